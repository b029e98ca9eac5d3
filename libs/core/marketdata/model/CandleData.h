#ifndef CANDLEDATA_H
#define CANDLEDATA_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <QMetaType>

// One OHLCV bucket. Identity and ordering are defined by openTime alone;
// two observations of the same still-forming bucket compare equal.
struct Candle
{
    std::int64_t openTime = 0;  // bucket start, ms since epoch
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;

    friend bool operator==(const Candle& a, const Candle& b) noexcept { return a.openTime == b.openTime; }
    friend bool operator!=(const Candle& a, const Candle& b) noexcept { return a.openTime != b.openTime; }
    friend bool operator<(const Candle& a, const Candle& b) noexcept { return a.openTime < b.openTime; }
};

// Incremented on every start(); observations carry the generation they were produced under.
using Generation = std::uint64_t;

enum class SynchronizerState {
    Idle,
    Loading,
    Active,
    Stopping,
    Stopped
};

inline const char* toString(SynchronizerState s) {
    switch (s) {
        case SynchronizerState::Idle:     return "Idle";
        case SynchronizerState::Loading:  return "Loading";
        case SynchronizerState::Active:   return "Active";
        case SynchronizerState::Stopping: return "Stopping";
        case SynchronizerState::Stopped:  return "Stopped";
    }
    return "Unknown";
}

// Historical fetch parameters: GET /api/v3/klines?symbol=..&interval=..&limit=..
struct KlineRequest {
    std::string instrument;   // e.g. "BTCUSDT"
    std::string interval;     // e.g. "1m"
    std::size_t limit = 0;
};

// Live subscription target: <instrument>@kline_<interval>
struct KlineStream {
    std::string instrument;
    std::string interval;
};

Q_DECLARE_METATYPE(Candle)
Q_DECLARE_METATYPE(SynchronizerState)

#endif // CANDLEDATA_H
