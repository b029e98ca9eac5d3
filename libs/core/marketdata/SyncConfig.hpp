#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <QString>
#include "model/CandleData.h"

// Runtime configuration for one synchronized instrument window.
struct SyncConfig {
    std::string instrument = "BTCUSDT";
    std::string interval   = "1m";
    std::size_t windowSize = 60;

    std::string restHost   = "api.binance.com";
    std::string restPort   = "443";
    std::string restPath   = "/api/v3/klines";
    std::string streamHost = "stream.binance.com";
    std::string streamPort = "9443";

    std::chrono::seconds      fetchTimeout{5};
    std::chrono::milliseconds closeGrace{2000};
    std::chrono::milliseconds renderInterval{0};

    // INI via QSettings, then CANDLESYNC_SYMBOL / CANDLESYNC_INTERVAL / CANDLESYNC_WINDOW.
    // A missing file yields defaults. Throws std::invalid_argument on bad values.
    static SyncConfig load(const QString& iniPath);

    void validate() const;

    KlineRequest request() const { return {instrument, interval, windowSize}; }
    KlineStream  stream() const { return {instrument, interval}; }
};
