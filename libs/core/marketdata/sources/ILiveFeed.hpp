#pragma once
#include <functional>
#include <string>
#include "../model/CandleData.h"

// A single persistent subscription, bound to one generation for its whole life.
// Callbacks may fire on any thread; they must be set before open().
class ILiveFeed {
public:
    using ObservationCb    = std::function<void(Generation, Candle)>;
    using ConnectionLostCb = std::function<void(Generation, std::string)>;
    using ClosedCb         = std::function<void(Generation)>;

    virtual ~ILiveFeed() = default;

    virtual void open(const KlineStream& stream, Generation generation) = 0;
    // Idempotent; acknowledged once through onClosed.
    virtual void close() = 0;

    virtual void onObservation(ObservationCb) = 0;
    virtual void onConnectionLost(ConnectionLostCb) = 0;
    virtual void onClosed(ClosedCb) = 0;
};
