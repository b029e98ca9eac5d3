#pragma once
#include <functional>
#include <string>
#include <vector>
#include "../model/CandleData.h"
#include "../model/Errors.hpp"

struct SnapshotResult {
    std::vector<Candle> candles;   // ascending openTime on success
    SnapshotError       error = SnapshotError::None;
    std::string         message;

    bool ok() const { return error == SnapshotError::None; }
};

// One-shot historical fetch. Implementations must not block the caller and
// report exactly once per fetch(), from any thread.
class ISnapshotSource {
public:
    using ResultCb = std::function<void(Generation, SnapshotResult)>;

    virtual ~ISnapshotSource() = default;
    virtual void fetch(const KlineRequest& request, Generation generation, ResultCb cb) = 0;
};
