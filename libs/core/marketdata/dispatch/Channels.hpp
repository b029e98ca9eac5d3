#pragma once
#include <array>
#include <string>
#include <string_view>
#include <fmt/format.h>
#include "Cpp20Utils.hpp"
#include "../model/CandleData.h"

namespace ch {
    inline constexpr const char* kKlinesPath   = "/api/v3/klines";
    inline constexpr const char* kStreamPrefix = "/ws/";
    inline constexpr const char* kKlineEvent   = "kline";

    inline constexpr std::array<std::string_view, 16> kIntervals{
        "1s", "1m", "3m", "5m", "15m", "30m",
        "1h", "2h", "4h", "6h", "8h", "12h",
        "1d", "3d", "1w", "1M"
    };

    inline bool isSupportedInterval(std::string_view interval) {
        for (auto i : kIntervals) {
            if (i == interval) return true;
        }
        return false;
    }

    // btcusdt@kline_1m
    inline std::string streamKey(const KlineStream& s) {
        return fmt::format("{}@{}_{}", Cpp20Utils::toLowerAscii(s.instrument), kKlineEvent, s.interval);
    }

    // /ws/btcusdt@kline_1m
    inline std::string streamTarget(const KlineStream& s) {
        return std::string{kStreamPrefix} + streamKey(s);
    }

    // /api/v3/klines?symbol=BTCUSDT&interval=1m&limit=60
    inline std::string klinesTarget(const KlineRequest& r, std::string_view path = kKlinesPath) {
        return fmt::format("{}?symbol={}&interval={}&limit={}",
            path, Cpp20Utils::toUpperAscii(r.instrument), r.interval, r.limit);
    }
}
