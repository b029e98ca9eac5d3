#pragma once

// C++20 UTILITIES FOR CANDLESYNC
// String, number and time helpers shared by the wire codec and the console renderer

#include <string>
#include <string_view>
#include <optional>
#include <charconv>
#include <system_error>
#include <cstdint>
#include <chrono>
#include <ctime>
#include <fmt/format.h>
#include "marketdata/model/CandleData.h"

namespace Cpp20Utils {

inline char asciiToLower(unsigned char c) {
    if (c >= 'A' && c <= 'Z') {
        return static_cast<char>(c + ('a' - 'A'));
    }
    return static_cast<char>(c);
}

inline char asciiToUpper(unsigned char c) {
    if (c >= 'a' && c <= 'z') {
        return static_cast<char>(c - ('a' - 'A'));
    }
    return static_cast<char>(c);
}

inline std::string toLowerAscii(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) out.push_back(asciiToLower(static_cast<unsigned char>(c)));
    return out;
}

inline std::string toUpperAscii(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) out.push_back(asciiToUpper(static_cast<unsigned char>(c)));
    return out;
}

/**
 * Strict string-to-double conversion, independent of the process locale
 * @param str Input string; must be a complete decimal number, no trailing garbage
 * @return Converted value, or std::nullopt when str is empty, out of range or not fully numeric
 */
inline std::optional<double> tryParseDouble(std::string_view str) {
    if (str.empty()) return std::nullopt;
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc() || ptr != str.data() + str.size()) return std::nullopt;
    return value;
}

/**
 * Strict string-to-int64 conversion
 * @param str Input string
 * @return Converted value, or std::nullopt on any error
 */
inline std::optional<std::int64_t> tryParseInt64(std::string_view str) {
    if (str.empty()) return std::nullopt;
    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc() || ptr != str.data() + str.size()) return std::nullopt;
    return value;
}

/**
 * Local wall-clock "HH:MM" for an epoch-millisecond timestamp
 */
inline std::string formatClockTime(std::int64_t epochMs) {
    const std::time_t secs = static_cast<std::time_t>(epochMs / 1000);
    std::tm local{};
    if (::localtime_r(&secs, &local) == nullptr) {
        return "--:--";
    }
    return fmt::format("{:02}:{:02}", local.tm_hour, local.tm_min);
}

/**
 * One-line candle summary for logs and the console renderer
 */
inline std::string formatCandleLog(const Candle& c) {
    return fmt::format("{} O:{:.2f} H:{:.2f} L:{:.2f} C:{:.2f} V:{:.4f}",
        formatClockTime(c.openTime), c.open, c.high, c.low, c.close, c.volume);
}

} // namespace Cpp20Utils
