#include "KlineDecoder.hpp"
#include "Cpp20Utils.hpp"
#include <cmath>
#include <cstdint>
#include <limits>
#include <fmt/format.h>

namespace {

nlohmann::json parseOrThrow(std::string_view text) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw DecodeError(fmt::format("malformed JSON: {}", e.what()));
    }
}

} // namespace

double KlineDecoder::number(const nlohmann::json& v, const char* field) {
    if (v.is_number()) {
        const double d = v.get<double>();
        if (std::isfinite(d)) return d;
    } else if (v.is_string()) {
        if (auto d = Cpp20Utils::tryParseDouble(v.get_ref<const std::string&>()); d && std::isfinite(*d)) {
            return *d;
        }
    }
    throw DecodeError(fmt::format("field '{}' is not a finite number: {}", field, v.dump()));
}

std::int64_t KlineDecoder::integer(const nlohmann::json& v, const char* field) {
    if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            throw DecodeError(fmt::format("field '{}' is out of range: {}", field, u));
        }
        return static_cast<std::int64_t>(u);
    }
    if (v.is_number_integer()) {
        return v.get<std::int64_t>();
    }
    if (v.is_string()) {
        if (auto i = Cpp20Utils::tryParseInt64(v.get_ref<const std::string&>())) return *i;
    }
    throw DecodeError(fmt::format("field '{}' is not an integer: {}", field, v.dump()));
}

Candle KlineDecoder::decodeLiveFrame(std::string_view payload) {
    return decodeLiveEvent(parseOrThrow(payload));
}

Candle KlineDecoder::decodeLiveEvent(const nlohmann::json& frame) {
    if (!frame.is_object()) {
        throw DecodeError("live frame is not a JSON object");
    }

    const nlohmann::json* event = &frame;
    if (auto it = frame.find("data"); it != frame.end() && it->is_object()) {
        event = &(*it);
    }

    auto k = event->find("k");
    if (k == event->end() || !k->is_object()) {
        throw DecodeError("live frame has no kline object 'k'");
    }

    auto field = [&](const char* name) -> const nlohmann::json& {
        auto it = k->find(name);
        if (it == k->end()) {
            throw DecodeError(fmt::format("kline field '{}' missing", name));
        }
        return *it;
    };

    Candle c;
    c.openTime = integer(field("t"), "t");
    c.open     = number(field("o"), "o");
    c.high     = number(field("h"), "h");
    c.low      = number(field("l"), "l");
    c.close    = number(field("c"), "c");
    c.volume   = number(field("v"), "v");
    return c;
}

std::vector<Candle> KlineDecoder::decodeSnapshot(std::string_view body) {
    return decodeSnapshotRows(parseOrThrow(body));
}

std::vector<Candle> KlineDecoder::decodeSnapshotRows(const nlohmann::json& rows) {
    if (!rows.is_array()) {
        throw DecodeError("snapshot body is not a JSON array");
    }

    std::vector<Candle> out;
    out.reserve(rows.size());
    for (std::size_t i = 0; i < rows.size(); ++i) {
        const auto& row = rows[i];
        if (!row.is_array() || row.size() < 6) {
            throw DecodeError(fmt::format("snapshot row {} is not an array of at least 6 fields", i));
        }
        Candle c;
        c.openTime = integer(row[0], "open_time");
        c.open     = number(row[1], "open");
        c.high     = number(row[2], "high");
        c.low      = number(row[3], "low");
        c.close    = number(row[4], "close");
        c.volume   = number(row[5], "volume");
        out.push_back(c);
    }
    return out;
}
