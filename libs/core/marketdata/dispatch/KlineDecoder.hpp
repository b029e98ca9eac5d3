#pragma once
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include "../model/CandleData.h"
#include "../model/Errors.hpp"

// Pure JSON -> Candle decoding for both inbound formats. Stateless; throws DecodeError.
class KlineDecoder {
public:
    // One websocket text frame: {"e":"kline",...,"k":{"t":..,"o":..,"h":..,"l":..,"c":..,"v":..}}
    // or the combined-stream envelope {"stream":"..","data":{...}}.
    static Candle decodeLiveFrame(std::string_view payload);
    static Candle decodeLiveEvent(const nlohmann::json& frame);

    // REST body: [[openTime, "open", "high", "low", "close", "volume", ...], ...]
    static std::vector<Candle> decodeSnapshot(std::string_view body);
    static std::vector<Candle> decodeSnapshotRows(const nlohmann::json& rows);

private:
    static double number(const nlohmann::json& v, const char* field);
    static std::int64_t integer(const nlohmann::json& v, const char* field);
};
