/*
CandleSync — KlineDecoder Tests
Role: Verify JSON → Candle decoding for websocket frames and REST snapshot bodies
Testing Strategy: Golden fixtures → assert decoded fields; malformed input → assert DecodeError
Coverage: String and numeric fields, decimal-comma locales, out-of-range open times, combined-stream envelope, missing fields, bad JSON, endpoint builders
*/
#include <gtest/gtest.h>
#include "Cpp20Utils.hpp"
#include "marketdata/dispatch/Channels.hpp"
#include "marketdata/dispatch/KlineDecoder.hpp"
#include "fixtures/kline_messages.hpp"
#include <clocale>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

using fixtures::kBase;
using fixtures::kMinute;

// =============================================================================
// Live frames
// =============================================================================

TEST(KlineDecoder, DecodesKlineEvent) {
    const Candle in{kBase, 100.25, 101.5, 99.75, 100.5, 12.125};
    const Candle out = KlineDecoder::decodeLiveFrame(std::string_view{fixtures::klineEvent(in).dump()});

    EXPECT_EQ(out.openTime, kBase);
    EXPECT_DOUBLE_EQ(out.open, 100.25);
    EXPECT_DOUBLE_EQ(out.high, 101.5);
    EXPECT_DOUBLE_EQ(out.low, 99.75);
    EXPECT_DOUBLE_EQ(out.close, 100.5);
    EXPECT_DOUBLE_EQ(out.volume, 12.125);
}

TEST(KlineDecoder, DecodesCombinedStreamEnvelope) {
    const Candle in = fixtures::candle(kBase + kMinute, 200);
    const Candle out = KlineDecoder::decodeLiveFrame(
        std::string_view{fixtures::combinedEnvelope(fixtures::klineEvent(in)).dump()});
    EXPECT_EQ(out.openTime, kBase + kMinute);
    EXPECT_DOUBLE_EQ(out.close, 200.0);
}

TEST(KlineDecoder, AcceptsNumericJsonValues) {
    nlohmann::json frame = {
        {"e", "kline"},
        {"k", {{"t", kBase}, {"o", 1.0}, {"h", 2.0}, {"l", 0.5}, {"c", 1.5}, {"v", 10}}}
    };
    const Candle out = KlineDecoder::decodeLiveEvent(frame);
    EXPECT_DOUBLE_EQ(out.high, 2.0);
    EXPECT_DOUBLE_EQ(out.volume, 10.0);
}

TEST(KlineDecoder, RejectsMalformedJson) {
    EXPECT_THROW(KlineDecoder::decodeLiveFrame(std::string_view{"{\"e\":\"kline\",\"k\":"}), DecodeError);
}

TEST(KlineDecoder, RejectsFrameWithoutKline) {
    // Subscription acks and other control frames carry no "k"
    EXPECT_THROW(KlineDecoder::decodeLiveFrame(std::string_view{R"({"result":null,"id":1})"}), DecodeError);
    EXPECT_THROW(KlineDecoder::decodeLiveFrame(std::string_view{"[]"}), DecodeError);
}

TEST(KlineDecoder, RejectsMissingField) {
    auto frame = fixtures::klineEvent(fixtures::candle(kBase, 100));
    frame["k"].erase("c");
    EXPECT_THROW(KlineDecoder::decodeLiveEvent(frame), DecodeError);
}

TEST(KlineDecoder, RejectsNonNumericField) {
    auto frame = fixtures::klineEvent(fixtures::candle(kBase, 100));
    frame["k"]["o"] = "abc";
    EXPECT_THROW(KlineDecoder::decodeLiveEvent(frame), DecodeError);

    frame = fixtures::klineEvent(fixtures::candle(kBase, 100));
    frame["k"]["v"] = "12.5x";
    EXPECT_THROW(KlineDecoder::decodeLiveEvent(frame), DecodeError);

    frame = fixtures::klineEvent(fixtures::candle(kBase, 100));
    frame["k"]["t"] = 1.5;
    EXPECT_THROW(KlineDecoder::decodeLiveEvent(frame), DecodeError);
}

TEST(KlineDecoder, RejectsOpenTimeBeyondInt64) {
    auto frame = fixtures::klineEvent(fixtures::candle(kBase, 100));
    frame["k"]["t"] = std::numeric_limits<std::uint64_t>::max();
    EXPECT_THROW(KlineDecoder::decodeLiveEvent(frame), DecodeError);

    frame["k"]["t"] = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()) + 1;
    EXPECT_THROW(KlineDecoder::decodeLiveEvent(frame), DecodeError);

    frame["k"]["t"] = "18446744073709551615";
    EXPECT_THROW(KlineDecoder::decodeLiveEvent(frame), DecodeError);
}

// =============================================================================
// Locale independence
// =============================================================================

namespace {

// Switches LC_NUMERIC to the first installed decimal-comma locale; restores on exit.
class ScopedCommaLocale {
public:
    ScopedCommaLocale() {
        if (const char* current = std::setlocale(LC_NUMERIC, nullptr)) previous_ = current;
        for (const char* name : {"de_DE.UTF-8", "de_DE.utf8", "fr_FR.UTF-8", "fr_FR.utf8",
                                 "ru_RU.UTF-8", "nl_NL.UTF-8", "de_DE", "fr_FR"}) {
            if (std::setlocale(LC_NUMERIC, name) != nullptr) {
                active_ = name;
                return;
            }
        }
    }
    ~ScopedCommaLocale() { std::setlocale(LC_NUMERIC, previous_.empty() ? "C" : previous_.c_str()); }

    bool active() const { return !active_.empty(); }

private:
    std::string previous_;
    std::string active_;
};

} // namespace

TEST(KlineDecoder, StringPricesDecodeUnderDecimalCommaLocale) {
    ScopedCommaLocale locale;
    if (!locale.active()) {
        GTEST_SKIP() << "no decimal-comma locale installed";
    }

    const Candle out = KlineDecoder::decodeLiveFrame(std::string_view{
        R"({"e":"kline","k":{"t":1700000040000,"o":"67000.50","h":"67100.25","l":"66950.75","c":"67050.00","v":"12.3456"}})"});
    EXPECT_DOUBLE_EQ(out.open, 67000.50);
    EXPECT_DOUBLE_EQ(out.high, 67100.25);
    EXPECT_DOUBLE_EQ(out.low, 66950.75);
    EXPECT_DOUBLE_EQ(out.close, 67050.0);
    EXPECT_DOUBLE_EQ(out.volume, 12.3456);

    const auto rows = KlineDecoder::decodeSnapshot(std::string_view{
        R"([[1700000040000,"1.5","2.5","0.5","2.25","100.125",1700000099999]])"});
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_DOUBLE_EQ(rows[0].close, 2.25);
    EXPECT_DOUBLE_EQ(rows[0].volume, 100.125);
}

TEST(Cpp20Utils, TryParseDoubleIgnoresLocaleAndRejectsGarbage) {
    ScopedCommaLocale locale;
    EXPECT_EQ(Cpp20Utils::tryParseDouble("67000.50"), std::optional<double>(67000.50));
    EXPECT_FALSE(Cpp20Utils::tryParseDouble("67000,50").has_value());
    EXPECT_FALSE(Cpp20Utils::tryParseDouble("1.5x").has_value());
    EXPECT_FALSE(Cpp20Utils::tryParseDouble("").has_value());
    EXPECT_FALSE(Cpp20Utils::tryParseDouble("1e999").has_value());
}

// =============================================================================
// Snapshot bodies
// =============================================================================

TEST(KlineDecoder, DecodesSnapshotRowsInOrder) {
    const auto series = fixtures::minuteSeries(3);
    const auto out = KlineDecoder::decodeSnapshot(std::string_view{fixtures::klinesBody(series)});

    ASSERT_EQ(out.size(), 3u);
    for (std::size_t i = 0; i < out.size(); ++i) {
        EXPECT_EQ(out[i].openTime, series[i].openTime);
        EXPECT_DOUBLE_EQ(out[i].close, series[i].close);
    }
}

TEST(KlineDecoder, EmptySnapshotIsNotAnError) {
    EXPECT_TRUE(KlineDecoder::decodeSnapshot(std::string_view{"[]"}).empty());
}

TEST(KlineDecoder, RejectsSnapshotErrorObject) {
    // Binance reports bad parameters as an object
    EXPECT_THROW(KlineDecoder::decodeSnapshot(std::string_view{R"({"code":-1121,"msg":"Invalid symbol."})"}),
                 DecodeError);
}

TEST(KlineDecoder, RejectsShortSnapshotRow) {
    EXPECT_THROW(KlineDecoder::decodeSnapshot(std::string_view{R"([[1700000040000,"1","2","0.5","1.5"]])"}),
                 DecodeError);
}

// =============================================================================
// Endpoints
// =============================================================================

TEST(Channels, BuildsStreamKeyAndTarget) {
    const KlineStream s{"BTCUSDT", "1m"};
    EXPECT_EQ(ch::streamKey(s), "btcusdt@kline_1m");
    EXPECT_EQ(ch::streamTarget(s), "/ws/btcusdt@kline_1m");
}

TEST(Channels, BuildsKlinesTarget) {
    const KlineRequest r{"ethusdt", "15m", 60};
    EXPECT_EQ(ch::klinesTarget(r), "/api/v3/klines?symbol=ETHUSDT&interval=15m&limit=60");
}

TEST(Channels, KnowsBinanceIntervals) {
    EXPECT_TRUE(ch::isSupportedInterval("1m"));
    EXPECT_TRUE(ch::isSupportedInterval("1M"));
    EXPECT_FALSE(ch::isSupportedInterval("7m"));
    EXPECT_FALSE(ch::isSupportedInterval(""));
}
