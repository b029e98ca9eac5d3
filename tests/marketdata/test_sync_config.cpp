/*
CandleSync — SyncConfig Tests
Role: Verify INI loading, environment overrides and validation
Testing Strategy: Temporary INI files + scoped environment → assert resulting fields or std::invalid_argument
Coverage: Defaults, full INI, malformed timings, env precedence, invalid window/interval/instrument, request/stream helpers
*/
#include <gtest/gtest.h>
#include "marketdata/SyncConfig.hpp"
#include <QFile>
#include <QTemporaryDir>
#include <QTextStream>

namespace {

class SyncConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clearEnv(); ASSERT_TRUE(dir_.isValid()); }
    void TearDown() override { clearEnv(); }

    static void clearEnv() {
        qunsetenv("CANDLESYNC_SYMBOL");
        qunsetenv("CANDLESYNC_INTERVAL");
        qunsetenv("CANDLESYNC_WINDOW");
    }

    QString writeIni(const QString& contents) {
        const QString path = dir_.filePath("config.ini");
        QFile f(path);
        EXPECT_TRUE(f.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text));
        QTextStream(&f) << contents;
        return path;
    }

    QTemporaryDir dir_;
};

} // namespace

TEST_F(SyncConfigTest, MissingFileYieldsDefaults) {
    const SyncConfig cfg = SyncConfig::load(dir_.filePath("absent.ini"));
    EXPECT_EQ(cfg.instrument, "BTCUSDT");
    EXPECT_EQ(cfg.interval, "1m");
    EXPECT_EQ(cfg.windowSize, 60u);
    EXPECT_EQ(cfg.restHost, "api.binance.com");
    EXPECT_EQ(cfg.streamPort, "9443");
    EXPECT_EQ(cfg.fetchTimeout, std::chrono::seconds(5));
    EXPECT_EQ(cfg.closeGrace, std::chrono::milliseconds(2000));
}

TEST_F(SyncConfigTest, ReadsAllIniKeys) {
    const QString path = writeIni(
        "[market]\nsymbol=ETHUSDT\ninterval=5m\n"
        "[window]\nsize=120\n"
        "[rest]\nhost=rest.example.test\nport=8443\n"
        "[stream]\nhost=ws.example.test\nport=9000\n"
        "[timing]\nfetchTimeoutSec=9\ncloseGraceMs=500\nrenderIntervalMs=16\n");

    const SyncConfig cfg = SyncConfig::load(path);
    EXPECT_EQ(cfg.instrument, "ETHUSDT");
    EXPECT_EQ(cfg.interval, "5m");
    EXPECT_EQ(cfg.windowSize, 120u);
    EXPECT_EQ(cfg.restHost, "rest.example.test");
    EXPECT_EQ(cfg.restPort, "8443");
    EXPECT_EQ(cfg.streamHost, "ws.example.test");
    EXPECT_EQ(cfg.streamPort, "9000");
    EXPECT_EQ(cfg.fetchTimeout, std::chrono::seconds(9));
    EXPECT_EQ(cfg.closeGrace, std::chrono::milliseconds(500));
    EXPECT_EQ(cfg.renderInterval, std::chrono::milliseconds(16));
}

TEST_F(SyncConfigTest, EnvironmentOverridesFile) {
    const QString path = writeIni("[market]\nsymbol=ETHUSDT\ninterval=5m\n[window]\nsize=120\n");
    qputenv("CANDLESYNC_SYMBOL", "SOLUSDT");
    qputenv("CANDLESYNC_INTERVAL", "1h");
    qputenv("CANDLESYNC_WINDOW", "30");

    const SyncConfig cfg = SyncConfig::load(path);
    EXPECT_EQ(cfg.instrument, "SOLUSDT");
    EXPECT_EQ(cfg.interval, "1h");
    EXPECT_EQ(cfg.windowSize, 30u);
}

TEST_F(SyncConfigTest, RejectsInvalidWindowSize) {
    EXPECT_THROW(SyncConfig::load(writeIni("[window]\nsize=0\n")), std::invalid_argument);
    EXPECT_THROW(SyncConfig::load(writeIni("[window]\nsize=abc\n")), std::invalid_argument);

    qputenv("CANDLESYNC_WINDOW", "-4");
    EXPECT_THROW(SyncConfig::load(dir_.filePath("absent.ini")), std::invalid_argument);
}

TEST_F(SyncConfigTest, RejectsNonNumericTimings) {
    EXPECT_THROW(SyncConfig::load(writeIni("[timing]\ncloseGraceMs=soon\n")), std::invalid_argument);
    EXPECT_THROW(SyncConfig::load(writeIni("[timing]\nrenderIntervalMs=16ms\n")), std::invalid_argument);
    EXPECT_THROW(SyncConfig::load(writeIni("[timing]\nfetchTimeoutSec=\n")), std::invalid_argument);
    EXPECT_THROW(SyncConfig::load(writeIni("[timing]\ncloseGraceMs=-5\n")), std::invalid_argument);
}

TEST_F(SyncConfigTest, RejectsUnsupportedInterval) {
    EXPECT_THROW(SyncConfig::load(writeIni("[market]\ninterval=7m\n")), std::invalid_argument);
}

TEST_F(SyncConfigTest, ValidateRejectsEmptyInstrument) {
    SyncConfig cfg;
    cfg.instrument.clear();
    EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

TEST_F(SyncConfigTest, BuildsRequestAndStream) {
    SyncConfig cfg;
    cfg.instrument = "BNBUSDT";
    cfg.interval = "15m";
    cfg.windowSize = 48;

    const KlineRequest r = cfg.request();
    EXPECT_EQ(r.instrument, "BNBUSDT");
    EXPECT_EQ(r.interval, "15m");
    EXPECT_EQ(r.limit, 48u);

    const KlineStream s = cfg.stream();
    EXPECT_EQ(s.instrument, "BNBUSDT");
    EXPECT_EQ(s.interval, "15m");
}
