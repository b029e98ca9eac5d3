#include "SyncConfig.hpp"
#include "CandleSyncLogging.hpp"
#include "dispatch/Channels.hpp"
#include "Cpp20Utils.hpp"
#include <QFile>
#include <QSettings>
#include <QtGlobal>
#include <fmt/format.h>
#include <stdexcept>

namespace {

std::size_t parseWindowSize(const QString& text, const char* source) {
    const auto parsed = Cpp20Utils::tryParseInt64(text.trimmed().toStdString());
    if (!parsed || *parsed <= 0) {
        throw std::invalid_argument(fmt::format("{}: window size must be a positive integer, got '{}'",
                                                source, text.toStdString()));
    }
    return static_cast<std::size_t>(*parsed);
}

int readInt(const QSettings& ini, const char* key, int fallback) {
    if (!ini.contains(key)) return fallback;
    const QString text = ini.value(key).toString();
    bool ok = false;
    const int value = text.trimmed().toInt(&ok);
    if (!ok) {
        throw std::invalid_argument(fmt::format("{}: expected an integer, got '{}'", key, text.toStdString()));
    }
    return value;
}

} // namespace

SyncConfig SyncConfig::load(const QString& iniPath) {
    SyncConfig cfg;

    if (!iniPath.isEmpty() && QFile::exists(iniPath)) {
        QSettings ini(iniPath, QSettings::IniFormat);
        cfg.instrument = ini.value("market/symbol", QString::fromStdString(cfg.instrument)).toString().toStdString();
        cfg.interval   = ini.value("market/interval", QString::fromStdString(cfg.interval)).toString().toStdString();
        if (ini.contains("window/size")) {
            cfg.windowSize = parseWindowSize(ini.value("window/size").toString(), "window/size");
        }
        cfg.restHost   = ini.value("rest/host", QString::fromStdString(cfg.restHost)).toString().toStdString();
        cfg.restPort   = ini.value("rest/port", QString::fromStdString(cfg.restPort)).toString().toStdString();
        cfg.streamHost = ini.value("stream/host", QString::fromStdString(cfg.streamHost)).toString().toStdString();
        cfg.streamPort = ini.value("stream/port", QString::fromStdString(cfg.streamPort)).toString().toStdString();
        cfg.fetchTimeout   = std::chrono::seconds(
            readInt(ini, "timing/fetchTimeoutSec", static_cast<int>(cfg.fetchTimeout.count())));
        cfg.closeGrace     = std::chrono::milliseconds(
            readInt(ini, "timing/closeGraceMs", static_cast<int>(cfg.closeGrace.count())));
        cfg.renderInterval = std::chrono::milliseconds(
            readInt(ini, "timing/renderIntervalMs", static_cast<int>(cfg.renderInterval.count())));
        cLog_App("Loaded config from" << iniPath);
    } else if (!iniPath.isEmpty()) {
        cLog_Warning("Config file" << iniPath << "not found, using defaults");
    }

    const QString symbolEnv = qEnvironmentVariable("CANDLESYNC_SYMBOL");
    if (!symbolEnv.isEmpty()) cfg.instrument = symbolEnv.toStdString();
    const QString intervalEnv = qEnvironmentVariable("CANDLESYNC_INTERVAL");
    if (!intervalEnv.isEmpty()) cfg.interval = intervalEnv.toStdString();
    const QString windowEnv = qEnvironmentVariable("CANDLESYNC_WINDOW");
    if (!windowEnv.isEmpty()) cfg.windowSize = parseWindowSize(windowEnv, "CANDLESYNC_WINDOW");

    cfg.validate();
    return cfg;
}

void SyncConfig::validate() const {
    if (instrument.empty()) {
        throw std::invalid_argument("instrument must not be empty");
    }
    if (!ch::isSupportedInterval(interval)) {
        throw std::invalid_argument(fmt::format("unsupported interval '{}'", interval));
    }
    if (windowSize == 0) {
        throw std::invalid_argument("window size must be at least 1");
    }
    if (restHost.empty() || streamHost.empty()) {
        throw std::invalid_argument("REST and stream hosts must not be empty");
    }
    if (fetchTimeout.count() <= 0) {
        throw std::invalid_argument("fetch timeout must be positive");
    }
    if (closeGrace.count() < 0 || renderInterval.count() < 0) {
        throw std::invalid_argument("timing values must not be negative");
    }
}
