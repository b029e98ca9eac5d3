#include "CandleSyncLogging.hpp"
#include "Cpp20Utils.hpp"
#include "RenderGate.hpp"
#include "marketdata/ReconnectBackoff.hpp"
#include "marketdata/SyncConfig.hpp"
#include "marketdata/SynchronizerFactory.hpp"
#include "marketdata/WindowSynchronizer.hpp"
#include <QCoreApplication>
#include <QTimer>
#include <fmt/format.h>
#include <atomic>
#include <csignal>
#include <cstdio>
#include <exception>
#include <memory>

namespace {

std::atomic<bool> g_quitRequested{false};

void onSignal(int) {
    g_quitRequested.store(true);
}

void drawConsole(const std::vector<Candle>& window) {
    const Candle& last = window.back();
    const double spanMinutes = static_cast<double>(last.openTime - window.front().openTime) / 60000.0;
    fmt::print("{} | O {:.2f} H {:.2f} L {:.2f} C {:.2f} V {:.4f} | {} candles, {}-{} ({:.0f} min)\n",
               Cpp20Utils::formatClockTime(last.openTime),
               last.open, last.high, last.low, last.close, last.volume,
               window.size(),
               Cpp20Utils::formatClockTime(window.front().openTime),
               Cpp20Utils::formatClockTime(last.openTime),
               spanMinutes);
    std::fflush(stdout);
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("candlesync_cli");

    const QString iniPath = argc > 1 ? QString::fromLocal8Bit(argv[1]) : QStringLiteral("config.ini");

    SyncConfig config;
    std::unique_ptr<WindowSynchronizer> sync;
    try {
        config = SyncConfig::load(iniPath);
        sync = makeBinanceSynchronizer(config);
    } catch (const std::exception& e) {
        cLog_Error("Startup failed:" << e.what());
        return 1;
    }

    fmt::print("CandleSync: {} {} window={} ({}:{})\n", config.instrument, config.interval,
               config.windowSize, config.streamHost, config.streamPort);

    RenderGate gate(*sync, drawConsole, config.renderInterval);

    ReconnectBackoff backoff;
    QTimer retryTimer;
    retryTimer.setSingleShot(true);
    QObject::connect(&retryTimer, &QTimer::timeout, sync.get(), [&] {
        cLog_App("Reconnect attempt" << backoff.attempts());
        sync->start();
    });

    auto scheduleRetry = [&](const QString& reason) {
        if (retryTimer.isActive()) return;
        const auto delay = backoff.next();
        cLog_Warning("Feed unavailable:" << reason << "- retrying in" << static_cast<qint64>(delay.count()) << "ms");
        retryTimer.start(delay);
    };

    QObject::connect(sync.get(), &WindowSynchronizer::connectionLost, sync.get(), scheduleRetry);
    QObject::connect(sync.get(), &WindowSynchronizer::snapshotFailed, sync.get(), scheduleRetry);
    QObject::connect(sync.get(), &WindowSynchronizer::stateChanged, sync.get(), [&](SynchronizerState s) {
        if (s == SynchronizerState::Active) backoff.reset();
    });

    QObject::connect(&app, &QCoreApplication::aboutToQuit, sync.get(), [&] {
        retryTimer.stop();
        sync->stop();
        const SyncStats& st = sync->stats();
        fmt::print("appended={} replaced={} evicted={} stale={} rejected={} frames={} coalesced={}\n",
                   st.appended, st.replaced, st.evicted, st.stale,
                   st.rejectedGeneration + st.rejectedInactive,
                   gate.framesDrawn(), gate.coalesced());
    });

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
    QTimer quitPoll;
    QObject::connect(&quitPoll, &QTimer::timeout, &app, [] {
        if (g_quitRequested.load()) QCoreApplication::quit();
    });
    quitPoll.start(200);

    sync->start();
    return app.exec();
}
