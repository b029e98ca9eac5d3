#pragma once

#include <QLoggingCategory>
#include <QDebug>
#include <atomic>
#include <cstdint>
#include <cstdlib>

// =============================================================================
// CANDLESYNC LOGGING CATEGORIES
// =============================================================================
// Three categories, each call site carries its own atomic throttle counter.

Q_DECLARE_LOGGING_CATEGORY(logApp)      // Application: lifecycle, config, state transitions
Q_DECLARE_LOGGING_CATEGORY(logData)     // Data: snapshot fetch, live feed, merge protocol
Q_DECLARE_LOGGING_CATEGORY(logRender)   // Render: render gate, frame scheduling

namespace candlesync::log_throttle {
    // Compile-time defaults (overridden by env vars)
    inline constexpr int kApp    = 1;    // Log every app event (low frequency)
    inline constexpr int kData   = 20;   // Log every 20th data operation
    inline constexpr int kRender = 100;  // Log every 100th render operation
}

// Logs the 1st, (n+1)th, (2n+1)th ... call of this call site.
#define CLOG_THROTTLED(cat, defaultInterval, ...)                                   \
    do {                                                                             \
        static std::atomic<std::uint32_t> _counter{0};                               \
        static const int _interval = []() {                                          \
            const char* env = std::getenv("CANDLESYNC_LOG_" #cat "_INTERVAL");      \
            const int n = env ? std::atoi(env) : (defaultInterval);                  \
            return n > 0 ? n : 1;                                                    \
        }();                                                                         \
        if ((_counter.fetch_add(1, std::memory_order_relaxed) %                     \
             static_cast<std::uint32_t>(_interval)) == 0) {                          \
            qCDebug(log##cat) << __VA_ARGS__;                                        \
        }                                                                            \
    } while(false)

#define cLog_App(...)     CLOG_THROTTLED(App, candlesync::log_throttle::kApp, __VA_ARGS__)
#define cLog_Data(...)    CLOG_THROTTLED(Data, candlesync::log_throttle::kData, __VA_ARGS__)
#define cLog_Render(...)  CLOG_THROTTLED(Render, candlesync::log_throttle::kRender, __VA_ARGS__)

#define cLog_AppN(n, ...)    CLOG_THROTTLED(App, n, __VA_ARGS__)
#define cLog_DataN(n, ...)   CLOG_THROTTLED(Data, n, __VA_ARGS__)
#define cLog_RenderN(n, ...) CLOG_THROTTLED(Render, n, __VA_ARGS__)

// Always-on (no throttling)
#define cLog_Warning(...)  qCWarning(logApp) << __VA_ARGS__
#define cLog_Error(...)    qCCritical(logApp) << __VA_ARGS__

// Runtime control:
//   export CANDLESYNC_LOG_Data_INTERVAL=1     # every data operation
//   export CANDLESYNC_LOG_Render_INTERVAL=10  # every 10th frame
//   export QT_LOGGING_RULES="candlesync.data.debug=false"
