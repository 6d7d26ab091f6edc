#pragma once

#include <QLoggingCategory>
#include <QDebug>
#include <QString>
#include <atomic>
#include <cstdint>
#include <cstdlib>

// =============================================================================
// RELAY LOGGING CATEGORIES
// =============================================================================
// Three categories; the hot ones are throttled with an atomic counter per call site.

Q_DECLARE_LOGGING_CATEGORY(logApp)      // Application: session lifecycle, config, pause/resume
Q_DECLARE_LOGGING_CATEGORY(logData)     // Data: sockets, frames, queue flush, subscription replay
Q_DECLARE_LOGGING_CATEGORY(logDebug)    // Debug: detailed diagnostics (disabled by default)

// =============================================================================
// ATOMIC THROTTLING SYSTEM
// =============================================================================

namespace relay::log_throttle {
    // Compile-time defaults (overridden by env vars)
    inline constexpr int kApp   = 1;    // Log every app event (low frequency)
    inline constexpr int kData  = 20;   // Log every 20th data operation
    inline constexpr int kDebug = 10;   // Log every 10th debug message
}

// Atomic throttling macro with runtime env var override
#define RLOG_THROTTLED(cat, defaultInterval, ...)                                   \
    do {                                                                             \
        static std::atomic<uint32_t> _counter{0};                                    \
        static int _interval = []() {                                                \
            const char* env = std::getenv("RELAY_LOG_" #cat "_INTERVAL");           \
            const int v = env ? std::atoi(env) : (defaultInterval);                 \
            return v > 0 ? v : 1;                                                    \
        }();                                                                         \
        if ((++_counter % _interval) == 1 || _interval == 1) {                       \
            qCDebug(log##cat) << __VA_ARGS__;                                        \
        }                                                                            \
    } while(false)

// Primary logging macros (automatically throttled for hot paths)
#define rLog_App(...)     RLOG_THROTTLED(App, relay::log_throttle::kApp, __VA_ARGS__)
#define rLog_Data(...)    RLOG_THROTTLED(Data, relay::log_throttle::kData, __VA_ARGS__)
#define rLog_Debug(...)   RLOG_THROTTLED(Debug, relay::log_throttle::kDebug, __VA_ARGS__)

// Always-on macros (no throttling for critical messages)
#define rLog_Warning(...)  qCWarning(logApp) << __VA_ARGS__
#define rLog_Error(...)    qCCritical(logApp) << __VA_ARGS__

// =============================================================================
// RUNTIME CONTROL
// =============================================================================
//   export RELAY_LOG_Data_INTERVAL=1            # every frame / flush / replay line
//   export QT_LOGGING_RULES="relay.debug=true"  # enable debug category
//
// Strings from the std:: side go through QString::fromStdString before streaming:
//   rLog_Data("Flushing queue:" << count << "envelopes for" << QString::fromStdString(url));
