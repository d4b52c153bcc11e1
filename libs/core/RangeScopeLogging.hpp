#pragma once

#include <QLoggingCategory>
#include <QDebug>
#include <atomic>
#include <cstdint>
#include <cstdlib>

// =============================================================================
// RANGESCOPE LOGGING CATEGORIES
// =============================================================================
// Four categories, each with atomic throttling for high-frequency call sites

Q_DECLARE_LOGGING_CATEGORY(logApp)      // Application: init, lifecycle, config
Q_DECLARE_LOGGING_CATEGORY(logData)     // Data: HTTP calls, stage transitions, parsing
Q_DECLARE_LOGGING_CATEGORY(logRender)   // Render: chart painting, viewport changes
Q_DECLARE_LOGGING_CATEGORY(logDebug)    // Debug: detailed diagnostics (disabled by default)

// =============================================================================
// ATOMIC THROTTLING
// =============================================================================

namespace rangescope::log_throttle {
    // Compile-time defaults (overridden by env vars)
    inline constexpr int kApp    = 1;    // Every app event
    inline constexpr int kData   = 1;    // Every stage transition (a few per user edit)
    inline constexpr int kRender = 100;  // Every 100th paint / viewport update
    inline constexpr int kDebug  = 10;   // Every 10th debug message
}

// Per-call-site counter; interval read once from RANGESCOPE_LOG_<cat>_INTERVAL
#define RSLOG_THROTTLED(cat, defaultInterval, ...)                                  \
    do {                                                                             \
        static std::atomic<uint32_t> _counter{0};                                    \
        static int _interval = []() {                                                \
            const char* env = std::getenv("RANGESCOPE_LOG_" #cat "_INTERVAL");      \
            const int v = env ? std::atoi(env) : (defaultInterval);                 \
            return v > 0 ? v : 1;                                                    \
        }();                                                                         \
        if (_interval == 1 || (++_counter % _interval) == 1) {                      \
            qCDebug(log##cat) << __VA_ARGS__;                                        \
        }                                                                            \
    } while(false)

// =============================================================================
// LOGGING MACROS
// =============================================================================

#define rsLog_App(...)     RSLOG_THROTTLED(App, rangescope::log_throttle::kApp, __VA_ARGS__)
#define rsLog_Data(...)    RSLOG_THROTTLED(Data, rangescope::log_throttle::kData, __VA_ARGS__)
#define rsLog_Render(...)  RSLOG_THROTTLED(Render, rangescope::log_throttle::kRender, __VA_ARGS__)
#define rsLog_Debug(...)   RSLOG_THROTTLED(Debug, rangescope::log_throttle::kDebug, __VA_ARGS__)

#define rsLog_RenderN(n, ...) RSLOG_THROTTLED(Render, n, __VA_ARGS__)
#define rsLog_DebugN(n, ...)  RSLOG_THROTTLED(Debug, n, __VA_ARGS__)

// Always-on (no throttling)
#define rsLog_Warning(...)  qCWarning(logApp) << __VA_ARGS__
#define rsLog_Error(...)    qCCritical(logApp) << __VA_ARGS__

/*
RUNTIME CONTROL:
export QT_LOGGING_RULES="rangescope.*.debug=true"   # Enable all categories
export RANGESCOPE_LOG_Render_INTERVAL=1             # See every paint
*/
