#pragma once
/*
===============================================================================
LOGGING - Leveled, thread-safe diagnostics output for the planning engine
===============================================================================

Overview
--------
Every analysis reports what it did through this header: run parameters at
Debug, run summaries at Info, fallbacks and approximations at Warn, solver
failures at Warn/Error.

    * log(level, msg) never throws
    * one global level (default Info) and one global sink
    * default sink: "[2026-01-05T10:00:00Z][INFO] msg" to stdout for
      Debug/Info, stderr for Warn/Error
    * setLogSink() redirects output (tests capture messages this way)

Typical Usage
-------------
    fabcap::setLogLevel(fabcap::LogLevel::Warn);
    fabcap::logInfo("simulateRisk: 10000 trials");   // filtered out

    std::vector<std::string> seen;
    fabcap::setLogSink([&](fabcap::LogLevel, const std::string& m) {
        seen.push_back(m);
    });
    ...
    fabcap::resetLogSink();

Thread Safety
-------------
Level is atomic; sink replacement and sink invocation share one mutex, so
lines from Monte Carlo workers never interleave.

===============================================================================
*/

#include <atomic>
#include <chrono>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace fabcap {

enum class LogLevel : int { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

using LogSink = std::function<void(LogLevel, const std::string&)>;

namespace log_detail {

    struct LoggerState {
        std::atomic<int> level{static_cast<int>(LogLevel::Info)};
        std::mutex mutex;
        LogSink sink;
    };

    inline LoggerState& state() {
        static LoggerState s;
        return s;
    }

    inline const char* levelTag(LogLevel lvl) noexcept {
        switch (lvl) {
            case LogLevel::Debug: return "DEBUG";
            case LogLevel::Info:  return "INFO";
            case LogLevel::Warn:  return "WARN";
            case LogLevel::Error: return "ERROR";
            default:              return "INFO";
        }
    }

    inline std::string utcTimestamp() {
        using clock = std::chrono::system_clock;
        std::time_t tt = clock::to_time_t(clock::now());
        std::tm tm{};
#if defined(_WIN32)
        gmtime_s(&tm, &tt);
#else
        gmtime_r(&tt, &tm);
#endif
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return oss.str();
    }

    inline void defaultSink(LogLevel lvl, const std::string& msg) {
        std::ostream& out = (lvl >= LogLevel::Warn) ? std::cerr : std::cout;
        out << "[" << utcTimestamp() << "][" << levelTag(lvl) << "] " << msg << "\n";
        out.flush();
    }

} // namespace log_detail

/// @brief "DEBUG", "INFO", "WARN" or "ERROR".
inline const char* logLevelName(LogLevel lvl) noexcept {
    return log_detail::levelTag(lvl);
}

/// @brief Set the minimum level that reaches the sink.
inline void setLogLevel(LogLevel lvl) noexcept {
    log_detail::state().level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

/// @brief Current minimum level.
inline LogLevel logLevel() noexcept {
    return static_cast<LogLevel>(log_detail::state().level.load(std::memory_order_relaxed));
}

/// @brief True if a message at lvl would be emitted.
inline bool logEnabled(LogLevel lvl) noexcept {
    return lvl != LogLevel::Off && static_cast<int>(lvl) >= static_cast<int>(logLevel());
}

/**
 * @brief Replace the output sink
 * @param sink Callable receiving (level, message); an empty function restores
 *             the default console sink
 */
inline void setLogSink(LogSink sink) {
    auto& s = log_detail::state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.sink = std::move(sink);
}

/// @brief Restore the default console sink.
inline void resetLogSink() {
    setLogSink(LogSink{});
}

/**
 * @brief Emit a message
 *
 * @note Exceptions thrown by a custom sink or by stream formatting are
 *       dropped.
 */
inline void log(LogLevel lvl, const std::string& msg) noexcept {
    if (!logEnabled(lvl))
        return;
    try {
        auto& s = log_detail::state();
        std::lock_guard<std::mutex> lock(s.mutex);
        if (s.sink)
            s.sink(lvl, msg);
        else
            log_detail::defaultSink(lvl, msg);
    } catch (const std::exception&) {
    }
}

inline void logDebug(const std::string& msg) noexcept { log(LogLevel::Debug, msg); }
inline void logInfo(const std::string& msg) noexcept  { log(LogLevel::Info, msg); }
inline void logWarn(const std::string& msg) noexcept  { log(LogLevel::Warn, msg); }
inline void logError(const std::string& msg) noexcept { log(LogLevel::Error, msg); }

} // namespace fabcap
