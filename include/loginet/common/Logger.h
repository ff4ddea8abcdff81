#pragma once

#include "loginet/common/ILoggerBackend.h"
#include <fmt/format.h>
#include <chrono>
#include <memory>
#include <source_location>
#include <string>
#include <vector>

namespace loginet {

/// Process-wide logging facade
///
/// Messages go to the installed ILoggerBackend (spdlog when built with
/// LOGINET_USE_SPDLOG, a stdout/stderr backend otherwise). Route refinement
/// logs from worker threads, so every entry point serializes on one mutex.
///
/// Capture keeps recent lines in memory for tests and for services that
/// attach the warnings of a run to its response:
/// @code
/// loginet::Logger::enableCapture(true);
/// auto result = pipeline.run(records, region, CategoryMode::Rail, roads);
/// auto warnings = loginet::Logger::getCapturedLogs("", 0, LogLevel::Warn);
/// @endcode
class Logger {
public:
    /// Install a backend; ownership is transferred
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /// Install the default backend if none is set (console only)
    static void initialize();

    /// Install the default backend, optionally also writing <logDir>/loginet.log
    static void initialize(const std::string& logDir, bool logToFile = true);

    static void setLevel(LogLevel level);

    static void trace(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void debug(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void info(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void warn(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void error(const std::string& message,
                      const std::source_location& loc = std::source_location::current());

    static void flush();

    // ===== Capture =====

    /// Start or stop keeping lines in memory; captured lines are kept when stopping
    static void enableCapture(bool enable);
    static bool isCaptureEnabled();

    /// Maximum number of captured lines kept; the oldest are discarded first
    static void setCaptureLimit(size_t maxLines);

    /// Captured lines in order, each "[<level>] <function>() - <message>"
    /// @param pattern Substring filter (empty matches all)
    /// @param maxLines Keep only the most recent matches (0 = unlimited)
    /// @param minLevel Skip lines below this level
    static std::vector<std::string> getCapturedLogs(const std::string& pattern = "",
                                                    size_t maxLines = 0,
                                                    LogLevel minLevel = LogLevel::Trace);

    static void clearCapturedLogs();

    static constexpr size_t DEFAULT_CAPTURE_LIMIT = 10000;

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void write(LogLevel level, const std::string& message, const std::source_location& loc);
    static std::string extractFunctionName(const std::source_location& loc);
    static void captureLog(LogLevel level, std::string line);
};

/// Measures one pipeline stage and stores its duration when the scope ends
///
/// @code
/// {
///     StageTimer timer("spanning tree", stats.spanningTreeMs);
///     tree = engine.computeMst(graph);
/// }
/// @endcode
class StageTimer {
public:
    StageTimer(const char* stage, double& elapsedMs)
        : stage_(stage), elapsedMs_(elapsedMs), start_(std::chrono::steady_clock::now()) {}
    ~StageTimer();

    StageTimer(const StageTimer&) = delete;
    StageTimer& operator=(const StageTimer&) = delete;

private:
    const char* stage_;
    double& elapsedMs_;
    std::chrono::steady_clock::time_point start_;
};

}  // namespace loginet

// Logging macros; arguments follow the fmt format-string syntax
#define LOG_TRACE(...) loginet::Logger::trace(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) loginet::Logger::debug(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...)  loginet::Logger::info(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...)  loginet::Logger::warn(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) loginet::Logger::error(fmt::format(__VA_ARGS__), std::source_location::current())
