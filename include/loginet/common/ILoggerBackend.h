#pragma once

#include <source_location>
#include <string>

namespace loginet {

/// Severity of a log line, ordered from most to least verbose
enum class LogLevel {
    Trace = 0,
    Debug = 1,   ///< Per-record and per-edge decisions
    Info = 2,    ///< One line per pipeline run
    Warn = 3,    ///< Dropped records, provider retries, degraded refinement
    Error = 4,
    Critical = 5,
    Off = 6
};

/// Lower-case level name as it appears in captured lines ("warn", "error", ...)
const char* toString(LogLevel level);

/// Sink that receives formatted pipeline diagnostics
///
/// Services embedding the pipeline install their own backend to forward
/// records into their log aggregation:
/// @code
/// class JournalBackend : public loginet::ILoggerBackend {
/// public:
///     void log(LogLevel level, const std::string& message,
///              const std::source_location& loc) override {
///         journal_.send(toString(level), message, loc.file_name(), loc.line());
///     }
///     void setLevel(LogLevel level) override { minLevel_ = level; }
///     void flush() override { journal_.sync(); }
/// };
/// loginet::Logger::setBackend(std::make_unique<JournalBackend>());
/// @endcode
///
/// log() is always called under the Logger mutex, so implementations need no
/// locking of their own.
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /// @param message Already formatted, prefixed with the calling function name
    virtual void log(LogLevel level, const std::string& message,
                     const std::source_location& loc) = 0;

    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

}  // namespace loginet
