#pragma once

#include "loginet/common/ILoggerBackend.h"
#include <mutex>

namespace loginet {

/// Console backend used when the library is built without spdlog
///
/// Info and below go to stdout, warnings and above to stderr, each line
/// prefixed with a HH:MM:SS.mmm timestamp. Levels are colored only when the
/// target stream is a terminal.
class DefaultBackend : public ILoggerBackend {
public:
    explicit DefaultBackend(LogLevel level = LogLevel::Info);

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    LogLevel currentLevel_;
    bool stdoutColor_;
    bool stderrColor_;
    std::mutex mutex_;

    static const char* levelColor(LogLevel level);
    static std::string timestamp();
};

}  // namespace loginet
