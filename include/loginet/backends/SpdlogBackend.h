#pragma once

#include "loginet/common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace loginet {

/// spdlog backend; the default when built with LOGINET_USE_SPDLOG
///
/// Console output goes to stderr. With file logging enabled a second sink
/// writes <logDir>/loginet.log including thread ids and source locations.
/// The initial level is Info unless LOGINET_LOG_LEVEL names another spdlog
/// level ("debug", "warn", "off", ...).
class SpdlogBackend : public ILoggerBackend {
public:
    explicit SpdlogBackend(const std::string& logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

    static constexpr const char* LOGGER_NAME = "loginet";
    static constexpr const char* LEVEL_ENV = "LOGINET_LOG_LEVEL";

private:
    std::shared_ptr<spdlog::logger> logger_;
    static spdlog::level::level_enum convertLevel(LogLevel level);
};

}  // namespace loginet
