#include "loginet/backends/SpdlogBackend.h"
#include <cstdlib>
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace loginet {

SpdlogBackend::SpdlogBackend(const std::string& logDir, bool logToFile) {
    // Registered by an earlier instance; reuse rather than register twice
    logger_ = spdlog::get(LOGGER_NAME);
    if (!logger_) {
        std::vector<spdlog::sink_ptr> sinks;

        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console);

        if (logToFile && !logDir.empty()) {
            std::filesystem::create_directories(logDir);
            auto path = std::filesystem::path(logDir) / "loginet.log";
            auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), true);
            file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] [%s:%#] %v");
            sinks.push_back(file);
        }

        logger_ = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
        spdlog::register_logger(logger_);
    }

    logger_->set_level(spdlog::level::info);
    if (const char* env = std::getenv(LEVEL_ENV)) {
        // from_str maps unknown names to off; keep Info for those
        auto level = spdlog::level::from_str(env);
        if (level != spdlog::level::off || std::string(env) == "off") {
            logger_->set_level(level);
        }
    }
}

void SpdlogBackend::log(LogLevel level, const std::string& message, const std::source_location& loc) {
    logger_->log(spdlog::source_loc{loc.file_name(), static_cast<int>(loc.line()), loc.function_name()},
                 convertLevel(level), message);
}

void SpdlogBackend::setLevel(LogLevel level) {
    logger_->set_level(convertLevel(level));
}

void SpdlogBackend::flush() {
    logger_->flush();
}

spdlog::level::level_enum SpdlogBackend::convertLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Warn: return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off: return spdlog::level::off;
    }
    return spdlog::level::info;
}

}  // namespace loginet
