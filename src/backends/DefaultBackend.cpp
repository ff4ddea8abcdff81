#include "loginet/backends/DefaultBackend.h"

#include <chrono>
#include <ctime>
#include <iostream>

#include <fmt/format.h>
#include <unistd.h>

namespace loginet {

DefaultBackend::DefaultBackend(LogLevel level)
    : currentLevel_(level),
      stdoutColor_(::isatty(STDOUT_FILENO) != 0),
      stderrColor_(::isatty(STDERR_FILENO) != 0) {}

void DefaultBackend::log(LogLevel level, const std::string& message,
                         [[maybe_unused]] const std::source_location& loc) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (currentLevel_ == LogLevel::Off || level < currentLevel_) {
        return;
    }

    const bool toStderr = level >= LogLevel::Warn;
    std::ostream& out = toStderr ? std::cerr : std::cout;
    const bool color = toStderr ? stderrColor_ : stdoutColor_;

    if (color) {
        out << fmt::format("[{}] [{}{}\033[0m] {}\n", timestamp(), levelColor(level), toString(level), message);
    } else {
        out << fmt::format("[{}] [{}] {}\n", timestamp(), toString(level), message);
    }
}

void DefaultBackend::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    currentLevel_ = level;
}

void DefaultBackend::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout.flush();
    std::cerr.flush();
}

const char* DefaultBackend::levelColor(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[37m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info: return "\033[32m";
        case LogLevel::Warn: return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Critical: return "\033[1;31m";
        case LogLevel::Off: return "";
    }
    return "";
}

std::string DefaultBackend::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&seconds, &local);
    return fmt::format("{:02}:{:02}:{:02}.{:03}", local.tm_hour, local.tm_min, local.tm_sec, millis);
}

}  // namespace loginet
