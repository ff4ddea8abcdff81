#include "loginet/common/Logger.h"

#ifdef LOGINET_USE_SPDLOG
#include "loginet/backends/SpdlogBackend.h"
#else
#include "loginet/backends/DefaultBackend.h"
#endif

#include <cctype>
#include <deque>
#include <mutex>

namespace loginet {

namespace {

struct CapturedLine {
    LogLevel level;
    std::string text;
};

std::mutex backendMutex;

std::mutex captureMutex;
bool captureEnabled = false;
size_t captureLimit = Logger::DEFAULT_CAPTURE_LIMIT;
std::deque<CapturedLine> capturedLines;

std::unique_ptr<ILoggerBackend> makeDefaultBackend() {
#ifdef LOGINET_USE_SPDLOG
    return std::make_unique<SpdlogBackend>();
#else
    return std::make_unique<DefaultBackend>();
#endif
}

}  // namespace

const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off: return "off";
    }
    return "info";
}

std::unique_ptr<ILoggerBackend> Logger::backend_;

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backendMutex);
    backend_ = std::move(backend);
}

void Logger::initialize() {
    std::lock_guard<std::mutex> lock(backendMutex);
    if (!backend_) {
        backend_ = makeDefaultBackend();
    }
}

void Logger::initialize([[maybe_unused]] const std::string& logDir,
                        [[maybe_unused]] bool logToFile) {
    std::lock_guard<std::mutex> lock(backendMutex);
    if (backend_) {
        return;
    }
#ifdef LOGINET_USE_SPDLOG
    backend_ = std::make_unique<SpdlogBackend>(logDir, logToFile);
#else
    backend_ = std::make_unique<DefaultBackend>();
#endif
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(backendMutex);
    if (!backend_) {
        backend_ = makeDefaultBackend();
    }
    backend_->setLevel(level);
}

void Logger::trace(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Trace, message, loc);
}

void Logger::debug(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Debug, message, loc);
}

void Logger::info(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Info, message, loc);
}

void Logger::warn(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Warn, message, loc);
}

void Logger::error(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Error, message, loc);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(backendMutex);
    if (backend_) {
        backend_->flush();
    }
}

void Logger::write(LogLevel level, const std::string& message, const std::source_location& loc) {
    std::string line = extractFunctionName(loc) + "() - " + message;
    {
        std::lock_guard<std::mutex> lock(backendMutex);
        if (!backend_) {
            backend_ = makeDefaultBackend();
        }
        backend_->log(level, line, loc);
    }
    captureLog(level, std::move(line));
}

// ===== Capture =====

void Logger::enableCapture(bool enable) {
    std::lock_guard<std::mutex> lock(captureMutex);
    captureEnabled = enable;
}

bool Logger::isCaptureEnabled() {
    std::lock_guard<std::mutex> lock(captureMutex);
    return captureEnabled;
}

void Logger::setCaptureLimit(size_t maxLines) {
    std::lock_guard<std::mutex> lock(captureMutex);
    captureLimit = maxLines == 0 ? 1 : maxLines;
    while (capturedLines.size() > captureLimit) {
        capturedLines.pop_front();
    }
}

std::vector<std::string> Logger::getCapturedLogs(const std::string& pattern, size_t maxLines,
                                                 LogLevel minLevel) {
    std::lock_guard<std::mutex> lock(captureMutex);

    std::vector<std::string> result;
    for (const auto& line : capturedLines) {
        if (line.level < minLevel) continue;
        if (!pattern.empty() && line.text.find(pattern) == std::string::npos) continue;
        result.push_back(line.text);
    }

    if (maxLines > 0 && result.size() > maxLines) {
        result.erase(result.begin(), result.end() - static_cast<std::ptrdiff_t>(maxLines));
    }
    return result;
}

void Logger::clearCapturedLogs() {
    std::lock_guard<std::mutex> lock(captureMutex);
    capturedLines.clear();
}

void Logger::captureLog(LogLevel level, std::string line) {
    std::lock_guard<std::mutex> lock(captureMutex);
    if (!captureEnabled) {
        return;
    }
    capturedLines.push_back({level, std::string("[") + toString(level) + "] " + line});
    if (capturedLines.size() > captureLimit) {
        capturedLines.pop_front();
    }
}

// "double loginet::geo::haversineDistance(double, ...)" -> "loginet::geo::haversineDistance"
std::string Logger::extractFunctionName(const std::source_location& loc) {
    std::string signature = loc.function_name();
    size_t paren = signature.find('(');
    if (paren == std::string::npos) {
        return "Unknown";
    }

    // The name starts after the last space that is not inside template brackets
    size_t start = 0;
    int depth = 0;
    for (size_t i = 0; i < paren; ++i) {
        if (signature[i] == '<') ++depth;
        else if (signature[i] == '>') --depth;
        else if (signature[i] == ' ' && depth == 0) start = i + 1;
    }

    std::string name;
    depth = 0;
    for (size_t i = start; i < paren; ++i) {
        char c = signature[i];
        if (c == '<') ++depth;
        else if (c == '>') --depth;
        else if (depth == 0 && c != '*' && c != '&' && !std::isspace(static_cast<unsigned char>(c))) {
            name += c;
        }
    }
    return name.empty() ? "Unknown" : name;
}

// ===== StageTimer =====

StageTimer::~StageTimer() {
    elapsedMs_ = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start_).count();
    LOG_DEBUG("Stage '{}' finished in {:.2f} ms", stage_, elapsedMs_);
}

}  // namespace loginet
