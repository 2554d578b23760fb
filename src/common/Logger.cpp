#include "pathlayer/common/Logger.h"

#ifdef PATHLAYER_USE_SPDLOG
#include "pathlayer/backends/SpdlogBackend.h"
#else
#include "pathlayer/backends/DefaultBackend.h"
#endif

#include <atomic>
#include <cctype>
#include <mutex>

namespace pathlayer {

std::unique_ptr<ILoggerBackend> Logger::backend_;

namespace {

std::mutex backend_mutex;

// Lowest level the installed backend accepts; Trace until one is known
std::atomic<LogLevel> backend_threshold{LogLevel::Trace};

// Log capture state
std::atomic<bool> capture_enabled{false};
std::vector<std::string> captured_logs;
std::mutex capture_mutex;

// Both default backends start at this level
LogLevel defaultLevel() {
    return logLevelFromEnvironment().value_or(LogLevel::Info);
}

std::unique_ptr<ILoggerBackend> makeDefaultBackend([[maybe_unused]] const std::string& logDir,
                                                   [[maybe_unused]] bool logToFile) {
    backend_threshold.store(defaultLevel());
#ifdef PATHLAYER_USE_SPDLOG
    return std::make_unique<SpdlogBackend>(logDir, logToFile);
#else
    return std::make_unique<DefaultBackend>();
#endif
}

}  // namespace

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    backend_threshold.store(backend ? LogLevel::Trace : defaultLevel());
    backend_ = std::move(backend);
}

void Logger::initialize() {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = makeDefaultBackend("", false);
    }
}

void Logger::initialize(const std::string& logDir, bool logToFile) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = makeDefaultBackend(logDir, logToFile);
    }
}

void Logger::setLevel(LogLevel level) {
    ensureBackend();
    std::lock_guard<std::mutex> lock(backend_mutex);
    backend_->setLevel(level);
    backend_threshold.store(level);
}

bool Logger::isEnabled(LogLevel level) {
    return level >= backend_threshold.load(std::memory_order_relaxed) ||
           capture_enabled.load(std::memory_order_relaxed);
}

void Logger::trace(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Trace, message, loc);
}

void Logger::debug(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Debug, message, loc);
}

void Logger::info(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Info, message, loc);
}

void Logger::warn(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Warn, message, loc);
}

void Logger::error(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Error, message, loc);
}

void Logger::flush() {
    ensureBackend();
    std::lock_guard<std::mutex> lock(backend_mutex);
    backend_->flush();
}

void Logger::ensureBackend() {
    initialize();
}

void Logger::dispatch(LogLevel level, const std::string& message,
                      const std::source_location& loc) {
    std::string enhanced = extractFunctionName(loc) + "() - " + message;
    {
        std::lock_guard<std::mutex> lock(backend_mutex);
        if (!backend_) {
            backend_ = makeDefaultBackend("", false);
        }
        backend_->log(level, enhanced, loc);
    }
    captureLog(std::string("[") + logLevelToString(level) + "] " + enhanced);
}

// ===== Log Capture Implementation =====

void Logger::enableCapture(bool enable) {
    capture_enabled.store(enable);
}

bool Logger::isCaptureEnabled() {
    return capture_enabled.load();
}

std::vector<std::string> Logger::getCapturedLogs(const std::string& pattern, size_t maxLines) {
    std::lock_guard<std::mutex> lock(capture_mutex);

    std::vector<std::string> result;
    for (const auto& line : captured_logs) {
        if (pattern.empty() || line.find(pattern) != std::string::npos) {
            result.push_back(line);
        }
    }

    // Keep the most recent lines
    if (maxLines > 0 && result.size() > maxLines) {
        result.erase(result.begin(), result.begin() + static_cast<std::ptrdiff_t>(result.size() - maxLines));
    }

    return result;
}

void Logger::clearCapturedLogs() {
    std::lock_guard<std::mutex> lock(capture_mutex);
    captured_logs.clear();
}

void Logger::captureLog(const std::string& message) {
    if (!capture_enabled.load()) return;
    std::lock_guard<std::mutex> lock(capture_mutex);
    captured_logs.push_back(message);
}

std::string Logger::extractFunctionName(const std::source_location& loc) {
    std::string full_name = loc.function_name();

    size_t paren_pos = full_name.find('(');
    if (paren_pos == std::string::npos) {
        return "Unknown";
    }

    // Start of the name is the last top-level space before the parameter list
    int angle_count = 0;
    size_t name_start = 0;
    for (size_t i = 0; i < paren_pos; ++i) {
        char c = full_name[i];
        if (c == '<') angle_count++;
        else if (c == '>') angle_count--;
        else if (c == ' ' && angle_count == 0) name_start = i + 1;
    }

    std::string qualified = full_name.substr(name_start, paren_pos - name_start);

    // Drop template arguments
    std::string result;
    angle_count = 0;
    for (char c : qualified) {
        if (c == '<') angle_count++;
        else if (c == '>') angle_count--;
        else if (angle_count == 0) result += c;
    }

    while (!result.empty() && (std::isspace(static_cast<unsigned char>(result[0])) ||
                               result[0] == '*' || result[0] == '&')) {
        result.erase(0, 1);
    }
    while (!result.empty() && std::isspace(static_cast<unsigned char>(result.back()))) {
        result.pop_back();
    }

    return result.empty() ? "Unknown" : result;
}

}  // namespace pathlayer
