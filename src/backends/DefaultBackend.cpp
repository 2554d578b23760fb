#include "pathlayer/backends/DefaultBackend.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

namespace pathlayer {

DefaultBackend::DefaultBackend(std::ostream& out, bool useColor)
    : out_(out),
      useColor_(useColor),
      currentLevel_(logLevelFromEnvironment().value_or(LogLevel::Info)),
      ownerThread_(std::this_thread::get_id()) {}

DefaultBackend::DefaultBackend() : DefaultBackend(std::cout, true) {}

void DefaultBackend::log(LogLevel level, const std::string& message,
                         [[maybe_unused]] const std::source_location& loc) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < currentLevel_ || currentLevel_ == LogLevel::Off) {
        return;
    }

    out_ << "[" << timestamp() << "] [";
    if (useColor_) {
        out_ << levelToColor(level) << logLevelToString(level) << "\033[0m";
    } else {
        out_ << logLevelToString(level);
    }
    out_ << "] ";

    if (std::this_thread::get_id() != ownerThread_) {
        out_ << "[thread " << std::this_thread::get_id() << "] ";
    }
    out_ << message << '\n';
}

void DefaultBackend::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    currentLevel_ = level;
}

void DefaultBackend::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    out_.flush();
}

const char* DefaultBackend::levelToColor(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[37m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info: return "\033[32m";
        case LogLevel::Warn: return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Critical: return "\033[1;41m";
        default: return "";
    }
}

std::string DefaultBackend::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

}  // namespace pathlayer
