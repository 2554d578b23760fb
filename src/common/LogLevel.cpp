#include "pathlayer/common/ILoggerBackend.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace pathlayer {

const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off: return "off";
    }
    return "off";
}

LogLevel logLevelFromString(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "err" || lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    throw std::invalid_argument("Unknown log level: '" + name + "'");
}

std::optional<LogLevel> logLevelFromEnvironment() {
    const char* value = std::getenv("LOG_LEVEL");
    if (!value) {
        value = std::getenv("SPDLOG_LEVEL");
    }
    if (!value) {
        return std::nullopt;
    }

    try {
        return logLevelFromString(value);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

}  // namespace pathlayer
