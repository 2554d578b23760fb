#include "pathlayer/backends/SpdlogBackend.h"
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace pathlayer {

namespace {

spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
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

}  // namespace

SpdlogBackend::SpdlogBackend(const std::string& logDir, bool logToFile, const std::string& fileName) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    sinks.push_back(console_sink);

    if (logToFile && !logDir.empty()) {
        std::filesystem::create_directories(logDir);
        std::filesystem::path logPath = std::filesystem::path(logDir) / fileName;

        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            logPath.string(), true);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(file_sink);
    }

    // Not registered globally: tests swap backends repeatedly
    logger_ = std::make_shared<spdlog::logger>("pathlayer", sinks.begin(), sinks.end());
    logger_->set_level(toSpdlogLevel(logLevelFromEnvironment().value_or(LogLevel::Info)));
}

void SpdlogBackend::log(LogLevel level, const std::string& message,
                        [[maybe_unused]] const std::source_location& loc) {
    logger_->log(toSpdlogLevel(level), message);
}

void SpdlogBackend::setLevel(LogLevel level) {
    logger_->set_level(toSpdlogLevel(level));
}

void SpdlogBackend::flush() {
    logger_->flush();
}

}  // namespace pathlayer
