#pragma once

#include <optional>
#include <source_location>
#include <string>

namespace pathlayer {

/// Severity of a log message, lowest first
enum class LogLevel {
    Trace = 0,   ///< Per-sample diagnostics of the perturbed layer
    Debug = 1,   ///< Per-call summaries (compression, skipped ratios)
    Info = 2,    ///< Training progress
    Warn = 3,    ///< Degenerate results: no path, unnormalized weights
    Error = 4,
    Critical = 5,
    Off = 6
};

/// Lower-case level name ("trace" ... "off")
const char* logLevelToString(LogLevel level);

/// Parse a level name, case-insensitive; "warning" and "err" are accepted
/// @throws std::invalid_argument for unknown names
LogLevel logLevelFromString(const std::string& name);

/// Level requested through LOG_LEVEL (or SPDLOG_LEVEL when unset).
/// Unknown names are ignored.
std::optional<LogLevel> logLevelFromEnvironment();

/**
 * @brief Logger backend interface for dependency injection
 *
 * Implement this interface to route pathlayer diagnostics into the logging
 * system of the embedding application (training driver, notebook bridge, ...).
 * Backends must accept calls from several threads at once: oracle workers
 * log while sampling.
 *
 * Example:
 * @code
 * class MyLogger : public pathlayer::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string& message,
 *              const std::source_location& loc) override {
 *         mySystem->write(level, message, loc.file_name(), loc.line());
 *     }
 *     void setLevel(LogLevel level) override { mySystem->setMinLevel(level); }
 *     void flush() override { mySystem->flush(); }
 * };
 *
 * pathlayer::Logger::setBackend(std::make_unique<MyLogger>());
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /// @param message Formatted message, already prefixed with the caller name
    virtual void log(LogLevel level, const std::string& message,
                     const std::source_location& loc) = 0;

    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

}  // namespace pathlayer
