#pragma once

#include "pathlayer/common/ILoggerBackend.h"
#include <fmt/format.h>
#include <memory>
#include <source_location>
#include <string>
#include <vector>

namespace pathlayer {

/**
 * @brief Process-wide logging entry point of pathlayer
 *
 * Solvers, the perturbed layer and the trainer report through the LOG_*
 * macros below. Messages go to one backend:
 * - spdlog when the library is built with PATHLAYER_USE_SPDLOG, DefaultBackend otherwise
 * - any ILoggerBackend installed with setBackend()
 *
 * Each message is prefixed with the emitting function ("boundedBellmanFord() - ...").
 * Tests turn on capture to assert on warnings such as "No shortest path".
 *
 * The macros skip formatting when no sink wants the level, so LOG_TRACE in
 * the sampling loop costs one atomic load when tracing is off.
 *
 * Example:
 * @code
 * pathlayer::Logger::initialize("logs", true);
 * pathlayer::Logger::setLevel(pathlayer::LogLevel::Debug);
 * LOG_INFO("Epoch {} done, train gap {:.2f}%", epoch, gap);
 * @endcode
 */
class Logger {
public:
    /// Replace the backend. A null backend falls back to the default one on
    /// the next message. An injected backend filters levels itself, so every
    /// level is forwarded to it until setLevel() is called.
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /// Create the default console backend unless one is installed
    static void initialize();

    /// Create the default backend; spdlog builds also write to
    /// logDir/pathlayer.log when logToFile is set. No effect if a backend is
    /// already installed.
    static void initialize(const std::string& logDir, bool logToFile = true);

    /// Minimum level forwarded to the backend
    static void setLevel(LogLevel level);

    /// True if a message at this level reaches the backend or the capture buffer
    static bool isEnabled(LogLevel level);

    static void trace(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void debug(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void info(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void warn(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void error(const std::string& message,
                      const std::source_location& loc = std::source_location::current());

    static void flush();

    // Capture

    /// While enabled every message, whatever its level, is also kept in
    /// memory as "[level] function() - message"
    static void enableCapture(bool enable);

    static bool isCaptureEnabled();

    /// Captured lines containing pattern, oldest first
    /// @param maxLines Keep only the most recent lines (0 = all)
    static std::vector<std::string> getCapturedLogs(
        const std::string& pattern = "",
        size_t maxLines = 0);

    static void clearCapturedLogs();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void ensureBackend();
    static void dispatch(LogLevel level, const std::string& message,
                         const std::source_location& loc);
    static std::string extractFunctionName(const std::source_location& loc);
    static void captureLog(const std::string& message);
};

}  // namespace pathlayer

// fmt-style format string and arguments, evaluated only for enabled levels
#define PATHLAYER_LOG(level, method, ...)                                                    \
    do {                                                                                     \
        if (pathlayer::Logger::isEnabled(level)) {                                           \
            pathlayer::Logger::method(fmt::format(__VA_ARGS__), std::source_location::current()); \
        }                                                                                    \
    } while (0)

#define LOG_TRACE(...) PATHLAYER_LOG(pathlayer::LogLevel::Trace, trace, __VA_ARGS__)
#define LOG_DEBUG(...) PATHLAYER_LOG(pathlayer::LogLevel::Debug, debug, __VA_ARGS__)
#define LOG_INFO(...)  PATHLAYER_LOG(pathlayer::LogLevel::Info, info, __VA_ARGS__)
#define LOG_WARN(...)  PATHLAYER_LOG(pathlayer::LogLevel::Warn, warn, __VA_ARGS__)
#define LOG_ERROR(...) PATHLAYER_LOG(pathlayer::LogLevel::Error, error, __VA_ARGS__)
