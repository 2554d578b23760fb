#pragma once

#include "pathlayer/common/ILoggerBackend.h"
#include <iosfwd>
#include <mutex>
#include <thread>

namespace pathlayer {

/**
 * @brief Dependency-free stream logger
 *
 * Writes one line per message: timestamp, level, the id of the emitting
 * thread when it is not the one that created the backend (sampling workers),
 * then the message. Level defaults to Info unless LOG_LEVEL overrides it.
 *
 * Used when the library is built with PATHLAYER_USE_SPDLOG=OFF.
 */
class DefaultBackend : public ILoggerBackend {
public:
    /// @param out Destination stream; must outlive the backend
    /// @param useColor Wrap level names in ANSI color codes
    explicit DefaultBackend(std::ostream& out, bool useColor = true);

    /// Colored output to stdout
    DefaultBackend();

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::ostream& out_;
    bool useColor_;
    LogLevel currentLevel_;
    std::thread::id ownerThread_;
    std::mutex mutex_;

    static const char* levelToColor(LogLevel level);
    static std::string timestamp();
};

}  // namespace pathlayer
