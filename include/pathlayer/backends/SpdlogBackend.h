#pragma once

#include "pathlayer/common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace pathlayer {

/**
 * @brief spdlog-based logger backend
 *
 * Console sink plus, when a directory is given, a truncating file sink
 * `<logDir>/<fileName>` that also records the thread id of each message, so
 * parallel sampling workers can be told apart. Level defaults to Info unless
 * LOG_LEVEL / SPDLOG_LEVEL override it.
 *
 * Default backend when PATHLAYER_USE_SPDLOG=ON.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    explicit SpdlogBackend(const std::string& logDir = "", bool logToFile = false,
                           const std::string& fileName = "pathlayer.log");

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

    /// Underlying logger, for adding sinks
    std::shared_ptr<spdlog::logger> logger() const { return logger_; }

private:
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace pathlayer
