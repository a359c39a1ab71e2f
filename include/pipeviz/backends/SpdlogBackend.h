#pragma once

#include "pipeviz/common/ILoggerBackend.h"

#include <memory>
#include <spdlog/spdlog.h>

namespace pipeviz {

/**
 * @brief spdlog-based logger backend
 *
 * Console sink with colored levels, plus an optional file sink
 * (`<logDir>/pipeviz.log`). The initial level honours the LOG_LEVEL or
 * SPDLOG_LEVEL environment variables.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    explicit SpdlogBackend(const std::string& logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;
    static spdlog::level::level_enum convertLevel(LogLevel level);
};

}  // namespace pipeviz
