#pragma once

#include "common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace TEB {

/**
 * @brief Default Logger backend: colored stderr, plus bridge.log when a log directory is given
 *
 * The initial level is info; SPDLOG_LEVEL overrides it (e.g. SPDLOG_LEVEL=teb=debug).
 */
class SpdlogBackend : public ILoggerBackend {
public:
    static constexpr const char *LOGGER_NAME = "teb";

    explicit SpdlogBackend(const std::string &logDir = "");
    ~SpdlogBackend() override;

    void log(LogLevel level, const std::string &message, const std::source_location &loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    static spdlog::level::level_enum convertLevel(LogLevel level);

    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace TEB
