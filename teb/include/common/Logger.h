#pragma once

#include "common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <source_location>
#include <string>

namespace TEB {

/**
 * @brief Process-wide logging facade used through the LOG_* macros
 *
 * Messages go to the installed ILoggerBackend; an SpdlogBackend writing to
 * stderr is created on first use when the host installed none. Messages are
 * written as "<Component>: <text>".
 *
 * @code
 * TEB::Logger::initialize(settings.logDir);
 * LOG_INFO("ProcessBridge: Listing tests for {}", configFile);
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Replace the backend (ownership transferred)
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Install the spdlog backend unless a backend is already set
     * @param logDir Also write bridge.log there; empty for stderr only
     */
    static void initialize(const std::string &logDir = "");

    static void setLevel(LogLevel level);

    static void log(LogLevel level, const std::string &message,
                    const std::source_location &loc = std::source_location::current());

    static void flush();

private:
    static ILoggerBackend &backend();

    static std::unique_ptr<ILoggerBackend> backend_;
};

}  // namespace TEB

#define LOG_TRACE(...) TEB::Logger::log(TEB::LogLevel::Trace, std::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) TEB::Logger::log(TEB::LogLevel::Debug, std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...) TEB::Logger::log(TEB::LogLevel::Info, std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...) TEB::Logger::log(TEB::LogLevel::Warn, std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) TEB::Logger::log(TEB::LogLevel::Error, std::format(__VA_ARGS__), std::source_location::current())
