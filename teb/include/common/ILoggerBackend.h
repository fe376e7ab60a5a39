#pragma once

#include <source_location>
#include <string>

namespace TEB {

enum class LogLevel { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Critical = 5, Off = 6 };

/**
 * @brief Destination of the bridge's log output
 *
 * Hosts route bridge logs into their own output (an editor output channel,
 * a buffer captured by a test) by installing a backend with Logger::setBackend().
 *
 * @code
 * class OutputChannelBackend : public TEB::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string &message, const std::source_location &) override {
 *         if (level >= level_) channel_->appendLine(message);
 *     }
 *     void setLevel(LogLevel level) override { level_ = level; }
 *     void flush() override {}
 * };
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @param message Formatted message, already carrying its component prefix
     * @param loc Call site of the LOG_* macro
     */
    virtual void log(LogLevel level, const std::string &message, const std::source_location &loc) = 0;

    // Messages below @p level are dropped
    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

}  // namespace TEB
