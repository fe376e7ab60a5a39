#include "common/Logger.h"
#include "backends/SpdlogBackend.h"

#include <mutex>

namespace TEB {

std::unique_ptr<ILoggerBackend> Logger::backend_;

namespace {
std::mutex backendMutex;
}  // namespace

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backendMutex);
    backend_ = std::move(backend);
}

void Logger::initialize(const std::string &logDir) {
    std::lock_guard<std::mutex> lock(backendMutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>(logDir);
    }
}

void Logger::setLevel(LogLevel level) {
    backend().setLevel(level);
}

void Logger::log(LogLevel level, const std::string &message, const std::source_location &loc) {
    backend().log(level, message, loc);
}

void Logger::flush() {
    backend().flush();
}

ILoggerBackend &Logger::backend() {
    std::lock_guard<std::mutex> lock(backendMutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>();
    }
    return *backend_;
}

}  // namespace TEB
