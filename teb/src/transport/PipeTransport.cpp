#include "transport/PipeTransport.h"
#include "common/Logger.h"

#include <stdexcept>

namespace TEB {

PipeTransport::PipeTransport(EventLoop &loop, int writeFd, int readFd) : StreamTransportBase(loop, readFd, writeFd) {
    start();
}

void PipeTransport::send(const json &message) {
    if (isClosed()) {
        throw std::runtime_error("Pipe transport is closed");
    }
    queueBytes(NulFrameCodec::encode(message));
}

void PipeTransport::close() {
    flushNow();
    finishClose();
}

void PipeTransport::onBytes(const char *data, size_t size) {
    // A handler may destroy the transport while a frame is dispatched
    auto alive = lifetime();
    for (const auto &frame : codec_.feed(data, size)) {
        if (alive.expired() || isClosed()) {
            return;
        }
        std::string error;
        auto message = JsonUtils::parseJson(frame, &error);
        if (!message) {
            LOG_WARN("PipeTransport: Malformed frame, closing: {}", error);
            finishClose();
            return;
        }
        dispatchMessage(*message);
    }
}

}  // namespace TEB
