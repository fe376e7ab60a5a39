#include "transport/WebSocketTransport.h"
#include "common/Logger.h"

#include <stdexcept>

namespace TEB {

WebSocketTransport::WebSocketTransport(EventLoop &loop, int fd, std::string bufferedBytes)
    : StreamTransportBase(loop, fd, fd) {
    start();
    if (!bufferedBytes.empty()) {
        // Deferred so the owner can install callbacks first
        auto alive = lifetime();
        loop_.post([this, alive, bytes = std::move(bufferedBytes)]() {
            if (!alive.expired() && !isClosed()) {
                onBytes(bytes.data(), bytes.size());
            }
        });
    }
}

void WebSocketTransport::send(const json &message) {
    if (isClosed()) {
        throw std::runtime_error("WebSocket transport is closed");
    }
    queueBytes(WebSocketFrameCodec::encode(WebSocketOpcode::Text, message.dump()));
}

void WebSocketTransport::close() {
    if (isClosed()) {
        return;
    }
    if (!closeSent_) {
        closeSent_ = true;
        // Status 1000, normal closure
        queueBytes(WebSocketFrameCodec::encode(WebSocketOpcode::Close, std::string("\x03\xE8", 2)));
        flushNow();
    }
    finishClose();
}

void WebSocketTransport::onBytes(const char *data, size_t size) {
    auto frames = codec_.feed(data, size);
    auto alive = lifetime();
    for (auto &frame : frames) {
        if (alive.expired() || isClosed()) {
            return;
        }
        switch (frame.opcode) {
        case WebSocketOpcode::Ping:
            queueBytes(WebSocketFrameCodec::encode(WebSocketOpcode::Pong, frame.payload));
            break;
        case WebSocketOpcode::Pong:
            break;
        case WebSocketOpcode::Close:
            LOG_DEBUG("WebSocketTransport: Peer sent close");
            close();
            return;
        default: {
            std::string error;
            auto message = JsonUtils::parseJson(frame.payload, &error);
            if (!message) {
                LOG_WARN("WebSocketTransport: Malformed message, closing socket: {}", error);
                finishClose();
                return;
            }
            dispatchMessage(*message);
            if (alive.expired()) {
                return;
            }
            break;
        }
        }
    }
    if (codec_.hasError() && !isClosed()) {
        LOG_WARN("WebSocketTransport: Protocol error, closing socket: {}", codec_.error());
        finishClose();
    }
}

}  // namespace TEB
