#pragma once

#include "transport/StreamTransportBase.h"
#include "transport/WebSocketFrameCodec.h"

namespace TEB {

/**
 * @brief Server side of an upgraded debug socket connection
 *
 * Each text or binary message carries one JSON object. Pings are answered,
 * a close frame from the peer is echoed and closes the transport, and a
 * message that is not JSON closes the socket.
 */
class WebSocketTransport : public StreamTransportBase {
public:
    /**
     * @param fd Connected socket after a completed handshake; ownership is taken
     * @param bufferedBytes Bytes received after the handshake request, decoded first
     */
    WebSocketTransport(EventLoop &loop, int fd, std::string bufferedBytes = {});

    void send(const json &message) override;
    void close() override;

protected:
    void onBytes(const char *data, size_t size) override;

private:
    WebSocketFrameCodec codec_;
    bool closeSent_ = false;
};

}  // namespace TEB
