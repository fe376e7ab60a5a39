#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace TEB {

enum class WebSocketOpcode : uint8_t {
    Continuation = 0x0,
    Text = 0x1,
    Binary = 0x2,
    Close = 0x8,
    Ping = 0x9,
    Pong = 0xA,
};

struct WebSocketFrame {
    bool fin = true;
    WebSocketOpcode opcode = WebSocketOpcode::Text;
    std::string payload;
};

/**
 * @brief RFC 6455 framing for the server side of the debug socket
 *
 * Server frames are never masked; client frames must be. Fragmented data
 * messages are reassembled before they are returned.
 */
class WebSocketFrameCodec {
public:
    static constexpr uint64_t MAX_MESSAGE_SIZE = 256ull * 1024 * 1024;

    /**
     * @brief Encode a single final frame; @p maskKey is only used by tests acting as a client
     */
    static std::string encode(WebSocketOpcode opcode, const std::string &payload,
                              std::optional<uint32_t> maskKey = std::nullopt);

    /**
     * @brief Sec-WebSocket-Accept value for a client's Sec-WebSocket-Key
     */
    static std::string computeAcceptKey(const std::string &clientKey);

    explicit WebSocketFrameCodec(bool requireMask = true) : requireMask_(requireMask) {}

    /**
     * @brief Append raw bytes and return the complete messages (control frames included), in order
     *
     * Protocol violations set hasError() and stop decoding.
     */
    std::vector<WebSocketFrame> feed(const char *data, size_t size);

    bool hasError() const {
        return !error_.empty();
    }

    const std::string &error() const {
        return error_;
    }

private:
    std::optional<WebSocketFrame> decodeOne();

    bool requireMask_;
    std::string buffer_;
    std::string error_;

    // Fragmented message under reassembly
    std::optional<WebSocketFrame> partial_;
};

}  // namespace TEB
