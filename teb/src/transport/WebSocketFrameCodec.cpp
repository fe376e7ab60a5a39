#include "transport/WebSocketFrameCodec.h"

#include <openssl/evp.h>
#include <openssl/sha.h>
#include <stdexcept>

namespace TEB {

namespace {

constexpr const char *HANDSHAKE_GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

bool isControl(WebSocketOpcode opcode) {
    return (static_cast<uint8_t>(opcode) & 0x8) != 0;
}

}  // namespace

std::string WebSocketFrameCodec::encode(WebSocketOpcode opcode, const std::string &payload,
                                        std::optional<uint32_t> maskKey) {
    std::string out;
    out.reserve(payload.size() + 14);
    out.push_back(static_cast<char>(0x80 | static_cast<uint8_t>(opcode)));

    const uint8_t maskBit = maskKey ? 0x80 : 0x00;
    const uint64_t length = payload.size();
    if (length < 126) {
        out.push_back(static_cast<char>(maskBit | length));
    } else if (length <= 0xFFFF) {
        out.push_back(static_cast<char>(maskBit | 126));
        out.push_back(static_cast<char>((length >> 8) & 0xFF));
        out.push_back(static_cast<char>(length & 0xFF));
    } else {
        out.push_back(static_cast<char>(maskBit | 127));
        for (int shift = 56; shift >= 0; shift -= 8) {
            out.push_back(static_cast<char>((length >> shift) & 0xFF));
        }
    }

    if (!maskKey) {
        out += payload;
        return out;
    }

    uint8_t mask[4] = {static_cast<uint8_t>(*maskKey >> 24), static_cast<uint8_t>(*maskKey >> 16),
                       static_cast<uint8_t>(*maskKey >> 8), static_cast<uint8_t>(*maskKey)};
    out.append(reinterpret_cast<const char *>(mask), 4);
    for (size_t i = 0; i < payload.size(); ++i) {
        out.push_back(static_cast<char>(static_cast<uint8_t>(payload[i]) ^ mask[i % 4]));
    }
    return out;
}

std::string WebSocketFrameCodec::computeAcceptKey(const std::string &clientKey) {
    const std::string input = clientKey + HANDSHAKE_GUID;
    unsigned char digest[SHA_DIGEST_LENGTH];
    unsigned int digestLength = 0;
    if (EVP_Digest(input.data(), input.size(), digest, &digestLength, EVP_sha1(), nullptr) != 1) {
        throw std::runtime_error("SHA-1 digest failed");
    }

    // Base64 of 20 bytes is 28 characters plus the terminator
    unsigned char encoded[4 * ((SHA_DIGEST_LENGTH + 2) / 3) + 1];
    const int encodedLength = EVP_EncodeBlock(encoded, digest, static_cast<int>(digestLength));
    return std::string(reinterpret_cast<const char *>(encoded), static_cast<size_t>(encodedLength));
}

std::vector<WebSocketFrame> WebSocketFrameCodec::feed(const char *data, size_t size) {
    std::vector<WebSocketFrame> messages;
    if (hasError()) {
        return messages;
    }
    buffer_.append(data, size);

    while (!hasError()) {
        auto frame = decodeOne();
        if (!frame) {
            break;
        }

        if (isControl(frame->opcode)) {
            messages.push_back(std::move(*frame));
            continue;
        }

        if (frame->opcode == WebSocketOpcode::Continuation) {
            if (!partial_) {
                error_ = "Continuation frame without a started message";
                break;
            }
            partial_->payload += frame->payload;
            if (partial_->payload.size() > MAX_MESSAGE_SIZE) {
                error_ = "Message exceeds maximum size";
                break;
            }
            if (frame->fin) {
                partial_->fin = true;
                messages.push_back(std::move(*partial_));
                partial_.reset();
            }
            continue;
        }

        if (partial_) {
            error_ = "New data frame while a fragmented message is pending";
            break;
        }
        if (frame->fin) {
            messages.push_back(std::move(*frame));
        } else {
            partial_ = std::move(*frame);
        }
    }
    return messages;
}

std::optional<WebSocketFrame> WebSocketFrameCodec::decodeOne() {
    if (buffer_.size() < 2) {
        return std::nullopt;
    }
    const auto *bytes = reinterpret_cast<const uint8_t *>(buffer_.data());

    WebSocketFrame frame;
    frame.fin = (bytes[0] & 0x80) != 0;
    if ((bytes[0] & 0x70) != 0) {
        error_ = "Reserved bits set";
        return std::nullopt;
    }
    const uint8_t opcode = bytes[0] & 0x0F;
    switch (opcode) {
    case 0x0:
    case 0x1:
    case 0x2:
    case 0x8:
    case 0x9:
    case 0xA:
        frame.opcode = static_cast<WebSocketOpcode>(opcode);
        break;
    default:
        error_ = "Unknown opcode " + std::to_string(opcode);
        return std::nullopt;
    }

    const bool masked = (bytes[1] & 0x80) != 0;
    if (requireMask_ && !masked) {
        error_ = "Client frame is not masked";
        return std::nullopt;
    }

    uint64_t length = bytes[1] & 0x7F;
    size_t offset = 2;
    if (length == 126) {
        if (buffer_.size() < 4) {
            return std::nullopt;
        }
        length = (static_cast<uint64_t>(bytes[2]) << 8) | bytes[3];
        offset = 4;
    } else if (length == 127) {
        if (buffer_.size() < 10) {
            return std::nullopt;
        }
        length = 0;
        for (size_t i = 0; i < 8; ++i) {
            length = (length << 8) | bytes[2 + i];
        }
        offset = 10;
    }

    if (isControl(frame.opcode) && (length > 125 || !frame.fin)) {
        error_ = "Invalid control frame";
        return std::nullopt;
    }
    if (length > MAX_MESSAGE_SIZE) {
        error_ = "Frame exceeds maximum size";
        return std::nullopt;
    }

    uint8_t mask[4] = {0, 0, 0, 0};
    if (masked) {
        if (buffer_.size() < offset + 4) {
            return std::nullopt;
        }
        for (size_t i = 0; i < 4; ++i) {
            mask[i] = bytes[offset + i];
        }
        offset += 4;
    }

    if (buffer_.size() < offset + length) {
        return std::nullopt;
    }

    frame.payload = buffer_.substr(offset, static_cast<size_t>(length));
    if (masked) {
        for (size_t i = 0; i < frame.payload.size(); ++i) {
            frame.payload[i] = static_cast<char>(static_cast<uint8_t>(frame.payload[i]) ^ mask[i % 4]);
        }
    }
    buffer_.erase(0, offset + static_cast<size_t>(length));
    return frame;
}

}  // namespace TEB
