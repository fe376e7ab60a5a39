#pragma once

#include "common/JsonUtils.h"
#include <functional>

namespace TEB {

/**
 * @brief Bidirectional channel carrying one JSON object per frame
 *
 * Contract shared by the pipe and socket variants:
 * - send() throws std::runtime_error once the transport is closed
 * - close() always leads to exactly one onClose callback, delivered from the
 *   event loop; peer disconnects and malformed frames end up on the same path
 * - no onMessage callback is delivered after close()
 */
class IConnectionTransport {
public:
    using MessageCallback = std::function<void(const json &message)>;
    using CloseCallback = std::function<void()>;

    virtual ~IConnectionTransport() = default;

    virtual void send(const json &message) = 0;
    virtual void close() = 0;
    virtual bool isClosed() const = 0;

    virtual void setOnMessage(MessageCallback callback) = 0;
    virtual void setOnClose(CloseCallback callback) = 0;
};

}  // namespace TEB
