#pragma once

#include "common/EventLoop.h"
#include "transport/IConnectionTransport.h"
#include <memory>
#include <string>

namespace TEB {

/**
 * @brief Shared plumbing of the fd based transports
 *
 * Owns the read and write descriptors (which may be the same socket), drives
 * them from the EventLoop, buffers outgoing bytes until the descriptor is
 * writable, and guarantees the once-only onClose delivery.
 */
class StreamTransportBase : public IConnectionTransport {
public:
    ~StreamTransportBase() override;

    StreamTransportBase(const StreamTransportBase &) = delete;
    StreamTransportBase &operator=(const StreamTransportBase &) = delete;

    bool isClosed() const override {
        return closed_;
    }

    void setOnMessage(MessageCallback callback) override {
        onMessage_ = std::move(callback);
    }

    void setOnClose(CloseCallback callback) override {
        onClose_ = std::move(callback);
    }

protected:
    StreamTransportBase(EventLoop &loop, int readFd, int writeFd);

    /**
     * @brief Start watching the descriptors; call once the derived object is ready
     */
    void start();

    /**
     * @brief Append bytes to the outgoing buffer and write as much as possible now
     */
    void queueBytes(const std::string &bytes);

    /**
     * @brief Best-effort synchronous flush of the outgoing buffer (used right before closing)
     */
    void flushNow();

    virtual void onBytes(const char *data, size_t size) = 0;

    /**
     * @brief Peer closed its writing end. Default: finish closing.
     */
    virtual void onEof();

    void dispatchMessage(const json &message);

    /**
     * @brief Release descriptors and schedule the single onClose callback; idempotent
     */
    void finishClose();

    std::weak_ptr<bool> lifetime() const {
        return alive_;
    }

    EventLoop &loop_;

private:
    void handleReadable();
    void handleWritable();
    void updateWatches();

    int readFd_;
    int writeFd_;
    std::string writeBuffer_;
    bool writeFailed_ = false;
    bool closed_ = false;
    MessageCallback onMessage_;
    CloseCallback onClose_;

    // Guards loop callbacks against running after destruction
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

}  // namespace TEB
