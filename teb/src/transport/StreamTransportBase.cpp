#include "transport/StreamTransportBase.h"
#include "common/Logger.h"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <unistd.h>

namespace TEB {

namespace {

void setNonBlocking(int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

}  // namespace

StreamTransportBase::StreamTransportBase(EventLoop &loop, int readFd, int writeFd)
    : loop_(loop), readFd_(readFd), writeFd_(writeFd) {
    if (readFd_ < 0 || writeFd_ < 0) {
        throw std::invalid_argument("StreamTransportBase requires valid descriptors");
    }
    setNonBlocking(readFd_);
    if (writeFd_ != readFd_) {
        setNonBlocking(writeFd_);
    }
}

StreamTransportBase::~StreamTransportBase() {
    *alive_ = false;
    if (!closed_) {
        loop_.unwatchFd(readFd_);
        loop_.unwatchFd(writeFd_);
        ::close(readFd_);
        if (writeFd_ != readFd_) {
            ::close(writeFd_);
        }
    }
}

void StreamTransportBase::start() {
    updateWatches();
}

void StreamTransportBase::queueBytes(const std::string &bytes) {
    if (closed_ || writeFailed_) {
        LOG_DEBUG("StreamTransportBase: Dropping {} bytes, write side unavailable", bytes.size());
        return;
    }
    writeBuffer_ += bytes;
    handleWritable();
}

void StreamTransportBase::flushNow() {
    if (closed_ || writeFailed_ || writeBuffer_.empty()) {
        return;
    }
    // Bounded wait: closing must not hang on a peer that stopped reading
    for (int attempt = 0; attempt < 10 && !writeBuffer_.empty() && !writeFailed_; ++attempt) {
        pollfd pfd{};
        pfd.fd = writeFd_;
        pfd.events = POLLOUT;
        if (::poll(&pfd, 1, 10) > 0) {
            handleWritable();
        }
    }
}

void StreamTransportBase::onEof() {
    finishClose();
}

void StreamTransportBase::dispatchMessage(const json &message) {
    if (closed_ || !onMessage_) {
        return;
    }
    // The handler may destroy this transport, and onMessage_ with it
    MessageCallback callback = onMessage_;
    callback(message);
}

void StreamTransportBase::finishClose() {
    if (closed_) {
        return;
    }
    closed_ = true;

    loop_.unwatchFd(readFd_);
    loop_.unwatchFd(writeFd_);
    ::close(readFd_);
    if (writeFd_ != readFd_) {
        ::close(writeFd_);
    }
    writeBuffer_.clear();

    std::weak_ptr<bool> alive = alive_;
    loop_.post([this, alive]() {
        if (alive.expired()) {
            return;
        }
        if (onClose_) {
            // The callback may destroy this transport
            auto callback = std::move(onClose_);
            onClose_ = nullptr;
            callback();
        }
    });
}

void StreamTransportBase::handleReadable() {
    std::array<char, 16384> buffer{};
    while (!closed_) {
        const ssize_t bytes = ::read(readFd_, buffer.data(), buffer.size());
        if (bytes > 0) {
            std::weak_ptr<bool> alive = alive_;
            onBytes(buffer.data(), static_cast<size_t>(bytes));
            if (alive.expired()) {
                return;
            }
            continue;
        }
        if (bytes == 0) {
            onEof();
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        LOG_DEBUG("StreamTransportBase: Read failed: {}", std::strerror(errno));
        finishClose();
        return;
    }
}

void StreamTransportBase::handleWritable() {
    while (!writeBuffer_.empty() && !closed_) {
        const ssize_t written = ::write(writeFd_, writeBuffer_.data(), writeBuffer_.size());
        if (written > 0) {
            writeBuffer_.erase(0, static_cast<size_t>(written));
            continue;
        }
        if (written < 0 && errno == EINTR) {
            continue;
        }
        if (written < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            break;
        }
        LOG_DEBUG("StreamTransportBase: Write failed: {}", std::strerror(errno));
        writeFailed_ = true;
        writeBuffer_.clear();
        break;
    }
    if (!closed_) {
        updateWatches();
    }
}

void StreamTransportBase::updateWatches() {
    const bool wantWrite = !writeBuffer_.empty() && !writeFailed_;
    auto onRead = [this](short revents) {
        if (revents & (POLLIN | POLLHUP | POLLERR)) {
            handleReadable();
        }
    };

    if (readFd_ == writeFd_) {
        short events = POLLIN | (wantWrite ? POLLOUT : 0);
        loop_.watchFd(readFd_, events, [this, onRead](short revents) {
            std::weak_ptr<bool> alive = alive_;
            if (revents & POLLOUT) {
                handleWritable();
            }
            if (!alive.expired() && !closed_) {
                onRead(revents);
            }
        });
        return;
    }

    loop_.watchFd(readFd_, POLLIN, onRead);
    if (wantWrite) {
        loop_.watchFd(writeFd_, POLLOUT, [this](short revents) {
            if (revents & (POLLOUT | POLLERR | POLLHUP)) {
                handleWritable();
            }
        });
    } else {
        loop_.unwatchFd(writeFd_);
    }
}

}  // namespace TEB
