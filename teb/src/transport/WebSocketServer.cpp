#include "transport/WebSocketServer.h"
#include "common/Logger.h"
#include "transport/WebSocketFrameCodec.h"
#include "transport/WebSocketTransport.h"

#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sstream>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>

namespace TEB {

namespace {

constexpr size_t MAX_HANDSHAKE_SIZE = 16 * 1024;
constexpr const char *BAD_REQUEST = "HTTP/1.1 400 Bad Request\r\nConnection: close\r\nContent-Length: 0\r\n\r\n";

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string &value) {
    const auto begin = value.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\r");
    return value.substr(begin, end - begin + 1);
}

void writeAll(int fd, const std::string &data) {
    size_t offset = 0;
    while (offset < data.size()) {
        const ssize_t written = ::send(fd, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
        if (written > 0) {
            offset += static_cast<size_t>(written);
            continue;
        }
        if (written < 0 && errno == EINTR) {
            continue;
        }
        if (written < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLOUT;
            if (::poll(&pfd, 1, 1000) > 0) {
                continue;
            }
        }
        throw std::runtime_error(std::string("Handshake write failed: ") + std::strerror(errno));
    }
}

}  // namespace

WebSocketServer::WebSocketServer(EventLoop &loop, std::string path) : loop_(loop), path_(std::move(path)) {
    if (path_.empty() || path_.front() != '/') {
        throw std::invalid_argument("WebSocketServer path must start with '/'");
    }
}

WebSocketServer::~WebSocketServer() {
    stop();
}

std::string WebSocketServer::listen() {
    if (listenFd_ >= 0) {
        return "ws://127.0.0.1:" + std::to_string(port_) + path_;
    }

    listenFd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (listenFd_ < 0) {
        throw std::runtime_error(std::string("Failed to create socket: ") + std::strerror(errno));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;

    if (::bind(listenFd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0 || ::listen(listenFd_, 4) < 0) {
        const std::string reason = std::strerror(errno);
        ::close(listenFd_);
        listenFd_ = -1;
        throw std::runtime_error("Failed to listen on loopback: " + reason);
    }

    socklen_t length = sizeof(addr);
    if (::getsockname(listenFd_, reinterpret_cast<sockaddr *>(&addr), &length) < 0) {
        const std::string reason = std::strerror(errno);
        ::close(listenFd_);
        listenFd_ = -1;
        throw std::runtime_error("Failed to query listening port: " + reason);
    }
    port_ = ntohs(addr.sin_port);

    loop_.watchFd(listenFd_, POLLIN, [this](short) { acceptPending(); });

    const std::string endpoint = "ws://127.0.0.1:" + std::to_string(port_) + path_;
    LOG_DEBUG("WebSocketServer: Listening on {}", endpoint);
    return endpoint;
}

void WebSocketServer::stop() {
    if (listenFd_ >= 0) {
        loop_.unwatchFd(listenFd_);
        ::close(listenFd_);
        listenFd_ = -1;
    }
    while (!pending_.empty()) {
        dropPending(pending_.begin()->first);
    }
}

void WebSocketServer::acceptPending() {
    while (listenFd_ >= 0) {
        const int fd = ::accept4(listenFd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (fd < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                LOG_WARN("WebSocketServer: Accept failed: {}", std::strerror(errno));
            }
            return;
        }
        pending_[fd] = std::string();
        loop_.watchFd(fd, POLLIN, [this, fd](short) { readHandshake(fd); });
    }
}

void WebSocketServer::readHandshake(int fd) {
    auto it = pending_.find(fd);
    if (it == pending_.end()) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t bytes = ::recv(fd, buffer, sizeof(buffer), 0);
        if (bytes > 0) {
            it->second.append(buffer, static_cast<size_t>(bytes));
            continue;
        }
        if (bytes < 0 && errno == EINTR) {
            continue;
        }
        if (bytes < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            break;
        }
        dropPending(fd);
        return;
    }

    const auto headerEnd = it->second.find("\r\n\r\n");
    if (headerEnd == std::string::npos) {
        if (it->second.size() > MAX_HANDSHAKE_SIZE) {
            LOG_WARN("WebSocketServer: Handshake request too large");
            dropPending(fd);
        }
        return;
    }

    const std::string request = it->second.substr(0, headerEnd + 4);
    std::string remainder = it->second.substr(headerEnd + 4);
    const std::string response = buildHandshakeResponse(request, path_);

    loop_.unwatchFd(fd);
    pending_.erase(it);

    try {
        if (response.empty()) {
            LOG_WARN("WebSocketServer: Rejected upgrade request: {}", request.substr(0, request.find('\r')));
            writeAll(fd, BAD_REQUEST);
            ::close(fd);
            return;
        }
        writeAll(fd, response);
    } catch (const std::exception &e) {
        LOG_WARN("WebSocketServer: {}", e.what());
        ::close(fd);
        return;
    }

    // Only one client per listener
    if (listenFd_ >= 0) {
        loop_.unwatchFd(listenFd_);
        ::close(listenFd_);
        listenFd_ = -1;
    }

    LOG_DEBUG("WebSocketServer: Client connected on {}", path_);
    auto transport = std::make_unique<WebSocketTransport>(loop_, fd, std::move(remainder));
    if (onConnection_) {
        onConnection_(std::move(transport));
    }
}

void WebSocketServer::dropPending(int fd) {
    loop_.unwatchFd(fd);
    ::close(fd);
    pending_.erase(fd);
}

std::string WebSocketServer::buildHandshakeResponse(const std::string &request, const std::string &expectedPath) {
    std::istringstream stream(request);
    std::string requestLine;
    if (!std::getline(stream, requestLine)) {
        return "";
    }
    requestLine = trim(requestLine);

    std::istringstream lineStream(requestLine);
    std::string method;
    std::string target;
    std::string version;
    lineStream >> method >> target >> version;
    if (method != "GET" || target != expectedPath || version.rfind("HTTP/1.1", 0) != 0) {
        return "";
    }

    std::map<std::string, std::string> headers;
    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty()) {
            break;
        }
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            return "";
        }
        headers[toLower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }

    const auto upgrade = headers.find("upgrade");
    const auto connection = headers.find("connection");
    const auto key = headers.find("sec-websocket-key");
    if (upgrade == headers.end() || toLower(upgrade->second) != "websocket") {
        return "";
    }
    if (connection == headers.end() || toLower(connection->second).find("upgrade") == std::string::npos) {
        return "";
    }
    if (key == headers.end() || key->second.empty()) {
        return "";
    }

    return "HTTP/1.1 101 Switching Protocols\r\n"
           "Upgrade: websocket\r\n"
           "Connection: Upgrade\r\n"
           "Sec-WebSocket-Accept: " +
           WebSocketFrameCodec::computeAcceptKey(key->second) + "\r\n\r\n";
}

}  // namespace TEB
