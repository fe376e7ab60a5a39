#pragma once

#include "common/EventLoop.h"
#include "transport/IConnectionTransport.h"
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace TEB {

/**
 * @brief Loopback listener handing out the first upgraded debug socket
 *
 * Binds 127.0.0.1 on an ephemeral port and accepts upgrade requests whose
 * path matches the listener's secret path. Requests for any other path, or
 * without a valid handshake, are answered with an HTTP error and dropped.
 * After the first successful upgrade the listener stops accepting.
 */
class WebSocketServer {
public:
    using ConnectionCallback = std::function<void(std::unique_ptr<IConnectionTransport> transport)>;

    /**
     * @param path Secret request path, including the leading '/'
     */
    WebSocketServer(EventLoop &loop, std::string path);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer &) = delete;
    WebSocketServer &operator=(const WebSocketServer &) = delete;

    /**
     * @brief Start listening
     * @return Endpoint of the form ws://127.0.0.1:<port><path>
     * @throws std::runtime_error if the socket cannot be bound
     */
    std::string listen();

    void onConnection(ConnectionCallback callback) {
        onConnection_ = std::move(callback);
    }

    /**
     * @brief Stop accepting and drop connections still handshaking
     */
    void stop();

    bool isListening() const {
        return listenFd_ >= 0;
    }

    int port() const {
        return port_;
    }

    /**
     * @brief Parse a complete upgrade request and build the 101 response
     * @return Response text, or empty when the request must be rejected
     */
    static std::string buildHandshakeResponse(const std::string &request, const std::string &expectedPath);

private:
    void acceptPending();
    void readHandshake(int fd);
    void dropPending(int fd);

    EventLoop &loop_;
    std::string path_;
    int listenFd_ = -1;
    int port_ = 0;
    ConnectionCallback onConnection_;
    std::map<int, std::string> pending_;
};

}  // namespace TEB
