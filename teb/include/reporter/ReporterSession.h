#pragma once

#include "common/CancellationToken.h"
#include "common/EventLoop.h"
#include "reporter/ITestListener.h"
#include "transport/IConnectionTransport.h"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>

namespace TEB {

/**
 * @brief Reporter protocol state machine for one child run
 *
 * Dispatches inbound frames to an ITestListener and enforces cancellation:
 *
 *   Idle --attach--> Listening --onEnd--> Completed
 *                        |
 *                     cancel
 *                        v
 *                    Canceling --transport closed--> Closed
 *
 * Any transport close that is not preceded by onEnd also ends in Closed.
 * Once the token is cancelled every frame except onEnd is dropped. After a
 * cancellation a "stop" request is sent and the transport is force-closed if
 * the child has not closed it when the grace period expires.
 *
 * The completion callback fires exactly once, after the transport has closed
 * (or after abort() when no transport ever arrived).
 */
class ReporterSession {
public:
    enum class State { Idle, Listening, Canceling, Completed, Closed };

    using CompletionCallback = std::function<void()>;

    ReporterSession(EventLoop &loop, ITestListener &listener, CancellationToken token,
                    std::chrono::milliseconds gracePeriod);
    ~ReporterSession();

    ReporterSession(const ReporterSession &) = delete;
    ReporterSession &operator=(const ReporterSession &) = delete;

    /**
     * @brief Take ownership of the connected side channel and start dispatching
     * @throws std::logic_error when a transport is already attached
     */
    void attach(std::unique_ptr<IConnectionTransport> transport);

    /**
     * @brief End the session without a transport (spawn failure, child died before connecting)
     */
    void abort();

    void onCompleted(CompletionCallback callback) {
        onCompleted_ = std::move(callback);
    }

    State state() const {
        return state_;
    }

    bool isFinished() const {
        return finished_;
    }

    bool hasTransport() const {
        return transport_ != nullptr;
    }

    /**
     * @brief True when onEnd arrived from the runner before the channel closed
     */
    bool endedGracefully() const {
        return receivedEnd_;
    }

private:
    void handleMessage(const json &message);
    void handleCancel();
    void handleTransportClosed();
    void sendStop();
    void finish();

    EventLoop &loop_;
    ITestListener &listener_;
    CancellationToken token_;
    std::chrono::milliseconds gracePeriod_;

    std::unique_ptr<IConnectionTransport> transport_;
    CancellationRegistration cancelRegistration_;
    std::optional<EventLoop::TimerId> graceTimer_;
    CompletionCallback onCompleted_;

    State state_ = State::Idle;
    bool receivedEnd_ = false;
    bool finished_ = false;
};

const char *toString(ReporterSession::State state);

}  // namespace TEB
