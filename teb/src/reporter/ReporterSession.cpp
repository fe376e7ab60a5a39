#include "reporter/ReporterSession.h"
#include "common/Constants.h"
#include "common/Logger.h"

#include <stdexcept>

namespace TEB {

const char *toString(ReporterSession::State state) {
    switch (state) {
    case ReporterSession::State::Idle:
        return "Idle";
    case ReporterSession::State::Listening:
        return "Listening";
    case ReporterSession::State::Canceling:
        return "Canceling";
    case ReporterSession::State::Completed:
        return "Completed";
    case ReporterSession::State::Closed:
        return "Closed";
    }
    return "Unknown";
}

ReporterSession::ReporterSession(EventLoop &loop, ITestListener &listener, CancellationToken token,
                                 std::chrono::milliseconds gracePeriod)
    : loop_(loop), listener_(listener), token_(std::move(token)), gracePeriod_(gracePeriod) {
    if (gracePeriod_.count() < 0) {
        throw std::invalid_argument("ReporterSession grace period must not be negative");
    }
    cancelRegistration_ = token_.onCancellationRequested([this]() { handleCancel(); });
}

ReporterSession::~ReporterSession() {
    if (graceTimer_) {
        loop_.cancelTimer(*graceTimer_);
    }
    if (transport_) {
        transport_->setOnMessage(nullptr);
        transport_->setOnClose(nullptr);
    }
}

void ReporterSession::attach(std::unique_ptr<IConnectionTransport> transport) {
    if (!transport) {
        throw std::invalid_argument("ReporterSession::attach requires a transport");
    }
    if (transport_) {
        throw std::logic_error("ReporterSession already has a transport");
    }
    if (finished_) {
        LOG_DEBUG("ReporterSession: Transport arrived after the session finished, closing it");
        transport->close();
        return;
    }

    transport_ = std::move(transport);
    transport_->setOnMessage([this](const json &message) { handleMessage(message); });
    transport_->setOnClose([this]() { handleTransportClosed(); });

    if (state_ == State::Canceling) {
        // Cancelled while waiting for the connection
        sendStop();
        return;
    }
    state_ = State::Listening;
}

void ReporterSession::abort() {
    if (finished_) {
        return;
    }
    if (transport_ && !transport_->isClosed()) {
        transport_->close();
        return;
    }
    LOG_DEBUG("ReporterSession: Aborted in state {}", toString(state_));
    if (state_ != State::Completed) {
        state_ = State::Closed;
    }
    finish();
}

void ReporterSession::handleMessage(const json &message) {
    const std::string method = JsonUtils::getString(message, "method");
    const json params = message.contains("params") ? message["params"] : json::object();

    if (token_.isCancellationRequested() && method != Constants::METHOD_ON_END) {
        LOG_TRACE("ReporterSession: Dropping '{}' after cancellation", method);
        return;
    }

    if (method == Constants::METHOD_ON_BEGIN) {
        listener_.onBegin(BeginParams::fromJson(params));
    } else if (method == Constants::METHOD_ON_TEST_BEGIN) {
        listener_.onTestBegin(TestBeginParams::fromJson(params));
    } else if (method == Constants::METHOD_ON_TEST_END) {
        listener_.onTestEnd(TestEndParams::fromJson(params));
    } else if (method == Constants::METHOD_ON_STEP_BEGIN) {
        listener_.onStepBegin(StepBeginParams::fromJson(params));
    } else if (method == Constants::METHOD_ON_STEP_END) {
        listener_.onStepEnd(StepEndParams::fromJson(params));
    } else if (method == Constants::METHOD_ON_ERROR) {
        listener_.onError(ErrorParams::fromJson(params));
    } else if (method == Constants::METHOD_ON_END) {
        if (receivedEnd_) {
            return;
        }
        receivedEnd_ = true;
        state_ = State::Completed;
        listener_.onEnd();
        if (transport_ && !transport_->isClosed()) {
            transport_->close();
        }
    } else {
        LOG_DEBUG("ReporterSession: Ignoring unknown method '{}'", method);
    }
}

void ReporterSession::handleCancel() {
    if (finished_ || state_ == State::Completed || state_ == State::Canceling) {
        return;
    }
    LOG_DEBUG("ReporterSession: Cancellation requested in state {}", toString(state_));
    const bool connected = transport_ != nullptr;
    state_ = State::Canceling;

    graceTimer_ = loop_.addTimer(gracePeriod_, [this]() {
        graceTimer_.reset();
        if (finished_) {
            return;
        }
        LOG_WARN("ReporterSession: Runner did not stop within {} ms, closing side channel", gracePeriod_.count());
        abort();
    });

    if (connected) {
        sendStop();
    }
}

void ReporterSession::sendStop() {
    if (!transport_ || transport_->isClosed()) {
        return;
    }
    try {
        transport_->send(json{{"id", 0}, {"method", std::string(Constants::METHOD_STOP)}, {"params", json::object()}});
    } catch (const std::exception &e) {
        LOG_DEBUG("ReporterSession: Failed to send stop, closing: {}", e.what());
        transport_->close();
    }
}

void ReporterSession::handleTransportClosed() {
    if (state_ != State::Completed) {
        if (!receivedEnd_) {
            LOG_DEBUG("ReporterSession: Side channel closed without onEnd");
        }
        state_ = State::Closed;
    }
    finish();
}

void ReporterSession::finish() {
    if (finished_) {
        return;
    }
    finished_ = true;
    cancelRegistration_.reset();
    if (graceTimer_) {
        loop_.cancelTimer(*graceTimer_);
        graceTimer_.reset();
    }
    if (onCompleted_) {
        auto callback = std::move(onCompleted_);
        onCompleted_ = nullptr;
        callback();
    }
}

}  // namespace TEB
