#include "common/CancellationToken.h"

namespace TEB {

CancellationRegistration::CancellationRegistration(std::weak_ptr<detail::CancellationState> state, uint64_t id)
    : state_(std::move(state)), id_(id) {}

CancellationRegistration::~CancellationRegistration() {
    reset();
}

CancellationRegistration::CancellationRegistration(CancellationRegistration &&other) noexcept
    : state_(std::move(other.state_)), id_(other.id_) {
    other.state_.reset();
}

CancellationRegistration &CancellationRegistration::operator=(CancellationRegistration &&other) noexcept {
    if (this != &other) {
        reset();
        state_ = std::move(other.state_);
        id_ = other.id_;
        other.state_.reset();
    }
    return *this;
}

void CancellationRegistration::reset() {
    if (auto state = state_.lock()) {
        state->callbacks.erase(id_);
    }
    state_.reset();
}

bool CancellationToken::isCancellationRequested() const {
    return state_ && state_->cancelled;
}

CancellationRegistration CancellationToken::onCancellationRequested(std::function<void()> callback) const {
    if (!state_ || !callback) {
        return {};
    }
    if (state_->cancelled) {
        callback();
        return {};
    }
    uint64_t id = state_->nextId++;
    state_->callbacks.emplace(id, std::move(callback));
    return CancellationRegistration(state_, id);
}

CancellationTokenSource::CancellationTokenSource() : state_(std::make_shared<detail::CancellationState>()) {}

CancellationToken CancellationTokenSource::token() const {
    return CancellationToken(state_);
}

void CancellationTokenSource::cancel() {
    if (state_->cancelled) {
        return;
    }
    state_->cancelled = true;

    // Callbacks may drop their own registration while running
    auto callbacks = std::move(state_->callbacks);
    state_->callbacks.clear();
    for (auto &[id, callback] : callbacks) {
        callback();
    }
}

bool CancellationTokenSource::isCancellationRequested() const {
    return state_->cancelled;
}

}  // namespace TEB
