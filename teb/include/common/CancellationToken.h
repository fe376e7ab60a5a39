#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>

namespace TEB {

namespace detail {
struct CancellationState {
    bool cancelled = false;
    uint64_t nextId = 0;
    std::map<uint64_t, std::function<void()>> callbacks;
};
}  // namespace detail

/**
 * @brief Scoped subscription to a cancellation token
 *
 * Unregisters the callback when destroyed. Movable, not copyable.
 */
class CancellationRegistration {
public:
    CancellationRegistration() = default;
    CancellationRegistration(std::weak_ptr<detail::CancellationState> state, uint64_t id);
    ~CancellationRegistration();

    CancellationRegistration(CancellationRegistration &&other) noexcept;
    CancellationRegistration &operator=(CancellationRegistration &&other) noexcept;
    CancellationRegistration(const CancellationRegistration &) = delete;
    CancellationRegistration &operator=(const CancellationRegistration &) = delete;

    void reset();

private:
    std::weak_ptr<detail::CancellationState> state_;
    uint64_t id_ = 0;
};

/**
 * @brief Read side of a cooperative cancellation signal
 *
 * A default-constructed token is never cancelled. Tokens are cheap to copy and
 * all copies observe the same source.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    bool isCancellationRequested() const;

    /**
     * @brief Invoke @p callback once when cancellation is requested
     *
     * Runs the callback immediately when the token is already cancelled.
     */
    CancellationRegistration onCancellationRequested(std::function<void()> callback) const;

private:
    friend class CancellationTokenSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state) : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

class CancellationTokenSource {
public:
    CancellationTokenSource();

    CancellationToken token() const;

    /**
     * @brief Request cancellation; callbacks run synchronously, in registration order, once
     */
    void cancel();

    bool isCancellationRequested() const;

private:
    std::shared_ptr<detail::CancellationState> state_;
};

}  // namespace TEB
