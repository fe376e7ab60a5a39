#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <unordered_map>
#include <utility>

namespace TEB {

/**
 * @brief Single-threaded poll(2) reactor driving all bridge I/O
 *
 * Every transport, child process and debounce timer in the bridge is driven
 * from one EventLoop on the host's thread. Nothing here is thread-safe; all
 * callbacks run on the thread calling run()/runOnce().
 *
 * Ordering guarantees:
 * - Posted tasks run in FIFO order, before the loop blocks again
 * - Timers fire in deadline order, FIFO for equal deadlines
 * - A callback removed (unwatchFd/cancelTimer) before dispatch is never invoked
 */
class EventLoop {
public:
    using Clock = std::chrono::steady_clock;
    using Task = std::function<void()>;
    using TimerId = uint64_t;

    /**
     * @brief Called with the poll revents mask (POLLIN/POLLOUT/POLLHUP/POLLERR)
     */
    using FdCallback = std::function<void(short revents)>;

    EventLoop();
    ~EventLoop() = default;

    EventLoop(const EventLoop &) = delete;
    EventLoop &operator=(const EventLoop &) = delete;

    void post(Task task);

    /**
     * @brief Run @p task once after @p delay
     * @return Id usable with cancelTimer()
     */
    TimerId addTimer(std::chrono::milliseconds delay, Task task);

    /**
     * @return true if the timer was pending and is now cancelled
     */
    bool cancelTimer(TimerId id);

    /**
     * @brief Watch @p fd for @p events (POLLIN and/or POLLOUT), replacing an existing watch
     */
    void watchFd(int fd, short events, FdCallback callback);

    void unwatchFd(int fd);

    bool isWatching(int fd) const;

    /**
     * @brief Dispatch everything ready, blocking at most @p maxWait for something to become ready
     * @return Number of tasks, timers and fd callbacks dispatched
     */
    size_t runOnce(std::chrono::milliseconds maxWait);

    /**
     * @brief Dispatch until stop() is called or no work remains
     */
    void run();

    void stop();

    /**
     * @brief Dispatch until @p predicate holds or @p timeout elapses
     * @return true if the predicate became true
     */
    bool runUntil(const std::function<bool()> &predicate, std::chrono::milliseconds timeout);

    /**
     * @brief True while tasks, timers or fd watches are registered
     */
    bool hasPendingWork() const;

    size_t pendingTimerCount() const {
        return timerIndex_.size();
    }

private:
    struct FdWatch {
        short events = 0;
        FdCallback callback;
    };

    using TimerKey = std::pair<Clock::time_point, uint64_t>;

    size_t runPostedTasks();
    size_t runExpiredTimers();
    int computePollTimeout(std::chrono::milliseconds maxWait) const;

    std::deque<Task> posted_;
    std::map<TimerKey, Task> timers_;
    std::unordered_map<TimerId, TimerKey> timerIndex_;
    std::unordered_map<int, std::shared_ptr<FdWatch>> watches_;
    uint64_t nextTimerSequence_ = 1;
    bool stopRequested_ = false;
};

}  // namespace TEB
