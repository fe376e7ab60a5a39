#include "common/EventLoop.h"
#include "common/Logger.h"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <poll.h>
#include <vector>

namespace TEB {

EventLoop::EventLoop() {
    // Writes to a peer that went away must surface as EPIPE, not kill the host
    std::signal(SIGPIPE, SIG_IGN);
}

void EventLoop::post(Task task) {
    if (task) {
        posted_.push_back(std::move(task));
    }
}

EventLoop::TimerId EventLoop::addTimer(std::chrono::milliseconds delay, Task task) {
    TimerId id = nextTimerSequence_++;
    TimerKey key{Clock::now() + delay, id};
    timers_.emplace(key, std::move(task));
    timerIndex_.emplace(id, key);
    return id;
}

bool EventLoop::cancelTimer(TimerId id) {
    auto it = timerIndex_.find(id);
    if (it == timerIndex_.end()) {
        return false;
    }
    timers_.erase(it->second);
    timerIndex_.erase(it);
    return true;
}

void EventLoop::watchFd(int fd, short events, FdCallback callback) {
    auto watch = std::make_shared<FdWatch>();
    watch->events = events;
    watch->callback = std::move(callback);
    watches_[fd] = std::move(watch);
}

void EventLoop::unwatchFd(int fd) {
    watches_.erase(fd);
}

bool EventLoop::isWatching(int fd) const {
    return watches_.count(fd) > 0;
}

size_t EventLoop::runOnce(std::chrono::milliseconds maxWait) {
    size_t dispatched = runPostedTasks();

    std::vector<pollfd> pollFds;
    std::vector<std::shared_ptr<FdWatch>> snapshot;
    pollFds.reserve(watches_.size());
    snapshot.reserve(watches_.size());
    for (const auto &[fd, watch] : watches_) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = watch->events;
        pollFds.push_back(pfd);
        snapshot.push_back(watch);
    }

    int timeoutMs = dispatched > 0 ? 0 : computePollTimeout(maxWait);
    int ready = ::poll(pollFds.empty() ? nullptr : pollFds.data(), pollFds.size(), timeoutMs);
    if (ready < 0) {
        if (errno != EINTR) {
            LOG_ERROR("EventLoop: poll failed: {}", std::strerror(errno));
        }
        ready = 0;
    }

    for (size_t i = 0; i < pollFds.size() && ready > 0; ++i) {
        if (pollFds[i].revents == 0) {
            continue;
        }
        --ready;
        // Skip watches removed or replaced by an earlier callback in this round
        auto it = watches_.find(pollFds[i].fd);
        if (it == watches_.end() || it->second != snapshot[i]) {
            continue;
        }
        auto watch = it->second;
        watch->callback(pollFds[i].revents);
        ++dispatched;
    }

    dispatched += runExpiredTimers();
    return dispatched;
}

void EventLoop::run() {
    stopRequested_ = false;
    while (!stopRequested_ && hasPendingWork()) {
        runOnce(std::chrono::milliseconds(1000));
    }
}

void EventLoop::stop() {
    stopRequested_ = true;
}

bool EventLoop::runUntil(const std::function<bool()> &predicate, std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    while (!predicate()) {
        const auto now = Clock::now();
        if (now >= deadline) {
            return false;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        runOnce(std::min(remaining, std::chrono::milliseconds(50)));
    }
    return true;
}

bool EventLoop::hasPendingWork() const {
    return !posted_.empty() || !timers_.empty() || !watches_.empty();
}

size_t EventLoop::runPostedTasks() {
    // Tasks posted while draining run on the next turn
    std::deque<Task> tasks;
    tasks.swap(posted_);
    for (auto &task : tasks) {
        task();
    }
    return tasks.size();
}

size_t EventLoop::runExpiredTimers() {
    size_t fired = 0;
    const auto now = Clock::now();
    while (!timers_.empty()) {
        auto it = timers_.begin();
        if (it->first.first > now) {
            break;
        }
        Task task = std::move(it->second);
        timerIndex_.erase(it->first.second);
        timers_.erase(it);
        task();
        ++fired;
    }
    return fired;
}

int EventLoop::computePollTimeout(std::chrono::milliseconds maxWait) const {
    auto wait = maxWait;
    if (!timers_.empty()) {
        auto untilNext =
            std::chrono::duration_cast<std::chrono::milliseconds>(timers_.begin()->first.first - Clock::now());
        // Round up so the timer has expired when poll returns
        untilNext += std::chrono::milliseconds(1);
        if (untilNext < wait) {
            wait = untilNext;
        }
    }
    if (wait.count() < 0) {
        return 0;
    }
    return static_cast<int>(wait.count());
}

}  // namespace TEB
