#pragma once

#include "common/EventLoop.h"
#include "watch/WorkspaceChange.h"
#include <chrono>
#include <functional>
#include <optional>
#include <set>
#include <string>

namespace TEB {

/**
 * @brief Debounces host file system notifications into WorkspaceChange batches
 *
 * Every relevant event restarts the debounce timer; when it fires, the
 * accumulated change is delivered once and cleared. Paths under node_modules
 * are ignored, and so are paths under test-results unless running under test.
 * When watch folders are set, events outside all of them are ignored.
 */
class WorkspaceObserver {
public:
    using ChangeHandler = std::function<void(const WorkspaceChange &change)>;

    WorkspaceObserver(EventLoop &loop, ChangeHandler handler, std::chrono::milliseconds debounce,
                      bool isUnderTest = false);
    ~WorkspaceObserver();

    WorkspaceObserver(const WorkspaceObserver &) = delete;
    WorkspaceObserver &operator=(const WorkspaceObserver &) = delete;

    void setWatchFolders(std::set<std::string> folders);

    const std::set<std::string> &watchFolders() const {
        return watchFolders_;
    }

    void fileCreated(const std::string &path);
    void fileChanged(const std::string &path);
    void fileDeleted(const std::string &path);

    /**
     * @brief Drop the pending batch without delivering it
     */
    void reset();

    bool hasPendingChange() const {
        return pending_.has_value();
    }

    bool isRelevant(const std::string &path) const;

private:
    WorkspaceChange *pendingChange();
    void reportChange();

    EventLoop &loop_;
    ChangeHandler handler_;
    std::chrono::milliseconds debounce_;
    bool isUnderTest_;
    std::set<std::string> watchFolders_;
    std::optional<WorkspaceChange> pending_;
    std::optional<EventLoop::TimerId> timer_;
};

}  // namespace TEB
