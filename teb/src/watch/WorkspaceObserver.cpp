#include "watch/WorkspaceObserver.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <stdexcept>

namespace TEB {

WorkspaceObserver::WorkspaceObserver(EventLoop &loop, ChangeHandler handler, std::chrono::milliseconds debounce,
                                     bool isUnderTest)
    : loop_(loop), handler_(std::move(handler)), debounce_(debounce), isUnderTest_(isUnderTest) {
    if (!handler_) {
        throw std::invalid_argument("WorkspaceObserver requires a change handler");
    }
    if (debounce_.count() < 0) {
        throw std::invalid_argument("WorkspaceObserver debounce must not be negative");
    }
}

WorkspaceObserver::~WorkspaceObserver() {
    reset();
}

void WorkspaceObserver::setWatchFolders(std::set<std::string> folders) {
    watchFolders_.clear();
    for (const auto &folder : folders) {
        watchFolders_.insert(PathUtils::normalizeFsPath(folder));
    }
}

void WorkspaceObserver::fileCreated(const std::string &path) {
    if (auto *change = isRelevant(path) ? pendingChange() : nullptr) {
        change->created.insert(PathUtils::normalizeFsPath(path));
    }
}

void WorkspaceObserver::fileChanged(const std::string &path) {
    if (auto *change = isRelevant(path) ? pendingChange() : nullptr) {
        change->changed.insert(PathUtils::normalizeFsPath(path));
    }
}

void WorkspaceObserver::fileDeleted(const std::string &path) {
    if (auto *change = isRelevant(path) ? pendingChange() : nullptr) {
        change->deleted.insert(PathUtils::normalizeFsPath(path));
    }
}

void WorkspaceObserver::reset() {
    if (timer_) {
        loop_.cancelTimer(*timer_);
        timer_.reset();
    }
    pending_.reset();
}

bool WorkspaceObserver::isRelevant(const std::string &path) const {
    if (path.find("node_modules") != std::string::npos) {
        return false;
    }
    if (!isUnderTest_ && path.find("test-results") != std::string::npos) {
        return false;
    }
    if (watchFolders_.empty()) {
        return true;
    }
    const std::string normalized = PathUtils::normalizeFsPath(path);
    return std::any_of(watchFolders_.begin(), watchFolders_.end(),
                       [&normalized](const std::string &folder) { return PathUtils::isSameOrDescendant(folder, normalized); });
}

WorkspaceChange *WorkspaceObserver::pendingChange() {
    if (!pending_) {
        pending_.emplace();
    }
    if (timer_) {
        loop_.cancelTimer(*timer_);
    }
    timer_ = loop_.addTimer(debounce_, [this]() { reportChange(); });
    return &*pending_;
}

void WorkspaceObserver::reportChange() {
    timer_.reset();
    if (!pending_) {
        return;
    }
    WorkspaceChange change = std::move(*pending_);
    pending_.reset();
    LOG_DEBUG("WorkspaceObserver: Delivering {} created, {} changed, {} deleted", change.created.size(),
              change.changed.size(), change.deleted.size());
    handler_(change);
}

}  // namespace TEB
