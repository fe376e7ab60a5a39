#include "watch/WatchSupport.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace TEB {

WatchSupport::WatchSupport(const TestTree &tree, IRelatedFilesResolver &resolver, TriggerCallback onWatchesTriggered)
    : tree_(tree), resolver_(resolver), onWatchesTriggered_(std::move(onWatchesTriggered)) {
    if (!onWatchesTriggered_) {
        throw std::invalid_argument("WatchSupport requires a trigger callback");
    }
}

WatchSupport::~WatchSupport() {
    *alive_ = false;
}

bool WatchSupport::addToWatch(const TestConfig &config, const std::string &projectName, const std::string &testDir,
                              std::optional<std::vector<std::string>> include, const CancellationToken &token) {
    if (token.isCancellationRequested()) {
        return false;
    }

    Watch watch;
    watch.id = nextId_++;
    watch.config = config;
    watch.projectName = projectName;
    watch.testDir = PathUtils::normalizeFsPath(testDir);
    watch.include = std::move(include);

    for (const auto &record : watches_) {
        if (covers(record.watch, watch) && !covers(watch, record.watch)) {
            LOG_DEBUG("WatchSupport: Watch on '{}' already covered by watch {}", projectName, record.watch.id);
            return false;
        }
    }

    for (auto it = watches_.begin(); it != watches_.end();) {
        if (covers(watch, it->watch)) {
            LOG_DEBUG("WatchSupport: Watch {} subsumed by new watch {}", it->watch.id, watch.id);
            it = watches_.erase(it);
        } else {
            ++it;
        }
    }

    const uint64_t id = watch.id;
    watches_.push_back(WatchRecord{std::move(watch), CancellationRegistration()});
    watches_.back().registration = token.onCancellationRequested([this, id]() { removeWatch(id); });
    return true;
}

void WatchSupport::removeWatch(uint64_t id) {
    watches_.remove_if([id](const WatchRecord &record) { return record.watch.id == id; });
}

std::vector<Watch> WatchSupport::watches() const {
    std::vector<Watch> result;
    for (const auto &record : watches_) {
        result.push_back(record.watch);
    }
    return result;
}

bool WatchSupport::covers(const Watch &outer, const Watch &inner) const {
    if (outer.config.configFile != inner.config.configFile || outer.projectName != inner.projectName) {
        return false;
    }
    if (!outer.include) {
        return true;
    }
    if (!inner.include) {
        return false;
    }
    return std::all_of(inner.include->begin(), inner.include->end(), [&](const std::string &innerId) {
        return std::any_of(outer.include->begin(), outer.include->end(),
                           [&](const std::string &outerId) { return nodeCovers(outerId, innerId); });
    });
}

bool WatchSupport::nodeCovers(const std::string &outerId, const std::string &innerId) const {
    if (outerId == innerId) {
        return true;
    }
    const TreeNode *outer = tree_.findById(outerId);
    const TreeNode *inner = tree_.findById(innerId);
    return outer && inner && TestTree::isAncestorOf(*outer, *inner);
}

void WatchSupport::workspaceChanged(const WorkspaceChange &change) {
    if (watches_.empty()) {
        return;
    }

    std::vector<std::string> files(change.changed.begin(), change.changed.end());
    files.insert(files.end(), change.deleted.begin(), change.deleted.end());
    if (files.empty()) {
        return;
    }

    std::map<std::string, TestConfig> configs;
    for (const auto &record : watches_) {
        configs.emplace(record.watch.config.configFile, record.watch.config);
    }

    struct PendingQuery {
        size_t remaining = 0;
        std::map<std::string, std::vector<std::string>> relatedByConfig;
    };
    auto pending = std::make_shared<PendingQuery>();
    pending->remaining = configs.size();

    std::weak_ptr<bool> alive = alive_;
    for (const auto &[configFile, config] : configs) {
        const std::string key = configFile;
        resolver_.findRelatedTestFiles(config, files, [this, alive, pending, key](const RelatedFilesReport &report) {
            if (alive.expired()) {
                return;
            }
            if (!report.isSuccess) {
                LOG_WARN("WatchSupport: Related files query failed for {}: {}", key, report.errorMessage);
            }
            auto &related = pending->relatedByConfig[key];
            for (const auto &file : report.testFiles) {
                related.push_back(PathUtils::normalizeFsPath(file));
            }
            if (--pending->remaining > 0) {
                return;
            }
            auto triggered = matchWatches(pending->relatedByConfig);
            if (!triggered.empty()) {
                onWatchesTriggered_(triggered);
            }
        });
    }
}

std::vector<TriggeredWatch> WatchSupport::matchWatches(
    const std::map<std::string, std::vector<std::string>> &relatedByConfig) const {
    std::vector<TriggeredWatch> triggered;
    for (const auto &record : watches_) {
        const Watch &watch = record.watch;
        auto related = relatedByConfig.find(watch.config.configFile);
        if (related == relatedByConfig.end() || related->second.empty()) {
            continue;
        }

        std::vector<std::string> include;
        std::set<std::string> seen;
        auto addNode = [&include, &seen](const std::string &id) {
            if (seen.insert(id).second) {
                include.push_back(id);
            }
        };
        auto addFile = [this, &addNode](const std::string &file) {
            if (const TreeNode *node = tree_.getForLocation(file)) {
                addNode(node->id());
            } else {
                LOG_DEBUG("WatchSupport: {} has no tree node", file);
            }
        };

        for (const auto &testFile : related->second) {
            if (!watch.include) {
                if (watch.testDir.empty() || PathUtils::isSameOrDescendant(watch.testDir, testFile)) {
                    addFile(testFile);
                }
                continue;
            }
            for (const auto &includeId : *watch.include) {
                const TreeNode *node = tree_.findById(includeId);
                if (!node) {
                    continue;
                }
                const bool isFolder = node->kind() == TreeNodeKind::Folder || node->kind() == TreeNodeKind::Workspace;
                if (isFolder && PathUtils::isDescendant(node->path(), testFile)) {
                    addFile(testFile);
                    continue;
                }
                // A watched file or test is more specific than its file
                if (!isFolder && testFile == node->path()) {
                    addNode(includeId);
                }
            }
        }

        if (!include.empty()) {
            triggered.push_back(TriggeredWatch{watch, std::move(include)});
        }
    }
    return triggered;
}

}  // namespace TEB
