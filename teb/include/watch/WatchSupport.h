#pragma once

#include "common/CancellationToken.h"
#include "model/TestTypes.h"
#include "tree/TestTree.h"
#include "watch/IRelatedFilesResolver.h"
#include "watch/WorkspaceChange.h"
#include <cstdint>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace TEB {

/**
 * @brief Interest in re-running tests of one project when related files change
 */
struct Watch {
    uint64_t id = 0;
    TestConfig config;
    std::string projectName;
    std::string testDir;
    // Tree node ids in scope; nullopt watches the whole project
    std::optional<std::vector<std::string>> include;
};

/**
 * @brief A watch fired by a change, narrowed to the tree nodes that should run
 */
struct TriggeredWatch {
    Watch watch;
    std::vector<std::string> include;
};

/**
 * @brief Registry of watches fed by WorkspaceObserver batches
 *
 * A watch whose scope contains another watch of the same project subsumes it:
 * registering a narrower watch under an existing one is a no-op, and
 * registering a wider one drops the narrower ones. A watch goes away when its
 * cancellation token fires.
 *
 * On a change, each distinct config among the watches is asked once for the
 * test files related to the changed and deleted paths. All triggered watches
 * are then reported in a single callback.
 */
class WatchSupport {
public:
    using TriggerCallback = std::function<void(const std::vector<TriggeredWatch> &watches)>;

    WatchSupport(const TestTree &tree, IRelatedFilesResolver &resolver, TriggerCallback onWatchesTriggered);
    ~WatchSupport();

    WatchSupport(const WatchSupport &) = delete;
    WatchSupport &operator=(const WatchSupport &) = delete;

    /**
     * @return false when an existing watch already covers this scope
     */
    bool addToWatch(const TestConfig &config, const std::string &projectName, const std::string &testDir,
                    std::optional<std::vector<std::string>> include, const CancellationToken &token);

    void workspaceChanged(const WorkspaceChange &change);

    std::vector<Watch> watches() const;

    size_t size() const {
        return watches_.size();
    }

private:
    struct WatchRecord {
        Watch watch;
        CancellationRegistration registration;
    };

    bool covers(const Watch &outer, const Watch &inner) const;
    bool nodeCovers(const std::string &outerId, const std::string &innerId) const;
    void removeWatch(uint64_t id);
    std::vector<TriggeredWatch> matchWatches(const std::map<std::string, std::vector<std::string>> &relatedByConfig) const;

    const TestTree &tree_;
    IRelatedFilesResolver &resolver_;
    TriggerCallback onWatchesTriggered_;
    std::list<WatchRecord> watches_;
    uint64_t nextId_ = 1;

    // Guards resolver callbacks against running after destruction
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

}  // namespace TEB
