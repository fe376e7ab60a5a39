#pragma once

#include "bridge/ProcessBridge.h"
#include "common/CancellationToken.h"
#include "common/EventLoop.h"
#include "model/TestModel.h"
#include "runtime/ITestRunSink.h"
#include "runtime/TestRunSession.h"
#include "tree/TestTree.h"
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace TEB {

/**
 * @brief Run or debug request issued through one project's run profile
 */
struct RunRequest {
    std::string configFile;
    std::string projectName;
    bool isDebug = false;
    // Selected tree node ids; nullopt runs everything
    std::optional<std::vector<std::string>> include;
};

/**
 * @brief What the coordinator needs from the owner of the models and the tree
 */
class ITestRunContext {
public:
    virtual ~ITestRunContext() = default;

    virtual TestModel *modelForConfig(const std::string &configFile) = 0;

    virtual const TestTree &testTree() const = 0;

    /**
     * @brief A run merged new entries into a model; the tree must catch up
     */
    virtual void modelUpdated() = 0;
};

/**
 * @brief Projects and locations one runner invocation is narrowed down to
 */
struct NarrowedRun {
    std::vector<const TestProject *> projects;
    // "file" or "file:line"; nullopt runs everything, empty runs nothing
    std::optional<std::vector<std::string>> locations;
    std::string grepTitle;
};

/**
 * @brief Serializes UI test runs
 *
 * Only one run is in flight at a time; requests arriving meanwhile are
 * rejected. Requests made in the same event loop turn (one per selected run
 * profile, or one per triggered watch) are merged into one run. Requests of
 * one config with the same selection share a runner invocation; each
 * invocation is narrowed by its own selection.
 */
class TestRunCoordinator {
public:
    using RunFactory = std::function<std::unique_ptr<ITestRunSink>(const RunRequest &request)>;

    TestRunCoordinator(EventLoop &loop, ProcessBridge &bridge, ITestRunContext &context, RunFactory createRun);
    ~TestRunCoordinator();

    TestRunCoordinator(const TestRunCoordinator &) = delete;
    TestRunCoordinator &operator=(const TestRunCoordinator &) = delete;

    /**
     * @return false when a run is in flight or the request names an unknown config or project
     */
    bool scheduleRun(const RunRequest &request);

    /**
     * @brief Cancel the run in flight, if any
     */
    void cancel();

    bool isRunning() const {
        return running_;
    }

    /**
     * @brief Keep only projects with files under the selected nodes and turn the nodes into locations
     *
     * A single selected test that shares its line with siblings (a parametrized
     * test) is additionally filtered by its title.
     */
    static NarrowedRun narrowDownProjectsAndLocations(const TestTree &tree,
                                                      const std::vector<const TestProject *> &projects,
                                                      const std::optional<std::vector<std::string>> &include);

private:
    // Projects of one config that share a selection
    struct SelectionGroup {
        std::string configFile;
        std::optional<std::vector<std::string>> include;
        std::vector<std::string> projectNames;
    };

    struct ScheduledRun {
        RunRequest request;
        // In request order
        std::vector<SelectionGroup> groups;
    };

    struct PendingInvocation {
        std::string configFile;
        std::vector<std::string> projectNames;
        std::optional<std::vector<std::string>> locations;
        std::string grepTitle;
    };

    static void addToGroups(std::vector<SelectionGroup> &groups, const RunRequest &request);
    void startScheduledRun();
    void runNext();
    void finishRun();

    EventLoop &loop_;
    ProcessBridge &bridge_;
    ITestRunContext &context_;
    RunFactory createRun_;

    std::optional<ScheduledRun> scheduled_;
    bool running_ = false;
    bool isDebug_ = false;
    std::unique_ptr<ITestRunSink> sink_;
    std::unique_ptr<CancellationTokenSource> tokenSource_;
    std::deque<PendingInvocation> queue_;
    std::unique_ptr<TestRunSession> session_;
    std::set<std::string> failures_;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

}  // namespace TEB
