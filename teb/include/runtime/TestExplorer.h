#pragma once

#include "bridge/IDebugLauncher.h"
#include "bridge/ProcessBridge.h"
#include "bridge/RunnerLocator.h"
#include "common/BridgeSettings.h"
#include "common/CancellationToken.h"
#include "common/EventLoop.h"
#include "model/SourceMapCache.h"
#include "model/TestModel.h"
#include "runtime/TestRunCoordinator.h"
#include "tree/TestTree.h"
#include "tree/TreeReconciler.h"
#include "watch/WatchSupport.h"
#include "watch/WorkspaceObserver.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace TEB {

/**
 * @brief Host-facing entry point wiring discovery, listing, runs and watches together
 *
 * Owns one TestModel per discovered config and the single TestTree projected
 * from them. Every runner answer is applied to its model and followed by a
 * reconciliation pass; the resulting deltas are reported through
 * onTreeChanged(). The host feeds file system events into observer().
 */
class TestExplorer : private ITestRunContext {
public:
    using TreeChangedCallback = std::function<void(const ReconcileResult &result)>;
    using LoadedCallback = std::function<void()>;

    TestExplorer(EventLoop &loop, BridgeSettings settings, TestRunCoordinator::RunFactory createRun,
                 IDebugLauncher *debugLauncher = nullptr);
    ~TestExplorer() override;

    TestExplorer(const TestExplorer &) = delete;
    TestExplorer &operator=(const TestExplorer &) = delete;

    /**
     * @brief Rediscover configs under @p workspaceFolders and list their files
     *
     * Starts a new tree generation. @p onLoaded runs once every config has
     * answered (or failed).
     *
     * @return One-line warnings for configs that could not be used
     */
    std::vector<std::string> rebuild(const std::vector<std::string> &workspaceFolders, LoadedCallback onLoaded = nullptr);

    /**
     * @brief List the tests of the file node @p nodeId
     * @return false when the node is unknown or not a file
     */
    bool resolveChildren(const std::string &nodeId);

    /**
     * @brief List the tests of @p files in every model whose enabled projects contain them
     */
    void listTests(const std::vector<std::string> &files);

    /**
     * @return false when the config or project is unknown
     */
    bool setProjectEnabled(const std::string &configFile, const std::string &projectName, bool enabled);

    bool scheduleRun(const RunRequest &request) {
        return coordinator_.scheduleRun(request);
    }

    /**
     * @brief Re-run @p include (or the whole project) whenever related files change, until @p token fires
     */
    bool watch(const std::string &configFile, const std::string &projectName,
               std::optional<std::vector<std::string>> include, const CancellationToken &token);

    void onTreeChanged(TreeChangedCallback callback) {
        onTreeChanged_ = std::move(callback);
    }

    WorkspaceObserver &observer() {
        return observer_;
    }

    const TestTree &tree() const {
        return tree_;
    }

    std::vector<const TestModel *> models() const;

    ProcessBridge &bridge() {
        return bridge_;
    }

    TestRunCoordinator &coordinator() {
        return coordinator_;
    }

    const WatchSupport &watchSupport() const {
        return watchSupport_;
    }

private:
    TestModel *modelForConfig(const std::string &configFile) override;

    const TestTree &testTree() const override {
        return tree_;
    }

    void modelUpdated() override {
        reconcile();
    }

    void workspaceChanged(const WorkspaceChange &change);
    void listFiles(const std::string &configFile, std::function<void()> done);
    void listTestsForModel(TestModel &model, const std::vector<std::string> &files);
    void watchesTriggered(const std::vector<TriggeredWatch> &watches);
    void updateWatchFolders();
    void reconcile();

    EventLoop &loop_;
    BridgeSettings settings_;
    RunnerLocator locator_;
    ProcessBridge bridge_;
    SourceMapCache sourceMaps_;
    std::vector<std::unique_ptr<TestModel>> models_;
    TestTree tree_;
    TreeReconciler reconciler_;
    WatchSupport watchSupport_;
    WorkspaceObserver observer_;
    TestRunCoordinator coordinator_;
    TreeChangedCallback onTreeChanged_;
    uint64_t epoch_ = 0;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

}  // namespace TEB
