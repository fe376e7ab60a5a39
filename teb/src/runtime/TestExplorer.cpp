#include "runtime/TestExplorer.h"
#include "bridge/ConfigLocator.h"
#include "common/EnvironmentError.h"
#include "common/Logger.h"

#include <set>
#include <stdexcept>

namespace TEB {

TestExplorer::TestExplorer(EventLoop &loop, BridgeSettings settings, TestRunCoordinator::RunFactory createRun,
                           IDebugLauncher *debugLauncher)
    : loop_(loop), settings_(std::move(settings)), locator_(settings_.interpreter, settings_.minRunnerVersion),
      bridge_(loop, settings_, locator_, debugLauncher), reconciler_(tree_),
      watchSupport_(tree_, bridge_, [this](const std::vector<TriggeredWatch> &watches) { watchesTriggered(watches); }),
      observer_(
          loop, [this](const WorkspaceChange &change) { workspaceChanged(change); }, settings_.debounce,
          settings_.isUnderTest),
      coordinator_(loop, bridge_, *this, std::move(createRun)) {
    const auto errors = settings_.validate();
    if (!errors.empty()) {
        throw std::invalid_argument("Invalid bridge settings: " + errors.front());
    }
}

TestExplorer::~TestExplorer() {
    alive_.reset();
}

std::vector<std::string> TestExplorer::rebuild(const std::vector<std::string> &workspaceFolders,
                                               LoadedCallback onLoaded) {
    std::vector<std::string> warnings;
    const uint64_t epoch = ++epoch_;

    LOG_INFO("TestExplorer: Rebuilding {} workspace folder(s)", workspaceFolders.size());
    tree_.startNewGeneration(workspaceFolders);
    models_.clear();
    sourceMaps_.clear();

    for (const auto &folder : workspaceFolders) {
        for (const auto &configFile : ConfigLocator::findConfigFiles(folder, settings_.isUnderTest)) {
            try {
                TestConfig config = locator_.createConfig(folder, configFile, settings_.runnerCli);
                models_.push_back(std::make_unique<TestModel>(std::move(config), &sourceMaps_));
            } catch (const EnvironmentError &e) {
                LOG_WARN("TestExplorer: Skipping {}: {}", configFile, e.what());
                warnings.push_back(e.what());
            }
        }
    }

    auto pending = std::make_shared<size_t>(models_.size() + 1);
    std::weak_ptr<bool> alive = alive_;
    auto loaded = [this, alive, epoch, pending, onLoaded]() {
        if (alive.expired() || epoch != epoch_ || --*pending != 0) {
            return;
        }
        updateWatchFolders();
        reconcile();
        if (onLoaded) {
            onLoaded();
        }
    };

    std::vector<std::string> configFiles;
    for (const auto &model : models_) {
        configFiles.push_back(model->config().configFile);
    }
    for (const auto &configFile : configFiles) {
        try {
            listFiles(configFile, loaded);
        } catch (const EnvironmentError &e) {
            LOG_WARN("TestExplorer: Unable to list files of {}: {}", configFile, e.what());
            warnings.push_back(e.what());
            loaded();
        }
    }
    // Balances the initial count so an empty workspace still finishes
    loop_.post(loaded);
    return warnings;
}

void TestExplorer::listFiles(const std::string &configFile, std::function<void()> done) {
    TestModel *model = modelForConfig(configFile);
    if (!model) {
        return;
    }
    const uint64_t epoch = epoch_;
    std::weak_ptr<bool> alive = alive_;
    bridge_.listFiles(model->config(), [this, alive, epoch, configFile, done](const ListFilesReport &report) {
        if (alive.expired() || epoch != epoch_) {
            return;
        }
        if (!report.isSuccess) {
            LOG_WARN("TestExplorer: {}: {}", configFile, report.errorMessage);
        } else if (TestModel *current = modelForConfig(configFile)) {
            current->applyListFiles(report);
        }
        if (done) {
            done();
        }
    });
}

bool TestExplorer::resolveChildren(const std::string &nodeId) {
    const TreeNode *node = tree_.findById(nodeId);
    if (!node || node->kind() != TreeNodeKind::File) {
        return false;
    }
    listTests({node->path()});
    return true;
}

void TestExplorer::listTests(const std::vector<std::string> &files) {
    for (const auto &model : models_) {
        const auto narrowed = model->narrowDownFilesToEnabledProjects(std::set<std::string>(files.begin(), files.end()));
        if (narrowed.empty()) {
            continue;
        }
        listTestsForModel(*model, std::vector<std::string>(narrowed.begin(), narrowed.end()));
    }
}

void TestExplorer::listTestsForModel(TestModel &model, const std::vector<std::string> &files) {
    const std::string configFile = model.config().configFile;
    const uint64_t epoch = epoch_;
    std::weak_ptr<bool> alive = alive_;
    try {
        bridge_.listTests(model.config(), files, [this, alive, epoch, configFile, files](const ListTestsResult &result) {
            if (alive.expired() || epoch != epoch_) {
                return;
            }
            for (const auto &error : result.errors) {
                LOG_WARN("TestExplorer: {}", error.message);
            }
            TestModel *current = modelForConfig(configFile);
            if (!current) {
                return;
            }
            current->applyListTests(result.projects, files);
            reconcile();
        });
    } catch (const EnvironmentError &e) {
        LOG_WARN("TestExplorer: Unable to list tests of {}: {}", configFile, e.what());
    }
}

bool TestExplorer::setProjectEnabled(const std::string &configFile, const std::string &projectName, bool enabled) {
    TestModel *model = modelForConfig(configFile);
    if (!model || !model->setProjectEnabled(projectName, enabled)) {
        return false;
    }
    updateWatchFolders();
    reconcile();
    return true;
}

bool TestExplorer::watch(const std::string &configFile, const std::string &projectName,
                         std::optional<std::vector<std::string>> include, const CancellationToken &token) {
    TestModel *model = modelForConfig(configFile);
    if (!model) {
        return false;
    }
    const TestProject *project = model->project(projectName);
    if (!project) {
        return false;
    }
    return watchSupport_.addToWatch(model->config(), projectName, project->testDir, std::move(include), token);
}

std::vector<const TestModel *> TestExplorer::models() const {
    std::vector<const TestModel *> result;
    for (const auto &model : models_) {
        result.push_back(model.get());
    }
    return result;
}

TestModel *TestExplorer::modelForConfig(const std::string &configFile) {
    for (const auto &model : models_) {
        if (model->config().configFile == configFile) {
            return model.get();
        }
    }
    return nullptr;
}

void TestExplorer::workspaceChanged(const WorkspaceChange &change) {
    for (const auto &model : models_) {
        const ModelRefresh refresh = model->workspaceChanged(change);
        if (refresh.relistFiles) {
            try {
                listFiles(model->config().configFile, [this]() {
                    updateWatchFolders();
                    reconcile();
                });
            } catch (const EnvironmentError &e) {
                LOG_WARN("TestExplorer: Unable to list files of {}: {}", model->config().configFile, e.what());
            }
        }
        if (!refresh.testsToList.empty()) {
            listTestsForModel(*model, refresh.testsToList);
        }
    }

    // Mapped through the old source maps above; drop them for the next pass
    for (const auto &path : change.changed) {
        sourceMaps_.invalidate(path);
    }
    for (const auto &path : change.deleted) {
        sourceMaps_.invalidate(path);
    }

    watchSupport_.workspaceChanged(change);
}

void TestExplorer::watchesTriggered(const std::vector<TriggeredWatch> &watches) {
    for (const auto &triggered : watches) {
        RunRequest request;
        request.configFile = triggered.watch.config.configFile;
        request.projectName = triggered.watch.projectName;
        request.include = triggered.include;
        if (!coordinator_.scheduleRun(request)) {
            LOG_DEBUG("TestExplorer: Watch {} not re-run", triggered.watch.id);
        }
    }
}

void TestExplorer::updateWatchFolders() {
    std::set<std::string> folders;
    for (const auto &model : models_) {
        for (const auto &dir : model->testDirs()) {
            folders.insert(dir);
        }
    }
    observer_.setWatchFolders(std::move(folders));
}

void TestExplorer::reconcile() {
    const ReconcileResult result = reconciler_.reconcile(models());
    if (result.deltas.empty()) {
        return;
    }
    LOG_DEBUG("TestExplorer: Tree updated ({} added, {} removed, {} updated)", result.added, result.removed,
              result.updated);
    if (onTreeChanged_) {
        onTreeChanged_(result);
    }
}

}  // namespace TEB
