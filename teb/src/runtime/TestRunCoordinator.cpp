#include "runtime/TestRunCoordinator.h"
#include "common/EnvironmentError.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace TEB {

TestRunCoordinator::TestRunCoordinator(EventLoop &loop, ProcessBridge &bridge, ITestRunContext &context,
                                       RunFactory createRun)
    : loop_(loop), bridge_(bridge), context_(context), createRun_(std::move(createRun)) {
    if (!createRun_) {
        throw std::invalid_argument("TestRunCoordinator requires a run factory");
    }
}

TestRunCoordinator::~TestRunCoordinator() {
    alive_.reset();
}

bool TestRunCoordinator::scheduleRun(const RunRequest &request) {
    if (running_) {
        LOG_INFO("TestRunCoordinator: Rejecting run request for {}, a run is in flight", request.configFile);
        return false;
    }

    TestModel *model = context_.modelForConfig(request.configFile);
    if (!model || !model->project(request.projectName)) {
        LOG_WARN("TestRunCoordinator: Unknown project '{}' of {}", request.projectName, request.configFile);
        return false;
    }

    if (scheduled_) {
        // Same loop turn: another profile or another triggered watch
        addToGroups(scheduled_->groups, request);
        return true;
    }

    scheduled_ = ScheduledRun{request, {}};
    addToGroups(scheduled_->groups, request);
    std::weak_ptr<bool> alive = alive_;
    loop_.post([this, alive]() {
        if (!alive.expired()) {
            startScheduledRun();
        }
    });
    return true;
}

void TestRunCoordinator::addToGroups(std::vector<SelectionGroup> &groups, const RunRequest &request) {
    auto group = std::find_if(groups.begin(), groups.end(), [&request](const SelectionGroup &candidate) {
        return candidate.configFile == request.configFile && candidate.include == request.include;
    });
    if (group == groups.end()) {
        groups.push_back(SelectionGroup{request.configFile, request.include, {}});
        group = std::prev(groups.end());
    }
    if (std::find(group->projectNames.begin(), group->projectNames.end(), request.projectName) ==
        group->projectNames.end()) {
        group->projectNames.push_back(request.projectName);
    }
}

void TestRunCoordinator::cancel() {
    if (tokenSource_) {
        LOG_DEBUG("TestRunCoordinator: Cancelling run");
        tokenSource_->cancel();
    }
}

NarrowedRun TestRunCoordinator::narrowDownProjectsAndLocations(const TestTree &tree,
                                                               const std::vector<const TestProject *> &projects,
                                                               const std::optional<std::vector<std::string>> &include) {
    NarrowedRun result;
    if (!include) {
        result.projects = projects;
        return result;
    }

    if (include->size() == 1) {
        const TreeNode *test = tree.findById(include->front());
        if (test && test->range() && test->parent()) {
            int testsAtLocation = 0;
            for (const auto &sibling : test->parent()->children()) {
                if (sibling->path() == test->path() && sibling->range() &&
                    sibling->range()->startLine == test->range()->startLine) {
                    ++testsAtLocation;
                }
            }
            if (testsAtLocation > 1) {
                result.grepTitle = test->label();
            }
        }
    }

    std::vector<std::string> locations;
    for (const auto &id : *include) {
        const TreeNode *item = tree.findById(id);
        if (!item || item->path().empty()) {
            continue;
        }

        bool matched = false;
        for (const TestProject *project : projects) {
            const bool hasFile = std::any_of(project->files.begin(), project->files.end(), [&](const auto &file) {
                return PathUtils::isSameOrDescendant(item->path(), file.first);
            });
            if (!hasFile) {
                continue;
            }
            matched = true;
            if (std::find(result.projects.begin(), result.projects.end(), project) == result.projects.end()) {
                result.projects.push_back(project);
            }
        }
        if (!matched) {
            continue;
        }

        std::string location = item->path();
        if (item->range()) {
            location += ":" + std::to_string(item->range()->startLine + 1);
        }
        if (std::find(locations.begin(), locations.end(), location) == locations.end()) {
            locations.push_back(location);
        }
    }
    result.locations = std::move(locations);
    return result;
}

void TestRunCoordinator::startScheduledRun() {
    if (!scheduled_) {
        return;
    }
    ScheduledRun scheduled = std::move(*scheduled_);
    scheduled_.reset();

    sink_ = createRun_(scheduled.request);
    if (!sink_) {
        LOG_WARN("TestRunCoordinator: Host declined to create a test run");
        return;
    }
    running_ = true;
    isDebug_ = scheduled.request.isDebug;
    failures_.clear();
    tokenSource_ = std::make_unique<CancellationTokenSource>();

    const TestTree &tree = context_.testTree();

    // Provisional feedback until the runner reports what it actually runs
    std::set<std::string> enqueued;
    for (const auto &group : scheduled.groups) {
        if (!group.include) {
            continue;
        }
        for (const auto &id : *group.include) {
            if (const TreeNode *item = tree.findById(id)) {
                for (const TreeNode *test : tree.collectTestsInside(*item)) {
                    if (enqueued.insert(test->id()).second) {
                        sink_->enqueued(*test);
                    }
                }
            }
        }
    }

    queue_.clear();
    for (const auto &group : scheduled.groups) {
        TestModel *model = context_.modelForConfig(group.configFile);
        if (!model) {
            continue;
        }
        std::vector<const TestProject *> projects;
        for (const auto &name : group.projectNames) {
            if (const TestProject *project = model->project(name)) {
                projects.push_back(project);
            }
        }

        NarrowedRun narrowed = narrowDownProjectsAndLocations(tree, projects, group.include);
        if (narrowed.locations && narrowed.locations->empty()) {
            continue;
        }

        PendingInvocation invocation;
        invocation.configFile = group.configFile;
        for (const TestProject *project : narrowed.projects) {
            invocation.projectNames.push_back(project->name);
        }
        invocation.locations = std::move(narrowed.locations);
        invocation.grepTitle = std::move(narrowed.grepTitle);
        queue_.push_back(std::move(invocation));
    }

    if (queue_.empty()) {
        LOG_WARN("TestRunCoordinator: Selected tests are outside of the selected projects; nothing to run");
    }
    runNext();
}

void TestRunCoordinator::runNext() {
    if (session_) {
        session_->clearActiveSteps();
        session_.reset();
    }
    if (queue_.empty() || !tokenSource_ || tokenSource_->isCancellationRequested()) {
        finishRun();
        return;
    }

    PendingInvocation next = std::move(queue_.front());
    queue_.pop_front();

    TestModel *model = context_.modelForConfig(next.configFile);
    if (!model) {
        LOG_DEBUG("TestRunCoordinator: Config {} went away before its turn", next.configFile);
        runNext();
        return;
    }

    session_ = std::make_unique<TestRunSession>(context_.testTree(), *model, *sink_, failures_,
                                                [this]() { context_.modelUpdated(); });

    std::weak_ptr<bool> alive = alive_;
    auto done = [this, alive](const RunOutcome &outcome) {
        if (alive.expired()) {
            return;
        }
        if (!outcome.completed && !outcome.cancelled) {
            LOG_WARN("TestRunCoordinator: Runner exited without finishing the run (exit code {})",
                     outcome.exitCode ? std::to_string(*outcome.exitCode) : std::string("unknown"));
        }
        runNext();
    };

    try {
        if (isDebug_) {
            bridge_.debugTests(model->config(), next.projectNames, next.locations, *session_, next.grepTitle,
                               tokenSource_->token(), done);
        } else {
            bridge_.runTests(model->config(), next.projectNames, next.locations, *session_, next.grepTitle,
                             tokenSource_->token(), done);
        }
    } catch (const EnvironmentError &e) {
        LOG_WARN("TestRunCoordinator: {}", e.what());
        sink_->appendOutput(TestRunSession::toTerminalOutput(std::string(e.what()) + "\n"));
        loop_.post([this, alive]() {
            if (!alive.expired()) {
                runNext();
            }
        });
    }
}

void TestRunCoordinator::finishRun() {
    queue_.clear();
    session_.reset();
    tokenSource_.reset();
    auto sink = std::move(sink_);
    running_ = false;
    if (sink) {
        sink->end();
    }
}

}  // namespace TEB
