#include "runtime/TestRunSession.h"
#include "common/Logger.h"

namespace TEB {

TestRunSession::TestRunSession(const TestTree &tree, TestModel &model, ITestRunSink &sink,
                               std::set<std::string> &failures, ModelUpdatedCallback modelUpdated)
    : tree_(tree), model_(model), sink_(sink), failures_(failures), modelUpdated_(std::move(modelUpdated)) {}

void TestRunSession::onBegin(const BeginParams &params) {
    model_.updateFromRunningProjects(params.projects);
    if (modelUpdated_) {
        modelUpdated_();
    }

    std::function<void(const ReportEntry &)> visit = [&](const ReportEntry &entry) {
        if (entry.kind == ReportEntryKind::Test) {
            if (const TreeNode *test = tree_.testItemForLocation(entry.location, entry.title)) {
                sink_.enqueued(*test);
            }
        }
        for (const auto &child : entry.children) {
            visit(child);
        }
    };
    for (const auto &project : params.projects) {
        visit(project);
    }
}

void TestRunSession::onTestBegin(const TestBeginParams &params) {
    if (const TreeNode *test = tree_.testItemForLocation(params.location, params.title)) {
        sink_.started(*test);
    } else {
        LOG_DEBUG("TestRunSession: No tree node for {}:{}", params.location.file, params.location.line);
    }
}

void TestRunSession::onTestEnd(const TestEndParams &params) {
    clearActiveSteps();

    const TreeNode *test = tree_.testItemForLocation(params.location, params.title);
    if (!test) {
        return;
    }

    if (params.ok()) {
        // A test that failed earlier in this run (another project) stays failed
        if (failures_.count(test->id())) {
            return;
        }
        if (params.status == "skipped") {
            sink_.skipped(*test);
        } else {
            sink_.passed(*test, params.duration);
        }
        return;
    }

    failures_.insert(test->id());
    std::vector<TestMessage> messages;
    for (const auto &error : params.errors) {
        messages.push_back(messageForError(error));
    }
    sink_.failed(*test, messages, params.duration);
}

void TestRunSession::onStepBegin(const StepBeginParams &params) {
    auto &step = activeSteps_[stepKey(params.location)];
    step.location = params.location;
    ++step.activeCount;
    executionLinesChanged();
}

void TestRunSession::onStepEnd(const StepEndParams &params) {
    const std::string key = stepKey(params.location);
    auto it = activeSteps_.find(key);
    if (it == activeSteps_.end()) {
        return;
    }
    --it->second.activeCount;
    it->second.duration = params.duration;
    completedSteps_[key] = it->second;
    if (it->second.activeCount == 0) {
        activeSteps_.erase(it);
    }
    executionLinesChanged();
}

void TestRunSession::onError(const ErrorParams &params) {
    const TestMessage message = messageForError(params.error);
    LOG_DEBUG("TestRunSession: Runner error: {}", message.text);
    sink_.appendOutput(toTerminalOutput(message.text + "\n"));
}

void TestRunSession::onStdOut(const std::string &data) {
    sink_.appendOutput(toTerminalOutput(data));
}

void TestRunSession::onStdErr(const std::string &data) {
    sink_.appendOutput(toTerminalOutput(data));
}

void TestRunSession::clearActiveSteps() {
    if (activeSteps_.empty()) {
        return;
    }
    activeSteps_.clear();
    executionLinesChanged();
}

std::vector<StepMarker> TestRunSession::activeSteps() const {
    std::vector<StepMarker> result;
    for (const auto &[key, step] : activeSteps_) {
        result.push_back(step);
    }
    return result;
}

std::vector<StepMarker> TestRunSession::completedSteps() const {
    std::vector<StepMarker> result;
    for (const auto &[key, step] : completedSteps_) {
        result.push_back(step);
    }
    return result;
}

TestMessage TestRunSession::messageForError(const TestError &error) {
    TestMessage message;
    if (!error.stack.empty()) {
        message.text = error.stack;
    } else if (!error.message.empty()) {
        message.text = error.message;
    } else {
        message.text = error.value;
    }
    message.location = error.location;
    return message;
}

std::string TestRunSession::toTerminalOutput(const std::string &data) {
    std::string result;
    result.reserve(data.size());
    for (char c : data) {
        if (c == '\n') {
            result += "\r\n";
        } else {
            result += c;
        }
    }
    return result;
}

void TestRunSession::executionLinesChanged() {
    sink_.executionLinesChanged(activeSteps(), completedSteps());
}

std::string TestRunSession::stepKey(const Location &location) {
    return location.file + ":" + std::to_string(location.line);
}

}  // namespace TEB
