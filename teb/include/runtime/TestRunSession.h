#pragma once

#include "model/TestModel.h"
#include "reporter/ITestListener.h"
#include "runtime/ITestRunSink.h"
#include "tree/TestTree.h"
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace TEB {

/**
 * @brief Listener translating one model's run events into tree node results
 *
 * Tests are found in the tree by runner location and title. Steps are keyed by
 * "<file>:<line>" and counted, so nested or concurrent steps on one line stay
 * active until the last of them ends.
 */
class TestRunSession : public ITestListener {
public:
    using ModelUpdatedCallback = std::function<void()>;

    /**
     * @param modelUpdated Invoked after onBegin merged the running projects into @p model,
     *        before any node lookup; expected to reconcile the tree
     * @param failures Tests already failed in this UI run; shared across the sessions of one run
     */
    TestRunSession(const TestTree &tree, TestModel &model, ITestRunSink &sink, std::set<std::string> &failures,
                   ModelUpdatedCallback modelUpdated);

    void onBegin(const BeginParams &params) override;
    void onTestBegin(const TestBeginParams &params) override;
    void onTestEnd(const TestEndParams &params) override;
    void onStepBegin(const StepBeginParams &params) override;
    void onStepEnd(const StepEndParams &params) override;
    void onError(const ErrorParams &params) override;
    void onStdOut(const std::string &data) override;
    void onStdErr(const std::string &data) override;

    /**
     * @brief Forget the steps still marked active (end of a test or of the run)
     */
    void clearActiveSteps();

    std::vector<StepMarker> activeSteps() const;
    std::vector<StepMarker> completedSteps() const;

    static TestMessage messageForError(const TestError &error);

    /**
     * @brief Convert "\n" line endings to "\r\n" for the terminal
     */
    static std::string toTerminalOutput(const std::string &data);

private:
    void executionLinesChanged();
    static std::string stepKey(const Location &location);

    const TestTree &tree_;
    TestModel &model_;
    ITestRunSink &sink_;
    std::set<std::string> &failures_;
    ModelUpdatedCallback modelUpdated_;
    std::map<std::string, StepMarker> activeSteps_;
    std::map<std::string, StepMarker> completedSteps_;
};

}  // namespace TEB
