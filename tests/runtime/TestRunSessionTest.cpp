#include "mocks/RecordingRunSink.h"
#include "runtime/TestRunSession.h"
#include "tree/TreeReconciler.h"
#include <gtest/gtest.h>
#include <memory>

using namespace TEB;
using TEB::Test::RecordingRunSink;

namespace {

const std::string LOGIN = "/ws/tests/login.spec.ts";
const std::string CART = "/ws/tests/cart.spec.ts";

ReportEntry test(const std::string &title, const std::string &file, int line) {
    ReportEntry result;
    result.kind = ReportEntryKind::Test;
    result.title = title;
    result.location = Location{file, line, 1};
    return result;
}

ReportEntry file(const std::string &path, std::vector<ReportEntry> children) {
    ReportEntry result;
    result.kind = ReportEntryKind::File;
    result.title = path;
    result.location = Location{path, 0, 0};
    result.children = std::move(children);
    return result;
}

ReportEntry project(const std::string &name, std::vector<ReportEntry> files) {
    ReportEntry result;
    result.kind = ReportEntryKind::Project;
    result.title = name;
    result.children = std::move(files);
    return result;
}

TestEndParams testEnd(const std::string &title, const std::string &fileName, int line, const std::string &status,
                      const std::string &expectedStatus = "passed") {
    TestEndParams params;
    params.title = title;
    params.location = Location{fileName, line, 1};
    params.status = status;
    params.expectedStatus = expectedStatus;
    params.duration = 12;
    return params;
}

}  // namespace

class TestRunSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        model = std::make_unique<TestModel>(TestConfig{"/ws", "/ws/playwright.config.ts", "", {}});
        model->applyListFiles(ListFilesReport::success({{"chromium", "/ws/tests", {LOGIN, CART}}}));
        model->applyListTests(
            {project("chromium", {file(LOGIN, {test("signs in", LOGIN, 3), test("signs out", LOGIN, 8)}),
                                  file(CART, {test("adds item", CART, 4)})})},
            {LOGIN, CART});
        tree.startNewGeneration({"/ws"});
        reconcile();

        session = std::make_unique<TestRunSession>(tree, *model, sink, failures, [this]() {
            ++modelUpdates;
            reconcile();
        });
    }

    void reconcile() {
        TreeReconciler reconciler(tree);
        reconciler.reconcile({model.get()});
    }

    std::string id(const std::string &location) const {
        return tree.idForLocation(location);
    }

    TestTree tree;
    std::unique_ptr<TestModel> model;
    RecordingRunSink sink;
    std::set<std::string> failures;
    int modelUpdates = 0;
    std::unique_ptr<TestRunSession> session;
};

TEST_F(TestRunSessionTest, BeginEnqueuesReportedTests) {
    BeginParams begin;
    begin.projects = {project("chromium", {file(LOGIN, {test("signs in", LOGIN, 3)}), file(CART, {test("adds item", CART, 4)})})};
    session->onBegin(begin);

    EXPECT_EQ(modelUpdates, 1);
    EXPECT_EQ(sink.results, (std::vector<std::string>{"enqueued:" + id(LOGIN + ":3"), "enqueued:" + id(CART + ":4")}));
}

TEST_F(TestRunSessionTest, BeginAddsTestsOfUnlistedFiles) {
    const std::string fresh = "/ws/tests/fresh.spec.ts";
    model->applyListFiles(ListFilesReport::success({{"chromium", "/ws/tests", {LOGIN, CART, fresh}}}));
    reconcile();
    ASSERT_EQ(tree.getForLocation(fresh + ":2"), nullptr);

    BeginParams begin;
    begin.projects = {project("chromium", {file(fresh, {test("is new", fresh, 2)})})};
    session->onBegin(begin);

    ASSERT_NE(tree.getForLocation(fresh + ":2"), nullptr);
    EXPECT_EQ(sink.results, (std::vector<std::string>{"enqueued:" + id(fresh + ":2")}));
}

TEST_F(TestRunSessionTest, ReportsPassedSkippedAndFailed) {
    TestBeginParams begin;
    begin.title = "signs in";
    begin.location = Location{LOGIN, 3, 1};
    session->onTestBegin(begin);
    session->onTestEnd(testEnd("signs in", LOGIN, 3, "passed"));
    session->onTestEnd(testEnd("signs out", LOGIN, 8, "skipped", "skipped"));

    TestEndParams failure = testEnd("adds item", CART, 4, "failed");
    TestError error;
    error.message = "expected 1 to be 2";
    error.location = Location{CART, 6, 3};
    failure.errors.push_back(error);
    session->onTestEnd(failure);

    EXPECT_EQ(sink.results, (std::vector<std::string>{"started:" + id(LOGIN + ":3"), "passed:" + id(LOGIN + ":3"),
                                                      "skipped:" + id(LOGIN + ":8"), "failed:" + id(CART + ":4")}));
    ASSERT_EQ(sink.failureMessages.size(), 1u);
    ASSERT_EQ(sink.failureMessages[0].size(), 1u);
    EXPECT_EQ(sink.failureMessages[0][0].text, "expected 1 to be 2");
    EXPECT_EQ(sink.failureMessages[0][0].location, (Location{CART, 6, 3}));
}

TEST_F(TestRunSessionTest, UnexpectedPassIsFailure) {
    session->onTestEnd(testEnd("signs in", LOGIN, 3, "passed", "failed"));

    EXPECT_EQ(sink.results, (std::vector<std::string>{"failed:" + id(LOGIN + ":3")}));
    EXPECT_TRUE(sink.failureMessages[0].empty());
}

TEST_F(TestRunSessionTest, EarlierFailureIsNotOverwritten) {
    session->onTestEnd(testEnd("signs in", LOGIN, 3, "failed"));
    session->onTestEnd(testEnd("signs in", LOGIN, 3, "passed"));

    EXPECT_EQ(sink.results, (std::vector<std::string>{"failed:" + id(LOGIN + ":3")}));
    EXPECT_EQ(failures.count(id(LOGIN + ":3")), 1u);
}

TEST_F(TestRunSessionTest, UnknownTestIsIgnored) {
    session->onTestEnd(testEnd("ghost", "/ws/tests/ghost.spec.ts", 1, "failed"));

    EXPECT_TRUE(sink.results.empty());
    EXPECT_TRUE(failures.empty());
}

TEST_F(TestRunSessionTest, FailureMessagePrefersStackThenMessageThenValue) {
    TestError error;
    error.value = "thrown value";
    EXPECT_EQ(TestRunSession::messageForError(error).text, "thrown value");

    error.message = "Error: boom";
    EXPECT_EQ(TestRunSession::messageForError(error).text, "Error: boom");

    error.stack = "Error: boom\n    at login.spec.ts:3:5";
    EXPECT_EQ(TestRunSession::messageForError(error).text, "Error: boom\n    at login.spec.ts:3:5");
    EXPECT_FALSE(TestRunSession::messageForError(error).location.has_value());
}

TEST_F(TestRunSessionTest, StepsOnOneLineStayActiveUntilLastEnds) {
    StepBeginParams step;
    step.location = Location{LOGIN, 5, 3};
    session->onStepBegin(step);
    session->onStepBegin(step);

    StepEndParams end;
    end.location = step.location;
    end.duration = 7;
    session->onStepEnd(end);
    ASSERT_EQ(session->activeSteps().size(), 1u);
    EXPECT_EQ(session->activeSteps()[0].activeCount, 1);

    session->onStepEnd(end);
    EXPECT_TRUE(session->activeSteps().empty());
    ASSERT_EQ(session->completedSteps().size(), 1u);
    EXPECT_EQ(session->completedSteps()[0].duration, 7);
    EXPECT_EQ(sink.lineUpdates, 4);
    EXPECT_TRUE(sink.lastActive.empty());
}

TEST_F(TestRunSessionTest, TestEndClearsActiveSteps) {
    StepBeginParams step;
    step.location = Location{LOGIN, 5, 3};
    session->onStepBegin(step);

    session->onTestEnd(testEnd("signs in", LOGIN, 3, "passed"));

    EXPECT_TRUE(session->activeSteps().empty());
    EXPECT_TRUE(sink.lastActive.empty());
}

TEST_F(TestRunSessionTest, StepEndWithoutBeginIsIgnored) {
    StepEndParams end;
    end.location = Location{LOGIN, 9, 1};
    session->onStepEnd(end);

    EXPECT_TRUE(session->completedSteps().empty());
    EXPECT_EQ(sink.lineUpdates, 0);
}

TEST_F(TestRunSessionTest, OutputUsesTerminalLineEndings) {
    session->onStdOut("line one\nline two\n");
    session->onStdErr("warning\n");

    ErrorParams error;
    error.error.message = "SyntaxError";
    session->onError(error);

    EXPECT_EQ(sink.output, "line one\r\nline two\r\nwarning\r\nSyntaxError\r\n");
    EXPECT_EQ(TestRunSession::toTerminalOutput("no newline"), "no newline");
}
