#include "bridge/ProcessBridge.h"
#include "common/EnvironmentError.h"
#include "common/TestUtils.h"
#include "mocks/FakeRunner.h"
#include "mocks/RecordingTestListener.h"
#include "transport/WebSocketFrameCodec.h"
#include <algorithm>
#include <arpa/inet.h>
#include <gtest/gtest.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace TEB;
using TEB::Test::FakeRunner;
using TEB::Test::RecordingTestListener;

namespace {

/**
 * @brief Debug launcher of a host that starts the runner itself
 */
class HostOwnedLauncher : public IDebugLauncher {
public:
    std::unique_ptr<ChildProcess> launch(EventLoop &, const ChildProcessOptions &options) override {
        launched = options;
        return nullptr;
    }

    std::optional<ChildProcessOptions> launched;
};

}  // namespace

class ProcessBridgeTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings.reporterModule = "/ext/reporter.js";
        settings.cancelGracePeriod = std::chrono::milliseconds(TEB::Test::Utils::getBaseDelay(100));
    }

    std::unique_ptr<ProcessBridge> makeBridge(IDebugLauncher *launcher = nullptr) {
        return std::make_unique<ProcessBridge>(loop, settings, locator, launcher);
    }

    bool waitFor(const std::function<bool()> &predicate) {
        return TEB::Test::Utils::waitFor(loop, predicate, TEB::Test::Utils::PROCESS_WAIT_MS);
    }

    EventLoop loop;
    TEB::Test::Utils::TempDir dir;
    BridgeSettings settings;
    RunnerLocator locator{"/bin/sh", "1.19"};
    RecordingTestListener listener;
};

TEST_F(ProcessBridgeTest, ListFilesParsesReport) {
    TestConfig config = FakeRunner(dir)
                            .onListFiles(R"(printf '{"projects":[{"name":"chromium","testDir":"%s/tests","files":["%s/tests/a.spec.ts"]}]}' "$PWD" "$PWD")")
                            .install();
    auto bridge = makeBridge();

    std::optional<ListFilesReport> report;
    bridge->listFiles(config, [&report](const ListFilesReport &result) { report = result; });
    ASSERT_TRUE(waitFor([&report]() { return report.has_value(); }));

    ASSERT_TRUE(report->isSuccess);
    ASSERT_EQ(report->projects.size(), 1u);
    EXPECT_EQ(report->projects[0].name, "chromium");
    EXPECT_EQ(report->projects[0].testDir, dir.file("tests"));
    EXPECT_EQ(report->projects[0].files, (std::vector<std::string>{dir.file("tests/a.spec.ts")}));
    EXPECT_EQ(bridge->testLog(), (std::vector<std::string>{"> playwright list-files -c playwright.config.ts"}));
}

TEST_F(ProcessBridgeTest, ListFilesReportsStderrOnFailure) {
    TestConfig config = FakeRunner(dir).onListFiles("echo 'Error: config is broken' >&2; echo 'at line 3' >&2; exit 1").install();
    auto bridge = makeBridge();

    std::optional<ListFilesReport> report;
    bridge->listFiles(config, [&report](const ListFilesReport &result) { report = result; });
    ASSERT_TRUE(waitFor([&report]() { return report.has_value(); }));

    EXPECT_FALSE(report->isSuccess);
    EXPECT_EQ(report->errorMessage, "Unable to list test files: Error: config is broken");
}

TEST_F(ProcessBridgeTest, ListFilesRunnerSideError) {
    TestConfig config = FakeRunner(dir).onListFiles(R"(echo '{"error":{"message":"No tests found"}}')").install();
    auto bridge = makeBridge();

    std::optional<ListFilesReport> report;
    bridge->listFiles(config, [&report](const ListFilesReport &result) { report = result; });
    ASSERT_TRUE(waitFor([&report]() { return report.has_value(); }));

    EXPECT_FALSE(report->isSuccess);
    EXPECT_EQ(report->errorMessage, "No tests found");
}

TEST_F(ProcessBridgeTest, ListTestsCollectsBeginAndErrors) {
    TestConfig config =
        FakeRunner(dir)
            .onTest(FakeRunner::report(
                        R"({"method":"onBegin","params":{"projects":[{"type":"project","title":"chromium","children":[{"type":"file","title":"a.spec.ts","location":{"file":"/ws/a.spec.ts","line":0,"column":0},"children":[{"type":"test","title":"works","location":{"file":"/ws/a.spec.ts","line":3,"column":5}}]}]}]}})") +
                    FakeRunner::report(R"({"method":"onError","params":{"error":{"message":"SyntaxError in b.spec.ts"}}})") +
                    FakeRunner::report(R"({"method":"onEnd","params":{}})"))
            .install();
    auto bridge = makeBridge();

    std::optional<ListTestsResult> result;
    bridge->listTests(config, {"/ws/a.spec.ts"}, [&result](const ListTestsResult &listed) { result = listed; });
    ASSERT_TRUE(waitFor([&result]() { return result.has_value(); }));

    ASSERT_EQ(result->projects.size(), 1u);
    EXPECT_EQ(result->projects[0].title, "chromium");
    ASSERT_EQ(result->projects[0].children.size(), 1u);
    EXPECT_EQ(result->projects[0].children[0].children[0].title, "works");
    ASSERT_EQ(result->errors.size(), 1u);
    EXPECT_EQ(result->errors[0].message, "SyntaxError in b.spec.ts");
    ASSERT_EQ(bridge->testLog().size(), 1u);
    EXPECT_NE(bridge->testLog()[0].find("playwright test -c playwright.config.ts --list"), std::string::npos);
}

TEST_F(ProcessBridgeTest, RunDeliversEventsAndOutput) {
    TestConfig config =
        FakeRunner(dir)
            .onTest("echo \"reporter=$PW_TEST_REPORTER endpoint=$PW_TEST_REPORTER_WS_ENDPOINT color=$FORCE_COLOR\"\n" +
                    FakeRunner::report(R"({"method":"onBegin","params":{"projects":[]}})") +
                    FakeRunner::report(R"({"method":"onTestBegin","params":{"testId":"t1"}})") +
                    FakeRunner::report(R"({"method":"onTestEnd","params":{"testId":"t1","status":"passed","expectedStatus":"passed"}})") +
                    "sleep 0.2\n" + FakeRunner::report(R"({"method":"onEnd","params":{}})"))
            .install();
    auto bridge = makeBridge();

    std::optional<RunOutcome> outcome;
    bridge->runTests(config, {"chromium"}, std::vector<std::string>{dir.file("a.spec.ts")}, listener, "",
                     CancellationToken(), [&outcome](const RunOutcome &result) { outcome = result; });
    ASSERT_TRUE(waitFor([&outcome]() { return outcome.has_value(); }));

    EXPECT_TRUE(outcome->completed);
    EXPECT_FALSE(outcome->cancelled);
    EXPECT_EQ(listener.events, (std::vector<std::string>{"begin", "testBegin:t1", "testEnd:t1:ok", "end"}));
    EXPECT_EQ(listener.stdoutText, "reporter=/ext/reporter.js endpoint=fd://3/4 color=1\n");
    EXPECT_EQ(bridge->testLog().back(),
              "> playwright test -c playwright.config.ts --project=chromium a\\.spec\\.ts");

    ASSERT_TRUE(waitFor([&bridge]() { return bridge->activeProcessCount() == 0; }));
}

TEST_F(ProcessBridgeTest, RunnerDyingWithoutEndIsIncomplete) {
    TestConfig config =
        FakeRunner(dir).onTest(FakeRunner::report(R"({"method":"onBegin","params":{"projects":[]}})") + "exit 2").install();
    auto bridge = makeBridge();

    std::optional<RunOutcome> outcome;
    bridge->runTests(config, {}, std::nullopt, listener, "", CancellationToken(),
                     [&outcome](const RunOutcome &result) { outcome = result; });
    ASSERT_TRUE(waitFor([&outcome]() { return outcome.has_value(); }));

    EXPECT_FALSE(outcome->completed);
    EXPECT_EQ(listener.events, (std::vector<std::string>{"begin"}));
    EXPECT_EQ(listener.endCount, 0);
}

TEST_F(ProcessBridgeTest, CancelStopsRunnerAfterGracePeriod) {
    TestConfig config =
        FakeRunner(dir)
            .onTest(FakeRunner::report(R"({"method":"onBegin","params":{"projects":[]}})") + "exec sleep 30")
            .install();
    auto bridge = makeBridge();
    CancellationTokenSource source;

    std::optional<RunOutcome> outcome;
    bridge->runTests(config, {}, std::nullopt, listener, "", source.token(),
                     [&outcome](const RunOutcome &result) { outcome = result; });
    ASSERT_TRUE(waitFor([this]() { return !listener.events.empty(); }));

    source.cancel();
    ASSERT_TRUE(waitFor([&outcome]() { return outcome.has_value(); }));

    EXPECT_TRUE(outcome->cancelled);
    EXPECT_FALSE(outcome->completed);
    EXPECT_EQ(listener.events, (std::vector<std::string>{"begin"}));
    ASSERT_TRUE(waitFor([&bridge]() { return bridge->activeProcessCount() == 0; }));
}

TEST_F(ProcessBridgeTest, MissingInterpreterThrowsBeforeSpawn) {
    TestConfig config = FakeRunner(dir).install();
    RunnerLocator missing(dir.file("no-node"), "1.19");
    ProcessBridge bridge(loop, settings, missing);

    EXPECT_THROW(bridge.runTests(config, {}, std::nullopt, listener, "", CancellationToken(), [](const RunOutcome &) {}),
                 EnvironmentError);
    EXPECT_EQ(bridge.activeProcessCount(), 0u);
}

TEST_F(ProcessBridgeTest, FindRelatedTestFiles) {
    TestConfig config = FakeRunner(dir).onFindRelated(R"(printf '{"testFiles":["%s/tests/a.spec.ts"]}' "$PWD")").install();
    auto bridge = makeBridge();

    std::optional<RelatedFilesReport> report;
    bridge->findRelatedTestFiles(config, {dir.file("src/app.ts")},
                                 [&report](const RelatedFilesReport &result) { report = result; });
    ASSERT_TRUE(waitFor([&report]() { return report.has_value(); }));

    EXPECT_TRUE(report->isSuccess);
    EXPECT_EQ(report->testFiles, (std::vector<std::string>{dir.file("tests/a.spec.ts")}));
}

TEST_F(ProcessBridgeTest, FindRelatedTestFilesFallsBackToQueriedFiles) {
    TestConfig config = FakeRunner(dir).onFindRelated("echo 'Error: cannot load config'").install();
    auto bridge = makeBridge();

    std::optional<RelatedFilesReport> report;
    bridge->findRelatedTestFiles(config, {dir.file("src/app.ts")},
                                 [&report](const RelatedFilesReport &result) { report = result; });
    ASSERT_TRUE(waitFor([&report]() { return report.has_value(); }));

    EXPECT_FALSE(report->isSuccess);
    EXPECT_EQ(report->testFiles, (std::vector<std::string>{dir.file("src/app.ts")}));
}

TEST_F(ProcessBridgeTest, FindRelatedTestFilesNeverThrows) {
    TestConfig config = FakeRunner(dir).install();
    RunnerLocator missing(dir.file("no-node"), "1.19");
    ProcessBridge bridge(loop, settings, missing);

    std::optional<RelatedFilesReport> report;
    EXPECT_NO_THROW(bridge.findRelatedTestFiles(config, {"/ws/x.ts"},
                                                [&report](const RelatedFilesReport &result) { report = result; }));
    ASSERT_TRUE(waitFor([&report]() { return report.has_value(); }));
    EXPECT_FALSE(report->isSuccess);
    EXPECT_EQ(report->testFiles, (std::vector<std::string>{"/ws/x.ts"}));
}

TEST_F(ProcessBridgeTest, DebugRunConnectsOverWebSocket) {
    TestConfig config = FakeRunner(dir).install();
    HostOwnedLauncher launcher;
    auto bridge = makeBridge(&launcher);

    std::optional<RunOutcome> outcome;
    bridge->debugTests(config, {"chromium"}, std::vector<std::string>{dir.file("a.spec.ts") + ":3"}, listener, "",
                       CancellationToken(), [&outcome](const RunOutcome &result) { outcome = result; });

    ASSERT_TRUE(launcher.launched.has_value());
    const auto &args = launcher.launched->args;
    EXPECT_NE(std::find(args.begin(), args.end(), "--headed"), args.end());
    EXPECT_NE(std::find(args.begin(), args.end(), "--timeout=0"), args.end());
    const std::string endpoint = launcher.launched->env.at("PW_TEST_REPORTER_WS_ENDPOINT").value_or("");
    ASSERT_EQ(endpoint.rfind("ws://127.0.0.1:", 0), 0u);

    // Play the runner's reporter: connect, upgrade, report
    const std::string hostPort = endpoint.substr(std::string("ws://").size());
    const auto slash = hostPort.find('/');
    const int port = std::stoi(hostPort.substr(hostPort.find(':') + 1, slash));
    const std::string path = hostPort.substr(slash);

    const int client = ::socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(client, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(static_cast<uint16_t>(port));
    ASSERT_EQ(::connect(client, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)), 0);

    const std::string request = "GET " + path +
                                " HTTP/1.1\r\nHost: 127.0.0.1\r\nUpgrade: websocket\r\nConnection: Upgrade\r\n"
                                "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\nSec-WebSocket-Version: 13\r\n\r\n";
    ASSERT_EQ(::send(client, request.data(), request.size(), MSG_NOSIGNAL), static_cast<ssize_t>(request.size()));
    std::string frames;
    for (const char *message : {R"({"method":"onBegin","params":{"projects":[]}})", R"({"method":"onEnd","params":{}})"}) {
        frames += WebSocketFrameCodec::encode(WebSocketOpcode::Text, message, 0x5A5A1234u);
    }
    ASSERT_EQ(::send(client, frames.data(), frames.size(), MSG_NOSIGNAL), static_cast<ssize_t>(frames.size()));

    ASSERT_TRUE(waitFor([&outcome]() { return outcome.has_value(); }));
    ::close(client);

    EXPECT_TRUE(outcome->completed);
    EXPECT_FALSE(outcome->exitCode.has_value());
    EXPECT_EQ(listener.events, (std::vector<std::string>{"begin", "end"}));
    EXPECT_NE(bridge->testLog().back().find("debug -c playwright.config.ts"), std::string::npos);
}
