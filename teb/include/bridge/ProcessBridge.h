#pragma once

#include "bridge/ChildProcess.h"
#include "bridge/CommandLineBuilder.h"
#include "bridge/IDebugLauncher.h"
#include "bridge/RunnerLocator.h"
#include "common/BridgeSettings.h"
#include "common/CancellationToken.h"
#include "common/EventLoop.h"
#include "reporter/ITestListener.h"
#include "reporter/ReporterSession.h"
#include "transport/WebSocketServer.h"
#include "watch/IRelatedFilesResolver.h"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace TEB {

/**
 * @brief Outcome of one list/run/debug invocation
 */
struct RunOutcome {
    // onEnd arrived before the side channel closed
    bool completed = false;
    bool cancelled = false;
    // Unknown while the process is still running or when the host owns it
    std::optional<int> exitCode;
};

struct ListTestsResult {
    std::vector<ReportEntry> projects;
    std::vector<TestError> errors;
};

/**
 * @brief Spawns the runner and connects its reporter side channel to a listener
 *
 * List and run modes hand the runner a pipe pair on descriptors 3 and 4. Debug
 * mode listens on a loopback WebSocket instead and lets an IDebugLauncher start
 * the runner, which connects out to the endpoint it finds in its environment.
 *
 * Every callback runs on the EventLoop. Listeners passed to runTests/debugTests
 * must stay alive until the done callback fires; output and events are never
 * delivered after that.
 */
class ProcessBridge : public IRelatedFilesResolver {
public:
    using ListFilesCallback = std::function<void(const ListFilesReport &report)>;
    using ListTestsCallback = std::function<void(const ListTestsResult &result)>;
    using DoneCallback = std::function<void(const RunOutcome &outcome)>;

    /**
     * @param debugLauncher Used for debug runs; a DirectDebugLauncher when null
     */
    ProcessBridge(EventLoop &loop, BridgeSettings settings, RunnerLocator &locator,
                  IDebugLauncher *debugLauncher = nullptr);
    ~ProcessBridge() override;

    ProcessBridge(const ProcessBridge &) = delete;
    ProcessBridge &operator=(const ProcessBridge &) = delete;

    /**
     * @brief Ask the runner for the projects and test files of @p config
     * @throws EnvironmentError when the runner cannot be started
     */
    void listFiles(const TestConfig &config, ListFilesCallback done);

    /**
     * @brief List the suites and tests declared in @p files without running them
     * @throws EnvironmentError when the runner cannot be started
     */
    void listTests(const TestConfig &config, const std::vector<std::string> &files, ListTestsCallback done);

    /**
     * @param locations "file" or "file:line" filters; nullopt runs everything
     * @param grepTitle Title filter for a parametrized test, empty for none
     * @throws EnvironmentError when the runner cannot be started
     */
    void runTests(const TestConfig &config, const std::vector<std::string> &projects,
                  const std::optional<std::vector<std::string>> &locations, ITestListener &listener,
                  const std::string &grepTitle, CancellationToken token, DoneCallback done);

    /**
     * @brief Same as runTests, headed and single-worker, started through the debug launcher
     */
    void debugTests(const TestConfig &config, const std::vector<std::string> &projects,
                    const std::optional<std::vector<std::string>> &locations, ITestListener &listener,
                    const std::string &grepTitle, CancellationToken token, DoneCallback done);

    /**
     * @brief Never throws; on any failure the queried files themselves are reported
     */
    void findRelatedTestFiles(const TestConfig &config, const std::vector<std::string> &files,
                              Callback done) override;

    /**
     * @brief Command lines issued so far, one line per invocation
     */
    std::vector<std::string> testLog() const {
        return testLog_;
    }

    size_t activeProcessCount() const {
        return invocations_.size() + captures_.size();
    }

    const BridgeSettings &settings() const {
        return settings_;
    }

private:
    struct Invocation {
        RunMode mode = RunMode::Run;
        std::unique_ptr<ReporterSession> session;
        std::unique_ptr<WebSocketServer> server;
        // Destroyed first: a live process is killed before the session goes away
        std::unique_ptr<ChildProcess> process;
        CancellationToken token;
        DoneCallback done;
        bool processExited = false;
        std::optional<int> exitCode;
    };

    using CaptureCallback = std::function<void(const ProcessOutput &output)>;

    void startTest(const TestConfig &config, const TestInvocation &invocation, ITestListener &listener,
                   CancellationToken token, DoneCallback done);
    void handleSessionFinished(uint64_t id);
    void handleProcessExit(uint64_t id, int exitCode);
    void scheduleCleanup(uint64_t id);
    void runCapture(const TestConfig &config, const CommandLine &command, CaptureCallback done);
    ChildProcessOptions baseOptions(const TestConfig &config, const CommandLine &command);

    EventLoop &loop_;
    BridgeSettings settings_;
    RunnerLocator &locator_;
    CommandLineBuilder builder_;
    DirectDebugLauncher directLauncher_;
    IDebugLauncher *debugLauncher_;

    uint64_t nextId_ = 1;
    std::map<uint64_t, std::unique_ptr<Invocation>> invocations_;
    std::map<uint64_t, std::unique_ptr<ChildProcess>> captures_;
    std::vector<std::string> testLog_;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

}  // namespace TEB
