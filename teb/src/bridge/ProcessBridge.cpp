#include "bridge/ProcessBridge.h"
#include "common/Constants.h"
#include "common/EnvironmentError.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include "common/UniqueIdGenerator.h"

#include <csignal>

namespace TEB {

namespace {

class ListCollector : public ITestListener {
public:
    void onBegin(const BeginParams &params) override {
        result.projects = params.projects;
    }

    void onError(const ErrorParams &params) override {
        result.errors.push_back(params.error);
    }

    ListTestsResult result;
};

std::string pipeEndpoint() {
    return std::string(Constants::PIPE_ENDPOINT_SCHEME) + std::to_string(Constants::CHILD_PIPE_READ_FD) + "/" +
           std::to_string(Constants::CHILD_PIPE_WRITE_FD);
}

std::string firstLine(const std::string &text) {
    const auto end = text.find('\n');
    return end == std::string::npos ? text : text.substr(0, end);
}

}  // namespace

ProcessBridge::ProcessBridge(EventLoop &loop, BridgeSettings settings, RunnerLocator &locator,
                             IDebugLauncher *debugLauncher)
    : loop_(loop), settings_(std::move(settings)), locator_(locator), builder_(settings_.isUnderTest),
      debugLauncher_(debugLauncher ? debugLauncher : &directLauncher_) {}

ProcessBridge::~ProcessBridge() {
    alive_.reset();
    if (!invocations_.empty() || !captures_.empty()) {
        LOG_DEBUG("ProcessBridge: Terminating {} runner process(es)", activeProcessCount());
    }
    invocations_.clear();
    captures_.clear();
}

ChildProcessOptions ProcessBridge::baseOptions(const TestConfig &config, const CommandLine &command) {
    ChildProcessOptions options;
    options.program = locator_.resolveInterpreter();
    options.args = command.args;
    options.cwd = PathUtils::dirname(config.configFile);
    return options;
}

void ProcessBridge::listFiles(const TestConfig &config, ListFilesCallback done) {
    const CommandLine command = builder_.listFiles(config);
    testLog_.push_back(command.logLine);

    runCapture(config, command, [done = std::move(done)](const ProcessOutput &output) {
        std::string parseError;
        auto value = JsonUtils::parseJson(output.stdoutText, &parseError);
        if (!value) {
            LOG_WARN("ProcessBridge: Unable to parse list-files output (exit code {}): {}", output.exitCode,
                     parseError);
            const std::string detail = output.stderrText.empty() ? parseError : firstLine(output.stderrText);
            done(ListFilesReport::error("Unable to list test files: " + detail));
            return;
        }
        done(ListFilesReport::fromJson(*value));
    });
}

void ProcessBridge::listTests(const TestConfig &config, const std::vector<std::string> &files,
                              ListTestsCallback done) {
    TestInvocation invocation;
    invocation.mode = RunMode::List;
    invocation.locations = files;

    auto collector = std::make_shared<ListCollector>();
    startTest(config, invocation, *collector, CancellationToken(),
              [collector, done = std::move(done)](const RunOutcome &outcome) {
                  if (!outcome.completed) {
                      LOG_DEBUG("ProcessBridge: Listing ended without onEnd");
                  }
                  done(collector->result);
              });
}

void ProcessBridge::runTests(const TestConfig &config, const std::vector<std::string> &projects,
                             const std::optional<std::vector<std::string>> &locations, ITestListener &listener,
                             const std::string &grepTitle, CancellationToken token, DoneCallback done) {
    TestInvocation invocation;
    invocation.mode = RunMode::Run;
    invocation.projects = projects;
    invocation.locations = locations.value_or(std::vector<std::string>{});
    invocation.grepTitle = grepTitle;
    startTest(config, invocation, listener, std::move(token), std::move(done));
}

void ProcessBridge::debugTests(const TestConfig &config, const std::vector<std::string> &projects,
                               const std::optional<std::vector<std::string>> &locations, ITestListener &listener,
                               const std::string &grepTitle, CancellationToken token, DoneCallback done) {
    TestInvocation invocation;
    invocation.mode = RunMode::Debug;
    invocation.projects = projects;
    invocation.locations = locations.value_or(std::vector<std::string>{});
    invocation.grepTitle = grepTitle;
    startTest(config, invocation, listener, std::move(token), std::move(done));
}

void ProcessBridge::findRelatedTestFiles(const TestConfig &config, const std::vector<std::string> &files,
                                         Callback done) {
    const CommandLine command = builder_.findRelatedTestFiles(config, files);
    LOG_DEBUG("ProcessBridge: {}", command.logLine);

    auto reply = [this, done](RelatedFilesReport report) {
        std::weak_ptr<bool> alive = alive_;
        loop_.post([alive, done, report = std::move(report)]() {
            if (!alive.expired()) {
                done(report);
            }
        });
    };

    try {
        runCapture(config, command, [files, done](const ProcessOutput &output) {
            std::string parseError;
            auto value = JsonUtils::parseJson(output.stdoutText, &parseError);
            if (!value || !value->is_object()) {
                LOG_DEBUG("ProcessBridge: Unusable find-related-test-files output: {}", parseError);
                done(RelatedFilesReport::error(output.stdoutText.empty() ? parseError : output.stdoutText, files));
                return;
            }

            std::vector<std::string> testFiles;
            for (const auto &file : JsonUtils::getStringArray(*value, "testFiles")) {
                testFiles.push_back(PathUtils::normalizeFsPath(file));
            }
            if (value->contains("errors") && (*value)["errors"].is_array() && !(*value)["errors"].empty()) {
                const TestError error = TestError::fromJson((*value)["errors"].front());
                done(RelatedFilesReport::error(error.message, JsonUtils::hasKey(*value, "testFiles") ? testFiles : files));
                return;
            }
            done(RelatedFilesReport::success(std::move(testFiles)));
        });
    } catch (const std::exception &e) {
        LOG_WARN("ProcessBridge: find-related-test-files failed: {}", e.what());
        reply(RelatedFilesReport::error(e.what(), files));
    }
}

void ProcessBridge::startTest(const TestConfig &config, const TestInvocation &invocation, ITestListener &listener,
                              CancellationToken token, DoneCallback done) {
    const CommandLine command = builder_.test(config, invocation);
    ChildProcessOptions options = baseOptions(config, command);
    testLog_.push_back(command.logLine);

    const std::string &reporterModule = invocation.mode == RunMode::List && !settings_.listReporterModule.empty()
                                            ? settings_.listReporterModule
                                            : settings_.reporterModule;

    const uint64_t id = nextId_++;
    auto record = std::make_unique<Invocation>();
    record->mode = invocation.mode;
    record->token = token;
    record->done = std::move(done);
    record->session = std::make_unique<ReporterSession>(loop_, listener, token, settings_.cancelGracePeriod);
    record->session->onCompleted([this, id]() { handleSessionFinished(id); });

    if (invocation.mode == RunMode::Debug) {
        record->server = std::make_unique<WebSocketServer>(loop_, "/" + UniqueIdGenerator::generateGuid());
        std::string endpoint;
        try {
            endpoint = record->server->listen();
        } catch (const std::runtime_error &e) {
            throw EnvironmentError(EnvironmentError::Kind::SpawnFailed, e.what());
        }
        record->server->onConnection([this, id](std::unique_ptr<IConnectionTransport> transport) {
            auto it = invocations_.find(id);
            if (it == invocations_.end()) {
                transport->close();
                return;
            }
            LOG_DEBUG("ProcessBridge: Debug runner connected");
            it->second->session->attach(std::move(transport));
        });
        options.env = CommandLineBuilder::environment(settings_, reporterModule, endpoint);
        record->process = debugLauncher_->launch(loop_, options);
    } else {
        options.sideChannel = true;
        options.env = CommandLineBuilder::environment(settings_, reporterModule, pipeEndpoint());
        record->process = std::make_unique<ChildProcess>(loop_);
        record->process->spawn(options);
        record->session->attach(record->process->takeSideChannel());
    }

    if (record->process) {
        ReporterSession *session = record->session.get();
        record->process->onStdout([session, &listener](const std::string &chunk) {
            if (!session->isFinished()) {
                listener.onStdOut(chunk);
            }
        });
        record->process->onStderr([session, &listener](const std::string &chunk) {
            if (!session->isFinished()) {
                listener.onStdErr(chunk);
            }
        });
        record->process->onExit([this, id](int exitCode) { handleProcessExit(id, exitCode); });
        LOG_DEBUG("ProcessBridge: Started {} runner (pid {})", toString(invocation.mode), record->process->pid());
    }

    invocations_[id] = std::move(record);
}

void ProcessBridge::handleSessionFinished(uint64_t id) {
    auto it = invocations_.find(id);
    if (it == invocations_.end()) {
        return;
    }
    Invocation &record = *it->second;

    RunOutcome outcome;
    outcome.completed = record.session->endedGracefully();
    outcome.cancelled = record.token.isCancellationRequested();
    outcome.exitCode = record.exitCode;

    if (record.server) {
        record.server->stop();
    }
    if (outcome.cancelled && record.process && record.process->isRunning()) {
        LOG_DEBUG("ProcessBridge: Terminating cancelled runner (pid {})", record.process->pid());
        record.process->kill(SIGTERM);
    }

    if (record.done) {
        auto done = std::move(record.done);
        record.done = nullptr;
        std::weak_ptr<bool> alive = alive_;
        loop_.post([alive, done = std::move(done), outcome]() {
            if (!alive.expired()) {
                done(outcome);
            }
        });
    }

    if (!record.process || record.processExited) {
        scheduleCleanup(id);
    }
}

void ProcessBridge::handleProcessExit(uint64_t id, int exitCode) {
    auto it = invocations_.find(id);
    if (it == invocations_.end()) {
        return;
    }
    Invocation &record = *it->second;
    record.processExited = true;
    record.exitCode = exitCode;
    LOG_DEBUG("ProcessBridge: {} runner exited with code {}", toString(record.mode), exitCode);

    if (record.session->isFinished()) {
        scheduleCleanup(id);
        return;
    }
    if (!record.session->hasTransport()) {
        // Died before connecting; no channel will ever close
        record.session->abort();
    }
}

void ProcessBridge::scheduleCleanup(uint64_t id) {
    std::weak_ptr<bool> alive = alive_;
    loop_.post([this, alive, id]() {
        if (!alive.expired()) {
            invocations_.erase(id);
        }
    });
}

void ProcessBridge::runCapture(const TestConfig &config, const CommandLine &command, CaptureCallback done) {
    ChildProcessOptions options = baseOptions(config, command);
    options.env = CommandLineBuilder::environment(settings_, "", "");

    const uint64_t id = nextId_++;
    auto output = std::make_shared<ProcessOutput>();
    auto process = std::make_unique<ChildProcess>(loop_);
    process->onStdout([output](const std::string &chunk) { output->stdoutText += chunk; });
    process->onStderr([output](const std::string &chunk) { output->stderrText += chunk; });
    process->onExit([this, id, output, done = std::move(done)](int exitCode) {
        output->exitCode = exitCode;
        std::weak_ptr<bool> alive = alive_;
        loop_.post([this, alive, id]() {
            if (!alive.expired()) {
                captures_.erase(id);
            }
        });
        done(*output);
    });
    process->spawn(options);
    process->closeStdin();
    captures_[id] = std::move(process);
}

}  // namespace TEB
