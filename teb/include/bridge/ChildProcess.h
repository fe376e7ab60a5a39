#pragma once

#include "common/EventLoop.h"
#include "transport/IConnectionTransport.h"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace TEB {

struct ChildProcessOptions {
    // Absolute path of the executable
    std::string program;
    std::vector<std::string> args;
    std::string cwd;

    // Applied over the inherited environment; nullopt removes the variable
    std::map<std::string, std::optional<std::string>> env;

    // Create the side-channel pipe pair on descriptors 3 (child reads) and 4 (child writes)
    bool sideChannel = false;
};

struct ProcessOutput {
    int exitCode = -1;
    std::string stdoutText;
    std::string stderrText;
};

/**
 * @brief Child process with piped stdio, driven by an EventLoop
 *
 * Output is delivered in chunks as it arrives. Exit is detected by polling
 * waitpid; output already written by the child is delivered before the exit
 * callback. A process still running at destruction is terminated and reaped.
 */
class ChildProcess {
public:
    using OutputCallback = std::function<void(const std::string &chunk)>;

    /**
     * @brief Exit status: the exit code, or 128 + signal number
     */
    using ExitCallback = std::function<void(int exitCode)>;

    explicit ChildProcess(EventLoop &loop);
    ~ChildProcess();

    ChildProcess(const ChildProcess &) = delete;
    ChildProcess &operator=(const ChildProcess &) = delete;

    /**
     * @throws EnvironmentError (SpawnFailed) when the process cannot be started
     */
    void spawn(const ChildProcessOptions &options);

    /**
     * @brief Host ends of the side channel as a transport; empty after the first call
     */
    std::unique_ptr<IConnectionTransport> takeSideChannel();

    void onStdout(OutputCallback callback) {
        onStdout_ = std::move(callback);
    }

    void onStderr(OutputCallback callback) {
        onStderr_ = std::move(callback);
    }

    void onExit(ExitCallback callback) {
        onExit_ = std::move(callback);
    }

    void closeStdin();

    void kill(int signal);

    bool isRunning() const {
        return pid_ > 0 && !exitCode_;
    }

    pid_t pid() const {
        return pid_;
    }

    std::optional<int> exitCode() const {
        return exitCode_;
    }

    /**
     * @brief Environment block for exec: inherited variables with @p overrides applied
     */
    static std::vector<std::string> buildEnvironment(const std::map<std::string, std::optional<std::string>> &overrides);

    /**
     * @brief Run to completion on a private loop and capture the output
     * @throws EnvironmentError (SpawnFailed) when the process cannot be started or times out
     */
    static ProcessOutput runToCompletion(const ChildProcessOptions &options, std::chrono::milliseconds timeout);

private:
    void readOutput(int &fd, const OutputCallback &callback);
    void pollExit();
    void closeFd(int &fd);

    EventLoop &loop_;
    pid_t pid_ = -1;
    int stdinFd_ = -1;
    int stdoutFd_ = -1;
    int stderrFd_ = -1;
    int sideWriteFd_ = -1;
    int sideReadFd_ = -1;
    std::optional<int> exitCode_;
    std::optional<EventLoop::TimerId> reapTimer_;
    OutputCallback onStdout_;
    OutputCallback onStderr_;
    ExitCallback onExit_;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

}  // namespace TEB
