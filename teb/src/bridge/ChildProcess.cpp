#include "bridge/ChildProcess.h"
#include "common/EnvironmentError.h"
#include "common/Logger.h"
#include "transport/PipeTransport.h"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace TEB {

namespace {

constexpr auto REAP_INTERVAL = std::chrono::milliseconds(20);

struct PipePair {
    int read = -1;
    int write = -1;
};

void closeIfOpen(int &fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void closePipes(std::vector<PipePair *> pipes) {
    for (auto *pipe : pipes) {
        closeIfOpen(pipe->read);
        closeIfOpen(pipe->write);
    }
}

PipePair makePipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw EnvironmentError(EnvironmentError::Kind::SpawnFailed,
                               std::string("Failed to create pipe: ") + std::strerror(errno));
    }
    return PipePair{fds[0], fds[1]};
}

void setNonBlocking(int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Runs in the forked child: only async-signal-safe calls from here on
[[noreturn]] void execChild(const std::array<int, 5> &sources, int errorFd, const char *cwd, const char *program,
                            char *const argv[], char *const envp[]) {
    std::array<int, 5> moved{-1, -1, -1, -1, -1};
    for (size_t target = 0; target < sources.size(); ++target) {
        if (sources[target] >= 0) {
            moved[target] = fcntl(sources[target], F_DUPFD_CLOEXEC, 10);
        }
    }
    for (size_t target = 0; target < moved.size(); ++target) {
        if (moved[target] >= 0) {
            dup2(moved[target], static_cast<int>(target));
        }
    }

    int error = 0;
    if (cwd && *cwd && chdir(cwd) != 0) {
        error = errno;
    } else {
        execve(program, argv, envp);
        error = errno;
    }
    ssize_t ignored = write(errorFd, &error, sizeof(error));
    (void)ignored;
    _exit(127);
}

}  // namespace

ChildProcess::ChildProcess(EventLoop &loop) : loop_(loop) {}

ChildProcess::~ChildProcess() {
    *alive_ = false;
    if (reapTimer_) {
        loop_.cancelTimer(*reapTimer_);
    }
    closeFd(stdinFd_);
    closeFd(stdoutFd_);
    closeFd(stderrFd_);
    closeFd(sideWriteFd_);
    closeFd(sideReadFd_);
    if (isRunning()) {
        ::kill(pid_, SIGKILL);
        int status = 0;
        waitpid(pid_, &status, 0);
    }
}

std::vector<std::string> ChildProcess::buildEnvironment(const std::map<std::string, std::optional<std::string>> &overrides) {
    std::map<std::string, std::string> variables;
    for (char **entry = environ; entry && *entry; ++entry) {
        const std::string text(*entry);
        const auto separator = text.find('=');
        if (separator == std::string::npos || separator == 0) {
            continue;
        }
        variables[text.substr(0, separator)] = text.substr(separator + 1);
    }
    for (const auto &[name, value] : overrides) {
        if (value) {
            variables[name] = *value;
        } else {
            variables.erase(name);
        }
    }

    std::vector<std::string> result;
    result.reserve(variables.size());
    for (const auto &[name, value] : variables) {
        result.push_back(name + "=" + value);
    }
    return result;
}

void ChildProcess::spawn(const ChildProcessOptions &options) {
    if (pid_ > 0) {
        throw std::logic_error("ChildProcess already spawned");
    }
    if (options.program.empty()) {
        throw std::invalid_argument("ChildProcess requires a program");
    }

    // Everything the child needs is prepared before fork
    std::vector<std::string> argStorage;
    argStorage.push_back(options.program);
    argStorage.insert(argStorage.end(), options.args.begin(), options.args.end());
    std::vector<char *> argv;
    for (auto &arg : argStorage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> envStorage = buildEnvironment(options.env);
    std::vector<char *> envp;
    for (auto &variable : envStorage) {
        envp.push_back(variable.data());
    }
    envp.push_back(nullptr);

    PipePair in, out, err, sideIn, sideOut, errorPipe;
    std::vector<PipePair *> all{&in, &out, &err, &sideIn, &sideOut, &errorPipe};
    try {
        in = makePipe();
        out = makePipe();
        err = makePipe();
        if (options.sideChannel) {
            sideIn = makePipe();
            sideOut = makePipe();
        }
        errorPipe = makePipe();
    } catch (...) {
        closePipes(all);
        throw;
    }

    const pid_t pid = fork();
    if (pid < 0) {
        const std::string reason = std::strerror(errno);
        closePipes(all);
        throw EnvironmentError(EnvironmentError::Kind::SpawnFailed, "Failed to fork: " + reason);
    }

    if (pid == 0) {
        execChild({in.read, out.write, err.write, sideIn.read, sideOut.write}, errorPipe.write, options.cwd.c_str(),
                  options.program.c_str(), argv.data(), envp.data());
    }

    closeIfOpen(in.read);
    closeIfOpen(out.write);
    closeIfOpen(err.write);
    closeIfOpen(sideIn.read);
    closeIfOpen(sideOut.write);
    closeIfOpen(errorPipe.write);

    // The error pipe closes on successful exec; otherwise it carries errno
    int childErrno = 0;
    ssize_t bytes = 0;
    do {
        bytes = ::read(errorPipe.read, &childErrno, sizeof(childErrno));
    } while (bytes < 0 && errno == EINTR);
    closeIfOpen(errorPipe.read);

    if (bytes == static_cast<ssize_t>(sizeof(childErrno))) {
        int status = 0;
        waitpid(pid, &status, 0);
        closePipes(all);
        throw EnvironmentError(EnvironmentError::Kind::SpawnFailed,
                               "Failed to start " + options.program + ": " + std::strerror(childErrno));
    }

    pid_ = pid;
    stdinFd_ = in.write;
    stdoutFd_ = out.read;
    stderrFd_ = err.read;
    sideWriteFd_ = sideIn.write;
    sideReadFd_ = sideOut.read;

    setNonBlocking(stdoutFd_);
    setNonBlocking(stderrFd_);
    loop_.watchFd(stdoutFd_, POLLIN, [this](short) { readOutput(stdoutFd_, onStdout_); });
    loop_.watchFd(stderrFd_, POLLIN, [this](short) { readOutput(stderrFd_, onStderr_); });
    reapTimer_ = loop_.addTimer(REAP_INTERVAL, [this]() { pollExit(); });

    LOG_DEBUG("ChildProcess: Started pid {} ({} {} args) in {}", pid_, options.program, options.args.size(),
              options.cwd.empty() ? "." : options.cwd);
}

std::unique_ptr<IConnectionTransport> ChildProcess::takeSideChannel() {
    if (sideWriteFd_ < 0 || sideReadFd_ < 0) {
        return nullptr;
    }
    auto transport = std::make_unique<PipeTransport>(loop_, sideWriteFd_, sideReadFd_);
    sideWriteFd_ = -1;
    sideReadFd_ = -1;
    return transport;
}

void ChildProcess::closeStdin() {
    closeFd(stdinFd_);
}

void ChildProcess::kill(int signal) {
    if (isRunning()) {
        ::kill(pid_, signal);
    }
}

void ChildProcess::readOutput(int &fd, const OutputCallback &callback) {
    std::array<char, 8192> buffer{};
    while (fd >= 0) {
        const ssize_t bytes = ::read(fd, buffer.data(), buffer.size());
        if (bytes > 0) {
            if (callback) {
                std::weak_ptr<bool> alive = alive_;
                callback(std::string(buffer.data(), static_cast<size_t>(bytes)));
                if (alive.expired()) {
                    return;
                }
            }
            continue;
        }
        if (bytes < 0 && errno == EINTR) {
            continue;
        }
        if (bytes < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        closeFd(fd);
    }
}

void ChildProcess::pollExit() {
    reapTimer_.reset();
    int status = 0;
    const pid_t result = waitpid(pid_, &status, WNOHANG);
    if (result == 0) {
        reapTimer_ = loop_.addTimer(REAP_INTERVAL, [this]() { pollExit(); });
        return;
    }

    exitCode_ = result == pid_ ? decodeStatus(status) : -1;
    LOG_DEBUG("ChildProcess: pid {} exited with {}", pid_, *exitCode_);

    // Deliver what the child wrote before exiting
    std::weak_ptr<bool> alive = alive_;
    readOutput(stdoutFd_, onStdout_);
    if (alive.expired()) {
        return;
    }
    readOutput(stderrFd_, onStderr_);
    if (alive.expired()) {
        return;
    }
    closeFd(stdoutFd_);
    closeFd(stderrFd_);
    closeFd(stdinFd_);

    if (onExit_) {
        auto callback = std::move(onExit_);
        onExit_ = nullptr;
        callback(*exitCode_);
    }
}

void ChildProcess::closeFd(int &fd) {
    if (fd >= 0) {
        loop_.unwatchFd(fd);
        ::close(fd);
        fd = -1;
    }
}

ProcessOutput ChildProcess::runToCompletion(const ChildProcessOptions &options, std::chrono::milliseconds timeout) {
    EventLoop loop;
    ChildProcess child(loop);
    ProcessOutput output;
    bool exited = false;

    child.onStdout([&output](const std::string &chunk) { output.stdoutText += chunk; });
    child.onStderr([&output](const std::string &chunk) { output.stderrText += chunk; });
    child.onExit([&output, &exited](int exitCode) {
        output.exitCode = exitCode;
        exited = true;
    });
    child.spawn(options);
    child.closeStdin();

    if (!loop.runUntil([&exited]() { return exited; }, timeout)) {
        child.kill(SIGKILL);
        throw EnvironmentError(EnvironmentError::Kind::SpawnFailed,
                               options.program + " did not finish within " + std::to_string(timeout.count()) + " ms");
    }
    return output;
}

}  // namespace TEB
