#include "bridge/RunnerLocator.h"
#include "bridge/ChildProcess.h"
#include "common/EnvironmentError.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

namespace TEB {

namespace {

// Relative to a node_modules folder, in preference order
constexpr const char *CLI_CANDIDATES[] = {"playwright-core/lib/cli/cli.js", "playwright-core/cli.js",
                                          "@playwright/test/cli.js"};

bool isExecutableFile(const std::string &path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

}  // namespace

RunnerLocator::RunnerLocator(std::string interpreter, const std::string &minVersion,
                             std::chrono::milliseconds probeTimeout)
    : interpreter_(std::move(interpreter)), probeTimeout_(probeTimeout) {
    if (interpreter_.empty()) {
        throw std::invalid_argument("RunnerLocator requires an interpreter");
    }
    auto parsed = RunnerVersion::parse(minVersion);
    if (!parsed) {
        throw std::invalid_argument("Invalid minimum runner version: " + minVersion);
    }
    minVersion_ = *parsed;
}

std::string RunnerLocator::resolveInterpreter() {
    if (cachedInterpreter_) {
        return *cachedInterpreter_;
    }
    const char *pathEnv = std::getenv("PATH");
    auto found = findInPath(interpreter_, pathEnv ? pathEnv : "");
    if (!found) {
        throw EnvironmentError(EnvironmentError::Kind::RunnerNotFound,
                               "Unable to find '" + interpreter_ + "' executable. Make sure it is on your PATH.");
    }
    LOG_DEBUG("RunnerLocator: Resolved {} to {}", interpreter_, *found);
    cachedInterpreter_ = *found;
    return *found;
}

void RunnerLocator::invalidate() {
    cachedInterpreter_.reset();
}

std::optional<std::string> RunnerLocator::findInPath(const std::string &program, const std::string &pathEnv) {
    if (program.find('/') != std::string::npos) {
        if (isExecutableFile(program)) {
            return std::filesystem::absolute(program).lexically_normal().string();
        }
        return std::nullopt;
    }

    std::stringstream stream(pathEnv);
    std::string directory;
    while (std::getline(stream, directory, ':')) {
        if (directory.empty()) {
            directory = ".";
        }
        const std::string candidate = (std::filesystem::path(directory) / program).string();
        if (isExecutableFile(candidate)) {
            return std::filesystem::absolute(candidate).lexically_normal().string();
        }
    }
    return std::nullopt;
}

std::string RunnerLocator::locateCli(const std::string &configFile, const std::string &explicitCli) {
    std::error_code ec;
    if (!explicitCli.empty()) {
        if (std::filesystem::is_regular_file(explicitCli, ec)) {
            return explicitCli;
        }
        throw EnvironmentError(EnvironmentError::Kind::RunnerNotFound, "Runner CLI not found: " + explicitCli);
    }

    for (std::filesystem::path folder = std::filesystem::path(configFile).parent_path(); !folder.empty();
         folder = folder.parent_path()) {
        for (const char *candidate : CLI_CANDIDATES) {
            const auto cli = folder / "node_modules" / candidate;
            if (std::filesystem::is_regular_file(cli, ec)) {
                return cli.string();
            }
        }
        if (folder == folder.root_path()) {
            break;
        }
    }
    throw EnvironmentError(EnvironmentError::Kind::RunnerNotFound,
                           "Please install the test runner next to " + configFile + " (npm i --save-dev @playwright/test)");
}

RunnerVersion RunnerLocator::probeVersion(const TestConfig &config) {
    if (config.cli.empty()) {
        throw EnvironmentError(EnvironmentError::Kind::RunnerNotFound, "No runner CLI for " + config.configFile);
    }

    ChildProcessOptions options;
    options.program = resolveInterpreter();
    options.args = {config.cli, "--version"};
    options.cwd = PathUtils::dirname(config.configFile);
    const ProcessOutput output = ChildProcess::runToCompletion(options, probeTimeout_);

    auto version = RunnerVersion::parse(output.stdoutText);
    if (!version) {
        throw EnvironmentError(EnvironmentError::Kind::IncompatibleVersion,
                               "Unable to determine the runner version for " + config.configFile);
    }
    if (*version < minVersion_) {
        throw EnvironmentError(EnvironmentError::Kind::IncompatibleVersion,
                               "Runner v" + minVersion_.toString() + " or newer is required, found v" +
                                   version->toString());
    }
    return *version;
}

TestConfig RunnerLocator::createConfig(const std::string &workspaceFolder, const std::string &configFile,
                                       const std::string &explicitCli) {
    TestConfig config;
    config.workspaceFolder = PathUtils::normalizeFsPath(workspaceFolder);
    config.configFile = PathUtils::normalizeFsPath(configFile);
    config.cli = locateCli(config.configFile, explicitCli);
    config.version = probeVersion(config);
    return config;
}

}  // namespace TEB
