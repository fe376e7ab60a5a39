#pragma once

#include "common/RunnerVersion.h"
#include "model/TestTypes.h"
#include <chrono>
#include <optional>
#include <string>

namespace TEB {

/**
 * @brief Resolves the interpreter and runner CLI, and checks the runner version
 *
 * Holds the resolved interpreter path as an explicit cache; call invalidate()
 * when the environment may have changed (settings edit, PATH change).
 */
class RunnerLocator {
public:
    /**
     * @param interpreter Program name or path ("node", "/usr/bin/node")
     * @param minVersion Oldest accepted runner, "<major>.<minor>"
     */
    RunnerLocator(std::string interpreter, const std::string &minVersion,
                  std::chrono::milliseconds probeTimeout = std::chrono::milliseconds(30000));

    /**
     * @brief Absolute interpreter path, cached after the first lookup
     * @throws EnvironmentError (RunnerNotFound)
     */
    std::string resolveInterpreter();

    void invalidate();

    bool hasCachedInterpreter() const {
        return cachedInterpreter_.has_value();
    }

    /**
     * @brief Runner CLI for a config: @p explicitCli when given, otherwise the first
     *        node_modules installation found walking up from the config's folder
     * @throws EnvironmentError (RunnerNotFound)
     */
    static std::string locateCli(const std::string &configFile, const std::string &explicitCli = "");

    /**
     * @brief Run "<interpreter> <cli> --version" and check it against the minimum
     * @throws EnvironmentError (RunnerNotFound, IncompatibleVersion, SpawnFailed)
     */
    RunnerVersion probeVersion(const TestConfig &config);

    /**
     * @brief Locate the CLI and probe the version of a freshly discovered config
     */
    TestConfig createConfig(const std::string &workspaceFolder, const std::string &configFile,
                            const std::string &explicitCli = "");

    /**
     * @brief Search @p pathEnv (colon separated) for an executable @p program
     *
     * Names containing '/' are checked as given.
     */
    static std::optional<std::string> findInPath(const std::string &program, const std::string &pathEnv);

    const RunnerVersion &minVersion() const {
        return minVersion_;
    }

private:
    std::string interpreter_;
    RunnerVersion minVersion_;
    std::chrono::milliseconds probeTimeout_;
    std::optional<std::string> cachedInterpreter_;
};

}  // namespace TEB
