#pragma once

#include "common/Constants.h"
#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace TEB {

/**
 * @brief Host-provided configuration of the bridge
 *
 * Plain values, read once at startup. Nothing here is persisted.
 */
struct BridgeSettings {
    // Interpreter used to launch the runner CLI ("node"); resolved through PATH
    std::string interpreter{Constants::DEFAULT_INTERPRETER};

    // Runner CLI entry point; when empty it is looked up under node_modules next to the config
    std::string runnerCli;

    // Reporter module loaded by the runner for run/debug (PW_TEST_REPORTER)
    std::string reporterModule;

    // Reporter module loaded by the runner for list mode; falls back to reporterModule
    std::string listReporterModule;

    std::chrono::milliseconds debounce{Constants::DEFAULT_DEBOUNCE};
    std::chrono::milliseconds cancelGracePeriod{Constants::DEFAULT_GRACE_PERIOD};
    // Oldest runner accepted, "<major>.<minor>"
    std::string minRunnerVersion{Constants::DEFAULT_MIN_RUNNER_VERSION};

    // Forwarded to every child after inherited variables
    std::map<std::string, std::string> extraEnv;

    bool isUnderTest = false;

    std::string logDir;

    /**
     * @brief Validate settings
     * @return Vector of validation errors (empty if valid)
     */
    std::vector<std::string> validate() const;

    /**
     * @brief Defaults overlaid with TEB_NODE, TEB_RUNNER_CLI, TEB_REPORTER, TEB_DEBOUNCE_MS, TEB_GRACE_MS, TEB_LOG_DIR
     *
     * Malformed numeric values are logged and ignored.
     */
    static BridgeSettings fromEnvironment();
};

}  // namespace TEB
