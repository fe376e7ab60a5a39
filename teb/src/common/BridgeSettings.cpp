#include "common/BridgeSettings.h"
#include "common/Logger.h"
#include "common/RunnerVersion.h"

#include <cstdlib>
#include <optional>

namespace TEB {

namespace {

std::optional<long> readMillis(const char *name) {
    const char *value = std::getenv(name);
    if (!value || !*value) {
        return std::nullopt;
    }
    char *end = nullptr;
    long parsed = std::strtol(value, &end, 10);
    if (end == value || *end != '\0' || parsed < 0) {
        LOG_WARN("BridgeSettings: Ignoring malformed {}='{}'", name, value);
        return std::nullopt;
    }
    return parsed;
}

}  // namespace

std::vector<std::string> BridgeSettings::validate() const {
    std::vector<std::string> errors;

    if (interpreter.empty()) {
        errors.push_back("Interpreter cannot be empty");
    }

    if (debounce.count() <= 0) {
        errors.push_back("Debounce window must be positive");
    }

    if (cancelGracePeriod.count() <= 0) {
        errors.push_back("Cancellation grace period must be positive");
    }

    if (!RunnerVersion::parse(minRunnerVersion)) {
        errors.push_back("Minimum runner version must look like <major>.<minor>: '" + minRunnerVersion + "'");
    }

    for (const auto &[name, value] : extraEnv) {
        if (name.empty() || name.find('=') != std::string::npos) {
            errors.push_back("Invalid environment variable name: '" + name + "'");
        }
    }

    return errors;
}

BridgeSettings BridgeSettings::fromEnvironment() {
    BridgeSettings settings;

    if (const char *node = std::getenv("TEB_NODE"); node && *node) {
        settings.interpreter = node;
    }
    if (const char *cli = std::getenv("TEB_RUNNER_CLI"); cli && *cli) {
        settings.runnerCli = cli;
    }
    if (const char *reporter = std::getenv("TEB_REPORTER"); reporter && *reporter) {
        settings.reporterModule = reporter;
    }
    if (const char *logDir = std::getenv("TEB_LOG_DIR"); logDir && *logDir) {
        settings.logDir = logDir;
    }
    if (auto debounce = readMillis("TEB_DEBOUNCE_MS")) {
        settings.debounce = std::chrono::milliseconds(*debounce);
    }
    if (auto grace = readMillis("TEB_GRACE_MS")) {
        settings.cancelGracePeriod = std::chrono::milliseconds(*grace);
    }

    return settings;
}

}  // namespace TEB
