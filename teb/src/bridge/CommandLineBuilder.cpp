#include "bridge/CommandLineBuilder.h"
#include "common/Constants.h"
#include "common/PathUtils.h"

namespace TEB {

const char *toString(RunMode mode) {
    switch (mode) {
    case RunMode::List:
        return "list";
    case RunMode::Run:
        return "run";
    case RunMode::Debug:
        return "debug";
    }
    return "unknown";
}

namespace {

std::string join(const std::vector<std::string> &parts) {
    std::string result;
    for (const auto &part : parts) {
        result += " " + part;
    }
    return result;
}

}  // namespace

std::string CommandLineBuilder::logPrefix(const TestConfig &config) const {
    const std::string configFolder = PathUtils::dirname(config.configFile);
    return PathUtils::escapeRegex(PathUtils::relative(config.workspaceFolder, configFolder)) + "> ";
}

CommandLine CommandLineBuilder::listFiles(const TestConfig &config) const {
    const std::string configFile = PathUtils::basename(config.configFile);
    CommandLine command;
    command.args = {config.cli, "list-files", "-c", configFile};
    command.logLine = logPrefix(config) + "playwright list-files -c " + configFile;
    return command;
}

CommandLine CommandLineBuilder::test(const TestConfig &config, const TestInvocation &invocation) const {
    const std::string configFile = PathUtils::basename(config.configFile);
    const std::string configFolder = PathUtils::dirname(config.configFile);

    std::vector<std::string> escapedLocations;
    std::vector<std::string> relativeLocations;
    for (const auto &location : invocation.locations) {
        escapedLocations.push_back(PathUtils::escapeRegex(location));
        relativeLocations.push_back(PathUtils::escapeRegex(PathUtils::relative(configFolder, location)));
    }

    std::vector<std::string> filters;
    for (const auto &project : invocation.projects) {
        if (!project.empty()) {
            filters.push_back("--project=" + project);
        }
    }
    if (!invocation.grepTitle.empty()) {
        filters.push_back("--grep=" + PathUtils::escapeRegex(invocation.grepTitle));
    }

    CommandLine command;
    command.args = {config.cli, "test", "-c", configFile};

    if (invocation.mode == RunMode::Debug) {
        command.args.insert(command.args.end(), escapedLocations.begin(), escapedLocations.end());
        command.args.push_back("--headed");
        command.args.insert(command.args.end(), filters.begin(), filters.end());
        command.args.insert(command.args.end(), {"--repeat-each=1", "--retries=0", "--timeout=0", "--workers=1"});
        command.logLine = logPrefix(config) + "debug -c " + configFile + join(relativeLocations);
        return command;
    }

    std::vector<std::string> modeArgs = filters;
    if (invocation.mode == RunMode::List) {
        modeArgs.insert(modeArgs.begin(), "--list");
    }
    command.args.insert(command.args.end(), modeArgs.begin(), modeArgs.end());
    command.args.insert(command.args.end(), escapedLocations.begin(), escapedLocations.end());
    command.args.insert(command.args.end(), {"--repeat-each=1", "--retries=0"});
    if (isUnderTest_) {
        command.args.push_back("--workers=1");
    }
    if (invocation.mode == RunMode::List) {
        command.args.push_back("--reporter=null");
    }
    command.logLine = logPrefix(config) + "playwright test -c " + configFile + join(modeArgs) + join(relativeLocations);
    return command;
}

CommandLine CommandLineBuilder::findRelatedTestFiles(const TestConfig &config,
                                                     const std::vector<std::string> &files) const {
    const std::string configFile = PathUtils::basename(config.configFile);
    const std::string configFolder = PathUtils::dirname(config.configFile);

    CommandLine command;
    command.args = {config.cli, "find-related-test-files", "-c", configFile};
    command.args.insert(command.args.end(), files.begin(), files.end());

    std::vector<std::string> relativeFiles;
    for (const auto &file : files) {
        relativeFiles.push_back(PathUtils::relative(configFolder, file));
    }
    command.logLine = logPrefix(config) + "playwright find-related-test-files -c " + configFile + join(relativeFiles);
    return command;
}

std::map<std::string, std::optional<std::string>> CommandLineBuilder::environment(const BridgeSettings &settings,
                                                                                   const std::string &reporterModule,
                                                                                   const std::string &endpoint) {
    std::map<std::string, std::optional<std::string>> env;
    for (const auto &[name, value] : settings.extraEnv) {
        env[name] = value;
    }
    for (const auto name : Constants::STRIPPED_ENV_VARS) {
        env[std::string(name)] = std::nullopt;
    }
    if (!reporterModule.empty()) {
        env[std::string(Constants::ENV_REPORTER)] = reporterModule;
    }
    if (!endpoint.empty()) {
        env[std::string(Constants::ENV_REPORTER_ENDPOINT)] = endpoint;
    }
    env[std::string(Constants::ENV_FORCE_COLOR)] = "1";
    env[std::string(Constants::ENV_HTML_REPORT_OPEN)] = "never";
    return env;
}

}  // namespace TEB
