#pragma once

#include "common/BridgeSettings.h"
#include "model/TestTypes.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace TEB {

enum class RunMode { List, Run, Debug };

const char *toString(RunMode mode);

/**
 * @brief What to pass to one "test" invocation of the runner
 */
struct TestInvocation {
    RunMode mode = RunMode::Run;
    // File or "file:line" locations; empty runs everything
    std::vector<std::string> locations;
    std::vector<std::string> projects;
    // Title filter for parametrized tests sharing one line
    std::string grepTitle;
};

struct CommandLine {
    // Arguments after the interpreter, starting with the CLI path
    std::vector<std::string> args;
    // Human readable line recorded in the test log
    std::string logLine;
};

/**
 * @brief Builds runner command lines and environments
 */
class CommandLineBuilder {
public:
    explicit CommandLineBuilder(bool isUnderTest = false) : isUnderTest_(isUnderTest) {}

    CommandLine listFiles(const TestConfig &config) const;

    CommandLine test(const TestConfig &config, const TestInvocation &invocation) const;

    CommandLine findRelatedTestFiles(const TestConfig &config, const std::vector<std::string> &files) const;

    /**
     * @brief Environment overrides for a child: settings variables, reporter wiring, forced
     *        color output, and removal of inherited debugger variables
     */
    static std::map<std::string, std::optional<std::string>> environment(const BridgeSettings &settings,
                                                                          const std::string &reporterModule,
                                                                          const std::string &endpoint);

private:
    std::string logPrefix(const TestConfig &config) const;

    bool isUnderTest_;
};

}  // namespace TEB
