#pragma once

#include <chrono>
#include <string_view>

namespace TEB {
namespace Constants {

// Reporter side channel: environment handed to the runner
constexpr std::string_view ENV_REPORTER = "PW_TEST_REPORTER";
constexpr std::string_view ENV_REPORTER_ENDPOINT = "PW_TEST_REPORTER_WS_ENDPOINT";
constexpr std::string_view ENV_FORCE_COLOR = "FORCE_COLOR";
constexpr std::string_view ENV_HTML_REPORT_OPEN = "PW_TEST_HTML_REPORT_OPEN";

// Pipe endpoint format: "fd://<child reads>/<child writes>"
constexpr std::string_view PIPE_ENDPOINT_SCHEME = "fd://";
constexpr int CHILD_PIPE_READ_FD = 3;
constexpr int CHILD_PIPE_WRITE_FD = 4;

// Inherited variables that would attach a second debugger/instrumentation to the child
constexpr std::string_view STRIPPED_ENV_VARS[] = {"NODE_OPTIONS", "ELECTRON_RUN_AS_NODE", "VSCODE_INSPECTOR_OPTIONS",
                                                  "NODE_INSPECT_RESUME_ON_START"};

// Protocol methods
constexpr std::string_view METHOD_STOP = "stop";
constexpr std::string_view METHOD_ON_BEGIN = "onBegin";
constexpr std::string_view METHOD_ON_TEST_BEGIN = "onTestBegin";
constexpr std::string_view METHOD_ON_TEST_END = "onTestEnd";
constexpr std::string_view METHOD_ON_STEP_BEGIN = "onStepBegin";
constexpr std::string_view METHOD_ON_STEP_END = "onStepEnd";
constexpr std::string_view METHOD_ON_ERROR = "onError";
constexpr std::string_view METHOD_ON_END = "onEnd";

// Defaults
constexpr auto DEFAULT_DEBOUNCE = std::chrono::milliseconds(50);
constexpr auto DEFAULT_GRACE_PERIOD = std::chrono::milliseconds(30000);
constexpr std::string_view DEFAULT_MIN_RUNNER_VERSION = "1.19";
constexpr std::string_view DEFAULT_INTERPRETER = "node";

}  // namespace Constants
}  // namespace TEB
