#pragma once

#include "bridge/ChildProcess.h"
#include "common/EventLoop.h"
#include <memory>

namespace TEB {

/**
 * @brief Starts the runner for a debug session
 *
 * Hosts with a debugger implement this to launch the runner under it. The
 * reporter endpoint is already part of @p options' environment.
 */
class IDebugLauncher {
public:
    virtual ~IDebugLauncher() = default;

    /**
     * @return The spawned process, or nullptr when the host owns the process itself
     * @throws EnvironmentError (SpawnFailed) when the launch fails
     */
    virtual std::unique_ptr<ChildProcess> launch(EventLoop &loop, const ChildProcessOptions &options) = 0;
};

/**
 * @brief Launches the debug run as a plain child process
 */
class DirectDebugLauncher : public IDebugLauncher {
public:
    std::unique_ptr<ChildProcess> launch(EventLoop &loop, const ChildProcessOptions &options) override;
};

}  // namespace TEB
