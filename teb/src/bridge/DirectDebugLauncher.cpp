#include "bridge/IDebugLauncher.h"
#include "common/Logger.h"

namespace TEB {

std::unique_ptr<ChildProcess> DirectDebugLauncher::launch(EventLoop &loop, const ChildProcessOptions &options) {
    auto process = std::make_unique<ChildProcess>(loop);
    process->spawn(options);
    LOG_DEBUG("DirectDebugLauncher: Started {} (pid {})", options.program, process->pid());
    return process;
}

}  // namespace TEB
