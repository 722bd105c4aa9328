#include "sandbox/sandboxed_executor.hpp"

#include <gradebox/logging.hpp>

#include "subprocess/subprocess.hpp"

#include <optional>
#include <utility>

namespace gradebox {

SandboxedExecutor::SandboxedExecutor(std::optional<ProcessIdentity> identity, ResourceLimits limits)
    : identity_{identity}
    , limits_{limits} {
    if (!identity_) {
        LOG_WARN("Sandboxing is disabled: submission code runs with the harness's own privileges");
    }
}

ProcessResult<CapturedRun> SandboxedExecutor::run(SpawnRequest request) const {
    request.identity = identity_;
    request.limits = limits_;

    return run_subprocess(std::move(request));
}

} // namespace gradebox
