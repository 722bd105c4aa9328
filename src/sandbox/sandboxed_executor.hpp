#pragma once

#include "subprocess/run_result.hpp"
#include "subprocess/subprocess.hpp"

#include <optional>

namespace gradebox {

/// The one way submission code is launched: in its own process group, under the restricted
/// identity (when sandboxing is enabled), with no core dumps and a cap on written file sizes.
class SandboxedExecutor
{
public:
    /// ``identity`` is nullopt only when sandboxing was explicitly disabled
    SandboxedExecutor(std::optional<ProcessIdentity> identity, ResourceLimits limits);

    ProcessResult<CapturedRun> run(SpawnRequest request) const;

    bool is_sandboxed() const noexcept { return identity_.has_value(); }

    const std::optional<ProcessIdentity>& get_identity() const noexcept { return identity_; }

private:
    std::optional<ProcessIdentity> identity_;
    ResourceLimits limits_;
};

} // namespace gradebox
