#pragma once

#include "app/app.hpp" // IWYU pragma: export
#include "output/plaintext_serializer.hpp"
#include "output/stdout_sink.hpp"
#include "sandbox/sandboxed_executor.hpp"
#include "user/environment_config.hpp"

#include <optional>

namespace gradebox {

/// Grades the one submission the container was started for
class GraderApp final : public App
{
public:
    explicit GraderApp(ProgramOptions opts);

    /// Process exit codes. Anything but REPORT_WRITTEN means the submission must be treated as ungraded
    enum ExitCode : int {
        REPORT_WRITTEN = 0,
        INTERNAL_ERROR = App::INTERNAL_ERROR_EXIT,
        INVALID_CONFIGURATION = 2,
        PERMISSION_SETUP_FAILED = 3,
        RESULT_PERSISTENCE_FAILED = 4,
    };

    /// Cap on any single file submission code writes (RLIMIT_FSIZE)
    static constexpr rlim_t MAX_WRITTEN_FILE_SIZE = 256ULL * 1024 * 1024;

private:
    int run_impl() override;

    /// Establish the restricted identity, unless sandboxing is disabled. Throws PermissionSetupError
    std::optional<ProcessIdentity> setup_sandbox(const HarnessConfig& config);

    StdoutSink sink_;
    PlainTextSerializer serializer_;
};

} // namespace gradebox
