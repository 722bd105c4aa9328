#include "app/grader_app.hpp"

#include <gradebox/exceptions.hpp>
#include <gradebox/logging.hpp>

#include "pipeline/grading_pipeline.hpp"
#include "sandbox/privilege_separator.hpp"
#include "sandbox/restricted_identity.hpp"
#include "sandbox/sandboxed_executor.hpp"
#include "subprocess/subprocess.hpp"
#include "user/environment_config.hpp"
#include "user/program_options.hpp"

#include <fmt/format.h>

#include <optional>
#include <utility>

namespace gradebox {

GraderApp::GraderApp(ProgramOptions opts)
    : App{std::move(opts)}
    , serializer_{sink_, OPTS.colorize_option, OPTS.verbosity} {}

int GraderApp::run_impl() {
    auto config = HarnessConfig::from_environment();

    if (!config) {
        LOG_ERROR("Invalid environment: {}", config.error());
        serializer_.on_error(config.error());
        return INVALID_CONFIGURATION;
    }

    if (auto valid = config->validate(); !valid) {
        LOG_ERROR("Invalid configuration: {}", valid.error());
        serializer_.on_error(valid.error());
        return INVALID_CONFIGURATION;
    }

    LOG_INFO("Configuration: {}", config.value());

    std::optional<ProcessIdentity> identity;

    try {
        identity = setup_sandbox(config.value());
    } catch (const PermissionSetupError& ex) {
        LOG_FATAL("Could not set up the sandbox: {}", ex.what());
        serializer_.on_error(fmt::format("Could not set up the sandbox: {}", ex.what()));
        return PERMISSION_SETUP_FAILED;
    }

    SandboxedExecutor executor{identity, ResourceLimits{.disable_core_dumps = true,
                                                        .max_file_size = MAX_WRITTEN_FILE_SIZE}};

    GradingPipeline pipeline{config.value(), executor, &serializer_};

    try {
        pipeline.run();
    } catch (const ResultPersistenceError& ex) {
        LOG_FATAL("{}", ex.what());
        serializer_.on_error(ex.what());
        serializer_.finalize();
        return RESULT_PERSISTENCE_FAILED;
    }

    serializer_.finalize();

    return REPORT_WRITTEN;
}

std::optional<ProcessIdentity> GraderApp::setup_sandbox(const HarnessConfig& config) {
    if (!config.sandbox) {
        LOG_WARN("Sandboxing is DISABLED (GRADEBOX_SANDBOX=off); submission code runs as the harness identity");
        serializer_.on_warning("Warning: sandboxing is disabled");
        return std::nullopt;
    }

    PrivilegeSeparator separator{config.sandbox_user, config.make_sandbox_layout()};
    RestrictedIdentity restricted = separator.apply();

    return restricted.as_process_identity();
}

} // namespace gradebox
