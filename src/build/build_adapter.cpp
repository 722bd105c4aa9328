#include "build/build_adapter.hpp"

#include <gradebox/exceptions.hpp>
#include <gradebox/logging.hpp>
#include <gradebox/model/build_result.hpp>
#include <gradebox/model/language_profile.hpp>

#include "sandbox/sandboxed_executor.hpp"
#include "subprocess/run_result.hpp"
#include "subprocess/subprocess.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/algorithm/find.hpp>
#include <range/v3/algorithm/sort.hpp>

#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace gradebox {

namespace fs = std::filesystem;

namespace {

std::string combine_output(const CapturedRun& run) {
    std::string out = run.stdout_text;

    if (!out.empty() && !run.stderr_text.empty() && out.back() != '\n') {
        out += '\n';
    }
    out += run.stderr_text;

    if (run.truncated()) {
        out += "\n[output truncated]";
    }

    return out;
}

} // namespace

BuildAdapter::BuildAdapter(const SandboxedExecutor& executor, std::size_t max_output)
    : executor_{&executor}
    , max_output_{max_output} {}

std::vector<std::string> BuildAdapter::collect_sources(const fs::path& submission,
                                                       const std::vector<std::string>& extensions) {
    std::vector<std::string> sources;
    std::error_code err;

    for (auto iter = fs::recursive_directory_iterator{submission, err};
         !err && iter != fs::recursive_directory_iterator{}; iter.increment(err)) {
        std::error_code entry_err;

        if (!iter->is_regular_file(entry_err)) {
            continue;
        }

        std::string ext = iter->path().extension().string();

        if (ranges::find(extensions, ext) != extensions.end()) {
            sources.push_back(fs::relative(iter->path(), submission).string());
        }
    }

    if (err) {
        throw BuildError(fmt::format("could not list submission directory {:?}: {}", submission.string(),
                                     err.message()));
    }

    ranges::sort(sources);

    return sources;
}

std::vector<std::string> BuildAdapter::make_build_command(const fs::path& submission, const LanguageProfile& profile) {
    if (!profile.command.empty()) {
        return profile.command;
    }

    std::vector<std::string> sources = collect_sources(submission, profile.source_extensions);

    if (sources.empty()) {
        throw BuildError(
            fmt::format("no source files ({}) found in the submission", fmt::join(profile.source_extensions, " ")));
    }

    std::vector<std::string> command{profile.compiler};

    switch (profile.target) {
    case TargetArch::Native:
        break;
    case TargetArch::Bits32:
        command.emplace_back("-m32");
        break;
    case TargetArch::Bits64:
        command.emplace_back("-m64");
        break;
    }

    command.insert(command.end(), profile.flags.begin(), profile.flags.end());
    command.insert(command.end(), sources.begin(), sources.end());
    command.emplace_back("-o");
    command.push_back(profile.output);

    return command;
}

BuildResult BuildAdapter::build(const fs::path& submission, const LanguageProfile& profile) const {
    if (!profile.requires_build()) {
        LOG_DEBUG("Interpreted submission; nothing to build");
        return BuildResult::make_success(submission);
    }

    try {
        return run_toolchain(submission, profile);
    } catch (const BuildError& ex) {
        LOG_INFO("Build failed: {}", ex.what());

        std::string diagnostics = ex.what();

        if (!ex.get_diagnostics().empty()) {
            diagnostics += fmt::format("\n\n{}", ex.get_diagnostics());
        }

        return BuildResult::make_failure(std::move(diagnostics));
    }
}

BuildResult BuildAdapter::run_toolchain(const fs::path& submission, const LanguageProfile& profile) const {
    std::vector<std::string> command = make_build_command(submission, profile);

    LOG_INFO("Building submission: {}", fmt::join(command, " "));

    SpawnRequest request{
        .argv = command, .cwd = submission, .timeout = profile.build_timeout, .max_output = max_output_};

    auto run = executor_->run(std::move(request));

    if (!run) {
        throw BuildError(fmt::format("could not run the build command: {}", run.error()));
    }

    std::string diagnostics = combine_output(*run);

    if (run->timed_out()) {
        throw BuildError(fmt::format("build timed out after {}", profile.build_timeout), diagnostics);
    }

    if (!run->result.exited_with(0)) {
        throw BuildError(fmt::format("build command {}", run->result), diagnostics);
    }

    fs::path artifact = submission / profile.output;
    std::error_code err;

    if (!fs::exists(artifact, err)) {
        throw BuildError(fmt::format("build succeeded but did not produce {:?}", profile.output), diagnostics);
    }

    LOG_DEBUG("Build produced {:?}", artifact.string());

    return BuildResult::make_success(std::move(artifact), std::move(diagnostics));
}

} // namespace gradebox
