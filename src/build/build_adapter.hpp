#pragma once

#include <gradebox/model/build_result.hpp>
#include <gradebox/model/language_profile.hpp>

#include "sandbox/sandboxed_executor.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace gradebox {

/// Turns a submission into something runnable. Interpreted submissions pass straight through;
/// compiled ones are built by the toolchain, under the restricted identity.
class BuildAdapter
{
public:
    BuildAdapter(const SandboxedExecutor& executor, std::size_t max_output);

    /// Never throws for a failed build: failure is reported in the returned BuildResult
    BuildResult build(const std::filesystem::path& submission, const LanguageProfile& profile) const;

    /// The toolchain invocation, run from within the submission directory.
    /// Throws BuildError if there is nothing to compile
    static std::vector<std::string> make_build_command(const std::filesystem::path& submission,
                                                       const LanguageProfile& profile);

    /// Source files under ``submission`` (relative to it) matching the profile's extensions, sorted
    static std::vector<std::string> collect_sources(const std::filesystem::path& submission,
                                                    const std::vector<std::string>& extensions);

private:
    BuildResult run_toolchain(const std::filesystem::path& submission, const LanguageProfile& profile) const;

    const SandboxedExecutor* executor_;
    std::size_t max_output_;
};

} // namespace gradebox
