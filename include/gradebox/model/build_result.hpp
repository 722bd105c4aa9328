#pragma once

#include <gradebox/common/formatters.hpp>

#include <boost/describe/enum.hpp>

#include <filesystem>
#include <string>
#include <utility>

namespace gradebox {

class BuildResult
{
public:
    // NOLINTNEXTLINE
    enum class Status { Success, Failure };
    BOOST_DESCRIBE_NESTED_ENUM(Status, Success, Failure)

    static BuildResult make_success(std::filesystem::path artifact, std::string diagnostics = "") {
        return {Status::Success, std::move(diagnostics), std::move(artifact)};
    }

    static BuildResult make_failure(std::string diagnostics) { return {Status::Failure, std::move(diagnostics), {}}; }

    Status get_status() const { return status_; }

    bool succeeded() const { return status_ == Status::Success; }

    /// Compiler output, or the reason the build failed
    const std::string& get_diagnostics() const { return diagnostics_; }

    /// Only meaningful on success
    const std::filesystem::path& get_artifact() const { return artifact_; }

private:
    BuildResult(Status status, std::string diagnostics, std::filesystem::path artifact)
        : status_{status}
        , diagnostics_{std::move(diagnostics)}
        , artifact_{std::move(artifact)} {}

    Status status_;
    std::string diagnostics_;
    std::filesystem::path artifact_;
};

} // namespace gradebox
