#pragma once

#include <gradebox/common/error_types.hpp>

#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace gradebox {

/// The restricted identity could not be resolved, or access control could not be applied.
/// Fatal: raised before any submission code runs.
class PermissionSetupError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// The Report could not be written to the result location. Fatal: raised after all tests ran.
class ResultPersistenceError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// The submission failed to build. Carries the captured toolchain diagnostics
class BuildError : public std::runtime_error
{
public:
    explicit BuildError(const std::string& msg, std::string diagnostics = "")
        : std::runtime_error{msg}
        , diagnostics_{std::move(diagnostics)} {}

    const std::string& get_diagnostics() const { return diagnostics_; }

private:
    std::string diagnostics_;
};

/// A test invocation outlived its deadline and was killed
class TestTimeoutError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// Engine-side fault while executing a single test (spawn failure, sandbox failure, ...)
class TestExecutionError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;

    explicit TestExecutionError(ErrorKind error, const std::string& msg = "")
        : std::runtime_error{msg}
        , error_{error} {}

    ErrorKind get_error() const { return error_; };

private:
    ErrorKind error_ = ErrorKind::UnknownError;
};

/// The instructor-provided suite or its configuration is invalid. The run is reported as ungradable
class SuiteError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace gradebox

template <>
struct fmt::formatter<::gradebox::TestExecutionError> : fmt::formatter<std::string>
{
    auto format(const ::gradebox::TestExecutionError& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{} : {}", from.what(), from.get_error());
    }
};
