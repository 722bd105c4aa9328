#pragma once

#include <gradebox/common/class_traits.hpp>
#include <gradebox/model/build_result.hpp>
#include <gradebox/model/report.hpp>
#include <gradebox/model/test_outcome.hpp>

#include "output/sink.hpp"
#include "output/verbosity.hpp"

#include <string_view>

namespace gradebox {

/// Renders the progress of a grading run for humans. The pipeline calls the hooks in run order:
/// metadata, build, each test (in declaration order), then the final report.
class Serializer : NonCopyable
{
public:
    Serializer(Sink& sink, VerbosityLevel verbosity)
        : sink_{sink}
        , verbosity_{verbosity} {}

    virtual ~Serializer() = default;

    virtual void on_run_metadata(const RunMetadata& data) = 0;
    virtual void on_build_result(const BuildResult& data) = 0;
    virtual void on_test_result(const TestOutcome& data) = 0;
    virtual void on_report(const Report& data) = 0;

    virtual void on_warning(std::string_view what) = 0;
    virtual void on_error(std::string_view what) = 0;

    virtual void finalize() = 0;

protected:
    Sink& sink_;
    VerbosityLevel verbosity_;
};

} // namespace gradebox
