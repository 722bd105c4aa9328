#pragma once

#include <gradebox/common/class_traits.hpp>

#include "app/trace_exception.hpp"
#include "user/program_options.hpp"

#include <optional>
#include <utility>

namespace gradebox {

class App : NonCopyable
{
public:
    explicit App(ProgramOptions opts)
        : OPTS{std::move(opts)} {}

    virtual ~App() = default;

    const ProgramOptions& get_opts() const noexcept { return OPTS; }

    /// Exit code of ``run_impl``, or INTERNAL_ERROR_EXIT if it threw
    int run() noexcept {
        std::optional res = wrap_throwable_fn(&App::run_impl, this);

        return res.value_or(INTERNAL_ERROR_EXIT);
    }

    const ProgramOptions OPTS;

    static constexpr int INTERNAL_ERROR_EXIT = 1;

protected:
    virtual int run_impl() = 0;
};

} // namespace gradebox
