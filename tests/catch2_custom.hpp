#pragma once

#include <gradebox/common/formatters.hpp> // IWYU pragma: keep

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <filesystem>
#include <string>
#include <string_view>

// If this is included after Catch2, then instantiations of the stringify function template will
// be choosen over ours
#if defined(CATCH_TOSTRING_HPP_INCLUDED)
#error "Include this file before Catch2"
#else
// Captured program output is full of newlines; show them escaped in failure messages
namespace Catch::Detail {

inline std::string stringify(std::string_view e) {
    return fmt::format("{:?}", e);
}

inline std::string stringify(const std::string& e) {
    return fmt::format("{:?}", e);
}

inline std::string stringify(const char* e) {
    return fmt::format("{:?}", e);
}

} // namespace Catch::Detail
#endif

#include <catch2/catch_test_macros.hpp> // IWYU pragma: export
#include <catch2/catch_tostring.hpp>
#include <catch2/matchers/catch_matchers_all.hpp> // IWYU pragma: export

namespace Catch {

// Statuses, run results and the like print through their fmt formatters.
// Inverse of Catch2's conditions as to not cause ambiguity
template <typename T>
    requires(fmt::is_formattable<T>::value && !is_range<T>::value && !Catch::Detail::IsStreamInsertable<T>::value)
struct StringMaker<T>
{
    static std::string convert(const T& t) { return fmt::format("{}", t); }
};

} // namespace Catch

/// Scratch directory under the system temp dir, removed with everything in it on destruction
class TempDir
{
public:
    explicit TempDir(std::string_view prefix);
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    /// Writes ``contents`` to ``relative`` under the directory, creating parents
    std::filesystem::path write_file(const std::filesystem::path& relative, std::string_view contents) const;

private:
    std::filesystem::path path_;
};
