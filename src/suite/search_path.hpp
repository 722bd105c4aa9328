#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gradebox {

/// Ordered list of directories instructor fixtures and shared course helpers are looked up in
class SearchPath
{
public:
    SearchPath() = default;

    explicit SearchPath(std::vector<std::filesystem::path> dirs);

    /// Colon-separated, like PATH. Empty components are ignored
    static SearchPath parse(std::string_view colon_separated);

    /// First existing match for ``name``. Absolute paths are only checked for existence.
    /// ``preferred`` is tried before the search path (typically the directory of the manifest
    /// that referenced the file).
    std::optional<std::filesystem::path> resolve(const std::filesystem::path& name,
                                                 const std::filesystem::path& preferred = {}) const;

    const std::vector<std::filesystem::path>& get_dirs() const { return dirs_; }

    /// Colon-separated form, suitable for PYTHONPATH-style variables
    std::string to_string() const;

private:
    std::vector<std::filesystem::path> dirs_;
};

} // namespace gradebox
