#include "suite/search_path.hpp"

#include <gradebox/logging.hpp>

#include <fmt/format.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace gradebox {

namespace fs = std::filesystem;

SearchPath::SearchPath(std::vector<fs::path> dirs)
    : dirs_{std::move(dirs)} {}

SearchPath SearchPath::parse(std::string_view colon_separated) {
    std::vector<fs::path> dirs;

    while (!colon_separated.empty()) {
        auto colon_pos = colon_separated.find(':');
        std::string_view component = colon_separated.substr(0, colon_pos);

        if (!component.empty()) {
            dirs.emplace_back(component);
        }

        if (colon_pos == std::string_view::npos) {
            break;
        }

        colon_separated.remove_prefix(colon_pos + 1);
    }

    return SearchPath{std::move(dirs)};
}

std::optional<fs::path> SearchPath::resolve(const fs::path& name, const fs::path& preferred) const {
    std::error_code err;

    if (name.is_absolute()) {
        if (fs::exists(name, err)) {
            return name;
        }
        return std::nullopt;
    }

    if (!preferred.empty() && fs::exists(preferred / name, err)) {
        return preferred / name;
    }

    for (const fs::path& dir : dirs_) {
        fs::path candidate = dir / name;

        if (fs::exists(candidate, err)) {
            return candidate;
        }
    }

    LOG_DEBUG("{:?} not found in {:?} or search path {}", name.string(), preferred.string(), to_string());

    return std::nullopt;
}

std::string SearchPath::to_string() const {
    std::string result;

    for (const fs::path& dir : dirs_) {
        if (!result.empty()) {
            result += ':';
        }
        result += dir.string();
    }

    return result;
}

} // namespace gradebox
