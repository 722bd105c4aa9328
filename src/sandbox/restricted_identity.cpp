#include "sandbox/restricted_identity.hpp"

#include <gradebox/common/expected.hpp>
#include <gradebox/common/linux.hpp>
#include <gradebox/logging.hpp>

#include <fmt/format.h>

#include <string>
#include <system_error>

#include <unistd.h>

namespace gradebox {

Expected<RestrictedIdentity, std::string> resolve_restricted_identity(const std::string& user_name) {
    auto entry = linux::getpwnam(user_name);

    if (!entry) {
        if (entry.error() == std::errc::no_such_file_or_directory) {
            return fmt::format("restricted user {:?} does not exist", user_name);
        }
        return fmt::format("failed to look up restricted user {:?}: {}", user_name, entry.error().message());
    }

    RestrictedIdentity identity{.name = entry->name, .uid = entry->uid, .gid = entry->gid};

    if (identity.is_root()) {
        return fmt::format("restricted user {:?} must not be root", user_name);
    }

    if (identity.uid == ::getuid() || identity.uid == linux::geteuid()) {
        return fmt::format("restricted user {:?} (uid {}) is the user running the harness", user_name, identity.uid);
    }

    LOG_DEBUG("Resolved restricted identity {:?}: uid={} gid={}", identity.name, identity.uid, identity.gid);

    return identity;
}

} // namespace gradebox
