#pragma once

#include <gradebox/common/expected.hpp>

#include "subprocess/subprocess.hpp"

#include <string>

#include <sys/types.h>

namespace gradebox {

/// The non-privileged account submission code runs as
struct RestrictedIdentity
{
    std::string name;
    uid_t uid;
    gid_t gid;

    bool is_root() const noexcept { return uid == 0; }

    ProcessIdentity as_process_identity() const noexcept { return {.uid = uid, .gid = gid}; }
};

/// Looks ``user_name`` up in the password database.
/// Fails if the user does not exist, is root, or is the identity the harness itself runs as.
Expected<RestrictedIdentity, std::string> resolve_restricted_identity(const std::string& user_name);

} // namespace gradebox
