#pragma once

#include "sandbox/restricted_identity.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace gradebox {

/// Directories whose permissions are adjusted before any submission code runs
struct SandboxLayout
{
    std::filesystem::path grade_root;
    std::filesystem::path submission_dir;

    /// The tests directory followed by any shared helper directories on the test path
    std::vector<std::filesystem::path> fixture_dirs;

    std::filesystem::path results_dir;

    /// Writable by the restricted identity (memory checker logs)
    std::filesystem::path scratch_dir;
};

/// Establishes the restricted identity and the filesystem access control around it.
///
/// After ``apply`` the identity owns the submission, can read and traverse the fixture directories,
/// can only traverse the grade root, and cannot reach the results directory. The grant is applied
/// once and never widened afterwards.
class PrivilegeSeparator
{
public:
    PrivilegeSeparator(std::string user_name, SandboxLayout layout);

    /// Throws PermissionSetupError on any failure; never falls back to running unsandboxed
    RestrictedIdentity apply() const;

    const SandboxLayout& get_layout() const { return layout_; }

private:
    static void require_privileges();

    void hand_over_submission(const RestrictedIdentity& identity) const;
    void lock_down_grade_root() const;
    void grant_fixture_access(const RestrictedIdentity& identity) const;
    void prepare_scratch(const RestrictedIdentity& identity) const;

    std::string user_name_;
    SandboxLayout layout_;
};

} // namespace gradebox
