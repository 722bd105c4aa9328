#include "sandbox/privilege_separator.hpp"

#include <gradebox/common/linux.hpp>
#include <gradebox/exceptions.hpp>
#include <gradebox/logging.hpp>

#include "sandbox/restricted_identity.hpp"
#include "subprocess/subprocess.hpp"

#include <fmt/format.h>

#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

namespace gradebox {

namespace fs = std::filesystem;

namespace {

constexpr auto GRADE_ROOT_PERMS = static_cast<fs::perms>(0711);
constexpr auto RESULTS_DIR_PERMS = fs::perms::owner_all;
constexpr auto SCRATCH_DIR_PERMS = fs::perms::owner_all;

constexpr std::chrono::seconds SETFACL_TIMEOUT{60};

void set_permissions(const fs::path& path, fs::perms perms, fs::perm_options opts = fs::perm_options::replace) {
    std::error_code err;
    fs::permissions(path, perms, opts, err);

    if (err) {
        throw PermissionSetupError(fmt::format("could not change permissions of {:?}: {}", path.string(),
                                               err.message()));
    }
}

void give_to(const fs::path& path, const RestrictedIdentity& identity) {
    if (auto res = linux::lchown(path.string(), identity.uid, identity.gid); !res) {
        throw PermissionSetupError(fmt::format("could not give {:?} to {:?}: {}", path.string(), identity.name,
                                               res.error().message()));
    }
}

} // namespace

PrivilegeSeparator::PrivilegeSeparator(std::string user_name, SandboxLayout layout)
    : user_name_{std::move(user_name)}
    , layout_{std::move(layout)} {}

RestrictedIdentity PrivilegeSeparator::apply() const {
    auto identity = resolve_restricted_identity(user_name_);

    if (!identity) {
        throw PermissionSetupError(identity.error());
    }

    require_privileges();

    hand_over_submission(*identity);
    grant_fixture_access(*identity);
    prepare_scratch(*identity);

    // Last, so that nothing above depends on being able to list the grade root
    lock_down_grade_root();

    LOG_INFO("Submission code will run as {:?} (uid {}, gid {})", identity->name, identity->uid, identity->gid);

    return *identity;
}

void PrivilegeSeparator::require_privileges() {
    if (uid_t euid = linux::geteuid(); euid != 0) {
        throw PermissionSetupError(
            fmt::format("switching to the restricted identity requires root (effective uid is {})", euid));
    }
}

void PrivilegeSeparator::hand_over_submission(const RestrictedIdentity& identity) const {
    const fs::path& dir = layout_.submission_dir;

    std::error_code err;

    if (!fs::is_directory(dir, err)) {
        throw PermissionSetupError(fmt::format("submission directory {:?} does not exist", dir.string()));
    }

    give_to(dir, identity);
    set_permissions(dir, fs::perms::owner_all, fs::perm_options::add);

    // Symlinks are re-owned but never followed
    for (auto iter = fs::recursive_directory_iterator{dir, err}; !err && iter != fs::recursive_directory_iterator{};
         iter.increment(err)) {
        const fs::directory_entry& entry = *iter;

        std::error_code entry_err;

        give_to(entry.path(), identity);

        if (entry.is_symlink(entry_err)) {
            continue;
        }

        if (entry.is_directory(entry_err)) {
            set_permissions(entry.path(), fs::perms::owner_all, fs::perm_options::add);
        } else {
            set_permissions(entry.path(), fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::add);
        }
    }

    if (err) {
        throw PermissionSetupError(fmt::format("could not walk submission directory {:?}: {}", dir.string(),
                                               err.message()));
    }

    LOG_DEBUG("Submission {:?} now owned by {:?}", dir.string(), identity.name);
}

void PrivilegeSeparator::grant_fixture_access(const RestrictedIdentity& identity) const {
    for (const fs::path& dir : layout_.fixture_dirs) {
        std::error_code err;

        if (!fs::is_directory(dir, err)) {
            LOG_DEBUG("Fixture directory {:?} does not exist; nothing to grant", dir.string());
            continue;
        }

        SpawnRequest request{.argv = {"setfacl", "-R", "-m", fmt::format("u:{}:rX", identity.uid), dir.string()},
                             .timeout = SETFACL_TIMEOUT};

        auto run = run_subprocess(std::move(request));

        if (!run) {
            throw PermissionSetupError(fmt::format("could not run setfacl on {:?}: {}", dir.string(), run.error()));
        }

        if (!run->result.exited_with(0)) {
            throw PermissionSetupError(fmt::format("setfacl on {:?} {}: {}", dir.string(), run->result,
                                                   run->stderr_text));
        }

        LOG_DEBUG("Granted {:?} read access to {:?}", identity.name, dir.string());
    }
}

void PrivilegeSeparator::prepare_scratch(const RestrictedIdentity& identity) const {
    if (layout_.scratch_dir.empty()) {
        return;
    }

    std::error_code err;
    fs::create_directories(layout_.scratch_dir, err);

    if (err) {
        throw PermissionSetupError(fmt::format("could not create scratch directory {:?}: {}",
                                               layout_.scratch_dir.string(), err.message()));
    }

    give_to(layout_.scratch_dir, identity);
    set_permissions(layout_.scratch_dir, SCRATCH_DIR_PERMS);
}

void PrivilegeSeparator::lock_down_grade_root() const {
    std::error_code err;

    if (!layout_.results_dir.empty()) {
        fs::create_directories(layout_.results_dir, err);

        if (err) {
            throw PermissionSetupError(fmt::format("could not create results directory {:?}: {}",
                                                   layout_.results_dir.string(), err.message()));
        }

        set_permissions(layout_.results_dir, RESULTS_DIR_PERMS);
    }

    if (!layout_.grade_root.empty() && fs::is_directory(layout_.grade_root, err)) {
        set_permissions(layout_.grade_root, GRADE_ROOT_PERMS);
    }
}

} // namespace gradebox
