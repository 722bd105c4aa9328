#include "catch2_custom.hpp"

#include <gradebox/exceptions.hpp>

#include "sandbox/privilege_separator.hpp"
#include "sandbox/restricted_identity.hpp"
#include "sandbox/sandboxed_executor.hpp"
#include "subprocess/subprocess.hpp"

#include <fmt/format.h>

#include <filesystem>
#include <optional>
#include <string>

#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

using namespace gradebox;
using Catch::Matchers::ContainsSubstring;

namespace fs = std::filesystem;

namespace {

struct ::stat stat_of(const fs::path& path) {
    struct ::stat info{};
    REQUIRE(::lstat(path.c_str(), &info) == 0);
    return info;
}

mode_t mode_of(const fs::path& path) {
    return stat_of(path).st_mode & 07777;
}

} // namespace

TEST_CASE("The restricted identity must be a real, unprivileged user") {
    REQUIRE_THAT(resolve_restricted_identity("no-such-user-gradebox").error(), ContainsSubstring("does not exist"));
    REQUIRE_THAT(resolve_restricted_identity("root").error(), ContainsSubstring("must not be root"));
}

TEST_CASE("Permission setup never falls back to running unsandboxed") {
    TempDir grade{"gradebox-sandbox"};
    fs::create_directories(grade.path() / "student");

    PrivilegeSeparator separator{"no-such-user-gradebox",
                                 {.grade_root = grade.path(),
                                  .submission_dir = grade.path() / "student",
                                  .fixture_dirs = {},
                                  .results_dir = grade.path() / "results",
                                  .scratch_dir = {}}};

    REQUIRE_THROWS_AS(separator.apply(), PermissionSetupError);

    // Nothing was touched
    REQUIRE_FALSE(fs::exists(grade.path() / "results"));
}

TEST_CASE("Sandboxed children run as the restricted identity") {
    const passwd* nobody = ::getpwnam("nobody");

    if (::geteuid() != 0 || nobody == nullptr) {
        SKIP("requires root and a \"nobody\" user");
    }

    SandboxedExecutor executor{ProcessIdentity{.uid = nobody->pw_uid, .gid = nobody->pw_gid}, ResourceLimits{}};
    REQUIRE(executor.is_sandboxed());

    auto run = executor.run({.argv = {"/bin/sh", "-c", "id -u; id -g"}, .cwd = "/"});

    REQUIRE(run);
    REQUIRE(run->result.exited_with(0));
    REQUIRE(run->stdout_text == fmt::format("{}\n{}\n", nobody->pw_uid, nobody->pw_gid));
}

TEST_CASE("Applying the separation hands over the submission and locks down the rest") {
    const passwd* nobody = ::getpwnam("nobody");

    if (::geteuid() != 0 || nobody == nullptr) {
        SKIP("requires root and a \"nobody\" user");
    }

    TempDir grade{"gradebox-sandbox"};
    grade.write_file("student/main.c", "int main(void) { return 0; }\n");
    grade.write_file("student/src/util.c", "\n");
    grade.write_file("tests/00-echo/cmd", "echo hi\n");
    grade.write_file("results/previous.json", "{}\n");

    // Temporary directories may live on a filesystem without ACLs
    auto acl_check = run_subprocess({.argv = {"setfacl", "-m", fmt::format("u:{}:r", nobody->pw_uid),
                                              (grade.path() / "results" / "previous.json").string()}});
    if (!acl_check || !acl_check->result.exited_with(0)) {
        SKIP("setfacl is unavailable or ACLs are unsupported here");
    }
    REQUIRE(run_subprocess({.argv = {"setfacl", "-b", (grade.path() / "results" / "previous.json").string()}}));

    PrivilegeSeparator separator{"nobody",
                                 {.grade_root = grade.path(),
                                  .submission_dir = grade.path() / "student",
                                  .fixture_dirs = {grade.path() / "tests"},
                                  .results_dir = grade.path() / "results",
                                  .scratch_dir = grade.path() / "scratch"}};

    RestrictedIdentity identity = separator.apply();

    REQUIRE(identity.uid == nobody->pw_uid);
    REQUIRE(identity.gid == nobody->pw_gid);

    SECTION("Submission is owned by the restricted identity") {
        for (const auto& path : {grade.path() / "student", grade.path() / "student" / "src"}) {
            REQUIRE(stat_of(path).st_uid == nobody->pw_uid);
            REQUIRE((mode_of(path) & S_IRWXU) == S_IRWXU);
        }

        const auto file = grade.path() / "student" / "src" / "util.c";
        REQUIRE(stat_of(file).st_uid == nobody->pw_uid);
        REQUIRE((mode_of(file) & (S_IRUSR | S_IWUSR)) == (S_IRUSR | S_IWUSR));
    }

    SECTION("Grade root is traverse-only and results are private") {
        REQUIRE(mode_of(grade.path()) == 0711);
        REQUIRE(mode_of(grade.path() / "results") == 0700);
        REQUIRE(stat_of(grade.path() / "results").st_uid == 0);
    }

    SECTION("Scratch directory is private to the restricted identity") {
        REQUIRE(stat_of(grade.path() / "scratch").st_uid == nobody->pw_uid);
        REQUIRE(mode_of(grade.path() / "scratch") == 0700);
    }

    SECTION("Fixtures carry a read grant for the restricted identity") {
        auto acl = run_subprocess({.argv = {"getfacl", "-n", "-p", (grade.path() / "tests" / "00-echo").string()}});

        REQUIRE(acl);
        REQUIRE(acl->result.exited_with(0));
        REQUIRE_THAT(acl->stdout_text, ContainsSubstring(fmt::format("user:{}:r-x", nobody->pw_uid)));
    }

    SECTION("The restricted identity sees exactly what was granted") {
        SandboxedExecutor executor{identity.as_process_identity(), ResourceLimits{}};

        auto run = executor.run({.argv = {"/bin/sh", "-c",
                                          "cat tests/00-echo/cmd && touch student/new.o && "
                                          "if cat results/previous.json 2>/dev/null; then exit 3; fi"},
                                 .cwd = grade.path()});

        REQUIRE(run);
        INFO(run->stderr_text);
        REQUIRE(run->result.exited_with(0));
        REQUIRE(run->stdout_text == "echo hi\n");
    }
}
