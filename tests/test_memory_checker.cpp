#include "catch2_custom.hpp"

#include <gradebox/model/language_profile.hpp>

#include "runner/memory_checker.hpp"
#include "subprocess/run_result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

using namespace gradebox;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

namespace {

constexpr const char* CLEAN_LOG = R"(==1234== Memcheck, a memory error detector
==1234== HEAP SUMMARY:
==1234==     in use at exit: 0 bytes in 0 blocks
==1234== All heap blocks were freed -- no leaks are possible
==1234== ERROR SUMMARY: 0 errors from 0 contexts (suppressed: 0 from 0)
)";

constexpr const char* LEAKY_LOG = R"(==99== Memcheck, a memory error detector
==99== 40 bytes in 1 blocks are definitely lost in loss record 1 of 1
==99==    at 0x483B7F3: malloc (vg_replace_malloc.c:307)
==99==    by 0x109146: main (leak.c:4)
==99== ERROR SUMMARY: 1,204 errors from 1 contexts (suppressed: 0 from 0)
)";

} // namespace

TEST_CASE("Parse memcheck error summaries") {
    REQUIRE(MemoryChecker::parse_error_summary(CLEAN_LOG) == 0);
    REQUIRE(MemoryChecker::parse_error_summary(LEAKY_LOG) == 1204);

    REQUIRE_FALSE(MemoryChecker::parse_error_summary("no summary here").has_value());
    REQUIRE_FALSE(MemoryChecker::parse_error_summary("ERROR SUMMARY: lots").has_value());

    // The last summary wins
    REQUIRE(MemoryChecker::parse_error_summary("ERROR SUMMARY: 3 errors\nERROR SUMMARY: 0 errors\n") == 0);
}

TEST_CASE("Invocations are wrapped in the checker") {
    TempDir scratch{"gradebox-memcheck"};
    const auto scratch_dir = scratch.path() / "logs";

    MemoryCheckConfig config{.enabled = true, .tool = "valgrind", .tool_args = {"-q"}, .error_exit_code = 77};
    MemoryChecker checker{config, scratch_dir};

    MemoryChecker::Invocation first = checker.wrap({"./a.out", "input.txt"}, "reads input/file");
    MemoryChecker::Invocation second = checker.wrap({"./a.out"}, "reads input/file");

    REQUIRE(first.log_file == scratch_dir / "memcheck-0-reads_input_file.log");
    REQUIRE(first.argv ==
            std::vector<std::string>{"valgrind", "-q",
                                     "--log-file=" + (scratch_dir / "memcheck-0-reads_input_file.log").string(),
                                     "--error-exitcode=77", "./a.out", "input.txt"});

    // Same test name, distinct log files
    REQUIRE(second.log_file != first.log_file);

    // Created on demand
    REQUIRE(std::filesystem::is_directory(scratch_dir));
}

TEST_CASE("Wrapping fails if the scratch directory cannot exist") {
    TempDir scratch{"gradebox-memcheck"};
    auto blocker = scratch.write_file("not-a-directory", "");

    MemoryChecker checker{MemoryCheckConfig{.enabled = true}, blocker / "logs"};

    REQUIRE_THROWS_AS(checker.wrap({"./a.out"}, "any"), std::filesystem::filesystem_error);
}

TEST_CASE("Violations come from the sentinel exit code or the error summary") {
    TempDir scratch{"gradebox-memcheck"};
    MemoryChecker checker{MemoryCheckConfig{.enabled = true, .error_exit_code = 99}, scratch.path()};

    CapturedRun clean_exit{.result = RunResult::make_exited(0)};
    CapturedRun sentinel_exit{.result = RunResult::make_exited(99)};

    SECTION("Clean log, clean exit") {
        auto log = scratch.write_file("clean.log", CLEAN_LOG);

        REQUIRE_FALSE(checker.collect_violation(clean_exit, log, 4096).has_value());
        REQUIRE_FALSE(std::filesystem::exists(log));
    }

    SECTION("Errors in the summary") {
        auto log = scratch.write_file("leaky.log", LEAKY_LOG);

        auto violation = checker.collect_violation(clean_exit, log, 4096);

        REQUIRE(violation.has_value());
        REQUIRE_THAT(*violation, StartsWith("Memory errors detected (1204 reported by valgrind):\n"));
        REQUIRE_THAT(*violation, ContainsSubstring("definitely lost"));
        REQUIRE_FALSE(std::filesystem::exists(log));
    }

    SECTION("Sentinel exit without a log") {
        auto violation = checker.collect_violation(sentinel_exit, scratch.path() / "missing.log", 4096);

        REQUIRE(violation.has_value());
        REQUIRE_THAT(*violation, StartsWith("Memory errors detected"));
    }

    SECTION("Long reports keep their tail") {
        auto log = scratch.write_file("long.log", LEAKY_LOG);

        auto violation = checker.collect_violation(clean_exit, log, 30);

        REQUIRE(violation.has_value());
        REQUIRE_THAT(*violation, ContainsSubstring("\n...\n"));
        REQUIRE_THAT(*violation, ContainsSubstring("(suppressed: 0 from 0)"));
    }
}

TEST_CASE("Memory checker logs swapped by the submission are never read") {
    TempDir scratch{"gradebox-memcheck"};
    MemoryChecker checker{MemoryCheckConfig{.enabled = true, .error_exit_code = 99}, scratch.path()};

    CapturedRun sentinel_exit{.result = RunResult::make_exited(99)};

    // Stands in for a file only the harness may read
    auto secret = scratch.write_file("harness-only.txt", "root:$6$do-not-leak$:19000:0:99999:7:::\n");
    const auto log = scratch.path() / "memcheck-0-reads_input.log";

    SECTION("Symlink to another file") {
        std::filesystem::create_symlink(secret, log);

        auto violation = checker.collect_violation(sentinel_exit, log, 4096);

        // The sentinel exit alone still counts
        REQUIRE(violation.has_value());
        REQUIRE_THAT(*violation, !ContainsSubstring("do-not-leak"));

        REQUIRE_FALSE(std::filesystem::exists(std::filesystem::symlink_status(log)));
        REQUIRE(std::filesystem::exists(secret));
    }

    SECTION("Hard link to another file") {
        std::filesystem::create_hard_link(secret, log);

        auto violation = checker.collect_violation(sentinel_exit, log, 4096);

        REQUIRE(violation.has_value());
        REQUIRE_THAT(*violation, !ContainsSubstring("do-not-leak"));
    }

    SECTION("FIFO does not block the harness") {
        REQUIRE(::mkfifo(log.c_str(), 0600) == 0);

        auto violation = checker.collect_violation(sentinel_exit, log, 4096);

        REQUIRE(violation.has_value());
    }
}

TEST_CASE("Memory checker logs must belong to the identity that ran the checker") {
    TempDir scratch{"gradebox-memcheck"};
    auto log = scratch.write_file("leaky.log", LEAKY_LOG);

    CapturedRun clean_exit{.result = RunResult::make_exited(0)};

    SECTION("Owned by someone else") {
        MemoryChecker checker{MemoryCheckConfig{.enabled = true, .error_exit_code = 99}, scratch.path(),
                              ::geteuid() + 1};

        REQUIRE_FALSE(checker.collect_violation(clean_exit, log, 4096).has_value());
    }

    SECTION("Owned by the expected identity") {
        MemoryChecker checker{MemoryCheckConfig{.enabled = true, .error_exit_code = 99}, scratch.path(),
                              ::geteuid()};

        auto violation = checker.collect_violation(clean_exit, log, 4096);

        REQUIRE(violation.has_value());
        REQUIRE_THAT(*violation, ContainsSubstring("definitely lost"));
    }
}
