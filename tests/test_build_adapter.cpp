#include "catch2_custom.hpp"

#include <gradebox/exceptions.hpp>
#include <gradebox/model/build_result.hpp>
#include <gradebox/model/language_profile.hpp>

#include "build/build_adapter.hpp"
#include "sandbox/sandboxed_executor.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

using namespace gradebox;
using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;

namespace fs = std::filesystem;

namespace {

const SandboxedExecutor unsandboxed{std::nullopt, ResourceLimits{}};

LanguageProfile compiled_with(std::vector<std::string> command, std::string output = "prog") {
    LanguageProfile profile;
    profile.kind = LanguageKind::Compiled;
    profile.command = std::move(command);
    profile.output = std::move(output);
    profile.build_timeout = 5s;
    return profile;
}

} // namespace

TEST_CASE("Interpreted submissions need no build") {
    TempDir submission{"gradebox-build"};
    BuildAdapter builder{unsandboxed, 4096};

    BuildResult result = builder.build(submission.path(), LanguageProfile{});

    REQUIRE(result.succeeded());
    REQUIRE(result.get_artifact() == submission.path());
}

TEST_CASE("Compiler invocation from the language profile") {
    TempDir submission{"gradebox-build"};
    submission.write_file("main.c", "int main(void) { return 0; }\n");
    submission.write_file("lib/helper.c", "int helper(void) { return 1; }\n");
    submission.write_file("lib/helper.h", "int helper(void);\n");
    submission.write_file("README.md", "notes\n");

    LanguageProfile profile;
    profile.kind = LanguageKind::Compiled;
    profile.compiler = "gcc";
    profile.target = TargetArch::Bits32;
    profile.flags = {"-Wall"};
    profile.source_extensions = {".c"};
    profile.output = "prog";

    REQUIRE(BuildAdapter::make_build_command(submission.path(), profile) ==
            std::vector<std::string>{"gcc", "-m32", "-Wall", "lib/helper.c", "main.c", "-o", "prog"});

    profile.command = {"make", "all"};
    REQUIRE(BuildAdapter::make_build_command(submission.path(), profile) == std::vector<std::string>{"make", "all"});

    SECTION("Nothing to compile") {
        TempDir empty{"gradebox-build"};
        profile.command.clear();

        REQUIRE_THROWS_AS(BuildAdapter::make_build_command(empty.path(), profile), BuildError);
    }
}

TEST_CASE("A successful build produces the artifact") {
    TempDir submission{"gradebox-build"};
    BuildAdapter builder{unsandboxed, 4096};

    BuildResult result = builder.build(
        submission.path(),
        compiled_with({"/bin/sh", "-c", "echo compiling; printf '#!/bin/sh\\necho hi\\n' > prog; chmod +x prog"}));

    REQUIRE(result.succeeded());
    REQUIRE(result.get_artifact() == submission.path() / "prog");
    REQUIRE(result.get_diagnostics() == "compiling\n");
    REQUIRE(fs::exists(submission.path() / "prog"));
}

TEST_CASE("Build failures carry the toolchain diagnostics") {
    TempDir submission{"gradebox-build"};
    BuildAdapter builder{unsandboxed, 4096};

    SECTION("Non-zero exit") {
        BuildResult result = builder.build(
            submission.path(), compiled_with({"/bin/sh", "-c", "echo \"main.c:3: error: expected ';'\" >&2; exit 1"}));

        REQUIRE_FALSE(result.succeeded());
        REQUIRE(result.get_status() == BuildResult::Status::Failure);
        REQUIRE_THAT(result.get_diagnostics(), ContainsSubstring("exited with code 1"));
        REQUIRE_THAT(result.get_diagnostics(), ContainsSubstring("main.c:3: error: expected ';'"));
    }

    SECTION("No artifact") {
        BuildResult result = builder.build(submission.path(), compiled_with({"/bin/true"}));

        REQUIRE_FALSE(result.succeeded());
        REQUIRE_THAT(result.get_diagnostics(), ContainsSubstring("did not produce \"prog\""));
    }

    SECTION("Missing toolchain") {
        BuildResult result = builder.build(submission.path(), compiled_with({"no-such-compiler-gradebox"}));

        REQUIRE_FALSE(result.succeeded());
        REQUIRE_THAT(result.get_diagnostics(), ContainsSubstring("could not run the build command"));
    }

    SECTION("Timeout") {
        LanguageProfile profile = compiled_with({"/bin/sh", "-c", "sleep 30"});
        profile.build_timeout = 200ms;

        BuildResult result = builder.build(submission.path(), profile);

        REQUIRE_FALSE(result.succeeded());
        REQUIRE_THAT(result.get_diagnostics(), ContainsSubstring("build timed out"));
    }
}
