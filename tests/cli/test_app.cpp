#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

#include "makemcp/cli/app.hpp"
#include "test_support.hpp"

using namespace makemcp::cli;
using makemcp::testing::TempDir;
namespace fs = std::filesystem;

namespace {

// Runs the CLI the way main() does.
auto run_app(std::vector<std::string> args) -> int {
    args.insert(args.begin(), "makemcp");
    std::vector<char*> argv;
    for (auto& arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);

    App app;
    return app.run(static_cast<int>(args.size()), argv.data());
}

auto quiet_options() -> GlobalOptions {
    GlobalOptions options;
    options.log_level = "off";
    return options;
}

} // anonymous namespace

TEST_CASE("resolve_config layers command-line options", "[cli][config]") {
    SECTION("defaults") {
        auto config = resolve_config(quiet_options());
        REQUIRE(config.has_value());
        CHECK(config->log_level == "off");
        CHECK(config->execution.make_program == "make");
        CHECK(config->execution.max_timeout_seconds == makemcp::kMaxTimeoutSeconds);
    }

    SECTION("makefile directory and program") {
        auto options = quiet_options();
        options.makefile_dir = "/srv/project";
        options.make_program = "gmake";
        options.timeout_ceiling = 30;

        auto config = resolve_config(options);
        REQUIRE(config.has_value());
        CHECK(config->makefile_dir == "/srv/project");
        CHECK(config->execution.make_program == "gmake");
        CHECK(config->execution.max_timeout_seconds == 30);
        CHECK(config->execution.default_timeout_seconds == 30);
    }

    SECTION("--make-path selects the Makefile's directory") {
        TempDir dir("cli_make_path");
        auto makefile = dir.write_makefile("all:\n");

        auto options = quiet_options();
        options.make_path = makefile.string();
        auto config = resolve_config(options);
        REQUIRE(config.has_value());
        REQUIRE(config->makefile_dir.has_value());
        CHECK(fs::path(*config->makefile_dir) == fs::absolute(dir.path()));
    }

    SECTION("--make-path must name a Makefile") {
        TempDir dir("cli_make_path_bad");
        auto other = dir.write("build.mk", "all:\n");

        auto options = quiet_options();
        options.make_path = other.string();
        auto config = resolve_config(options);
        REQUIRE_FALSE(config.has_value());
        CHECK(config.error().code() == makemcp::ErrorCode::InvalidConfig);
    }
}

TEST_CASE("resolve_config precedence", "[cli][config]") {
    TempDir dir("cli_precedence");
    auto file = dir.write("makemcp.json", R"({
        "makefile_dir": "/from/file",
        "execution": {"make_program": "file-make", "default_timeout_seconds": 42}
    })");

    auto options = quiet_options();
    options.config_path = file.string();

    SECTION("file values apply") {
        auto config = resolve_config(options);
        REQUIRE(config.has_value());
        CHECK(config->makefile_dir == "/from/file");
        CHECK(config->execution.make_program == "file-make");
        CHECK(config->execution.default_timeout_seconds == 42);
    }

    SECTION("environment beats the file") {
        ::setenv("MAKEMCP_MAKE_PROGRAM", "env-make", 1);
        auto config = resolve_config(options);
        ::unsetenv("MAKEMCP_MAKE_PROGRAM");
        REQUIRE(config.has_value());
        CHECK(config->execution.make_program == "env-make");
    }

    SECTION("command line beats the environment") {
        ::setenv("MAKEMCP_MAKE_PROGRAM", "env-make", 1);
        options.make_program = "cli-make";
        options.makefile_dir = "/from/cli";
        auto config = resolve_config(options);
        ::unsetenv("MAKEMCP_MAKE_PROGRAM");
        REQUIRE(config.has_value());
        CHECK(config->execution.make_program == "cli-make");
        CHECK(config->makefile_dir == "/from/cli");
    }
}

TEST_CASE("App exit codes", "[cli][app]") {
    TempDir dir("cli_app");

    SECTION("subcommand is required") {
        CHECK(run_app({"--log-level", "off"}) != 0);
    }

    SECTION("unknown option") {
        CHECK(run_app({"--no-such-flag", "targets"}) != 0);
    }

    SECTION("targets without a Makefile fails") {
        CHECK(run_app({"--log-level", "off", "-C", dir.path().string(), "targets"}) == 1);
    }

    SECTION("targets with a Makefile succeeds") {
        dir.write_makefile("build: ## Build\n");
        CHECK(run_app({"--log-level", "off", "-C", dir.path().string(), "targets"}) == 0);
    }

    SECTION("targets with an invalid pattern fails") {
        dir.write_makefile("build: ## Build\n");
        CHECK(run_app({"--log-level", "off", "-C", dir.path().string(),
                       "targets", "--pattern", "("}) == 1);
    }

    SECTION("run rejects an invalid target name") {
        dir.write_makefile("build:\n");
        CHECK(run_app({"--log-level", "off", "-C", dir.path().string(), "run", "-f"}) != 0);
        CHECK(run_app({"--log-level", "off", "-C", dir.path().string(), "run", "a;b"}) == 1);
    }

    SECTION("--make-path and --makefile-dir are exclusive") {
        auto makefile = dir.write_makefile("build:\n");
        CHECK(run_app({"--make-path", makefile.string(), "-C", dir.path().string(), "targets"}) != 0);
    }
}
