#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cstdlib>

#include "makemcp/security/env_sanitizer.hpp"

using namespace makemcp::security;

TEST_CASE("sanitize_environment strips loader and path variables", "[security][env]") {
    Environment env{
        {"HOME", "/home/dev"},
        {"LANG", "C.UTF-8"},
        {"PATH", "/usr/bin:/bin"},
        {"PATHEXT", ".EXE"},
        {"LD_PRELOAD", "/tmp/evil.so"},
        {"LD_LIBRARY_PATH", "/tmp"},
        {"DYLD_INSERT_LIBRARIES", "/tmp/evil.dylib"},
        {"MY_PATH", "/opt"},
    };

    auto clean = sanitize_environment(env);

    CHECK(clean.contains("HOME"));
    CHECK(clean.contains("LANG"));
    CHECK(clean.contains("MY_PATH"));
    CHECK_FALSE(clean.contains("PATH"));
    CHECK_FALSE(clean.contains("PATHEXT"));
    CHECK_FALSE(clean.contains("LD_PRELOAD"));
    CHECK_FALSE(clean.contains("LD_LIBRARY_PATH"));
    CHECK_FALSE(clean.contains("DYLD_INSERT_LIBRARIES"));
    CHECK(clean.at("HOME") == "/home/dev");
}

TEST_CASE("sanitize_environment matches prefixes case-sensitively", "[security][env]") {
    Environment env{{"ld_preload", "x"}, {"Path", "y"}};
    auto clean = sanitize_environment(env);
    CHECK(clean.size() == 2);
}

TEST_CASE("sanitize_environment honours custom prefixes", "[security][env]") {
    Environment env{{"PATH", "/bin"}, {"SECRET_TOKEN", "t"}, {"HOME", "/root"}};

    SECTION("custom list replaces the default") {
        auto clean = sanitize_environment(env, {"SECRET_"});
        CHECK(clean.contains("PATH"));
        CHECK_FALSE(clean.contains("SECRET_TOKEN"));
    }

    SECTION("empty prefixes strip nothing") {
        auto clean = sanitize_environment(env, {""});
        CHECK(clean.size() == 3);
    }
}

TEST_CASE("current_environment reflects the process", "[security][env]") {
    ::setenv("MAKEMCP_TEST_MARKER", "a=b", 1);
    auto env = current_environment();
    ::unsetenv("MAKEMCP_TEST_MARKER");

    REQUIRE(env.contains("MAKEMCP_TEST_MARKER"));
    CHECK(env.at("MAKEMCP_TEST_MARKER") == "a=b");
}

TEST_CASE("to_envp renders KEY=VALUE", "[security][env]") {
    auto envp = to_envp({{"A", "1"}, {"B", ""}});
    REQUIRE(envp.size() == 2);
    CHECK(std::ranges::find(envp, "A=1") != envp.end());
    CHECK(std::ranges::find(envp, "B=") != envp.end());
}
