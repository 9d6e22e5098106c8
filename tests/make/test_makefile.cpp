#include <catch2/catch_test_macros.hpp>

#include <filesystem>

#include "makemcp/make/makefile.hpp"
#include "test_support.hpp"

using namespace makemcp::make;
using makemcp::ErrorCode;
using makemcp::testing::TempDir;
namespace fs = std::filesystem;

TEST_CASE("locate_makefile finds the directory's Makefile", "[make][makefile]") {
    TempDir dir("locate");

    SECTION("present") {
        dir.write_makefile("all:\n");
        auto path = locate_makefile(dir.path());
        REQUIRE(path.has_value());
        CHECK(*path == fs::canonical(dir.path()) / "Makefile");
    }

    SECTION("absent") {
        auto path = locate_makefile(dir.path());
        REQUIRE_FALSE(path.has_value());
        CHECK(path.error().code() == ErrorCode::MakefileNotFound);
        CHECK(path.error().message() == "No Makefile found in directory");
    }

    SECTION("lowercase makefile is not picked up") {
        dir.write("makefile", "all:\n");
        auto path = locate_makefile(dir.path());
        // Case-insensitive filesystems may still resolve it.
        if (!fs::exists(dir.path() / "Makefile")) {
            REQUIRE_FALSE(path.has_value());
            CHECK(path.error().code() == ErrorCode::MakefileNotFound);
        }
    }

    SECTION("Makefile that is a directory") {
        fs::create_directories(dir.path() / "Makefile");
        auto path = locate_makefile(dir.path());
        REQUIRE_FALSE(path.has_value());
        CHECK(path.error().code() == ErrorCode::MakefileNotFound);
    }

    SECTION("directory that does not exist") {
        auto path = locate_makefile(dir.path() / "missing");
        REQUIRE_FALSE(path.has_value());
        CHECK(path.error().code() == ErrorCode::SecurityViolation);
    }
}

TEST_CASE("locate_makefile rejects a Makefile symlinked outside", "[make][makefile]") {
    TempDir dir("locate_link");
    TempDir outside("locate_link_target");
    auto real = outside.write_makefile("secret:\n");
    fs::create_symlink(real, dir.path() / "Makefile");

    auto path = locate_makefile(dir.path());
    REQUIRE_FALSE(path.has_value());
    CHECK(path.error().code() == ErrorCode::SecurityViolation);
}

TEST_CASE("read_makefile returns raw content", "[make][makefile]") {
    TempDir dir("read");
    const std::string content = "build: ## Build\n\tcc main.c\r\n";
    auto path = dir.write_makefile(content);

    auto text = read_makefile(path);
    REQUIRE(text.has_value());
    CHECK(*text == content);

    SECTION("missing file") {
        auto missing = read_makefile(dir.path() / "nope");
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code() == ErrorCode::MakefileNotFound);
    }

    SECTION("directory") {
        auto not_file = read_makefile(dir.path());
        REQUIRE_FALSE(not_file.has_value());
        CHECK(not_file.error().code() == ErrorCode::MakefileReadFailure);
    }
}

TEST_CASE("validate_makefile_syntax", "[make][makefile]") {
    SECTION("ordinary Makefile") {
        CHECK(validate_makefile_syntax(".PHONY: all\nall:\n\t@echo hi\n").has_value());
    }

    SECTION("dotted line with a colon") {
        CHECK(validate_makefile_syntax(".DEFAULT_GOAL := all\n").has_value());
    }

    SECTION("blank content") {
        auto result = validate_makefile_syntax(" \n\t\n");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::InvalidMakefile);
        CHECK(result.error().message() == "Empty Makefile");
    }

    SECTION("dotted line without a colon") {
        auto result = validate_makefile_syntax("all:\n.ONESHELL\n");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::InvalidMakefile);
        CHECK(result.error().message() == "Invalid directive on line 2");
    }
}
