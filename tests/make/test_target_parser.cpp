#include <catch2/catch_test_macros.hpp>

#include "makemcp/make/target_parser.hpp"

using namespace makemcp::make;

TEST_CASE("is_valid_target_name", "[make][parser]") {
    SECTION("accepted names") {
        CHECK(is_valid_target_name("build"));
        CHECK(is_valid_target_name("test-target"));
        CHECK(is_valid_target_name("deploy_prod"));
        CHECK(is_valid_target_name("1st-step"));
        CHECK(is_valid_target_name("X"));
    }

    SECTION("rejected names") {
        CHECK_FALSE(is_valid_target_name(""));
        CHECK_FALSE(is_valid_target_name("-f"));
        CHECK_FALSE(is_valid_target_name("_hidden"));
        CHECK_FALSE(is_valid_target_name(".PHONY"));
        CHECK_FALSE(is_valid_target_name("%.o"));
        CHECK_FALSE(is_valid_target_name("a.b"));
        CHECK_FALSE(is_valid_target_name("foo bar"));
        CHECK_FALSE(is_valid_target_name("CC=gcc"));
        CHECK_FALSE(is_valid_target_name("build;rm"));
        CHECK_FALSE(is_valid_target_name("caf\xc3\xa9"));
    }
}

TEST_CASE("parse_targets reads inline descriptions", "[make][parser]") {
    auto targets = parse_targets("build: test ## Build the project\n");

    REQUIRE(targets.size() == 1);
    CHECK(targets[0].name == "build");
    REQUIRE(targets[0].description.has_value());
    CHECK(*targets[0].description == "Build the project");
}

TEST_CASE("parse_targets joins comment blocks", "[make][parser]") {
    auto targets = parse_targets(
        "# Compile everything\n"
        "#   and link it\n"
        "all: build\n");

    REQUIRE(targets.size() == 1);
    CHECK(targets[0].name == "all");
    CHECK(targets[0].description == "Compile everything and link it");
}

TEST_CASE("parse_targets inline description wins over comments", "[make][parser]") {
    auto targets = parse_targets(
        "# long form\n"
        "test: ## Run tests\n");

    REQUIRE(targets.size() == 1);
    CHECK(targets[0].description == "Run tests");
}

TEST_CASE("parse_targets resets comments on unrelated lines", "[make][parser]") {
    SECTION("blank line") {
        auto targets = parse_targets("# orphan\n\nclean:\n");
        REQUIRE(targets.size() == 1);
        CHECK(targets[0].name == "clean");
        CHECK_FALSE(targets[0].description.has_value());
    }

    SECTION("recipe line") {
        auto targets = parse_targets(
            "# Build it\n"
            "build:\n"
            "\t@echo building: now\n"
            "# Clean up\n"
            "clean:\n");
        REQUIRE(targets.size() == 2);
        CHECK(targets[0].name == "build");
        CHECK(targets[0].description == "Build it");
        CHECK(targets[1].name == "clean");
        CHECK(targets[1].description == "Clean up");
    }

    SECTION("comment does not carry past a target") {
        auto targets = parse_targets("# first\na:\nb:\n");
        REQUIRE(targets.size() == 2);
        CHECK(targets[0].description == "first");
        CHECK_FALSE(targets[1].description.has_value());
    }
}

TEST_CASE("parse_targets skips special targets, patterns and assignments", "[make][parser]") {
    auto targets = parse_targets(
        ".PHONY: all clean\n"
        "CC := gcc\n"
        "LD ::= ld\n"
        "AR :::= ar\n"
        "%.o: %.c\n"
        "\t$(CC) -c $<\n"
        "# Documented\n"
        "$(OUT): deps\n"
        "all: app\n");

    REQUIRE(targets.size() == 1);
    CHECK(targets[0].name == "all");
    // The dropped `$(OUT)` line still consumed the comment block.
    CHECK_FALSE(targets[0].description.has_value());
}

TEST_CASE("parse_targets handles CRLF and surrounding whitespace", "[make][parser]") {
    auto targets = parse_targets("  lint  : ## Run linters  \r\nfmt:\r\n");

    REQUIRE(targets.size() == 2);
    CHECK(targets[0].name == "lint");
    CHECK(targets[0].description == "Run linters");
    CHECK(targets[1].name == "fmt");
}

TEST_CASE("parse_targets keeps file order and never fails", "[make][parser]") {
    SECTION("empty input") {
        CHECK(parse_targets("").empty());
    }

    SECTION("garbage input") {
        CHECK(parse_targets("::::\n\t\t\n## ##\n=:=\n").empty());
    }

    SECTION("order") {
        auto targets = parse_targets("zeta:\nalpha:\nmid: alpha\n");
        REQUIRE(targets.size() == 3);
        CHECK(targets[0].name == "zeta");
        CHECK(targets[1].name == "alpha");
        CHECK(targets[2].name == "mid");
    }

    SECTION("no trailing newline") {
        auto targets = parse_targets("install: ## Install it");
        REQUIRE(targets.size() == 1);
        CHECK(targets[0].description == "Install it");
    }
}

TEST_CASE("parse_targets is idempotent", "[make][parser]") {
    const char* makefile =
        "# Build\n"
        "build: ## Build the project\n"
        "\tcc -o app main.c\n"
        "\n"
        "# Remove outputs\n"
        "clean:\n"
        "\trm -f app\n";

    CHECK(parse_targets(makefile) == parse_targets(makefile));
}

TEST_CASE("Target serializes to JSON", "[make][parser]") {
    makemcp::json with = Target{"build", "Build the project"};
    CHECK(with["name"] == "build");
    CHECK(with["description"] == "Build the project");

    makemcp::json without = Target{"clean", std::nullopt};
    CHECK(without["description"].is_null());
}
