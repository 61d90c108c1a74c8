#include "tools/cli/ToolCli.hpp"

#include <doctest/doctest.h>

#include <string>
#include <vector>

using RT::Tools::CLI::ToolCli;

namespace {

struct Harness {
    ToolCli                  cli;
    std::vector<std::string> errors;

    Harness() {
        cli.set_program_name("replicatrie_merge");
        cli.set_error_logger([this](std::string const& message) { errors.push_back(message); });
    }

    auto parse(std::vector<char const*> args) -> bool {
        args.insert(args.begin(), "replicatrie_merge");
        return cli.parse(static_cast<int>(args.size()), args.data());
    }
};

} // namespace

TEST_SUITE("tools.cli") {

TEST_CASE("flags values and positionals") {
    Harness     h;
    bool        report = false;
    std::string policy;
    int         indent = 2;
    h.cli.add_flag("--report", {.on_set = [&] { report = true; }});
    h.cli.add_value("--policy", {.on_value = [&](std::string_view value) -> ToolCli::ParseError {
                        policy.assign(value);
                        return std::nullopt;
                    }});
    h.cli.add_int("--indent", [&](int value) { indent = value; });

    CHECK(h.parse({"a.json", "--report", "--policy", "ordered", "--indent=-1", "b.json"}));
    CHECK(report);
    CHECK(policy == "ordered");
    CHECK(indent == -1);
    CHECK(h.cli.positionals() == std::vector<std::string>{"a.json", "b.json"});
    CHECK(h.errors.empty());
    CHECK_FALSE(h.cli.had_errors());
}

TEST_CASE("double dash ends option parsing") {
    Harness h;
    bool    report = false;
    h.cli.add_flag("--report", {.on_set = [&] { report = true; }});

    CHECK(h.parse({"--", "--report", "-"}));
    CHECK_FALSE(report);
    CHECK(h.cli.positionals() == std::vector<std::string>{"--report", "-"});
}

TEST_CASE("errors are reported with the program name") {
    Harness h;
    h.cli.add_flag("--report", {});
    h.cli.add_int("--indent", [](int) {});
    h.cli.add_value("--output", {});

    SUBCASE("unknown argument") {
        CHECK_FALSE(h.parse({"--bogus"}));
        REQUIRE(h.errors.size() == 1);
        CHECK(h.errors[0] == "replicatrie_merge: unknown argument '--bogus'");
    }
    SUBCASE("flag with a value") {
        CHECK_FALSE(h.parse({"--report=yes"}));
        CHECK(h.cli.had_errors());
    }
    SUBCASE("missing value") {
        CHECK_FALSE(h.parse({"--output"}));
        REQUIRE(h.errors.size() == 1);
        CHECK(h.errors[0] == "replicatrie_merge: --output requires a value");
    }
    SUBCASE("non numeric int") {
        CHECK_FALSE(h.parse({"--indent", "wide"}));
        REQUIRE(h.errors.size() == 1);
        CHECK(h.errors[0] == "replicatrie_merge: --indent expects a numeric value");
    }
}

TEST_CASE("value handler errors fail the parse") {
    Harness h;
    h.cli.add_value("--policy", {.on_value = [](std::string_view) -> ToolCli::ParseError {
                        return std::string{"--policy: unknown"};
                    }});
    CHECK_FALSE(h.parse({"--policy", "nope"}));
    REQUIRE(h.errors.size() == 1);
    CHECK(h.errors[0] == "replicatrie_merge: --policy: unknown");
}

} // TEST_SUITE
