#include <doctest/doctest.h>

#include "cli/CommandLine.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {
auto make_argv(std::initializer_list<const char*> list) {
    std::vector<char*> argv;
    argv.reserve(list.size());
    for (auto* value : list) {
        argv.push_back(const_cast<char*>(value));
    }
    return argv;
}
}

using CE::CLI::CommandLine;

TEST_SUITE("cli.command_line") {

TEST_CASE("flags, values, ints and positionals") {
    CommandLine cli;
    cli.set_program_name("command_line_test");

    bool                     help = false;
    std::string              id;
    int                      indent = 2;
    std::vector<std::string> positionals;
    cli.add_flag("--help", {.on_set = [&] { help = true; }});
    cli.add_value("--id", {.on_value = [&](std::string_view value) -> CommandLine::ParseError {
                      id = std::string{value};
                      return std::nullopt;
                  }});
    cli.add_int("--indent", {.on_value = [&](int value) -> CommandLine::ParseError {
                    indent = value;
                    return std::nullopt;
                }});
    cli.set_positional_handler([&](std::string_view token) -> CommandLine::ParseError {
        positionals.emplace_back(token);
        return std::nullopt;
    });

    auto argv = make_argv({"prog", "describe", "--id", "sales", "--indent=-1", "--help"});
    CHECK(cli.parse(static_cast<int>(argv.size()), argv.data()));
    CHECK(help);
    CHECK(id == "sales");
    CHECK(indent == -1);
    CHECK(positionals == std::vector<std::string>{"describe"});
}

TEST_CASE("aliases reach the target option") {
    CommandLine cli;
    bool        help = false;
    cli.add_flag("--help", {.on_set = [&] { help = true; }});
    cli.add_alias("-h", "--help");

    auto argv = make_argv({"prog", "-h"});
    CHECK(cli.parse(static_cast<int>(argv.size()), argv.data()));
    CHECK(help);
}

TEST_CASE("errors are reported through the logger") {
    std::vector<std::string> errors;
    CommandLine              cli;
    cli.set_program_name("chartedit_cli");
    cli.set_error_logger([&](std::string const& message) { errors.push_back(message); });
    cli.add_flag("--help", {.on_set = [] {}});
    cli.add_value("--id", {.on_value = [](std::string_view) -> CommandLine::ParseError { return std::nullopt; }});
    cli.add_int("--indent", {.on_value = [](int) -> CommandLine::ParseError { return std::nullopt; }});

    SUBCASE("unknown option") {
        auto argv = make_argv({"prog", "--bogus"});
        CHECK_FALSE(cli.parse(static_cast<int>(argv.size()), argv.data()));
        REQUIRE(errors.size() == 1);
        CHECK(errors[0] == "chartedit_cli: unknown option '--bogus'");
    }
    SUBCASE("value missing before the next option") {
        auto argv = make_argv({"prog", "--id", "--help"});
        CHECK_FALSE(cli.parse(static_cast<int>(argv.size()), argv.data()));
        CHECK(errors.front() == "chartedit_cli: --id requires a value");
    }
    SUBCASE("flag given a value") {
        auto argv = make_argv({"prog", "--help=yes"});
        CHECK_FALSE(cli.parse(static_cast<int>(argv.size()), argv.data()));
        CHECK(errors.front() == "chartedit_cli: --help does not accept a value");
    }
    SUBCASE("non-numeric int") {
        auto argv = make_argv({"prog", "--indent", "wide"});
        CHECK_FALSE(cli.parse(static_cast<int>(argv.size()), argv.data()));
        CHECK(errors.front() == "chartedit_cli: --indent expects a numeric value");
    }
    SUBCASE("positional without a handler") {
        auto argv = make_argv({"prog", "extra"});
        CHECK_FALSE(cli.parse(static_cast<int>(argv.size()), argv.data()));
        CHECK(errors.front() == "chartedit_cli: unexpected argument 'extra'");
    }
}

} // TEST_SUITE
