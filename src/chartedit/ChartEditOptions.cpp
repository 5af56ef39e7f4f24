#include <chartedit/ChartEditOptions.hpp>

#include "cli/CommandLine.hpp"

#include <array>
#include <charconv>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

namespace CE {

namespace {

constexpr std::array<std::string_view, 4> kCommands{"describe", "customize", "display", "seed"};

constexpr int kMaxIndent = 16;

bool parse_integer_in_range(std::string_view text, int min, int max, int& out) {
    int value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

} // namespace

bool IsValidChartEditCommand(std::string_view command) {
    for (auto candidate : kCommands) {
        if (candidate == command) {
            return true;
        }
    }
    return false;
}

bool IsValidStoreBackend(std::string_view backend) {
    return backend == "memory" || backend == "file";
}

auto ValidateChartEditOptions(ChartEditOptions const& options) -> std::optional<std::string> {
    if (options.command.empty()) {
        return std::string{"a command is required (describe, customize, display, seed)"};
    }
    if (!IsValidChartEditCommand(options.command)) {
        return std::string{"Unsupported command: " + options.command};
    }
    if (options.payload_id.empty()) {
        return std::string{"--id must not be empty"};
    }
    if (!IsValidStoreBackend(options.store_backend)) {
        return std::string{"Unsupported store backend: " + options.store_backend};
    }
    if (options.store_backend == "file" && options.store_root.empty()) {
        return std::string{"File store requires a non-empty --store-root"};
    }
    if (options.pretty_indent < -1 || options.pretty_indent > kMaxIndent) {
        return std::string{"--indent must be within -1-16"};
    }
    return std::nullopt;
}

bool ApplyChartEditEnvOverrides(ChartEditOptions& options) {
    if (!apply_env("CHARTEDIT_STORE", [&](std::string_view value) {
            if (!IsValidStoreBackend(value)) {
                std::cerr << "CHARTEDIT_STORE must be 'memory' or 'file'\n";
                return false;
            }
            options.store_backend = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("CHARTEDIT_STORE_ROOT", [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << "CHARTEDIT_STORE_ROOT must not be empty\n";
                return false;
            }
            options.store_root = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("CHARTEDIT_INDENT", [&](std::string_view value) {
            int parsed = options.pretty_indent;
            if (!parse_integer_in_range(value, -1, kMaxIndent, parsed)) {
                std::cerr << "CHARTEDIT_INDENT must be within -1-16\n";
                return false;
            }
            options.pretty_indent = parsed;
            return true;
        })) {
        return false;
    }

    return true;
}

void PrintChartEditUsage() {
    std::cout << "Usage: chartedit_cli <describe|customize|display|seed> --id <payload-id> [options]\n"
              << "Options:\n"
              << "  --id <id>              Saved payload identifier\n"
              << "  --updates <text>       JSON updates or key=value lines (customize)\n"
              << "  --instructions <text>  Plain-language styling instructions (customize)\n"
              << "  --actor <name>         Name recorded in the payload history\n"
              << "  --store <backend>      Payload store backend: memory or file (default: file)\n"
              << "  --store-root <dir>     Directory holding <id>.json payloads (default: chart_store)\n"
              << "  --indent <n>           JSON indent for output, -1 for compact (default: 2)\n"
              << "  --help                 Show this message\n"
              << "Environment overrides: CHARTEDIT_STORE, CHARTEDIT_STORE_ROOT, CHARTEDIT_INDENT\n";
}

auto ParseChartEditArguments(int argc, char** argv) -> std::optional<ChartEditOptions> {
    ChartEditOptions options;
    if (!ApplyChartEditEnvOverrides(options)) {
        return std::nullopt;
    }

    CLI::CommandLine cli;
    cli.set_program_name("chartedit_cli");
    cli.set_positional_handler([&](std::string_view token) -> CLI::CommandLine::ParseError {
        if (!options.command.empty()) {
            return "unexpected argument '" + std::string(token) + "'";
        }
        options.command = std::string{token};
        return std::nullopt;
    });

    cli.add_flag("--help", {.on_set = [&] { options.show_help = true; }});
    cli.add_alias("-h", "--help");

    auto string_value = [](std::string& target) {
        return CLI::CommandLine::ValueOption{
            .on_value = [&target](std::string_view value) -> CLI::CommandLine::ParseError {
                target = std::string{value};
                return std::nullopt;
            }};
    };
    auto optional_value = [](std::optional<std::string>& target) {
        return CLI::CommandLine::ValueOption{
            .on_value = [&target](std::string_view value) -> CLI::CommandLine::ParseError {
                target = std::string{value};
                return std::nullopt;
            },
            .allow_leading_dash_value = true};
    };

    cli.add_value("--id", string_value(options.payload_id));
    cli.add_value("--updates", optional_value(options.updates));
    cli.add_value("--instructions", optional_value(options.instructions));
    cli.add_value("--actor", string_value(options.actor));
    cli.add_value("--store", {.on_value = [&](std::string_view value) -> CLI::CommandLine::ParseError {
                      if (!IsValidStoreBackend(value)) {
                          return std::string{"--store must be 'memory' or 'file'"};
                      }
                      options.store_backend = std::string{value};
                      return std::nullopt;
                  }});
    cli.add_value("--store-root", string_value(options.store_root));
    cli.add_int("--indent", {.on_value = [&](int value) -> CLI::CommandLine::ParseError {
                    if (value < -1 || value > kMaxIndent) {
                        return std::string{"--indent must be within -1-16"};
                    }
                    options.pretty_indent = value;
                    return std::nullopt;
                }});

    if (!cli.parse(argc, argv)) {
        return std::nullopt;
    }
    return options;
}

} // namespace CE
