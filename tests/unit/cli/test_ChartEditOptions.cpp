#include <doctest/doctest.h>

#include <chartedit/ChartEditOptions.hpp>

#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

using namespace CE;

namespace {

auto make_argv(std::initializer_list<const char*> list) {
    std::vector<char*> argv;
    argv.reserve(list.size());
    for (auto* value : list) {
        argv.push_back(const_cast<char*>(value));
    }
    return argv;
}

class ScopedEnv {
public:
    ScopedEnv(char const* key, char const* value) : key_(key) {
        if (char const* existing = std::getenv(key)) {
            original_ = existing;
        }
        if (value) {
            setenv(key, value, 1);
        } else {
            unsetenv(key);
        }
    }
    ~ScopedEnv() {
        if (original_) {
            setenv(key_, original_->c_str(), 1);
        } else {
            unsetenv(key_);
        }
    }

private:
    char const*                key_;
    std::optional<std::string> original_;
};

struct CleanEnv {
    ScopedEnv store{"CHARTEDIT_STORE", nullptr};
    ScopedEnv root{"CHARTEDIT_STORE_ROOT", nullptr};
    ScopedEnv indent{"CHARTEDIT_INDENT", nullptr};
};

} // namespace

TEST_SUITE("cli.options") {

TEST_CASE("defaults") {
    ChartEditOptions options;
    CHECK(options.store_backend == "file");
    CHECK(options.store_root == "chart_store");
    CHECK(options.pretty_indent == 2);
    CHECK_FALSE(options.updates.has_value());
    CHECK_FALSE(options.show_help);
}

TEST_CASE("arguments fill the options") {
    CleanEnv env;
    auto     argv = make_argv({"chartedit_cli",
                               "customize",
                               "--id",
                               "sales",
                               "--updates",
                               "{\"legend.enabled\": false}",
                               "--instructions=Make series 1 red",
                               "--store",
                               "memory",
                               "--indent",
                               "4",
                               "--actor",
                               "ops"});
    auto     options = ParseChartEditArguments(static_cast<int>(argv.size()), argv.data());
    REQUIRE(options.has_value());
    CHECK(options->command == "customize");
    CHECK(options->payload_id == "sales");
    CHECK(options->updates == std::optional<std::string>{"{\"legend.enabled\": false}"});
    CHECK(options->instructions == std::optional<std::string>{"Make series 1 red"});
    CHECK(options->store_backend == "memory");
    CHECK(options->pretty_indent == 4);
    CHECK(options->actor == "ops");
    CHECK_FALSE(ValidateChartEditOptions(*options).has_value());
}

TEST_CASE("bad arguments fail to parse") {
    CleanEnv env;
    auto     badStore = make_argv({"chartedit_cli", "describe", "--store", "redis"});
    CHECK_FALSE(ParseChartEditArguments(static_cast<int>(badStore.size()), badStore.data()).has_value());

    auto twoCommands = make_argv({"chartedit_cli", "describe", "display"});
    CHECK_FALSE(ParseChartEditArguments(static_cast<int>(twoCommands.size()), twoCommands.data()).has_value());

    auto wideIndent = make_argv({"chartedit_cli", "describe", "--indent", "40"});
    CHECK_FALSE(ParseChartEditArguments(static_cast<int>(wideIndent.size()), wideIndent.data()).has_value());
}

TEST_CASE("validation reports the first problem") {
    ChartEditOptions options;
    CHECK(ValidateChartEditOptions(options) == std::optional<std::string>{"a command is required (describe, customize, display, seed)"});

    options.command = "export";
    CHECK(ValidateChartEditOptions(options) == std::optional<std::string>{"Unsupported command: export"});

    options.command = "display";
    CHECK(ValidateChartEditOptions(options) == std::optional<std::string>{"--id must not be empty"});

    options.payload_id = "sales";
    options.store_root.clear();
    CHECK(ValidateChartEditOptions(options) == std::optional<std::string>{"File store requires a non-empty --store-root"});

    options.store_backend = "memory";
    CHECK_FALSE(ValidateChartEditOptions(options).has_value());
}

TEST_CASE("environment overrides apply before arguments") {
    CleanEnv  env;
    ScopedEnv store{"CHARTEDIT_STORE", "memory"};
    ScopedEnv indent{"CHARTEDIT_INDENT", "-1"};
    ScopedEnv root{"CHARTEDIT_STORE_ROOT", "/tmp/charts"};

    auto argv    = make_argv({"chartedit_cli", "display", "--id", "x", "--indent", "0"});
    auto options = ParseChartEditArguments(static_cast<int>(argv.size()), argv.data());
    REQUIRE(options.has_value());
    CHECK(options->store_backend == "memory");
    CHECK(options->store_root == "/tmp/charts");
    CHECK(options->pretty_indent == 0);
}

TEST_CASE("invalid environment values are rejected") {
    CleanEnv env;
    {
        ScopedEnv        store{"CHARTEDIT_STORE", "s3"};
        ChartEditOptions options;
        CHECK_FALSE(ApplyChartEditEnvOverrides(options));
    }
    {
        ScopedEnv        indent{"CHARTEDIT_INDENT", "two"};
        ChartEditOptions options;
        CHECK_FALSE(ApplyChartEditEnvOverrides(options));
        CHECK(options.pretty_indent == 2);
    }
}

} // TEST_SUITE
