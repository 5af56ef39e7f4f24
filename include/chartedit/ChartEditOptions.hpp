#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace CE {

struct ChartEditOptions {
    std::string                command;
    std::string                payload_id;
    std::optional<std::string> updates;
    std::optional<std::string> instructions;
    std::string                store_backend{"file"};
    std::string                store_root{"chart_store"};
    int                        pretty_indent{2};
    std::string                actor;
    bool                       show_help{false};
};

auto ParseChartEditArguments(int argc, char** argv) -> std::optional<ChartEditOptions>;

void PrintChartEditUsage();

bool ApplyChartEditEnvOverrides(ChartEditOptions& options);

auto ValidateChartEditOptions(ChartEditOptions const& options) -> std::optional<std::string>;

bool IsValidChartEditCommand(std::string_view command);
bool IsValidStoreBackend(std::string_view backend);

} // namespace CE
