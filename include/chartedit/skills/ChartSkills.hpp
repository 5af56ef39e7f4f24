#pragma once

#include <chartedit/core/Error.hpp>
#include <chartedit/core/Json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace CE {

class DocumentStore;

namespace Skills {

struct SkillParameter {
    std::string name;
    std::string description;
    bool        required = false;
};

struct SkillDescriptor {
    std::string                 name;
    std::string                 command;
    std::string                 description;
    std::vector<SkillParameter> parameters;
};

struct SkillArguments {
    std::optional<std::string> saved_payload_id;
    // A mapping, a sequence of updates, or text (JSON or key=value lines).
    std::optional<Json>        updates;
    std::optional<std::string> instructions;
    // Overrides the skill's default history actor when not empty.
    std::string                actor;
    // Indent for JSON in final_prompt, -1 for compact.
    int                        indent = 2;
};

// What a skill hands back to its caller. Failures are reported in final_prompt.
struct SkillOutput {
    std::string final_prompt;
    std::string narrative;
    Json        visualizations = Json::array();
    Json        export_data    = Json::array();
};

[[nodiscard]] auto skill_catalog() -> std::vector<SkillDescriptor> const&;

/**
 * Overview of a chart for describing it: chart type ("unknown" when
 * absent), the series count and one entry per mapping series with its
 * name, type, color, dash style and whether data labels are set.
 */
[[nodiscard]] auto summarize_options(Json const& options) -> Json;

// The area chart stored by seed_sample_chart, without its envelope.
[[nodiscard]] auto sample_chart_options() -> Json;

auto describe_chart(DocumentStore& store, SkillArguments const& args) -> SkillOutput;
auto customize_chart(DocumentStore& store, SkillArguments const& args) -> SkillOutput;
auto display_chart(DocumentStore& store, SkillArguments const& args) -> SkillOutput;
auto seed_sample_chart(DocumentStore& store, SkillArguments const& args) -> SkillOutput;

// Looks a skill up by command ("describe") or display name ("Describe Chart").
auto run_skill(std::string_view name, DocumentStore& store, SkillArguments const& args) -> Expected<SkillOutput>;

} // namespace Skills
} // namespace CE
