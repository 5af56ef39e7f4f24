#include <chartedit/skills/ChartSkills.hpp>

#include <chartedit/store/DocumentStore.hpp>

#include "core/UpdateRecord.hpp"
#include "history/HistoryLog.hpp"
#include "log/TaggedLogger.hpp"
#include "orchestrate/UpdateOrchestrator.hpp"
#include "schema/EditableFields.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace CE::Skills {

namespace {

constexpr std::string_view kDescribe  = "Describe Chart";
constexpr std::string_view kCustomize = "Customize Chart";
constexpr std::string_view kDisplay   = "Display Chart";
constexpr std::string_view kSeed      = "Seed Sample Chart";

auto prompt_only(std::string text) -> SkillOutput {
    SkillOutput out;
    out.final_prompt = std::move(text);
    return out;
}

auto missing_id(std::string_view verb) -> SkillOutput {
    return prompt_only("A saved payload ID is required to " + std::string{verb} + " a chart.");
}

auto has_id(SkillArguments const& args) -> bool {
    return args.saved_payload_id.has_value() && !args.saved_payload_id->empty();
}

auto dump(Json const& value, int indent) -> std::string {
    return value.dump(indent);
}

// Strings print bare, everything else as JSON text.
auto display_text(Json const& value) -> std::string {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

auto truthy(Json const& value) -> bool {
    switch (value.type()) {
    case Json::value_t::null:
    case Json::value_t::discarded:
        return false;
    case Json::value_t::boolean:
        return value.get<bool>();
    case Json::value_t::number_integer:
        return value.get<std::int64_t>() != 0;
    case Json::value_t::number_unsigned:
        return value.get<std::uint64_t>() != 0;
    case Json::value_t::number_float:
        return value.get<double>() != 0.0;
    case Json::value_t::string:
        return !value.get_ref<std::string const&>().empty();
    case Json::value_t::binary:
        return !value.get_binary().empty();
    case Json::value_t::array:
    case Json::value_t::object:
        return !value.empty();
    }
    return false;
}

auto member_or_null(Json const& object, char const* key) -> Json {
    auto it = object.find(key);
    return it == object.end() ? Json(nullptr) : *it;
}

auto actor_for(SkillArguments const& args, std::string_view fallback) -> std::string {
    return args.actor.empty() ? std::string{fallback} : args.actor;
}

} // namespace

auto skill_catalog() -> std::vector<SkillDescriptor> const& {
    static std::vector<SkillDescriptor> const catalog{
            {std::string{kDescribe},
             "describe",
             "Summarize an existing Highcharts payload and highlight editable properties.",
             {{"saved_payload_id", "Identifier returned when the chart payload was stored.", true}}},
            {std::string{kCustomize},
             "customize",
             "Apply structured Highcharts option updates to a saved payload.",
             {{"saved_payload_id", "Identifier returned when the chart payload was saved.", true},
              {"updates",
               "JSON or key=value list describing chart option updates (e.g. {\"series[0].color\": \"#ff0000\"}).",
               false},
              {"instructions", "Plain-language styling instructions, recorded in the payload history.", false}}},
            {std::string{kDisplay},
             "display",
             "Retrieve a chart payload from the store and present it to the user.",
             {{"saved_payload_id", "Identifier returned when the chart was saved.", true}}},
            {std::string{kSeed},
             "seed",
             "Store a sample Highcharts area chart under the given identifier.",
             {{"saved_payload_id", "Identifier to store the sample chart under.", true}}},
    };
    return catalog;
}

auto summarize_options(Json const& options) -> Json {
    Json chart_type = Json(nullptr);
    if (auto kind = Schema::chart_kind(options); kind && !kind->empty()) {
        chart_type = *kind;
    }

    Json series_summary = Json::array();
    std::size_t series_count = 0;
    if (auto it = options.find("series"); it != options.end() && it->is_array()) {
        series_count = it->size();
        for (std::size_t idx = 0; idx < it->size(); ++idx) {
            auto const& serie = (*it)[idx];
            if (!serie.is_object()) {
                continue;
            }
            Json entry = Json::object();
            entry["index"] = idx;
            entry["name"]  = serie.contains("name") ? serie["name"] : Json("Series " + std::to_string(idx + 1));
            entry["type"]  = serie.contains("type") ? serie["type"] : chart_type;
            entry["color"]      = member_or_null(serie, "color");
            entry["dashStyle"]  = member_or_null(serie, "dashStyle");
            entry["dataLabels"] = truthy(member_or_null(serie, "dataLabels"));
            series_summary.push_back(std::move(entry));
        }
    }

    Json summary = Json::object();
    summary["chart_type"]   = chart_type.is_null() ? Json("unknown") : chart_type;
    summary["series_count"] = series_count;
    summary["series"]       = std::move(series_summary);
    return summary;
}

auto describe_chart(DocumentStore& store, SkillArguments const& args) -> SkillOutput {
    if (!has_id(args)) {
        return missing_id("describe");
    }
    auto payload = store.load(*args.saved_payload_id);
    if (!payload) {
        return prompt_only(errorMessage(payload.error()));
    }
    auto options = extract_chart_options(*payload);
    if (!options) {
        return prompt_only(errorMessage(options.error()));
    }
    Json const& chart   = **options;
    Json        summary = summarize_options(chart);

    std::string narrative = "Chart type: " + display_text(summary["chart_type"]) + "\n"
                            + "Series count: " + std::to_string(summary["series_count"].get<std::size_t>());
    for (auto const& serie : summary["series"]) {
        narrative += "\nSeries " + std::to_string(serie["index"].get<std::size_t>()) + " ("
                     + display_text(serie["name"]) + "): color="
                     + (truthy(serie["color"]) ? display_text(serie["color"]) : std::string{"default"})
                     + ", dashStyle="
                     + (truthy(serie["dashStyle"]) ? display_text(serie["dashStyle"]) : std::string{"solid"});
    }

    Json result = Json::object();
    result["summary"]         = std::move(summary);
    result["editable_fields"] = Schema::editable_fields_json(Schema::editable_fields(chart));
    result["chart_options"]   = chart;

    SkillOutput out;
    out.final_prompt = dump(result, args.indent);
    out.narrative    = std::move(narrative);
    return out;
}

auto customize_chart(DocumentStore& store, SkillArguments const& args) -> SkillOutput {
    if (!has_id(args)) {
        return missing_id("customize");
    }
    auto payload = store.load(*args.saved_payload_id);
    if (!payload) {
        return prompt_only(errorMessage(payload.error()));
    }
    auto options = extract_chart_options(*payload);
    if (!options) {
        return prompt_only(errorMessage(options.error()));
    }
    Json& chart = **options;

    UpdateList explicitUpdates;
    if (args.updates) {
        explicitUpdates = UpdateOrchestrator::normalize_updates(*args.updates);
    }
    std::optional<std::string_view> instructions;
    if (args.instructions && !args.instructions->empty()) {
        instructions = *args.instructions;
    }
    auto updates = UpdateOrchestrator::collect_updates(chart, std::move(explicitUpdates), instructions);
    if (updates.empty()) {
        return prompt_only("Provide chart updates as JSON, an array of path/value pairs, key=value lines, "
                           "or recognizable instructions.");
    }

    auto changes = UpdateOrchestrator::apply_updates(chart, updates);
    if (!changes) {
        ce_log("customize aborted: " + describeError(changes.error()), "Skill", "ERROR");
        return prompt_only(errorMessage(changes.error()));
    }
    Json change_log = changes_to_json(*changes);

    Json details = Json::object();
    details["instructions"] = args.instructions ? Json(*args.instructions) : Json(nullptr);
    details["changes"]      = change_log;
    if (auto recorded = History::append_history_entry(*payload, actor_for(args, kCustomize), "apply_updates", details);
        !recorded) {
        return prompt_only(errorMessage(recorded.error()));
    }

    auto saved_id = store.persist(*payload, *args.saved_payload_id);
    if (!saved_id) {
        return prompt_only(errorMessage(saved_id.error()));
    }

    // Adding metadata can reallocate the payload's members; `chart` is stale from here on.
    auto persisted_options = extract_chart_options(*payload);
    if (!persisted_options) {
        return prompt_only(errorMessage(persisted_options.error()));
    }

    std::string narrative;
    for (auto const& change : *changes) {
        if (!narrative.empty()) {
            narrative.push_back('\n');
        }
        narrative += change.path + ": " + (change.before ? display_text(*change.before) : std::string{"null"})
                     + " -> " + display_text(change.after);
    }

    Json result = Json::object();
    result["saved_payload_id"] = *saved_id;
    result["changes"]          = std::move(change_log);
    result["chart_options"]    = **persisted_options;

    SkillOutput out;
    out.final_prompt = dump(result, args.indent);
    out.narrative    = std::move(narrative);
    return out;
}

auto display_chart(DocumentStore& store, SkillArguments const& args) -> SkillOutput {
    if (!has_id(args)) {
        return missing_id("display");
    }
    auto payload = store.load(*args.saved_payload_id);
    if (!payload) {
        return prompt_only(errorMessage(payload.error()));
    }

    Json chart = {
            {"name", "HighchartsChart0"},
            {"type", "HighchartsChart"},
            {"minHeight", "400px"},
            {"options", *payload},
    };
    Json visualization = {
            {"title", std::string{kDisplay}},
            {"layout", "standard"},
            {"content",
             {
                     {"type", "Document"},
                     {"gap", "0px"},
                     {"style", {{"backgroundColor", "#ffffff"}, {"width", "100%"}, {"height", "max-content"}}},
                     {"children", Json::array({std::move(chart)})},
             }},
    };

    SkillOutput out;
    out.final_prompt = dump(*payload, args.indent);
    out.visualizations.push_back(std::move(visualization));
    return out;
}

auto sample_chart_options() -> Json {
    return Json{
            {"chart", {{"type", "area"}}},
            {"title", {{"text", "Sample Highchart"}, {"style", {{"fontSize", "20px"}}}}},
            {"xAxis",
             {{"categories", Json::array({"Category A", "Category B", "Category C"})},
              {"title", {{"text", "Categories"}}}}},
            {"yAxis", {{"title", {{"text", "Values"}}}}},
            {"series", Json::array({Json{{"name", "Series 1"}, {"data", Json::array({10, 20, 30})}}})},
            {"credits", Json::object()},
            {"legend", {{"align", "center"}, {"verticalAlign", "bottom"}, {"layout", "horizontal"}}},
            {"plotOptions", {{"column", {{"dataLabels", {{"style", {{"fontSize", ""}}}}}}}}},
    };
}

auto seed_sample_chart(DocumentStore& store, SkillArguments const& args) -> SkillOutput {
    if (!has_id(args)) {
        return missing_id("seed");
    }
    Json payload = make_chart_payload(sample_chart_options());
    Json details = {{"chart_type", payload["data"]["chart"]["type"]}};
    if (auto recorded = History::append_history_entry(payload, actor_for(args, kSeed), "initial_save", details);
        !recorded) {
        return prompt_only("Chart could not be saved (" + errorMessage(recorded.error()) + ").");
    }
    auto saved_id = store.persist(payload, *args.saved_payload_id);
    if (!saved_id) {
        return prompt_only("Chart could not be saved (" + errorMessage(saved_id.error()) + ").");
    }
    return prompt_only("Chart saved to address " + *saved_id);
}

auto run_skill(std::string_view name, DocumentStore& store, SkillArguments const& args) -> Expected<SkillOutput> {
    using Runner = SkillOutput (*)(DocumentStore&, SkillArguments const&);
    Runner runner = nullptr;
    for (auto const& descriptor : skill_catalog()) {
        if (descriptor.command != name && descriptor.name != name) {
            continue;
        }
        if (descriptor.command == "describe") {
            runner = &describe_chart;
        } else if (descriptor.command == "customize") {
            runner = &customize_chart;
        } else if (descriptor.command == "display") {
            runner = &display_chart;
        } else if (descriptor.command == "seed") {
            runner = &seed_sample_chart;
        }
        break;
    }
    if (runner == nullptr) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "Unknown skill: " + std::string{name}});
    }
    ce_log("running " + std::string{name}, "Skill");
    return runner(store, args);
}

} // namespace CE::Skills
