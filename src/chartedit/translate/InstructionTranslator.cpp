#include "translate/InstructionTranslator.hpp"

#include "log/TaggedLogger.hpp"
#include "schema/EditableFields.hpp"
#include "translate/FacetExtractors.hpp"

#include <optional>
#include <string>
#include <vector>

namespace CE {

namespace {

struct SentenceContext {
    std::string                sentence;
    std::string                lowered;
    std::vector<std::size_t>   targets;
    std::optional<std::string> chartKind;
};

auto series_path(std::size_t index, std::string_view suffix) -> std::string {
    std::string path = "series[" + std::to_string(index) + "].";
    path.append(suffix);
    return path;
}

void emit_per_target(UpdateList& updates, SentenceContext const& ctx, std::string_view suffix, Json const& value) {
    for (auto index : ctx.targets) {
        updates.push_back({series_path(index, suffix), value});
    }
}

auto mentions(SentenceContext const& ctx, std::string_view word) -> bool {
    return ctx.lowered.find(word) != std::string::npos;
}

auto kind_is(SentenceContext const& ctx, std::string_view kind) -> bool {
    return ctx.chartKind && *ctx.chartKind == kind;
}

void translate_sentence(SentenceContext const& ctx, UpdateList& updates) {
    auto const color = Facets::extract_color(ctx.sentence);
    if (color) {
        emit_per_target(updates, ctx, "color", *color);
    }

    if (auto dash = Facets::extract_dash_style(ctx.lowered)) {
        emit_per_target(updates, ctx, "dashStyle", *dash);
    }

    if (auto width = Facets::extract_line_width(ctx.lowered)) {
        emit_per_target(updates, ctx, "lineWidth", *width);
    }

    if (mentions(ctx, "data label")) {
        if (auto enabled = Facets::detect_bool(ctx.lowered)) {
            if (!ctx.targets.empty() && !Facets::mentions_all_series(ctx.lowered)) {
                emit_per_target(updates, ctx, "dataLabels.enabled", *enabled);
            } else {
                updates.push_back({"plotOptions.series.dataLabels.enabled", *enabled});
            }
        }
    }

    if (mentions(ctx, "legend")) {
        if (auto enabled = Facets::detect_bool(ctx.lowered)) {
            updates.push_back({"legend.enabled", *enabled});
        }
    }

    if (mentions(ctx, "marker")) {
        if (auto enabled = Facets::detect_bool(ctx.lowered)) {
            std::optional<std::string_view> kind;
            if (ctx.chartKind) {
                kind = *ctx.chartKind;
            }
            updates.push_back({Facets::marker_enabled_path(kind), *enabled});
        }

        if (auto radius = Facets::extract_marker_radius(ctx.lowered)) {
            if (kind_is(ctx, "scatter")) {
                updates.push_back({"plotOptions.scatter.marker.radius", *radius});
            } else {
                emit_per_target(updates, ctx, "marker.radius", *radius);
            }
        }

        if (auto symbol = Facets::extract_marker_symbol(ctx.lowered)) {
            if (kind_is(ctx, "scatter")) {
                updates.push_back({"plotOptions.scatter.marker.symbol", *symbol});
            } else {
                emit_per_target(updates, ctx, "marker.symbol", *symbol);
            }
        }

        if (color && ctx.targets.empty() && kind_is(ctx, "scatter")) {
            updates.push_back({"plotOptions.scatter.marker.fillColor", *color});
        }
    }

    if (kind_is(ctx, "area") || kind_is(ctx, "areaspline")) {
        if (auto opacity = Facets::extract_fill_opacity(ctx.lowered)) {
            updates.push_back({"plotOptions." + *ctx.chartKind + ".fillOpacity", *opacity});
        }
    }

    if (kind_is(ctx, "pie")) {
        if (auto innerSize = Facets::extract_inner_size(ctx.lowered)) {
            updates.push_back({"plotOptions.pie.innerSize", *innerSize});
        }
        if (mentions(ctx, "legend")) {
            if (auto shown = Facets::detect_bool(ctx.lowered)) {
                updates.push_back({"plotOptions.pie.showInLegend", *shown});
            }
        }
        if (mentions(ctx, "data label")) {
            if (auto enabled = Facets::detect_bool(ctx.lowered)) {
                updates.push_back({"plotOptions.pie.dataLabels.enabled", *enabled});
            }
        }
    }
}

} // namespace

auto InstructionTranslator::translate(std::string_view instructions, Json const& document) -> UpdateList {
    UpdateList updates;
    if (instructions.empty()) {
        return updates;
    }

    auto const chartKind = Schema::chart_kind(document);
    Json const emptySeries = Json::array();
    Json const* series     = &emptySeries;
    if (document.is_object()) {
        if (auto it = document.find("series"); it != document.end() && it->is_array()) {
            series = &*it;
        }
    }

    for (auto& sentence : Facets::split_sentences(instructions)) {
        SentenceContext ctx;
        ctx.lowered   = Facets::to_lower(sentence);
        ctx.targets   = Facets::resolve_targets(ctx.lowered, *series);
        ctx.chartKind = chartKind;
        ctx.sentence  = std::move(sentence);

        auto const before = updates.size();
        translate_sentence(ctx, updates);
        ce_log("'" + ctx.sentence + "' -> " + std::to_string(updates.size() - before) + " update(s)", "Translator");
    }
    return updates;
}

} // namespace CE
