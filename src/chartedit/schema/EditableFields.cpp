#include "schema/EditableFields.hpp"

#include <algorithm>
#include <array>
#include <string>

namespace CE::Schema {

namespace {

constexpr std::array kGlobalTemplates{
    FieldTemplate{"title.text", "Chart title text"},
    FieldTemplate{"title.style.color", "Title font color"},
    FieldTemplate{"subtitle.text", "Subtitle text"},
    FieldTemplate{"subtitle.style.color", "Subtitle font color"},
    FieldTemplate{"chart.backgroundColor", "Chart background color"},
    FieldTemplate{"xAxis.title.text", "X-axis title"},
    FieldTemplate{"xAxis.labels.style", "X-axis label styles"},
    FieldTemplate{"yAxis.title.text", "Y-axis title"},
    FieldTemplate{"yAxis.labels.style", "Y-axis label styles"},
    FieldTemplate{"legend", "Legend configuration"},
    FieldTemplate{"legend.enabled", "Toggle legend visibility"},
    FieldTemplate{"plotOptions.series.dataLabels", "Global data label options"},
    FieldTemplate{"plotOptions.series.dataLabels.enabled", "Enable global data labels"},
    FieldTemplate{"plotOptions.series.dataLabels.style", "Global data label style"},
    FieldTemplate{"plotOptions.series.marker.enabled", "Global marker visibility"},
};

constexpr std::array kSeriesTemplates{
    FieldTemplate{"series[{index}].name", "Series display name"},
    FieldTemplate{"series[{index}].color", "Series color"},
    FieldTemplate{"series[{index}].dashStyle", "Series line/dash style"},
    FieldTemplate{"series[{index}].lineWidth", "Series line width"},
    FieldTemplate{"series[{index}].dataLabels.enabled", "Enable series data labels"},
    FieldTemplate{"series[{index}].dataLabels.format", "Series data label format"},
    FieldTemplate{"series[{index}].dataLabels.style", "Series data label style"},
    FieldTemplate{"series[{index}].marker.enabled", "Series marker visibility"},
    FieldTemplate{"series[{index}].marker.symbol", "Series marker symbol"},
    FieldTemplate{"series[{index}].marker.radius", "Series marker radius"},
};

constexpr std::array kColumnTemplates{
    FieldTemplate{"plotOptions.column.colorByPoint", "Color each column by point"},
    FieldTemplate{"plotOptions.column.dataLabels.enabled", "Enable column data labels"},
    FieldTemplate{"plotOptions.column.dataLabels.style.fontSize", "Column data label font size"},
    FieldTemplate{"plotOptions.column.borderRadius", "Column border radius"},
};

constexpr std::array kBarTemplates{
    FieldTemplate{"plotOptions.bar.dataLabels.enabled", "Enable bar data labels"},
    FieldTemplate{"plotOptions.bar.dataLabels.style.fontSize", "Bar data label font size"},
    FieldTemplate{"plotOptions.bar.borderRadius", "Bar border radius"},
};

constexpr std::array kAreaTemplates{
    FieldTemplate{"plotOptions.area.fillOpacity", "Area fill opacity"},
    FieldTemplate{"plotOptions.area.marker.enabled", "Area marker visibility"},
};

constexpr std::array kAreasplineTemplates{
    FieldTemplate{"plotOptions.areaspline.fillOpacity", "Areaspline fill opacity"},
    FieldTemplate{"plotOptions.areaspline.marker.enabled", "Areaspline marker visibility"},
};

constexpr std::array kLineTemplates{
    FieldTemplate{"plotOptions.line.marker.enabled", "Line marker visibility"},
};

constexpr std::array kSplineTemplates{
    FieldTemplate{"plotOptions.spline.marker.enabled", "Spline marker visibility"},
};

constexpr std::array kPieTemplates{
    FieldTemplate{"plotOptions.pie.dataLabels.enabled", "Pie data label toggle"},
    FieldTemplate{"plotOptions.pie.dataLabels.distance", "Pie data label distance"},
    FieldTemplate{"plotOptions.pie.innerSize", "Pie inner size (donut)"},
    FieldTemplate{"plotOptions.pie.showInLegend", "Show pie slices in legend"},
};

constexpr std::array kScatterTemplates{
    FieldTemplate{"plotOptions.scatter.marker.enabled", "Scatter marker visibility"},
    FieldTemplate{"plotOptions.scatter.marker.symbol", "Scatter marker symbol"},
    FieldTemplate{"plotOptions.scatter.marker.radius", "Scatter marker radius"},
    FieldTemplate{"plotOptions.scatter.marker.fillColor", "Scatter marker fill color"},
};

constexpr std::array kBubbleTemplates{
    FieldTemplate{"plotOptions.bubble.minSize", "Bubble min size"},
    FieldTemplate{"plotOptions.bubble.maxSize", "Bubble max size"},
};

struct ChartKindEntry {
    std::string_view                kind;
    std::span<FieldTemplate const>  templates;
};

constexpr std::array kChartKinds{
    ChartKindEntry{"column", kColumnTemplates},
    ChartKindEntry{"bar", kBarTemplates},
    ChartKindEntry{"area", kAreaTemplates},
    ChartKindEntry{"areaspline", kAreasplineTemplates},
    ChartKindEntry{"line", kLineTemplates},
    ChartKindEntry{"spline", kSplineTemplates},
    ChartKindEntry{"pie", kPieTemplates},
    ChartKindEntry{"scatter", kScatterTemplates},
    ChartKindEntry{"bubble", kBubbleTemplates},
};

auto replace_placeholder(std::string_view templ, std::string_view replacement) -> std::string {
    std::string out{templ};
    auto pos = out.find(kIndexPlaceholder);
    if (pos != std::string::npos) {
        out.replace(pos, kIndexPlaceholder.size(), replacement);
    }
    return out;
}

auto to_pattern(FieldTemplate const& templ) -> std::string {
    return replace_placeholder(templ.path, "[]");
}

} // namespace

auto global_field_templates() -> std::span<FieldTemplate const> {
    return kGlobalTemplates;
}

auto series_field_templates() -> std::span<FieldTemplate const> {
    return kSeriesTemplates;
}

auto chart_kind_field_templates(std::string_view chartKind) -> std::span<FieldTemplate const> {
    auto it = std::find_if(kChartKinds.begin(), kChartKinds.end(), [&](ChartKindEntry const& entry) {
        return entry.kind == chartKind;
    });
    if (it == kChartKinds.end()) {
        return {};
    }
    return it->templates;
}

auto known_chart_kinds() -> std::vector<std::string_view> {
    std::vector<std::string_view> kinds;
    kinds.reserve(kChartKinds.size());
    for (auto const& entry : kChartKinds) {
        kinds.push_back(entry.kind);
    }
    return kinds;
}

auto allowed_patterns(std::optional<std::string_view> chartKind) -> std::unordered_set<std::string> {
    std::unordered_set<std::string> patterns;
    for (auto const& templ : kGlobalTemplates) {
        patterns.insert(to_pattern(templ));
    }
    for (auto const& templ : kSeriesTemplates) {
        patterns.insert(to_pattern(templ));
    }
    if (chartKind && !chartKind->empty()) {
        for (auto const& templ : chart_kind_field_templates(*chartKind)) {
            patterns.insert(to_pattern(templ));
        }
    }
    return patterns;
}

auto chart_kind(Json const& document) -> std::optional<std::string> {
    if (!document.is_object()) {
        return std::nullopt;
    }
    auto chart = document.find("chart");
    if (chart == document.end() || !chart->is_object()) {
        return std::nullopt;
    }
    auto type = chart->find("type");
    if (type == chart->end() || !type->is_string()) {
        return std::nullopt;
    }
    return type->get<std::string>();
}

auto editable_fields(Json const& document) -> std::vector<EditableField> {
    std::vector<EditableField> fields;
    for (auto const& templ : kGlobalTemplates) {
        fields.push_back({std::string{templ.path}, std::string{templ.description}});
    }

    if (auto kind = chart_kind(document)) {
        for (auto const& templ : chart_kind_field_templates(*kind)) {
            fields.push_back({std::string{templ.path}, std::string{templ.description}});
        }
    }

    if (!document.is_object()) {
        return fields;
    }
    auto series = document.find("series");
    if (series == document.end() || !series->is_array()) {
        return fields;
    }
    for (std::size_t index = 0; index < series->size(); ++index) {
        if (!(*series)[index].is_object()) {
            continue;
        }
        auto const concrete = "[" + std::to_string(index) + "]";
        for (auto const& templ : kSeriesTemplates) {
            fields.push_back({replace_placeholder(templ.path, concrete), std::string{templ.description}});
        }
    }
    return fields;
}

auto editable_fields_json(std::vector<EditableField> const& fields) -> Json {
    Json out = Json::array();
    for (auto const& field : fields) {
        out.push_back(Json{{"path", field.path}, {"description", field.description}});
    }
    return out;
}

} // namespace CE::Schema
