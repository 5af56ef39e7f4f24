#pragma once

#include <chartedit/core/Json.hpp>

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace CE::Schema {

inline constexpr int kCatalogVersion = 1;

// Placeholder for the series position inside per-series templates.
inline constexpr std::string_view kIndexPlaceholder = "[{index}]";

struct FieldTemplate {
    std::string_view path;
    std::string_view description;
};

struct EditableField {
    std::string path;
    std::string description;
};

[[nodiscard]] auto global_field_templates() -> std::span<FieldTemplate const>;
[[nodiscard]] auto series_field_templates() -> std::span<FieldTemplate const>;

// Empty for a chart kind the catalog does not know.
[[nodiscard]] auto chart_kind_field_templates(std::string_view chartKind) -> std::span<FieldTemplate const>;
[[nodiscard]] auto known_chart_kinds() -> std::vector<std::string_view>;

/**
 * Every path pattern that may be written for a chart of the given kind:
 * global and per-series patterns always, plus the kind's own patterns when
 * the kind is known. Patterns use `[]` for any index.
 */
[[nodiscard]] auto allowed_patterns(std::optional<std::string_view> chartKind) -> std::unordered_set<std::string>;

// `chart.type` when present and a string.
[[nodiscard]] auto chart_kind(Json const& document) -> std::optional<std::string>;

/**
 * The user-facing listing of what can be edited on this document: global
 * entries, then the chart kind's entries, then one concrete entry per series
 * template for every series element that is a mapping.
 */
[[nodiscard]] auto editable_fields(Json const& document) -> std::vector<EditableField>;

[[nodiscard]] auto editable_fields_json(std::vector<EditableField> const& fields) -> Json;

} // namespace CE::Schema
