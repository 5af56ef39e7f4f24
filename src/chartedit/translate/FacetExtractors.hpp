#pragma once

#include <chartedit/core/Json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace CE::Facets {

// Sentence-level building blocks of the instruction translator. Every
// function here is pure; `lowered` arguments are expected in lowercase.

/**
 * Splits free text on '.', ';' and newlines into trimmed, non-empty
 * sentences. A '.' with a digit on both sides belongs to a number and does
 * not end the sentence.
 */
[[nodiscard]] auto split_sentences(std::string_view text) -> std::vector<std::string>;

[[nodiscard]] auto to_lower(std::string_view text) -> std::string;

/**
 * Which series a sentence talks about, first matching rule wins:
 * "all/every series", "series <N>" (1-based), "<ordinal> series|line|bar|
 * column|area", a series name contained in the sentence, then the bare word
 * "series" when exactly one series exists. Indices are ascending.
 */
[[nodiscard]] auto resolve_targets(std::string_view lowered, Json const& series) -> std::vector<std::size_t>;

[[nodiscard]] auto mentions_all_series(std::string_view lowered) -> bool;

// Negative phrases take precedence: "turn off" never falls through to "turn on".
[[nodiscard]] auto detect_bool(std::string_view lowered) -> std::optional<bool>;

// Hex literal (uppercased), rgb(...) literal (verbatim) or a named color.
[[nodiscard]] auto extract_color(std::string const& sentence) -> std::optional<std::string>;
[[nodiscard]] auto extract_dash_style(std::string_view lowered) -> std::optional<std::string>;

// Integral numbers come back as JSON integers, fractional ones as floats.
[[nodiscard]] auto extract_line_width(std::string const& lowered) -> std::optional<Json>;
[[nodiscard]] auto extract_marker_radius(std::string const& lowered) -> std::optional<Json>;
[[nodiscard]] auto extract_marker_symbol(std::string_view lowered) -> std::optional<std::string>;

// Clamped to [0, 1]; "40%" gives 0.4.
[[nodiscard]] auto extract_fill_opacity(std::string const& lowered) -> std::optional<double>;

// "70%" style sizes; a bare donut mention defaults to "60%".
[[nodiscard]] auto extract_inner_size(std::string const& lowered) -> std::optional<std::string>;

// plotOptions.<kind>.marker.enabled for marker-bearing kinds, the series-wide path otherwise.
[[nodiscard]] auto marker_enabled_path(std::optional<std::string_view> chartKind) -> std::string;

[[nodiscard]] auto number_to_json(double value) -> Json;

} // namespace CE::Facets
