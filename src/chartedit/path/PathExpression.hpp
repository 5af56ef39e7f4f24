#pragma once

#include <chartedit/core/Error.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace CE {

/**
 * One step of a parsed path expression: a mapping field name or a sequence
 * index. `series[2].marker.radius` parses to
 * `{"series", 2, "marker", "radius"}`.
 */
using PathToken     = std::variant<std::string, std::size_t>;
using TokenSequence = std::vector<PathToken>;

// Marker that stands in for every concrete index inside a path pattern.
inline constexpr std::string_view kAnyIndexMarker = "[]";

[[nodiscard]] inline auto is_index(PathToken const& token) noexcept -> bool {
    return std::holds_alternative<std::size_t>(token);
}

/**
 * Parses a dotted/bracketed path. Segments are separated by '.', each segment
 * may carry any number of `[<digits>]` suffixes. Empty segments produced by
 * leading, trailing or doubled dots are dropped.
 *
 * Fails with MalformedPath for an empty string, an unterminated '[' or a
 * bracket whose contents are not a non-negative integer literal.
 */
[[nodiscard]] auto parse_path(std::string_view path) -> Expected<TokenSequence>;

// Canonical text for a token sequence; parse_path(stringify_tokens(t)) == t.
[[nodiscard]] auto stringify_tokens(TokenSequence const& tokens) -> std::string;

/**
 * Collapses every index into the preceding field with the any-index marker,
 * producing the pattern used for schema lookups: `series[3].color` and
 * `series[0].color` both become `series[].color`.
 */
[[nodiscard]] auto normalize_tokens(TokenSequence const& tokens) -> std::string;

} // namespace CE
