#pragma once

#include <chartedit/core/Error.hpp>
#include <chartedit/core/Json.hpp>

#include "core/UpdateRecord.hpp"

#include <optional>
#include <string_view>

namespace CE {

/**
 * Merges caller-supplied updates with translated instructions and applies
 * them to a document through the DocumentPatcher, in order.
 *
 * Explicit updates are applied first, in caller order, then the updates
 * derived from `instructions`. Every record is validated against the
 * document's chart kind before it is written. The first failure stops the
 * run and is returned; writes made before it stay in the document, so the
 * caller must not persist a document after a failed apply.
 */
class UpdateOrchestrator {
public:
    /**
     * Accepts a mapping of path to value, a sequence of {path, value} objects
     * or two-element arrays, or a string holding either JSON or `path = value`
     * lines. Anything else yields no updates. A non-string path is kept as an
     * empty path, which apply() skips.
     */
    [[nodiscard]] static auto normalize_updates(Json const& raw) -> UpdateList;
    [[nodiscard]] static auto normalize_updates_text(std::string_view raw) -> UpdateList;

    /**
     * `path = value` per line. Values are decoded as JSON when possible and
     * kept as strings otherwise. Blank lines, '#' comments and lines without
     * '=' are skipped.
     */
    [[nodiscard]] static auto parse_key_value_lines(std::string_view raw) -> UpdateList;

    [[nodiscard]] static auto collect_updates(Json const&                    document,
                                              UpdateList                     explicitUpdates,
                                              std::optional<std::string_view> instructions) -> UpdateList;

    [[nodiscard]] static auto apply_updates(Json& document, UpdateList const& updates) -> Expected<ChangeLog>;

    [[nodiscard]] static auto apply(Json&                           document,
                                    Json const&                     explicitUpdates,
                                    std::optional<std::string_view> instructions) -> Expected<ChangeLog>;
};

} // namespace CE
