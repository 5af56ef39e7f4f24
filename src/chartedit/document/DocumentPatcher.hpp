#pragma once

#include <chartedit/core/Error.hpp>
#include <chartedit/core/Json.hpp>

#include "path/PathExpression.hpp"

#include <optional>
#include <string_view>

namespace CE {

/**
 * Path-addressed reads and writes over a chart configuration tree.
 *
 * The patcher only guarantees structural safety. Whether a path may be
 * written at all is decided by validate_tokens(), which callers run first
 * for user-supplied updates. Trusted internal writes (history metadata)
 * call set_value() directly.
 */
class DocumentPatcher {
public:
    /**
     * Walks `tokens` from the root. A field step needs a mapping that holds
     * the field, an index step needs a sequence long enough; anything else
     * yields std::nullopt. A stored null is returned as Json(nullptr).
     */
    [[nodiscard]] static auto get_value(Json const& document, TokenSequence const& tokens) -> MaybeJson;

    // PathNotEditable unless the normalized pattern is allowed for `chartKind`.
    [[nodiscard]] static auto validate_tokens(TokenSequence const& tokens, std::optional<std::string_view> chartKind)
        -> Expected<void>;

    /**
     * Writes `value` at `tokens`, creating missing intermediate containers.
     * An intermediate node whose kind does not fit the next step (mapping for
     * a field, sequence for an index) is replaced by an empty container of
     * the right kind, discarding what was there. Short sequences are padded:
     * empty containers before an intermediate position, null before the final
     * one. Returns what was stored at the final position before the write.
     *
     * InvalidContainer when a step starts from a node that cannot hold it,
     * which can only happen at the root.
     */
    [[nodiscard]] static auto set_value(Json& document, TokenSequence const& tokens, Json value) -> Expected<MaybeJson>;
};

} // namespace CE
