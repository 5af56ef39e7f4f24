#pragma once

#include <chartedit/core/Json.hpp>

#include "core/UpdateRecord.hpp"

#include <string_view>

namespace CE {

/**
 * Turns free-form editing instructions into path/value updates.
 *
 * Text is split into sentences and each sentence is handled on its own: the
 * series it targets are resolved first, then every facet extractor runs
 * (color, dash style, line width, data labels, legend, markers, area fill
 * opacity, pie sizing). Updates come out in sentence order and, within a
 * sentence, in extractor order. Facets that need a series are dropped when
 * no series was resolved; chart-wide facets are emitted regardless.
 *
 * Never fails. Sentences that match nothing contribute nothing.
 */
class InstructionTranslator {
public:
    [[nodiscard]] static auto translate(std::string_view instructions, Json const& document) -> UpdateList;
};

} // namespace CE
