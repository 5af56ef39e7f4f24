#pragma once

#include <chartedit/core/Error.hpp>
#include <chartedit/core/Json.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace CE::History {

// Makes sure `payload.meta` is a mapping holding a `history` array.
// A scalar `meta` is kept as `{"note": ...}`.
[[nodiscard]] auto ensure_metadata(Json& payload) -> Expected<void>;

/**
 * Appends `{timestamp, actor, action[, details]}` to `payload.meta.history`.
 * Writes go straight through the DocumentPatcher; metadata is not part of
 * the editable chart options and is not checked against the schema.
 */
[[nodiscard]] auto append_history_entry(Json&            payload,
                                        std::string_view actor,
                                        std::string_view action,
                                        Json const&      details = Json(nullptr)) -> Expected<void>;

// ISO-8601 UTC with millisecond precision and a trailing 'Z'.
[[nodiscard]] auto utc_timestamp(std::chrono::system_clock::time_point when) -> std::string;

} // namespace CE::History
