#pragma once

#include <nlohmann/json.hpp>

#include <optional>

namespace CE {

// Mappings keep insertion order so documents round-trip the way they were stored.
using Json = nlohmann::ordered_json;

// A read that found nothing. Distinct from a stored JSON null.
using MaybeJson = std::optional<Json>;

} // namespace CE
