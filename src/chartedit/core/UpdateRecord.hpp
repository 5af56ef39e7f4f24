#pragma once

#include <chartedit/core/Json.hpp>

#include <string>
#include <vector>

namespace CE {

// One intended write, independent of any document until applied.
struct UpdateRecord {
    std::string path;
    Json        value;

    auto operator==(UpdateRecord const&) const -> bool = default;
};

// The outcome of applying an UpdateRecord. `before` is empty when nothing was stored.
struct ChangeRecord {
    std::string path;
    MaybeJson   before;
    Json        after;
};

using UpdateList = std::vector<UpdateRecord>;
using ChangeLog  = std::vector<ChangeRecord>;

[[nodiscard]] inline auto update_to_json(UpdateRecord const& update) -> Json {
    return Json{{"path", update.path}, {"value", update.value}};
}

[[nodiscard]] inline auto change_to_json(ChangeRecord const& change) -> Json {
    return Json{{"path", change.path}, {"before", change.before.value_or(Json(nullptr))}, {"after", change.after}};
}

[[nodiscard]] inline auto changes_to_json(ChangeLog const& changes) -> Json {
    Json out = Json::array();
    for (auto const& change : changes) {
        out.push_back(change_to_json(change));
    }
    return out;
}

} // namespace CE
