#include "orchestrate/UpdateOrchestrator.hpp"

#include "document/DocumentPatcher.hpp"
#include "log/TaggedLogger.hpp"
#include "path/PathExpression.hpp"
#include "schema/EditableFields.hpp"
#include "translate/InstructionTranslator.hpp"

#include <cctype>
#include <string>
#include <utility>

namespace CE {

namespace {

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
        text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
        text.remove_suffix(1);
    return text;
}

auto path_of(Json const& value) -> std::string {
    return value.is_string() ? value.get<std::string>() : std::string{};
}

} // namespace

auto UpdateOrchestrator::parse_key_value_lines(std::string_view raw) -> UpdateList {
    UpdateList updates;
    while (!raw.empty()) {
        auto newline = raw.find('\n');
        auto line    = trim(raw.substr(0, newline));
        raw.remove_prefix(newline == std::string_view::npos ? raw.size() : newline + 1);

        if (line.empty() || line.front() == '#') {
            continue;
        }
        auto equals = line.find('=');
        if (equals == std::string_view::npos) {
            continue;
        }
        auto path  = trim(line.substr(0, equals));
        auto value = trim(line.substr(equals + 1));

        auto parsed = Json::parse(std::string{value}, nullptr, false);
        if (parsed.is_discarded()) {
            parsed = Json(std::string{value});
        }
        updates.push_back({std::string{path}, std::move(parsed)});
    }
    return updates;
}

auto UpdateOrchestrator::normalize_updates_text(std::string_view raw) -> UpdateList {
    auto text = trim(raw);
    if (text.empty()) {
        return {};
    }
    auto parsed = Json::parse(std::string{text}, nullptr, false);
    if (parsed.is_discarded()) {
        return parse_key_value_lines(text);
    }
    if (parsed.is_string()) {
        return {};
    }
    return normalize_updates(parsed);
}

auto UpdateOrchestrator::normalize_updates(Json const& raw) -> UpdateList {
    UpdateList updates;
    switch (raw.type()) {
    case Json::value_t::string:
        return normalize_updates_text(raw.get_ref<std::string const&>());
    case Json::value_t::object:
        for (auto it = raw.begin(); it != raw.end(); ++it) {
            updates.push_back({it.key(), it.value()});
        }
        return updates;
    case Json::value_t::array:
        for (auto const& item : raw) {
            if (item.is_object() && item.contains("path") && item.contains("value")) {
                updates.push_back({path_of(item["path"]), item["value"]});
            } else if (item.is_array() && item.size() == 2) {
                updates.push_back({path_of(item[0]), item[1]});
            }
        }
        return updates;
    case Json::value_t::null:
    case Json::value_t::boolean:
    case Json::value_t::number_integer:
    case Json::value_t::number_unsigned:
    case Json::value_t::number_float:
    case Json::value_t::binary:
    case Json::value_t::discarded:
        return updates;
    }
    return updates;
}

auto UpdateOrchestrator::collect_updates(Json const&                     document,
                                         UpdateList                      explicitUpdates,
                                         std::optional<std::string_view> instructions) -> UpdateList {
    if (instructions && !instructions->empty()) {
        auto translated = InstructionTranslator::translate(*instructions, document);
        explicitUpdates.insert(explicitUpdates.end(),
                               std::make_move_iterator(translated.begin()),
                               std::make_move_iterator(translated.end()));
    }
    return explicitUpdates;
}

auto UpdateOrchestrator::apply_updates(Json& document, UpdateList const& updates) -> Expected<ChangeLog> {
    ChangeLog changes;
    for (auto const& update : updates) {
        if (update.path.empty()) {
            continue;
        }
        auto tokens = parse_path(update.path);
        if (!tokens) {
            ce_log(describeError(tokens.error()), "Orchestrator", "ERROR");
            return std::unexpected(tokens.error());
        }

        auto const kind = Schema::chart_kind(document);
        std::optional<std::string_view> kindView;
        if (kind) {
            kindView = *kind;
        }
        if (auto valid = DocumentPatcher::validate_tokens(*tokens, kindView); !valid) {
            ce_log(describeError(valid.error()), "Orchestrator", "ERROR");
            return std::unexpected(valid.error());
        }

        auto previous = DocumentPatcher::get_value(document, *tokens);
        auto written  = DocumentPatcher::set_value(document, *tokens, update.value);
        if (!written) {
            ce_log(describeError(written.error()), "Orchestrator", "ERROR");
            return std::unexpected(written.error());
        }
        changes.push_back({update.path, std::move(previous), update.value});
    }
    ce_log("applied " + std::to_string(changes.size()) + " change(s)", "Orchestrator");
    return changes;
}

auto UpdateOrchestrator::apply(Json&                           document,
                               Json const&                     explicitUpdates,
                               std::optional<std::string_view> instructions) -> Expected<ChangeLog> {
    auto updates = collect_updates(document, normalize_updates(explicitUpdates), instructions);
    return apply_updates(document, updates);
}

} // namespace CE
