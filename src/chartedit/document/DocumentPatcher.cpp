#include "document/DocumentPatcher.hpp"

#include "log/TaggedLogger.hpp"
#include "schema/EditableFields.hpp"

#include <string>
#include <utility>

namespace {

using CE::Error;
using CE::Json;
using CE::PathToken;

auto container_for(PathToken const& next) -> Json {
    return CE::is_index(next) ? Json::array() : Json::object();
}

auto fits(Json const& node, PathToken const& next) -> bool {
    return CE::is_index(next) ? node.is_array() : node.is_object();
}

auto describe_token(PathToken const& token) -> std::string {
    if (auto const* index = std::get_if<std::size_t>(&token)) {
        return std::to_string(*index);
    }
    return "'" + std::get<std::string>(token) + "'";
}

auto container_error(PathToken const& token, Json const& node) -> Error {
    std::string expected = CE::is_index(token) ? "list" : "mapping";
    return Error{Error::Code::InvalidContainer,
                 "Expected " + expected + " while updating path segment " + describe_token(token) + ", found "
                     + std::string{node.type_name()} + "."};
}

} // namespace

namespace CE {

auto DocumentPatcher::get_value(Json const& document, TokenSequence const& tokens) -> MaybeJson {
    Json const* current = &document;
    for (auto const& token : tokens) {
        if (auto const* index = std::get_if<std::size_t>(&token)) {
            if (!current->is_array() || *index >= current->size()) {
                return std::nullopt;
            }
            current = &(*current)[*index];
            continue;
        }
        auto const& field = std::get<std::string>(token);
        if (!current->is_object()) {
            return std::nullopt;
        }
        auto it = current->find(field);
        if (it == current->end()) {
            return std::nullopt;
        }
        current = &*it;
    }
    return *current;
}

auto DocumentPatcher::validate_tokens(TokenSequence const& tokens, std::optional<std::string_view> chartKind)
    -> Expected<void> {
    auto const pattern = normalize_tokens(tokens);
    auto const allowed = Schema::allowed_patterns(chartKind);
    if (allowed.contains(pattern)) {
        return {};
    }
    std::string kind = chartKind && !chartKind->empty() ? std::string{*chartKind} : std::string{"generic"};
    ce_log("rejected pattern " + pattern + " for " + kind, "Patcher");
    return std::unexpected(Error{Error::Code::PathNotEditable,
                                 "Path '" + pattern + "' is not editable for chart type '" + kind + "'."});
}

auto DocumentPatcher::set_value(Json& document, TokenSequence const& tokens, Json value) -> Expected<MaybeJson> {
    if (tokens.empty()) {
        return std::unexpected(Error{Error::Code::MalformedPath, "Update paths cannot be empty."});
    }

    Json* current = &document;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        auto const& token  = tokens[i];
        bool const  isLast = i + 1 == tokens.size();

        if (auto const* index = std::get_if<std::size_t>(&token)) {
            if (!current->is_array()) {
                return std::unexpected(container_error(token, *current));
            }
            if (isLast) {
                MaybeJson previous;
                if (*index < current->size()) {
                    previous = (*current)[*index];
                }
                while (current->size() <= *index) {
                    current->push_back(nullptr);
                }
                (*current)[*index] = std::move(value);
                return previous;
            }
            auto const& next = tokens[i + 1];
            while (current->size() <= *index) {
                current->push_back(container_for(next));
            }
            Json& slot = (*current)[*index];
            if (!fits(slot, next)) {
                slot = container_for(next);
            }
            current = &slot;
            continue;
        }

        auto const& field = std::get<std::string>(token);
        if (!current->is_object()) {
            return std::unexpected(container_error(token, *current));
        }
        if (isLast) {
            MaybeJson previous;
            if (auto it = current->find(field); it != current->end()) {
                previous = *it;
            }
            (*current)[field] = std::move(value);
            return previous;
        }
        auto const& next = tokens[i + 1];
        auto        it   = current->find(field);
        if (it == current->end() || !fits(*it, next)) {
            if (it != current->end()) {
                ce_log("replacing " + std::string{it->type_name()} + " at '" + field + "'", "Patcher");
            }
            (*current)[field] = container_for(next);
            it = current->find(field);
        }
        current = &*it;
    }
    return std::nullopt;
}

} // namespace CE
