#include "path/PathExpression.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>
#include <string_view>

namespace {

using CE::Error;
using CE::Expected;
using CE::TokenSequence;

auto make_path_error(std::string message) -> Error {
    return Error{Error::Code::MalformedPath, std::move(message)};
}

auto is_digits(std::string_view text) -> bool {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char ch) {
        return std::isdigit(ch) != 0;
    });
}

} // namespace

namespace CE {

auto parse_path(std::string_view path) -> Expected<TokenSequence> {
    if (path.empty()) {
        return std::unexpected(make_path_error("Update paths cannot be empty."));
    }

    TokenSequence tokens;
    std::string   buffer;
    auto flush = [&] {
        if (!buffer.empty()) {
            tokens.emplace_back(std::move(buffer));
            buffer.clear();
        }
    };

    std::size_t pos = 0;
    while (pos < path.size()) {
        char const ch = path[pos];
        if (ch == '.') {
            flush();
            ++pos;
            continue;
        }
        if (ch == '[') {
            flush();
            auto close = path.find(']', pos);
            if (close == std::string_view::npos) {
                return std::unexpected(make_path_error("Unmatched '[' in path " + std::string{path} + "."));
            }
            auto digits = path.substr(pos + 1, close - pos - 1);
            if (!is_digits(digits)) {
                return std::unexpected(make_path_error("List index must be numeric in path " + std::string{path} + "."));
            }
            std::size_t index = 0;
            auto result = std::from_chars(digits.data(), digits.data() + digits.size(), index);
            if (result.ec != std::errc{}) {
                return std::unexpected(make_path_error("List index out of range in path " + std::string{path} + "."));
            }
            tokens.emplace_back(index);
            pos = close + 1;
            continue;
        }
        buffer.push_back(ch);
        ++pos;
    }
    flush();

    if (tokens.empty()) {
        return std::unexpected(make_path_error("Path " + std::string{path} + " contains no segments."));
    }
    return tokens;
}

auto stringify_tokens(TokenSequence const& tokens) -> std::string {
    std::string out;
    for (auto const& token : tokens) {
        if (auto const* index = std::get_if<std::size_t>(&token)) {
            out.push_back('[');
            out.append(std::to_string(*index));
            out.push_back(']');
            continue;
        }
        if (!out.empty()) {
            out.push_back('.');
        }
        out.append(std::get<std::string>(token));
    }
    return out;
}

auto normalize_tokens(TokenSequence const& tokens) -> std::string {
    std::vector<std::string> segments;
    segments.reserve(tokens.size());
    for (auto const& token : tokens) {
        if (is_index(token)) {
            if (segments.empty()) {
                segments.emplace_back(kAnyIndexMarker);
            } else {
                segments.back().append(kAnyIndexMarker);
            }
            continue;
        }
        segments.push_back(std::get<std::string>(token));
    }

    std::string pattern;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) {
            pattern.push_back('.');
        }
        pattern.append(segments[i]);
    }
    return pattern;
}

} // namespace CE
