#include "translate/FacetExtractors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <iterator>
#include <limits>
#include <regex>
#include <utility>

namespace CE::Facets {

namespace {

struct Keyword {
    std::string_view phrase;
    std::string_view result;
};

// Order is precedence: multi-word styles must be tested before their substrings.
constexpr std::array kDashKeywords{
    Keyword{"short dash dot", "ShortDashDot"},
    Keyword{"short dash", "ShortDash"},
    Keyword{"long dash", "LongDash"},
    Keyword{"dashdot", "DashDot"},
    Keyword{"dash-dot", "DashDot"},
    Keyword{"dotted", "Dot"},
    Keyword{"dot", "Dot"},
    Keyword{"dashed", "Dash"},
    Keyword{"dash", "Dash"},
    Keyword{"solid", "Solid"},
};

constexpr std::array kColorNames{
    Keyword{"red", "#FF0000"},
    Keyword{"blue", "#1F77B4"},
    Keyword{"green", "#2CA02C"},
    Keyword{"orange", "#FF7F0E"},
    Keyword{"purple", "#9467BD"},
    Keyword{"yellow", "#F2C200"},
    Keyword{"black", "#000000"},
    Keyword{"white", "#FFFFFF"},
    Keyword{"gray", "#808080"},
    Keyword{"grey", "#808080"},
    Keyword{"pink", "#E377C2"},
    Keyword{"teal", "#17BECF"},
};

constexpr std::array kMarkerSymbols{
    Keyword{"triangle-down", "triangle-down"},
    Keyword{"triangle down", "triangle-down"},
    Keyword{"circle", "circle"},
    Keyword{"square", "square"},
    Keyword{"diamond", "diamond"},
    Keyword{"triangle", "triangle"},
};

constexpr std::array<std::string_view, 10> kOrdinals{
    "first", "second", "third", "fourth", "fifth", "sixth", "seventh", "eighth", "ninth", "tenth"};

constexpr std::array<std::string_view, 7> kNegativePhrases{
    "disable", "turn off", "turn it off", "hide", "remove", "deactivate", "suppress"};

constexpr std::array<std::string_view, 8> kPositivePhrases{
    "enable", "turn on", "turn it on", "show", "display", "activate", "add", "use"};

constexpr std::array<std::string_view, 5> kMarkerKinds{"line", "spline", "area", "areaspline", "scatter"};

constexpr auto kRegexFlags = std::regex::ECMAScript | std::regex::icase;

auto hex_color_re() -> std::regex const& {
    static std::regex const re{R"(#(?:[0-9a-f]{6}|[0-9a-f]{3})(?![0-9a-f]))", kRegexFlags};
    return re;
}

auto rgb_color_re() -> std::regex const& {
    static std::regex const re{R"(rgb\s*\(\s*\d+\s*,\s*\d+\s*,\s*\d+\s*\))", kRegexFlags};
    return re;
}

auto series_number_re() -> std::regex const& {
    static std::regex const re{R"(series\s+(\d+))", kRegexFlags};
    return re;
}

auto ordinal_series_re() -> std::regex const& {
    static std::regex const re{
        R"(\b(first|second|third|fourth|fifth|sixth|seventh|eighth|ninth|tenth)\s+(series|line|bar|column|area)\b)",
        kRegexFlags};
    return re;
}

auto line_width_res() -> std::array<std::regex, 2> const& {
    static std::array<std::regex, 2> const res{
        std::regex{R"((\d+(?:\.\d+)?)\s*(?:px|pt)?\s*(?:line width|linewidth|thickness|stroke))", kRegexFlags},
        std::regex{R"((?:line width|linewidth|thickness|stroke)\s*(?:of|to)?\s*(\d+(?:\.\d+)?)(?:\s*(?:px|pt))?)",
                   kRegexFlags},
    };
    return res;
}

auto radius_res() -> std::array<std::regex, 2> const& {
    static std::array<std::regex, 2> const res{
        std::regex{R"((\d+(?:\.\d+)?)\s*(?:px)?\s*(?:radius|size))", kRegexFlags},
        std::regex{R"((?:radius|size).*?(\d+(?:\.\d+)?)(?:\s*px)?)", kRegexFlags},
    };
    return res;
}

auto fill_opacity_re() -> std::regex const& {
    static std::regex const re{R"(fill opacity.*?(\d+(?:\.\d+)?%?))", kRegexFlags};
    return re;
}

auto inner_size_re() -> std::regex const& {
    static std::regex const re{R"(inner size.*?(\d+%))", kRegexFlags};
    return re;
}

auto donut_size_re() -> std::regex const& {
    static std::regex const re{R"((?:donut|doughnut).*?(\d+%))", kRegexFlags};
    return re;
}

auto color_name_res() -> std::array<std::regex, kColorNames.size()> const& {
    static auto const res = [] {
        std::array<std::regex, kColorNames.size()> out;
        for (std::size_t i = 0; i < kColorNames.size(); ++i) {
            out[i] = std::regex{"\\b" + std::string{kColorNames[i].phrase} + "\\b", kRegexFlags};
        }
        return out;
    }();
    return res;
}

auto contains(std::string_view haystack, std::string_view needle) -> bool {
    return haystack.find(needle) != std::string_view::npos;
}

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
        text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
        text.remove_suffix(1);
    return text;
}

auto parse_number(std::string_view text) -> std::optional<double> {
    double value = 0.0;
    auto   result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto first_capture(std::string const& text, std::regex const& re, std::size_t group = 1) -> std::optional<std::string> {
    std::smatch match;
    if (!std::regex_search(text, match, re)) {
        return std::nullopt;
    }
    return match[group].str();
}

auto series_name(Json const& serie) -> std::string {
    if (!serie.is_object()) {
        return {};
    }
    auto it = serie.find("name");
    if (it == serie.end() || it->is_null()) {
        return {};
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

} // namespace

auto to_lower(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(out), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return out;
}

auto split_sentences(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> sentences;
    std::string              current;
    auto flush = [&] {
        auto trimmed = trim(current);
        if (!trimmed.empty()) {
            sentences.emplace_back(trimmed);
        }
        current.clear();
    };

    for (std::size_t i = 0; i < text.size(); ++i) {
        char const ch = text[i];
        if (ch == '.') {
            bool const digitBefore = i > 0 && std::isdigit(static_cast<unsigned char>(text[i - 1]));
            bool const digitAfter  = i + 1 < text.size() && std::isdigit(static_cast<unsigned char>(text[i + 1]));
            if (digitBefore && digitAfter) {
                current.push_back(ch);
                continue;
            }
            flush();
            continue;
        }
        if (ch == ';' || ch == '\n') {
            flush();
            continue;
        }
        current.push_back(ch);
    }
    flush();
    return sentences;
}

auto mentions_all_series(std::string_view lowered) -> bool {
    return contains(lowered, "all series") || contains(lowered, "every series");
}

auto resolve_targets(std::string_view lowered, Json const& series) -> std::vector<std::size_t> {
    if (!series.is_array() || series.empty()) {
        return {};
    }
    auto const total = series.size();

    if (mentions_all_series(lowered)) {
        std::vector<std::size_t> all(total);
        for (std::size_t i = 0; i < total; ++i) {
            all[i] = i;
        }
        return all;
    }

    std::string const sentence{lowered};
    if (auto number = first_capture(sentence, series_number_re())) {
        std::size_t ordinal = 0;
        auto result = std::from_chars(number->data(), number->data() + number->size(), ordinal);
        if (result.ec == std::errc{} && ordinal >= 1 && ordinal <= total) {
            return {ordinal - 1};
        }
        return {};
    }

    if (auto word = first_capture(sentence, ordinal_series_re())) {
        auto lowerWord = to_lower(*word);
        auto it        = std::find(kOrdinals.begin(), kOrdinals.end(), lowerWord);
        auto index     = static_cast<std::size_t>(std::distance(kOrdinals.begin(), it));
        if (it != kOrdinals.end() && index < total) {
            return {index};
        }
        return {};
    }

    for (std::size_t i = 0; i < total; ++i) {
        auto name = to_lower(series_name(series[i]));
        if (!name.empty() && contains(lowered, name)) {
            return {i};
        }
    }

    if (contains(lowered, "series") && total == 1) {
        return {0};
    }
    return {};
}

auto detect_bool(std::string_view lowered) -> std::optional<bool> {
    for (auto phrase : kNegativePhrases) {
        if (contains(lowered, phrase)) {
            return false;
        }
    }
    for (auto phrase : kPositivePhrases) {
        if (contains(lowered, phrase)) {
            return true;
        }
    }
    return std::nullopt;
}

auto extract_color(std::string const& sentence) -> std::optional<std::string> {
    std::smatch match;
    if (std::regex_search(sentence, match, hex_color_re())) {
        auto hex = match[0].str();
        std::transform(hex.begin(), hex.end(), hex.begin(), [](unsigned char ch) {
            return static_cast<char>(std::toupper(ch));
        });
        return hex;
    }
    if (std::regex_search(sentence, match, rgb_color_re())) {
        return match[0].str();
    }
    auto const  lowered = to_lower(sentence);
    auto const& names   = color_name_res();
    for (std::size_t i = 0; i < kColorNames.size(); ++i) {
        if (std::regex_search(lowered, names[i])) {
            return std::string{kColorNames[i].result};
        }
    }
    return std::nullopt;
}

auto extract_dash_style(std::string_view lowered) -> std::optional<std::string> {
    for (auto const& keyword : kDashKeywords) {
        if (contains(lowered, keyword.phrase)) {
            return std::string{keyword.result};
        }
    }
    return std::nullopt;
}

auto number_to_json(double value) -> Json {
    if (std::isfinite(value) && std::floor(value) == value
        && std::fabs(value) < static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
        return Json(static_cast<std::int64_t>(value));
    }
    return Json(value);
}

auto extract_line_width(std::string const& lowered) -> std::optional<Json> {
    for (auto const& re : line_width_res()) {
        if (auto captured = first_capture(lowered, re)) {
            if (auto value = parse_number(*captured)) {
                return number_to_json(*value);
            }
        }
    }
    return std::nullopt;
}

auto extract_marker_radius(std::string const& lowered) -> std::optional<Json> {
    for (auto const& re : radius_res()) {
        if (auto captured = first_capture(lowered, re)) {
            if (auto value = parse_number(*captured)) {
                return number_to_json(*value);
            }
        }
    }
    return std::nullopt;
}

auto extract_marker_symbol(std::string_view lowered) -> std::optional<std::string> {
    for (auto const& keyword : kMarkerSymbols) {
        if (contains(lowered, keyword.phrase)) {
            return std::string{keyword.result};
        }
    }
    return std::nullopt;
}

auto extract_fill_opacity(std::string const& lowered) -> std::optional<double> {
    auto captured = first_capture(lowered, fill_opacity_re());
    if (!captured) {
        return std::nullopt;
    }
    std::string_view text{*captured};
    bool const percent = !text.empty() && text.back() == '%';
    if (percent) {
        text.remove_suffix(1);
    }
    auto value = parse_number(text);
    if (!value) {
        return std::nullopt;
    }
    double numeric = percent ? *value / 100.0 : *value;
    return std::clamp(numeric, 0.0, 1.0);
}

auto extract_inner_size(std::string const& lowered) -> std::optional<std::string> {
    if (auto size = first_capture(lowered, inner_size_re())) {
        return size;
    }
    if (auto size = first_capture(lowered, donut_size_re())) {
        return size;
    }
    if (contains(lowered, "donut") || contains(lowered, "doughnut")) {
        return std::string{"60%"};
    }
    return std::nullopt;
}

auto marker_enabled_path(std::optional<std::string_view> chartKind) -> std::string {
    if (chartKind && std::find(kMarkerKinds.begin(), kMarkerKinds.end(), *chartKind) != kMarkerKinds.end()) {
        return "plotOptions." + std::string{*chartKind} + ".marker.enabled";
    }
    return "plotOptions.series.marker.enabled";
}

} // namespace CE::Facets
