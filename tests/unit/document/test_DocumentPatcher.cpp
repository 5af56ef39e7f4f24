#include <doctest/doctest.h>

#include "document/DocumentPatcher.hpp"

#include <string>

using namespace CE;

namespace {

auto tokens_of(std::string_view path) -> TokenSequence {
    auto parsed = parse_path(path);
    REQUIRE(parsed.has_value());
    return *parsed;
}

} // namespace

TEST_SUITE("document.patcher") {

TEST_CASE("get distinguishes a stored null from no value") {
    Json document = Json::parse(R"({"title": {"text": null}, "series": [{"name": "Alpha"}]})");

    auto stored = DocumentPatcher::get_value(document, tokens_of("title.text"));
    REQUIRE(stored.has_value());
    CHECK(stored->is_null());

    CHECK_FALSE(DocumentPatcher::get_value(document, tokens_of("title.style")).has_value());
    CHECK_FALSE(DocumentPatcher::get_value(document, tokens_of("series[1].name")).has_value());
    CHECK_FALSE(DocumentPatcher::get_value(document, tokens_of("series.name")).has_value());
    CHECK_FALSE(DocumentPatcher::get_value(document, tokens_of("title[0]")).has_value());
    CHECK(DocumentPatcher::get_value(document, tokens_of("series[0].name")) == Json("Alpha"));
}

TEST_CASE("set then get returns the written value") {
    Json document = Json::object();
    auto tokens   = tokens_of("plotOptions.series.dataLabels.enabled");

    auto previous = DocumentPatcher::set_value(document, tokens, true);
    REQUIRE(previous.has_value());
    CHECK_FALSE(previous->has_value());
    CHECK(DocumentPatcher::get_value(document, tokens) == Json(true));

    auto again = DocumentPatcher::set_value(document, tokens, true);
    REQUIRE(again.has_value());
    CHECK(*again == Json(true));
    CHECK(document == Json::parse(R"({"plotOptions": {"series": {"dataLabels": {"enabled": true}}}})"));
}

TEST_CASE("missing sequences are padded with containers and null") {
    Json document = Json::object();
    auto written  = DocumentPatcher::set_value(document, tokens_of("series[2].color"), "#FF0000");
    REQUIRE(written.has_value());
    CHECK_FALSE(written->has_value());
    CHECK(document["series"] == Json::parse(R"([{}, {}, {"color": "#FF0000"}])"));

    Json list = Json{{"values", Json::array({1})}};
    auto tail = DocumentPatcher::set_value(list, tokens_of("values[3]"), 4);
    REQUIRE(tail.has_value());
    CHECK_FALSE(tail->has_value());
    CHECK(list["values"] == Json::parse("[1, null, null, 4]"));
}

TEST_CASE("mismatched intermediates are replaced") {
    Json document = Json::parse(R"({"legend": false, "series": {"oops": 1}})");

    REQUIRE(DocumentPatcher::set_value(document, tokens_of("legend.enabled"), true).has_value());
    CHECK(document["legend"] == Json{{"enabled", true}});

    REQUIRE(DocumentPatcher::set_value(document, tokens_of("series[0].name"), "Alpha").has_value());
    CHECK(document["series"] == Json::parse(R"([{"name": "Alpha"}])"));
}

TEST_CASE("a root that cannot hold the first step is InvalidContainer") {
    Json list = Json::array();
    auto field = DocumentPatcher::set_value(list, tokens_of("title.text"), "x");
    REQUIRE_FALSE(field.has_value());
    CHECK(field.error().code == Error::Code::InvalidContainer);

    Json mapping = Json::object();
    auto index   = DocumentPatcher::set_value(mapping, tokens_of("[0].name"), "x");
    REQUIRE_FALSE(index.has_value());
    CHECK(index.error().code == Error::Code::InvalidContainer);

    Json scalar = 5;
    CHECK_FALSE(DocumentPatcher::set_value(scalar, tokens_of("a"), 1).has_value());
}

TEST_CASE("validation follows the chart kind") {
    CHECK(DocumentPatcher::validate_tokens(tokens_of("series[4].color"), std::nullopt).has_value());
    CHECK(DocumentPatcher::validate_tokens(tokens_of("plotOptions.area.fillOpacity"), "area").has_value());

    auto wrongKind = DocumentPatcher::validate_tokens(tokens_of("plotOptions.area.fillOpacity"), "line");
    REQUIRE_FALSE(wrongKind.has_value());
    CHECK(wrongKind.error().code == Error::Code::PathNotEditable);
    CHECK(wrongKind.error().message == "Path 'plotOptions.area.fillOpacity' is not editable for chart type 'line'.");

    auto unknownField = DocumentPatcher::validate_tokens(tokens_of("series[0].unknownField"), "area");
    REQUIRE_FALSE(unknownField.has_value());
    CHECK(unknownField.error().message == "Path 'series[].unknownField' is not editable for chart type 'area'.");

    auto generic = DocumentPatcher::validate_tokens(tokens_of("credits.enabled"), std::nullopt);
    REQUIRE_FALSE(generic.has_value());
    CHECK(generic.error().message == "Path 'credits.enabled' is not editable for chart type 'generic'.");
}

} // TEST_SUITE
