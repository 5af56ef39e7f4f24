#include <doctest/doctest.h>

#include "orchestrate/UpdateOrchestrator.hpp"

#include <string>

using namespace CE;

TEST_SUITE("orchestrate.updates") {

TEST_CASE("normalize accepts mappings, record lists and pairs") {
    SUBCASE("mapping keeps key order") {
        auto updates = UpdateOrchestrator::normalize_updates(
                Json::parse(R"({"title.text": "Revenue", "series[0].color": "#00FF00"})"));
        REQUIRE(updates.size() == 2);
        CHECK(updates[0] == UpdateRecord{"title.text", "Revenue"});
        CHECK(updates[1] == UpdateRecord{"series[0].color", "#00FF00"});
    }
    SUBCASE("sequence of records and pairs, malformed items skipped") {
        auto updates = UpdateOrchestrator::normalize_updates(Json::parse(R"([
            {"path": "legend.enabled", "value": false},
            ["series[1].lineWidth", 4],
            {"path": "title.text"},
            ["only one"],
            7
        ])"));
        REQUIRE(updates.size() == 2);
        CHECK(updates[0] == UpdateRecord{"legend.enabled", false});
        CHECK(updates[1] == UpdateRecord{"series[1].lineWidth", 4});
    }
    SUBCASE("non-string paths become empty") {
        auto updates = UpdateOrchestrator::normalize_updates(Json::parse(R"([[3, "x"]])"));
        REQUIRE(updates.size() == 1);
        CHECK(updates[0].path.empty());
    }
    SUBCASE("scalars give nothing") {
        CHECK(UpdateOrchestrator::normalize_updates(Json(nullptr)).empty());
        CHECK(UpdateOrchestrator::normalize_updates(Json(12)).empty());
    }
}

TEST_CASE("normalize text tries JSON first, then key=value lines") {
    auto fromJson = UpdateOrchestrator::normalize_updates(Json(R"(  {"legend.enabled": true}  )"));
    REQUIRE(fromJson.size() == 1);
    CHECK(fromJson[0] == UpdateRecord{"legend.enabled", true});

    auto fromLines = UpdateOrchestrator::normalize_updates_text(
            "# comment\nseries[0].color = #FF0000\n\nseries[0].lineWidth=2\nno equals sign\ntitle.text = \"Q3\"");
    REQUIRE(fromLines.size() == 3);
    CHECK(fromLines[0] == UpdateRecord{"series[0].color", "#FF0000"});
    CHECK(fromLines[1] == UpdateRecord{"series[0].lineWidth", 2});
    CHECK(fromLines[2] == UpdateRecord{"title.text", "Q3"});

    CHECK(UpdateOrchestrator::normalize_updates_text("   \n ").empty());
    CHECK(UpdateOrchestrator::normalize_updates_text(R"("just a string")").empty());
}

TEST_CASE("explicit updates come before translated ones") {
    Json document = Json::parse(R"({"chart": {"type": "line"}, "series": [{"name": "Alpha"}]})");
    UpdateList explicitUpdates{{"title.text", "Sales"}};

    auto updates = UpdateOrchestrator::collect_updates(document, explicitUpdates, "Make the series green");
    REQUIRE(updates.size() == 2);
    CHECK(updates[0] == UpdateRecord{"title.text", "Sales"});
    CHECK(updates[1] == UpdateRecord{"series[0].color", "#2CA02C"});

    CHECK(UpdateOrchestrator::collect_updates(document, {}, std::nullopt).empty());
}

TEST_CASE("apply records before and after for every write") {
    Json document = Json::parse(R"({"chart": {"type": "area"}, "series": [{"name": "Area", "color": "#111111"}]})");

    auto changes = UpdateOrchestrator::apply(document,
                                             Json::parse(R"({"series[0].color": "#222222", "": 1})"),
                                             "Set the fill opacity to 40%");
    REQUIRE(changes.has_value());
    REQUIRE(changes->size() == 2);

    CHECK((*changes)[0].path == "series[0].color");
    CHECK((*changes)[0].before == std::optional<Json>{Json("#111111")});
    CHECK((*changes)[0].after == Json("#222222"));
    CHECK((*changes)[1].path == "plotOptions.area.fillOpacity");
    CHECK_FALSE((*changes)[1].before.has_value());
    CHECK(document["plotOptions"]["area"]["fillOpacity"].get<double>() == doctest::Approx(0.4));

    auto serialized = changes_to_json(*changes);
    CHECK(serialized[1]["before"].is_null());
    CHECK(serialized[0] == Json{{"path", "series[0].color"}, {"before", "#111111"}, {"after", "#222222"}});
}

TEST_CASE("reapplying a record sees the previous write as before") {
    Json       document = Json::parse(R"({"chart": {"type": "line"}, "series": [{"name": "Alpha"}]})");
    UpdateList updates{{"series[0].lineWidth", 4}};

    auto first = UpdateOrchestrator::apply_updates(document, updates);
    REQUIRE(first.has_value());
    REQUIRE(first->size() == 1);
    CHECK_FALSE((*first)[0].before.has_value());

    auto second = UpdateOrchestrator::apply_updates(document, updates);
    REQUIRE(second.has_value());
    REQUIRE(second->size() == 1);
    CHECK((*second)[0].before == std::optional<Json>{(*first)[0].after});
    CHECK((*second)[0].after == (*first)[0].after);
    CHECK(document["series"][0]["lineWidth"] == 4);
}

TEST_CASE("the first failing record stops the run") {
    Json document = Json::parse(R"({"chart": {"type": "area"}, "series": [{"name": "Area"}]})");
    UpdateList updates{
            {"title.text", "Kept"},
            {"series[0].unknownField", 1},
            {"legend.enabled", false},
    };

    auto result = UpdateOrchestrator::apply_updates(document, updates);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == Error::Code::PathNotEditable);
    CHECK(result.error().message == "Path 'series[].unknownField' is not editable for chart type 'area'.");
    CHECK(document["title"]["text"] == "Kept");
    CHECK_FALSE(document.contains("legend"));
}

TEST_CASE("malformed paths surface as MalformedPath") {
    Json document = Json::object();
    auto result   = UpdateOrchestrator::apply_updates(document, UpdateList{{"series[x].color", "red"}});
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == Error::Code::MalformedPath);
    CHECK(document.empty());
}

TEST_CASE("validation uses the chart kind in force when each record runs") {
    Json document = Json::parse(R"({"chart": {"type": "line"}})");
    UpdateList updates{
            {"plotOptions.pie.innerSize", "50%"},
    };
    CHECK_FALSE(UpdateOrchestrator::apply_updates(document, updates).has_value());

    document["chart"]["type"] = "pie";
    auto changes = UpdateOrchestrator::apply_updates(document, updates);
    REQUIRE(changes.has_value());
    CHECK(document["plotOptions"]["pie"]["innerSize"] == "50%");
}

} // TEST_SUITE
