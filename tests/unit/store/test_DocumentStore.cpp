#include <doctest/doctest.h>

#include <chartedit/ChartEditOptions.hpp>
#include <chartedit/store/DocumentStore.hpp>

#include <filesystem>
#include <fstream>
#include <string>

using namespace CE;

namespace {

#ifndef CHARTEDIT_TEST_TMPDIR
#define CHARTEDIT_TEST_TMPDIR "chartedit_test_tmp"
#endif

// Fresh directory per test case, removed afterwards.
struct ScratchDir {
    explicit ScratchDir(std::string const& name)
        : path(std::filesystem::path{CHARTEDIT_TEST_TMPDIR} / name) {
        std::filesystem::remove_all(path);
    }
    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
    std::filesystem::path path;
};

auto sample_payload() -> Json {
    return make_chart_payload(Json::parse(R"({"chart": {"type": "line"}, "series": [{"name": "Alpha"}]})"));
}

} // namespace

TEST_SUITE("store.document_store") {

TEST_CASE("in-memory store round-trips independent copies") {
    InMemoryDocumentStore store;
    CHECK_FALSE(store.contains("chart-1"));

    auto saved = store.persist(sample_payload(), "chart-1");
    REQUIRE(saved.has_value());
    CHECK(*saved == "chart-1");
    CHECK(store.contains("chart-1"));

    auto loaded = store.load("chart-1");
    REQUIRE(loaded.has_value());
    (*loaded)["data"]["title"] = Json{{"text", "local only"}};

    auto reloaded = store.load("chart-1");
    REQUIRE(reloaded.has_value());
    CHECK_FALSE((*reloaded)["data"].contains("title"));
}

TEST_CASE("load and persist report argument and lookup failures") {
    InMemoryDocumentStore store;

    auto missing = store.load("nope");
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == Error::Code::NotFound);
    CHECK(missing.error().message == "No chart payload found for ID nope.");

    auto empty = store.load("");
    REQUIRE_FALSE(empty.has_value());
    CHECK(empty.error().code == Error::Code::InvalidArgument);

    auto noId = store.persist(sample_payload(), "");
    REQUIRE_FALSE(noId.has_value());
    CHECK(noId.error().code == Error::Code::InvalidArgument);

    auto notMapping = store.persist(Json::array({1, 2}), "list");
    REQUIRE_FALSE(notMapping.has_value());
    CHECK(notMapping.error().code == Error::Code::InvalidFormat);
}

TEST_CASE("file store writes one json file per payload") {
    ScratchDir dir{"file_store_roundtrip"};
    FileDocumentStore store{dir.path};

    REQUIRE(store.persist(sample_payload(), "sales_q3").has_value());
    CHECK(std::filesystem::exists(dir.path / "sales_q3.json"));
    CHECK_FALSE(std::filesystem::exists(dir.path / "sales_q3.json.tmp"));

    auto loaded = store.load("sales_q3");
    REQUIRE(loaded.has_value());
    CHECK(*loaded == sample_payload());

    auto missing = store.load("other");
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == Error::Code::NotFound);
}

TEST_CASE("file store rejects unsafe identifiers and bad content") {
    ScratchDir dir{"file_store_rejects"};
    FileDocumentStore store{dir.path};

    for (auto const* id : {"../escape", ".hidden", "a/b", "with space"}) {
        CAPTURE(id);
        auto result = store.persist(sample_payload(), id);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::InvalidArgument);
    }

    std::filesystem::create_directories(dir.path);
    {
        std::ofstream out(dir.path / "garbage.json");
        out << "{not json";
    }
    {
        std::ofstream out(dir.path / "scalar.json");
        out << "42";
    }
    auto garbage = store.load("garbage");
    REQUIRE_FALSE(garbage.has_value());
    CHECK(garbage.error().code == Error::Code::InvalidFormat);

    auto scalar = store.load("scalar");
    REQUIRE_FALSE(scalar.has_value());
    CHECK(scalar.error().code == Error::Code::InvalidFormat);
}

TEST_CASE("identifier rules") {
    CHECK(is_payload_identifier("chart-1.v2_final"));
    CHECK_FALSE(is_payload_identifier(""));
    CHECK_FALSE(is_payload_identifier(".env"));
    CHECK_FALSE(is_payload_identifier("a\\b"));
}

TEST_CASE("chart options come from data when it is a mapping") {
    Json envelope = sample_payload();
    auto options  = extract_chart_options(envelope);
    REQUIRE(options.has_value());
    CHECK(*options == &envelope["data"]);

    Json bare = Json{{"chart", {{"type", "pie"}}}};
    auto self = extract_chart_options(bare);
    REQUIRE(self.has_value());
    CHECK(*self == &bare);

    Json odd = Json{{"data", "not options"}, {"series", Json::array()}};
    auto fallback = extract_chart_options(odd);
    REQUIRE(fallback.has_value());
    CHECK(*fallback == &odd);

    Json list = Json::array();
    auto failed = extract_chart_options(list);
    REQUIRE_FALSE(failed.has_value());
    CHECK(failed.error().code == Error::Code::InvalidFormat);
}

TEST_CASE("the factory follows the configured backend") {
    ScratchDir       dir{"factory"};
    ChartEditOptions options;
    options.store_backend = "memory";
    auto memory           = make_document_store(options);
    REQUIRE(memory != nullptr);
    CHECK(dynamic_cast<InMemoryDocumentStore*>(memory.get()) != nullptr);

    options.store_backend = "file";
    options.store_root    = dir.path.string();
    auto file             = make_document_store(options);
    auto* fileStore       = dynamic_cast<FileDocumentStore*>(file.get());
    REQUIRE(fileStore != nullptr);
    CHECK(fileStore->root() == dir.path);
}

} // TEST_SUITE
