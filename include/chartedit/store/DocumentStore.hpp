#pragma once

#include <chartedit/core/Error.hpp>
#include <chartedit/core/Json.hpp>

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace CE {

struct ChartEditOptions;

inline constexpr std::string_view kPayloadType = "highcharts";

/**
 * Keyed storage for chart payloads. Payloads are mappings, normally the
 * envelope `{"type": "highcharts", "data": <chart options>, "meta": {...}}`.
 * load() hands out an independent copy; nothing the caller does to it is
 * visible in the store until persist().
 */
class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    auto load(std::string const& id) -> Expected<Json>;
    auto persist(Json const& payload, std::string const& id) -> Expected<std::string>;
    auto contains(std::string const& id) -> bool;

protected:
    virtual auto read_document(std::string const& id) -> Expected<MaybeJson>              = 0;
    virtual auto write_document(std::string const& id, Json const& payload) -> Expected<void> = 0;
};

class InMemoryDocumentStore final : public DocumentStore {
private:
    auto read_document(std::string const& id) -> Expected<MaybeJson> override;
    auto write_document(std::string const& id, Json const& payload) -> Expected<void> override;

    std::unordered_map<std::string, Json> documents_;
    mutable std::mutex                    mutex_;
};

// One `<id>.json` file per payload under `root`. The directory is created on first write.
class FileDocumentStore final : public DocumentStore {
public:
    explicit FileDocumentStore(std::filesystem::path root);

    auto root() const -> std::filesystem::path const&;

private:
    auto read_document(std::string const& id) -> Expected<MaybeJson> override;
    auto write_document(std::string const& id, Json const& payload) -> Expected<void> override;

    auto document_path(std::string const& id) const -> Expected<std::filesystem::path>;

    std::filesystem::path root_;
    mutable std::mutex    mutex_;
};

auto make_document_store(ChartEditOptions const& options) -> std::unique_ptr<DocumentStore>;

// Letters, digits, '-', '_' and '.', not starting with '.'.
[[nodiscard]] bool is_payload_identifier(std::string_view id);

/**
 * The chart options inside a payload: `payload["data"]` when it is a mapping,
 * otherwise the payload itself. The returned pointer aliases `payload`.
 */
[[nodiscard]] auto extract_chart_options(Json& payload) -> Expected<Json*>;

// Wraps chart options in a fresh payload envelope with empty metadata.
[[nodiscard]] auto make_chart_payload(Json options) -> Json;

} // namespace CE
