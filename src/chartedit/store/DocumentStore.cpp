#include <chartedit/store/DocumentStore.hpp>

#include <chartedit/ChartEditOptions.hpp>

#include "log/TaggedLogger.hpp"

#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <utility>

namespace CE {

auto DocumentStore::load(std::string const& id) -> Expected<Json> {
    if (id.empty()) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "A saved payload ID is required."});
    }
    auto stored = read_document(id);
    if (!stored) {
        return std::unexpected(stored.error());
    }
    if (!stored->has_value()) {
        return std::unexpected(Error{Error::Code::NotFound, "No chart payload found for ID " + id + "."});
    }
    if (!(*stored)->is_object()) {
        return std::unexpected(Error{Error::Code::InvalidFormat, "Chart payloads must be JSON-like mappings."});
    }
    ce_log("loaded " + id, "Store");
    return std::move(**stored);
}

auto DocumentStore::persist(Json const& payload, std::string const& id) -> Expected<std::string> {
    if (id.empty()) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "No chat entry identifier was provided."});
    }
    if (!payload.is_object()) {
        return std::unexpected(Error{Error::Code::InvalidFormat, "Chart payloads must be JSON-like mappings."});
    }
    if (auto written = write_document(id, payload); !written) {
        ce_log("persist " + id + " failed: " + describeError(written.error()), "Store", "ERROR");
        return std::unexpected(written.error());
    }
    ce_log("persisted " + id, "Store");
    return id;
}

auto DocumentStore::contains(std::string const& id) -> bool {
    if (id.empty()) {
        return false;
    }
    auto stored = read_document(id);
    return stored && stored->has_value();
}

auto InMemoryDocumentStore::read_document(std::string const& id) -> Expected<MaybeJson> {
    std::lock_guard const lock{mutex_};
    auto                  it = documents_.find(id);
    if (it == documents_.end()) {
        return MaybeJson{};
    }
    return MaybeJson{it->second};
}

auto InMemoryDocumentStore::write_document(std::string const& id, Json const& payload) -> Expected<void> {
    std::lock_guard const lock{mutex_};
    documents_[id] = payload;
    return {};
}

FileDocumentStore::FileDocumentStore(std::filesystem::path root)
    : root_{std::move(root)} {}

auto FileDocumentStore::root() const -> std::filesystem::path const& {
    return root_;
}

auto FileDocumentStore::document_path(std::string const& id) const -> Expected<std::filesystem::path> {
    if (!is_payload_identifier(id)) {
        return std::unexpected(Error{Error::Code::InvalidArgument,
                                     "Payload ID '" + id + "' may only contain letters, digits, '-', '_' and '.'."});
    }
    return root_ / (id + ".json");
}

auto FileDocumentStore::read_document(std::string const& id) -> Expected<MaybeJson> {
    auto path = document_path(id);
    if (!path) {
        return std::unexpected(path.error());
    }

    std::lock_guard const lock{mutex_};
    std::error_code       ec;
    if (!std::filesystem::exists(*path, ec)) {
        return MaybeJson{};
    }
    std::ifstream in(*path, std::ios::binary);
    if (!in) {
        return std::unexpected(Error{Error::Code::NotFound, "Unable to open " + path->string()});
    }
    std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    auto        parsed = Json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return std::unexpected(Error{Error::Code::InvalidFormat, "Stored payload " + id + " is not valid JSON."});
    }
    return MaybeJson{std::move(parsed)};
}

auto FileDocumentStore::write_document(std::string const& id, Json const& payload) -> Expected<void> {
    auto path = document_path(id);
    if (!path) {
        return std::unexpected(path.error());
    }

    std::lock_guard const lock{mutex_};
    std::error_code       ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        return std::unexpected(Error{Error::Code::PersistFailure,
                                     "Unable to create store directory " + root_.string() + ": " + ec.message()});
    }

    // Write beside the target, then rename over it.
    auto temp_path = *path;
    temp_path += ".tmp";
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return std::unexpected(Error{Error::Code::PersistFailure,
                                         "Chart payload could not be saved to " + path->string() + "."});
        }
        out << payload.dump(2) << '\n';
        if (!out) {
            return std::unexpected(Error{Error::Code::PersistFailure,
                                         "Chart payload could not be saved to " + path->string() + "."});
        }
    }
    std::filesystem::rename(temp_path, *path, ec);
    if (ec) {
        std::error_code cleanup;
        std::filesystem::remove(temp_path, cleanup);
        return std::unexpected(Error{Error::Code::PersistFailure,
                                     "Chart payload could not be saved to " + path->string() + ": " + ec.message()});
    }
    return {};
}

auto make_document_store(ChartEditOptions const& options) -> std::unique_ptr<DocumentStore> {
    if (options.store_backend == "file") {
        return std::make_unique<FileDocumentStore>(options.store_root);
    }
    return std::make_unique<InMemoryDocumentStore>();
}

bool is_payload_identifier(std::string_view id) {
    if (id.empty() || id.front() == '.') {
        return false;
    }
    for (char ch : id) {
        auto const uch = static_cast<unsigned char>(ch);
        if (!std::isalnum(uch) && ch != '-' && ch != '_' && ch != '.') {
            return false;
        }
    }
    return true;
}

auto extract_chart_options(Json& payload) -> Expected<Json*> {
    if (payload.is_object()) {
        auto it = payload.find("data");
        if (it != payload.end() && it->is_object()) {
            return &*it;
        }
        return &payload;
    }
    return std::unexpected(Error{Error::Code::InvalidFormat,
                                 "Chart payloads must contain a dict of Highcharts options."});
}

auto make_chart_payload(Json options) -> Json {
    Json payload = Json::object();
    payload["type"] = std::string{kPayloadType};
    payload["data"] = std::move(options);
    payload["meta"] = Json::object();
    return payload;
}

} // namespace CE
