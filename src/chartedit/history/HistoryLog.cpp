#include "history/HistoryLog.hpp"

#include "document/DocumentPatcher.hpp"
#include "log/TaggedLogger.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace CE::History {

namespace {

auto const kMetaTokens    = TokenSequence{std::string{"meta"}};
auto const kHistoryTokens = TokenSequence{std::string{"meta"}, std::string{"history"}};

auto discard_previous(Expected<MaybeJson> written) -> Expected<void> {
    if (!written) {
        return std::unexpected(written.error());
    }
    return {};
}

} // namespace

auto utc_timestamp(std::chrono::system_clock::time_point when) -> std::string {
    auto const ms    = std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()) % 1000;
    auto const timeT = std::chrono::system_clock::to_time_t(when);
    std::tm    utc{};
    gmtime_r(&timeT, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

auto ensure_metadata(Json& payload) -> Expected<void> {
    auto meta = DocumentPatcher::get_value(payload, kMetaTokens);
    if (!meta) {
        if (auto written = discard_previous(DocumentPatcher::set_value(payload, kMetaTokens, Json::object())); !written) {
            return written;
        }
    } else if (!meta->is_object()) {
        auto note = meta->is_string() ? meta->get<std::string>() : meta->dump();
        if (auto written = discard_previous(DocumentPatcher::set_value(payload, kMetaTokens, Json{{"note", note}}));
            !written) {
            return written;
        }
    }

    auto history = DocumentPatcher::get_value(payload, kHistoryTokens);
    if (!history || !history->is_array()) {
        return discard_previous(DocumentPatcher::set_value(payload, kHistoryTokens, Json::array()));
    }
    return {};
}

auto append_history_entry(Json& payload, std::string_view actor, std::string_view action, Json const& details)
    -> Expected<void> {
    if (auto ensured = ensure_metadata(payload); !ensured) {
        return ensured;
    }

    Json entry = Json::object();
    entry["timestamp"] = utc_timestamp(std::chrono::system_clock::now());
    entry["actor"]     = std::string{actor};
    entry["action"]    = std::string{action};
    if (!details.is_null() && !details.empty()) {
        entry["details"] = details;
    }

    auto const length = DocumentPatcher::get_value(payload, kHistoryTokens).value_or(Json::array()).size();
    auto       tokens = kHistoryTokens;
    tokens.emplace_back(length);
    ce_log(std::string{"history += "} + std::string{action}, "History");
    return discard_previous(DocumentPatcher::set_value(payload, tokens, std::move(entry)));
}

} // namespace CE::History
