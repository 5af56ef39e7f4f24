#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace CE {

struct Error {
    enum class Code {
        UnknownError = 0,
        MalformedPath,
        PathNotEditable,
        InvalidContainer,
        NotFound,
        InvalidFormat,
        PersistFailure,
        MalformedInput,
        InvalidArgument
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::MalformedPath:
        return "malformed_path";
    case Error::Code::PathNotEditable:
        return "path_not_editable";
    case Error::Code::InvalidContainer:
        return "invalid_container";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::InvalidFormat:
        return "invalid_format";
    case Error::Code::PersistFailure:
        return "persist_failure";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::InvalidArgument:
        return "invalid_argument";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

// The bare message for user-facing surfaces, falling back to the label.
[[nodiscard]] inline auto errorMessage(Error const& error) -> std::string {
    if (error.message && !error.message->empty()) {
        return *error.message;
    }
    return std::string{errorCodeToString(error.code)};
}

} // namespace CE
