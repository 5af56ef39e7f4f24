#include <doctest/doctest.h>

#include <chartedit/core/Error.hpp>

using namespace CE;

TEST_SUITE("core.error") {

TEST_CASE("error codes map to snake_case labels") {
    CHECK(errorCodeToString(Error::Code::MalformedPath) == "malformed_path");
    CHECK(errorCodeToString(Error::Code::PathNotEditable) == "path_not_editable");
    CHECK(errorCodeToString(Error::Code::InvalidContainer) == "invalid_container");
    CHECK(errorCodeToString(Error::Code::NotFound) == "not_found");
    CHECK(errorCodeToString(Error::Code::PersistFailure) == "persist_failure");
}

TEST_CASE("describeError joins label and message") {
    Error withMessage{Error::Code::NotFound, "No chart payload found for ID abc."};
    CHECK(describeError(withMessage) == "not_found:No chart payload found for ID abc.");
    CHECK(errorMessage(withMessage) == "No chart payload found for ID abc.");

    Error bare{Error::Code::InvalidFormat, ""};
    CHECK(describeError(bare) == "invalid_format");
    CHECK(errorMessage(bare) == "invalid_format");
}

} // TEST_SUITE
