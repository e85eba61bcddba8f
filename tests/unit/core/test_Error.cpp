#include "core/Error.hpp"

#include <doctest/doctest.h>

#include <vector>

using namespace FT;

TEST_SUITE("core.error") {
    TEST_CASE("Error string helpers") {
        std::vector<Error::Code> codes;
        for (int i = static_cast<int>(Error::Code::InvalidError);
             i <= static_cast<int>(Error::Code::IOError);
             ++i) {
            codes.push_back(static_cast<Error::Code>(i));
        }

        for (auto code : codes) {
            auto label = errorCodeToString(code);
            CHECK_FALSE(label.empty());
            Error e{code, {}};
            CHECK(describeError(e) == std::string{label});
        }

        Error withMsg{Error::Code::IOError, "Kids is not an array"};
        CHECK(describeError(withMsg) == "io_error:Kids is not an array");

        Error withoutMsg{Error::Code::InvalidPath, {}};
        CHECK(describeError(withoutMsg) == "invalid_path");

        auto unknownLabel = errorCodeToString(static_cast<Error::Code>(999));
        CHECK(unknownLabel == "unknown_error");
    }

    TEST_CASE("Expected carries either a value or an error") {
        Expected<int> good = 7;
        REQUIRE(good.has_value());
        CHECK(*good == 7);

        Expected<int> bad = std::unexpected(Error{Error::Code::MalformedInput, "object 4"});
        REQUIRE_FALSE(bad.has_value());
        CHECK(bad.error().code == Error::Code::MalformedInput);
        CHECK(describeError(bad.error()) == "malformed_input:object 4");
    }
}
