#include "path/FieldNameIterator.hpp"

#include <doctest/doctest.h>

#include <string>
#include <string_view>
#include <vector>

using namespace FT;

TEST_SUITE("path.field_name_iterator") {
TEST_CASE("iterates segments in order") {
    FieldNameIterator iter{"address.street.line1"};
    CHECK(iter.isAtStart());
    CHECK_FALSE(iter.isAtFinalComponent());
    CHECK(*iter == "address");
    CHECK(iter->size() == 7);

    ++iter;
    CHECK_FALSE(iter.isAtStart());
    CHECK(*iter == "street");

    auto previous = iter++;
    CHECK(*previous == "street");
    CHECK(*iter == "line1");
    CHECK(iter.isAtFinalComponent());
    CHECK_FALSE(iter.isAtEnd());

    ++iter;
    CHECK(iter.isAtEnd());
    CHECK((*iter).empty());
    CHECK(iter.fullName() == "address.street.line1");

    ++iter;
    CHECK(iter.isAtEnd());
}

TEST_CASE("single segment names") {
    FieldNameIterator iter{"phone"};
    CHECK(iter.isAtStart());
    CHECK(iter.isAtFinalComponent());
    CHECK(*iter == "phone");
    CHECK_FALSE(iter.validate().has_value());
}

TEST_CASE("iterators over the same name compare by position") {
    std::string_view const name = "a.b";
    FieldNameIterator      first{name};
    FieldNameIterator      second{name};
    CHECK(first == second);
    ++second;
    CHECK_FALSE(first == second);
    ++first;
    CHECK(first == second);
}

TEST_CASE("validation rejects empty segments") {
    for (std::string_view const name : {"", ".a", "a.", "a..b", "."}) {
        auto error = FieldNameIterator{name}.validate();
        REQUIRE(error.has_value());
        CHECK(error->code == Error::Code::InvalidPath);
    }
    for (std::string_view const name : {"a", "a.b", "with space.x", "Name1.Name2.Name3"})
        CHECK_FALSE(FieldNameIterator{name}.validate().has_value());
}

TEST_CASE("splitFieldName") {
    auto segments = splitFieldName("root.Name1.Name2");
    REQUIRE(segments.has_value());
    CHECK(*segments == std::vector<std::string>{"root", "Name1", "Name2"});

    auto single = splitFieldName("root");
    REQUIRE(single.has_value());
    CHECK(single->size() == 1);

    auto invalid = splitFieldName("root..Name2");
    REQUIRE_FALSE(invalid.has_value());
    CHECK(invalid.error().code == Error::Code::InvalidPath);
}
}
