#include "FormTreeTestHelper.hpp"

#include <doctest/doctest.h>

#include <string>
#include <vector>

using namespace FT;
using FT::testing::FormFixture;

TEST_SUITE("form.form_context") {
TEST_CASE("root fields are listed in order, skipping dangling entries") {
    FormFixture fx;
    auto        empty = fx.form.fields();
    REQUIRE(empty.has_value());
    CHECK(empty->empty());

    auto& first = fx.addRootField("first");
    static_cast<MemoryArray*>(*fx.formNode.getArray(Keys::Fields))->appendReference(321);
    auto& second = fx.addRootField("second");

    auto fields = fx.form.fields();
    REQUIRE(fields.has_value());
    REQUIRE(fields->size() == 2);
    CHECK(&(*fields)[0].node() == &first);
    CHECK(&(*fields)[1].node() == &second);
}

TEST_CASE("addField appends and creates the Fields array") {
    FormFixture fx;
    FieldNode   field{fx.form};
    field.setPartialName("created");

    REQUIRE_FALSE(fx.form.addField(field).has_value());
    REQUIRE_FALSE(fx.form.addField(FieldNode{fx.form}).has_value());

    auto fields = fx.form.fields();
    REQUIRE(fields.has_value());
    REQUIRE(fields->size() == 2);
    CHECK((*fields)[0] == field);

    fx.formNode.setString(Keys::Fields, "broken");
    auto error = fx.form.addField(field);
    REQUIRE(error.has_value());
    CHECK(error->code == Error::Code::IOError);
    auto broken = fx.form.fields();
    REQUIRE_FALSE(broken.has_value());
    CHECK(broken.error().code == Error::Code::IOError);
}

TEST_CASE("getField resolves fully qualified names") {
    FormFixture fx;
    auto&       address = fx.addRootField("address");
    auto&       street  = fx.addField(address, "street");
    auto&       line1   = fx.addField(street, "line1");
    fx.addRootField("phone");

    SUBCASE("root field") {
        auto found = fx.form.getField("address");
        REQUIRE(found.has_value());
        REQUIRE(found->has_value());
        CHECK(&(*found)->node() == &address);
    }

    SUBCASE("nested field") {
        auto found = fx.form.getField("address.street.line1");
        REQUIRE(found.has_value());
        REQUIRE(found->has_value());
        CHECK(&(*found)->node() == &line1);
        CHECK((*found)->fullyQualifiedName() == "address.street.line1");
    }

    SUBCASE("unknown names are not found") {
        for (std::string const name : {"fax", "address.city", "address.street.line2", "phone.mobile"}) {
            auto found = fx.form.getField(name);
            REQUIRE(found.has_value());
            CHECK_FALSE(found->has_value());
        }
    }

    SUBCASE("malformed names are invalid paths") {
        for (std::string const name : {"", ".address", "address.", "address..street"}) {
            auto found = fx.form.getField(name);
            REQUIRE_FALSE(found.has_value());
            CHECK(found.error().code == Error::Code::InvalidPath);
        }
    }
}

TEST_CASE("context exposes its collaborators") {
    FormFixture fx;
    CHECK(&fx.form.store() == &fx.document);
    CHECK(&fx.form.formNode() == &fx.formNode);
    CHECK(&fx.form.factory() == &fx.factory);
    CHECK(&fx.form.resolver().factory() == &fx.factory);
    CHECK(fx.form.resolver().options().detectCycles);
}
}
