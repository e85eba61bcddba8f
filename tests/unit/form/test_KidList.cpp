#include "FormTreeTestHelper.hpp"

#include "form/KidList.hpp"

#include <doctest/doctest.h>

#include <vector>

using namespace FT;
using FT::testing::FormFixture;

TEST_SUITE("form.kid_list") {
TEST_CASE("edits through the list reach the backing array") {
    FormFixture fx;
    auto&       group = fx.addRootField("group");
    auto&       a     = fx.addField(group, "a");
    fx.kidsOf(group).appendReference(900);
    auto& b = fx.addField(group, "b");

    FieldNode groupField{fx.form, group};
    auto      kids = groupField.kids();
    REQUIRE(kids.has_value());
    REQUIRE(kids->has_value());
    auto& list = **kids;
    REQUIRE(list.size() == 2);
    CHECK(list.backingIndex(1) == 2);

    SUBCASE("append") {
        auto& c = fx.document.createNode();
        REQUIRE_FALSE(list.append(KidEntry{Widget{c}}).has_value());
        CHECK(list.size() == 3);
        CHECK(list.backingIndex(2) == 3);
        CHECK(list.backing().size() == 4);
        CHECK(list.backing().getNode(3) == &c);
        CHECK(isWidget(list[2]));
    }

    SUBCASE("set replaces in place") {
        auto& c = fx.document.createNode();
        REQUIRE_FALSE(list.set(1, KidEntry{FieldNode{fx.form, c}}).has_value());
        CHECK(&entryNode(list[1]) == &c);
        CHECK(list.backing().getNode(2) == &c);
        CHECK(list.backing().getNode(0) == &a);
    }

    SUBCASE("erase shifts later backing indices") {
        REQUIRE_FALSE(list.erase(0).has_value());
        REQUIRE(list.size() == 1);
        CHECK(&entryNode(list[0]) == &b);
        CHECK(list.backingIndex(0) == 1);
        CHECK(list.backing().size() == 2);
        CHECK(list.backing().getNode(1) == &b);

        auto reread = groupField.kids();
        REQUIRE(reread.has_value());
        REQUIRE(reread->has_value());
        REQUIRE((*reread)->size() == 1);
        CHECK(&entryNode((*reread)->front()) == &b);
    }

    SUBCASE("out of range indices are rejected") {
        auto& c = fx.document.createNode();
        auto  setError = list.set(5, KidEntry{Widget{c}});
        REQUIRE(setError.has_value());
        CHECK(setError->code == Error::Code::InvalidPath);
        auto eraseError = list.erase(2);
        REQUIRE(eraseError.has_value());
        CHECK(eraseError->code == Error::Code::InvalidPath);
        CHECK(list.size() == 2);
    }

    SUBCASE("foreign nodes are refused and leave the list untouched") {
        MemoryDocument other;
        auto&          foreign = other.createNode();
        auto           error   = list.append(KidEntry{Widget{foreign}});
        REQUIRE(error.has_value());
        CHECK(error->code == Error::Code::InvalidType);
        CHECK(list.size() == 2);
        CHECK(list.backing().size() == 3);
    }
}

TEST_CASE("iteration visits entries in document order") {
    FormFixture fx;
    auto&       group = fx.addRootField("group");
    fx.addField(group, "first");
    fx.addWidget(group);
    fx.addField(group, "last");

    auto kids = FieldNode{fx.form, group}.kids();
    REQUIRE(kids.has_value());
    REQUIRE(kids->has_value());

    std::vector<bool> widgets;
    for (auto const& entry : **kids)
        widgets.push_back(isWidget(entry));
    REQUIRE(widgets.size() == 3);
    CHECK_FALSE(widgets[0]);
    CHECK(widgets[1]);
    CHECK_FALSE(widgets[2]);
}
}
