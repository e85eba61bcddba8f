#include "FormTreeTestHelper.hpp"

#include "form/FieldKind.hpp"

#include <doctest/doctest.h>

using namespace FT;
using FT::testing::FormFixture;

TEST_SUITE("form.field_factory") {
TEST_CASE("field kinds map from FT names") {
    CHECK(fieldKindFromType(std::nullopt) == FieldKind::NonTerminal);
    CHECK(fieldKindFromType("Btn") == FieldKind::Button);
    CHECK(fieldKindFromType("Tx") == FieldKind::Text);
    CHECK(fieldKindFromType("Ch") == FieldKind::Choice);
    CHECK(fieldKindFromType("Sig") == FieldKind::Signature);
    CHECK(fieldKindFromType("Barcode") == FieldKind::Unknown);

    CHECK(fieldKindToString(FieldKind::NonTerminal) == "non_terminal");
    CHECK(fieldKindToString(FieldKind::Text) == "text");
    CHECK(fieldKindToString(static_cast<FieldKind>(42)) == "unknown");
}

TEST_CASE("default factory uses the inherited field type") {
    FormFixture fx;
    auto&       root = fx.addRootField("sig");
    root.setName(Keys::FieldType, "Sig");
    auto& kid   = fx.addField(root, "part");
    auto& group = fx.addRootField("group");

    auto signature = fx.factory.createField(fx.form, kid);
    REQUIRE(signature.has_value());
    CHECK(signature->kind() == FieldKind::Signature);
    CHECK(&signature->node() == &kid);
    CHECK(&signature->formContext() == &fx.form);

    auto grouping = fx.factory.createField(fx.form, group);
    REQUIRE(grouping.has_value());
    CHECK(grouping->kind() == FieldKind::NonTerminal);
}

TEST_CASE("kids built through the factory carry their kind") {
    FormFixture fx;
    auto&       root = fx.addRootField("root");
    auto&       text = fx.addField(root, "text");
    text.setName(Keys::FieldType, "Tx");
    fx.addField(root, "group");

    auto kids = FieldNode{fx.form, root}.kids();
    REQUIRE(kids.has_value());
    REQUIRE(kids->has_value());
    REQUIRE((*kids)->size() == 2);
    CHECK(std::get<FieldNode>((**kids)[0]).kind() == FieldKind::Text);
    CHECK(std::get<FieldNode>((**kids)[1]).kind() == FieldKind::NonTerminal);
}
}
