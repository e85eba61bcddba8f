#include "store/MemoryDocument.hpp"

#include <doctest/doctest.h>

#include <string>

using namespace FT;

TEST_SUITE("store.memory_document") {
TEST_CASE("objects are numbered in creation order and owned by the document") {
    MemoryDocument document;
    auto&          first  = document.createNode();
    auto&          second = document.createNode();

    CHECK(first.objectNumber() == 1);
    CHECK(second.objectNumber() == 2);
    CHECK(document.objectCount() == 2);
    CHECK(document.object(1) == &first);
    CHECK(document.object(3) == nullptr);
    CHECK(document.owns(second));

    MemoryDocument other;
    CHECK_FALSE(other.owns(first));

    CHECK(document.erase(1));
    CHECK_FALSE(document.erase(1));
    CHECK(document.object(1) == nullptr);
}

TEST_CASE("scalar attributes keep strings and names apart") {
    MemoryDocument document;
    auto&          node = document.createNode();

    node.setString("T", "street");
    node.setName("FT", "Tx");
    node.setInteger("Ff", 3);

    CHECK(node.getString("T") == "street");
    CHECK_FALSE(node.getName("T").has_value());
    CHECK(node.getName("FT") == "Tx");
    CHECK_FALSE(node.getString("FT").has_value());
    CHECK(node.getInteger("Ff") == 3);
    CHECK_FALSE(node.getInteger("T").has_value());
    CHECK(node.hasKey("Ff"));

    node.setString("T", "");
    CHECK(node.getString("T") == "");

    node.remove("Ff");
    CHECK_FALSE(node.hasKey("Ff"));
    CHECK(node.size() == 2);
}

TEST_CASE("node references resolve through primary then fallback key") {
    MemoryDocument document;
    auto&          child   = document.createNode();
    auto&          primary = document.createNode();
    auto&          legacy  = document.createNode();

    auto none = child.getNode("Parent", "P");
    REQUIRE(none.has_value());
    CHECK(*none == nullptr);

    REQUIRE_FALSE(child.setNode("P", legacy).has_value());
    auto viaFallback = child.getNode("Parent", "P");
    REQUIRE(viaFallback.has_value());
    CHECK(*viaFallback == &legacy);

    REQUIRE_FALSE(child.setNode("Parent", primary).has_value());
    auto viaPrimary = child.getNode("Parent", "P");
    REQUIRE(viaPrimary.has_value());
    CHECK(*viaPrimary == &primary);

    child.setReference("Parent", 999);
    auto danglingPrimary = child.getNode("Parent", "P");
    REQUIRE(danglingPrimary.has_value());
    CHECK(*danglingPrimary == &legacy);

    child.setInteger("Parent", 3);
    auto wrongKindPrimary = child.getNode("Parent", "P");
    REQUIRE_FALSE(wrongKindPrimary.has_value());
    CHECK(wrongKindPrimary.error().code == Error::Code::IOError);
}

TEST_CASE("wrong kinds and dangling references") {
    MemoryDocument document;
    auto&          node = document.createNode();

    node.setInteger("Parent", 12);
    auto notANode = node.getNode("Parent");
    REQUIRE_FALSE(notANode.has_value());
    CHECK(notANode.error().code == Error::Code::IOError);

    node.setString("Kids", "oops");
    auto notAnArray = node.getArray("Kids");
    REQUIRE_FALSE(notAnArray.has_value());
    CHECK(notAnArray.error().code == Error::Code::IOError);

    node.setReference("Parent", 99);
    auto dangling = node.getNode("Parent");
    REQUIRE(dangling.has_value());
    CHECK(*dangling == nullptr);

    MemoryDocument other;
    auto&          foreign = other.createNode();
    auto           error   = node.setNode("Parent", foreign);
    REQUIRE(error.has_value());
    CHECK(error->code == Error::Code::InvalidType);
}

TEST_CASE("arrays hold references in order and report bad indices") {
    MemoryDocument document;
    auto&          owner = document.createNode();
    auto&          a     = document.createNode();
    auto&          b     = document.createNode();
    auto&          c     = document.createNode();

    auto& kids = owner.createArray("Kids");
    REQUIRE_FALSE(kids.append(a).has_value());
    kids.appendReference(500);
    kids.appendInteger(4);
    REQUIRE_FALSE(kids.append(b).has_value());

    CHECK(kids.size() == 4);
    CHECK(kids.getNode(0) == &a);
    CHECK(kids.getNode(1) == nullptr);
    CHECK(kids.getNode(2) == nullptr);
    CHECK(kids.getNode(3) == &b);
    CHECK(kids.getNode(10) == nullptr);

    REQUIRE_FALSE(kids.insert(1, c).has_value());
    CHECK(kids.getNode(1) == &c);
    REQUIRE_FALSE(kids.setNode(0, b).has_value());
    CHECK(kids.getNode(0) == &b);
    REQUIRE_FALSE(kids.erase(2).has_value());
    CHECK(kids.size() == 4);

    auto outOfRange = kids.erase(10);
    REQUIRE(outOfRange.has_value());
    CHECK(outOfRange->code == Error::Code::InvalidPath);

    auto looked = owner.getArray("Kids");
    REQUIRE(looked.has_value());
    CHECK(*looked == &kids);

    auto& replaced = owner.createArray("Kids");
    CHECK(replaced.empty());
}

TEST_CASE("erasing an object leaves array entries dangling") {
    MemoryDocument document;
    auto&          owner = document.createNode();
    auto&          kid   = document.createNode();
    auto&          kids  = owner.createArray("Kids");
    REQUIRE_FALSE(kids.append(kid).has_value());

    REQUIRE(document.erase(kid.objectNumber()));
    CHECK(kids.size() == 1);
    CHECK(kids.getNode(0) == nullptr);
}
}
