#pragma once
#include "store/AttributeNode.hpp"
#include "store/TransparentString.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace FT {

class MemoryDocument;

using ObjectNumber = std::uint32_t;

// Indirect reference to an object of a MemoryDocument. Resolves to nothing once
// the object has been erased.
struct ObjectReference {
    ObjectNumber number = 0;
};

class MemoryArray final : public AttributeArray {
public:
    using Entry = std::variant<ObjectReference, std::int64_t>;

    explicit MemoryArray(MemoryDocument& document)
        : document_(&document) {}

    [[nodiscard]] auto size() const -> std::size_t override;
    [[nodiscard]] auto getNode(std::size_t index) const -> AttributeNode* override;

    auto setNode(std::size_t index, AttributeNode& node) -> std::optional<Error> override;
    auto insert(std::size_t index, AttributeNode& node) -> std::optional<Error> override;
    auto append(AttributeNode& node) -> std::optional<Error> override;
    auto erase(std::size_t index) -> std::optional<Error> override;

    // Raw entry access, used to build malformed arrays.
    auto appendReference(ObjectNumber number) -> void;
    auto appendInteger(std::int64_t value) -> void;

private:
    auto referenceTo(AttributeNode& node) const -> Expected<ObjectReference>;

    MemoryDocument*    document_;
    std::vector<Entry> entries_;
};

class MemoryNode final : public AttributeNode {
public:
    struct String {
        std::string value;
    };
    struct Name {
        std::string value;
    };
    using Value = std::variant<String, Name, std::int64_t, ObjectReference, std::unique_ptr<MemoryArray>>;

    MemoryNode(MemoryDocument& document, ObjectNumber number)
        : document_(&document), number_(number) {}

    [[nodiscard]] auto objectNumber() const noexcept -> ObjectNumber { return number_; }
    [[nodiscard]] auto document() const noexcept -> MemoryDocument& { return *document_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return attributes_.size(); }

    [[nodiscard]] auto hasKey(std::string_view key) const -> bool override;
    auto               remove(std::string_view key) -> void override;

    [[nodiscard]] auto getString(std::string_view key) const -> std::optional<std::string> override;
    auto               setString(std::string_view key, std::string value) -> void override;

    [[nodiscard]] auto getName(std::string_view key) const -> std::optional<std::string> override;
    auto               setName(std::string_view key, std::string value) -> void override;

    [[nodiscard]] auto getInteger(std::string_view key) const -> std::optional<std::int64_t> override;
    auto               setInteger(std::string_view key, std::int64_t value) -> void override;

    [[nodiscard]] auto getNode(std::string_view primary, std::string_view fallback = {}) const
            -> Expected<AttributeNode*> override;
    auto setNode(std::string_view key, AttributeNode& value) -> std::optional<Error> override;

    [[nodiscard]] auto getArray(std::string_view key) const -> Expected<AttributeArray*> override;
    auto               createArray(std::string_view key) -> MemoryArray& override;

    // Stores a reference by number, whether or not the object exists.
    auto setReference(std::string_view key, ObjectNumber number) -> void;

private:
    auto put(std::string_view key, Value value) -> void;
    auto find(std::string_view key) const -> Value const*;
    auto resolve(std::string_view key) const -> Expected<AttributeNode*>;

    MemoryDocument* document_;
    ObjectNumber    number_;
    phmap::flat_hash_map<std::string, Value, TransparentStringHash, std::equal_to<>> attributes_;
};

/**
 * In-memory attribute store.
 *
 * Objects are numbered from 1 in creation order and owned by the document.
 * References between objects are stored by number, so erasing an object leaves
 * dangling references behind instead of dangling pointers.
 */
class MemoryDocument final : public AttributeStore {
public:
    MemoryDocument()                                 = default;
    MemoryDocument(MemoryDocument const&)            = delete;
    MemoryDocument& operator=(MemoryDocument const&) = delete;

    auto createNode() -> MemoryNode& override;

    [[nodiscard]] auto object(ObjectNumber number) const -> MemoryNode*;
    auto               erase(ObjectNumber number) -> bool;
    [[nodiscard]] auto objectCount() const noexcept -> std::size_t { return objects_.size(); }

    [[nodiscard]] auto owns(AttributeNode const& node) const -> bool override;

private:
    phmap::node_hash_map<ObjectNumber, std::unique_ptr<MemoryNode>> objects_;
    ObjectNumber                                                      nextNumber_ = 1;
};

} // namespace FT
