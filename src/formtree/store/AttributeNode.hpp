#pragma once
#include "core/Error.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace FT {

class AttributeArray;

/**
 * Generic key/value node of the backing document.
 *
 * The field tree only talks to the document through this interface. Nodes are
 * owned by their AttributeStore; everything handed out here is a non-owning
 * pointer or reference that stays valid for the lifetime of the store.
 *
 * Value kinds:
 * - strings and names live in separate namespaces (a name is a type tag such as "Tx")
 * - node and array lookups return nullptr when the key is absent and an IOError
 *   when the key holds a value of another kind
 */
class AttributeNode {
public:
    virtual ~AttributeNode() = default;

    [[nodiscard]] virtual auto hasKey(std::string_view key) const -> bool = 0;
    virtual auto               remove(std::string_view key) -> void       = 0;

    [[nodiscard]] virtual auto getString(std::string_view key) const -> std::optional<std::string> = 0;
    virtual auto               setString(std::string_view key, std::string value) -> void          = 0;

    [[nodiscard]] virtual auto getName(std::string_view key) const -> std::optional<std::string> = 0;
    virtual auto               setName(std::string_view key, std::string value) -> void          = 0;

    [[nodiscard]] virtual auto getInteger(std::string_view key) const -> std::optional<std::int64_t> = 0;
    virtual auto               setInteger(std::string_view key, std::int64_t value) -> void          = 0;

    // Tries `primary` first, then `fallback` when `primary` is absent or does not
    // resolve to a node. Either may be empty.
    [[nodiscard]] virtual auto getNode(std::string_view primary, std::string_view fallback = {}) const
            -> Expected<AttributeNode*>                                           = 0;
    virtual auto setNode(std::string_view key, AttributeNode& value) -> std::optional<Error> = 0;

    [[nodiscard]] virtual auto getArray(std::string_view key) const -> Expected<AttributeArray*> = 0;
    // Replaces any existing value under `key` with a new empty array.
    virtual auto createArray(std::string_view key) -> AttributeArray& = 0;
};

/**
 * Ordered sequence of node references owned by an AttributeNode.
 *
 * getNode returns nullptr for entries that do not resolve to a node (dangling
 * references, non-node values). Index arguments past the end are reported as
 * InvalidPath errors. Nodes that belong to another store are rejected with
 * InvalidType.
 */
class AttributeArray {
public:
    virtual ~AttributeArray() = default;

    [[nodiscard]] virtual auto size() const -> std::size_t                       = 0;
    [[nodiscard]] virtual auto getNode(std::size_t index) const -> AttributeNode* = 0;

    virtual auto setNode(std::size_t index, AttributeNode& node) -> std::optional<Error>  = 0;
    virtual auto insert(std::size_t index, AttributeNode& node) -> std::optional<Error>   = 0;
    virtual auto append(AttributeNode& node) -> std::optional<Error>                      = 0;
    virtual auto erase(std::size_t index) -> std::optional<Error>                         = 0;

    [[nodiscard]] auto empty() const -> bool { return this->size() == 0; }
};

/**
 * Owner of attribute nodes. Used when a field is created from scratch.
 */
class AttributeStore {
public:
    virtual ~AttributeStore() = default;

    virtual auto createNode() -> AttributeNode& = 0;
    // Whether `node` was created by this store and is still alive.
    [[nodiscard]] virtual auto owns(AttributeNode const& node) const -> bool = 0;
};

} // namespace FT
