#pragma once
#include "core/Error.hpp"
#include "form/FieldKind.hpp"
#include "form/Widget.hpp"
#include "store/AttributeNode.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace FT {

class FormContext;
class FieldNode;
class KidList;

// Child of a field: either a terminal widget or a nested field.
using KidEntry = std::variant<Widget, FieldNode>;

/**
 * One node of an interactive form's field hierarchy.
 *
 * Wraps an attribute node owned by the document and reads every attribute
 * through it on demand; nothing is cached, so two FieldNodes over the same
 * node always agree. The parent is never stored: it is looked up through the
 * Parent (or legacy P) entry each time it is needed.
 *
 * Every FieldNode is bound to the FormContext it was built with. The context
 * must outlive the node.
 */
class FieldNode {
public:
    static constexpr std::uint32_t FLAG_READ_ONLY = 1;
    static constexpr std::uint32_t FLAG_REQUIRED  = 1 << 1;
    static constexpr std::uint32_t FLAG_NO_EXPORT = 1 << 2;

    // Creates a field over a fresh, empty node allocated from the form's store.
    explicit FieldNode(FormContext const& form);
    // Wraps an existing node; the kind is derived from the inherited FT entry.
    FieldNode(FormContext const& form, AttributeNode& node);
    FieldNode(FormContext const& form, AttributeNode& node, FieldKind kind);

    // ----- Names -----

    [[nodiscard]] auto partialName() const -> std::optional<std::string>;
    auto               setPartialName(std::string name) -> void;

    [[nodiscard]] auto alternateFieldName() const -> std::optional<std::string>;
    auto               setAlternateFieldName(std::string name) -> void;

    [[nodiscard]] auto mappingName() const -> std::optional<std::string>;
    auto               setMappingName(std::string name) -> void;

    // Partial names from the root down to this field joined with '.'.
    // Unnamed ancestors are skipped; nullopt when nothing in the chain is named.
    [[nodiscard]] auto fullyQualifiedName() const -> std::optional<std::string>;

    // ----- Type and flags -----

    // FT of this node or of the nearest ancestor declaring one.
    [[nodiscard]] auto fieldType() const -> std::optional<std::string>;
    [[nodiscard]] auto kind() const noexcept -> FieldKind { return kind_; }

    // Ff of this node only; 0 when absent.
    [[nodiscard]] auto fieldFlags() const -> std::uint32_t;
    auto               setFieldFlags(std::uint32_t flags) -> void;

    [[nodiscard]] auto isReadOnly() const -> bool;
    auto               setReadOnly(bool readOnly) -> void;
    [[nodiscard]] auto isRequired() const -> bool;
    auto               setRequired(bool required) -> void;
    [[nodiscard]] auto isNoExport() const -> bool;
    auto               setNoExport(bool noExport) -> void;

    // ----- Navigation -----

    [[nodiscard]] auto parent() const -> Expected<std::optional<FieldNode>>;
    // Points Parent at `parent`, or removes the parent entries when null.
    auto setParent(FieldNode const* parent) -> std::optional<Error>;

    // Classified children; nullopt when the node has no Kids entry at all.
    [[nodiscard]] auto kids() const -> Expected<std::optional<KidList>>;
    // Replaces Kids with the given entries and re-parents each of them here.
    // Nothing is written when an entry belongs to another store.
    auto setKids(std::vector<KidEntry> const& kids) -> std::optional<Error>;

    // The single widget of a field whose annotation is merged into it, or the
    // first widget reached through the first kid.
    [[nodiscard]] auto widget() const -> Expected<std::optional<Widget>>;

    // Descendant whose partial names match segments[index..].
    [[nodiscard]] auto findKid(std::vector<std::string> const& segments, std::size_t index) const
            -> Expected<std::optional<FieldNode>>;

    // ----- Identity -----

    [[nodiscard]] auto formContext() const noexcept -> FormContext const& { return *form_; }
    [[nodiscard]] auto node() const noexcept -> AttributeNode& { return *node_; }

    auto operator==(FieldNode const& other) const noexcept -> bool { return node_ == other.node_; }

private:
    auto setFlag(std::uint32_t flag, bool value) -> void;

    FormContext const* form_;
    AttributeNode*     node_;
    FieldKind          kind_;
};

} // namespace FT
