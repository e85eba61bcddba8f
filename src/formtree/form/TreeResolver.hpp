#pragma once
#include "core/Error.hpp"
#include "form/FieldNode.hpp"
#include "form/KidList.hpp"
#include "form/NodeClassifier.hpp"
#include "form/Widget.hpp"
#include "store/AttributeNode.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace FT {

class FieldFactory;
class FormContext;

struct ResolverOptions {
    // Upper bound on parent hops taken by an ancestor walk.
    std::size_t maxAncestorDepth = 256;
    // Stop ancestor walks and widget descents that revisit a node.
    bool detectCycles = true;
};

/**
 * Structural queries over the field tree.
 *
 * Reads the attribute store directly; FieldNode forwards every navigation call
 * here. Child fields are built through the injected FieldFactory.
 *
 * Outcomes:
 * - absent attributes, parents, kids or path segments are empty optionals
 * - a store entry of the wrong kind, or a factory failure, is an IOError
 * - dangling Kids entries are skipped
 * - parent cycles end ancestor walks as "not found" and widget descents as MalformedInput
 */
class TreeResolver {
public:
    explicit TreeResolver(FieldFactory const& factory, ResolverOptions options = {});

    [[nodiscard]] auto factory() const noexcept -> FieldFactory const& { return *factory_; }
    [[nodiscard]] auto options() const noexcept -> ResolverOptions const& { return options_; }

    // ----- Inherited attributes -----

    [[nodiscard]] auto findInheritedName(AttributeNode const& node, std::string_view key) const -> std::optional<std::string>;
    [[nodiscard]] auto findInheritedString(AttributeNode const& node, std::string_view key) const -> std::optional<std::string>;
    [[nodiscard]] auto findInheritedInteger(AttributeNode const& node, std::string_view key) const -> std::optional<std::int64_t>;

    // Parent through Parent, then P. nullptr at the root.
    [[nodiscard]] auto parentOf(AttributeNode const& node) const -> Expected<AttributeNode*>;
    // `node` followed by its ancestors up to the root, stopping on cycles or broken parents.
    [[nodiscard]] auto ancestorChain(AttributeNode& node) const -> std::vector<AttributeNode*>;

    // ----- Children -----

    [[nodiscard]] auto materialize(FormContext const& form, AttributeNode& node, NodeRole role) const -> Expected<KidEntry>;
    [[nodiscard]] auto createField(FormContext const& form, AttributeNode& node) const -> Expected<FieldNode>;

    [[nodiscard]] auto kids(FormContext const& form, AttributeNode& node) const -> Expected<std::optional<KidList>>;
    [[nodiscard]] auto widget(FormContext const& form, AttributeNode& node) const -> Expected<std::optional<Widget>>;
    [[nodiscard]] auto findKid(FormContext const&              form,
                               AttributeNode&                  node,
                               std::vector<std::string> const& segments,
                               std::size_t                     index) const -> Expected<std::optional<FieldNode>>;

private:
    template <typename T>
    using Reader = std::function<std::optional<T>(AttributeNode const&)>;

    template <typename T>
    auto findInherited(AttributeNode const& node, Reader<T> const& read) const -> std::optional<T>;

    FieldFactory const* factory_;
    ResolverOptions     options_;
};

} // namespace FT
