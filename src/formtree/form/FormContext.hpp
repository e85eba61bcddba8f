#pragma once
#include "core/Error.hpp"
#include "form/FieldNode.hpp"
#include "form/TreeResolver.hpp"
#include "store/AttributeNode.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace FT {

class FieldFactory;

/**
 * Shared owner of a form's field tree.
 *
 * Responsibilities:
 * - Hold the attribute store fields are allocated from and the form node whose
 *   Fields array lists the root fields.
 * - Own the TreeResolver, bound to the injected FieldFactory and options.
 * - Resolve fully qualified names against the root fields.
 *
 * The store, form node and factory are borrowed and must outlive the context;
 * every FieldNode bound to the context must not outlive it.
 */
class FormContext final {
public:
    FormContext(AttributeStore& store, AttributeNode& formNode, FieldFactory const& factory, ResolverOptions options = {});

    FormContext(FormContext const&)            = delete;
    FormContext& operator=(FormContext const&) = delete;

    [[nodiscard]] auto store() const noexcept -> AttributeStore& { return *store_; }
    [[nodiscard]] auto formNode() const noexcept -> AttributeNode& { return *formNode_; }
    [[nodiscard]] auto resolver() const noexcept -> TreeResolver const& { return resolver_; }
    [[nodiscard]] auto factory() const noexcept -> FieldFactory const& { return resolver_.factory(); }

    // Root fields in document order; dangling entries are skipped.
    [[nodiscard]] auto fields() const -> Expected<std::vector<FieldNode>>;
    // Appends a root field, creating the Fields array when missing.
    auto addField(FieldNode const& field) const -> std::optional<Error>;
    // Looks a field up by its fully qualified name ("parent.child.leaf").
    [[nodiscard]] auto getField(std::string_view fullyQualifiedName) const -> Expected<std::optional<FieldNode>>;

private:
    AttributeStore* store_;
    AttributeNode*  formNode_;
    TreeResolver    resolver_;
};

} // namespace FT
