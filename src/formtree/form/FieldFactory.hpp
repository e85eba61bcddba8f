#pragma once
#include "core/Error.hpp"
#include "form/FieldNode.hpp"
#include "store/AttributeNode.hpp"

namespace FT {

class FormContext;

/**
 * Builds the field variant for a raw node. Injected into the FormContext so
 * the tree can be exercised with a fake factory.
 */
class FieldFactory {
public:
    virtual ~FieldFactory() = default;

    [[nodiscard]] virtual auto createField(FormContext const& form, AttributeNode& node) const -> Expected<FieldNode> = 0;
};

// Picks the FieldKind from the node's inherited FT entry.
class DefaultFieldFactory final : public FieldFactory {
public:
    [[nodiscard]] auto createField(FormContext const& form, AttributeNode& node) const -> Expected<FieldNode> override;
};

} // namespace FT
