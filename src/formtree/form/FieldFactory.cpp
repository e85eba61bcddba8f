#include "FieldFactory.hpp"
#include "form/FieldKeys.hpp"
#include "form/FormContext.hpp"

namespace FT {

auto DefaultFieldFactory::createField(FormContext const& form, AttributeNode& node) const -> Expected<FieldNode> {
    auto const fieldType = form.resolver().findInheritedName(node, Keys::FieldType);
    return FieldNode{form, node, fieldKindFromType(fieldType)};
}

} // namespace FT
