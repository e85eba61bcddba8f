#include "NodeClassifier.hpp"
#include "form/FieldKeys.hpp"
#include "log/TaggedLogger.hpp"

namespace FT {

auto classifyNode(AttributeNode const& node, AttributeNode const* parent) -> NodeRole {
    if (node.hasKey(Keys::FieldType))
        return NodeRole::Field;
    if (parent != nullptr && parent->hasKey(Keys::FieldType))
        return NodeRole::Field;
    if (node.getName(Keys::Subtype) == Keys::WidgetSubtype)
        return NodeRole::Widget;
    ft_log("Node without FT or widget subtype treated as a field", "Classifier");
    return NodeRole::Field;
}

auto nodeRoleToString(NodeRole role) -> std::string_view {
    switch (role) {
    case NodeRole::Field:
        return "field";
    case NodeRole::Widget:
        return "widget";
    }
    return "field";
}

} // namespace FT
