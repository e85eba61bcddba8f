#pragma once
#include "store/AttributeNode.hpp"

#include <string_view>

namespace FT {

enum class NodeRole {
    Field,
    Widget
};

/**
 * Decides whether a raw child node is a field or a widget annotation.
 *
 * First match wins:
 * 1. the node declares FT                 -> Field
 * 2. the parent declares FT (inherited)   -> Field
 * 3. the node's Subtype is /Widget        -> Widget
 * 4. anything else is a grouping field    -> Field
 *
 * Pure function of the node attributes; never fails.
 */
[[nodiscard]] auto classifyNode(AttributeNode const& node, AttributeNode const* parent) -> NodeRole;

[[nodiscard]] auto nodeRoleToString(NodeRole role) -> std::string_view;

} // namespace FT
