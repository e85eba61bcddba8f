#pragma once
#include "store/AttributeNode.hpp"

#include <optional>
#include <string>

namespace FT {

/**
 * Terminal entry of the field tree: the widget annotation that renders an
 * input. Only the identity of the annotation node matters to the tree.
 */
class Widget {
public:
    explicit Widget(AttributeNode& node) noexcept
        : node_(&node) {}

    [[nodiscard]] auto node() const noexcept -> AttributeNode& { return *node_; }
    [[nodiscard]] auto subtype() const -> std::optional<std::string>;

    auto operator==(Widget const& other) const noexcept -> bool { return node_ == other.node_; }

private:
    AttributeNode* node_;
};

} // namespace FT
