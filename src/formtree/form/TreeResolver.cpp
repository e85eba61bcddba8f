#include "TreeResolver.hpp"
#include "form/FieldFactory.hpp"
#include "form/FieldKeys.hpp"
#include "form/FormContext.hpp"
#include "log/TaggedLogger.hpp"

#include <parallel_hashmap/phmap.h>

namespace FT {
namespace {

auto as_io_error(Error const& error, std::string_view context) -> Error {
    if (error.code == Error::Code::IOError)
        return error;
    return Error{Error::Code::IOError, std::string{context} + ": " + describeError(error)};
}

} // namespace

TreeResolver::TreeResolver(FieldFactory const& factory, ResolverOptions options)
    : factory_(&factory), options_(options) {}

auto TreeResolver::parentOf(AttributeNode const& node) const -> Expected<AttributeNode*> {
    return node.getNode(Keys::Parent, Keys::ParentLegacy);
}

template <typename T>
auto TreeResolver::findInherited(AttributeNode const& node, Reader<T> const& read) const -> std::optional<T> {
    phmap::flat_hash_set<AttributeNode const*> visited;
    AttributeNode const*                       current = &node;
    std::size_t                                hops    = 0;
    while (current != nullptr) {
        if (this->options_.detectCycles && !visited.insert(current).second) {
            ft_log("Parent cycle detected during inherited lookup", "TreeResolver", "Cycle");
            return std::nullopt;
        }
        if (auto value = read(*current))
            return value;

        auto parent = this->parentOf(*current);
        if (!parent) {
            ft_log("Ignoring unreadable parent entry: " + describeError(parent.error()), "TreeResolver");
            return std::nullopt;
        }
        if (*parent != nullptr && ++hops > this->options_.maxAncestorDepth) {
            ft_log("Inherited lookup exceeded " + std::to_string(this->options_.maxAncestorDepth) + " ancestors", "TreeResolver", "Cycle");
            return std::nullopt;
        }
        current = *parent;
    }
    return std::nullopt;
}

auto TreeResolver::findInheritedName(AttributeNode const& node, std::string_view key) const -> std::optional<std::string> {
    return this->findInherited<std::string>(node, [key](AttributeNode const& n) { return n.getName(key); });
}

auto TreeResolver::findInheritedString(AttributeNode const& node, std::string_view key) const -> std::optional<std::string> {
    return this->findInherited<std::string>(node, [key](AttributeNode const& n) { return n.getString(key); });
}

auto TreeResolver::findInheritedInteger(AttributeNode const& node, std::string_view key) const -> std::optional<std::int64_t> {
    return this->findInherited<std::int64_t>(node, [key](AttributeNode const& n) { return n.getInteger(key); });
}

auto TreeResolver::ancestorChain(AttributeNode& node) const -> std::vector<AttributeNode*> {
    std::vector<AttributeNode*>                chain;
    phmap::flat_hash_set<AttributeNode const*> visited;
    AttributeNode*                             current = &node;
    while (current != nullptr && chain.size() <= this->options_.maxAncestorDepth) {
        if (this->options_.detectCycles && !visited.insert(current).second) {
            ft_log("Parent cycle detected while collecting ancestors", "TreeResolver", "Cycle");
            break;
        }
        chain.push_back(current);
        auto parent = this->parentOf(*current);
        if (!parent) {
            ft_log("Ancestor chain cut at unreadable parent entry: " + describeError(parent.error()), "TreeResolver");
            break;
        }
        current = *parent;
    }
    return chain;
}

auto TreeResolver::createField(FormContext const& form, AttributeNode& node) const -> Expected<FieldNode> {
    auto field = this->factory_->createField(form, node);
    if (!field)
        return std::unexpected(as_io_error(field.error(), "field creation failed"));
    return field;
}

auto TreeResolver::materialize(FormContext const& form, AttributeNode& node, NodeRole role) const -> Expected<KidEntry> {
    if (role == NodeRole::Widget)
        return KidEntry{Widget{node}};
    auto field = this->createField(form, node);
    if (!field)
        return std::unexpected(field.error());
    return KidEntry{std::move(*field)};
}

auto TreeResolver::kids(FormContext const& form, AttributeNode& node) const -> Expected<std::optional<KidList>> {
    auto array = node.getArray(Keys::Kids);
    if (!array)
        return std::unexpected(array.error());
    if (*array == nullptr)
        return std::optional<KidList>{};

    auto&                    backing = **array;
    std::vector<KidEntry>    entries;
    std::vector<std::size_t> indices;
    entries.reserve(backing.size());
    indices.reserve(backing.size());

    for (std::size_t i = 0; i < backing.size(); ++i) {
        auto* kid = backing.getNode(i);
        if (kid == nullptr) {
            ft_log("Skipping unresolvable kid at index " + std::to_string(i), "TreeResolver");
            continue;
        }
        AttributeNode const* kidParent = nullptr;
        if (auto parent = this->parentOf(*kid))
            kidParent = *parent;
        else
            ft_log("Classifying kid " + std::to_string(i) + " without its parent: " + describeError(parent.error()), "Classifier");

        auto entry = this->materialize(form, *kid, classifyNode(*kid, kidParent));
        if (!entry)
            return std::unexpected(entry.error());
        entries.push_back(std::move(*entry));
        indices.push_back(i);
    }
    return std::optional<KidList>{KidList{backing, std::move(entries), std::move(indices)}};
}

auto TreeResolver::widget(FormContext const& form, AttributeNode& node) const -> Expected<std::optional<Widget>> {
    phmap::flat_hash_set<AttributeNode const*> visited;
    AttributeNode*                             current = &node;
    while (true) {
        if (this->options_.detectCycles && !visited.insert(current).second)
            return std::unexpected(Error{Error::Code::MalformedInput, "cycle in Kids while looking for a widget"});

        auto list = this->kids(form, *current);
        if (!list)
            return std::unexpected(list.error());
        if (!*list)
            return std::optional<Widget>{Widget{*current}};
        if ((*list)->empty())
            return std::optional<Widget>{};

        auto const& first = (*list)->front();
        if (auto const* widget = std::get_if<Widget>(&first))
            return std::optional<Widget>{*widget};
        current = &std::get<FieldNode>(first).node();
    }
}

auto TreeResolver::findKid(FormContext const&              form,
                           AttributeNode&                  node,
                           std::vector<std::string> const& segments,
                           std::size_t                     index) const -> Expected<std::optional<FieldNode>> {
    if (index >= segments.size())
        return std::unexpected(Error{Error::Code::InvalidPath,
                                     "segment index " + std::to_string(index) + " past end of " + std::to_string(segments.size()) + " segments"});

    auto array = node.getArray(Keys::Kids);
    if (!array)
        return std::unexpected(array.error());
    if (*array == nullptr)
        return std::optional<FieldNode>{};

    auto const& backing = **array;
    for (std::size_t i = 0; i < backing.size(); ++i) {
        auto* kid = backing.getNode(i);
        if (kid == nullptr)
            continue;
        if (kid->getString(Keys::PartialName) != segments[index])
            continue;

        // Matched names are always built as fields, widget shaped or not.
        auto field = this->createField(form, *kid);
        if (!field)
            return std::unexpected(field.error());
        if (index + 1 < segments.size())
            return this->findKid(form, field->node(), segments, index + 1);
        return std::optional<FieldNode>{std::move(*field)};
    }
    return std::optional<FieldNode>{};
}

} // namespace FT
