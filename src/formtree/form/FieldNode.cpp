#include "FieldNode.hpp"
#include "form/FieldKeys.hpp"
#include "form/FormContext.hpp"
#include "form/KidList.hpp"
#include "form/TreeResolver.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <string>

namespace FT {

FieldNode::FieldNode(FormContext const& form)
    : form_(&form), node_(&form.store().createNode()), kind_(FieldKind::NonTerminal) {}

FieldNode::FieldNode(FormContext const& form, AttributeNode& node)
    : form_(&form), node_(&node), kind_(fieldKindFromType(form.resolver().findInheritedName(node, Keys::FieldType))) {}

FieldNode::FieldNode(FormContext const& form, AttributeNode& node, FieldKind kind)
    : form_(&form), node_(&node), kind_(kind) {}

auto FieldNode::partialName() const -> std::optional<std::string> {
    return this->node_->getString(Keys::PartialName);
}

auto FieldNode::setPartialName(std::string name) -> void {
    this->node_->setString(Keys::PartialName, std::move(name));
}

auto FieldNode::alternateFieldName() const -> std::optional<std::string> {
    return this->node_->getString(Keys::AlternateName);
}

auto FieldNode::setAlternateFieldName(std::string name) -> void {
    this->node_->setString(Keys::AlternateName, std::move(name));
}

auto FieldNode::mappingName() const -> std::optional<std::string> {
    return this->node_->getString(Keys::MappingName);
}

auto FieldNode::setMappingName(std::string name) -> void {
    this->node_->setString(Keys::MappingName, std::move(name));
}

auto FieldNode::fullyQualifiedName() const -> std::optional<std::string> {
    auto chain = this->form_->resolver().ancestorChain(*this->node_);
    std::reverse(chain.begin(), chain.end());

    std::optional<std::string> name;
    for (auto const* node : chain) {
        auto partial = node->getString(Keys::PartialName);
        if (!partial)
            continue;
        if (name) {
            name->push_back('.');
            name->append(*partial);
        } else {
            name = std::move(partial);
        }
    }
    return name;
}

auto FieldNode::fieldType() const -> std::optional<std::string> {
    return this->form_->resolver().findInheritedName(*this->node_, Keys::FieldType);
}

auto FieldNode::fieldFlags() const -> std::uint32_t {
    return static_cast<std::uint32_t>(this->node_->getInteger(Keys::FieldFlags).value_or(0));
}

auto FieldNode::setFieldFlags(std::uint32_t flags) -> void {
    this->node_->setInteger(Keys::FieldFlags, static_cast<std::int64_t>(flags));
}

auto FieldNode::setFlag(std::uint32_t flag, bool value) -> void {
    auto flags = this->fieldFlags();
    if (value)
        flags |= flag;
    else
        flags &= ~flag;
    this->setFieldFlags(flags);
}

auto FieldNode::isReadOnly() const -> bool {
    return (this->fieldFlags() & FLAG_READ_ONLY) != 0;
}

auto FieldNode::setReadOnly(bool readOnly) -> void {
    this->setFlag(FLAG_READ_ONLY, readOnly);
}

auto FieldNode::isRequired() const -> bool {
    return (this->fieldFlags() & FLAG_REQUIRED) != 0;
}

auto FieldNode::setRequired(bool required) -> void {
    this->setFlag(FLAG_REQUIRED, required);
}

auto FieldNode::isNoExport() const -> bool {
    return (this->fieldFlags() & FLAG_NO_EXPORT) != 0;
}

auto FieldNode::setNoExport(bool noExport) -> void {
    this->setFlag(FLAG_NO_EXPORT, noExport);
}

auto FieldNode::parent() const -> Expected<std::optional<FieldNode>> {
    auto const& resolver = this->form_->resolver();
    auto        parent   = resolver.parentOf(*this->node_);
    if (!parent)
        return std::unexpected(parent.error());
    if (*parent == nullptr)
        return std::optional<FieldNode>{};
    auto field = resolver.createField(*this->form_, **parent);
    if (!field)
        return std::unexpected(field.error());
    return std::optional<FieldNode>{std::move(*field)};
}

auto FieldNode::setParent(FieldNode const* parent) -> std::optional<Error> {
    if (parent == nullptr) {
        this->node_->remove(Keys::Parent);
        this->node_->remove(Keys::ParentLegacy);
        return std::nullopt;
    }
    return this->node_->setNode(Keys::Parent, parent->node());
}

auto FieldNode::kids() const -> Expected<std::optional<KidList>> {
    return this->form_->resolver().kids(*this->form_, *this->node_);
}

auto FieldNode::setKids(std::vector<KidEntry> const& kids) -> std::optional<Error> {
    auto const& store = this->form_->store();
    if (!store.owns(*this->node_))
        return Error{Error::Code::InvalidType, "field node belongs to another store"};
    for (std::size_t i = 0; i < kids.size(); ++i)
        if (!store.owns(entryNode(kids[i])))
            return Error{Error::Code::InvalidType, "kid " + std::to_string(i) + " belongs to another store"};

    auto& array = this->node_->createArray(Keys::Kids);
    for (auto const& kid : kids) {
        auto& kidNode = entryNode(kid);
        if (auto error = array.append(kidNode))
            return error;
        if (auto error = kidNode.setNode(Keys::Parent, *this->node_))
            return error;
    }
    ft_log("Replaced Kids with " + std::to_string(kids.size()) + " entries", "FieldNode");
    return std::nullopt;
}

auto FieldNode::widget() const -> Expected<std::optional<Widget>> {
    return this->form_->resolver().widget(*this->form_, *this->node_);
}

auto FieldNode::findKid(std::vector<std::string> const& segments, std::size_t index) const
        -> Expected<std::optional<FieldNode>> {
    return this->form_->resolver().findKid(*this->form_, *this->node_, segments, index);
}

} // namespace FT
