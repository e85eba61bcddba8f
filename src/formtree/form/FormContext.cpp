#include "FormContext.hpp"
#include "form/FieldKeys.hpp"
#include "log/TaggedLogger.hpp"
#include "path/FieldNameIterator.hpp"

namespace FT {

FormContext::FormContext(AttributeStore& store, AttributeNode& formNode, FieldFactory const& factory, ResolverOptions options)
    : store_(&store), formNode_(&formNode), resolver_(factory, options) {}

auto FormContext::fields() const -> Expected<std::vector<FieldNode>> {
    std::vector<FieldNode> result;
    auto                   array = this->formNode_->getArray(Keys::Fields);
    if (!array)
        return std::unexpected(array.error());
    if (*array == nullptr)
        return result;

    auto const& backing = **array;
    result.reserve(backing.size());
    for (std::size_t i = 0; i < backing.size(); ++i) {
        auto* node = backing.getNode(i);
        if (node == nullptr) {
            ft_log("Skipping unresolvable root field at index " + std::to_string(i), "FormContext");
            continue;
        }
        auto field = this->resolver_.createField(*this, *node);
        if (!field)
            return std::unexpected(field.error());
        result.push_back(std::move(*field));
    }
    return result;
}

auto FormContext::addField(FieldNode const& field) const -> std::optional<Error> {
    auto array = this->formNode_->getArray(Keys::Fields);
    if (!array)
        return array.error();
    AttributeArray* backing = *array;
    if (backing == nullptr)
        backing = &this->formNode_->createArray(Keys::Fields);
    return backing->append(field.node());
}

auto FormContext::getField(std::string_view fullyQualifiedName) const -> Expected<std::optional<FieldNode>> {
    auto segments = splitFieldName(fullyQualifiedName);
    if (!segments)
        return std::unexpected(segments.error());

    auto roots = this->fields();
    if (!roots)
        return std::unexpected(roots.error());

    for (auto const& root : *roots) {
        if (root.partialName() != segments->front())
            continue;
        if (segments->size() == 1)
            return std::optional<FieldNode>{root};
        return root.findKid(*segments, 1);
    }
    ft_log("No root field named '" + segments->front() + "'", "FormContext");
    return std::optional<FieldNode>{};
}

} // namespace FT
