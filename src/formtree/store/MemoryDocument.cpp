#include "MemoryDocument.hpp"
#include "log/TaggedLogger.hpp"

namespace FT {

// ----- MemoryArray -----

auto MemoryArray::size() const -> std::size_t {
    return this->entries_.size();
}

auto MemoryArray::getNode(std::size_t index) const -> AttributeNode* {
    if (index >= this->entries_.size())
        return nullptr;
    auto const* reference = std::get_if<ObjectReference>(&this->entries_[index]);
    if (reference == nullptr)
        return nullptr;
    return this->document_->object(reference->number);
}

auto MemoryArray::referenceTo(AttributeNode& node) const -> Expected<ObjectReference> {
    if (!this->document_->owns(node))
        return std::unexpected(Error{Error::Code::InvalidType, "node belongs to another store"});
    return ObjectReference{static_cast<MemoryNode&>(node).objectNumber()};
}

auto MemoryArray::setNode(std::size_t index, AttributeNode& node) -> std::optional<Error> {
    if (index >= this->entries_.size())
        return Error{Error::Code::InvalidPath, "array index " + std::to_string(index) + " out of range"};
    auto reference = this->referenceTo(node);
    if (!reference)
        return reference.error();
    this->entries_[index] = *reference;
    return std::nullopt;
}

auto MemoryArray::insert(std::size_t index, AttributeNode& node) -> std::optional<Error> {
    if (index > this->entries_.size())
        return Error{Error::Code::InvalidPath, "array index " + std::to_string(index) + " out of range"};
    auto reference = this->referenceTo(node);
    if (!reference)
        return reference.error();
    this->entries_.insert(this->entries_.begin() + static_cast<std::ptrdiff_t>(index), *reference);
    return std::nullopt;
}

auto MemoryArray::append(AttributeNode& node) -> std::optional<Error> {
    auto reference = this->referenceTo(node);
    if (!reference)
        return reference.error();
    this->entries_.emplace_back(*reference);
    return std::nullopt;
}

auto MemoryArray::erase(std::size_t index) -> std::optional<Error> {
    if (index >= this->entries_.size())
        return Error{Error::Code::InvalidPath, "array index " + std::to_string(index) + " out of range"};
    this->entries_.erase(this->entries_.begin() + static_cast<std::ptrdiff_t>(index));
    return std::nullopt;
}

auto MemoryArray::appendReference(ObjectNumber number) -> void {
    this->entries_.emplace_back(ObjectReference{number});
}

auto MemoryArray::appendInteger(std::int64_t value) -> void {
    this->entries_.emplace_back(value);
}

// ----- MemoryNode -----

auto MemoryNode::find(std::string_view key) const -> Value const* {
    auto it = this->attributes_.find(key);
    if (it == this->attributes_.end())
        return nullptr;
    return &it->second;
}

auto MemoryNode::put(std::string_view key, Value value) -> void {
    auto it = this->attributes_.find(key);
    if (it != this->attributes_.end()) {
        it->second = std::move(value);
        return;
    }
    this->attributes_.emplace(std::string{key}, std::move(value));
}

auto MemoryNode::hasKey(std::string_view key) const -> bool {
    return this->find(key) != nullptr;
}

auto MemoryNode::remove(std::string_view key) -> void {
    auto it = this->attributes_.find(key);
    if (it != this->attributes_.end())
        this->attributes_.erase(it);
}

auto MemoryNode::getString(std::string_view key) const -> std::optional<std::string> {
    if (auto const* value = this->find(key))
        if (auto const* str = std::get_if<String>(value))
            return str->value;
    return std::nullopt;
}

auto MemoryNode::setString(std::string_view key, std::string value) -> void {
    this->put(key, String{std::move(value)});
}

auto MemoryNode::getName(std::string_view key) const -> std::optional<std::string> {
    if (auto const* value = this->find(key))
        if (auto const* name = std::get_if<Name>(value))
            return name->value;
    return std::nullopt;
}

auto MemoryNode::setName(std::string_view key, std::string value) -> void {
    this->put(key, Name{std::move(value)});
}

auto MemoryNode::getInteger(std::string_view key) const -> std::optional<std::int64_t> {
    if (auto const* value = this->find(key))
        if (auto const* integer = std::get_if<std::int64_t>(value))
            return *integer;
    return std::nullopt;
}

auto MemoryNode::setInteger(std::string_view key, std::int64_t value) -> void {
    this->put(key, value);
}

auto MemoryNode::resolve(std::string_view key) const -> Expected<AttributeNode*> {
    auto const* value = this->find(key);
    if (value == nullptr)
        return nullptr;
    auto const* reference = std::get_if<ObjectReference>(value);
    if (reference == nullptr)
        return std::unexpected(Error{Error::Code::IOError,
                                     "object " + std::to_string(this->number_) + " entry '" + std::string{key} + "' is not a reference"});
    auto* target = this->document_->object(reference->number);
    if (target == nullptr)
        ft_log("Dangling reference " + std::to_string(reference->number) + " under '" + std::string{key} + "'", "MemoryDocument");
    return target;
}

auto MemoryNode::getNode(std::string_view primary, std::string_view fallback) const -> Expected<AttributeNode*> {
    if (!primary.empty() && this->hasKey(primary)) {
        auto target = this->resolve(primary);
        if (!target || *target != nullptr || fallback.empty())
            return target;
    }
    if (!fallback.empty())
        return this->resolve(fallback);
    return nullptr;
}

auto MemoryNode::setNode(std::string_view key, AttributeNode& value) -> std::optional<Error> {
    if (!this->document_->owns(value))
        return Error{Error::Code::InvalidType, "node belongs to another store"};
    this->put(key, ObjectReference{static_cast<MemoryNode&>(value).objectNumber()});
    return std::nullopt;
}

auto MemoryNode::setReference(std::string_view key, ObjectNumber number) -> void {
    this->put(key, ObjectReference{number});
}

auto MemoryNode::getArray(std::string_view key) const -> Expected<AttributeArray*> {
    auto const* value = this->find(key);
    if (value == nullptr)
        return nullptr;
    auto const* array = std::get_if<std::unique_ptr<MemoryArray>>(value);
    if (array == nullptr)
        return std::unexpected(Error{Error::Code::IOError,
                                     "object " + std::to_string(this->number_) + " entry '" + std::string{key} + "' is not an array"});
    return array->get();
}

auto MemoryNode::createArray(std::string_view key) -> MemoryArray& {
    auto  array  = std::make_unique<MemoryArray>(*this->document_);
    auto& result = *array;
    this->put(key, std::move(array));
    return result;
}

// ----- MemoryDocument -----

auto MemoryDocument::createNode() -> MemoryNode& {
    auto const number = this->nextNumber_++;
    auto       node   = std::make_unique<MemoryNode>(*this, number);
    auto&      result = *node;
    this->objects_.emplace(number, std::move(node));
    return result;
}

auto MemoryDocument::object(ObjectNumber number) const -> MemoryNode* {
    auto it = this->objects_.find(number);
    if (it == this->objects_.end())
        return nullptr;
    return it->second.get();
}

auto MemoryDocument::erase(ObjectNumber number) -> bool {
    return this->objects_.erase(number) > 0;
}

auto MemoryDocument::owns(AttributeNode const& node) const -> bool {
    auto const* memoryNode = dynamic_cast<MemoryNode const*>(&node);
    if (memoryNode == nullptr)
        return false;
    return this->object(memoryNode->objectNumber()) == memoryNode;
}

} // namespace FT
