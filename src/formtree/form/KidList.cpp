#include "KidList.hpp"

#include <string>

namespace FT {

auto entryNode(KidEntry const& entry) -> AttributeNode& {
    return std::visit([](auto const& kid) -> AttributeNode& { return kid.node(); }, entry);
}

auto isWidget(KidEntry const& entry) noexcept -> bool {
    return std::holds_alternative<Widget>(entry);
}

KidList::KidList(AttributeArray& backing, std::vector<KidEntry> entries, std::vector<std::size_t> backingIndices)
    : backing_(&backing), entries_(std::move(entries)), backingIndices_(std::move(backingIndices)) {}

auto KidList::append(KidEntry entry) -> std::optional<Error> {
    auto const position = this->backing_->size();
    if (auto error = this->backing_->append(entryNode(entry)))
        return error;
    this->entries_.push_back(std::move(entry));
    this->backingIndices_.push_back(position);
    return std::nullopt;
}

auto KidList::set(std::size_t index, KidEntry entry) -> std::optional<Error> {
    if (index >= this->entries_.size())
        return Error{Error::Code::InvalidPath, "kid index " + std::to_string(index) + " out of range"};
    if (auto error = this->backing_->setNode(this->backingIndices_[index], entryNode(entry)))
        return error;
    this->entries_[index] = std::move(entry);
    return std::nullopt;
}

auto KidList::erase(std::size_t index) -> std::optional<Error> {
    if (index >= this->entries_.size())
        return Error{Error::Code::InvalidPath, "kid index " + std::to_string(index) + " out of range"};
    if (auto error = this->backing_->erase(this->backingIndices_[index]))
        return error;
    this->entries_.erase(this->entries_.begin() + static_cast<std::ptrdiff_t>(index));
    this->backingIndices_.erase(this->backingIndices_.begin() + static_cast<std::ptrdiff_t>(index));
    for (auto i = index; i < this->backingIndices_.size(); ++i)
        --this->backingIndices_[i];
    return std::nullopt;
}

} // namespace FT
