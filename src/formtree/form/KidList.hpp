#pragma once
#include "core/Error.hpp"
#include "form/FieldNode.hpp"
#include "form/Widget.hpp"
#include "store/AttributeNode.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace FT {

[[nodiscard]] auto entryNode(KidEntry const& entry) -> AttributeNode&;
[[nodiscard]] auto isWidget(KidEntry const& entry) noexcept -> bool;

/**
 * Classified view over a field's Kids array.
 *
 * Entries keep document order. Unresolvable entries of the backing array are
 * not part of the view, so every entry remembers the backing index it came
 * from. Edits made through the list are written to the backing array right
 * away; the list stays in sync as long as the array is only edited through it.
 *
 * The list borrows the backing array. Replacing or removing the owner's Kids
 * entry (FieldNode::setKids, createArray) destroys that array and leaves any
 * list taken earlier dangling; fetch a new one with kids() afterwards.
 */
class KidList {
public:
    using const_iterator = std::vector<KidEntry>::const_iterator;

    KidList(AttributeArray& backing, std::vector<KidEntry> entries, std::vector<std::size_t> backingIndices);

    [[nodiscard]] auto size() const noexcept -> std::size_t { return entries_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return entries_.empty(); }
    [[nodiscard]] auto operator[](std::size_t index) const -> KidEntry const& { return entries_[index]; }
    [[nodiscard]] auto front() const -> KidEntry const& { return entries_.front(); }
    [[nodiscard]] auto begin() const noexcept -> const_iterator { return entries_.begin(); }
    [[nodiscard]] auto end() const noexcept -> const_iterator { return entries_.end(); }

    [[nodiscard]] auto backing() const noexcept -> AttributeArray& { return *backing_; }
    [[nodiscard]] auto backingIndex(std::size_t index) const -> std::size_t { return backingIndices_[index]; }

    auto append(KidEntry entry) -> std::optional<Error>;
    auto set(std::size_t index, KidEntry entry) -> std::optional<Error>;
    auto erase(std::size_t index) -> std::optional<Error>;

private:
    AttributeArray*          backing_;
    std::vector<KidEntry>    entries_;
    std::vector<std::size_t> backingIndices_;
};

} // namespace FT
