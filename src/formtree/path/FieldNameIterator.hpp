#pragma once
#include "core/Error.hpp"

#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace FT {

inline constexpr char FieldNameSeparator = '.';

/**
 * Walks the partial-name segments of a fully qualified field name such as
 * "address.street.line1". Segments are yielded exactly as written, so "a..b"
 * yields an empty middle segment; validate() rejects such names.
 */
class FieldNameIterator {
public:
    using iterator_category = std::forward_iterator_tag;
    using value_type        = std::string_view;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const value_type*;
    using reference         = const value_type&;

    explicit FieldNameIterator(std::string_view name) noexcept;

    [[nodiscard]] auto operator*() const noexcept -> value_type;
    [[nodiscard]] auto operator->() const noexcept -> pointer;
    auto               operator++() noexcept -> FieldNameIterator&;
    auto               operator++(int) noexcept -> FieldNameIterator;
    [[nodiscard]] auto operator==(const FieldNameIterator& other) const noexcept -> bool;

    [[nodiscard]] auto isAtStart() const noexcept -> bool;
    [[nodiscard]] auto isAtFinalComponent() const noexcept -> bool;
    [[nodiscard]] auto isAtEnd() const noexcept -> bool;
    [[nodiscard]] auto validate() const noexcept -> std::optional<Error>;
    [[nodiscard]] auto fullName() const noexcept -> std::string_view;

private:
    auto updateCurrentSegment() noexcept -> void;

    std::string_view name;            // Complete name being iterated
    std::string_view current_segment; // Segment at the current position
    std::size_t      current;         // Offset of the current segment
    std::size_t      segment_end;     // Offset one past the current segment
    bool             at_end;
};

// Splits and validates a fully qualified name.
[[nodiscard]] auto splitFieldName(std::string_view name) -> Expected<std::vector<std::string>>;

} // namespace FT
