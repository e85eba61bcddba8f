#include "FieldNameIterator.hpp"

namespace FT {

FieldNameIterator::FieldNameIterator(std::string_view name) noexcept
    : name{name}, current{0}, segment_end{0}, at_end{name.empty()} {
    updateCurrentSegment();
}

auto FieldNameIterator::updateCurrentSegment() noexcept -> void {
    if (this->at_end) {
        this->current_segment = {};
        return;
    }
    auto const separator = this->name.find(FieldNameSeparator, this->current);
    this->segment_end    = separator == std::string_view::npos ? this->name.size() : separator;
    this->current_segment = this->name.substr(this->current, this->segment_end - this->current);
}

auto FieldNameIterator::operator*() const noexcept -> value_type {
    return this->current_segment;
}

auto FieldNameIterator::operator->() const noexcept -> pointer {
    return &this->current_segment;
}

auto FieldNameIterator::operator++() noexcept -> FieldNameIterator& {
    if (this->at_end)
        return *this;
    if (this->segment_end >= this->name.size()) {
        this->at_end  = true;
        this->current = this->name.size();
    } else {
        this->current = this->segment_end + 1;
    }
    updateCurrentSegment();
    return *this;
}

auto FieldNameIterator::operator++(int) noexcept -> FieldNameIterator {
    FieldNameIterator tmp = *this;
    ++*this;
    return tmp;
}

auto FieldNameIterator::operator==(const FieldNameIterator& other) const noexcept -> bool {
    return this->name.data() == other.name.data() && this->current == other.current && this->at_end == other.at_end;
}

auto FieldNameIterator::isAtStart() const noexcept -> bool {
    return this->current == 0 && !this->at_end;
}

auto FieldNameIterator::isAtFinalComponent() const noexcept -> bool {
    return !this->at_end && this->segment_end == this->name.size();
}

auto FieldNameIterator::isAtEnd() const noexcept -> bool {
    return this->at_end;
}

auto FieldNameIterator::fullName() const noexcept -> std::string_view {
    return this->name;
}

auto FieldNameIterator::validate() const noexcept -> std::optional<Error> {
    if (this->name.empty())
        return Error{Error::Code::InvalidPath, "Empty field name"};
    if (this->name.front() == FieldNameSeparator)
        return Error{Error::Code::InvalidPath, "Field name starts with '.'"};
    if (this->name.back() == FieldNameSeparator)
        return Error{Error::Code::InvalidPath, "Field name ends with '.'"};
    if (this->name.find("..") != std::string_view::npos)
        return Error{Error::Code::InvalidPath, "Field name has an empty segment"};
    return std::nullopt;
}

auto splitFieldName(std::string_view name) -> Expected<std::vector<std::string>> {
    FieldNameIterator iter{name};
    if (auto error = iter.validate())
        return std::unexpected(*error);

    std::vector<std::string> segments;
    for (; !iter.isAtEnd(); ++iter)
        segments.emplace_back(*iter);
    return segments;
}

} // namespace FT
