#include "Widget.hpp"
#include "form/FieldKeys.hpp"

namespace FT {

auto Widget::subtype() const -> std::optional<std::string> {
    return this->node_->getName(Keys::Subtype);
}

} // namespace FT
