#include "FieldKind.hpp"

namespace FT {

auto fieldKindFromType(std::optional<std::string> const& fieldType) -> FieldKind {
    if (!fieldType)
        return FieldKind::NonTerminal;
    if (*fieldType == "Btn")
        return FieldKind::Button;
    if (*fieldType == "Tx")
        return FieldKind::Text;
    if (*fieldType == "Ch")
        return FieldKind::Choice;
    if (*fieldType == "Sig")
        return FieldKind::Signature;
    return FieldKind::Unknown;
}

auto fieldKindToString(FieldKind kind) -> std::string_view {
    switch (kind) {
    case FieldKind::NonTerminal:
        return "non_terminal";
    case FieldKind::Button:
        return "button";
    case FieldKind::Text:
        return "text";
    case FieldKind::Choice:
        return "choice";
    case FieldKind::Signature:
        return "signature";
    case FieldKind::Unknown:
        return "unknown";
    }
    return "unknown";
}

} // namespace FT
