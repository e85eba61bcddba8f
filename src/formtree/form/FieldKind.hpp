#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace FT {

// Field variant selected from the inherited FT entry.
enum class FieldKind {
    NonTerminal = 0,
    Button,
    Text,
    Choice,
    Signature,
    Unknown
};

[[nodiscard]] auto fieldKindFromType(std::optional<std::string> const& fieldType) -> FieldKind;
[[nodiscard]] auto fieldKindToString(FieldKind kind) -> std::string_view;

} // namespace FT
