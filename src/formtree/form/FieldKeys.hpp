#pragma once
#include <string_view>

namespace FT::Keys {

// Attribute keys read and written by the field tree.
inline constexpr std::string_view PartialName       = "T";
inline constexpr std::string_view AlternateName     = "TU";
inline constexpr std::string_view MappingName       = "TM";
inline constexpr std::string_view FieldType         = "FT";
inline constexpr std::string_view FieldFlags        = "Ff";
inline constexpr std::string_view Parent            = "Parent";
inline constexpr std::string_view ParentLegacy      = "P";
inline constexpr std::string_view Kids              = "Kids";
inline constexpr std::string_view Subtype           = "Subtype";
inline constexpr std::string_view Fields            = "Fields";

// Subtype marker of an interactive widget annotation.
inline constexpr std::string_view WidgetSubtype = "Widget";

} // namespace FT::Keys
