#pragma once

#include <string>
#include <string_view>

namespace vscore {

// Lookup key for a VHDL name. Basic identifiers are case-insensitive and
// fold to lower case. Extended identifiers (\Foo\) and character literals
// ('a') keep their spelling.
auto CanonicalName(std::string_view spelling) -> std::string;

[[nodiscard]] auto IsCharacterLiteral(std::string_view spelling) -> bool;

}  // namespace vscore
