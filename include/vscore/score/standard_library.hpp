#pragma once

#include <vector>

#include "vscore/ast/ast.hpp"

namespace vscore::score {

// Syntax of library `std`: package `standard` with the predefined types of
// IEEE 1076-2008 16.3 that need no physical units or arrays.
auto MakeStandardLibrary() -> std::vector<ast::DesignUnit>;

}  // namespace vscore::score
