#include "vscore/hir/declaration.hpp"

namespace vscore::hir {

auto ToString(Mode mode) -> const char* {
  switch (mode) {
    case Mode::kIn:
      return "in";
    case Mode::kOut:
      return "out";
    case Mode::kInout:
      return "inout";
    case Mode::kBuffer:
      return "buffer";
    case Mode::kLinkage:
      return "linkage";
  }
  return "?";
}

}  // namespace vscore::hir
