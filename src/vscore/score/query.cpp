#include "vscore/score/query.hpp"

namespace vscore::score {

auto ToString(QueryKind kind) -> const char* {
  switch (kind) {
    case QueryKind::kHir:
      return "hir";
    case QueryKind::kDefinitions:
      return "definitions";
    case QueryKind::kScope:
      return "scope";
  }
  return "unknown";
}

}  // namespace vscore::score
