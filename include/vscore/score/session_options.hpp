#pragma once

namespace vscore::score {

struct SessionOptions {
  // Log every definition as it is declared, and every query computation.
  bool trace_scoreboard = false;
  // Keep the first of several design units with the same name instead of
  // reporting them.
  bool ignore_duplicate_defs = false;
  // Register library `std` with package `standard` and make it implicitly
  // visible to every design unit.
  bool standard_library = true;
};

}  // namespace vscore::score
