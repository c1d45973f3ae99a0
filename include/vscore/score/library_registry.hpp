#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "vscore/hir/fwd.hpp"

namespace vscore::score {

// Process-wide mapping from library names to libraries. Filled while the
// session is set up; read-only once queries run.
class LibraryRegistry {
 public:
  // Registering a name twice is a setup bug and throws InternalError.
  void Register(std::string_view name, hir::LibraryId id);

  [[nodiscard]] auto Lookup(std::string_view name) const
      -> std::optional<hir::LibraryId>;

  // Canonical names in registration order
  [[nodiscard]] auto Names() const -> const std::vector<std::string>& {
    return names_;
  }

 private:
  absl::flat_hash_map<std::string, hir::LibraryId> libraries_;
  std::vector<std::string> names_;
};

}  // namespace vscore::score
