#include "vscore/score/library_registry.hpp"

#include <format>
#include <string>

#include "vscore/common/internal_error.hpp"
#include "vscore/common/name.hpp"

namespace vscore::score {

void LibraryRegistry::Register(std::string_view name, hir::LibraryId id) {
  std::string canonical = CanonicalName(name);
  auto [it, inserted] = libraries_.try_emplace(canonical, id);
  if (!inserted) {
    common::ThrowInternalError(
        "LibraryRegistry::Register",
        std::format("library `{}` registered twice", canonical));
  }
  names_.push_back(std::move(canonical));
}

auto LibraryRegistry::Lookup(std::string_view name) const
    -> std::optional<hir::LibraryId> {
  auto it = libraries_.find(CanonicalName(name));
  if (it == libraries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace vscore::score
