#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "vscore/common/source_span.hpp"
#include "vscore/hir/refs.hpp"

namespace vscore::score {

// Maps canonical names to what they may denote. Entries under one name keep
// insertion order; names are enumerated in order of first insertion.
class Defs {
 public:
  using Entries = std::vector<Spanned<hir::Def>>;

  void Append(const std::string& name, Spanned<hir::Def> def) {
    auto [it, inserted] = map_.try_emplace(name);
    if (inserted) {
      order_.push_back(name);
    }
    it->second.push_back(def);
  }

  [[nodiscard]] auto Lookup(std::string_view name) const -> const Entries* {
    auto it = map_.find(absl::string_view(name.data(), name.size()));
    if (it == map_.end()) {
      return nullptr;
    }
    return &it->second;
  }

  [[nodiscard]] auto Names() const -> const std::vector<std::string>& {
    return order_;
  }

  [[nodiscard]] auto Size() const -> size_t {
    return order_.size();
  }

  [[nodiscard]] auto Empty() const -> bool {
    return order_.empty();
  }

 private:
  absl::flat_hash_map<std::string, Entries> map_;
  std::vector<std::string> order_;
};

// What is visible at some point of the design: the definitions tables in
// `defs` (the construct itself plus wildcard-imported packages), the names
// bound by selective use clauses, and everything the parent makes visible.
struct Scope {
  std::optional<hir::ScopeRef> parent;
  std::vector<hir::ScopeRef> defs;
  Defs explicit_defs;
};

}  // namespace vscore::score
