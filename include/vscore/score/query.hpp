#pragma once

#include <cstdint>
#include <expected>
#include <utility>

#include "absl/container/flat_hash_map.h"
#include "vscore/hir/fwd.hpp"

namespace vscore::score {

// A query failed and the reason was already reported to the diagnostic
// sink. Callers propagate it without reporting again.
struct ErrorReported {};

template <typename T>
using QueryResult = std::expected<const T*, ErrorReported>;

template <typename T>
using Outcome = std::expected<T, ErrorReported>;

inline auto Failed() -> std::unexpected<ErrorReported> {
  return std::unexpected(ErrorReported{});
}

enum class QueryKind : uint8_t { kHir, kDefinitions, kScope };

auto ToString(QueryKind kind) -> const char*;

// Memoization table of one query over one identifier kind. A key is either
// absent, in progress (its computation is on the call stack), or done with
// a cached success or failure.
template <typename Key, typename Value>
class QueryCache {
 public:
  struct Slot {
    bool in_progress = true;
    QueryResult<Value> result = Failed();
  };

  [[nodiscard]] auto Find(Key key) const -> const Slot* {
    auto it = slots_.find(key);
    if (it == slots_.end()) {
      return nullptr;
    }
    return &it->second;
  }

  void Begin(Key key) {
    slots_.insert_or_assign(key, Slot{});
  }

  void Finish(Key key, QueryResult<Value> result) {
    slots_.insert_or_assign(
        key, Slot{.in_progress = false, .result = std::move(result)});
  }

 private:
  absl::flat_hash_map<Key, Slot> slots_;
};

// Number of times each (query, node kind) pair was actually computed, as
// opposed to served from a cache.
class QueryStats {
 public:
  void Record(QueryKind query, hir::NodeKind kind) {
    ++counts_[std::pair{query, kind}];
  }

  [[nodiscard]] auto Computations(QueryKind query, hir::NodeKind kind) const
      -> uint32_t {
    auto it = counts_.find(std::pair{query, kind});
    return it == counts_.end() ? 0 : it->second;
  }

 private:
  absl::flat_hash_map<std::pair<QueryKind, hir::NodeKind>, uint32_t> counts_;
};

}  // namespace vscore::score
