#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <format>
#include <utility>

#include "vscore/common/internal_error.hpp"
#include "vscore/hir/fwd.hpp"

namespace vscore::hir {

// Append-only pool. Nodes never move and are never freed individually, so
// references returned by Allocate stay valid for the lifetime of the arena.
template <typename T>
class Arena final {
 public:
  Arena() = default;
  ~Arena() = default;

  Arena(const Arena&) = delete;
  auto operator=(const Arena&) -> Arena& = delete;

  Arena(Arena&&) = default;
  auto operator=(Arena&&) -> Arena& = default;

  auto Allocate(T value) -> const T& {
    nodes_.push_back(std::move(value));
    return nodes_.back();
  }

  [[nodiscard]] auto Size() const -> size_t {
    return nodes_.size();
  }

 private:
  std::deque<T> nodes_;
};

// Append-only pool that hands out typed identifiers. Indexing with an id
// this arena never produced is a contract violation.
template <typename Id, typename T>
class IndexedArena final {
 public:
  IndexedArena() = default;
  ~IndexedArena() = default;

  IndexedArena(const IndexedArena&) = delete;
  auto operator=(const IndexedArena&) -> IndexedArena& = delete;

  IndexedArena(IndexedArena&&) = default;
  auto operator=(IndexedArena&&) -> IndexedArena& = default;

  auto Allocate(T value) -> Id {
    Id id{.value = static_cast<uint32_t>(nodes_.size())};
    nodes_.push_back(std::move(value));
    return id;
  }

  [[nodiscard]] auto operator[](Id id) const -> const T& {
    if (id.value >= nodes_.size()) {
      common::ThrowInternalError(
          "IndexedArena::operator[]",
          std::format(
              "{}#{} was never allocated ({} nodes of this kind)",
              ToString(Id::kKind), id.value, nodes_.size()));
    }
    return nodes_[id.value];
  }

  [[nodiscard]] auto Contains(Id id) const -> bool {
    return id.value < nodes_.size();
  }

  [[nodiscard]] auto Size() const -> size_t {
    return nodes_.size();
  }

 private:
  std::deque<T> nodes_;
};

}  // namespace vscore::hir
