#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <tuple>
#include <utility>
#include <vector>

#include "vscore/ast/ast.hpp"
#include "vscore/hir/arena.hpp"
#include "vscore/hir/fwd.hpp"
#include "vscore/hir/refs.hpp"

namespace vscore::score {

// Syntax backing of a library: its name and the design units it holds.
struct LibraryEntry {
  ast::Ident name;
  std::span<const ast::DesignUnit> units;
};

// The context clause preceding a design unit, or the clauses inside a
// context declaration.
struct ContextItemsEntry {
  // Name of the design unit the clauses belong to
  ast::Ident name;
  hir::LibraryId library;
  const std::vector<ast::ContextItem>* items = nullptr;
  // Set for the clauses of an architecture, whose scope chains to the
  // entity it implements.
  std::optional<hir::ArchitectureId> architecture;
  // Whether the implicit `library std, work; use std.standard.all;` applies.
  // False for the inside of a context declaration.
  bool implicit = true;
};

// A top-level design unit.
template <typename Node>
struct DesignUnitEntry {
  ast::Ident name;
  hir::LibraryId library;
  hir::ContextItemsId context;
  const Node* node = nullptr;
};

// A node declared inside some scope. Object and interface declarations
// with several names register once per name; `name` tells them apart.
template <typename Node>
struct ScopedEntry {
  ast::Ident name;
  hir::ScopeRef parent;
  hir::LibraryId library;
  const Node* node = nullptr;
};

template <hir::NodeKind K>
struct AstTraits;

template <>
struct AstTraits<hir::NodeKind::kLibrary> {
  using Entry = LibraryEntry;
};
template <>
struct AstTraits<hir::NodeKind::kContextItems> {
  using Entry = ContextItemsEntry;
};
template <>
struct AstTraits<hir::NodeKind::kEntity> {
  using Entry = DesignUnitEntry<ast::EntityDecl>;
};
template <>
struct AstTraits<hir::NodeKind::kArchitecture> {
  using Entry = DesignUnitEntry<ast::ArchitectureBody>;
};
template <>
struct AstTraits<hir::NodeKind::kConfiguration> {
  using Entry = DesignUnitEntry<ast::ConfigurationDecl>;
};
template <>
struct AstTraits<hir::NodeKind::kPackage> {
  using Entry = ScopedEntry<ast::PackageDecl>;
};
template <>
struct AstTraits<hir::NodeKind::kPackageInstance> {
  using Entry = ScopedEntry<ast::PackageInstDecl>;
};
template <>
struct AstTraits<hir::NodeKind::kPackageBody> {
  using Entry = DesignUnitEntry<ast::PackageBody>;
};
template <>
struct AstTraits<hir::NodeKind::kContext> {
  using Entry = DesignUnitEntry<ast::ContextDecl>;
};
template <>
struct AstTraits<hir::NodeKind::kGeneric> {
  using Entry = ScopedEntry<ast::InterfaceDecl>;
};
template <>
struct AstTraits<hir::NodeKind::kInterfaceSignal> {
  using Entry = ScopedEntry<ast::InterfaceDecl>;
};
template <>
struct AstTraits<hir::NodeKind::kTypeDecl> {
  using Entry = ScopedEntry<ast::TypeDecl>;
};
template <>
struct AstTraits<hir::NodeKind::kSubtypeDecl> {
  using Entry = ScopedEntry<ast::SubtypeDecl>;
};
template <>
struct AstTraits<hir::NodeKind::kConstDecl> {
  using Entry = ScopedEntry<ast::ObjectDecl>;
};
template <>
struct AstTraits<hir::NodeKind::kSignalDecl> {
  using Entry = ScopedEntry<ast::ObjectDecl>;
};
template <>
struct AstTraits<hir::NodeKind::kVariableDecl> {
  using Entry = ScopedEntry<ast::ObjectDecl>;
};
template <>
struct AstTraits<hir::NodeKind::kFileDecl> {
  using Entry = ScopedEntry<ast::ObjectDecl>;
};
template <>
struct AstTraits<hir::NodeKind::kConcurrentStmt> {
  using Entry = ScopedEntry<ast::ConcurrentStmt>;
};

template <hir::NodeKind K>
using AstEntry = typename AstTraits<K>::Entry;

// Maps every syntax-backed identifier to its parent and syntax node. This
// is where identifiers of those kinds are allocated.
class AstTable {
 public:
  template <hir::NodeKind K>
  auto Add(AstEntry<K> entry) -> hir::NodeId<K> {
    return Slots<K>().Allocate(std::move(entry));
  }

  template <hir::NodeKind K>
  [[nodiscard]] auto Get(hir::NodeId<K> id) const -> const AstEntry<K>& {
    return Slots<K>()[id];
  }

  // The id the next Add<K> will hand out.
  template <hir::NodeKind K>
  [[nodiscard]] auto NextId() const -> hir::NodeId<K> {
    return hir::NodeId<K>{.value = static_cast<uint32_t>(Slots<K>().Size())};
  }

 private:
  template <hir::NodeKind K>
  using Slot = hir::IndexedArena<hir::NodeId<K>, AstEntry<K>>;

  template <hir::NodeKind K>
  auto Slots() -> Slot<K>& {
    return std::get<Slot<K>>(slots_);
  }

  template <hir::NodeKind K>
  [[nodiscard]] auto Slots() const -> const Slot<K>& {
    return std::get<Slot<K>>(slots_);
  }

  std::tuple<
      Slot<hir::NodeKind::kLibrary>, Slot<hir::NodeKind::kContextItems>,
      Slot<hir::NodeKind::kEntity>, Slot<hir::NodeKind::kArchitecture>,
      Slot<hir::NodeKind::kConfiguration>, Slot<hir::NodeKind::kPackage>,
      Slot<hir::NodeKind::kPackageInstance>,
      Slot<hir::NodeKind::kPackageBody>, Slot<hir::NodeKind::kContext>,
      Slot<hir::NodeKind::kGeneric>, Slot<hir::NodeKind::kInterfaceSignal>,
      Slot<hir::NodeKind::kTypeDecl>, Slot<hir::NodeKind::kSubtypeDecl>,
      Slot<hir::NodeKind::kConstDecl>, Slot<hir::NodeKind::kSignalDecl>,
      Slot<hir::NodeKind::kVariableDecl>, Slot<hir::NodeKind::kFileDecl>,
      Slot<hir::NodeKind::kConcurrentStmt>>
      slots_;
};

}  // namespace vscore::score
