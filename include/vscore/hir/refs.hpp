#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>

#include "vscore/hir/fwd.hpp"

namespace vscore::hir {

// The i-th literal of an enumeration type declaration.
struct EnumLitRef {
  TypeDeclId type;
  uint32_t index = 0;

  auto operator==(const EnumLitRef&) const -> bool = default;

  template <typename H>
  friend auto AbslHashValue(H h, const EnumLitRef& ref) -> H {
    return H::combine(std::move(h), ref.type, ref.index);
  }
};

// A construct that introduces a scope and owns a definitions table.
using ScopeRef = std::variant<
    LibraryId, ContextItemsId, EntityId, ArchitectureId, PackageId,
    PackageInstanceId>;

// Anything a name may denote.
using Def = std::variant<
    LibraryId, EntityId, ConfigurationId, PackageId, PackageInstanceId,
    ContextId, TypeDeclId, SubtypeDeclId, EnumLitRef, ConstDeclId,
    SignalDeclId, VariableDeclId, FileDeclId>;

// A declaration that may appear in a package or an architecture.
using DeclRef = std::variant<
    PackageId, PackageInstanceId, TypeDeclId, SubtypeDeclId, ConstDeclId,
    SignalDeclId, VariableDeclId, FileDeclId>;

using TypeMarkRef = std::variant<TypeDeclId, SubtypeDeclId>;

// Only enumeration literals may share a name within one declarative region.
[[nodiscard]] auto IsOverloadable(const Def& def) -> bool;

[[nodiscard]] auto ToDef(const DeclRef& decl) -> Def;

// Short human-readable rendering, e.g. "package#3" or "enum literal 1 of
// type_decl#0". Used in traces and dumps.
[[nodiscard]] auto ToString(const Def& def) -> std::string;
[[nodiscard]] auto ToString(const ScopeRef& scope) -> std::string;

// Noun used in messages, e.g. "entity" or "enumeration literal".
[[nodiscard]] auto DescribeKind(const Def& def) -> const char*;

}  // namespace vscore::hir
