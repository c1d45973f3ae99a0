#pragma once

#include <string>
#include <vector>

#include "vscore/common/source_span.hpp"
#include "vscore/hir/fwd.hpp"
#include "vscore/hir/refs.hpp"

namespace vscore::hir {

// The design units of one library, in source order per kind.
struct Library {
  std::string name;
  std::vector<EntityId> entities;
  std::vector<ConfigurationId> configurations;
  std::vector<PackageId> packages;
  std::vector<PackageInstanceId> package_instances;
  std::vector<ContextId> contexts;
  std::vector<ArchitectureId> architectures;
  std::vector<PackageBodyId> package_bodies;
};

struct Entity {
  ContextItemsId context;
  LibraryId library;
  Spanned<std::string> name;
  std::vector<GenericId> generics;
  std::vector<InterfaceSignalId> ports;
};

struct Architecture {
  ContextItemsId context;
  EntityId entity;
  Spanned<std::string> name;
  std::vector<DeclRef> decls;
  std::vector<ConcurrentStmtId> stmts;
};

struct Configuration {
  ContextItemsId context;
  LibraryId library;
  Spanned<std::string> name;
  EntityId entity;
};

struct Package {
  ScopeRef parent;
  Spanned<std::string> name;
  std::vector<GenericId> generics;
  std::vector<DeclRef> decls;
};

struct PackageInstance {
  ScopeRef parent;
  Spanned<std::string> name;
  // The uninstantiated package
  PackageId package;
};

struct PackageBody {
  ContextItemsId context;
  LibraryId library;
  Spanned<std::string> name;
  PackageId package;
};

// A VHDL-2008 context declaration. `items` are the clauses between
// `context ... is` and `end`; `context` are the ones preceding it.
struct Context {
  ContextItemsId context;
  LibraryId library;
  Spanned<std::string> name;
  ContextItemsId items;
};

}  // namespace vscore::hir
