#pragma once

#include <format>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

#include "absl/functional/function_ref.h"
#include "vscore/ast/ast.hpp"
#include "vscore/common/diagnostic/diagnostic_sink.hpp"
#include "vscore/common/name.hpp"
#include "vscore/common/source_span.hpp"
#include "vscore/hir/arena.hpp"
#include "vscore/hir/declaration.hpp"
#include "vscore/hir/design_unit.hpp"
#include "vscore/hir/expression.hpp"
#include "vscore/hir/fwd.hpp"
#include "vscore/hir/refs.hpp"
#include "vscore/hir/subtype.hpp"
#include "vscore/score/ast_table.hpp"
#include "vscore/score/library_registry.hpp"
#include "vscore/score/query.hpp"
#include "vscore/score/scope.hpp"
#include "vscore/score/session_options.hpp"

namespace vscore::score {

template <hir::NodeKind K>
struct HirTraits;

template <>
struct HirTraits<hir::NodeKind::kLibrary> {
  using Node = hir::Library;
};
template <>
struct HirTraits<hir::NodeKind::kEntity> {
  using Node = hir::Entity;
};
template <>
struct HirTraits<hir::NodeKind::kArchitecture> {
  using Node = hir::Architecture;
};
template <>
struct HirTraits<hir::NodeKind::kConfiguration> {
  using Node = hir::Configuration;
};
template <>
struct HirTraits<hir::NodeKind::kPackage> {
  using Node = hir::Package;
};
template <>
struct HirTraits<hir::NodeKind::kPackageInstance> {
  using Node = hir::PackageInstance;
};
template <>
struct HirTraits<hir::NodeKind::kPackageBody> {
  using Node = hir::PackageBody;
};
template <>
struct HirTraits<hir::NodeKind::kContext> {
  using Node = hir::Context;
};
template <>
struct HirTraits<hir::NodeKind::kGeneric> {
  using Node = hir::Generic;
};
template <>
struct HirTraits<hir::NodeKind::kInterfaceSignal> {
  using Node = hir::InterfaceSignal;
};
template <>
struct HirTraits<hir::NodeKind::kTypeDecl> {
  using Node = hir::TypeDecl;
};
template <>
struct HirTraits<hir::NodeKind::kSubtypeDecl> {
  using Node = hir::SubtypeDecl;
};
template <>
struct HirTraits<hir::NodeKind::kConstDecl> {
  using Node = hir::ConstDecl;
};
template <>
struct HirTraits<hir::NodeKind::kSignalDecl> {
  using Node = hir::SignalDecl;
};
template <>
struct HirTraits<hir::NodeKind::kVariableDecl> {
  using Node = hir::VariableDecl;
};
template <>
struct HirTraits<hir::NodeKind::kFileDecl> {
  using Node = hir::FileDecl;
};

template <hir::NodeKind K>
using HirNode = typename HirTraits<K>::Node;

// The leading part of a compound name that resolved through libraries and
// packages, and whatever follows it.
struct ResolvedName {
  // Canonical name of the last resolved part
  std::string name;
  std::vector<Spanned<hir::Def>> defs;
  // Covers the resolved prefix
  SourceSpan valid_span;
  std::span<const ast::NamePart> tail;
};

// Demand-driven store of everything the compiler core knows about a design.
// Every query is computed at most once per key; success and failure are
// both cached. Errors go to the diagnostic sink exactly once, where they
// are detected, and callers only see ErrorReported.
class Scoreboard {
 public:
  Scoreboard(SessionOptions options, DiagnosticSink* sink);
  ~Scoreboard();

  Scoreboard(const Scoreboard&) = delete;
  auto operator=(const Scoreboard&) -> Scoreboard& = delete;
  Scoreboard(Scoreboard&&) = delete;
  auto operator=(Scoreboard&&) -> Scoreboard& = delete;

  // Registers a library under the canonical form of `name`. The units must
  // outlive the scoreboard. Adding a name twice throws InternalError.
  auto AddLibrary(const ast::Ident& name, std::span<const ast::DesignUnit> units)
      -> hir::LibraryId;

  [[nodiscard]] auto LookupLibrary(std::string_view name) const
      -> std::optional<hir::LibraryId>;

  template <hir::NodeKind K>
  auto Hir(hir::NodeId<K> id) -> QueryResult<HirNode<K>> {
    return Memoize(
        std::get<HirTable<K>>(hir_tables_).cache, QueryKind::kHir, id,
        [&] { return ComputeHir(id); });
  }

  // Expressions and subtype indications are built together with the
  // declaration that owns them.
  [[nodiscard]] auto Hir(hir::ExprId id) const -> const hir::Expr&;
  [[nodiscard]] auto Hir(hir::SubtypeIndId id) const -> const hir::SubtypeInd&;

  // Names declared directly in a construct, with duplicates checked.
  template <hir::NodeKind K>
  auto Definitions(hir::NodeId<K> id) -> QueryResult<Defs> {
    return Memoize(
        std::get<DefsCache<K>>(defs_caches_), QueryKind::kDefinitions, id,
        [&] { return ComputeDefinitions(id); });
  }
  auto Definitions(const hir::ScopeRef& ref) -> QueryResult<Defs>;

  // Everything visible inside a construct.
  template <hir::NodeKind K>
  auto ScopeOf(hir::NodeId<K> id) -> QueryResult<Scope> {
    return Memoize(
        std::get<ScopeCache<K>>(scope_caches_), QueryKind::kScope, id,
        [&] { return ComputeScope(id); });
  }
  auto ScopeOf(const hir::ScopeRef& ref) -> QueryResult<Scope>;

  // All definitions `name` may denote at `scope`, from the innermost level
  // of the scope chain that has any. Reports an error when there are none.
  auto ResolveName(const hir::ScopeRef& scope, const Spanned<std::string>& name)
      -> Outcome<std::vector<Spanned<hir::Def>>>;

  // Resolves the leading simple name at `scope`, then selects into
  // libraries and packages as long as the name allows it.
  auto ResolveCompoundName(
      const hir::ScopeRef& scope, const ast::CompoundName& name)
      -> Outcome<ResolvedName>;

  // Canonical name a definition was declared under.
  [[nodiscard]] auto NameOf(const hir::Def& def) const -> std::string;

  template <hir::NodeKind K>
  [[nodiscard]] auto Ast(hir::NodeId<K> id) const -> const AstEntry<K>& {
    return ast_.Get(id);
  }

  [[nodiscard]] auto Options() const -> const SessionOptions& {
    return options_;
  }

  [[nodiscard]] auto Stats() const -> const QueryStats& {
    return stats_;
  }

  [[nodiscard]] auto Libraries() const -> const LibraryRegistry& {
    return libraries_;
  }

  auto Sink() -> DiagnosticSink& {
    return *sink_;
  }

 private:
  using LeadingLookup = absl::FunctionRef<Outcome<std::vector<Spanned<hir::Def>>>(
      const Spanned<std::string>&)>;

  template <hir::NodeKind K>
  struct HirTable {
    hir::Arena<HirNode<K>> arena;
    QueryCache<hir::NodeId<K>, HirNode<K>> cache;
  };

  template <hir::NodeKind K>
  using DefsCache = QueryCache<hir::NodeId<K>, Defs>;

  template <hir::NodeKind K>
  using ScopeCache = QueryCache<hir::NodeId<K>, Scope>;

  template <hir::NodeKind K, typename Value, typename Compute>
  auto Memoize(
      QueryCache<hir::NodeId<K>, Value>& cache, QueryKind query,
      hir::NodeId<K> id, Compute&& compute) -> QueryResult<Value>;

  void TraceQuery(QueryKind query, hir::AnyId id, const ast::Ident& name) const;
  void ReportCycle(QueryKind query, hir::AnyId id, const ast::Ident& name);
  void TraceDeclare(std::string_view name, const hir::Def& def) const;

  template <hir::NodeKind K>
  auto Commit(HirNode<K> node) -> QueryResult<HirNode<K>> {
    return &std::get<HirTable<K>>(hir_tables_).arena.Allocate(std::move(node));
  }

  // HIR construction, hir_lowering.cpp
  auto ComputeHir(hir::LibraryId id) -> QueryResult<hir::Library>;
  auto ComputeHir(hir::EntityId id) -> QueryResult<hir::Entity>;
  auto ComputeHir(hir::ArchitectureId id) -> QueryResult<hir::Architecture>;
  auto ComputeHir(hir::ConfigurationId id) -> QueryResult<hir::Configuration>;
  auto ComputeHir(hir::PackageId id) -> QueryResult<hir::Package>;
  auto ComputeHir(hir::PackageInstanceId id)
      -> QueryResult<hir::PackageInstance>;
  auto ComputeHir(hir::PackageBodyId id) -> QueryResult<hir::PackageBody>;
  auto ComputeHir(hir::ContextId id) -> QueryResult<hir::Context>;
  auto ComputeHir(hir::GenericId id) -> QueryResult<hir::Generic>;
  auto ComputeHir(hir::InterfaceSignalId id)
      -> QueryResult<hir::InterfaceSignal>;
  auto ComputeHir(hir::TypeDeclId id) -> QueryResult<hir::TypeDecl>;
  auto ComputeHir(hir::SubtypeDeclId id) -> QueryResult<hir::SubtypeDecl>;
  auto ComputeHir(hir::ConstDeclId id) -> QueryResult<hir::ConstDecl>;
  auto ComputeHir(hir::SignalDeclId id) -> QueryResult<hir::SignalDecl>;
  auto ComputeHir(hir::VariableDeclId id) -> QueryResult<hir::VariableDecl>;
  auto ComputeHir(hir::FileDeclId id) -> QueryResult<hir::FileDecl>;

  auto RegisterDecls(
      const std::vector<ast::Declaration>& decls, const hir::ScopeRef& parent,
      hir::LibraryId library) -> std::vector<hir::DeclRef>;

  template <hir::NodeKind K>
  auto RegisterInterfaces(
      const std::vector<ast::InterfaceDecl>& decls,
      const hir::ScopeRef& parent, hir::LibraryId library)
      -> std::vector<hir::NodeId<K>> {
    std::vector<hir::NodeId<K>> ids;
    for (const ast::InterfaceDecl& decl : decls) {
      for (const ast::Ident& name : decl.names) {
        ids.push_back(
            ast_.Add<K>(
                {.name = name,
                 .parent = parent,
                 .library = library,
                 .node = &decl}));
      }
    }
    return ids;
  }

  // Finds the primary unit `name` of kind K in `library`.
  template <hir::NodeKind K>
  auto LookupUnit(
      hir::LibraryId library, const ast::Ident& name, std::string_view noun)
      -> Outcome<hir::NodeId<K>>;

  // Expression lowering, expression_lowering.cpp
  auto LowerExpr(const ast::Expr& expr, const hir::ScopeRef& scope)
      -> Outcome<hir::ExprId>;
  auto LowerOptionalExpr(
      const std::optional<ast::Expr>& expr, const hir::ScopeRef& scope)
      -> Outcome<std::optional<hir::ExprId>>;
  auto LowerName(const ast::CompoundName& name, const hir::ScopeRef& scope)
      -> Outcome<hir::ExprId>;
  auto LowerSubtypeInd(
      const ast::SubtypeIndication& ind, const hir::ScopeRef& scope)
      -> Outcome<hir::SubtypeIndId>;
  auto LowerConstraint(const ast::Constraint& c, const hir::ScopeRef& scope)
      -> Outcome<hir::Constraint>;
  auto LowerElementConstraint(
      const ast::Constraint& c, const hir::ScopeRef& scope)
      -> Outcome<hir::ElementConstraint>;
  auto LowerArrayConstraint(
      const ast::Constraint& c, const hir::ScopeRef& scope)
      -> Outcome<hir::ArrayConstraint>;
  auto LowerRecordConstraint(
      const ast::Constraint& c, const hir::ScopeRef& scope)
      -> Outcome<hir::RecordConstraint>;

  // Definitions tables, definitions.cpp
  auto ComputeDefinitions(hir::LibraryId id) -> QueryResult<Defs>;
  auto ComputeDefinitions(hir::ContextItemsId id) -> QueryResult<Defs>;
  auto ComputeDefinitions(hir::EntityId id) -> QueryResult<Defs>;
  auto ComputeDefinitions(hir::ArchitectureId id) -> QueryResult<Defs>;
  auto ComputeDefinitions(hir::PackageId id) -> QueryResult<Defs>;
  auto ComputeDefinitions(hir::PackageInstanceId id) -> QueryResult<Defs>;

  // Scopes and name resolution, scope.cpp
  auto ComputeScope(hir::LibraryId id) -> QueryResult<Scope>;
  auto ComputeScope(hir::ContextItemsId id) -> QueryResult<Scope>;
  auto ComputeScope(hir::EntityId id) -> QueryResult<Scope>;
  auto ComputeScope(hir::ArchitectureId id) -> QueryResult<Scope>;
  auto ComputeScope(hir::PackageId id) -> QueryResult<Scope>;
  auto ComputeScope(hir::PackageInstanceId id) -> QueryResult<Scope>;

  auto ImportStandard(Scope& scope, hir::LibraryId library) -> bool;
  auto ApplyUseClause(Scope& scope, const ast::CompoundName& name) -> bool;
  auto ApplyContextReference(Scope& scope, const ast::CompoundName& name)
      -> bool;

  // Definitions of `name` in one scope level, without its parents.
  auto LookupInScope(const Scope& scope, std::string_view name)
      -> Outcome<std::vector<Spanned<hir::Def>>>;
  // Definitions of `name` at the innermost level of the chain starting at
  // `start` that has any. Empty if there are none.
  auto LookupChain(const hir::ScopeRef& start, std::string_view name)
      -> Outcome<std::vector<Spanned<hir::Def>>>;
  auto ResolveCompoundNameWith(
      const ast::CompoundName& name, LeadingLookup lookup)
      -> Outcome<ResolvedName>;

  SessionOptions options_;
  DiagnosticSink* sink_;
  LibraryRegistry libraries_;
  AstTable ast_;
  QueryStats stats_;

  // Syntax of library `std`, owned here since no caller provides it.
  std::unique_ptr<std::vector<ast::DesignUnit>> standard_units_;

  std::tuple<
      HirTable<hir::NodeKind::kLibrary>, HirTable<hir::NodeKind::kEntity>,
      HirTable<hir::NodeKind::kArchitecture>,
      HirTable<hir::NodeKind::kConfiguration>,
      HirTable<hir::NodeKind::kPackage>,
      HirTable<hir::NodeKind::kPackageInstance>,
      HirTable<hir::NodeKind::kPackageBody>, HirTable<hir::NodeKind::kContext>,
      HirTable<hir::NodeKind::kGeneric>,
      HirTable<hir::NodeKind::kInterfaceSignal>,
      HirTable<hir::NodeKind::kTypeDecl>,
      HirTable<hir::NodeKind::kSubtypeDecl>,
      HirTable<hir::NodeKind::kConstDecl>,
      HirTable<hir::NodeKind::kSignalDecl>,
      HirTable<hir::NodeKind::kVariableDecl>,
      HirTable<hir::NodeKind::kFileDecl>>
      hir_tables_;

  std::tuple<
      DefsCache<hir::NodeKind::kLibrary>,
      DefsCache<hir::NodeKind::kContextItems>,
      DefsCache<hir::NodeKind::kEntity>,
      DefsCache<hir::NodeKind::kArchitecture>,
      DefsCache<hir::NodeKind::kPackage>,
      DefsCache<hir::NodeKind::kPackageInstance>>
      defs_caches_;

  std::tuple<
      ScopeCache<hir::NodeKind::kLibrary>,
      ScopeCache<hir::NodeKind::kContextItems>,
      ScopeCache<hir::NodeKind::kEntity>,
      ScopeCache<hir::NodeKind::kArchitecture>,
      ScopeCache<hir::NodeKind::kPackage>,
      ScopeCache<hir::NodeKind::kPackageInstance>>
      scope_caches_;

  hir::Arena<Defs> defs_arena_;
  hir::Arena<Scope> scope_arena_;
  hir::IndexedArena<hir::ExprId, hir::Expr> exprs_;
  hir::IndexedArena<hir::SubtypeIndId, hir::SubtypeInd> subtype_inds_;
};

template <hir::NodeKind K, typename Value, typename Compute>
auto Scoreboard::Memoize(
    QueryCache<hir::NodeId<K>, Value>& cache, QueryKind query,
    hir::NodeId<K> id, Compute&& compute) -> QueryResult<Value> {
  // Also rejects identifiers this scoreboard never allocated.
  const ast::Ident& name = ast_.Get(id).name;

  if (const auto* slot = cache.Find(id)) {
    if (slot->in_progress) {
      ReportCycle(query, hir::AnyId::From(id), name);
      return Failed();
    }
    return slot->result;
  }

  cache.Begin(id);
  stats_.Record(query, K);
  TraceQuery(query, hir::AnyId::From(id), name);
  QueryResult<Value> result = std::forward<Compute>(compute)();
  cache.Finish(id, result);
  return result;
}

template <hir::NodeKind K>
auto Scoreboard::LookupUnit(
    hir::LibraryId library, const ast::Ident& name, std::string_view noun)
    -> Outcome<hir::NodeId<K>> {
  auto defs = Definitions(library);
  if (!defs) {
    return Failed();
  }
  if (const auto* entries = (*defs)->Lookup(CanonicalName(name.name))) {
    for (const Spanned<hir::Def>& entry : *entries) {
      if (const auto* unit = std::get_if<hir::NodeId<K>>(&entry.value)) {
        return *unit;
      }
    }
  }
  sink_->Error(
      name.span, std::format(
                     "no {} named `{}` in library `{}`", noun, name.name,
                     ast_.Get(library).name.name));
  return Failed();
}

}  // namespace vscore::score
