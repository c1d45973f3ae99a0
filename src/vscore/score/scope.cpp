#include <algorithm>
#include <format>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "vscore/common/overloaded.hpp"
#include "vscore/score/scoreboard.hpp"
#include "vscore/score/syntax_utils.hpp"

namespace vscore::score {

namespace {

void AppendUnique(
    std::vector<Spanned<hir::Def>>& out, const Defs::Entries& entries) {
  for (const Spanned<hir::Def>& entry : entries) {
    bool seen = std::ranges::any_of(out, [&](const Spanned<hir::Def>& prev) {
      return prev.value == entry.value;
    });
    if (!seen) {
      out.push_back(entry);
    }
  }
}

void AddVisible(Scope& scope, const hir::ScopeRef& ref) {
  if (std::ranges::find(scope.defs, ref) == scope.defs.end()) {
    scope.defs.push_back(ref);
  }
}

// Libraries and packages can be selected into with `.name`.
auto AsContainer(const hir::Def& def) -> std::optional<hir::ScopeRef> {
  return std::visit(
      Overloaded{
          [](hir::LibraryId id) -> std::optional<hir::ScopeRef> { return id; },
          [](hir::PackageId id) -> std::optional<hir::ScopeRef> { return id; },
          [](hir::PackageInstanceId id) -> std::optional<hir::ScopeRef> {
            return id;
          },
          [](const auto&) -> std::optional<hir::ScopeRef> {
            return std::nullopt;
          },
      },
      def);
}

}  // namespace

auto Scoreboard::ComputeScope(hir::LibraryId id) -> QueryResult<Scope> {
  return &scope_arena_.Allocate(
      Scope{.parent = std::nullopt, .defs = {id}, .explicit_defs = {}});
}

auto Scoreboard::ComputeScope(hir::EntityId id) -> QueryResult<Scope> {
  auto entity = Hir(id);
  if (!entity) {
    return Failed();
  }
  if (!ScopeOf((*entity)->context)) {
    return Failed();
  }
  return &scope_arena_.Allocate(
      Scope{
          .parent = hir::ScopeRef{(*entity)->context},
          .defs = {id},
          .explicit_defs = {}});
}

auto Scoreboard::ComputeScope(hir::ArchitectureId id) -> QueryResult<Scope> {
  auto arch = Hir(id);
  if (!arch) {
    return Failed();
  }
  if (!ScopeOf((*arch)->context)) {
    return Failed();
  }
  return &scope_arena_.Allocate(
      Scope{
          .parent = hir::ScopeRef{(*arch)->context},
          .defs = {id},
          .explicit_defs = {}});
}

auto Scoreboard::ComputeScope(hir::PackageId id) -> QueryResult<Scope> {
  auto pkg = Hir(id);
  if (!pkg) {
    return Failed();
  }
  if (!ScopeOf((*pkg)->parent)) {
    return Failed();
  }
  return &scope_arena_.Allocate(
      Scope{.parent = (*pkg)->parent, .defs = {id}, .explicit_defs = {}});
}

auto Scoreboard::ComputeScope(hir::PackageInstanceId id) -> QueryResult<Scope> {
  const auto& name = ast_.Get(id).name;
  sink_->Unsupported(
      name.span,
      std::format(
          "scope of package instance `{}` is not yet supported", name.name));
  return Failed();
}

auto Scoreboard::ComputeScope(hir::ContextItemsId id) -> QueryResult<Scope> {
  const ContextItemsEntry& entry = ast_.Get(id);

  std::optional<hir::ScopeRef> parent;
  if (entry.architecture) {
    // The architecture already reported a missing entity.
    auto arch = Hir(*entry.architecture);
    if (!arch) {
      return Failed();
    }
    parent = (*arch)->entity;
  }

  // Library clauses are checked before any use clause relies on them.
  if (!Definitions(id)) {
    return Failed();
  }

  Scope scope{.parent = parent, .defs = {id}, .explicit_defs = {}};
  if (entry.implicit && !ImportStandard(scope, entry.library)) {
    return Failed();
  }

  // Every clause is processed so that all of its errors are reported.
  bool failed = false;
  for (const ast::ContextItem& item : *entry.items) {
    std::visit(
        Overloaded{
            [](const ast::LibraryClause&) {},
            [&](const ast::UseClause& clause) {
              for (const ast::CompoundName& name : clause.names) {
                failed |= !ApplyUseClause(scope, name);
              }
            },
            [&](const ast::ContextReference& ref) {
              for (const ast::CompoundName& name : ref.names) {
                failed |= !ApplyContextReference(scope, name);
              }
            },
        },
        item);
  }

  if (failed) {
    return Failed();
  }
  return &scope_arena_.Allocate(std::move(scope));
}

auto Scoreboard::ImportStandard(Scope& scope, hir::LibraryId library) -> bool {
  auto std_lib = libraries_.Lookup("std");
  if (!std_lib || *std_lib == library) {
    return true;
  }
  auto defs = Definitions(*std_lib);
  if (!defs) {
    return false;
  }
  if (const auto* entries = (*defs)->Lookup("standard")) {
    for (const Spanned<hir::Def>& entry : *entries) {
      if (const auto* pkg = std::get_if<hir::PackageId>(&entry.value)) {
        AddVisible(scope, *pkg);
      }
    }
  }
  return true;
}

auto Scoreboard::ApplyUseClause(Scope& scope, const ast::CompoundName& name)
    -> bool {
  auto resolved = ResolveCompoundNameWith(
      name, [&](const Spanned<std::string>& first)
                -> Outcome<std::vector<Spanned<hir::Def>>> {
        auto found = LookupInScope(scope, first.value);
        if (!found) {
          return Failed();
        }
        if (found->empty() && scope.parent) {
          return LookupChain(*scope.parent, first.value);
        }
        return found;
      });
  if (!resolved) {
    return false;
  }

  std::span<const ast::NamePart> tail = resolved->tail;
  SourceSpan valid = resolved->valid_span;
  std::optional<hir::PackageId> wildcard;

  if (!tail.empty() && tail.front().kind == ast::NamePartKind::kSelectAll) {
    const ast::NamePart& all = tail.front();
    const auto* pkg = resolved->defs.size() == 1
                          ? std::get_if<hir::PackageId>(&resolved->defs[0].value)
                          : nullptr;
    if (pkg == nullptr) {
      sink_->Error(
          all.span,
          std::format(
              "`all` not possible on `{}`",
              RenderPrefix(name, name.parts.size() - tail.size())));
      return false;
    }
    wildcard = *pkg;
    valid = Union(valid, all.span);
    tail = tail.subspan(1);
  }

  if (!tail.empty()) {
    sink_->Error(SuffixSpan(valid, name), "invalid name suffix");
    return false;
  }

  if (wildcard) {
    AddVisible(scope, *wildcard);
    return true;
  }
  for (const Spanned<hir::Def>& def : resolved->defs) {
    const Defs::Entries* existing = scope.explicit_defs.Lookup(resolved->name);
    bool seen = existing != nullptr &&
                std::ranges::any_of(*existing, [&](const auto& prev) {
                  return prev.value == def.value;
                });
    if (!seen) {
      scope.explicit_defs.Append(resolved->name, def);
    }
  }
  return true;
}

auto Scoreboard::ApplyContextReference(
    Scope& scope, const ast::CompoundName& name) -> bool {
  auto resolved = ResolveCompoundNameWith(
      name, [&](const Spanned<std::string>& first)
                -> Outcome<std::vector<Spanned<hir::Def>>> {
        return LookupInScope(scope, first.value);
      });
  if (!resolved) {
    return false;
  }
  if (!resolved->tail.empty()) {
    sink_->Error(SuffixSpan(resolved->valid_span, name), "invalid name suffix");
    return false;
  }

  const auto* context =
      resolved->defs.size() == 1
          ? std::get_if<hir::ContextId>(&resolved->defs[0].value)
          : nullptr;
  if (context == nullptr) {
    sink_->Error(
        name.span, std::format(
                       "`{}` is not a context",
                       RenderPrefix(name, name.parts.size())));
    return false;
  }

  auto decl = Hir(*context);
  if (!decl) {
    return false;
  }
  auto inner = ScopeOf((*decl)->items);
  if (!inner) {
    return false;
  }

  for (const hir::ScopeRef& ref : (*inner)->defs) {
    AddVisible(scope, ref);
  }
  for (const std::string& imported : (*inner)->explicit_defs.Names()) {
    for (const Spanned<hir::Def>& def : *(*inner)->explicit_defs.Lookup(imported)) {
      const Defs::Entries* existing = scope.explicit_defs.Lookup(imported);
      bool seen = existing != nullptr &&
                  std::ranges::any_of(*existing, [&](const auto& prev) {
                    return prev.value == def.value;
                  });
      if (!seen) {
        scope.explicit_defs.Append(imported, def);
      }
    }
  }
  return true;
}

auto Scoreboard::LookupInScope(const Scope& scope, std::string_view name)
    -> Outcome<std::vector<Spanned<hir::Def>>> {
  std::vector<Spanned<hir::Def>> found;
  if (const auto* entries = scope.explicit_defs.Lookup(name)) {
    AppendUnique(found, *entries);
  }
  // Index-based: `scope` may be the one under construction.
  for (size_t i = 0; i < scope.defs.size(); ++i) {
    auto defs = Definitions(scope.defs[i]);
    if (!defs) {
      return Failed();
    }
    if (const auto* entries = (*defs)->Lookup(name)) {
      AppendUnique(found, *entries);
    }
  }
  return found;
}

auto Scoreboard::LookupChain(const hir::ScopeRef& start, std::string_view name)
    -> Outcome<std::vector<Spanned<hir::Def>>> {
  std::optional<hir::ScopeRef> current = start;
  while (current) {
    auto scope = ScopeOf(*current);
    if (!scope) {
      return Failed();
    }
    auto found = LookupInScope(**scope, name);
    if (!found) {
      return Failed();
    }
    if (!found->empty()) {
      return found;
    }
    current = (*scope)->parent;
  }
  return std::vector<Spanned<hir::Def>>{};
}

auto Scoreboard::ResolveName(
    const hir::ScopeRef& scope, const Spanned<std::string>& name)
    -> Outcome<std::vector<Spanned<hir::Def>>> {
  auto found = LookupChain(scope, CanonicalName(name.value));
  if (!found) {
    return Failed();
  }
  if (found->empty()) {
    sink_->Error(name.span, std::format("`{}` is not declared", name.value));
    return Failed();
  }
  return found;
}

auto Scoreboard::ResolveCompoundName(
    const hir::ScopeRef& scope, const ast::CompoundName& name)
    -> Outcome<ResolvedName> {
  return ResolveCompoundNameWith(
      name, [&](const Spanned<std::string>& first) {
        return LookupChain(scope, first.value);
      });
}

auto Scoreboard::ResolveCompoundNameWith(
    const ast::CompoundName& name, LeadingLookup lookup)
    -> Outcome<ResolvedName> {
  Spanned<std::string> first = SpannedName(name.primary);
  auto defs = lookup(first);
  if (!defs) {
    return Failed();
  }
  if (defs->empty()) {
    sink_->Error(
        first.span, std::format("`{}` is not declared", name.primary.name));
    return Failed();
  }

  ResolvedName result{
      .name = first.value,
      .defs = std::move(*defs),
      .valid_span = name.primary.span,
      .tail = name.parts,
  };

  while (!result.tail.empty()) {
    const ast::NamePart& part = result.tail.front();
    if (part.kind != ast::NamePartKind::kSelect || result.defs.size() != 1) {
      break;
    }
    std::optional<hir::ScopeRef> container =
        AsContainer(result.defs.front().value);
    if (!container) {
      break;
    }

    auto members = Definitions(*container);
    if (!members) {
      return Failed();
    }
    std::string member = CanonicalName(part.ident.name);
    const Defs::Entries* entries = (*members)->Lookup(member);
    if (entries == nullptr) {
      size_t consumed = name.parts.size() - result.tail.size();
      sink_->Error(
          part.ident.span,
          std::format(
              "no `{}` in {} `{}`", part.ident.name,
              hir::DescribeKind(result.defs.front().value),
              RenderPrefix(name, consumed)));
      return Failed();
    }

    result.name = std::move(member);
    result.defs = *entries;
    result.valid_span = Union(result.valid_span, part.span);
    result.tail = result.tail.subspan(1);
  }

  return result;
}

}  // namespace vscore::score
