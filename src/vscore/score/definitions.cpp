#include <algorithm>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_join.h"
#include "vscore/common/overloaded.hpp"
#include "vscore/score/scoreboard.hpp"
#include "vscore/score/syntax_utils.hpp"

namespace vscore::score {

namespace {

auto Before(const SourceSpan& a, const SourceSpan& b) -> bool {
  if (a.file_id.value != b.file_id.value) {
    return a.file_id.value < b.file_id.value;
  }
  return a.begin < b.begin;
}

}  // namespace

auto Scoreboard::ComputeDefinitions(hir::LibraryId id) -> QueryResult<Defs> {
  auto lib = Hir(id);
  if (!lib) {
    return Failed();
  }

  // Architectures and package bodies contribute no names.
  Defs candidates;
  auto collect = [&](auto unit) {
    const ast::Ident& name = ast_.Get(unit).name;
    candidates.Append(
        CanonicalName(name.name), {.value = hir::Def{unit}, .span = name.span});
  };
  std::ranges::for_each((*lib)->entities, collect);
  std::ranges::for_each((*lib)->configurations, collect);
  std::ranges::for_each((*lib)->packages, collect);
  std::ranges::for_each((*lib)->package_instances, collect);
  std::ranges::for_each((*lib)->contexts, collect);

  Defs defs;
  bool had_duplicates = false;
  for (const std::string& name : candidates.Names()) {
    Defs::Entries entries = *candidates.Lookup(name);
    std::ranges::stable_sort(entries, [](const auto& a, const auto& b) {
      return Before(a.span, b.span);
    });

    if (entries.size() > 1 && !options_.ignore_duplicate_defs) {
      Diagnostic diag = Diagnostic::Error(
          entries.front().span,
          std::format("`{}` declared multiple times", name));
      for (size_t i = 1; i < entries.size(); ++i) {
        diag = std::move(diag).WithNote(entries[i].span, "also declared here");
      }
      sink_->Report(std::move(diag));
      had_duplicates = true;
      continue;
    }

    TraceDeclare(name, entries.front().value);
    defs.Append(name, entries.front());
  }

  if (had_duplicates) {
    return Failed();
  }
  return &defs_arena_.Allocate(std::move(defs));
}

auto Scoreboard::ComputeDefinitions(hir::ContextItemsId id)
    -> QueryResult<Defs> {
  const ContextItemsEntry& entry = ast_.Get(id);
  Defs defs;

  // Implicit bindings may be repeated by an explicit library clause once.
  absl::flat_hash_set<std::string> implicit;
  if (entry.implicit) {
    defs.Append("work", {.value = entry.library, .span = {}});
    implicit.insert("work");
    if (auto std_lib = libraries_.Lookup("std");
        std_lib && *std_lib != entry.library) {
      defs.Append("std", {.value = *std_lib, .span = {}});
      implicit.insert("std");
    }
  }

  bool failed = false;
  for (const ast::ContextItem& item : *entry.items) {
    const auto* clause = std::get_if<ast::LibraryClause>(&item);
    if (clause == nullptr) {
      continue;
    }
    for (const ast::Ident& ident : clause->names) {
      std::string name = CanonicalName(ident.name);
      std::optional<hir::LibraryId> lib =
          name == "work" ? entry.library : libraries_.Lookup(name);
      if (!lib) {
        sink_->Report(
            Diagnostic::Error(
                ident.span, std::format("no library named `{}` found", name))
                .WithNote(
                    std::format(
                        "known libraries: {}",
                        absl::StrJoin(libraries_.Names(), ", "))));
        failed = true;
        continue;
      }

      if (const auto* existing = defs.Lookup(name)) {
        if (implicit.erase(name) != 0) {
          continue;
        }
        sink_->Report(
            Diagnostic::Error(
                ident.span, std::format("`{}` has already been declared", name))
                .WithNote(
                    existing->front().span, "previous declaration was here:"));
        failed = true;
        continue;
      }

      TraceDeclare(name, *lib);
      defs.Append(name, {.value = *lib, .span = ident.span});
    }
  }

  if (failed) {
    return Failed();
  }
  return &defs_arena_.Allocate(std::move(defs));
}

auto Scoreboard::ComputeDefinitions(hir::EntityId id) -> QueryResult<Defs> {
  const auto& name = ast_.Get(id).name;
  sink_->Unsupported(
      name.span,
      std::format("definitions of entity `{}` are not yet supported", name.name));
  return Failed();
}

auto Scoreboard::ComputeDefinitions(hir::ArchitectureId id)
    -> QueryResult<Defs> {
  const auto& name = ast_.Get(id).name;
  sink_->Unsupported(
      name.span, std::format(
                     "definitions of architecture `{}` are not yet supported",
                     name.name));
  return Failed();
}

auto Scoreboard::ComputeDefinitions(hir::PackageInstanceId id)
    -> QueryResult<Defs> {
  const auto& name = ast_.Get(id).name;
  sink_->Unsupported(
      name.span,
      std::format(
          "definitions of package instance `{}` are not yet supported",
          name.name));
  return Failed();
}

auto Scoreboard::ComputeDefinitions(hir::PackageId id) -> QueryResult<Defs> {
  auto pkg = Hir(id);
  if (!pkg) {
    return Failed();
  }

  // Names come from the syntax of each declaration, so that building this
  // table never lowers a declaration and never resolves a name.
  std::vector<std::pair<Spanned<std::string>, hir::Def>> declared;
  auto declare = [&](auto decl) {
    declared.emplace_back(SpannedName(ast_.Get(decl).name), hir::Def{decl});
  };
  for (const hir::DeclRef& decl : (*pkg)->decls) {
    std::visit(
        Overloaded{
            [&](hir::TypeDeclId type) {
              declare(type);
              const ast::TypeDecl& node = *ast_.Get(type).node;
              if (!node.def) {
                return;
              }
              if (const auto* def = std::get_if<ast::EnumTypeDef>(&*node.def)) {
                for (uint32_t i = 0; i < def->literals.size(); ++i) {
                  declared.emplace_back(
                      SpannedName(def->literals[i]),
                      hir::EnumLitRef{.type = type, .index = i});
                }
              }
            },
            [&](auto other) { declare(other); },
        },
        decl);
  }

  Defs defs;
  bool failed = false;
  for (const auto& [name, def] : declared) {
    const Defs::Entries* existing = defs.Lookup(name.value);
    bool overloads =
        existing == nullptr ||
        (hir::IsOverloadable(def) &&
         std::ranges::all_of(*existing, [](const Spanned<hir::Def>& prev) {
           return hir::IsOverloadable(prev.value);
         }));
    if (!overloads) {
      sink_->Report(
          Diagnostic::Error(
              name.span,
              std::format("`{}` has already been declared", name.value))
              .WithNote(existing->back().span, "previous declaration was here:"));
      failed = true;
      continue;
    }
    TraceDeclare(name.value, def);
    defs.Append(name.value, {.value = def, .span = name.span});
  }

  if (failed) {
    return Failed();
  }
  return &defs_arena_.Allocate(std::move(defs));
}

}  // namespace vscore::score
