#include "vscore/score/scoreboard.hpp"

#include <format>
#include <memory>
#include <string>
#include <utility>
#include <variant>

#include <spdlog/spdlog.h>

#include "vscore/common/overloaded.hpp"
#include "vscore/score/standard_library.hpp"

namespace vscore::score {

Scoreboard::Scoreboard(SessionOptions options, DiagnosticSink* sink)
    : options_(options), sink_(sink) {
  if (options_.standard_library) {
    standard_units_ =
        std::make_unique<std::vector<ast::DesignUnit>>(MakeStandardLibrary());
    AddLibrary(ast::Ident{.name = "std", .span = {}}, *standard_units_);
  }
}

Scoreboard::~Scoreboard() = default;

auto Scoreboard::AddLibrary(
    const ast::Ident& name, std::span<const ast::DesignUnit> units)
    -> hir::LibraryId {
  hir::LibraryId id =
      ast_.Add<hir::NodeKind::kLibrary>({.name = name, .units = units});
  libraries_.Register(name.name, id);
  return id;
}

auto Scoreboard::LookupLibrary(std::string_view name) const
    -> std::optional<hir::LibraryId> {
  return libraries_.Lookup(name);
}

auto Scoreboard::Hir(hir::ExprId id) const -> const hir::Expr& {
  return exprs_[id];
}

auto Scoreboard::Hir(hir::SubtypeIndId id) const -> const hir::SubtypeInd& {
  return subtype_inds_[id];
}

auto Scoreboard::Definitions(const hir::ScopeRef& ref) -> QueryResult<Defs> {
  return std::visit([this](auto id) { return Definitions(id); }, ref);
}

auto Scoreboard::ScopeOf(const hir::ScopeRef& ref) -> QueryResult<Scope> {
  return std::visit([this](auto id) { return ScopeOf(id); }, ref);
}

auto Scoreboard::NameOf(const hir::Def& def) const -> std::string {
  return std::visit(
      Overloaded{
          [this](const hir::EnumLitRef& lit) {
            const ast::TypeDecl& decl = *ast_.Get(lit.type).node;
            const auto& literals =
                std::get<ast::EnumTypeDef>(*decl.def).literals;
            if (lit.index >= literals.size()) {
              common::ThrowInternalError(
                  "Scoreboard::NameOf",
                  std::format(
                      "type `{}` has no literal {}", decl.name.name,
                      lit.index));
            }
            return CanonicalName(literals[lit.index].name);
          },
          [this](auto id) { return CanonicalName(ast_.Get(id).name.name); },
      },
      def);
}

void Scoreboard::TraceQuery(
    QueryKind query, hir::AnyId id, const ast::Ident& name) const {
  if (!options_.trace_scoreboard) {
    return;
  }
  spdlog::debug(
      "[sb] computing {} of {}#{} `{}`", ToString(query), hir::ToString(id.kind),
      id.value, name.name);
}

void Scoreboard::TraceDeclare(std::string_view name, const hir::Def& def) const {
  if (!options_.trace_scoreboard) {
    return;
  }
  spdlog::info("[sb][scope] declaring `{}` as {}", name, hir::ToString(def));
}

void Scoreboard::ReportCycle(
    QueryKind query, hir::AnyId id, const ast::Ident& name) {
  sink_->Error(
      name.span, std::format(
                     "circular dependency while computing {} of {} `{}`",
                     ToString(query), hir::ToString(id.kind), name.name));
}

}  // namespace vscore::score
