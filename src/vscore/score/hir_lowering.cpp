#include <format>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

#include "vscore/common/overloaded.hpp"
#include "vscore/score/scoreboard.hpp"
#include "vscore/score/syntax_utils.hpp"

namespace vscore::score {

namespace {

auto LowerMode(ast::Mode mode) -> hir::Mode {
  switch (mode) {
    case ast::Mode::kIn:
      return hir::Mode::kIn;
    case ast::Mode::kOut:
      return hir::Mode::kOut;
    case ast::Mode::kInout:
      return hir::Mode::kInout;
    case ast::Mode::kBuffer:
      return hir::Mode::kBuffer;
    case ast::Mode::kLinkage:
      return hir::Mode::kLinkage;
  }
  return hir::Mode::kIn;
}

auto LowerSignalKind(ast::SignalKind kind) -> hir::SignalKind {
  switch (kind) {
    case ast::SignalKind::kNormal:
      return hir::SignalKind::kNormal;
    case ast::SignalKind::kRegister:
      return hir::SignalKind::kRegister;
    case ast::SignalKind::kBus:
      return hir::SignalKind::kBus;
  }
  return hir::SignalKind::kNormal;
}

auto LowerDirection(ast::Direction dir) -> hir::Direction {
  return dir == ast::Direction::kTo ? hir::Direction::kTo
                                    : hir::Direction::kDownto;
}

}  // namespace

auto Scoreboard::ComputeHir(hir::LibraryId id) -> QueryResult<hir::Library> {
  const LibraryEntry& entry = ast_.Get(id);
  hir::Library lib{.name = CanonicalName(entry.name.name)};

  for (const ast::DesignUnit& unit : entry.units) {
    auto make_context =
        [&](std::optional<hir::ArchitectureId> architecture = std::nullopt) {
          return ast_.Add<hir::NodeKind::kContextItems>(
              {.name = UnitName(unit),
               .library = id,
               .items = &unit.context,
               .architecture = architecture});
        };

    std::visit(
        Overloaded{
            [&](const ast::EntityDecl& node) {
              lib.entities.push_back(
                  ast_.Add<hir::NodeKind::kEntity>(
                      {.name = node.name,
                       .library = id,
                       .context = make_context(),
                       .node = &node}));
            },
            [&](const ast::ArchitectureBody& node) {
              // The clauses of an architecture chain to its entity.
              auto arch = ast_.NextId<hir::NodeKind::kArchitecture>();
              hir::ContextItemsId context = make_context(arch);
              lib.architectures.push_back(
                  ast_.Add<hir::NodeKind::kArchitecture>(
                      {.name = node.name,
                       .library = id,
                       .context = context,
                       .node = &node}));
            },
            [&](const ast::PackageDecl& node) {
              lib.packages.push_back(
                  ast_.Add<hir::NodeKind::kPackage>(
                      {.name = node.name,
                       .parent = make_context(),
                       .library = id,
                       .node = &node}));
            },
            [&](const ast::PackageInstDecl& node) {
              lib.package_instances.push_back(
                  ast_.Add<hir::NodeKind::kPackageInstance>(
                      {.name = node.name,
                       .parent = make_context(),
                       .library = id,
                       .node = &node}));
            },
            [&](const ast::PackageBody& node) {
              lib.package_bodies.push_back(
                  ast_.Add<hir::NodeKind::kPackageBody>(
                      {.name = node.name,
                       .library = id,
                       .context = make_context(),
                       .node = &node}));
            },
            [&](const ast::ConfigurationDecl& node) {
              lib.configurations.push_back(
                  ast_.Add<hir::NodeKind::kConfiguration>(
                      {.name = node.name,
                       .library = id,
                       .context = make_context(),
                       .node = &node}));
            },
            [&](const ast::ContextDecl& node) {
              lib.contexts.push_back(
                  ast_.Add<hir::NodeKind::kContext>(
                      {.name = node.name,
                       .library = id,
                       .context = make_context(),
                       .node = &node}));
            },
        },
        unit.body);
  }

  return Commit<hir::NodeKind::kLibrary>(std::move(lib));
}

auto Scoreboard::ComputeHir(hir::EntityId id) -> QueryResult<hir::Entity> {
  const auto& entry = ast_.Get(id);
  const ast::EntityDecl& node = *entry.node;
  return Commit<hir::NodeKind::kEntity>(
      hir::Entity{
          .context = entry.context,
          .library = entry.library,
          .name = SpannedName(node.name),
          // Entity-local names are not resolved yet, so interface
          // subtypes and defaults see the context clause only.
          .generics = RegisterInterfaces<hir::NodeKind::kGeneric>(
              node.generics, entry.context, entry.library),
          .ports = RegisterInterfaces<hir::NodeKind::kInterfaceSignal>(
              node.ports, entry.context, entry.library),
      });
}

auto Scoreboard::ComputeHir(hir::ArchitectureId id)
    -> QueryResult<hir::Architecture> {
  const auto& entry = ast_.Get(id);
  const ast::ArchitectureBody& node = *entry.node;

  auto entity =
      LookupUnit<hir::NodeKind::kEntity>(entry.library, node.entity, "entity");
  if (!entity) {
    return Failed();
  }

  std::vector<hir::ConcurrentStmtId> stmts;
  for (const ast::ConcurrentStmt& stmt : node.stmts) {
    ast::Ident label =
        stmt.label ? *stmt.label : ast::Ident{.name = "", .span = stmt.span};
    stmts.push_back(
        ast_.Add<hir::NodeKind::kConcurrentStmt>(
            {.name = std::move(label),
             .parent = id,
             .library = entry.library,
             .node = &stmt}));
  }

  return Commit<hir::NodeKind::kArchitecture>(
      hir::Architecture{
          .context = entry.context,
          .entity = *entity,
          .name = SpannedName(node.name),
          .decls = RegisterDecls(node.decls, id, entry.library),
          .stmts = std::move(stmts),
      });
}

auto Scoreboard::ComputeHir(hir::ConfigurationId id)
    -> QueryResult<hir::Configuration> {
  const auto& entry = ast_.Get(id);
  auto entity = LookupUnit<hir::NodeKind::kEntity>(
      entry.library, entry.node->entity, "entity");
  if (!entity) {
    return Failed();
  }
  return Commit<hir::NodeKind::kConfiguration>(
      hir::Configuration{
          .context = entry.context,
          .library = entry.library,
          .name = SpannedName(entry.node->name),
          .entity = *entity,
      });
}

auto Scoreboard::ComputeHir(hir::PackageId id) -> QueryResult<hir::Package> {
  const auto& entry = ast_.Get(id);
  const ast::PackageDecl& node = *entry.node;
  return Commit<hir::NodeKind::kPackage>(
      hir::Package{
          .parent = entry.parent,
          .name = SpannedName(node.name),
          .generics = RegisterInterfaces<hir::NodeKind::kGeneric>(
              node.generics, id, entry.library),
          .decls = RegisterDecls(node.decls, id, entry.library),
      });
}

auto Scoreboard::ComputeHir(hir::PackageInstanceId id)
    -> QueryResult<hir::PackageInstance> {
  const auto& entry = ast_.Get(id);
  const ast::CompoundName& package = entry.node->package;

  auto resolved = ResolveCompoundName(entry.parent, package);
  if (!resolved) {
    return Failed();
  }
  if (!resolved->tail.empty()) {
    sink_->Error(SuffixSpan(resolved->valid_span, package), "invalid name suffix");
    return Failed();
  }
  const hir::PackageId* target =
      resolved->defs.size() == 1
          ? std::get_if<hir::PackageId>(&resolved->defs.front().value)
          : nullptr;
  if (target == nullptr) {
    sink_->Error(
        package.span, std::format(
                          "`{}` is not a package",
                          RenderPrefix(package, package.parts.size())));
    return Failed();
  }

  return Commit<hir::NodeKind::kPackageInstance>(
      hir::PackageInstance{
          .parent = entry.parent,
          .name = SpannedName(entry.node->name),
          .package = *target,
      });
}

auto Scoreboard::ComputeHir(hir::PackageBodyId id)
    -> QueryResult<hir::PackageBody> {
  const auto& entry = ast_.Get(id);
  auto package = LookupUnit<hir::NodeKind::kPackage>(
      entry.library, entry.node->name, "package");
  if (!package) {
    return Failed();
  }
  return Commit<hir::NodeKind::kPackageBody>(
      hir::PackageBody{
          .context = entry.context,
          .library = entry.library,
          .name = SpannedName(entry.node->name),
          .package = *package,
      });
}

auto Scoreboard::ComputeHir(hir::ContextId id) -> QueryResult<hir::Context> {
  const auto& entry = ast_.Get(id);
  hir::ContextItemsId items = ast_.Add<hir::NodeKind::kContextItems>(
      {.name = entry.node->name,
       .library = entry.library,
       .items = &entry.node->items,
       .implicit = false});
  return Commit<hir::NodeKind::kContext>(
      hir::Context{
          .context = entry.context,
          .library = entry.library,
          .name = SpannedName(entry.node->name),
          .items = items,
      });
}

auto Scoreboard::ComputeHir(hir::GenericId id) -> QueryResult<hir::Generic> {
  const auto& entry = ast_.Get(id);
  const ast::InterfaceDecl& node = *entry.node;
  auto subtype = LowerSubtypeInd(node.subtype, entry.parent);
  auto default_value = LowerOptionalExpr(node.default_value, entry.parent);
  if (!subtype || !default_value) {
    return Failed();
  }
  return Commit<hir::NodeKind::kGeneric>(
      hir::Generic{
          .name = SpannedName(entry.name),
          .subtype = *subtype,
          .default_value = *default_value,
      });
}

auto Scoreboard::ComputeHir(hir::InterfaceSignalId id)
    -> QueryResult<hir::InterfaceSignal> {
  const auto& entry = ast_.Get(id);
  const ast::InterfaceDecl& node = *entry.node;
  if (node.kind != ast::InterfaceKind::kSignal) {
    sink_->Unsupported(
        entry.name.span,
        std::format("non-signal port `{}` is not yet supported", entry.name.name));
    return Failed();
  }
  auto subtype = LowerSubtypeInd(node.subtype, entry.parent);
  auto init = LowerOptionalExpr(node.default_value, entry.parent);
  if (!subtype || !init) {
    return Failed();
  }
  return Commit<hir::NodeKind::kInterfaceSignal>(
      hir::InterfaceSignal{
          .name = SpannedName(entry.name),
          .mode = LowerMode(node.mode),
          .subtype = *subtype,
          .bus = node.bus,
          .init = *init,
      });
}

auto Scoreboard::ComputeHir(hir::TypeDeclId id) -> QueryResult<hir::TypeDecl> {
  const auto& entry = ast_.Get(id);
  const ast::TypeDecl& node = *entry.node;

  std::optional<hir::TypeData> data;
  if (node.def) {
    bool ok = std::visit(
        Overloaded{
            [&](const ast::EnumTypeDef& def) {
              hir::EnumTypeData lits{.span = def.span, .literals = {}};
              for (const ast::Ident& lit : def.literals) {
                lits.literals.push_back(SpannedName(lit));
              }
              data = std::move(lits);
              return true;
            },
            [&](const ast::RangeTypeDef& def) {
              const ast::Expr& range = def.range;
              if (range.kind != ast::ExprKind::kRange ||
                  range.operands.size() != 2) {
                sink_->Error(range.span, "expected a range");
                return false;
              }
              auto left = LowerExpr(range.operands[0], entry.parent);
              auto right = LowerExpr(range.operands[1], entry.parent);
              if (!left || !right) {
                return false;
              }
              data = hir::RangeTypeData{
                  .span = def.span,
                  .dir = LowerDirection(range.direction),
                  .left = *left,
                  .right = *right,
              };
              return true;
            },
        },
        *node.def);
    if (!ok) {
      return Failed();
    }
  }

  return Commit<hir::NodeKind::kTypeDecl>(
      hir::TypeDecl{
          .parent = entry.parent,
          .name = SpannedName(node.name),
          .data = std::move(data),
      });
}

auto Scoreboard::ComputeHir(hir::SubtypeDeclId id)
    -> QueryResult<hir::SubtypeDecl> {
  const auto& entry = ast_.Get(id);
  auto subtype = LowerSubtypeInd(entry.node->subtype, entry.parent);
  if (!subtype) {
    return Failed();
  }
  return Commit<hir::NodeKind::kSubtypeDecl>(
      hir::SubtypeDecl{
          .parent = entry.parent,
          .name = SpannedName(entry.name),
          .subtype = *subtype,
      });
}

auto Scoreboard::ComputeHir(hir::ConstDeclId id)
    -> QueryResult<hir::ConstDecl> {
  const auto& entry = ast_.Get(id);
  auto subtype = LowerSubtypeInd(entry.node->subtype, entry.parent);
  auto init = LowerOptionalExpr(entry.node->init, entry.parent);
  if (!subtype || !init) {
    return Failed();
  }
  return Commit<hir::NodeKind::kConstDecl>(
      hir::ConstDecl{
          .parent = entry.parent,
          .name = SpannedName(entry.name),
          .subtype = *subtype,
          .init = *init,
      });
}

auto Scoreboard::ComputeHir(hir::SignalDeclId id)
    -> QueryResult<hir::SignalDecl> {
  const auto& entry = ast_.Get(id);
  auto subtype = LowerSubtypeInd(entry.node->subtype, entry.parent);
  auto init = LowerOptionalExpr(entry.node->init, entry.parent);
  if (!subtype || !init) {
    return Failed();
  }
  return Commit<hir::NodeKind::kSignalDecl>(
      hir::SignalDecl{
          .parent = entry.parent,
          .name = SpannedName(entry.name),
          .subtype = *subtype,
          .kind = LowerSignalKind(entry.node->signal_kind),
          .init = *init,
      });
}

auto Scoreboard::ComputeHir(hir::VariableDeclId id)
    -> QueryResult<hir::VariableDecl> {
  const auto& entry = ast_.Get(id);
  auto subtype = LowerSubtypeInd(entry.node->subtype, entry.parent);
  auto init = LowerOptionalExpr(entry.node->init, entry.parent);
  if (!subtype || !init) {
    return Failed();
  }
  return Commit<hir::NodeKind::kVariableDecl>(
      hir::VariableDecl{
          .parent = entry.parent,
          .shared = entry.node->kind == ast::ObjectKind::kSharedVariable,
          .name = SpannedName(entry.name),
          .subtype = *subtype,
          .init = *init,
      });
}

auto Scoreboard::ComputeHir(hir::FileDeclId id) -> QueryResult<hir::FileDecl> {
  const auto& entry = ast_.Get(id);
  auto subtype = LowerSubtypeInd(entry.node->subtype, entry.parent);
  if (!subtype) {
    return Failed();
  }

  std::optional<hir::FileOpen> open;
  if (const auto& info = entry.node->file_open) {
    auto logical_name = LowerExpr(info->logical_name, entry.parent);
    auto open_kind = LowerOptionalExpr(info->open_kind, entry.parent);
    if (!logical_name || !open_kind) {
      return Failed();
    }
    open = hir::FileOpen{.logical_name = *logical_name, .open_kind = *open_kind};
  }

  return Commit<hir::NodeKind::kFileDecl>(
      hir::FileDecl{
          .parent = entry.parent,
          .name = SpannedName(entry.name),
          .subtype = *subtype,
          .open = open,
      });
}

auto Scoreboard::RegisterDecls(
    const std::vector<ast::Declaration>& decls, const hir::ScopeRef& parent,
    hir::LibraryId library) -> std::vector<hir::DeclRef> {
  std::vector<hir::DeclRef> refs;

  auto add = [&]<hir::NodeKind K>(const ast::Ident& name, const auto* node) {
    refs.emplace_back(
        ast_.Add<K>(
            {.name = name, .parent = parent, .library = library, .node = node}));
  };

  for (const ast::Declaration& decl : decls) {
    std::visit(
        Overloaded{
            [&](const ast::TypeDecl& node) {
              add.template operator()<hir::NodeKind::kTypeDecl>(
                  node.name, &node);
            },
            [&](const ast::SubtypeDecl& node) {
              add.template operator()<hir::NodeKind::kSubtypeDecl>(
                  node.name, &node);
            },
            [&](const ast::ObjectDecl& node) {
              for (const ast::Ident& name : node.names) {
                switch (node.kind) {
                  case ast::ObjectKind::kConstant:
                    add.template operator()<hir::NodeKind::kConstDecl>(
                        name, &node);
                    break;
                  case ast::ObjectKind::kSignal:
                    add.template operator()<hir::NodeKind::kSignalDecl>(
                        name, &node);
                    break;
                  case ast::ObjectKind::kVariable:
                  case ast::ObjectKind::kSharedVariable:
                    add.template operator()<hir::NodeKind::kVariableDecl>(
                        name, &node);
                    break;
                  case ast::ObjectKind::kFile:
                    add.template operator()<hir::NodeKind::kFileDecl>(
                        name, &node);
                    break;
                }
              }
            },
            [&](const std::unique_ptr<ast::PackageDecl>& node) {
              add.template operator()<hir::NodeKind::kPackage>(
                  node->name, node.get());
            },
            [&](const ast::PackageInstDecl& node) {
              add.template operator()<hir::NodeKind::kPackageInstance>(
                  node.name, &node);
            },
        },
        decl);
  }

  return refs;
}

}  // namespace vscore::score
