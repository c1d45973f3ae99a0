#include "vscore/hir/dumper.hpp"

#include <format>
#include <optional>
#include <string>
#include <variant>

#include "vscore/common/internal_error.hpp"
#include "vscore/common/overloaded.hpp"

namespace vscore::hir {

Dumper::Dumper(score::Scoreboard* scoreboard, std::ostream* out)
    : scoreboard_(scoreboard), out_(out) {
}

void Dumper::PrintIndent() {
  for (int i = 0; i < indent_; ++i) {
    *out_ << "  ";
  }
}

void Dumper::Indent() {
  ++indent_;
}

void Dumper::Dedent() {
  if (indent_ == 0) {
    common::ThrowInternalError("Dumper::Dedent", "unbalanced indentation");
  }
  --indent_;
}

auto Dumper::DefName(const Def& def) const -> std::string {
  return scoreboard_->NameOf(def);
}

void Dumper::DumpUnit(const char* keyword, const std::string& name) {
  PrintIndent();
  *out_ << std::format("{} {} <error>\n", keyword, name);
}

void Dumper::Dump(LibraryId id) {
  auto lib = scoreboard_->Hir(id);
  if (!lib) {
    DumpUnit("Library", scoreboard_->Ast(id).name.name);
    return;
  }
  PrintIndent();
  *out_ << std::format("Library {} {{\n", (*lib)->name);
  Indent();
  for (EntityId entity : (*lib)->entities) {
    Dump(entity);
  }
  for (ConfigurationId cfg : (*lib)->configurations) {
    PrintIndent();
    auto hir = scoreboard_->Hir(cfg);
    *out_ << std::format(
        "Configuration {} of {}\n", scoreboard_->Ast(cfg).name.name,
        hir ? scoreboard_->NameOf((*hir)->entity) : "<error>");
  }
  for (PackageId pkg : (*lib)->packages) {
    Dump(pkg);
  }
  for (PackageInstanceId inst : (*lib)->package_instances) {
    PrintIndent();
    auto hir = scoreboard_->Hir(inst);
    *out_ << std::format(
        "PackageInstance {} is new {}\n", scoreboard_->Ast(inst).name.name,
        hir ? scoreboard_->NameOf((*hir)->package) : "<error>");
  }
  for (ContextId ctx : (*lib)->contexts) {
    PrintIndent();
    *out_ << std::format("Context {}\n", scoreboard_->Ast(ctx).name.name);
  }
  for (ArchitectureId arch : (*lib)->architectures) {
    Dump(arch);
  }
  for (PackageBodyId body : (*lib)->package_bodies) {
    PrintIndent();
    *out_ << std::format("PackageBody {}\n", scoreboard_->Ast(body).name.name);
  }
  Dedent();
  PrintIndent();
  *out_ << "}\n";
}

void Dumper::Dump(EntityId id) {
  auto entity = scoreboard_->Hir(id);
  if (!entity) {
    DumpUnit("Entity", scoreboard_->Ast(id).name.name);
    return;
  }
  PrintIndent();
  *out_ << std::format("Entity {} {{\n", (*entity)->name.value);
  Indent();
  for (GenericId generic : (*entity)->generics) {
    PrintIndent();
    auto hir = scoreboard_->Hir(generic);
    if (!hir) {
      *out_ << std::format(
          "generic {} <error>\n", scoreboard_->Ast(generic).name.name);
      continue;
    }
    *out_ << std::format(
        "generic {} : {}{}\n", (*hir)->name.value,
        SubtypeString((*hir)->subtype), InitString((*hir)->default_value));
  }
  for (InterfaceSignalId port : (*entity)->ports) {
    PrintIndent();
    auto hir = scoreboard_->Hir(port);
    if (!hir) {
      *out_ << std::format(
          "port {} <error>\n", scoreboard_->Ast(port).name.name);
      continue;
    }
    *out_ << std::format(
        "port {} : {} {}{}{}\n", (*hir)->name.value, ToString((*hir)->mode),
        SubtypeString((*hir)->subtype), (*hir)->bus ? " bus" : "",
        InitString((*hir)->init));
  }
  Dedent();
  PrintIndent();
  *out_ << "}\n";
}

void Dumper::Dump(ArchitectureId id) {
  auto arch = scoreboard_->Hir(id);
  if (!arch) {
    DumpUnit("Architecture", scoreboard_->Ast(id).name.name);
    return;
  }
  PrintIndent();
  *out_ << std::format(
      "Architecture {} of {} {{\n", (*arch)->name.value,
      scoreboard_->NameOf((*arch)->entity));
  Indent();
  for (const DeclRef& decl : (*arch)->decls) {
    Dump(decl);
  }
  PrintIndent();
  *out_ << std::format("{} concurrent statements\n", (*arch)->stmts.size());
  Dedent();
  PrintIndent();
  *out_ << "}\n";
}

void Dumper::Dump(PackageId id) {
  auto pkg = scoreboard_->Hir(id);
  if (!pkg) {
    DumpUnit("Package", scoreboard_->Ast(id).name.name);
    return;
  }
  PrintIndent();
  *out_ << std::format("Package {} {{\n", (*pkg)->name.value);
  Indent();
  for (GenericId generic : (*pkg)->generics) {
    PrintIndent();
    auto hir = scoreboard_->Hir(generic);
    *out_ << std::format(
        "generic {} : {}\n", scoreboard_->Ast(generic).name.name,
        hir ? SubtypeString((*hir)->subtype) + InitString((*hir)->default_value)
            : "<error>");
  }
  for (const DeclRef& decl : (*pkg)->decls) {
    Dump(decl);
  }
  Dedent();
  PrintIndent();
  *out_ << "}\n";
}

void Dumper::Dump(const DeclRef& decl) {
  std::visit(
      Overloaded{
          [this](PackageId id) { Dump(id); },
          [this](PackageInstanceId id) {
            PrintIndent();
            auto hir = scoreboard_->Hir(id);
            *out_ << std::format(
                "package {} is new {}\n", scoreboard_->Ast(id).name.name,
                hir ? scoreboard_->NameOf((*hir)->package) : "<error>");
          },
          [this](TypeDeclId id) {
            PrintIndent();
            auto hir = scoreboard_->Hir(id);
            if (!hir) {
              *out_ << std::format(
                  "type {} <error>\n", scoreboard_->Ast(id).name.name);
              return;
            }
            const TypeDecl& type = **hir;
            if (!type.data) {
              *out_ << std::format("type {}\n", type.name.value);
              return;
            }
            std::visit(
                Overloaded{
                    [&](const EnumTypeData& data) {
                      std::string lits;
                      for (const auto& lit : data.literals) {
                        lits += lits.empty() ? lit.value : ", " + lit.value;
                      }
                      *out_ << std::format(
                          "type {} is ({})\n", type.name.value, lits);
                    },
                    [&](const RangeTypeData& data) {
                      *out_ << std::format(
                          "type {} is range {} {} {}\n", type.name.value,
                          ExprString(data.left), ToString(data.dir),
                          ExprString(data.right));
                    },
                },
                *type.data);
          },
          [this](SubtypeDeclId id) {
            PrintIndent();
            auto hir = scoreboard_->Hir(id);
            *out_ << std::format(
                "subtype {} is {}\n", scoreboard_->Ast(id).name.name,
                hir ? SubtypeString((*hir)->subtype) : "<error>");
          },
          [this](ConstDeclId id) {
            PrintIndent();
            auto hir = scoreboard_->Hir(id);
            *out_ << std::format(
                "constant {} : {}\n", scoreboard_->Ast(id).name.name,
                hir ? SubtypeString((*hir)->subtype) + InitString((*hir)->init)
                    : "<error>");
          },
          [this](SignalDeclId id) {
            PrintIndent();
            auto hir = scoreboard_->Hir(id);
            *out_ << std::format(
                "signal {} : {}\n", scoreboard_->Ast(id).name.name,
                hir ? SubtypeString((*hir)->subtype) + InitString((*hir)->init)
                    : "<error>");
          },
          [this](VariableDeclId id) {
            PrintIndent();
            auto hir = scoreboard_->Hir(id);
            *out_ << std::format(
                "{}variable {} : {}\n",
                hir && (*hir)->shared ? "shared " : "",
                scoreboard_->Ast(id).name.name,
                hir ? SubtypeString((*hir)->subtype) + InitString((*hir)->init)
                    : "<error>");
          },
          [this](FileDeclId id) {
            PrintIndent();
            auto hir = scoreboard_->Hir(id);
            std::string open;
            if (hir && (*hir)->open) {
              open = " is " + ExprString((*hir)->open->logical_name);
            }
            *out_ << std::format(
                "file {} : {}{}\n", scoreboard_->Ast(id).name.name,
                hir ? SubtypeString((*hir)->subtype) : "<error>", open);
          },
      },
      decl);
}

void Dumper::Dump(ExprId id) {
  PrintIndent();
  *out_ << ExprString(id) << "\n";
}

auto Dumper::InitString(const std::optional<ExprId>& init) const
    -> std::string {
  return init ? " := " + ExprString(*init) : "";
}

auto Dumper::ExprString(ExprId id) const -> std::string {
  const Expr& expr = scoreboard_->Hir(id);
  return std::visit(
      Overloaded{
          [&](const NameExprData& data) { return DefName(data.def); },
          [&](const OverloadedNameExprData& data) {
            return data.candidates.empty()
                       ? std::string("<overloaded>")
                       : DefName(data.candidates.front().value);
          },
          [&](const SelectExprData& data) {
            return ExprString(data.prefix) + "." + data.field.value;
          },
          [&](const AttrExprData& data) {
            return ExprString(data.prefix) + "'" + data.attr.value;
          },
          [](const IntegerLiteralExprData& data) {
            return std::format("{}", data.value);
          },
          [](const FloatLiteralExprData& data) {
            return std::format("{}", data.value);
          },
          [&](const UnaryExprData& data) {
            return std::format(
                "({} {})", ToString(data.op), ExprString(data.operand));
          },
          [&](const BinaryExprData& data) {
            return std::format(
                "({} {} {})", ExprString(data.lhs), ToString(data.op),
                ExprString(data.rhs));
          },
          [&](const RangeExprData& data) {
            return std::format(
                "{} {} {}", ExprString(data.left), ToString(data.dir),
                ExprString(data.right));
          },
      },
      expr.data);
}

auto Dumper::SubtypeString(SubtypeIndId id) const -> std::string {
  const SubtypeInd& ind = scoreboard_->Hir(id);
  std::string mark = std::visit(
      [&](auto type) { return DefName(Def{type}); }, ind.type_mark.value);
  return mark + ConstraintString(ind.constraint);
}

auto Dumper::ConstraintString(const Constraint& constraint) const
    -> std::string {
  return std::visit(
      Overloaded{
          [](const NoConstraint&) { return std::string(); },
          [&](const RangeConstraint& c) {
            return " range " + ExprString(c.range);
          },
          [&](const ArrayConstraint& c) { return ArrayString(c); },
          [&](const RecordConstraint& c) { return RecordString(c); },
      },
      constraint);
}

auto Dumper::ElementString(const ElementConstraint& constraint) const
    -> std::string {
  return std::visit(
      Overloaded{
          [&](const ArrayConstraint& c) { return ArrayString(c); },
          [&](const RecordConstraint& c) { return RecordString(c); },
      },
      constraint);
}

auto Dumper::ArrayString(const ArrayConstraint& c) const -> std::string {
  std::string text = "(";
  if (!c.index) {
    text += "open";
  } else {
    for (size_t i = 0; i < c.index->size(); ++i) {
      text += (i == 0 ? "" : ", ") + ExprString((*c.index)[i]);
    }
  }
  text += ")";
  if (c.element) {
    text += ElementString(c.element->value);
  }
  return text;
}

auto Dumper::RecordString(const RecordConstraint& c) const -> std::string {
  std::string text = "(";
  for (size_t i = 0; i < c.elements.size(); ++i) {
    text += std::format(
        "{}{}{}", i == 0 ? "" : ", ", c.elements[i].first.value,
        ElementString(c.elements[i].second));
  }
  return text + ")";
}

}  // namespace vscore::hir
