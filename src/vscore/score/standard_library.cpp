#include "vscore/score/standard_library.hpp"

#include <array>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace vscore::score {

namespace {

// Names of the 32 control characters below the space, in code order.
constexpr std::array<std::string_view, 32> kControlCharacters = {
    "nul", "soh", "stx", "etx", "eot", "enq", "ack", "bel",
    "bs",  "ht",  "lf",  "vt",  "ff",  "cr",  "so",  "si",
    "dle", "dc1", "dc2", "dc3", "dc4", "nak", "syn", "etb",
    "can", "em",  "sub", "esc", "fsp", "gsp", "rsp", "usp"};

auto Id(std::string name) -> ast::Ident {
  return ast::Ident{.name = std::move(name), .span = {}};
}

auto Literal(ast::ExprKind kind, std::string text) -> ast::Expr {
  return ast::Expr{.kind = kind, .literal = std::move(text)};
}

auto Negate(ast::Expr operand) -> ast::Expr {
  ast::Expr expr{.kind = ast::ExprKind::kUnary, .unary_op = ast::UnaryOp::kNeg};
  expr.operands.push_back(std::move(operand));
  return expr;
}

auto Range(ast::Expr left, ast::Expr right) -> ast::Expr {
  ast::Expr expr{.kind = ast::ExprKind::kRange};
  expr.operands.push_back(std::move(left));
  expr.operands.push_back(std::move(right));
  return expr;
}

// `integer'high`
auto IntegerHigh() -> ast::Expr {
  ast::Expr expr{.kind = ast::ExprKind::kName};
  expr.name.primary = Id("integer");
  expr.name.parts.push_back(
      ast::NamePart{.kind = ast::NamePartKind::kAttribute, .ident = Id("high")});
  return expr;
}

auto EnumType(std::string name, std::initializer_list<std::string_view> lits)
    -> ast::Declaration {
  ast::EnumTypeDef def;
  for (std::string_view lit : lits) {
    def.literals.push_back(Id(std::string(lit)));
  }
  return ast::TypeDecl{.name = Id(std::move(name)), .def = std::move(def)};
}

auto CharacterType() -> ast::Declaration {
  ast::EnumTypeDef def;
  for (std::string_view name : kControlCharacters) {
    def.literals.push_back(Id(std::string(name)));
  }
  for (char c = ' '; c <= '~'; ++c) {
    def.literals.push_back(Id(std::string{'\'', c, '\''}));
  }
  def.literals.push_back(Id("del"));
  return ast::TypeDecl{.name = Id("character"), .def = std::move(def)};
}

auto RangeType(std::string name, ast::Expr left, ast::Expr right)
    -> ast::Declaration {
  return ast::TypeDecl{
      .name = Id(std::move(name)),
      .def = ast::RangeTypeDef{
          .range = Range(std::move(left), std::move(right))}};
}

// `subtype <name> is integer range <low> to integer'high;`
auto IntegerSubtype(std::string name, std::string low) -> ast::Declaration {
  ast::SubtypeIndication ind;
  ind.type_mark.primary = Id("integer");
  ind.constraint = ast::Constraint{
      .kind = ast::ConstraintKind::kRange,
      .range = Range(
          Literal(ast::ExprKind::kIntegerLiteral, std::move(low)),
          IntegerHigh())};
  return ast::SubtypeDecl{.name = Id(std::move(name)), .subtype = std::move(ind)};
}

}  // namespace

auto MakeStandardLibrary() -> std::vector<ast::DesignUnit> {
  ast::PackageDecl standard{.name = Id("standard")};
  auto& decls = standard.decls;

  decls.push_back(EnumType("boolean", {"false", "true"}));
  decls.push_back(EnumType("bit", {"'0'", "'1'"}));
  decls.push_back(CharacterType());
  decls.push_back(
      EnumType("severity_level", {"note", "warning", "error", "failure"}));
  decls.push_back(RangeType(
      "integer",
      Negate(Literal(ast::ExprKind::kIntegerLiteral, "2147483648")),
      Literal(ast::ExprKind::kIntegerLiteral, "2147483647")));
  decls.push_back(IntegerSubtype("natural", "0"));
  decls.push_back(IntegerSubtype("positive", "1"));
  decls.push_back(RangeType(
      "real", Negate(Literal(ast::ExprKind::kFloatLiteral, "1.7976931348623157e308")),
      Literal(ast::ExprKind::kFloatLiteral, "1.7976931348623157e308")));
  // Physical units are not modelled; time is its abstract range only.
  decls.push_back(RangeType(
      "time",
      Negate(Literal(ast::ExprKind::kIntegerLiteral, "9223372036854775807")),
      Literal(ast::ExprKind::kIntegerLiteral, "9223372036854775807")));
  decls.push_back(EnumType(
      "file_open_kind", {"read_mode", "write_mode", "append_mode"}));
  decls.push_back(EnumType(
      "file_open_status",
      {"open_ok", "status_error", "name_error", "mode_error"}));

  std::vector<ast::DesignUnit> units;
  units.push_back(ast::DesignUnit{.context = {}, .body = std::move(standard)});
  return units;
}

}  // namespace vscore::score
