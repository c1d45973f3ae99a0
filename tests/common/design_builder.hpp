#pragma once

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "vscore/ast/ast.hpp"
#include "vscore/common/source_manager.hpp"
#include "vscore/common/source_span.hpp"

namespace vscore::test {

// Builds syntax trees the way a parser would hand them over. Every token
// gets a fresh span in one synthetic file, laid out left to right, so that
// spans of different nodes never compare equal and compound names have
// contiguous parts. Sibling function arguments are evaluated in an
// unspecified order, so a test that depends on which of two units comes
// first in the source builds them into locals first.
class DesignBuilder {
 public:
  explicit DesignBuilder(FileId file = FileId{.value = 1}) : file_(file) {
  }

  auto Span(uint32_t width = 1) -> SourceSpan {
    SourceSpan span{.file_id = file_, .begin = cursor_, .end = cursor_ + width};
    cursor_ += width + 1;
    return span;
  }

  auto Ident(std::string_view name) -> ast::Ident {
    return ast::Ident{
        .name = std::string(name),
        .span = Span(static_cast<uint32_t>(name.size()))};
  }

  // Parses "a.b.all" or "integer'high" into a compound name.
  auto Name(std::string_view text) -> ast::CompoundName {
    ast::CompoundName name;
    size_t end = text.find_first_of(".'");
    name.primary = Ident(text.substr(0, end));
    uint32_t last = name.primary.span.end;
    cursor_ = last;

    while (end != std::string_view::npos) {
      char sep = text[end];
      size_t next = text.find_first_of(".'", end + 1);
      std::string_view word = text.substr(end + 1, next - end - 1);

      ast::NamePart part;
      uint32_t begin = cursor_;
      ++cursor_;  // separator
      if (sep == '\'') {
        part.kind = ast::NamePartKind::kAttribute;
      } else if (word == "all") {
        part.kind = ast::NamePartKind::kSelectAll;
      } else {
        part.kind = ast::NamePartKind::kSelect;
      }
      part.ident = ast::Ident{
          .name = std::string(word),
          .span = SourceSpan{
              .file_id = file_,
              .begin = cursor_,
              .end = cursor_ + static_cast<uint32_t>(word.size())}};
      cursor_ += static_cast<uint32_t>(word.size());
      part.span = SourceSpan{.file_id = file_, .begin = begin, .end = cursor_};
      last = cursor_;
      name.parts.push_back(std::move(part));
      end = next;
    }

    name.span = SourceSpan{
        .file_id = file_, .begin = name.primary.span.begin, .end = last};
    cursor_ = last + 1;
    return name;
  }

  // Appends a `(...)` part, as for a function call or indexed name.
  auto WithCall(ast::CompoundName name) -> ast::CompoundName {
    SourceSpan span = Span(5);
    name.parts.push_back(
        ast::NamePart{.kind = ast::NamePartKind::kCall, .ident = {}, .span = span});
    name.span = Union(name.span, span);
    return name;
  }

  auto NameExpr(std::string_view text) -> ast::Expr {
    ast::CompoundName name = Name(text);
    SourceSpan span = name.span;
    return ast::Expr{
        .kind = ast::ExprKind::kName, .span = span, .name = std::move(name)};
  }

  auto Int(std::string_view text) -> ast::Expr {
    return ast::Expr{
        .kind = ast::ExprKind::kIntegerLiteral,
        .span = Span(static_cast<uint32_t>(text.size())),
        .literal = std::string(text)};
  }

  auto Float(std::string_view text) -> ast::Expr {
    return ast::Expr{
        .kind = ast::ExprKind::kFloatLiteral,
        .span = Span(static_cast<uint32_t>(text.size())),
        .literal = std::string(text)};
  }

  auto Unary(ast::UnaryOp op, ast::Expr operand) -> ast::Expr {
    ast::Expr expr{
        .kind = ast::ExprKind::kUnary,
        .span = operand.span,
        .unary_op = op};
    expr.operands.push_back(std::move(operand));
    return expr;
  }

  auto Binary(ast::BinaryOp op, ast::Expr lhs, ast::Expr rhs) -> ast::Expr {
    ast::Expr expr{
        .kind = ast::ExprKind::kBinary,
        .span = Union(lhs.span, rhs.span),
        .binary_op = op};
    expr.operands.push_back(std::move(lhs));
    expr.operands.push_back(std::move(rhs));
    return expr;
  }

  auto Range(
      ast::Expr left, ast::Expr right,
      ast::Direction dir = ast::Direction::kTo) -> ast::Expr {
    ast::Expr expr{
        .kind = ast::ExprKind::kRange,
        .span = Union(left.span, right.span),
        .direction = dir};
    expr.operands.push_back(std::move(left));
    expr.operands.push_back(std::move(right));
    return expr;
  }

  auto Subtype(std::string_view mark) -> ast::SubtypeIndication {
    ast::CompoundName name = Name(mark);
    SourceSpan span = name.span;
    return ast::SubtypeIndication{
        .type_mark = std::move(name), .constraint = std::nullopt, .span = span};
  }

  // `mark range left to right`
  auto Subtype(std::string_view mark, ast::Expr left, ast::Expr right)
      -> ast::SubtypeIndication {
    ast::SubtypeIndication ind = Subtype(mark);
    ast::Expr range = Range(std::move(left), std::move(right));
    SourceSpan span = range.span;
    ind.constraint = ast::Constraint{
        .kind = ast::ConstraintKind::kRange,
        .span = span,
        .range = std::move(range)};
    ind.span = Union(ind.span, span);
    return ind;
  }

  // Context items

  auto Library(std::initializer_list<std::string_view> names)
      -> ast::ContextItem {
    ast::LibraryClause clause;
    for (std::string_view name : names) {
      clause.names.push_back(Ident(name));
    }
    clause.span = clause.names.front().span;
    return clause;
  }

  auto Use(std::initializer_list<std::string_view> names) -> ast::ContextItem {
    ast::UseClause clause;
    for (std::string_view name : names) {
      clause.names.push_back(Name(name));
    }
    clause.span = clause.names.front().span;
    return clause;
  }

  auto ContextRef(std::initializer_list<std::string_view> names)
      -> ast::ContextItem {
    ast::ContextReference ref;
    for (std::string_view name : names) {
      ref.names.push_back(Name(name));
    }
    ref.span = ref.names.front().span;
    return ref;
  }

  // Declarations

  auto EnumType(
      std::string_view name, std::initializer_list<std::string_view> literals)
      -> ast::Declaration {
    ast::TypeDecl decl{.name = Ident(name)};
    ast::EnumTypeDef def;
    for (std::string_view lit : literals) {
      def.literals.push_back(Ident(lit));
    }
    def.span = def.literals.front().span;
    decl.span = Union(decl.name.span, def.span);
    decl.def = std::move(def);
    return decl;
  }

  auto RangeType(std::string_view name, ast::Expr left, ast::Expr right)
      -> ast::Declaration {
    ast::TypeDecl decl{.name = Ident(name)};
    ast::Expr range = Range(std::move(left), std::move(right));
    SourceSpan span = range.span;
    decl.def = ast::RangeTypeDef{.range = std::move(range), .span = span};
    decl.span = Union(decl.name.span, span);
    return decl;
  }

  auto IncompleteType(std::string_view name) -> ast::Declaration {
    ast::Ident ident = Ident(name);
    SourceSpan span = ident.span;
    return ast::TypeDecl{
        .name = std::move(ident), .def = std::nullopt, .span = span};
  }

  auto SubtypeDecl(std::string_view name, ast::SubtypeIndication ind)
      -> ast::Declaration {
    ast::Ident ident = Ident(name);
    SourceSpan span = Union(ident.span, ind.span);
    return ast::SubtypeDecl{
        .name = std::move(ident), .subtype = std::move(ind), .span = span};
  }

  auto Object(
      ast::ObjectKind kind, std::initializer_list<std::string_view> names,
      ast::SubtypeIndication ind, std::optional<ast::Expr> init = std::nullopt)
      -> ast::Declaration {
    ast::ObjectDecl decl{.kind = kind};
    for (std::string_view name : names) {
      decl.names.push_back(Ident(name));
    }
    decl.span = Union(decl.names.front().span, ind.span);
    decl.subtype = std::move(ind);
    decl.init = std::move(init);
    return decl;
  }

  auto Constant(
      std::string_view name, ast::SubtypeIndication ind,
      std::optional<ast::Expr> init = std::nullopt) -> ast::Declaration {
    return Object(
        ast::ObjectKind::kConstant, {name}, std::move(ind), std::move(init));
  }

  auto Signal(std::string_view name, ast::SubtypeIndication ind)
      -> ast::Declaration {
    return Object(ast::ObjectKind::kSignal, {name}, std::move(ind));
  }

  auto PackageInst(std::string_view name, std::string_view package)
      -> ast::PackageInstDecl {
    ast::Ident ident = Ident(name);
    ast::CompoundName target = Name(package);
    SourceSpan span = Union(ident.span, target.span);
    return ast::PackageInstDecl{
        .name = std::move(ident), .package = std::move(target), .span = span};
  }

  template <typename... Decls>
  auto Package(std::string_view name, Decls&&... decls) -> ast::PackageDecl {
    ast::PackageDecl pkg{.name = Ident(name)};
    (pkg.decls.push_back(std::forward<Decls>(decls)), ...);
    pkg.span = pkg.name.span;
    return pkg;
  }

  template <typename... Decls>
  auto NestedPackage(std::string_view name, Decls&&... decls)
      -> ast::Declaration {
    return std::make_unique<ast::PackageDecl>(
        Package(name, std::forward<Decls>(decls)...));
  }

  auto Port(
      std::string_view name, ast::Mode mode, ast::SubtypeIndication ind)
      -> ast::InterfaceDecl {
    ast::InterfaceDecl decl{.kind = ast::InterfaceKind::kSignal, .mode = mode};
    decl.names.push_back(Ident(name));
    decl.span = Union(decl.names.front().span, ind.span);
    decl.subtype = std::move(ind);
    return decl;
  }

  auto Generic(
      std::string_view name, ast::SubtypeIndication ind,
      std::optional<ast::Expr> default_value = std::nullopt)
      -> ast::InterfaceDecl {
    ast::InterfaceDecl decl{.kind = ast::InterfaceKind::kConstant};
    decl.names.push_back(Ident(name));
    decl.span = Union(decl.names.front().span, ind.span);
    decl.subtype = std::move(ind);
    decl.default_value = std::move(default_value);
    return decl;
  }

  auto Entity(
      std::string_view name, std::vector<ast::InterfaceDecl> ports = {},
      std::vector<ast::InterfaceDecl> generics = {}) -> ast::EntityDecl {
    ast::Ident ident = Ident(name);
    SourceSpan span = ident.span;
    return ast::EntityDecl{
        .name = std::move(ident),
        .generics = std::move(generics),
        .ports = std::move(ports),
        .span = span};
  }

  template <typename... Decls>
  auto Architecture(
      std::string_view name, std::string_view entity, Decls&&... decls)
      -> ast::ArchitectureBody {
    ast::ArchitectureBody arch{.name = Ident(name), .entity = Ident(entity)};
    (arch.decls.push_back(std::forward<Decls>(decls)), ...);
    arch.span = Union(arch.name.span, arch.entity.span);
    return arch;
  }

  auto Configuration(std::string_view name, std::string_view entity)
      -> ast::ConfigurationDecl {
    ast::Ident ident = Ident(name);
    ast::Ident target = Ident(entity);
    SourceSpan span = Union(ident.span, target.span);
    return ast::ConfigurationDecl{
        .name = std::move(ident), .entity = std::move(target), .span = span};
  }

  auto PackageBody(std::string_view name) -> ast::PackageBody {
    ast::Ident ident = Ident(name);
    SourceSpan span = ident.span;
    return ast::PackageBody{.name = std::move(ident), .decls = {}, .span = span};
  }

  auto Context(std::string_view name, std::vector<ast::ContextItem> items)
      -> ast::ContextDecl {
    ast::Ident ident = Ident(name);
    SourceSpan span = ident.span;
    return ast::ContextDecl{
        .name = std::move(ident), .items = std::move(items), .span = span};
  }

 private:
  FileId file_;
  uint32_t cursor_ = 0;
};

// A design unit with its context clause.
inline auto Unit(ast::DesignUnitBody body, std::vector<ast::ContextItem> context = {})
    -> ast::DesignUnit {
  return ast::DesignUnit{.context = std::move(context), .body = std::move(body)};
}

}  // namespace vscore::test
