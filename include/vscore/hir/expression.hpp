#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "vscore/common/source_span.hpp"
#include "vscore/hir/fwd.hpp"
#include "vscore/hir/operator.hpp"
#include "vscore/hir/refs.hpp"

namespace vscore::hir {

// A name that resolved to exactly one definition.
struct NameExprData {
  Def def;
  SourceSpan def_span;

  auto operator==(const NameExprData&) const -> bool = default;
};

// A name that resolved to several overloadable definitions (enumeration
// literals). The type checker picks one.
struct OverloadedNameExprData {
  std::vector<Spanned<Def>> candidates;

  auto operator==(const OverloadedNameExprData&) const -> bool = default;
};

// `prefix.field`, where prefix is not a library or package.
struct SelectExprData {
  ExprId prefix;
  Spanned<std::string> field;

  auto operator==(const SelectExprData&) const -> bool = default;
};

// `prefix'attribute`
struct AttrExprData {
  ExprId prefix;
  Spanned<std::string> attr;

  auto operator==(const AttrExprData&) const -> bool = default;
};

struct IntegerLiteralExprData {
  int64_t value = 0;

  auto operator==(const IntegerLiteralExprData&) const -> bool = default;
};

struct FloatLiteralExprData {
  double value = 0.0;

  auto operator==(const FloatLiteralExprData&) const -> bool = default;
};

struct UnaryExprData {
  UnaryOp op;
  ExprId operand;

  auto operator==(const UnaryExprData&) const -> bool = default;
};

struct BinaryExprData {
  BinaryOp op;
  ExprId lhs;
  ExprId rhs;

  auto operator==(const BinaryExprData&) const -> bool = default;
};

struct RangeExprData {
  Direction dir;
  ExprId left;
  ExprId right;

  auto operator==(const RangeExprData&) const -> bool = default;
};

using ExprData = std::variant<
    NameExprData, OverloadedNameExprData, SelectExprData, AttrExprData,
    IntegerLiteralExprData, FloatLiteralExprData, UnaryExprData,
    BinaryExprData, RangeExprData>;

struct Expr {
  // Scope the expression's names were resolved in
  ScopeRef parent;
  SourceSpan span;
  ExprData data;

  auto operator==(const Expr&) const -> bool = default;
};

}  // namespace vscore::hir
