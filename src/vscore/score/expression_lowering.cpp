#include <algorithm>
#include <charconv>
#include <cstdint>
#include <format>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

#include "vscore/common/internal_error.hpp"
#include "vscore/score/scoreboard.hpp"
#include "vscore/score/syntax_utils.hpp"

namespace vscore::score {

namespace {

auto StripUnderscores(std::string_view text) -> std::string {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (c != '_') {
      out.push_back(c);
    }
  }
  return out;
}

auto DigitValue(char c) -> int {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

// Accumulates `digits` in `base` into `value`. Fails on an invalid digit or
// on overflow.
auto AccumulateDigits(std::string_view digits, int64_t base, int64_t& value)
    -> bool {
  if (digits.empty()) {
    return false;
  }
  constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
  for (char c : digits) {
    int digit = DigitValue(c);
    if (digit < 0 || digit >= base) {
      return false;
    }
    if (value > (kMax - digit) / base) {
      return false;
    }
    value = value * base + digit;
  }
  return true;
}

auto ParseExponent(std::string_view text, int64_t& exponent) -> bool {
  if (!text.empty() && text.front() == '+') {
    text.remove_prefix(1);
  }
  if (text.empty()) {
    return false;
  }
  auto [ptr, ec] =
      std::from_chars(text.data(), text.data() + text.size(), exponent);
  // Integer literals may not have a negative exponent.
  return ec == std::errc() && ptr == text.data() + text.size() && exponent >= 0;
}

// Decimal (`1_000`, `2E3`) and based (`16#FF#`, `2#1010#E2`) integer
// literals of IEEE 1076-2008 15.5.
auto ParseIntegerLiteral(std::string_view spelling) -> std::optional<int64_t> {
  std::string text = StripUnderscores(spelling);
  std::string_view rest = text;

  int64_t base = 10;
  std::string_view digits;
  std::string_view exponent_text;
  bool has_exponent = false;

  size_t hash = rest.find_first_of("#:");
  if (hash != std::string_view::npos) {
    char delim = rest[hash];
    int64_t parsed_base = 0;
    if (!AccumulateDigits(rest.substr(0, hash), 10, parsed_base) ||
        parsed_base < 2 || parsed_base > 16) {
      return std::nullopt;
    }
    base = parsed_base;
    size_t close = rest.find(delim, hash + 1);
    if (close == std::string_view::npos) {
      return std::nullopt;
    }
    digits = rest.substr(hash + 1, close - hash - 1);
    rest = rest.substr(close + 1);
    if (!rest.empty()) {
      if (rest.front() != 'e' && rest.front() != 'E') {
        return std::nullopt;
      }
      exponent_text = rest.substr(1);
      has_exponent = true;
    }
  } else {
    size_t e = rest.find_first_of("eE");
    digits = rest.substr(0, e);
    if (e != std::string_view::npos) {
      exponent_text = rest.substr(e + 1);
      has_exponent = true;
    }
  }

  int64_t value = 0;
  if (!AccumulateDigits(digits, base, value)) {
    return std::nullopt;
  }
  if (has_exponent) {
    int64_t exponent = 0;
    if (!ParseExponent(exponent_text, exponent)) {
      return std::nullopt;
    }
    for (int64_t i = 0; i < exponent && value != 0; ++i) {
      if (value > std::numeric_limits<int64_t>::max() / base) {
        return std::nullopt;
      }
      value *= base;
    }
  }
  return value;
}

auto ParseFloatLiteral(std::string_view spelling) -> std::optional<double> {
  std::string text = StripUnderscores(spelling);
  double value = 0.0;
  auto [ptr, ec] =
      std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

auto LowerUnaryOp(ast::UnaryOp op) -> hir::UnaryOp {
  switch (op) {
    case ast::UnaryOp::kNot:
      return hir::UnaryOp::kNot;
    case ast::UnaryOp::kAbs:
      return hir::UnaryOp::kAbs;
    case ast::UnaryOp::kPos:
      return hir::UnaryOp::kPos;
    case ast::UnaryOp::kNeg:
      return hir::UnaryOp::kNeg;
    case ast::UnaryOp::kAnd:
      return hir::UnaryOp::kReduceAnd;
    case ast::UnaryOp::kOr:
      return hir::UnaryOp::kReduceOr;
    case ast::UnaryOp::kNand:
      return hir::UnaryOp::kReduceNand;
    case ast::UnaryOp::kNor:
      return hir::UnaryOp::kReduceNor;
    case ast::UnaryOp::kXor:
      return hir::UnaryOp::kReduceXor;
    case ast::UnaryOp::kXnor:
      return hir::UnaryOp::kReduceXnor;
  }
  return hir::UnaryOp::kNot;
}

// Both enums list the operators in the same order.
auto LowerBinaryOp(ast::BinaryOp op) -> hir::BinaryOp {
  return static_cast<hir::BinaryOp>(static_cast<int>(op));
}

void ExpectOperands(const ast::Expr& expr, size_t count) {
  if (expr.operands.size() != count) {
    common::ThrowInternalError(
        "Scoreboard::LowerExpr",
        std::format(
            "expression expects {} operands, syntax tree has {}", count,
            expr.operands.size()));
  }
}

}  // namespace

auto Scoreboard::LowerExpr(const ast::Expr& expr, const hir::ScopeRef& scope)
    -> Outcome<hir::ExprId> {
  auto make = [&](hir::ExprData data) {
    return exprs_.Allocate(
        hir::Expr{.parent = scope, .span = expr.span, .data = std::move(data)});
  };

  switch (expr.kind) {
    case ast::ExprKind::kName:
      return LowerName(expr.name, scope);

    case ast::ExprKind::kIntegerLiteral: {
      auto value = ParseIntegerLiteral(expr.literal);
      if (!value) {
        sink_->Error(
            expr.span,
            std::format(
                "invalid or out-of-range integer literal `{}`", expr.literal));
        return Failed();
      }
      return make(hir::IntegerLiteralExprData{.value = *value});
    }

    case ast::ExprKind::kFloatLiteral: {
      auto value = ParseFloatLiteral(expr.literal);
      if (!value) {
        sink_->Error(
            expr.span,
            std::format("invalid floating-point literal `{}`", expr.literal));
        return Failed();
      }
      return make(hir::FloatLiteralExprData{.value = *value});
    }

    case ast::ExprKind::kUnary: {
      ExpectOperands(expr, 1);
      auto operand = LowerExpr(expr.operands[0], scope);
      if (!operand) {
        return Failed();
      }
      return make(
          hir::UnaryExprData{
              .op = LowerUnaryOp(expr.unary_op), .operand = *operand});
    }

    case ast::ExprKind::kBinary: {
      ExpectOperands(expr, 2);
      auto lhs = LowerExpr(expr.operands[0], scope);
      auto rhs = LowerExpr(expr.operands[1], scope);
      if (!lhs || !rhs) {
        return Failed();
      }
      return make(
          hir::BinaryExprData{
              .op = LowerBinaryOp(expr.binary_op), .lhs = *lhs, .rhs = *rhs});
    }

    case ast::ExprKind::kRange: {
      ExpectOperands(expr, 2);
      auto left = LowerExpr(expr.operands[0], scope);
      auto right = LowerExpr(expr.operands[1], scope);
      if (!left || !right) {
        return Failed();
      }
      return make(
          hir::RangeExprData{
              .dir = expr.direction == ast::Direction::kTo
                         ? hir::Direction::kTo
                         : hir::Direction::kDownto,
              .left = *left,
              .right = *right});
    }
  }

  common::ThrowInternalError("Scoreboard::LowerExpr", "unknown expression kind");
}

auto Scoreboard::LowerOptionalExpr(
    const std::optional<ast::Expr>& expr, const hir::ScopeRef& scope)
    -> Outcome<std::optional<hir::ExprId>> {
  if (!expr) {
    return std::optional<hir::ExprId>{};
  }
  auto id = LowerExpr(*expr, scope);
  if (!id) {
    return Failed();
  }
  return std::optional<hir::ExprId>{*id};
}

auto Scoreboard::LowerName(
    const ast::CompoundName& name, const hir::ScopeRef& scope)
    -> Outcome<hir::ExprId> {
  auto resolved = ResolveCompoundName(scope, name);
  if (!resolved) {
    return Failed();
  }

  hir::ExprData data;
  if (resolved->defs.size() == 1) {
    data = hir::NameExprData{
        .def = resolved->defs.front().value,
        .def_span = resolved->defs.front().span};
  } else if (std::ranges::all_of(resolved->defs, [](const auto& def) {
               return hir::IsOverloadable(def.value);
             })) {
    data = hir::OverloadedNameExprData{.candidates = resolved->defs};
  } else {
    Diagnostic diag = Diagnostic::Error(
        resolved->valid_span,
        std::format(
            "`{}` is ambiguous",
            RenderPrefix(name, name.parts.size() - resolved->tail.size())));
    for (const Spanned<hir::Def>& def : resolved->defs) {
      diag = std::move(diag).WithNote(
          def.span, std::format("candidate {}", hir::DescribeKind(def.value)));
    }
    sink_->Report(std::move(diag));
    return Failed();
  }

  SourceSpan span = resolved->valid_span;
  hir::ExprId current = exprs_.Allocate(
      hir::Expr{.parent = scope, .span = span, .data = std::move(data)});

  for (const ast::NamePart& part : resolved->tail) {
    span = Union(span, part.span);
    switch (part.kind) {
      case ast::NamePartKind::kSelect:
        current = exprs_.Allocate(
            hir::Expr{
                .parent = scope,
                .span = span,
                .data = hir::SelectExprData{
                    .prefix = current, .field = SpannedName(part.ident)}});
        break;
      case ast::NamePartKind::kAttribute:
        current = exprs_.Allocate(
            hir::Expr{
                .parent = scope,
                .span = span,
                .data = hir::AttrExprData{
                    .prefix = current, .attr = SpannedName(part.ident)}});
        break;
      case ast::NamePartKind::kCall:
        sink_->Unsupported(
            part.span, "calls and indexed names are not yet supported");
        return Failed();
      case ast::NamePartKind::kSelectAll:
        sink_->Error(
            SourceSpan{
                .file_id = name.span.file_id,
                .begin = part.span.begin,
                .end = name.span.end},
            "invalid name suffix");
        return Failed();
    }
  }
  return current;
}

auto Scoreboard::LowerSubtypeInd(
    const ast::SubtypeIndication& ind, const hir::ScopeRef& scope)
    -> Outcome<hir::SubtypeIndId> {
  const ast::CompoundName& mark = ind.type_mark;
  auto resolved = ResolveCompoundName(scope, mark);
  if (!resolved) {
    return Failed();
  }
  if (!resolved->tail.empty()) {
    sink_->Error(SuffixSpan(resolved->valid_span, mark), "invalid name suffix");
    return Failed();
  }

  std::optional<hir::TypeMarkRef> type_mark;
  if (resolved->defs.size() == 1) {
    const hir::Def& def = resolved->defs.front().value;
    if (const auto* type = std::get_if<hir::TypeDeclId>(&def)) {
      type_mark = *type;
    } else if (const auto* subtype = std::get_if<hir::SubtypeDeclId>(&def)) {
      type_mark = *subtype;
    }
  }
  if (!type_mark) {
    sink_->Error(
        mark.span, std::format(
                       "`{}` is not a type",
                       RenderPrefix(mark, mark.parts.size())));
    return Failed();
  }

  hir::Constraint constraint = hir::NoConstraint{};
  if (ind.constraint) {
    auto lowered = LowerConstraint(*ind.constraint, scope);
    if (!lowered) {
      return Failed();
    }
    constraint = std::move(*lowered);
  }

  return subtype_inds_.Allocate(
      hir::SubtypeInd{
          .span = ind.span,
          .type_mark = {.value = *type_mark, .span = resolved->valid_span},
          .constraint = std::move(constraint),
      });
}

auto Scoreboard::LowerConstraint(
    const ast::Constraint& c, const hir::ScopeRef& scope)
    -> Outcome<hir::Constraint> {
  switch (c.kind) {
    case ast::ConstraintKind::kRange: {
      if (!c.range) {
        common::ThrowInternalError(
            "Scoreboard::LowerConstraint", "range constraint without a range");
      }
      auto range = LowerExpr(*c.range, scope);
      if (!range) {
        return Failed();
      }
      return hir::RangeConstraint{.span = c.span, .range = *range};
    }
    case ast::ConstraintKind::kArray: {
      auto array = LowerArrayConstraint(c, scope);
      if (!array) {
        return Failed();
      }
      return hir::Constraint{std::move(*array)};
    }
    case ast::ConstraintKind::kRecord: {
      auto record = LowerRecordConstraint(c, scope);
      if (!record) {
        return Failed();
      }
      return hir::Constraint{std::move(*record)};
    }
  }
  common::ThrowInternalError(
      "Scoreboard::LowerConstraint", "unknown constraint kind");
}

auto Scoreboard::LowerElementConstraint(
    const ast::Constraint& c, const hir::ScopeRef& scope)
    -> Outcome<hir::ElementConstraint> {
  switch (c.kind) {
    case ast::ConstraintKind::kArray: {
      auto array = LowerArrayConstraint(c, scope);
      if (!array) {
        return Failed();
      }
      return hir::ElementConstraint{std::move(*array)};
    }
    case ast::ConstraintKind::kRecord: {
      auto record = LowerRecordConstraint(c, scope);
      if (!record) {
        return Failed();
      }
      return hir::ElementConstraint{std::move(*record)};
    }
    case ast::ConstraintKind::kRange:
      sink_->Error(
          c.span, "element constraint must be an array or record constraint");
      return Failed();
  }
  common::ThrowInternalError(
      "Scoreboard::LowerElementConstraint", "unknown constraint kind");
}

auto Scoreboard::LowerArrayConstraint(
    const ast::Constraint& c, const hir::ScopeRef& scope)
    -> Outcome<hir::ArrayConstraint> {
  hir::ArrayConstraint array{.span = c.span, .index = std::nullopt, .element = nullptr};
  bool failed = false;

  if (c.index) {
    array.index.emplace();
    for (const ast::Expr& index : *c.index) {
      auto id = LowerExpr(index, scope);
      if (!id) {
        failed = true;
        continue;
      }
      array.index->push_back(*id);
    }
  }

  if (!c.element.empty()) {
    const ast::Constraint& element = c.element.front();
    auto lowered = LowerElementConstraint(element, scope);
    if (!lowered) {
      failed = true;
    } else {
      array.element = std::make_unique<Spanned<hir::ElementConstraint>>(
          Spanned<hir::ElementConstraint>{
              .value = std::move(*lowered), .span = element.span});
    }
  }

  if (failed) {
    return Failed();
  }
  return array;
}

auto Scoreboard::LowerRecordConstraint(
    const ast::Constraint& c, const hir::ScopeRef& scope)
    -> Outcome<hir::RecordConstraint> {
  hir::RecordConstraint record{.span = c.span, .elements = {}};
  bool failed = false;
  for (const ast::RecordElementConstraint& element : c.record) {
    auto lowered = LowerElementConstraint(element.constraint, scope);
    if (!lowered) {
      failed = true;
      continue;
    }
    record.elements.emplace_back(
        SpannedName(element.name), std::move(*lowered));
  }
  if (failed) {
    return Failed();
  }
  return record;
}

}  // namespace vscore::score
