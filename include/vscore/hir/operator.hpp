#pragma once

namespace vscore::hir {

enum class UnaryOp {
  kNot,
  kAbs,
  kPos,
  kNeg,

  // Reduction (VHDL-2008)
  kReduceAnd,
  kReduceOr,
  kReduceNand,
  kReduceNor,
  kReduceXor,
  kReduceXnor,
};

enum class BinaryOp {
  // Logical
  kAnd,
  kOr,
  kNand,
  kNor,
  kXor,
  kXnor,

  // Relational
  kEq,
  kNeq,
  kLt,
  kLeq,
  kGt,
  kGeq,

  // Matching relational (VHDL-2008)
  kMatchEq,
  kMatchNeq,
  kMatchLt,
  kMatchLeq,
  kMatchGt,
  kMatchGeq,

  // Shift
  kSll,
  kSrl,
  kSla,
  kSra,
  kRol,
  kRor,

  // Adding
  kAdd,
  kSub,
  kConcat,

  // Multiplying
  kMul,
  kDiv,
  kMod,
  kRem,
  kPow,
};

enum class Direction { kTo, kDownto };

auto ToString(UnaryOp op) -> const char*;
auto ToString(BinaryOp op) -> const char*;
auto ToString(Direction dir) -> const char*;

}  // namespace vscore::hir
