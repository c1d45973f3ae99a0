#include "vscore/hir/operator.hpp"

namespace vscore::hir {

auto ToString(UnaryOp op) -> const char* {
  switch (op) {
    case UnaryOp::kNot:
      return "not";
    case UnaryOp::kAbs:
      return "abs";
    case UnaryOp::kPos:
      return "+";
    case UnaryOp::kNeg:
      return "-";
    case UnaryOp::kReduceAnd:
      return "and";
    case UnaryOp::kReduceOr:
      return "or";
    case UnaryOp::kReduceNand:
      return "nand";
    case UnaryOp::kReduceNor:
      return "nor";
    case UnaryOp::kReduceXor:
      return "xor";
    case UnaryOp::kReduceXnor:
      return "xnor";
  }
  return "?";
}

auto ToString(BinaryOp op) -> const char* {
  switch (op) {
    case BinaryOp::kAnd:
      return "and";
    case BinaryOp::kOr:
      return "or";
    case BinaryOp::kNand:
      return "nand";
    case BinaryOp::kNor:
      return "nor";
    case BinaryOp::kXor:
      return "xor";
    case BinaryOp::kXnor:
      return "xnor";
    case BinaryOp::kEq:
      return "=";
    case BinaryOp::kNeq:
      return "/=";
    case BinaryOp::kLt:
      return "<";
    case BinaryOp::kLeq:
      return "<=";
    case BinaryOp::kGt:
      return ">";
    case BinaryOp::kGeq:
      return ">=";
    case BinaryOp::kMatchEq:
      return "?=";
    case BinaryOp::kMatchNeq:
      return "?/=";
    case BinaryOp::kMatchLt:
      return "?<";
    case BinaryOp::kMatchLeq:
      return "?<=";
    case BinaryOp::kMatchGt:
      return "?>";
    case BinaryOp::kMatchGeq:
      return "?>=";
    case BinaryOp::kSll:
      return "sll";
    case BinaryOp::kSrl:
      return "srl";
    case BinaryOp::kSla:
      return "sla";
    case BinaryOp::kSra:
      return "sra";
    case BinaryOp::kRol:
      return "rol";
    case BinaryOp::kRor:
      return "ror";
    case BinaryOp::kAdd:
      return "+";
    case BinaryOp::kSub:
      return "-";
    case BinaryOp::kConcat:
      return "&";
    case BinaryOp::kMul:
      return "*";
    case BinaryOp::kDiv:
      return "/";
    case BinaryOp::kMod:
      return "mod";
    case BinaryOp::kRem:
      return "rem";
    case BinaryOp::kPow:
      return "**";
  }
  return "?";
}

auto ToString(Direction dir) -> const char* {
  switch (dir) {
    case Direction::kTo:
      return "to";
    case Direction::kDownto:
      return "downto";
  }
  return "?";
}

}  // namespace vscore::hir
