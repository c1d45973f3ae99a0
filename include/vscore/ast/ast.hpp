#pragma once

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "vscore/common/source_span.hpp"

// Syntax tree of VHDL design files, as handed over by the parser. Nodes are
// plain aggregates owned by the caller; the scoreboard only keeps pointers
// into them and requires them to outlive the session.
namespace vscore::ast {

struct Ident {
  std::string name;  // As spelled in the source
  SourceSpan span;
};

enum class NamePartKind {
  kSelect,     // .ident
  kSelectAll,  // .all
  kAttribute,  // 'ident
  kCall,       // ( ... )
};

struct NamePart {
  NamePartKind kind = NamePartKind::kSelect;
  Ident ident;  // kSelect and kAttribute only
  SourceSpan span;
};

// A possibly dotted name, e.g. `ieee.std_logic_1164.all`.
struct CompoundName {
  Ident primary;
  std::vector<NamePart> parts;
  SourceSpan span;
};

enum class Direction { kTo, kDownto };

enum class UnaryOp {
  kNot,
  kAbs,
  kPos,
  kNeg,
  // Reduction operators (VHDL-2008)
  kAnd,
  kOr,
  kNand,
  kNor,
  kXor,
  kXnor,
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

enum class ExprKind {
  kName,
  kIntegerLiteral,
  kFloatLiteral,
  kUnary,
  kBinary,
  kRange,  // operands[0] to/downto operands[1]
};

struct Expr {
  ExprKind kind = ExprKind::kName;
  SourceSpan span;
  CompoundName name;    // kName
  std::string literal;  // kIntegerLiteral, kFloatLiteral
  UnaryOp unary_op = UnaryOp::kNot;
  BinaryOp binary_op = BinaryOp::kAdd;
  Direction direction = Direction::kTo;
  std::vector<Expr> operands;
};

enum class ConstraintKind { kRange, kArray, kRecord };

struct RecordElementConstraint;

struct Constraint {
  ConstraintKind kind = ConstraintKind::kRange;
  SourceSpan span;
  std::optional<Expr> range;  // kRange
  // kArray: index ranges, std::nullopt for `(open)`.
  std::optional<std::vector<Expr>> index;
  // kArray: constraint on the elements, at most one entry.
  std::vector<Constraint> element;
  std::vector<RecordElementConstraint> record;  // kRecord
};

struct RecordElementConstraint {
  Ident name;
  Constraint constraint;
};

struct SubtypeIndication {
  CompoundName type_mark;
  std::optional<Constraint> constraint;
  SourceSpan span;
};

struct EnumTypeDef {
  std::vector<Ident> literals;  // Character literals keep their quotes
  SourceSpan span;
};

struct RangeTypeDef {
  Expr range;  // ExprKind::kRange
  SourceSpan span;
};

using TypeDef = std::variant<EnumTypeDef, RangeTypeDef>;

struct TypeDecl {
  Ident name;
  std::optional<TypeDef> def;  // std::nullopt for incomplete types
  SourceSpan span;
};

struct SubtypeDecl {
  Ident name;
  SubtypeIndication subtype;
  SourceSpan span;
};

enum class ObjectKind {
  kConstant,
  kSignal,
  kVariable,
  kSharedVariable,
  kFile,
};

enum class SignalKind { kNormal, kRegister, kBus };

struct FileOpenInfo {
  std::optional<Expr> open_kind;
  Expr logical_name;
};

struct ObjectDecl {
  ObjectKind kind = ObjectKind::kConstant;
  std::vector<Ident> names;
  SubtypeIndication subtype;
  std::optional<Expr> init;
  SignalKind signal_kind = SignalKind::kNormal;
  std::optional<FileOpenInfo> file_open;
  SourceSpan span;
};

struct PackageDecl;

struct PackageInstDecl {
  Ident name;
  CompoundName package;
  SourceSpan span;
};

using Declaration = std::variant<
    TypeDecl, SubtypeDecl, ObjectDecl, std::unique_ptr<PackageDecl>,
    PackageInstDecl>;

enum class Mode { kIn, kOut, kInout, kBuffer, kLinkage };

enum class InterfaceKind { kSignal, kConstant };

struct InterfaceDecl {
  InterfaceKind kind = InterfaceKind::kSignal;
  std::vector<Ident> names;
  Mode mode = Mode::kIn;
  SubtypeIndication subtype;
  bool bus = false;
  std::optional<Expr> default_value;
  SourceSpan span;
};

struct PackageDecl {
  Ident name;
  std::vector<InterfaceDecl> generics;
  std::vector<Declaration> decls;
  SourceSpan span;
};

struct EntityDecl {
  Ident name;
  std::vector<InterfaceDecl> generics;
  std::vector<InterfaceDecl> ports;
  SourceSpan span;
};

// Statements are lowered outside this core; only their position is kept.
struct ConcurrentStmt {
  std::optional<Ident> label;
  SourceSpan span;
};

struct ArchitectureBody {
  Ident name;
  Ident entity;
  std::vector<Declaration> decls;
  std::vector<ConcurrentStmt> stmts;
  SourceSpan span;
};

struct ConfigurationDecl {
  Ident name;
  Ident entity;
  SourceSpan span;
};

struct PackageBody {
  Ident name;
  std::vector<Declaration> decls;
  SourceSpan span;
};

struct LibraryClause {
  std::vector<Ident> names;
  SourceSpan span;
};

struct UseClause {
  std::vector<CompoundName> names;
  SourceSpan span;
};

struct ContextReference {
  std::vector<CompoundName> names;
  SourceSpan span;
};

using ContextItem = std::variant<LibraryClause, UseClause, ContextReference>;

struct ContextDecl {
  Ident name;
  std::vector<ContextItem> items;
  SourceSpan span;
};

using DesignUnitBody = std::variant<
    EntityDecl, ArchitectureBody, PackageDecl, PackageInstDecl, PackageBody,
    ConfigurationDecl, ContextDecl>;

struct DesignUnit {
  std::vector<ContextItem> context;
  DesignUnitBody body;
};

}  // namespace vscore::ast
