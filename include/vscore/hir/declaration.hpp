#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "vscore/common/source_span.hpp"
#include "vscore/hir/fwd.hpp"
#include "vscore/hir/operator.hpp"
#include "vscore/hir/refs.hpp"

namespace vscore::hir {

enum class Mode { kIn, kOut, kInout, kBuffer, kLinkage };

auto ToString(Mode mode) -> const char*;

// A port of an entity.
struct InterfaceSignal {
  Spanned<std::string> name;
  Mode mode = Mode::kIn;
  SubtypeIndId subtype;
  // Declared with the `bus` keyword
  bool bus = false;
  std::optional<ExprId> init;
};

// A generic constant of an entity or package.
struct Generic {
  Spanned<std::string> name;
  SubtypeIndId subtype;
  std::optional<ExprId> default_value;
};

// An integer, floating or physical type.
struct RangeTypeData {
  SourceSpan span;
  Direction dir;
  ExprId left;
  ExprId right;
};

struct EnumTypeData {
  SourceSpan span;
  // Identifiers are canonical; character literals keep their quotes.
  std::vector<Spanned<std::string>> literals;
};

using TypeData = std::variant<RangeTypeData, EnumTypeData>;

struct TypeDecl {
  ScopeRef parent;
  Spanned<std::string> name;
  // Absent for incomplete type declarations
  std::optional<TypeData> data;
};

// IEEE 1076-2008 6.3
struct SubtypeDecl {
  ScopeRef parent;
  Spanned<std::string> name;
  SubtypeIndId subtype;
};

struct ConstDecl {
  ScopeRef parent;
  Spanned<std::string> name;
  SubtypeIndId subtype;
  // Absent for deferred constants
  std::optional<ExprId> init;
};

enum class SignalKind { kNormal, kRegister, kBus };

struct SignalDecl {
  ScopeRef parent;
  Spanned<std::string> name;
  SubtypeIndId subtype;
  SignalKind kind = SignalKind::kNormal;
  std::optional<ExprId> init;
};

struct VariableDecl {
  ScopeRef parent;
  bool shared = false;
  Spanned<std::string> name;
  SubtypeIndId subtype;
  std::optional<ExprId> init;
};

struct FileOpen {
  // Evaluates to a string holding the file name
  ExprId logical_name;
  // Evaluates to a FILE_OPEN_KIND
  std::optional<ExprId> open_kind;
};

struct FileDecl {
  ScopeRef parent;
  Spanned<std::string> name;
  SubtypeIndId subtype;
  std::optional<FileOpen> open;
};

}  // namespace vscore::hir
