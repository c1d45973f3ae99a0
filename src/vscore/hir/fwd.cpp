#include "vscore/hir/fwd.hpp"

namespace vscore::hir {

auto ToString(NodeKind kind) -> const char* {
  switch (kind) {
    case NodeKind::kLibrary:
      return "library";
    case NodeKind::kContextItems:
      return "context_items";
    case NodeKind::kEntity:
      return "entity";
    case NodeKind::kArchitecture:
      return "architecture";
    case NodeKind::kConfiguration:
      return "configuration";
    case NodeKind::kPackage:
      return "package";
    case NodeKind::kPackageInstance:
      return "package_instance";
    case NodeKind::kPackageBody:
      return "package_body";
    case NodeKind::kContext:
      return "context";
    case NodeKind::kGeneric:
      return "generic";
    case NodeKind::kInterfaceSignal:
      return "interface_signal";
    case NodeKind::kTypeDecl:
      return "type_decl";
    case NodeKind::kSubtypeDecl:
      return "subtype_decl";
    case NodeKind::kConstDecl:
      return "const_decl";
    case NodeKind::kSignalDecl:
      return "signal_decl";
    case NodeKind::kVariableDecl:
      return "variable_decl";
    case NodeKind::kFileDecl:
      return "file_decl";
    case NodeKind::kConcurrentStmt:
      return "concurrent_stmt";
    case NodeKind::kSubtypeInd:
      return "subtype_ind";
    case NodeKind::kExpr:
      return "expr";
  }
  return "unknown";
}

}  // namespace vscore::hir
