#pragma once

#include <cstdint>
#include <format>
#include <utility>

#include "vscore/common/internal_error.hpp"

namespace vscore::hir {

enum class NodeKind : uint8_t {
  kLibrary,
  kContextItems,
  kEntity,
  kArchitecture,
  kConfiguration,
  kPackage,
  kPackageInstance,
  kPackageBody,
  kContext,
  kGeneric,
  kInterfaceSignal,
  kTypeDecl,
  kSubtypeDecl,
  kConstDecl,
  kSignalDecl,
  kVariableDecl,
  kFileDecl,
  kConcurrentStmt,
  kSubtypeInd,
  kExpr,
};

auto ToString(NodeKind kind) -> const char*;

// Handle to a node of kind K. Copyable, comparable and hashable; carries no
// ownership. The node itself lives in the arena for K for the whole session.
template <NodeKind K>
struct NodeId {
  static constexpr NodeKind kKind = K;

  uint32_t value = 0;

  auto operator==(const NodeId&) const -> bool = default;
  auto operator<=>(const NodeId&) const = default;

  template <typename H>
  friend auto AbslHashValue(H h, NodeId id) -> H {
    return H::combine(std::move(h), id.value);
  }
};

using LibraryId = NodeId<NodeKind::kLibrary>;
using ContextItemsId = NodeId<NodeKind::kContextItems>;
using EntityId = NodeId<NodeKind::kEntity>;
using ArchitectureId = NodeId<NodeKind::kArchitecture>;
using ConfigurationId = NodeId<NodeKind::kConfiguration>;
using PackageId = NodeId<NodeKind::kPackage>;
using PackageInstanceId = NodeId<NodeKind::kPackageInstance>;
using PackageBodyId = NodeId<NodeKind::kPackageBody>;
using ContextId = NodeId<NodeKind::kContext>;
using GenericId = NodeId<NodeKind::kGeneric>;
using InterfaceSignalId = NodeId<NodeKind::kInterfaceSignal>;
using TypeDeclId = NodeId<NodeKind::kTypeDecl>;
using SubtypeDeclId = NodeId<NodeKind::kSubtypeDecl>;
using ConstDeclId = NodeId<NodeKind::kConstDecl>;
using SignalDeclId = NodeId<NodeKind::kSignalDecl>;
using VariableDeclId = NodeId<NodeKind::kVariableDecl>;
using FileDeclId = NodeId<NodeKind::kFileDecl>;
using ConcurrentStmtId = NodeId<NodeKind::kConcurrentStmt>;
using SubtypeIndId = NodeId<NodeKind::kSubtypeInd>;
using ExprId = NodeId<NodeKind::kExpr>;

// Kind-erased identifier. Converting back with As<K>() checks the tag.
struct AnyId {
  NodeKind kind = NodeKind::kLibrary;
  uint32_t value = 0;

  template <NodeKind K>
  static auto From(NodeId<K> id) -> AnyId {
    return AnyId{.kind = K, .value = id.value};
  }

  template <NodeKind K>
  [[nodiscard]] auto As() const -> NodeId<K> {
    if (kind != K) {
      common::ThrowInternalError(
          "AnyId::As",
          std::format(
              "identifier {}#{} used as {}", ToString(kind), value,
              ToString(K)));
    }
    return NodeId<K>{.value = value};
  }

  auto operator==(const AnyId&) const -> bool = default;

  template <typename H>
  friend auto AbslHashValue(H h, const AnyId& id) -> H {
    return H::combine(std::move(h), id.kind, id.value);
  }
};

struct Library;
struct Entity;
struct Architecture;
struct Configuration;
struct Package;
struct PackageInstance;
struct PackageBody;
struct Context;
struct Generic;
struct InterfaceSignal;
struct TypeDecl;
struct SubtypeDecl;
struct ConstDecl;
struct SignalDecl;
struct VariableDecl;
struct FileDecl;
struct SubtypeInd;
struct Expr;

}  // namespace vscore::hir
