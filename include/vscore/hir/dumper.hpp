#pragma once

#include <optional>
#include <ostream>
#include <string>

#include "vscore/hir/fwd.hpp"
#include "vscore/hir/refs.hpp"
#include "vscore/hir/subtype.hpp"
#include "vscore/score/scoreboard.hpp"

namespace vscore::hir {

// Renders HIR as indented text. Nodes are fetched through the scoreboard,
// so dumping builds whatever was not built yet; a node that fails to build
// prints as "<error>".
class Dumper {
 public:
  Dumper(score::Scoreboard* scoreboard, std::ostream* out);

  void Dump(LibraryId id);
  void Dump(EntityId id);
  void Dump(ArchitectureId id);
  void Dump(PackageId id);
  void Dump(const DeclRef& decl);
  void Dump(ExprId id);

  [[nodiscard]] auto ExprString(ExprId id) const -> std::string;
  [[nodiscard]] auto SubtypeString(SubtypeIndId id) const -> std::string;

 private:
  void PrintIndent();
  void Indent();
  void Dedent();

  void DumpUnit(const char* keyword, const std::string& name);

  [[nodiscard]] auto DefName(const Def& def) const -> std::string;
  [[nodiscard]] auto ConstraintString(const Constraint& constraint) const
      -> std::string;
  [[nodiscard]] auto ElementString(const ElementConstraint& constraint) const
      -> std::string;
  [[nodiscard]] auto ArrayString(const ArrayConstraint& c) const -> std::string;
  [[nodiscard]] auto RecordString(const RecordConstraint& c) const
      -> std::string;
  [[nodiscard]] auto InitString(const std::optional<ExprId>& init) const
      -> std::string;

  score::Scoreboard* scoreboard_;
  std::ostream* out_;
  int indent_ = 0;
};

}  // namespace vscore::hir
