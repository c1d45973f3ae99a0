#pragma once

#include <cstddef>
#include <string>
#include <variant>

#include "vscore/ast/ast.hpp"
#include "vscore/common/name.hpp"
#include "vscore/common/source_span.hpp"

namespace vscore::score {

inline auto SpannedName(const ast::Ident& ident) -> Spanned<std::string> {
  return {.value = CanonicalName(ident.name), .span = ident.span};
}

inline auto UnitName(const ast::DesignUnit& unit) -> const ast::Ident& {
  return std::visit(
      [](const auto& body) -> const ast::Ident& { return body.name; },
      unit.body);
}

// Source-like rendering of the primary name and the first `parts` parts,
// e.g. "work.pkg" or "integer'high".
inline auto RenderPrefix(const ast::CompoundName& name, size_t parts)
    -> std::string {
  std::string text = name.primary.name;
  for (size_t i = 0; i < parts && i < name.parts.size(); ++i) {
    const ast::NamePart& part = name.parts[i];
    switch (part.kind) {
      case ast::NamePartKind::kSelect:
        text += "." + part.ident.name;
        break;
      case ast::NamePartKind::kSelectAll:
        text += ".all";
        break;
      case ast::NamePartKind::kAttribute:
        text += "'" + part.ident.name;
        break;
      case ast::NamePartKind::kCall:
        text += "(...)";
        break;
    }
  }
  return text;
}

// From the end of the valid prefix to the end of the whole name.
inline auto SuffixSpan(const SourceSpan& valid, const ast::CompoundName& name)
    -> SourceSpan {
  return SourceSpan{
      .file_id = name.span.file_id, .begin = valid.end, .end = name.span.end};
}

}  // namespace vscore::score
