#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "vscore/common/source_span.hpp"
#include "vscore/hir/fwd.hpp"
#include "vscore/hir/refs.hpp"

namespace vscore::hir {

struct ArrayConstraint;
struct RecordConstraint;

using ElementConstraint = std::variant<ArrayConstraint, RecordConstraint>;

// IEEE 1076-2008 5.3.2.2
struct ArrayConstraint {
  SourceSpan span;
  // Index ranges or subtype expressions; std::nullopt is `(open)`.
  std::optional<std::vector<ExprId>> index;
  std::unique_ptr<Spanned<ElementConstraint>> element;
};

// IEEE 1076-2008 5.3.3
struct RecordConstraint {
  SourceSpan span;
  // Declaration order is kept.
  std::vector<std::pair<Spanned<std::string>, ElementConstraint>> elements;
};

struct NoConstraint {};

struct RangeConstraint {
  SourceSpan span;
  ExprId range;
};

using Constraint = std::variant<
    NoConstraint, RangeConstraint, ArrayConstraint, RecordConstraint>;

struct SubtypeInd {
  SourceSpan span;
  Spanned<TypeMarkRef> type_mark;
  Constraint constraint;
};

}  // namespace vscore::hir
