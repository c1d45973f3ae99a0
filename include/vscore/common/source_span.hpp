#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>

#include "vscore/common/source_manager.hpp"

namespace vscore {

struct SourceSpan {
  FileId file_id;
  uint32_t begin = 0;
  uint32_t end = 0;

  auto operator==(const SourceSpan&) const -> bool = default;

  // Zero-width span at the end of this one.
  [[nodiscard]] auto EndPoint() const -> SourceSpan {
    return SourceSpan{.file_id = file_id, .begin = end, .end = end};
  }
};

// Smallest span covering both arguments. Both must lie in the same file.
inline auto Union(const SourceSpan& a, const SourceSpan& b) -> SourceSpan {
  return SourceSpan{
      .file_id = a.file_id,
      .begin = std::min(a.begin, b.begin),
      .end = std::max(a.end, b.end)};
}

// A value tagged with the source range it was written at.
template <typename T>
struct Spanned {
  T value;
  SourceSpan span;

  auto operator==(const Spanned&) const -> bool = default;
};

// "file:line:col" of the start of the span, or nullopt when the span names
// no file the manager knows.
auto FormatSourceLocation(const SourceSpan& span, const SourceManager& mgr)
    -> std::optional<std::string>;

}  // namespace vscore
