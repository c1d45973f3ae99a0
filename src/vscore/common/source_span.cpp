#include "vscore/common/source_span.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <utility>

#include "vscore/common/source_manager.hpp"

namespace vscore {

auto SourceManager::AddFile(std::string path, std::string content) -> FileId {
  FileInfo file{.path = std::move(path), .content = std::move(content)};
  file.line_starts.push_back(0);
  for (uint32_t i = 0; i < file.content.size(); ++i) {
    if (file.content[i] == '\n') {
      file.line_starts.push_back(i + 1);
    }
  }
  files_.push_back(std::move(file));
  return FileId{.value = static_cast<uint32_t>(files_.size())};
}

auto SourceManager::GetFile(FileId id) const -> const FileInfo* {
  if (!id || id.value > files_.size()) {
    return nullptr;
  }
  return &files_[id.value - 1];
}

auto SourceManager::Position(FileId id, uint32_t offset) const
    -> std::optional<SourcePosition> {
  const FileInfo* file = GetFile(id);
  if (file == nullptr) {
    return std::nullopt;
  }
  offset = std::min(offset, static_cast<uint32_t>(file->content.size()));
  auto next = std::ranges::upper_bound(file->line_starts, offset);
  auto line = static_cast<uint32_t>(
      std::distance(file->line_starts.begin(), next));
  return SourcePosition{.line = line, .column = offset - *std::prev(next) + 1};
}

auto SourceManager::LineText(FileId id, uint32_t line) const
    -> std::optional<std::string_view> {
  const FileInfo* file = GetFile(id);
  if (file == nullptr || line == 0 || line > file->line_starts.size()) {
    return std::nullopt;
  }
  std::string_view content = file->content;
  uint32_t begin = file->line_starts[line - 1];
  uint32_t end = line < file->line_starts.size()
                     ? file->line_starts[line] - 1
                     : static_cast<uint32_t>(content.size());
  std::string_view text = content.substr(begin, end - begin);
  if (text.ends_with('\r')) {
    text.remove_suffix(1);
  }
  return text;
}

auto FormatSourceLocation(const SourceSpan& span, const SourceManager& mgr)
    -> std::optional<std::string> {
  auto pos = mgr.Position(span.file_id, span.begin);
  if (!pos) {
    return std::nullopt;
  }
  return std::format(
      "{}:{}:{}", mgr.GetFile(span.file_id)->path, pos->line, pos->column);
}

}  // namespace vscore
