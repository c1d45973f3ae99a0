#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vscore {

struct FileId {
  uint32_t value = 0;

  explicit operator bool() const {
    return value != 0;
  }
  auto operator==(const FileId&) const -> bool = default;
};

inline constexpr FileId kInvalidFileId{};

// One-based line and byte column.
struct SourcePosition {
  uint32_t line = 1;
  uint32_t column = 1;

  auto operator==(const SourcePosition&) const -> bool = default;
};

struct FileInfo {
  std::string path;
  std::string content;
  // Offset of the first byte of every line. Always starts with 0.
  std::vector<uint32_t> line_starts;
};

// Owns the text of every design file seen in a session. Spans refer to files
// by FileId only.
class SourceManager {
 public:
  auto AddFile(std::string path, std::string content) -> FileId;

  [[nodiscard]] auto GetFile(FileId id) const -> const FileInfo*;

  // Offsets past the end of the file map to the end of the file.
  [[nodiscard]] auto Position(FileId id, uint32_t offset) const
      -> std::optional<SourcePosition>;

  // Text of a one-based line without its terminator. CRLF line endings,
  // common in VHDL sources written on Windows, lose the CR as well.
  [[nodiscard]] auto LineText(FileId id, uint32_t line) const
      -> std::optional<std::string_view>;

 private:
  std::vector<FileInfo> files_;
};

}  // namespace vscore
