#include "vscore/common/diagnostic/print.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <fmt/color.h>
#include <fmt/core.h>

#include "vscore/common/overloaded.hpp"
#include "vscore/common/source_span.hpp"

namespace vscore {

namespace {

// Stands in for the location of items that have none.
constexpr std::string_view kToolName = "vscore";

constexpr auto kToolStyle =
    fmt::fg(fmt::terminal_color::white) | fmt::emphasis::bold;

auto DiagKindToString(DiagKind kind) -> const char* {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kHostError:
      return "error:";
    case DiagKind::kUnsupported:
      return "unsupported:";
    case DiagKind::kWarning:
      return "warning:";
    case DiagKind::kNote:
      return "note:";
  }
  return "error:";
}

auto DiagKindToStyle(DiagKind kind) -> fmt::text_style {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kUnsupported:
    case DiagKind::kHostError:
      return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
    case DiagKind::kWarning:
      return fmt::fg(fmt::terminal_color::bright_magenta) | fmt::emphasis::bold;
    case DiagKind::kNote:
      return fmt::fg(fmt::terminal_color::bright_cyan) | fmt::emphasis::bold;
  }
  return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
}

auto ItemLocation(const DiagItem& item, const SourceManager* source_manager)
    -> std::string {
  std::optional<std::string> location;
  std::visit(
      Overloaded{
          [&](const SourceSpan& span) {
            if (source_manager != nullptr) {
              location = FormatSourceLocation(span, *source_manager);
            }
          },
          [](UnknownSpan) {},
      },
      item.span);
  return location.value_or(std::string(kToolName));
}

auto Styled(const std::string& text, fmt::text_style style, bool colors)
    -> std::string {
  if (!colors) {
    return text;
  }
  return fmt::format("{}", fmt::styled(text, style));
}

// The source line holding the span and a caret marker under it.
void PrintExcerpt(
    const SourceSpan& span, const SourceManager& source_manager, bool colors) {
  auto begin = source_manager.Position(span.file_id, span.begin);
  if (!begin) {
    return;
  }
  std::string_view line = *source_manager.LineText(span.file_id, begin->line);
  uint32_t column = begin->column - 1;
  if (column > line.size()) {
    return;
  }

  std::string num_field = fmt::format("{:>4}", begin->line);
  std::string blank_field(num_field.size(), ' ');
  constexpr auto kGutterStyle = fmt::fg(fmt::terminal_color::white);

  fmt::print(
      stderr, " {} {}\n", Styled(num_field + " |", kGutterStyle, colors), line);

  // The marker stops at the end of the line for spans crossing lines.
  auto line_end = static_cast<uint32_t>(line.size());
  uint32_t span_end =
      std::min(column + std::max<uint32_t>(span.end - span.begin, 1), line_end);
  uint32_t span_width = std::max<uint32_t>(span_end - column, 1);
  std::string marker = "^" + std::string(span_width - 1, '~');

  fmt::print(
      stderr, " {} {}{}\n", Styled(blank_field + " |", kGutterStyle, colors),
      std::string(column, ' '),
      Styled(marker, fmt::fg(fmt::terminal_color::green), colors));
}

void PrintDiagItem(
    const DiagItem& item, const SourceManager* source_manager, bool is_primary,
    bool colors) {
  std::string location = ItemLocation(item, source_manager);
  fmt::print(
      stderr, "{}: {} {}\n",
      Styled(
          location,
          location == kToolName ? kToolStyle
                               : fmt::text_style(fmt::emphasis::bold),
          colors),
      Styled(DiagKindToString(item.kind), DiagKindToStyle(item.kind), colors),
      Styled(
          item.message, is_primary ? fmt::emphasis::bold : fmt::text_style{},
          colors));

  const auto* span = std::get_if<SourceSpan>(&item.span);
  if (is_primary && span != nullptr && source_manager != nullptr &&
      span->file_id) {
    PrintExcerpt(*span, *source_manager, colors);
  }
}

}  // namespace

auto FormatDiagnostic(const Diagnostic& diag, const SourceManager* source_manager)
    -> std::string {
  auto render = [&](const DiagItem& item) {
    return fmt::format(
        "{}: {} {}\n", ItemLocation(item, source_manager),
        DiagKindToString(item.kind), item.message);
  };
  std::string text = render(diag.primary);
  for (const DiagItem& note : diag.notes) {
    text += render(note);
  }
  return text;
}

void PrintDiagnostics(
    const DiagnosticSink& sink, const SourceManager* source_manager,
    bool colors) {
  uint32_t error_count = 0;
  uint32_t warning_count = 0;

  for (const Diagnostic& diag : sink.GetDiagnostics()) {
    switch (diag.primary.kind) {
      case DiagKind::kError:
      case DiagKind::kUnsupported:
      case DiagKind::kHostError:
        ++error_count;
        break;
      case DiagKind::kWarning:
        ++warning_count;
        break;
      case DiagKind::kNote:
        break;
    }

    PrintDiagItem(diag.primary, source_manager, true, colors);
    for (const DiagItem& note : diag.notes) {
      PrintDiagItem(note, source_manager, false, colors);
    }
  }

  if (warning_count > 0 || error_count > 0) {
    std::string summary;
    if (warning_count > 0) {
      summary += fmt::format(
          "{} warning{}", warning_count, warning_count == 1 ? "" : "s");
    }
    if (warning_count > 0 && error_count > 0) {
      summary += " and ";
    }
    if (error_count > 0) {
      summary +=
          fmt::format("{} error{}", error_count, error_count == 1 ? "" : "s");
    }
    fmt::print(stderr, "{} generated.\n", summary);
  }
}

}  // namespace vscore
