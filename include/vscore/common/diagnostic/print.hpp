#pragma once

#include <string>

#include "vscore/common/diagnostic/diagnostic.hpp"
#include "vscore/common/diagnostic/diagnostic_sink.hpp"
#include "vscore/common/source_manager.hpp"

namespace vscore {

// Uncolored rendering of one diagnostic, one line per item:
//   "file:line:col: error: message" or "vscore: error: message".
// source_manager may be null.
auto FormatDiagnostic(const Diagnostic& diag, const SourceManager* source_manager)
    -> std::string;

// Writes every diagnostic of the sink to stderr with source excerpts,
// followed by an "N errors generated." summary.
void PrintDiagnostics(
    const DiagnosticSink& sink, const SourceManager* source_manager,
    bool colors = true);

}  // namespace vscore
