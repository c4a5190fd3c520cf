//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the checklist parser, which reads the markdown binding
// checklist back into a Checklist document. The parser is the inverse of the
// ChecklistWriter: a canonical document parses and re-renders byte for byte.
//
// Document grammar:
//   document := blank* heading (blank+ group)* blank*
//   heading  := "# " title
//   group    := record (newline record)*
//   record   := "- [" ("X" | " ") "] `" name "`" [" (" annotation ")"]
//
// Trailing whitespace (including '\r') is ignored on every line. The
// annotation "not public, internal use only" marks the record internal; any
// other annotation is preserved verbatim.
//
// Error Handling:
// Parsing stops at the first malformed line or duplicate symbol and returns
// a single error diagnostic whose location points at the offending column.
//
//===----------------------------------------------------------------------===//
#pragma once

#include "coverage/BindingRecord.hpp"
#include "support/diag_expected.hpp"
#include "support/source_location.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace mpvbind::support
{
class SourceManager;
}

namespace mpvbind::coverage
{

/// @brief Parse a single record line.
/// @param line Line text without the terminating newline.
/// @param loc Location of the line's first character; column is ignored.
/// @return Parsed record, or a "malformed checklist line" diagnostic.
[[nodiscard]] support::Expected<BindingRecord> parseChecklistLine(std::string_view line,
                                                                  support::SourceLoc loc = {});

/// @brief Parse a complete checklist document.
/// @param text Document text.
/// @param fileId SourceManager identifier attached to diagnostics; 0 for
///        in-memory text.
/// @return Parsed checklist or the first diagnostic encountered.
[[nodiscard]] support::Expected<Checklist> parseChecklist(std::string_view text,
                                                          uint32_t fileId = 0);

/// @brief Load and parse the checklist stored at @p path.
/// @details The path is registered with @p sm so diagnostics print with the
///          file name.
[[nodiscard]] support::Expected<Checklist> loadChecklistFile(const std::string &path,
                                                             support::SourceManager &sm);

} // namespace mpvbind::coverage
