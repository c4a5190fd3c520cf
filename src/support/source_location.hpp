//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Position of a checklist record or error: file, line, column.
// Key invariants: file_id == 0 means no registered file; line and column are
//                 1-based with 0 meaning unknown.
// Ownership/Lifetime: Plain value type.
// Links: docs/coverage.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace mpvbind::support
{

/// @brief Position within a checklist.
/// @details Text parsed from memory has a line and column but no file id;
///          diagnostics then print "line N:" instead of a path.
struct SourceLoc
{
    uint32_t file_id = 0; ///< SourceManager id; 0 when parsed from memory
    uint32_t line = 0;
    uint32_t column = 0;

    [[nodiscard]] bool hasLine() const
    {
        return line != 0;
    }

    [[nodiscard]] bool hasColumn() const
    {
        return column != 0;
    }
};

} // namespace mpvbind::support
