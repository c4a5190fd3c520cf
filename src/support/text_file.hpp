//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/text_file.hpp
// Purpose: Load a text file and register it with the SourceManager.
// Key invariants: Buffer is left untouched on failure.
// Ownership/Lifetime: Callers retain ownership of buffers and SourceManager instances.
// Links: docs/coverage.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <cstdint>
#include <string>

namespace mpvbind::support
{

class SourceManager;

/// @brief Read @p path into @p buffer, register it with @p sm and attach a
///        copy of the text there for diagnostic excerpts.
///
/// @param path Path to the file to load.
/// @param buffer Destination for the file contents; unchanged on failure.
/// @param sm Source manager responsible for tracking file identifiers.
///
/// @return The assigned file identifier on success; a diagnostic when the file
///         cannot be opened or registered.
Expected<uint32_t> loadTextFile(const std::string &path, std::string &buffer, SourceManager &sm);

} // namespace mpvbind::support
