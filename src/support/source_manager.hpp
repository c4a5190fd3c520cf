//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Registry of loaded checklist files: path and, once read, contents.
// Key invariants: File id 0 is never assigned; an id stays valid for the
//                 manager's lifetime.
// Ownership/Lifetime: The manager owns every path and buffer it hands out
//                     views of.
// Links: docs/coverage.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace mpvbind::support
{

inline constexpr std::string_view kSourceManagerFileIdOverflowMessage =
    "source manager exhausted file identifier space";

struct SourceManagerTestAccess;

/// Maps file ids to checklist files.  A file is registered by path; its text
/// can be attached afterwards so diagnostics can quote the offending line.
class SourceManager
{
  public:
    /// @brief Register @p path, normalized, and return its id.
    /// @return Existing id when the path was registered before; 0 when the id
    ///         space is exhausted (an error is printed to std::cerr).
    uint32_t addFile(std::string path);

    /// @brief Attach the contents of file @p file_id; ignored for unknown ids.
    void setText(uint32_t file_id, std::string text);

    /// @brief Normalized path of @p file_id, or empty for unknown ids.
    std::string_view getPath(uint32_t file_id) const;

    /// @brief Attached contents of @p file_id, or empty when none.
    std::string_view getText(uint32_t file_id) const;

    /// @brief Text of 1-based @p line in @p file_id without its line break.
    /// @return Empty when the file has no text or the line does not exist.
    std::string_view getLine(uint32_t file_id, uint32_t line) const;

  private:
    struct FileEntry
    {
        std::string path;
        std::string text;
    };

    const FileEntry *entry(uint32_t file_id) const;

    /// Entry for id N lives at index N - 1; deque keeps views stable.
    std::deque<FileEntry> files_;

    /// 64-bit so the step past UINT32_MAX is observable.
    uint64_t next_id_ = 1;

    std::unordered_map<std::string, uint32_t> ids_by_path_;

    friend struct SourceManagerTestAccess;
};

} // namespace mpvbind::support
