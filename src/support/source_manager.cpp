//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements SourceManager.  Paths are stored in lexically normal, generic
// form so "docs/../docs/coverage.md" and "docs/coverage.md" share an id and
// print identically.  Contents are optional: checklists parsed from memory
// never register a file at all, and a registered file without text simply
// prints without a quoted line.
//
//===----------------------------------------------------------------------===//

#include "support/source_manager.hpp"

#include "support/diag_expected.hpp"

#include <filesystem>
#include <iostream>
#include <limits>

namespace mpvbind::support
{

uint32_t SourceManager::addFile(std::string path)
{
    std::string key = std::filesystem::path(std::move(path)).lexically_normal().generic_string();

    auto found = ids_by_path_.find(key);
    if (found != ids_by_path_.end())
        return found->second;

    if (next_id_ > std::numeric_limits<uint32_t>::max())
    {
        printDiag(makeError({}, std::string(kSourceManagerFileIdOverflowMessage)), std::cerr);
        return 0;
    }

    const auto id = static_cast<uint32_t>(next_id_++);
    files_.push_back(FileEntry{key, {}});
    ids_by_path_.emplace(std::move(key), id);
    return id;
}

const SourceManager::FileEntry *SourceManager::entry(uint32_t file_id) const
{
    if (file_id == 0 || file_id > files_.size())
        return nullptr;
    return &files_[file_id - 1];
}

void SourceManager::setText(uint32_t file_id, std::string text)
{
    if (file_id == 0 || file_id > files_.size())
        return;
    files_[file_id - 1].text = std::move(text);
}

std::string_view SourceManager::getPath(uint32_t file_id) const
{
    const FileEntry *e = entry(file_id);
    return e ? std::string_view(e->path) : std::string_view();
}

std::string_view SourceManager::getText(uint32_t file_id) const
{
    const FileEntry *e = entry(file_id);
    return e ? std::string_view(e->text) : std::string_view();
}

/// @brief Locate a line by scanning for line breaks.
///
/// @details A trailing "\r" is dropped so CRLF files quote cleanly.  The line
///          after a final newline does not exist.
std::string_view SourceManager::getLine(uint32_t file_id, uint32_t line) const
{
    const std::string_view text = getText(file_id);
    if (line == 0 || text.empty())
        return {};

    std::size_t start = 0;
    for (uint32_t n = 1; n < line; ++n)
    {
        const std::size_t nl = text.find('\n', start);
        if (nl == std::string_view::npos || nl + 1 == text.size())
            return {};
        start = nl + 1;
    }

    std::size_t end = text.find('\n', start);
    if (end == std::string_view::npos)
        end = text.size();
    std::string_view out = text.substr(start, end - start);
    if (!out.empty() && out.back() == '\r')
        out.remove_suffix(1);
    return out;
}

} // namespace mpvbind::support
