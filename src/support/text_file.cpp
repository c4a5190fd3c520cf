//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File loading shared by checklist consumers.  The file is read in full before
// it is registered so a failed read never allocates a file identifier.  The
// SourceManager keeps a copy of the text for quoting lines in diagnostics.
//
//===----------------------------------------------------------------------===//

#include "support/text_file.hpp"

#include "support/source_manager.hpp"

#include <fstream>
#include <sstream>

namespace mpvbind::support
{

Expected<uint32_t> loadTextFile(const std::string &path, std::string &buffer, SourceManager &sm)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return makeError({}, "cannot open " + path);

    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad())
        return makeError({}, "cannot read " + path);

    const uint32_t fileId = sm.addFile(path);
    if (fileId == 0)
        return makeError({}, "cannot register " + path);

    buffer = ss.str();
    sm.setText(fileId, buffer);
    return fileId;
}

} // namespace mpvbind::support
