//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Diagnostic construction and printing.  Checklist parsing and the libmpv
// client wrapper both return Expected values; every failure goes through
// printDiag so the tools and tests see one format.
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"

#include <string_view>

namespace mpvbind::support
{
namespace
{

/// @brief Write the location prefix; returns the registered path, if any.
std::string_view printLocation(const SourceLoc &loc, std::ostream &os, const SourceManager *sm)
{
    const std::string_view path = sm ? sm->getPath(loc.file_id) : std::string_view();
    if (!path.empty())
    {
        os << path;
        if (loc.hasLine())
        {
            os << ':' << loc.line;
            if (loc.hasColumn())
                os << ':' << loc.column;
        }
        os << ": ";
    }
    else if (loc.hasLine())
    {
        os << "line " << loc.line << ": ";
    }
    return path;
}

void printExcerpt(const SourceLoc &loc, std::ostream &os, const SourceManager &sm)
{
    const std::string_view text = sm.getLine(loc.file_id, loc.line);
    if (text.empty())
        return;
    os << "  " << text << '\n';
    if (loc.hasColumn())
        os << "  " << std::string(loc.column - 1, ' ') << "^\n";
}

} // namespace

Diag makeError(SourceLoc loc, std::string msg, int code)
{
    return Diag{Severity::Error, std::move(msg), loc, code};
}

Diag makeWarning(SourceLoc loc, std::string msg)
{
    return Diag{Severity::Warning, std::move(msg), loc, 0};
}

void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm)
{
    const std::string_view path = printLocation(diag.loc, os, sm);
    os << severityName(diag.severity) << ": " << diag.message;
    if (diag.code != 0)
        os << " [" << diag.code << ']';
    os << '\n';
    if (!path.empty())
        printExcerpt(diag.loc, os, *sm);
}

} // namespace mpvbind::support
