//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements DiagnosticEngine.  Reconciliation and the registry self-check
// report every issue they find rather than stopping at the first, so they
// collect into an engine that callers print once at the end.
//
//===----------------------------------------------------------------------===//

#include "support/diagnostics.hpp"

#include "support/diag_expected.hpp"

namespace mpvbind::support
{

std::string_view severityName(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "unknown";
}

void DiagnosticEngine::report(Diagnostic d)
{
    ++counts_[static_cast<size_t>(d.severity)];
    diags_.push_back(std::move(d));
}

void DiagnosticEngine::printAll(std::ostream &os, const SourceManager *sm) const
{
    for (const auto &d : diags_)
        printDiag(d, os, sm);
}

} // namespace mpvbind::support
