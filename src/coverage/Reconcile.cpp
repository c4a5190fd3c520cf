//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements checklist/registry reconciliation.  Findings are reported in
// checklist order first (unknown and mismatched symbols), then in registry
// order (missing symbols), so diagnostics read top to bottom against the
// checklist file.
//
//===----------------------------------------------------------------------===//

#include "coverage/Reconcile.hpp"

#include "support/diag_expected.hpp"

#include <string_view>
#include <unordered_map>

namespace mpvbind::coverage
{
namespace
{

const char *statusText(bool bound)
{
    return bound ? "bound" : "unbound";
}

const char *visibilityText(bool internal)
{
    return internal ? "internal" : "public";
}

} // namespace

ReconcileReport reconcile(const Checklist &checklist,
                          const std::vector<BindingRecord> &registry,
                          const support::CoverageOptions &options,
                          support::DiagnosticEngine &de)
{
    ReconcileReport report;

    std::unordered_map<std::string_view, const BindingRecord *> byName;
    byName.reserve(registry.size());
    for (const auto &record : registry)
        byName.emplace(record.name, &record);

    for (const auto *listed : checklist.records())
    {
        auto it = byName.find(listed->name);
        if (it == byName.end())
        {
            de.report(support::makeWarning(listed->loc, "unknown symbol '" + listed->name + "'"));
            report.unknown.push_back(listed->name);
            continue;
        }

        const BindingRecord &expected = *it->second;
        if (listed->bound != expected.bound)
        {
            de.report(support::makeError(listed->loc,
                                         "status mismatch for '" + listed->name +
                                             "': checklist says " + statusText(listed->bound) +
                                             ", registry says " + statusText(expected.bound)));
            report.mismatched.push_back(listed->name);
        }
        else if (options.annotateInternal && listed->internal != expected.internal)
        {
            de.report(support::makeError(listed->loc,
                                         "status mismatch for '" + listed->name +
                                             "': checklist says " +
                                             visibilityText(listed->internal) +
                                             ", registry says " +
                                             visibilityText(expected.internal)));
            report.mismatched.push_back(listed->name);
        }
    }

    for (const auto &record : registry)
    {
        if (record.internal && !options.includeInternal)
            continue;
        if (checklist.find(record.name) == nullptr)
        {
            de.report(support::makeWarning({}, "missing symbol '" + record.name + "'"));
            report.missing.push_back(record.name);
        }
    }

    return report;
}

} // namespace mpvbind::coverage
