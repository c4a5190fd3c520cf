//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "coverage/Summary.hpp"

namespace mpvbind::coverage
{
namespace
{

void count(CoverageCount &bucket, const BindingRecord &record)
{
    ++bucket.total;
    if (record.bound)
        ++bucket.bound;
    if (!record.internal)
    {
        ++bucket.publicTotal;
        if (record.bound)
            ++bucket.publicBound;
    }
}

} // namespace

CoverageSummary summarize(const std::vector<BindingRecord> &records)
{
    CoverageSummary summary;
    for (const auto &record : records)
    {
        count(summary.overall, record);
        if (record.group)
            count(summary.groups[apiGroupIndex(*record.group)], record);
    }
    return summary;
}

CoverageSummary summarize(const Checklist &checklist)
{
    CoverageSummary summary;
    for (const auto *record : checklist.records())
        count(summary.overall, *record);
    return summary;
}

void formatSummary(const CoverageSummary &summary, std::ostream &os)
{
    for (auto group : kApiGroups)
    {
        const auto &bucket = summary[group];
        if (bucket.total == 0)
            continue;
        os << apiGroupName(group) << ": " << bucket.bound << '/' << bucket.total << '\n';
    }
    os << "total: " << summary.overall.bound << '/' << summary.overall.total << '\n';
}

} // namespace mpvbind::coverage
