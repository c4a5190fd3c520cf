//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: coverage/Summary.hpp
// Purpose: Count bound versus tracked symbols per API group.
// Key invariants: bound <= total in every bucket; overall equals the sum of
//                 grouped and ungrouped records.
// Ownership/Lifetime: Plain value types.
// Links: docs/coverage.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "coverage/ApiGroup.hpp"
#include "coverage/BindingRecord.hpp"

#include <array>
#include <cstddef>
#include <ostream>
#include <vector>

namespace mpvbind::coverage
{

/// @brief Bound/total counters for one bucket.
struct CoverageCount
{
    std::size_t bound = 0;
    std::size_t total = 0;
    std::size_t publicBound = 0; ///< Bound records not flagged internal
    std::size_t publicTotal = 0; ///< Records not flagged internal
};

/// @brief Per-group and overall coverage counts.
struct CoverageSummary
{
    std::array<CoverageCount, kApiGroupCount> groups{};
    CoverageCount overall{};

    const CoverageCount &operator[](ApiGroup group) const
    {
        return groups[apiGroupIndex(group)];
    }
};

/// @brief Count @p records; records without a group only count overall.
CoverageSummary summarize(const std::vector<BindingRecord> &records);

/// @brief Count every record of @p checklist (overall only).
CoverageSummary summarize(const Checklist &checklist);

/// @brief Print "group: bound/total" for each non-empty group, then
///        "total: bound/total".
void formatSummary(const CoverageSummary &summary, std::ostream &os);

} // namespace mpvbind::coverage
