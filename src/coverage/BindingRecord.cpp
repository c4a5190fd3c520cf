//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "coverage/BindingRecord.hpp"

namespace mpvbind::coverage
{

/// @brief Linear scan over all groups.
///
/// @details Checklists hold a few dozen records; the parser enforces name
///          uniqueness so the first match is the only match.
const BindingRecord *Checklist::find(std::string_view name) const
{
    for (const auto &group : groups)
    {
        for (const auto &record : group.records)
        {
            if (record.name == name)
                return &record;
        }
    }
    return nullptr;
}

std::size_t Checklist::recordCount() const
{
    std::size_t count = 0;
    for (const auto &group : groups)
        count += group.records.size();
    return count;
}

std::vector<const BindingRecord *> Checklist::records() const
{
    std::vector<const BindingRecord *> out;
    out.reserve(recordCount());
    for (const auto &group : groups)
    {
        for (const auto &record : group.records)
            out.push_back(&record);
    }
    return out;
}

} // namespace mpvbind::coverage
