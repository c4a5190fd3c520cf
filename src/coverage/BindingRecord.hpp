//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: coverage/BindingRecord.hpp
// Purpose: Declares the binding record and the parsed checklist document.
// Key invariants: Symbol names are unique within a registry and within a
//                 checklist.
// Ownership/Lifetime: Records and checklists own their strings.
// Links: docs/coverage.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "coverage/ApiGroup.hpp"
#include "support/source_location.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mpvbind::coverage
{

/// @brief Binding status of one native entry point.
struct BindingRecord
{
    /// @brief Exported C symbol, e.g. "mpv_create".
    std::string name;

    /// @brief The wrapper exposes this entry point ("[X]").
    bool bound = false;

    /// @brief Bound for internal use only and not part of the public surface.
    bool internal = false;

    /// @brief Parenthetical annotation text without the parentheses; empty
    ///        when the line carries none.
    std::string annotation;

    /// @brief API section for registry records; unset for parsed records,
    ///        whose groups are unlabeled.
    std::optional<ApiGroup> group;

    /// @brief Location of the symbol name for parsed records.
    support::SourceLoc loc;
};

/// @brief Blank-line separated run of records.
struct ChecklistGroup
{
    std::vector<BindingRecord> records;
};

/// @brief Parsed or generated checklist document.
struct Checklist
{
    /// @brief Heading text without the leading "# ".
    std::string title;

    /// @brief Record groups in document order; never contains an empty group.
    std::vector<ChecklistGroup> groups;

    /// @brief Locate a record by symbol name.
    /// @return Pointer into @ref groups, or nullptr when absent.
    const BindingRecord *find(std::string_view name) const;

    /// @brief Total number of records across all groups.
    std::size_t recordCount() const;

    /// @brief Flattened view of every record in document order.
    std::vector<const BindingRecord *> records() const;
};

} // namespace mpvbind::coverage
