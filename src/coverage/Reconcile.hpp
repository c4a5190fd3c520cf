//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: coverage/Reconcile.hpp
// Purpose: Compare a parsed checklist against the binding registry.
// Key invariants: Every checklist and registry symbol lands in at most one
//                 report category.
// Ownership/Lifetime: Report owns copies of the symbol names it lists.
// Links: docs/coverage.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "coverage/BindingRecord.hpp"
#include "support/diagnostics.hpp"
#include "support/options.hpp"

#include <string>
#include <vector>

namespace mpvbind::coverage
{

/// @brief Outcome of reconciling a checklist with the registry.
struct ReconcileReport
{
    /// @brief Listed in the checklist but not tracked by the registry.
    std::vector<std::string> unknown;

    /// @brief Tracked by the registry but absent from the checklist.
    std::vector<std::string> missing;

    /// @brief Present in both with differing bound or internal flags.
    std::vector<std::string> mismatched;

    /// @brief True when no status mismatch was found.
    [[nodiscard]] bool ok() const
    {
        return mismatched.empty();
    }
};

/// @brief Compare @p checklist against @p registry.
/// @details Unknown and missing symbols are reported as warnings, status
///          mismatches as errors.  Internal registry records are only
///          required in the checklist when @c options.includeInternal is set.
/// @param checklist Parsed checklist; diagnostics point at its record locations.
/// @param registry Registry records, usually bindingRegistry().
/// @param options Rendering options the checklist is expected to follow.
/// @param de Engine receiving one diagnostic per finding.
ReconcileReport reconcile(const Checklist &checklist,
                          const std::vector<BindingRecord> &registry,
                          const support::CoverageOptions &options,
                          support::DiagnosticEngine &de);

} // namespace mpvbind::coverage
