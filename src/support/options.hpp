//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/options.hpp
// Purpose: Declares settings that shape checklist rendering and reconciliation.
// Key invariants: None.
// Ownership/Lifetime: Caller owns option values.
// Links: docs/coverage.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>

namespace mpvbind::support
{

/// @brief Annotation that marks a bound symbol as internal-only.
inline constexpr const char *kInternalAnnotation = "not public, internal use only";

/// @brief Settings consumed by the checklist writer and reconciliation.
/// @invariant Flags are independent booleans.
/// @ownership Value type.
struct CoverageOptions
{
    /// @brief Text of the top-level heading, without the leading "# ".
    std::string title = "libmpv binding coverage";

    /// @brief Render and reconcile records flagged as internal.
    bool includeInternal = true;

    /// @brief Append the internal-use annotation to internal records.
    bool annotateInternal = true;
};
} // namespace mpvbind::support
