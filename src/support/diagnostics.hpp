//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Diagnostic record and the engine that collects them for passes
//          that report more than one problem (reconcile, registry self-check).
// Key invariants: errorCount()/warningCount() always match the stored list.
// Ownership/Lifetime: The engine owns the diagnostics reported to it.
// Links: docs/coverage.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <array>
#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace mpvbind::support
{

class SourceManager;

enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief Lowercase name used when printing ("note", "warning", "error").
std::string_view severityName(Severity severity);

/// @brief One reported problem.
/// @details @ref code carries a subsystem status, the negative mpv_error value
///          for client failures; 0 means none.
struct Diagnostic
{
    Severity severity;
    std::string message;
    SourceLoc loc;
    int code = 0;
};

/// @brief Ordered collection of diagnostics with per-severity counts.
class DiagnosticEngine
{
  public:
    void report(Diagnostic d);

    /// @brief Print every diagnostic in report order through printDiag().
    void printAll(std::ostream &os, const SourceManager *sm = nullptr) const;

    const std::vector<Diagnostic> &diagnostics() const
    {
        return diags_;
    }

    size_t errorCount() const
    {
        return counts_[static_cast<size_t>(Severity::Error)];
    }

    size_t warningCount() const
    {
        return counts_[static_cast<size_t>(Severity::Warning)];
    }

  private:
    std::vector<Diagnostic> diags_;
    std::array<size_t, 3> counts_{};
};

} // namespace mpvbind::support
