// File: include/mpvbind/Coverage.hpp
// Purpose: Stable façade for the binding registry and checklist IO.
// Key invariants: Re-exports supported coverage interfaces only.
// Ownership/Lifetime: Mirrors the underlying implementations.
// Links: docs/coverage.md
#pragma once

#include "coverage/ApiGroup.hpp"
#include "coverage/BindingRecord.hpp"
#include "coverage/ChecklistParser.hpp"
#include "coverage/ChecklistWriter.hpp"
#include "coverage/Reconcile.hpp"
#include "coverage/Registry.hpp"
#include "coverage/Summary.hpp"

/// @file include/mpvbind/Coverage.hpp
/// @brief Aggregated public header for binding coverage tracking.  Provides the
///        registry, the checklist parser and writer, and reconciliation.
