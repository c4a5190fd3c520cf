//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the binding registry: the authoritative table of libmpv
// client API symbols together with whether the client module wraps each one.
//
// Registry Structure:
// - ApiSymbols.def: X-macro rows (group, symbol, bound, internal)
// - bindingRegistry(): records materialized once, grouped in ApiGroup order
// - findBinding(): name lookup backed by a hash index built alongside the
//   records
//
// The registry is read-only after first access. Function-local statics make
// concurrent first access safe.
//
//===----------------------------------------------------------------------===//
#pragma once

#include "coverage/ApiGroup.hpp"
#include "coverage/BindingRecord.hpp"
#include "support/diagnostics.hpp"
#include "support/options.hpp"

#include <string_view>
#include <vector>

namespace mpvbind::coverage
{

/// @brief All registry records, grouped in ApiGroup order.
const std::vector<BindingRecord> &bindingRegistry();

/// @brief Look up a record by exported symbol name.
/// @param name Symbol to resolve, e.g. "mpv_create".
/// @return Pointer into bindingRegistry(), or nullptr when the symbol is not
///         tracked.
const BindingRecord *findBinding(std::string_view name);

/// @brief Records belonging to @p group in table order.
std::vector<const BindingRecord *> bindingsInGroup(ApiGroup group);

/// @brief Validate registry invariants, reporting each violation.
/// @details Checks name uniqueness and that internal records are bound.
/// @return True when no violation was found.
bool selfCheckBindingRegistry(support::DiagnosticEngine &de);

/// @brief Build the checklist document describing the registry.
/// @details Groups follow ApiGroup order; a group emptied by
///          @c options.includeInternal == false is omitted.
Checklist registryChecklist(const support::CoverageOptions &options = {});

} // namespace mpvbind::coverage
