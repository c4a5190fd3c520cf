//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the ChecklistWriter, which renders binding records as
// the markdown checklist tracked in docs/coverage.md.
//
// Output layout:
//   # <title>
//   <blank>
//   - [X] `symbol`
//   - [ ] `symbol` (annotation)
//   <blank>            (one blank line between groups)
//   ...
//
// The output always ends with exactly one newline. Rendering a checklist that
// came from ChecklistParser reproduces canonical input byte for byte.
//
// Thread Safety:
// The writer is stateless; concurrent calls need no synchronization.
//
//===----------------------------------------------------------------------===//
#pragma once

#include "coverage/BindingRecord.hpp"
#include "support/options.hpp"

#include <ostream>
#include <string>

namespace mpvbind::coverage
{

/// @brief Renders checklists to their textual form.
class ChecklistWriter
{
  public:
    /// @brief Write checklist @p checklist to @p os.
    static void write(const Checklist &checklist, std::ostream &os);

    /// @brief Render checklist @p checklist to a string.
    static std::string toString(const Checklist &checklist);

    /// @brief Render the binding registry using @p options.
    /// @details Groups appear in ApiGroup order; see registryChecklist().
    static std::string renderRegistry(const support::CoverageOptions &options = {});

    /// @brief Render a single record line without the trailing newline.
    static std::string formatRecord(const BindingRecord &record);
};

} // namespace mpvbind::coverage
