//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: client/MpvError.hpp
// Purpose: Translate libmpv status codes into diagnostics.
// Key invariants: Negative codes are errors; zero and positive codes succeed.
// Ownership/Lifetime: Stateless helpers.
// Links: docs/coverage.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <string>
#include <string_view>

namespace mpvbind::client
{

/// @brief Build an error diagnostic for libmpv status @p code.
/// @param code libmpv error code (mpv_error).
/// @param context Operation and subject, e.g. "set_property volume".
/// @return Diagnostic "mpv: <error string> (<context>)" carrying @p code.
support::Diag mpvError(int code, std::string_view context);

/// @brief Map a libmpv status to Expected<void>.
/// @return Success for codes >= 0, otherwise mpvError(code, context).
support::Expected<void> checkMpv(int code, std::string_view context);

/// @brief Reject strings that cannot cross the C boundary intact.
/// @details libmpv takes NUL-terminated strings; an embedded NUL would silently
///          truncate the value.
support::Expected<void> checkCString(std::string_view text, std::string_view what);

} // namespace mpvbind::client
