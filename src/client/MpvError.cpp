//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "client/MpvError.hpp"

#include <mpv/client.h>

namespace mpvbind::client
{

support::Diag mpvError(int code, std::string_view context)
{
    std::string msg = "mpv: ";
    msg += mpv_error_string(code);
    if (!context.empty())
    {
        msg += " (";
        msg += context;
        msg += ')';
    }
    return support::makeError({}, std::move(msg), code);
}

support::Expected<void> checkMpv(int code, std::string_view context)
{
    if (code >= 0)
        return {};
    return mpvError(code, context);
}

support::Expected<void> checkCString(std::string_view text, std::string_view what)
{
    if (text.find('\0') == std::string_view::npos)
        return {};
    std::string msg(what);
    msg += " contains an embedded NUL byte";
    return support::makeError({}, std::move(msg), MPV_ERROR_INVALID_PARAMETER);
}

} // namespace mpvbind::client
