//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "client/Protocol.hpp"

#include "support/diag_expected.hpp"

#include <iostream>

namespace mpvbind::client::detail
{

int openProtocolStream(void *userData, char *uri, mpv_stream_cb_info *info)
{
    return static_cast<ProtocolBase *>(userData)->open(uri, info);
}

void reportCallbackFailure(std::string_view protocol,
                           std::string_view callback,
                           const std::exception &error) noexcept
{
    std::string msg = "protocol '";
    msg += protocol;
    msg += "' ";
    msg += callback;
    msg += " callback failed: ";
    msg += error.what();
    support::printDiag(support::makeError({}, std::move(msg)), std::cerr);
}

} // namespace mpvbind::client::detail
