//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: client/Events.hpp
// Purpose: Declares the event API of the libmpv client wrapper.
// Key invariants: Events are deep-copied out of libmpv's buffer before the
//                 next mpv_wait_event() call can invalidate it.
// Ownership/Lifetime: EventContext borrows the handle of the Mpv it came from
//                     and must not outlive it.
// Links: docs/coverage.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "client/PropertyTraits.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include <mpv/client.h>

namespace mpvbind::client
{

/// @brief Payload of MPV_EVENT_PROPERTY_CHANGE and MPV_EVENT_GET_PROPERTY_REPLY.
struct PropertyChange
{
    std::string name;
    mpv_format format = MPV_FORMAT_NONE;
    PropertyValue value;
};

/// @brief Payload of MPV_EVENT_LOG_MESSAGE.
struct LogMessage
{
    std::string prefix;
    std::string level;
    std::string text;
    mpv_log_level logLevel = MPV_LOG_LEVEL_NONE;
};

/// @brief Payload of MPV_EVENT_END_FILE.
struct EndFile
{
    int reason = 0; ///< mpv_end_file_reason value
    int error = 0;  ///< mpv_error when reason is MPV_END_FILE_REASON_ERROR
    int64_t playlistEntryId = 0;
};

/// @brief Payload of MPV_EVENT_HOOK; answer with EventContext::continueHook().
struct HookRequest
{
    std::string name;
    uint64_t id = 0;
};

using EventPayload = std::variant<std::monostate, PropertyChange, LogMessage, EndFile, HookRequest>;

/// @brief Owned copy of an mpv_event.
struct Event
{
    mpv_event_id id = MPV_EVENT_NONE;
    std::string name;     ///< mpv_event_name(id)
    int error = 0;        ///< mpv_error for reply events, otherwise 0
    uint64_t replyId = 0; ///< reply_userdata of the originating request
    EventPayload payload;
};

/// @brief Event loop helpers bound to one client handle.
/// @details waitEvent() may only be called from one thread at a time.
class EventContext
{
  public:
    explicit EventContext(mpv_handle *handle) : handle_(handle) {}

    /// @brief Wait up to @p timeoutSeconds for the next event.
    /// @param timeoutSeconds 0 polls, negative waits forever.
    /// @return The event, or std::nullopt on timeout (MPV_EVENT_NONE).
    std::optional<Event> waitEvent(double timeoutSeconds = 0.0) const;

    /// @brief Deliver MPV_EVENT_PROPERTY_CHANGE for @p name with @p replyId.
    support::Expected<void> observeProperty(const std::string &name,
                                            mpv_format format,
                                            uint64_t replyId) const;

    /// @brief Stop observations registered with @p replyId.
    /// @return Number of observations removed.
    support::Expected<int> unobserveProperty(uint64_t replyId) const;

    /// @brief Resume delivery of events of type @p id.
    support::Expected<void> enableEvent(mpv_event_id id) const;

    /// @brief Suppress events of type @p id.
    support::Expected<void> disableEvent(mpv_event_id id) const;

    /// @brief Receive log messages at @p minLevel or more severe ("no" disables).
    support::Expected<void> requestLogMessages(const std::string &minLevel) const;

    /// @brief Register for hook @p name; requests arrive as MPV_EVENT_HOOK.
    support::Expected<void> addHook(const std::string &name, int priority, uint64_t replyId) const;

    /// @brief Let the player continue past the hook request @p id.
    support::Expected<void> continueHook(uint64_t id) const;

  private:
    mpv_handle *handle_;
};

} // namespace mpvbind::client
