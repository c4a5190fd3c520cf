//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements EventContext.  mpv_wait_event() returns a pointer into a buffer
// owned by the handle that the next call overwrites, so every payload is
// copied into owned C++ types before returning.
//
//===----------------------------------------------------------------------===//

#include "client/Events.hpp"

#include "client/MpvError.hpp"

namespace mpvbind::client
{
namespace
{

std::string copyString(const char *text)
{
    return text ? std::string(text) : std::string();
}

EventPayload copyPayload(const mpv_event &event)
{
    if (event.data == nullptr)
        return std::monostate{};

    switch (event.event_id)
    {
        case MPV_EVENT_PROPERTY_CHANGE:
        case MPV_EVENT_GET_PROPERTY_REPLY:
        {
            const auto *prop = static_cast<const mpv_event_property *>(event.data);
            PropertyChange change;
            change.name = copyString(prop->name);
            change.format = prop->format;
            change.value = propertyValueFromEvent(prop->format, prop->data);
            return change;
        }
        case MPV_EVENT_LOG_MESSAGE:
        {
            const auto *log = static_cast<const mpv_event_log_message *>(event.data);
            LogMessage msg;
            msg.prefix = copyString(log->prefix);
            msg.level = copyString(log->level);
            msg.text = copyString(log->text);
            msg.logLevel = log->log_level;
            return msg;
        }
        case MPV_EVENT_END_FILE:
        {
            const auto *end = static_cast<const mpv_event_end_file *>(event.data);
            EndFile out;
            out.reason = static_cast<int>(end->reason);
            out.error = end->error;
            out.playlistEntryId = end->playlist_entry_id;
            return out;
        }
        case MPV_EVENT_HOOK:
        {
            const auto *hook = static_cast<const mpv_event_hook *>(event.data);
            HookRequest req;
            req.name = copyString(hook->name);
            req.id = hook->id;
            return req;
        }
        default:
            return std::monostate{};
    }
}

} // namespace

PropertyValue propertyValueFromEvent(mpv_format format, const void *data)
{
    if (data == nullptr)
        return std::monostate{};
    switch (format)
    {
        case MPV_FORMAT_STRING:
        case MPV_FORMAT_OSD_STRING:
            return copyString(*static_cast<char *const *>(data));
        case MPV_FORMAT_FLAG:
            return *static_cast<const int *>(data) != 0;
        case MPV_FORMAT_INT64:
            return *static_cast<const int64_t *>(data);
        case MPV_FORMAT_DOUBLE:
            return *static_cast<const double *>(data);
        default:
            return std::monostate{};
    }
}

std::optional<Event> EventContext::waitEvent(double timeoutSeconds) const
{
    const mpv_event *raw = mpv_wait_event(handle_, timeoutSeconds);
    if (raw == nullptr || raw->event_id == MPV_EVENT_NONE)
        return std::nullopt;

    Event event;
    event.id = raw->event_id;
    event.name = copyString(mpv_event_name(raw->event_id));
    event.error = raw->error;
    event.replyId = raw->reply_userdata;
    event.payload = copyPayload(*raw);
    return event;
}

support::Expected<void> EventContext::observeProperty(const std::string &name,
                                                      mpv_format format,
                                                      uint64_t replyId) const
{
    if (auto ok = checkCString(name, "property name"); !ok)
        return ok;
    return checkMpv(mpv_observe_property(handle_, replyId, name.c_str(), format),
                    "observe_property " + name);
}

support::Expected<int> EventContext::unobserveProperty(uint64_t replyId) const
{
    const int rc = mpv_unobserve_property(handle_, replyId);
    if (rc < 0)
        return mpvError(rc, "unobserve_property");
    return rc;
}

support::Expected<void> EventContext::enableEvent(mpv_event_id id) const
{
    return checkMpv(mpv_request_event(handle_, id, 1), "request_event");
}

support::Expected<void> EventContext::disableEvent(mpv_event_id id) const
{
    return checkMpv(mpv_request_event(handle_, id, 0), "request_event");
}

support::Expected<void> EventContext::requestLogMessages(const std::string &minLevel) const
{
    if (auto ok = checkCString(minLevel, "log level"); !ok)
        return ok;
    return checkMpv(mpv_request_log_messages(handle_, minLevel.c_str()),
                    "request_log_messages " + minLevel);
}

support::Expected<void> EventContext::addHook(const std::string &name,
                                              int priority,
                                              uint64_t replyId) const
{
    if (auto ok = checkCString(name, "hook name"); !ok)
        return ok;
    return checkMpv(mpv_hook_add(handle_, replyId, name.c_str(), priority), "hook_add " + name);
}

support::Expected<void> EventContext::continueHook(uint64_t id) const
{
    return checkMpv(mpv_hook_continue(handle_, id), "hook_continue");
}

} // namespace mpvbind::client
