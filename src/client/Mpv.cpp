//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the owning libmpv handle.  Construction goes through
// Mpv::create() so that a half-initialized core is always destroyed by the
// Mpv destructor rather than by hand on each failure path.
//
//===----------------------------------------------------------------------===//

#include "client/Mpv.hpp"

#include "client/Protocol.hpp"

#include <iostream>
#include <utility>

namespace mpvbind::client
{
namespace
{

/// @brief Build the NULL-terminated argv libmpv expects.
/// @details The returned pointers borrow from @p name and @p args.
support::Expected<std::vector<const char *>> buildArgv(const std::string &name,
                                                       const std::vector<std::string> &args)
{
    if (auto ok = checkCString(name, "command name"); !ok)
        return ok.error();
    std::vector<const char *> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(name.c_str());
    for (const auto &arg : args)
    {
        if (auto ok = checkCString(arg, "command argument"); !ok)
            return ok.error();
        argv.push_back(arg.c_str());
    }
    argv.push_back(nullptr);
    return argv;
}

void wakeupThunk(void *data) noexcept
{
    auto *callback = static_cast<std::function<void()> *>(data);
    try
    {
        (*callback)();
    }
    catch (const std::exception &e)
    {
        support::printDiag(
            support::makeError({}, std::string("wakeup callback failed: ") + e.what()),
            std::cerr);
    }
}

} // namespace

support::Expected<void> PropertyAccess::setOptionString(const std::string &name,
                                                        const std::string &value) const
{
    if (auto ok = checkCString(name, "option name"); !ok)
        return ok;
    if (auto ok = checkCString(value, "option value"); !ok)
        return ok;
    return checkMpv(mpv_set_option_string(handle_, name.c_str(), value.c_str()),
                    "set_option_string " + name);
}

support::Expected<void> PropertyAccess::setPropertyString(const std::string &name,
                                                          const std::string &value) const
{
    if (auto ok = checkCString(name, "property name"); !ok)
        return ok;
    if (auto ok = checkCString(value, "property value"); !ok)
        return ok;
    return checkMpv(mpv_set_property_string(handle_, name.c_str(), value.c_str()),
                    "set_property_string " + name);
}

support::Expected<std::string> PropertyAccess::getPropertyString(const std::string &name) const
{
    if (auto ok = checkCString(name, "property name"); !ok)
        return ok.error();
    char *raw = mpv_get_property_string(handle_, name.c_str());
    if (raw == nullptr)
        return mpvError(MPV_ERROR_PROPERTY_UNAVAILABLE, "get_property_string " + name);
    return PropertyTraits<std::string>::fromNative(raw);
}

support::Expected<std::string> PropertyAccess::getPropertyOsdString(const std::string &name) const
{
    if (auto ok = checkCString(name, "property name"); !ok)
        return ok.error();
    char *raw = mpv_get_property_osd_string(handle_, name.c_str());
    if (raw == nullptr)
        return mpvError(MPV_ERROR_PROPERTY_UNAVAILABLE, "get_property_osd_string " + name);
    return PropertyTraits<std::string>::fromNative(raw);
}

Mpv::Mpv(mpv_handle *handle) : PropertyAccess(handle) {}

Mpv::~Mpv()
{
    release();
}

Mpv::Mpv(Mpv &&other) noexcept
    : PropertyAccess(std::exchange(other.handle_, nullptr)),
      wakeupCallback_(std::move(other.wakeupCallback_)), protocols_(std::move(other.protocols_))
{
}

Mpv &Mpv::operator=(Mpv &&other) noexcept
{
    if (this != &other)
    {
        release();
        handle_ = std::exchange(other.handle_, nullptr);
        wakeupCallback_ = std::move(other.wakeupCallback_);
        protocols_ = std::move(other.protocols_);
    }
    return *this;
}

/// @brief Destroy the core before the state its callbacks reference.
void Mpv::release() noexcept
{
    if (handle_ != nullptr)
    {
        mpv_terminate_destroy(handle_);
        handle_ = nullptr;
    }
    protocols_.clear();
    wakeupCallback_.reset();
}

/// @brief Create, configure, and initialize a core.
///
/// @details Only the major version has to match: minor versions add API
///          without breaking it.  The Mpv object owns the handle from the
///          moment mpv_create() succeeds, so every early return below tears
///          the core down through the destructor.
support::Expected<Mpv> Mpv::create(const Initializer &init)
{
    const unsigned long loaded = mpv_client_api_version();
    if ((loaded >> 16) != (MPV_CLIENT_API_VERSION >> 16))
    {
        return support::makeError({},
                                  "libmpv client API major version mismatch: built against " +
                                      std::to_string(MPV_CLIENT_API_VERSION >> 16) +
                                      ", loaded " + std::to_string(loaded >> 16),
                                  MPV_ERROR_UNSUPPORTED);
    }

    mpv_handle *raw = mpv_create();
    if (raw == nullptr)
        return support::makeError({}, "mpv_create returned null", MPV_ERROR_NOMEM);

    Mpv mpv(raw);
    if (init)
    {
        if (auto ok = init(mpv); !ok)
            return ok.error();
    }

    if (auto ok = checkMpv(mpv_initialize(raw), "initialize"); !ok)
        return ok.error();
    return mpv;
}

support::Expected<void> Mpv::loadConfigFile(const std::string &path) const
{
    if (auto ok = checkCString(path, "config path"); !ok)
        return ok;
    return checkMpv(mpv_load_config_file(handle_, path.c_str()), "load_config_file " + path);
}

support::Expected<void> Mpv::command(const std::string &name,
                                     const std::vector<std::string> &args) const
{
    auto argv = buildArgv(name, args);
    if (!argv)
        return argv.error();
    return checkMpv(mpv_command(handle_, argv.value().data()), "command " + name);
}

support::Expected<void> Mpv::commandString(const std::string &cmd) const
{
    if (auto ok = checkCString(cmd, "command"); !ok)
        return ok;
    return checkMpv(mpv_command_string(handle_, cmd.c_str()), "command_string " + cmd);
}

support::Expected<void> Mpv::commandAsync(uint64_t replyId,
                                          const std::string &name,
                                          const std::vector<std::string> &args) const
{
    auto argv = buildArgv(name, args);
    if (!argv)
        return argv.error();
    return checkMpv(mpv_command_async(handle_, replyId, argv.value().data()),
                    "command_async " + name);
}

void Mpv::abortAsyncCommand(uint64_t replyId) const
{
    mpv_abort_async_command(handle_, replyId);
}

support::Expected<void> Mpv::getPropertyAsync(uint64_t replyId,
                                              const std::string &name,
                                              mpv_format format) const
{
    if (auto ok = checkCString(name, "property name"); !ok)
        return ok;
    return checkMpv(mpv_get_property_async(handle_, replyId, name.c_str(), format),
                    "get_property_async " + name);
}

int64_t Mpv::internalTimeUs() const
{
    return mpv_get_time_us(handle_);
}

std::string Mpv::clientName() const
{
    const char *name = mpv_client_name(handle_);
    return name ? std::string(name) : std::string();
}

int64_t Mpv::clientId() const
{
    return mpv_client_id(handle_);
}

void Mpv::wakeup() const
{
    mpv_wakeup(handle_);
}

/// @brief Swap in a new wakeup callback.
///
/// @details The callback lives on the heap so its address survives moves of
///          the Mpv object.  libmpv is pointed at the new callback before the
///          old one is released.
void Mpv::setWakeupCallback(std::function<void()> callback)
{
    if (!callback)
    {
        mpv_set_wakeup_callback(handle_, nullptr, nullptr);
        wakeupCallback_.reset();
        return;
    }
    auto next = std::make_unique<std::function<void()>>(std::move(callback));
    mpv_set_wakeup_callback(handle_, &wakeupThunk, next.get());
    wakeupCallback_ = std::move(next);
}

void Mpv::waitAsyncRequests() const
{
    mpv_wait_async_requests(handle_);
}

support::Expected<void> Mpv::registerProtocol(std::unique_ptr<ProtocolBase> protocol)
{
    if (!protocol)
        return support::makeError({}, "null protocol", MPV_ERROR_INVALID_PARAMETER);
    if (auto ok = checkCString(protocol->name(), "protocol name"); !ok)
        return ok;
    const int rc = mpv_stream_cb_add_ro(
        handle_, protocol->name().c_str(), protocol.get(), &detail::openProtocolStream);
    if (auto ok = checkMpv(rc, "stream_cb_add_ro " + protocol->name()); !ok)
        return ok;
    protocols_.push_back(std::move(protocol));
    return {};
}

} // namespace mpvbind::client
