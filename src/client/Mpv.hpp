//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares Mpv, the owning wrapper around a libmpv core handle, and
// PropertyAccess, the typed option/property surface it shares with the
// pre-initialization hook.
//
// Lifecycle:
//   Mpv::create() checks the client API major version, calls mpv_create(),
//   runs the caller's initializer (options set there apply before the core
//   starts), then calls mpv_initialize(). Any failure destroys the handle and
//   returns a diagnostic. The destructor calls mpv_terminate_destroy() and only
//   then releases wakeup callbacks and registered protocols, so libmpv never
//   calls into freed state.
//
// Error Handling:
//   Every libmpv status is surfaced as support::Expected; the diagnostic's
//   code field carries the raw mpv_error value.
//
// Thread Safety:
//   libmpv's client API is thread-safe; Mpv adds no locking. Registering
//   protocols and replacing the wakeup callback mutate wrapper state and must
//   not race with each other.
//
//===----------------------------------------------------------------------===//
#pragma once

#include "client/Events.hpp"
#include "client/MpvError.hpp"
#include "client/PropertyTraits.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

#include <mpv/client.h>

namespace mpvbind::client
{

class ProtocolBase;

namespace detail
{
/// @brief Selects the PropertyTraits type used for a C++ argument type.
template <class T, class = void> struct PropertyTypeOf
{
    using type = T;
};

template <class T>
struct PropertyTypeOf<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>>
{
    using type = int64_t;
};

template <class T> struct PropertyTypeOf<T, std::enable_if_t<std::is_floating_point_v<T>>>
{
    using type = double;
};

template <> struct PropertyTypeOf<const char *>
{
    using type = std::string;
};

template <> struct PropertyTypeOf<char *>
{
    using type = std::string;
};

template <class T> using property_type_t = typename PropertyTypeOf<T>::type;
} // namespace detail

/// @brief Typed option and property access over a borrowed handle.
class PropertyAccess
{
  public:
    /// @brief Set option @p name; usable before and after initialization.
    template <class T> support::Expected<void> setOption(const std::string &name, T value) const
    {
        return setTyped(name, std::move(value), "set_option", &mpv_set_option);
    }

    /// @brief Set option @p name from its string form.
    support::Expected<void> setOptionString(const std::string &name,
                                            const std::string &value) const;

    /// @brief Set property @p name.
    /// @details Integers widen to int64, floating point to double, bool maps to
    ///          an mpv flag and strings to MPV_FORMAT_STRING.
    template <class T> support::Expected<void> setProperty(const std::string &name, T value) const
    {
        return setTyped(name, std::move(value), "set_property", &mpv_set_property);
    }

    /// @brief Set property @p name from its string form.
    support::Expected<void> setPropertyString(const std::string &name,
                                              const std::string &value) const;

    /// @brief Read property @p name as @p T (double, int64_t, bool or std::string).
    template <class T> support::Expected<T> getProperty(const std::string &name) const
    {
        using Traits = PropertyTraits<T>;
        if (auto ok = checkCString(name, "property name"); !ok)
            return ok.error();
        typename Traits::Native native{};
        const int rc = mpv_get_property(handle_, name.c_str(), Traits::kFormat, &native);
        if (rc < 0)
            return mpvError(rc, "get_property " + name);
        return Traits::fromNative(native);
    }

    /// @brief Read property @p name formatted as a string.
    support::Expected<std::string> getPropertyString(const std::string &name) const;

    /// @brief Read property @p name formatted for on-screen display.
    support::Expected<std::string> getPropertyOsdString(const std::string &name) const;

    /// @brief Raw handle for calls the wrapper does not cover.
    mpv_handle *handle() const
    {
        return handle_;
    }

  protected:
    explicit PropertyAccess(mpv_handle *handle) : handle_(handle) {}

    mpv_handle *handle_;

  private:
    using SetFn = int (*)(mpv_handle *, const char *, mpv_format, void *);

    template <class T>
    support::Expected<void> setTyped(const std::string &name,
                                     T value,
                                     const char *what,
                                     SetFn fn) const
    {
        using Value = detail::property_type_t<T>;
        using Traits = PropertyTraits<Value>;
        if (auto ok = checkCString(name, "name"); !ok)
            return ok;
        const Value converted(value);
        if constexpr (std::is_same_v<Value, std::string>)
        {
            if (auto ok = checkCString(converted, "value"); !ok)
                return ok;
        }
        typename Traits::Native native = Traits::toNative(converted);
        return checkMpv(fn(handle_, name.c_str(), Traits::kFormat, &native),
                        std::string(what) + " " + name);
    }
};

/// @brief Owning handle to an initialized libmpv core.
class Mpv : public PropertyAccess
{
  public:
    /// @brief Hook run between mpv_create() and mpv_initialize().
    using Initializer = std::function<support::Expected<void>(PropertyAccess &)>;

    /// @brief Create and initialize a core.
    /// @param init Optional hook for options that must be set before
    ///        initialization (e.g. "vo", "config").
    /// @return Initialized core or the first failure.
    static support::Expected<Mpv> create(const Initializer &init = {});

    ~Mpv();
    Mpv(Mpv &&other) noexcept;
    Mpv &operator=(Mpv &&other) noexcept;
    Mpv(const Mpv &) = delete;
    Mpv &operator=(const Mpv &) = delete;

    /// @brief Load a configuration file; @p path must be absolute.
    support::Expected<void> loadConfigFile(const std::string &path) const;

    /// @brief Run command @p name with @p args, e.g. command("loadfile", {"a.mkv"}).
    support::Expected<void> command(const std::string &name,
                                    const std::vector<std::string> &args = {}) const;

    /// @brief Run a command given in mpv's input.conf syntax.
    support::Expected<void> commandString(const std::string &cmd) const;

    /// @brief Queue a command; completion arrives as MPV_EVENT_COMMAND_REPLY
    ///        with @p replyId.
    support::Expected<void> commandAsync(uint64_t replyId,
                                         const std::string &name,
                                         const std::vector<std::string> &args = {}) const;

    /// @brief Request cancellation of async commands queued with @p replyId.
    void abortAsyncCommand(uint64_t replyId) const;

    /// @brief Queue a property write; completion arrives as
    ///        MPV_EVENT_SET_PROPERTY_REPLY with @p replyId.
    template <class T>
    support::Expected<void> setPropertyAsync(uint64_t replyId, const std::string &name, T value) const
    {
        using Value = detail::property_type_t<T>;
        using Traits = PropertyTraits<Value>;
        if (auto ok = checkCString(name, "property name"); !ok)
            return ok;
        const Value converted(value);
        if constexpr (std::is_same_v<Value, std::string>)
        {
            if (auto ok = checkCString(converted, "property value"); !ok)
                return ok;
        }
        typename Traits::Native native = Traits::toNative(converted);
        return checkMpv(
            mpv_set_property_async(handle_, replyId, name.c_str(), Traits::kFormat, &native),
            "set_property_async " + name);
    }

    /// @brief Queue a property read; the value arrives as
    ///        MPV_EVENT_GET_PROPERTY_REPLY with @p replyId.
    support::Expected<void> getPropertyAsync(uint64_t replyId,
                                             const std::string &name,
                                             mpv_format format) const;

    /// @brief Monotonic internal clock in microseconds with arbitrary offset.
    int64_t internalTimeUs() const;

    /// @brief Name of this client, e.g. "main".
    std::string clientName() const;

    /// @brief Unique identifier of this client within the core.
    int64_t clientId() const;

    /// @brief Interrupt a blocking EventContext::waitEvent().
    void wakeup() const;

    /// @brief Install @p callback to run whenever new events are available.
    /// @details The callback runs on a libmpv thread and must not call back
    ///          into libmpv. Passing an empty function removes the callback.
    void setWakeupCallback(std::function<void()> callback);

    /// @brief Block until every queued async request has completed.
    void waitAsyncRequests() const;

    /// @brief Event API bound to this handle.
    EventContext events() const
    {
        return EventContext(handle_);
    }

    /// @brief Register a custom stream protocol and keep it alive with the core.
    /// @return Failure when libmpv rejects the name (e.g. already registered).
    support::Expected<void> registerProtocol(std::unique_ptr<ProtocolBase> protocol);

  private:
    explicit Mpv(mpv_handle *handle);

    void release() noexcept;

    std::unique_ptr<std::function<void()>> wakeupCallback_;
    std::vector<std::unique_ptr<ProtocolBase>> protocols_;
};

} // namespace mpvbind::client
