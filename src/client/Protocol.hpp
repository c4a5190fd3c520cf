//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares custom stream protocols for the libmpv client wrapper.
// A protocol named "foo" makes libmpv route every "foo://..." URI to the
// supplied callbacks instead of its own stream layer.
//
// Ownership:
//   Mpv::registerProtocol() takes ownership of the protocol object and keeps it
//   until after mpv_terminate_destroy() returns, because libmpv offers no way
//   to unregister a protocol. Each opened stream owns a heap-allocated cookie
//   that the close callback releases.
//
// Error Handling:
//   Callbacks run on libmpv threads behind a C ABI. A std::exception escaping
//   a callback is printed to std::cerr as a diagnostic and converted into the
//   libmpv failure value for that callback: MPV_ERROR_LOADING_FAILED for open,
//   -1 for read, MPV_ERROR_GENERIC for seek, MPV_ERROR_UNSUPPORTED for size.
//   The thunks are noexcept; any other exception terminates the process.
//
//===----------------------------------------------------------------------===//
#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <mpv/client.h>
#include <mpv/stream_cb.h>

namespace mpvbind::client
{

/// @brief Type-erased protocol state referenced by libmpv.
class ProtocolBase
{
  public:
    explicit ProtocolBase(std::string name) : name_(std::move(name)) {}

    virtual ~ProtocolBase() = default;

    ProtocolBase(const ProtocolBase &) = delete;
    ProtocolBase &operator=(const ProtocolBase &) = delete;

    /// @brief URI prefix without "://".
    const std::string &name() const
    {
        return name_;
    }

    /// @brief Open @p uri and fill @p info with per-stream callbacks.
    /// @return 0 on success or a negative mpv_error.
    virtual int open(const char *uri, mpv_stream_cb_info *info) noexcept = 0;

  private:
    std::string name_;
};

namespace detail
{
/// @brief mpv_stream_cb_open_ro_fn forwarding to ProtocolBase::open().
int openProtocolStream(void *userData, char *uri, mpv_stream_cb_info *info);

/// @brief Print a diagnostic for an exception thrown by a protocol callback.
void reportCallbackFailure(std::string_view protocol,
                           std::string_view callback,
                           const std::exception &error) noexcept;
} // namespace detail

/// @brief Read-only stream protocol whose per-stream state is a @p Cookie.
/// @tparam Cookie Move-constructible state returned by the open callback.
template <class Cookie> class Protocol final : public ProtocolBase
{
  public:
    /// @brief Produce the stream state for a full URI ("name://...").
    using OpenFn = std::function<Cookie(const std::string &uri)>;
    /// @brief Release resources held by the cookie.
    using CloseFn = std::function<void(Cookie &)>;
    /// @brief Fill up to @p nbytes; return bytes read, 0 on EOF, -1 on error.
    using ReadFn = std::function<int64_t(Cookie &, char *buf, uint64_t nbytes)>;
    /// @brief Seek to absolute @p offset; return the new offset or a negative
    ///        mpv_error.
    using SeekFn = std::function<int64_t(Cookie &, int64_t offset)>;
    /// @brief Total stream size in bytes, or a negative mpv_error.
    using SizeFn = std::function<int64_t(Cookie &)>;

    /// @param seek Optional; without it libmpv treats streams as unseekable.
    /// @param size Optional; without it libmpv treats the size as unknown.
    Protocol(std::string name,
             OpenFn open,
             CloseFn close,
             ReadFn read,
             SeekFn seek = {},
             SizeFn size = {})
        : ProtocolBase(std::move(name)), open_(std::move(open)), close_(std::move(close)),
          read_(std::move(read)), seek_(std::move(seek)), size_(std::move(size))
    {
    }

    int open(const char *uri, mpv_stream_cb_info *info) noexcept override
    {
        std::unique_ptr<Stream> stream;
        try
        {
            stream = std::make_unique<Stream>(Stream{this, open_(std::string(uri ? uri : ""))});
        }
        catch (const std::exception &e)
        {
            detail::reportCallbackFailure(name(), "open", e);
            return MPV_ERROR_LOADING_FAILED;
        }

        // libmpv owns the stream from here until closeThunk.
        info->cookie = stream.release();
        info->read_fn = &Protocol::readThunk;
        info->close_fn = &Protocol::closeThunk;
        info->seek_fn = seek_ ? &Protocol::seekThunk : nullptr;
        info->size_fn = size_ ? &Protocol::sizeThunk : nullptr;
        return 0;
    }

  private:
    struct Stream
    {
        Protocol *owner;
        Cookie cookie;
    };

    static int64_t readThunk(void *cookie, char *buf, uint64_t nbytes) noexcept
    {
        auto *stream = static_cast<Stream *>(cookie);
        try
        {
            return stream->owner->read_(stream->cookie, buf, nbytes);
        }
        catch (const std::exception &e)
        {
            detail::reportCallbackFailure(stream->owner->name(), "read", e);
            return -1;
        }
    }

    static int64_t seekThunk(void *cookie, int64_t offset) noexcept
    {
        auto *stream = static_cast<Stream *>(cookie);
        try
        {
            return stream->owner->seek_(stream->cookie, offset);
        }
        catch (const std::exception &e)
        {
            detail::reportCallbackFailure(stream->owner->name(), "seek", e);
            return MPV_ERROR_GENERIC;
        }
    }

    static int64_t sizeThunk(void *cookie) noexcept
    {
        auto *stream = static_cast<Stream *>(cookie);
        try
        {
            return stream->owner->size_(stream->cookie);
        }
        catch (const std::exception &e)
        {
            detail::reportCallbackFailure(stream->owner->name(), "size", e);
            return MPV_ERROR_UNSUPPORTED;
        }
    }

    static void closeThunk(void *cookie) noexcept
    {
        std::unique_ptr<Stream> stream(static_cast<Stream *>(cookie));
        try
        {
            stream->owner->close_(stream->cookie);
        }
        catch (const std::exception &e)
        {
            detail::reportCallbackFailure(stream->owner->name(), "close", e);
        }
    }

    OpenFn open_;
    CloseFn close_;
    ReadFn read_;
    SeekFn seek_;
    SizeFn size_;
};

} // namespace mpvbind::client
