//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/client/ProtocolTests.cpp
// Purpose: Verify the stream protocol adapter and its registration.
// Key invariants: Callback exceptions never cross into libmpv; streams are
//                 freed by the close callback; optional callbacks stay null.
// Ownership/Lifetime: Protocols are owned by the test or by the Mpv core
//                     they are registered with.
// Links: src/client/Protocol.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "client/Mpv.hpp"
#include "client/Protocol.hpp"

#include <algorithm>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

using namespace mpvbind::client;

namespace
{

struct Buffer
{
    std::string data;
    std::size_t pos = 0;
};

int closed = 0;

std::unique_ptr<Protocol<Buffer>> memoryProtocol(const std::string &name, bool seekable)
{
    auto open = [](const std::string &uri) {
        if (uri.find("fail") != std::string::npos)
            throw std::runtime_error("refusing " + uri);
        return Buffer{uri.substr(uri.find("://") + 3), 0};
    };
    auto close = [](Buffer &) { ++closed; };
    auto read = [](Buffer &buf, char *out, uint64_t nbytes) -> int64_t {
        const std::size_t n = std::min<std::size_t>(nbytes, buf.data.size() - buf.pos);
        std::memcpy(out, buf.data.data() + buf.pos, n);
        buf.pos += n;
        return static_cast<int64_t>(n);
    };
    Protocol<Buffer>::SeekFn seek;
    Protocol<Buffer>::SizeFn size;
    if (seekable)
    {
        seek = [](Buffer &buf, int64_t offset) -> int64_t {
            if (offset < 0 || static_cast<std::size_t>(offset) > buf.data.size())
                return MPV_ERROR_GENERIC;
            buf.pos = static_cast<std::size_t>(offset);
            return offset;
        };
        size = [](Buffer &buf) { return static_cast<int64_t>(buf.data.size()); };
    }
    return std::make_unique<Protocol<Buffer>>(name, open, close, read, seek, size);
}

} // namespace

TEST(Protocol, StreamCallbacks)
{
    auto protocol = memoryProtocol("mem", true);
    mpv_stream_cb_info info{};
    ASSERT_EQ(protocol->open("mem://hello world", &info), 0);
    ASSERT_NE(info.cookie, nullptr);
    ASSERT_NE(info.read_fn, nullptr);
    ASSERT_NE(info.seek_fn, nullptr);
    ASSERT_NE(info.size_fn, nullptr);
    ASSERT_NE(info.close_fn, nullptr);

    EXPECT_EQ(info.size_fn(info.cookie), 11);
    char buf[8] = {};
    EXPECT_EQ(info.read_fn(info.cookie, buf, 5), 5);
    EXPECT_EQ(std::string(buf, 5), "hello");
    EXPECT_EQ(info.seek_fn(info.cookie, 6), 6);
    EXPECT_EQ(info.read_fn(info.cookie, buf, sizeof(buf)), 5);
    EXPECT_EQ(std::string(buf, 5), "world");
    EXPECT_EQ(info.read_fn(info.cookie, buf, sizeof(buf)), 0);
    EXPECT_EQ(info.seek_fn(info.cookie, 100), MPV_ERROR_GENERIC);

    const int before = closed;
    info.close_fn(info.cookie);
    EXPECT_EQ(closed, before + 1);
}

TEST(Protocol, OptionalCallbacksStayNull)
{
    auto protocol = memoryProtocol("mem", false);
    mpv_stream_cb_info info{};
    ASSERT_EQ(protocol->open("mem://abc", &info), 0);
    EXPECT_EQ(info.seek_fn, nullptr);
    EXPECT_EQ(info.size_fn, nullptr);
    info.close_fn(info.cookie);
}

TEST(Protocol, OpenFailureIsReported)
{
    auto protocol = memoryProtocol("mem", true);
    mpv_stream_cb_info info{};
    EXPECT_EQ(protocol->open("mem://fail", &info), MPV_ERROR_LOADING_FAILED);
    EXPECT_EQ(info.cookie, nullptr);
}

struct TrackedCookie
{
    explicit TrackedCookie(int *alive) : alive(alive)
    {
        ++*alive;
    }

    TrackedCookie(TrackedCookie &&other) noexcept : alive(std::exchange(other.alive, nullptr)) {}

    TrackedCookie(const TrackedCookie &) = delete;
    TrackedCookie &operator=(const TrackedCookie &) = delete;

    ~TrackedCookie()
    {
        if (alive)
            --*alive;
    }

    int *alive;
};

TEST(Protocol, CloseReleasesStreamState)
{
    int alive = 0;
    Protocol<TrackedCookie> protocol(
        "tracked",
        [&alive](const std::string &uri) {
            if (uri == "tracked://fail")
                throw std::runtime_error("refused");
            return TrackedCookie(&alive);
        },
        [](TrackedCookie &) {},
        [](TrackedCookie &, char *, uint64_t) -> int64_t { return 0; });

    mpv_stream_cb_info first{};
    mpv_stream_cb_info second{};
    ASSERT_EQ(protocol.open("tracked://a", &first), 0);
    ASSERT_EQ(protocol.open("tracked://b", &second), 0);
    EXPECT_EQ(alive, 2);

    first.close_fn(first.cookie);
    EXPECT_EQ(alive, 1);

    mpv_stream_cb_info failed{};
    EXPECT_EQ(protocol.open("tracked://fail", &failed), MPV_ERROR_LOADING_FAILED);
    EXPECT_EQ(failed.cookie, nullptr);
    EXPECT_EQ(alive, 1);

    second.close_fn(second.cookie);
    EXPECT_EQ(alive, 0);
}

TEST(Protocol, ReadExceptionBecomesError)
{
    Protocol<int> protocol(
        "broken",
        [](const std::string &) { return 0; },
        [](int &) {},
        [](int &, char *, uint64_t) -> int64_t { throw std::runtime_error("disk gone"); });
    mpv_stream_cb_info info{};
    ASSERT_EQ(protocol.open("broken://x", &info), 0);
    char buf[4];
    EXPECT_EQ(info.read_fn(info.cookie, buf, sizeof(buf)), -1);
    info.close_fn(info.cookie);
}

TEST(Protocol, RegisterWithCore)
{
    auto created = Mpv::create([](PropertyAccess &core) { return core.setOptionString("vo", "null"); });
    ASSERT_TRUE(created) << created.error().message;
    Mpv &mpv = created.value();

    EXPECT_TRUE(mpv.registerProtocol(memoryProtocol("memtest", true)));
    auto duplicate = mpv.registerProtocol(memoryProtocol("memtest", true));
    ASSERT_FALSE(duplicate);
    EXPECT_LT(duplicate.error().code, 0);

    auto null = mpv.registerProtocol(nullptr);
    ASSERT_FALSE(null);
    EXPECT_EQ(null.error().code, MPV_ERROR_INVALID_PARAMETER);
}
