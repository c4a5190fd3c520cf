//===----------------------------------------------------------------------===//
//
// Part of the mpvbind project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/client/EventTests.cpp
// Purpose: Exercise event delivery: property observation, async replies,
//          the wakeup callback and hook registration.
// Key invariants: Reply events carry the reply id of their request.
// Ownership/Lifetime: Each test owns its core; events are copied out of
//                     libmpv before the next wait.
// Links: src/client/Events.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "client/Mpv.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

using namespace mpvbind::client;
using mpvbind::support::Expected;

namespace
{

Mpv makeCore()
{
    auto created = Mpv::create([](PropertyAccess &core) -> Expected<void> {
        if (auto ok = core.setOptionString("vo", "null"); !ok)
            return ok;
        return core.setOptionString("ao", "null");
    });
    if (!created)
        throw std::runtime_error(created.error().message);
    return std::move(created.value());
}

/// Wait for the first event of type @p id with reply id @p replyId.
std::optional<Event> waitFor(const Mpv &mpv, mpv_event_id id, uint64_t replyId)
{
    for (int i = 0; i < 200; ++i)
    {
        auto event = mpv.events().waitEvent(0.05);
        if (event && event->id == id && event->replyId == replyId)
            return event;
    }
    return std::nullopt;
}

} // namespace

TEST(Events, ObservedPropertyReportsCurrentValue)
{
    Mpv mpv = makeCore();
    ASSERT_TRUE(mpv.setProperty("volume", 60.0));
    ASSERT_TRUE(mpv.events().observeProperty("volume", MPV_FORMAT_DOUBLE, 7));

    auto event = waitFor(mpv, MPV_EVENT_PROPERTY_CHANGE, 7);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->name, "property-change");
    const auto *change = std::get_if<PropertyChange>(&event->payload);
    ASSERT_NE(change, nullptr);
    EXPECT_EQ(change->name, "volume");
    EXPECT_EQ(change->format, MPV_FORMAT_DOUBLE);
    ASSERT_TRUE(std::holds_alternative<double>(change->value));
    EXPECT_DOUBLE_EQ(std::get<double>(change->value), 60.0);

    auto removed = mpv.events().unobserveProperty(7);
    ASSERT_TRUE(removed);
    EXPECT_EQ(removed.value(), 1);
}

TEST(Events, AsyncReplies)
{
    Mpv mpv = makeCore();
    ASSERT_TRUE(mpv.commandAsync(5, "set", {"volume", "30"}));
    auto reply = waitFor(mpv, MPV_EVENT_COMMAND_REPLY, 5);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->error, 0);

    ASSERT_TRUE(mpv.getPropertyAsync(11, "volume", MPV_FORMAT_DOUBLE));
    auto value = waitFor(mpv, MPV_EVENT_GET_PROPERTY_REPLY, 11);
    ASSERT_TRUE(value.has_value());
    const auto *change = std::get_if<PropertyChange>(&value->payload);
    ASSERT_NE(change, nullptr);
    EXPECT_DOUBLE_EQ(std::get<double>(change->value), 30.0);

    ASSERT_TRUE(mpv.setPropertyAsync(12, "volume", 45.0));
    auto set = waitFor(mpv, MPV_EVENT_SET_PROPERTY_REPLY, 12);
    ASSERT_TRUE(set.has_value());
    EXPECT_EQ(set->error, 0);
    mpv.waitAsyncRequests();
}

TEST(Events, FailedAsyncCommandCarriesError)
{
    Mpv mpv = makeCore();
    ASSERT_TRUE(mpv.commandAsync(9, "set", {"no-such-property", "1"}));
    auto reply = waitFor(mpv, MPV_EVENT_COMMAND_REPLY, 9);
    ASSERT_TRUE(reply.has_value());
    EXPECT_LT(reply->error, 0);
}

TEST(Events, WakeupCallbackRuns)
{
    Mpv mpv = makeCore();
    std::mutex mutex;
    std::condition_variable cv;
    bool woken = false;
    mpv.setWakeupCallback([&] {
        std::lock_guard<std::mutex> lock(mutex);
        woken = true;
        cv.notify_all();
    });

    ASSERT_TRUE(mpv.setPropertyAsync(3, "volume", 20.0));
    {
        std::unique_lock<std::mutex> lock(mutex);
        EXPECT_TRUE(cv.wait_for(lock, std::chrono::seconds(5), [&] { return woken; }));
    }
    mpv.setWakeupCallback({});
}

TEST(Events, ThrowingWakeupCallbackIsContained)
{
    Mpv mpv = makeCore();
    std::atomic<int> calls{0};
    mpv.setWakeupCallback([&calls] {
        ++calls;
        throw std::runtime_error("wakeup handler failed");
    });

    ASSERT_TRUE(mpv.setPropertyAsync(21, "volume", 35.0));
    auto reply = waitFor(mpv, MPV_EVENT_SET_PROPERTY_REPLY, 21);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->error, 0);
    EXPECT_GT(calls.load(), 0);

    mpv.setWakeupCallback({});
    auto volume = mpv.getProperty<double>("volume");
    ASSERT_TRUE(volume);
    EXPECT_DOUBLE_EQ(volume.value(), 35.0);
}

TEST(Events, EventFilteringAndLogs)
{
    Mpv mpv = makeCore();
    EXPECT_TRUE(mpv.events().disableEvent(MPV_EVENT_IDLE));
    EXPECT_TRUE(mpv.events().enableEvent(MPV_EVENT_IDLE));
    EXPECT_TRUE(mpv.events().requestLogMessages("warn"));
    EXPECT_TRUE(mpv.events().requestLogMessages("no"));
    EXPECT_FALSE(mpv.events().requestLogMessages("chatty"));
}

TEST(Events, HookRegistration)
{
    Mpv mpv = makeCore();
    EXPECT_TRUE(mpv.events().addHook("on_load", 0, 4));
    EXPECT_FALSE(mpv.events().addHook(std::string("on\0load", 7), 0, 4));
}

TEST(Events, PollingWithoutEventsTimesOut)
{
    Mpv mpv = makeCore();
    for (int i = 0; i < 200; ++i)
    {
        if (!mpv.events().waitEvent(0.0))
            return;
    }
    FAIL() << "event queue never drained";
}
