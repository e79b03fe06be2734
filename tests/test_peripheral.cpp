#include <atomic>
#include <chrono>
#include <future>
#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "hub/hub.hpp"
#include "transport/loopback_connection.hpp"

using namespace hub;
using transport::Frame;
using transport::LoopbackConnection;

namespace
{

template <class Pred> bool eventually(Pred p, int timeout_ms = 2000)
{
    const auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < until)
    {
        if (p())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return p();
}

// Acknowledges every input format setup like the hub does.
std::vector<Frame> ack_input_format(const Frame &w)
{
    if (w.size() == 10 && w[2] == 0x41)
        return {proto::PortInputFmtSingleMsg(w[3], w[4], 1, w[9] != 0).bytes()};
    return {};
}

struct PeripheralFixture : ::testing::Test
{
    LoopbackConnection  *conn = nullptr;
    std::unique_ptr<Hub> hub;

    void SetUp() override
    {
        auto c = std::make_unique<LoopbackConnection>();
        conn   = c.get();
        hub    = std::make_unique<Hub>(std::move(c));
        conn->inject(proto::HubAttachedIoMsg::attached(0x3A, proto::dev::TILT_INTERNAL).bytes());
    }

    void value(std::uint8_t port, proto::Bytes v)
    {
        conn->inject(proto::PortValueSingleMsg(port, std::move(v)).bytes());
    }
};

}  // namespace

TEST_F(PeripheralFixture, SubscribeSendsInputFormatAndDeliversValues)
{
    conn->set_responder(&ack_input_format);
    auto tilt = hub->peripheral(0x3A);
    ASSERT_TRUE(tilt);

    std::mutex                mu;
    std::vector<proto::Bytes> got;
    ASSERT_TRUE(tilt->subscribe(
        [&](std::uint8_t port, const proto::Bytes &v) {
            EXPECT_EQ(port, 0x3A);
            std::lock_guard<std::mutex> lk(mu);
            got.push_back(v);
        },
        2));

    ASSERT_EQ(conn->write_count(), 1u);
    EXPECT_EQ(conn->written()[0], (Frame{0x0A, 0x00, 0x41, 0x3A, 0x02, 0x01, 0x00, 0x00, 0x00, 0x01}));
    ASSERT_TRUE(tilt->subscribed_mode());
    EXPECT_EQ(*tilt->subscribed_mode(), 2);

    value(0x3A, {0x05, 0xFB});
    value(0x3A, {0x00, 0x00});

    ASSERT_TRUE(eventually([&] {
        std::lock_guard<std::mutex> lk(mu);
        return got.size() == 2;
    }));
    std::lock_guard<std::mutex> lk(mu);
    EXPECT_EQ(tilt->values_seen(), 2u);
    EXPECT_EQ(got[0], (proto::Bytes{0x05, 0xFB}));
    EXPECT_EQ(got[1], (proto::Bytes{0x00, 0x00}));
    EXPECT_EQ(tilt->last_value(), (proto::Bytes{0x00, 0x00}));
}

TEST_F(PeripheralFixture, ValuesWithoutSubscriptionAreStillRecorded)
{
    auto tilt = hub->peripheral(0x3A);
    value(0x3A, {0x11});
    ASSERT_TRUE(eventually([&] { return tilt->values_seen() == 1; }));
    EXPECT_EQ(tilt->last_value(), (proto::Bytes{0x11}));
}

TEST_F(PeripheralFixture, ValueForUnattachedPortIsDropped)
{
    value(0x05, {0x01});
    EXPECT_FALSE(hub->desynced());
    EXPECT_EQ(hub->peripheral(0x3A)->values_seen(), 0u);
}

TEST_F(PeripheralFixture, FailedSubscribeLeavesNoState)
{
    conn->set_responder([](const Frame &w) {
        return std::vector<Frame>{proto::GenericErrorMsg(w[2], proto::err::INVALID_USE).bytes()};
    });
    auto tilt = hub->peripheral(0x3A);
    EXPECT_FALSE(tilt->subscribe([](std::uint8_t, const proto::Bytes &) {}));
    EXPECT_FALSE(tilt->subscribed_mode());
}

TEST_F(PeripheralFixture, UnsubscribeDisablesUpdates)
{
    conn->set_responder(&ack_input_format);
    auto tilt = hub->peripheral(0x3A);

    // nothing to undo
    EXPECT_TRUE(tilt->unsubscribe());
    EXPECT_EQ(conn->write_count(), 0u);

    ASSERT_TRUE(tilt->subscribe([](std::uint8_t, const proto::Bytes &) {}, 1));
    ASSERT_TRUE(tilt->unsubscribe());
    ASSERT_EQ(conn->write_count(), 2u);
    EXPECT_EQ(conn->written()[1].back(), 0x00);
    EXPECT_FALSE(tilt->subscribed_mode());
}

TEST_F(PeripheralFixture, DetachedPeripheralOutlivesTrackingButNotHub)
{
    auto tilt = hub->peripheral(0x3A);
    conn->inject(proto::HubAttachedIoMsg::detached(0x3A).bytes());
    EXPECT_FALSE(hub->peripheral(0x3A));
    EXPECT_EQ(tilt->port(), 0x3A);
    tilt.reset();
    hub.reset();
}

TEST_F(PeripheralFixture, CallbackMayDropTheLastReference)
{
    conn->set_responder(&ack_input_format);
    std::shared_ptr<Peripheral> held = hub->peripheral(0x3A);
    std::weak_ptr<Peripheral>   watch = held;

    std::promise<void>       gate;
    std::shared_future<void> opened = gate.get_future().share();
    std::atomic<bool>        released{false};
    ASSERT_TRUE(held->subscribe([&, opened](std::uint8_t, const proto::Bytes &) {
        opened.wait();
        held.reset();
        released = true;
    }));

    value(0x3A, {0x01});
    conn->inject(proto::HubAttachedIoMsg::detached(0x3A).bytes());
    EXPECT_FALSE(hub->peripheral(0x3A));
    gate.set_value();

    ASSERT_TRUE(eventually([&] { return released.load(); }));
    ASSERT_TRUE(eventually([&] { return watch.expired(); }));

    // the port can be reused right away
    conn->inject(proto::HubAttachedIoMsg::attached(0x3A, proto::dev::TILT_INTERNAL).bytes());
    auto again = hub->peripheral(0x3A);
    ASSERT_TRUE(again);
    value(0x3A, {0x02});
    ASSERT_TRUE(eventually([&] { return again->values_seen() == 1; }));
    EXPECT_FALSE(hub->desynced());
}

TEST_F(PeripheralFixture, DetachWhileCallbackAwaitsReplyDoesNotStallDelivery)
{
    conn->set_responder(&ack_input_format);
    auto        tilt = hub->peripheral(0x3A);
    Peripheral *raw  = tilt.get();

    std::atomic<bool> finished{false};
    std::atomic<bool> unsubscribed{false};
    ASSERT_TRUE(tilt->subscribe([&, raw](std::uint8_t, const proto::Bytes &) {
        unsubscribed = raw->unsubscribe();
        finished     = true;
    }));

    // the hub stays silent; the reply is injected by hand below
    conn->set_responder([](const Frame &) { return std::vector<Frame>{}; });
    std::weak_ptr<Peripheral> watch = tilt;
    tilt.reset();

    value(0x3A, {0x01});
    ASSERT_TRUE(eventually([&] { return conn->write_count() == 2; }));

    // returns although the reader is still waiting inside unsubscribe()
    conn->inject(proto::HubAttachedIoMsg::detached(0x3A).bytes());
    EXPECT_FALSE(hub->peripheral(0x3A));
    EXPECT_FALSE(finished.load());

    conn->inject(proto::HubAttachedIoMsg::attached(0x3B, proto::dev::CURRENT).bytes());
    EXPECT_TRUE(hub->peripheral(0x3B));

    conn->inject(proto::PortInputFmtSingleMsg(0x3A, 0x00, 1, false).bytes());
    ASSERT_TRUE(eventually([&] { return finished.load(); }));
    EXPECT_TRUE(unsubscribed.load());
    EXPECT_TRUE(eventually([&] { return watch.expired(); }));
    EXPECT_FALSE(hub->desynced());
}
