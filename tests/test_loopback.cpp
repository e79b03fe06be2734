#include <gtest/gtest.h>

#include "transport/loopback_connection.hpp"
#include "util/constants.hpp"

using namespace transport;

TEST(Loopback, RecordsWritesAndAnswersThroughResponder)
{
    LoopbackConnection c;
    std::vector<Frame> notified;
    std::uint16_t      seen_handle = 0;

    c.set_notify_handler([&](std::uint16_t h, const Frame &f) {
        seen_handle = h;
        notified.push_back(f);
    });
    c.set_responder([](const Frame &w) { return std::vector<Frame>{w, {0x03, 0x00, 0x02}}; });

    Frame f = {0x04, 0x00, 0x02, 0x02};
    EXPECT_TRUE(c.write(constants::HUB_HARDWARE_HANDLE, f));

    ASSERT_EQ(c.write_count(), 1u);
    EXPECT_EQ(c.written()[0], f);
    ASSERT_EQ(notified.size(), 2u);
    EXPECT_EQ(notified[0], f);
    EXPECT_EQ(seen_handle, constants::HUB_HARDWARE_HANDLE);
}

TEST(Loopback, InjectWithoutHandlerIsDropped)
{
    LoopbackConnection c;
    c.inject({0x05, 0x00, 0x04, 0x00, 0x01});
    EXPECT_EQ(c.write_count(), 0u);
}

TEST(Loopback, WriteFailsAfterDisconnect)
{
    LoopbackConnection c;
    EXPECT_TRUE(c.enable_notifications());
    EXPECT_TRUE(c.notifications_enabled());

    c.disconnect();
    c.disconnect();
    EXPECT_EQ(c.disconnect_count(), 1);
    EXPECT_FALSE(c.is_alive());
    EXPECT_FALSE(c.notifications_enabled());

    Frame f = {0x42};
    EXPECT_FALSE(c.write(constants::HUB_HARDWARE_HANDLE, f));
    EXPECT_FALSE(c.enable_notifications());
}
