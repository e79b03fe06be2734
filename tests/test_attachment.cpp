#include <gtest/gtest.h>
#include <memory>

#include "hub/attachment_tracker.hpp"
#include "hub/hub.hpp"
#include "transport/loopback_connection.hpp"

using namespace hub;
using proto::HubAttachedIoMsg;

namespace
{

// The tracker needs a hub to hand to the peripherals it builds; it must be
// declared after the hub so its peripherals go first.
struct TrackerFixture : ::testing::Test
{
    Hub               owner{nullptr};
    AttachmentTracker tracker{PeripheralRegistry::defaults()};
};

}  // namespace

TEST_F(TrackerFixture, AttachThenDetachReplay)
{
    auto a = tracker.apply(owner, HubAttachedIoMsg::attached(0x00, proto::dev::MOTOR_INTERNAL_TACHO));
    ASSERT_EQ(a.status, AttachStatus::Attached);
    ASSERT_TRUE(a.peripheral);
    EXPECT_EQ(a.peripheral->capability(), Capability::EncodedMotor);
    EXPECT_EQ(a.peripheral->port(), 0x00);

    auto b = tracker.apply(owner, HubAttachedIoMsg::attached(0x3A, proto::dev::TILT_INTERNAL));
    ASSERT_EQ(b.status, AttachStatus::Attached);
    EXPECT_EQ(tracker.size(), 2u);
    EXPECT_EQ(tracker.find(0x3A), b.peripheral);

    auto d = tracker.apply(owner, HubAttachedIoMsg::detached(0x00));
    EXPECT_EQ(d.status, AttachStatus::Detached);
    EXPECT_EQ(d.peripheral, a.peripheral);
    EXPECT_EQ(tracker.size(), 1u);
    EXPECT_FALSE(tracker.find(0x00));

    // the port can be reused after a detach
    auto again = tracker.apply(owner, HubAttachedIoMsg::attached(0x00, proto::dev::MOTOR));
    EXPECT_EQ(again.status, AttachStatus::Attached);
    EXPECT_EQ(again.peripheral->capability(), Capability::Motor);
}

TEST_F(TrackerFixture, UnknownDeviceTypeBuildsGenericPeripheral)
{
    auto a = tracker.apply(owner, HubAttachedIoMsg::attached(0x02, 0x0042));
    ASSERT_EQ(a.status, AttachStatus::Attached);
    EXPECT_EQ(a.peripheral->capability(), Capability::Generic);
    EXPECT_EQ(a.peripheral->device_type(), 0x0042);
}

TEST_F(TrackerFixture, VirtualAttachRecordsPortPair)
{
    auto a = tracker.apply(owner,
                           HubAttachedIoMsg::attached_virtual(0x10, proto::dev::MOTOR_INTERNAL_TACHO,
                                                              0x00, 0x01));
    ASSERT_EQ(a.status, AttachStatus::Attached);
    auto vp = a.peripheral->virtual_ports();
    ASSERT_TRUE(vp);
    EXPECT_EQ(vp->first, 0x00);
    EXPECT_EQ(vp->second, 0x01);
    EXPECT_NE(a.peripheral->describe().find("virtual 0x00+0x01"), std::string::npos);
}

TEST_F(TrackerFixture, SecondAttachOnOccupiedPortIsRejected)
{
    auto first = tracker.apply(owner, HubAttachedIoMsg::attached(0x01, proto::dev::MOTOR));
    auto dup   = tracker.apply(owner, HubAttachedIoMsg::attached(0x01, proto::dev::VISION_SENSOR));

    EXPECT_EQ(dup.status, AttachStatus::PortOccupied);
    EXPECT_FALSE(dup.peripheral);
    EXPECT_EQ(tracker.find(0x01), first.peripheral);
}

TEST_F(TrackerFixture, DetachOfUntrackedPort)
{
    auto d = tracker.apply(owner, HubAttachedIoMsg::detached(0x03));
    EXPECT_EQ(d.status, AttachStatus::UnknownPort);
    EXPECT_EQ(tracker.size(), 0u);
}

TEST_F(TrackerFixture, MalformedEvents)
{
    EXPECT_EQ(tracker.apply(owner, HubAttachedIoMsg(0x00, 0x07, {0x01, 0x00})).status,
              AttachStatus::BadEvent);
    EXPECT_EQ(tracker.apply(owner, HubAttachedIoMsg(0x00, proto::io_event::ATTACHED, {0x01})).status,
              AttachStatus::BadEvent);
    EXPECT_EQ(tracker
                  .apply(owner, HubAttachedIoMsg(0x10, proto::io_event::ATTACHED_VIRTUAL,
                                                 {0x27, 0x00, 0x00}))
                  .status,
              AttachStatus::BadEvent);
    EXPECT_EQ(tracker.size(), 0u);
}

TEST_F(TrackerFixture, TakeAllEmptiesTheSet)
{
    tracker.apply(owner, HubAttachedIoMsg::attached(0x32, proto::dev::RGB_LIGHT));
    tracker.apply(owner, HubAttachedIoMsg::attached(0x3B, proto::dev::CURRENT));

    PeripheralMap all = tracker.take_all();
    EXPECT_EQ(all.size(), 2u);
    EXPECT_EQ(tracker.size(), 0u);
    EXPECT_EQ(all.at(0x3B)->capability(), Capability::CurrentSensor);
}

TEST(Registry, CustomFactoryReplacesDefault)
{
    PeripheralRegistry reg = PeripheralRegistry::defaults();
    EXPECT_TRUE(reg.knows(proto::dev::VOLTAGE));
    EXPECT_FALSE(reg.knows(proto::dev::PIEZO_SOUND));

    int built = 0;
    reg.add(proto::dev::PIEZO_SOUND, [&](Hub &h, std::uint8_t port, std::uint16_t type) {
        ++built;
        return std::make_shared<RgbLight>(h, port, type);
    });

    Hub  owner(nullptr);
    auto p = reg.create(owner, 0x05, proto::dev::PIEZO_SOUND);
    EXPECT_EQ(built, 1);
    EXPECT_EQ(p->capability(), Capability::RgbLight);
}

TEST(HubAttach, DuplicateAttachDesyncsTheHub)
{
    auto conn = std::make_unique<transport::LoopbackConnection>();
    auto raw  = conn.get();
    Hub  h(std::move(conn));

    raw->inject(HubAttachedIoMsg::attached(0x00, proto::dev::MOTOR).bytes());
    EXPECT_FALSE(h.desynced());
    ASSERT_TRUE(h.peripheral(0x00));

    raw->inject(HubAttachedIoMsg::attached(0x00, proto::dev::MOTOR).bytes());
    EXPECT_TRUE(h.desynced());
    EXPECT_EQ(raw->disconnect_count(), 1);
}

TEST(HubAttach, UnknownDetachDesyncsTheHub)
{
    auto conn = std::make_unique<transport::LoopbackConnection>();
    auto raw  = conn.get();
    Hub  h(std::move(conn));

    raw->inject(HubAttachedIoMsg::detached(0x02).bytes());
    EXPECT_TRUE(h.desynced());
}
