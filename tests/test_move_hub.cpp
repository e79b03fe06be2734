#include <chrono>
#include <cstdlib>
#include <gtest/gtest.h>
#include <memory>
#include <thread>
#include <vector>

#include "hub/move_hub.hpp"
#include "transport/loopback_connection.hpp"

using namespace hub;
using proto::HubAttachedIoMsg;
using transport::Frame;
using transport::LoopbackConnection;

namespace
{

// Answers the start-up status queries of a healthy hub.
std::vector<Frame> healthy_hub(const Frame &w)
{
    if (w.size() >= 5 && w[2] == 0x01 && w[4] == proto::prop::OP_UPD_REQUEST)
    {
        proto::Bytes params;
        switch (w[3])
        {
            case proto::prop::ADVERTISE_NAME:
                params = {'M', 'o', 'v', 'e', ' ', 'H', 'u', 'b'};
                break;
            case proto::prop::PRIMARY_MAC:
                params = {0x00, 0x16, 0x53, 0xA1, 0xB2, 0xC3};
                break;
            case proto::prop::VOLTAGE_PERC:
                params = {87};
                break;
            default:
                return {};
        }
        return {proto::HubPropertiesMsg(w[3], proto::prop::OP_UPSTREAM_UPDATE, params).bytes()};
    }
    if (w.size() >= 5 && w[2] == 0x03 && w[4] == proto::alert::OP_UPD_REQUEST)
        return {proto::HubAlertMsg(w[3], proto::alert::OP_UPSTREAM_UPDATE, 0).bytes()};
    return {};
}

std::vector<Frame> builtin_devices()
{
    return {
        HubAttachedIoMsg::attached(MoveHub::PORT_A, proto::dev::MOTOR_INTERNAL_TACHO).bytes(),
        HubAttachedIoMsg::attached(MoveHub::PORT_B, proto::dev::MOTOR_INTERNAL_TACHO).bytes(),
        HubAttachedIoMsg::attached_virtual(MoveHub::PORT_AB, proto::dev::MOTOR_INTERNAL_TACHO,
                                           MoveHub::PORT_A, MoveHub::PORT_B)
            .bytes(),
        HubAttachedIoMsg::attached(MoveHub::PORT_LED, proto::dev::RGB_LIGHT).bytes(),
        HubAttachedIoMsg::attached(MoveHub::PORT_TILT, proto::dev::TILT_INTERNAL).bytes(),
        HubAttachedIoMsg::attached(MoveHub::PORT_CURRENT, proto::dev::CURRENT).bytes(),
        HubAttachedIoMsg::attached(MoveHub::PORT_VOLTAGE, proto::dev::VOLTAGE).bytes(),
    };
}

// Builds a MoveHub while a second thread announces `devices` the way a hub
// does right after notifications are switched on.
struct MoveHubRig
{
    LoopbackConnection      *conn = nullptr;
    std::unique_ptr<MoveHub> hub;

    MoveHubRig(LoopbackConnection::Responder responder,
               std::vector<Frame>            devices,
               MoveHubConfig                 mcfg,
               HubConfig                     cfg = HubConfig{})
    {
        auto c = std::make_unique<LoopbackConnection>();
        conn   = c.get();
        conn->set_responder(std::move(responder));

        LoopbackConnection *raw = conn;
        std::thread         feeder([raw, devices] {
            while (!raw->notifications_enabled())
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            for (const auto &f : devices)
                raw->inject(f);
        });
        hub = std::make_unique<MoveHub>(std::move(c), mcfg, cfg);
        feeder.join();
    }
};

MoveHubConfig patient()
{
    MoveHubConfig m;
    m.wait_attempts    = 400;
    m.wait_interval_ms = 5;
    return m;
}

MoveHubConfig impatient()
{
    MoveHubConfig m;
    m.wait_attempts    = 1;
    m.wait_interval_ms = 1;
    return m;
}

}  // namespace

TEST(MoveHub, BindsBuiltinDevicesAndReportsStatus)
{
    std::vector<Frame> devices = builtin_devices();
    devices.push_back(HubAttachedIoMsg::attached(MoveHub::PORT_C, proto::dev::VISION_SENSOR).bytes());
    devices.push_back(
        HubAttachedIoMsg::attached(MoveHub::PORT_D, proto::dev::MOTOR_EXTERNAL_TACHO).bytes());

    MoveHubRig rig(&healthy_hub, devices, patient());
    MoveHub   &h = *rig.hub;

    EXPECT_TRUE(h.missing_devices().empty());
    ASSERT_TRUE(h.motor_a());
    EXPECT_EQ(h.motor_a()->capability(), Capability::EncodedMotor);
    ASSERT_TRUE(h.motor_ab());
    EXPECT_TRUE(h.motor_ab()->virtual_ports());
    EXPECT_EQ(h.led()->capability(), Capability::RgbLight);
    EXPECT_EQ(h.tilt_sensor()->capability(), Capability::TiltSensor);
    EXPECT_EQ(h.current()->capability(), Capability::CurrentSensor);
    EXPECT_EQ(h.voltage()->capability(), Capability::VoltageSensor);

    EXPECT_EQ(h.vision_sensor(), h.port_c());
    EXPECT_EQ(h.motor_external(), h.port_d());
    ASSERT_TRUE(h.motor_external());

    HubInfo info = h.info();
    ASSERT_TRUE(info.name);
    EXPECT_EQ(*info.name, "Move Hub");
    ASSERT_TRUE(info.mac);
    EXPECT_EQ(*info.mac, "00:16:53:A1:B2:C3");
    ASSERT_TRUE(info.battery_percent);
    EXPECT_EQ(*info.battery_percent, 87u);
    ASSERT_TRUE(info.low_voltage);
    EXPECT_FALSE(*info.low_voltage);

    // four status queries, in this order
    auto w = rig.conn->written();
    ASSERT_EQ(w.size(), 4u);
    EXPECT_EQ(w[0][3], proto::prop::ADVERTISE_NAME);
    EXPECT_EQ(w[1][3], proto::prop::PRIMARY_MAC);
    EXPECT_EQ(w[2][3], proto::prop::VOLTAGE_PERC);
    EXPECT_EQ(w[3][2], 0x03);
}

TEST(MoveHub, MissingDevicesDoNotFailConstruction)
{
    std::vector<Frame> devices = {
        HubAttachedIoMsg::attached(MoveHub::PORT_A, proto::dev::MOTOR_INTERNAL_TACHO).bytes()};
    MoveHubRig rig(&healthy_hub, devices, impatient());

    auto missing = rig.hub->missing_devices();
    EXPECT_EQ(missing, (std::vector<std::string>{"motor B", "motor AB", "LED", "tilt sensor",
                                                 "current sensor", "voltage sensor"}));
    EXPECT_FALSE(rig.hub->desynced());
    EXPECT_TRUE(rig.hub->info().name);
}

TEST(MoveHub, UnansweredQueriesLeaveInfoEmpty)
{
    HubConfig cfg;
    cfg.reply_timeout_ms = 20;
    MoveHubRig rig(nullptr, builtin_devices(), patient(), cfg);

    HubInfo info = rig.hub->info();
    EXPECT_FALSE(info.name);
    EXPECT_FALSE(info.mac);
    EXPECT_FALSE(info.battery_percent);
    EXPECT_FALSE(info.low_voltage);
    EXPECT_TRUE(rig.hub->is_connected());
}

TEST(MoveHub, LowVoltageAlert)
{
    MoveHubRig rig(
        [](const Frame &w) {
            if (w[2] == 0x03)
                return std::vector<Frame>{
                    proto::HubAlertMsg(w[3], proto::alert::OP_UPSTREAM_UPDATE, 0xFF).bytes()};
            return healthy_hub(w);
        },
        builtin_devices(), patient());

    auto info = rig.hub->info();
    ASSERT_TRUE(info.low_voltage);
    EXPECT_TRUE(*info.low_voltage);
}

TEST(MoveHub, DetachClearsNamedSlots)
{
    std::vector<Frame> devices = builtin_devices();
    devices.push_back(HubAttachedIoMsg::attached(MoveHub::PORT_C, proto::dev::VISION_SENSOR).bytes());
    MoveHubRig rig(&healthy_hub, devices, patient());
    ASSERT_TRUE(rig.hub->vision_sensor());

    rig.conn->inject(HubAttachedIoMsg::detached(MoveHub::PORT_C).bytes());
    EXPECT_FALSE(rig.hub->port_c());
    EXPECT_FALSE(rig.hub->vision_sensor());
    EXPECT_FALSE(rig.hub->peripheral(MoveHub::PORT_C));

    rig.conn->inject(
        HubAttachedIoMsg::attached(MoveHub::PORT_C, proto::dev::MOTOR_EXTERNAL_TACHO).bytes());
    EXPECT_EQ(rig.hub->port_c(), rig.hub->motor_external());
    ASSERT_TRUE(rig.hub->motor_external());
}

TEST(MoveHub, ButtonUpdates)
{
    MoveHubRig rig(&healthy_hub, builtin_devices(), patient());
    Button    &btn = rig.hub->button();

    std::vector<bool> presses;
    ASSERT_TRUE(btn.subscribe([&](bool down) { presses.push_back(down); }));
    EXPECT_TRUE(btn.subscribed());
    EXPECT_EQ(rig.conn->written().back(), (Frame{0x05, 0x00, 0x01, 0x02, 0x02}));

    rig.conn->inject(proto::HubPropertiesMsg(proto::prop::BUTTON, proto::prop::OP_UPSTREAM_UPDATE,
                                             {0x01})
                         .bytes());
    EXPECT_TRUE(btn.pressed());
    rig.conn->inject(proto::HubPropertiesMsg(proto::prop::BUTTON, proto::prop::OP_UPSTREAM_UPDATE,
                                             {0x00})
                         .bytes());
    EXPECT_FALSE(btn.pressed());
    EXPECT_EQ(presses, (std::vector<bool>{true, false}));

    ASSERT_TRUE(btn.unsubscribe());
    EXPECT_FALSE(btn.subscribed());
    EXPECT_EQ(rig.conn->written().back(), (Frame{0x05, 0x00, 0x01, 0x02, 0x03}));
}

TEST(MoveHubConfigEnv, BoundsAreChecked)
{
    ::setenv("BRICKHUB_WAIT_ATTEMPTS", "5", 1);
    ::setenv("BRICKHUB_WAIT_INTERVAL_MS", "0", 1);
    MoveHubConfig m = MoveHubConfig::from_env();
    EXPECT_EQ(m.wait_attempts, 5u);
    EXPECT_EQ(m.wait_interval_ms, constants::DEVICE_WAIT_INTERVAL_MS);
    ::unsetenv("BRICKHUB_WAIT_ATTEMPTS");
    ::unsetenv("BRICKHUB_WAIT_INTERVAL_MS");
}
