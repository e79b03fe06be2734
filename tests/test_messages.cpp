#include <gtest/gtest.h>

#include "proto/messages.hpp"

using namespace proto;

TEST(Messages, FramesCommandWithHeader)
{
    HubPropertiesCmd cmd(prop::ADVERTISE_NAME, prop::OP_UPD_REQUEST);
    EXPECT_EQ(cmd.bytes(), (Bytes{0x05, 0x00, 0x01, 0x01, 0x05}));
    EXPECT_TRUE(cmd.needs_reply());

    HubPropertiesCmd enable(prop::BUTTON, prop::OP_UPD_ENABLE);
    EXPECT_FALSE(enable.needs_reply());
}

TEST(Messages, PortInputFormatSetupLayout)
{
    PortInputFmtSetupSingleCmd cmd(0x3A, 0x02, 0x01020304, false);
    EXPECT_EQ(cmd.bytes(), (Bytes{0x0A, 0x00, 0x41, 0x3A, 0x02, 0x04, 0x03, 0x02, 0x01, 0x00}));
}

TEST(Messages, OversizedPayloadDoesNotEncode)
{
    HubPropertiesCmd cmd(prop::ADVERTISE_NAME, prop::OP_SET, Bytes(MAX_FRAME, 'x'));
    EXPECT_TRUE(cmd.bytes().empty());
}

TEST(Messages, DecodesAttachedIo)
{
    auto msg = decode({0x0F, 0x00, 0x04, 0x00, 0x01, 0x27, 0x00, 0, 0, 0, 0, 0, 0, 0, 0});
    ASSERT_TRUE(msg);
    ASSERT_EQ(msg->type(), MsgType::HubAttachedIo);
    const auto &io = static_cast<const HubAttachedIoMsg &>(*msg);
    EXPECT_EQ(io.port(), 0x00);
    EXPECT_EQ(io.event(), io_event::ATTACHED);
    ASSERT_TRUE(io.device_type());
    EXPECT_EQ(*io.device_type(), dev::MOTOR_INTERNAL_TACHO);
    EXPECT_FALSE(io.virtual_ports());
}

TEST(Messages, DecodesVirtualAttach)
{
    auto msg = decode(HubAttachedIoMsg::attached_virtual(0x10, dev::MOTOR_INTERNAL_TACHO, 0, 1).bytes());
    ASSERT_TRUE(msg);
    const auto &io = static_cast<const HubAttachedIoMsg &>(*msg);
    auto        vp = io.virtual_ports();
    ASSERT_TRUE(vp);
    EXPECT_EQ(vp->first, 0x00);
    EXPECT_EQ(vp->second, 0x01);
}

TEST(Messages, DetachHasNoDeviceType)
{
    HubAttachedIoMsg io = HubAttachedIoMsg::detached(0x02);
    EXPECT_FALSE(io.device_type());
    EXPECT_EQ(io.bytes(), (Bytes{0x05, 0x00, 0x04, 0x02, 0x00}));
}

TEST(Messages, RejectsShortUnknownAndTruncatedFrames)
{
    EXPECT_FALSE(decode({0x02, 0x00}));
    EXPECT_FALSE(decode({0x04, 0x00, 0x7E, 0x01}));
    EXPECT_FALSE(decode({0x04, 0x00, 0x05, 0x01}));
}

TEST(Messages, PropertyReplyCorrelatesByProperty)
{
    HubPropertiesCmd name(prop::ADVERTISE_NAME, prop::OP_UPD_REQUEST);
    HubPropertiesCmd mac(prop::PRIMARY_MAC, prop::OP_UPD_REQUEST);

    HubPropertiesMsg reply(prop::ADVERTISE_NAME, prop::OP_UPSTREAM_UPDATE, {'L', 'E', 'G', 'O'});
    EXPECT_TRUE(reply.is_reply_to(name));
    EXPECT_FALSE(reply.is_reply_to(mac));
    EXPECT_EQ(reply.as_string(), "LEGO");

    HubPropertiesMsg not_update(prop::ADVERTISE_NAME, prop::OP_SET, {});
    EXPECT_FALSE(not_update.is_reply_to(name));
}

TEST(Messages, ActionReplyCorrelation)
{
    HubActionCmd off(action::SWITCH_OFF);
    HubActionCmd disc(action::DISCONNECT);
    HubActionCmd busy(action::BUSY_INDICATION_ON);

    EXPECT_TRUE(off.needs_reply());
    EXPECT_TRUE(disc.needs_reply());
    EXPECT_FALSE(busy.needs_reply());

    EXPECT_TRUE(HubActionMsg(action::UPSTREAM_SHUTDOWN).is_reply_to(off));
    EXPECT_TRUE(HubActionMsg(action::UPSTREAM_DISCONNECT).is_reply_to(disc));
    EXPECT_FALSE(HubActionMsg(action::UPSTREAM_DISCONNECT).is_reply_to(off));
}

TEST(Messages, AlertAndInputFormatCorrelation)
{
    HubAlertCmd req(alert::LOW_VOLTAGE, alert::OP_UPD_REQUEST);
    EXPECT_TRUE(HubAlertMsg(alert::LOW_VOLTAGE, alert::OP_UPSTREAM_UPDATE, 0).is_reply_to(req));
    EXPECT_FALSE(HubAlertMsg(alert::HIGH_CURRENT, alert::OP_UPSTREAM_UPDATE, 0).is_reply_to(req));

    PortInputFmtSetupSingleCmd setup(0x3A, 0);
    EXPECT_TRUE(PortInputFmtSingleMsg(0x3A, 0, 1, true).is_reply_to(setup));
    EXPECT_FALSE(PortInputFmtSingleMsg(0x3B, 0, 1, true).is_reply_to(setup));
}

TEST(Messages, VirtualPortSetupCorrelation)
{
    auto conn = VirtualPortSetupCmd::connect(0x00, 0x01);
    EXPECT_EQ(conn.payload(), (Bytes{0x01, 0x00, 0x01}));
    EXPECT_TRUE(HubAttachedIoMsg::attached_virtual(0x10, dev::MOTOR, 0x00, 0x01).is_reply_to(conn));
    EXPECT_FALSE(HubAttachedIoMsg::attached_virtual(0x10, dev::MOTOR, 0x01, 0x00).is_reply_to(conn));

    auto disc = VirtualPortSetupCmd::disconnect(0x10);
    EXPECT_TRUE(HubAttachedIoMsg::detached(0x10).is_reply_to(disc));
}

TEST(Messages, GenericErrorText)
{
    GenericErrorMsg e(0x01, err::COMMAND_NOT_RECOGNIZED);
    EXPECT_EQ(e.message(), "Command 0x01 caused error 0x05: Command not recognized");
}

namespace
{
std::unique_ptr<UpstreamMsg> decode_as_value(const Bytes &frame)
{
    return PortValueSingleMsg::decode(frame);
}
}  // namespace

TEST(Messages, RegisteredDecoderExtendsRegistry)
{
    constexpr std::uint8_t kType = 0x7D;
    EXPECT_FALSE(has_decoder(kType));
    register_decoder(kType, &decode_as_value);
    EXPECT_TRUE(has_decoder(kType));

    auto msg = decode({0x05, 0x00, kType, 0x3C, 0x20});
    ASSERT_TRUE(msg);
    EXPECT_EQ(static_cast<const PortValueMsg &>(*msg).value(), (Bytes{0x20}));
}
