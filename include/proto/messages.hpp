#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/*
Wire frame (LEGO Wireless Protocol, short-length form):

  [0] length of the whole frame (header included)
  [1] hub id, always 0x00
  [2] message type
  [3..] type-specific payload

TX:
hub.send(DownstreamMsg) -> msg.bytes() -> connection.write(HUB_HARDWARE_HANDLE, frame)

RX:
connection notify(frame) -> decode(frame) -> UpstreamMsg
   -> pending.is_reply?  -> waiting sender
   -> handler table      -> attachment tracker / peripherals / variant
*/

namespace proto
{

using Bytes = std::vector<std::uint8_t>;

inline constexpr std::size_t  HDR_SIZE   = 3;
inline constexpr std::size_t  MAX_FRAME  = 127;
inline constexpr std::size_t  TYPE_INDEX = 2;
inline constexpr std::uint8_t HUB_ID     = 0x00;

enum class MsgType : std::uint8_t
{
    HubProperties           = 0x01,
    HubAction               = 0x02,
    HubAlert                = 0x03,
    HubAttachedIo           = 0x04,
    GenericError            = 0x05,
    PortInputFmtSetupSingle = 0x41,
    PortValueSingle         = 0x45,
    PortValueCombined       = 0x46,
    PortInputFmtSingle      = 0x47,
    VirtualPortSetup        = 0x61,
};

// Device type codes reported in attach events
namespace dev
{
constexpr std::uint16_t MOTOR                = 0x0001;
constexpr std::uint16_t SYSTEM_TRAIN_MOTOR   = 0x0002;
constexpr std::uint16_t BUTTON               = 0x0005;
constexpr std::uint16_t LED_LIGHT            = 0x0008;
constexpr std::uint16_t VOLTAGE              = 0x0014;
constexpr std::uint16_t CURRENT              = 0x0015;
constexpr std::uint16_t PIEZO_SOUND          = 0x0016;
constexpr std::uint16_t RGB_LIGHT            = 0x0017;
constexpr std::uint16_t TILT_EXTERNAL        = 0x0022;
constexpr std::uint16_t MOTION_SENSOR        = 0x0023;
constexpr std::uint16_t VISION_SENSOR        = 0x0025;
constexpr std::uint16_t MOTOR_EXTERNAL_TACHO = 0x0026;
constexpr std::uint16_t MOTOR_INTERNAL_TACHO = 0x0027;
constexpr std::uint16_t TILT_INTERNAL        = 0x0028;
}  // namespace dev

class Message
{
  public:
    virtual ~Message() = default;

    virtual MsgType     type() const    = 0;
    virtual Bytes       payload() const = 0;
    virtual std::string describe() const;

    // Full frame with header; empty when the payload does not fit a short frame.
    Bytes bytes() const;
};

class DownstreamMsg : public Message
{
  public:
    virtual bool needs_reply() const { return false; }
};

class UpstreamMsg : public Message
{
  public:
    // Correlation predicate against the request currently awaiting a reply.
    virtual bool is_reply_to(const DownstreamMsg & /*req*/) const { return false; }
};

using UpstreamPtr = std::shared_ptr<const UpstreamMsg>;

// ---------------------------------------------------------------------------
// Hub properties (0x01)
// ---------------------------------------------------------------------------
namespace prop
{
constexpr std::uint8_t ADVERTISE_NAME   = 0x01;
constexpr std::uint8_t BUTTON           = 0x02;
constexpr std::uint8_t FW_VERSION       = 0x03;
constexpr std::uint8_t HW_VERSION       = 0x04;
constexpr std::uint8_t RSSI             = 0x05;
constexpr std::uint8_t VOLTAGE_PERC     = 0x06;
constexpr std::uint8_t BATTERY_TYPE     = 0x07;
constexpr std::uint8_t MANUFACTURER     = 0x08;
constexpr std::uint8_t RADIO_FW_VERSION = 0x09;
constexpr std::uint8_t LWP_VERSION      = 0x0A;
constexpr std::uint8_t SYSTEM_TYPE_ID   = 0x0B;
constexpr std::uint8_t HW_NETW_ID       = 0x0C;
constexpr std::uint8_t PRIMARY_MAC      = 0x0D;
constexpr std::uint8_t SECONDARY_MAC    = 0x0E;

constexpr std::uint8_t OP_SET             = 0x01;
constexpr std::uint8_t OP_UPD_ENABLE      = 0x02;
constexpr std::uint8_t OP_UPD_DISABLE     = 0x03;
constexpr std::uint8_t OP_RESET           = 0x04;
constexpr std::uint8_t OP_UPD_REQUEST     = 0x05;
constexpr std::uint8_t OP_UPSTREAM_UPDATE = 0x06;
}  // namespace prop

class HubPropertiesCmd : public DownstreamMsg
{
  public:
    HubPropertiesCmd(std::uint8_t property, std::uint8_t operation, Bytes parameters = {})
        : property_(property), operation_(operation), parameters_(std::move(parameters))
    {
    }

    MsgType     type() const override { return MsgType::HubProperties; }
    Bytes       payload() const override;
    bool        needs_reply() const override { return operation_ == prop::OP_UPD_REQUEST; }
    std::string describe() const override;

    std::uint8_t property() const { return property_; }
    std::uint8_t operation() const { return operation_; }

  private:
    std::uint8_t property_;
    std::uint8_t operation_;
    Bytes        parameters_;
};

class HubPropertiesMsg : public UpstreamMsg
{
  public:
    HubPropertiesMsg(std::uint8_t property, std::uint8_t operation, Bytes parameters)
        : property_(property), operation_(operation), parameters_(std::move(parameters))
    {
    }
    static std::unique_ptr<UpstreamMsg> decode(const Bytes &frame);

    MsgType     type() const override { return MsgType::HubProperties; }
    Bytes       payload() const override;
    bool        is_reply_to(const DownstreamMsg &req) const override;
    std::string describe() const override;

    std::uint8_t property() const { return property_; }
    std::uint8_t operation() const { return operation_; }
    const Bytes &parameters() const { return parameters_; }
    std::string  as_string() const { return std::string(parameters_.begin(), parameters_.end()); }

  private:
    std::uint8_t property_;
    std::uint8_t operation_;
    Bytes        parameters_;
};

// ---------------------------------------------------------------------------
// Hub actions (0x02)
// ---------------------------------------------------------------------------
namespace action
{
constexpr std::uint8_t SWITCH_OFF           = 0x01;
constexpr std::uint8_t DISCONNECT           = 0x02;
constexpr std::uint8_t VCC_PORT_CONTROL_ON  = 0x03;
constexpr std::uint8_t VCC_PORT_CONTROL_OFF = 0x04;
constexpr std::uint8_t BUSY_INDICATION_ON   = 0x05;
constexpr std::uint8_t BUSY_INDICATION_OFF  = 0x06;
constexpr std::uint8_t SHUTDOWN             = 0x2F;

constexpr std::uint8_t UPSTREAM_SHUTDOWN   = 0x30;
constexpr std::uint8_t UPSTREAM_DISCONNECT = 0x31;
constexpr std::uint8_t UPSTREAM_BOOT_MODE  = 0x32;
}  // namespace action

class HubActionCmd : public DownstreamMsg
{
  public:
    explicit HubActionCmd(std::uint8_t action) : action_(action) {}

    MsgType type() const override { return MsgType::HubAction; }
    Bytes   payload() const override { return {action_}; }
    bool    needs_reply() const override
    {
        return action_ == action::DISCONNECT || action_ == action::SWITCH_OFF;
    }

    std::uint8_t action() const { return action_; }

  private:
    std::uint8_t action_;
};

class HubActionMsg : public UpstreamMsg
{
  public:
    explicit HubActionMsg(std::uint8_t action) : action_(action) {}
    static std::unique_ptr<UpstreamMsg> decode(const Bytes &frame);

    MsgType     type() const override { return MsgType::HubAction; }
    Bytes       payload() const override { return {action_}; }
    bool        is_reply_to(const DownstreamMsg &req) const override;
    std::string describe() const override;

    std::uint8_t action() const { return action_; }

  private:
    std::uint8_t action_;
};

// ---------------------------------------------------------------------------
// Hub alerts (0x03)
// ---------------------------------------------------------------------------
namespace alert
{
constexpr std::uint8_t LOW_VOLTAGE  = 0x01;
constexpr std::uint8_t HIGH_CURRENT = 0x02;
constexpr std::uint8_t LOW_SIGNAL   = 0x03;
constexpr std::uint8_t OVER_POWER   = 0x04;

constexpr std::uint8_t OP_UPD_ENABLE      = 0x01;
constexpr std::uint8_t OP_UPD_DISABLE     = 0x02;
constexpr std::uint8_t OP_UPD_REQUEST     = 0x03;
constexpr std::uint8_t OP_UPSTREAM_UPDATE = 0x04;
}  // namespace alert

class HubAlertCmd : public DownstreamMsg
{
  public:
    HubAlertCmd(std::uint8_t alert, std::uint8_t operation) : alert_(alert), operation_(operation)
    {
    }

    MsgType type() const override { return MsgType::HubAlert; }
    Bytes   payload() const override { return {alert_, operation_}; }
    bool    needs_reply() const override { return operation_ == alert::OP_UPD_REQUEST; }

    std::uint8_t alert() const { return alert_; }

  private:
    std::uint8_t alert_;
    std::uint8_t operation_;
};

class HubAlertMsg : public UpstreamMsg
{
  public:
    HubAlertMsg(std::uint8_t alert, std::uint8_t operation, std::uint8_t status)
        : alert_(alert), operation_(operation), status_(status)
    {
    }
    static std::unique_ptr<UpstreamMsg> decode(const Bytes &frame);

    MsgType     type() const override { return MsgType::HubAlert; }
    Bytes       payload() const override { return {alert_, operation_, status_}; }
    bool        is_reply_to(const DownstreamMsg &req) const override;
    std::string describe() const override;

    std::uint8_t alert() const { return alert_; }
    std::uint8_t operation() const { return operation_; }
    bool         is_ok() const { return status_ == 0; }

  private:
    std::uint8_t alert_;
    std::uint8_t operation_;
    std::uint8_t status_;
};

// ---------------------------------------------------------------------------
// Attached I/O (0x04)
// ---------------------------------------------------------------------------
namespace io_event
{
constexpr std::uint8_t DETACHED         = 0x00;
constexpr std::uint8_t ATTACHED         = 0x01;
constexpr std::uint8_t ATTACHED_VIRTUAL = 0x02;
}  // namespace io_event

class HubAttachedIoMsg : public UpstreamMsg
{
  public:
    HubAttachedIoMsg(std::uint8_t port, std::uint8_t event, Bytes rest = {})
        : port_(port), event_(event), rest_(std::move(rest))
    {
    }
    static std::unique_ptr<UpstreamMsg> decode(const Bytes &frame);

    static HubAttachedIoMsg attached(std::uint8_t port, std::uint16_t device_type);
    static HubAttachedIoMsg attached_virtual(std::uint8_t  port,
                                             std::uint16_t device_type,
                                             std::uint8_t  port_a,
                                             std::uint8_t  port_b);
    static HubAttachedIoMsg detached(std::uint8_t port);

    MsgType     type() const override { return MsgType::HubAttachedIo; }
    Bytes       payload() const override;
    bool        is_reply_to(const DownstreamMsg &req) const override;
    std::string describe() const override;

    std::uint8_t port() const { return port_; }
    std::uint8_t event() const { return event_; }
    const Bytes &rest() const { return rest_; }

    // nullopt when the event carries no (or a truncated) device description
    std::optional<std::uint16_t>                         device_type() const;
    std::optional<std::pair<std::uint8_t, std::uint8_t>> virtual_ports() const;

  private:
    std::uint8_t port_;
    std::uint8_t event_;
    Bytes        rest_;
};

// ---------------------------------------------------------------------------
// Generic error (0x05)
// ---------------------------------------------------------------------------
namespace err
{
constexpr std::uint8_t ACK                    = 0x01;
constexpr std::uint8_t MACK                   = 0x02;
constexpr std::uint8_t BUFFER_OVERFLOW        = 0x03;
constexpr std::uint8_t TIMEOUT                = 0x04;
constexpr std::uint8_t COMMAND_NOT_RECOGNIZED = 0x05;
constexpr std::uint8_t INVALID_USE            = 0x06;
constexpr std::uint8_t OVERCURRENT            = 0x07;
constexpr std::uint8_t INTERNAL_ERROR         = 0x08;
}  // namespace err

class GenericErrorMsg : public UpstreamMsg
{
  public:
    GenericErrorMsg(std::uint8_t command_type, std::uint8_t code)
        : command_type_(command_type), code_(code)
    {
    }
    static std::unique_ptr<UpstreamMsg> decode(const Bytes &frame);

    MsgType     type() const override { return MsgType::GenericError; }
    Bytes       payload() const override { return {command_type_, code_}; }
    std::string describe() const override { return "GenericError(" + message() + ")"; }

    std::uint8_t command_type() const { return command_type_; }
    std::uint8_t code() const { return code_; }
    std::string  message() const;

  private:
    std::uint8_t command_type_;
    std::uint8_t code_;
};

// ---------------------------------------------------------------------------
// Port input format setup (0x41) and its acknowledgement (0x47)
// ---------------------------------------------------------------------------
class PortInputFmtSetupSingleCmd : public DownstreamMsg
{
  public:
    PortInputFmtSetupSingleCmd(std::uint8_t  port,
                               std::uint8_t  mode,
                               std::uint32_t delta         = 1,
                               bool          update_enable = true)
        : port_(port), mode_(mode), delta_(delta), update_enable_(update_enable)
    {
    }

    MsgType type() const override { return MsgType::PortInputFmtSetupSingle; }
    Bytes   payload() const override;
    bool    needs_reply() const override { return true; }

    std::uint8_t port() const { return port_; }
    std::uint8_t mode() const { return mode_; }

  private:
    std::uint8_t  port_;
    std::uint8_t  mode_;
    std::uint32_t delta_;
    bool          update_enable_;
};

class PortInputFmtSingleMsg : public UpstreamMsg
{
  public:
    PortInputFmtSingleMsg(std::uint8_t port, std::uint8_t mode, std::uint32_t delta, bool enabled)
        : port_(port), mode_(mode), delta_(delta), enabled_(enabled)
    {
    }
    static std::unique_ptr<UpstreamMsg> decode(const Bytes &frame);

    MsgType     type() const override { return MsgType::PortInputFmtSingle; }
    Bytes       payload() const override;
    bool        is_reply_to(const DownstreamMsg &req) const override;
    std::string describe() const override;

    std::uint8_t  port() const { return port_; }
    std::uint8_t  mode() const { return mode_; }
    std::uint32_t delta() const { return delta_; }
    bool          enabled() const { return enabled_; }

  private:
    std::uint8_t  port_;
    std::uint8_t  mode_;
    std::uint32_t delta_;
    bool          enabled_;
};

// ---------------------------------------------------------------------------
// Port values (0x45 single, 0x46 combined)
// ---------------------------------------------------------------------------
class PortValueMsg : public UpstreamMsg
{
  public:
    PortValueMsg(std::uint8_t port, Bytes value) : port_(port), value_(std::move(value)) {}

    Bytes       payload() const override;
    std::string describe() const override;

    std::uint8_t port() const { return port_; }
    const Bytes &value() const { return value_; }

  private:
    std::uint8_t port_;
    Bytes        value_;
};

class PortValueSingleMsg : public PortValueMsg
{
  public:
    using PortValueMsg::PortValueMsg;
    static std::unique_ptr<UpstreamMsg> decode(const Bytes &frame);
    MsgType type() const override { return MsgType::PortValueSingle; }
};

class PortValueCombinedMsg : public PortValueMsg
{
  public:
    using PortValueMsg::PortValueMsg;
    static std::unique_ptr<UpstreamMsg> decode(const Bytes &frame);
    MsgType type() const override { return MsgType::PortValueCombined; }
};

// ---------------------------------------------------------------------------
// Virtual port setup (0x61)
// ---------------------------------------------------------------------------
class VirtualPortSetupCmd : public DownstreamMsg
{
  public:
    static VirtualPortSetupCmd connect(std::uint8_t port_a, std::uint8_t port_b);
    static VirtualPortSetupCmd disconnect(std::uint8_t virtual_port);

    MsgType type() const override { return MsgType::VirtualPortSetup; }
    Bytes   payload() const override;
    bool    needs_reply() const override { return true; }

    bool         is_connect() const { return connect_; }
    std::uint8_t port_a() const { return a_; }
    std::uint8_t port_b() const { return b_; }

  private:
    VirtualPortSetupCmd(bool connect, std::uint8_t a, std::uint8_t b)
        : connect_(connect), a_(a), b_(b)
    {
    }
    bool         connect_;
    std::uint8_t a_;
    std::uint8_t b_;
};

// ---------------------------------------------------------------------------
// Decoder registry
// ---------------------------------------------------------------------------
using Decoder = std::unique_ptr<UpstreamMsg> (*)(const Bytes &frame);

// Adds or replaces the decoder for a type byte (process-wide).
void register_decoder(std::uint8_t type, Decoder fn);
bool has_decoder(std::uint8_t type);

// nullptr when the frame is truncated, the type byte is unknown, or the payload
// is malformed. The reason is logged.
UpstreamPtr decode(const Bytes &frame);

}  // namespace proto
