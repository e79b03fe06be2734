#include <cstdint>
#include <cstdio>
#include <mutex>
#include <unordered_map>

#include "proto/messages.hpp"
#include "util/hex.hpp"
#include "util/log.hpp"

namespace proto
{

namespace
{

std::string hex8(std::uint8_t v)
{
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02x", (unsigned)v);
    return buf;
}

// little-endian helpers, offsets are relative to the payload start
std::uint16_t le16(const Bytes &b, std::size_t at)
{
    return static_cast<std::uint16_t>(b[at] | (b[at + 1] << 8));
}

std::uint32_t le32(const Bytes &b, std::size_t at)
{
    return (std::uint32_t)b[at] | ((std::uint32_t)b[at + 1] << 8) |
           ((std::uint32_t)b[at + 2] << 16) | ((std::uint32_t)b[at + 3] << 24);
}

void put_le32(Bytes &out, std::uint32_t v)
{
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFF));
}

Bytes body_of(const Bytes &frame)
{
    return Bytes(frame.begin() + HDR_SIZE, frame.end());
}

const char *error_name(std::uint8_t code)
{
    switch (code)
    {
        case err::ACK:
            return "ACK";
        case err::MACK:
            return "MACK";
        case err::BUFFER_OVERFLOW:
            return "Buffer overflow";
        case err::TIMEOUT:
            return "Timeout";
        case err::COMMAND_NOT_RECOGNIZED:
            return "Command not recognized";
        case err::INVALID_USE:
            return "Invalid use";
        case err::OVERCURRENT:
            return "Overcurrent";
        case err::INTERNAL_ERROR:
            return "Internal error";
    }
    return "Unknown error";
}

struct Registry
{
    std::mutex                                 mu;
    std::unordered_map<std::uint8_t, Decoder> decoders{
        {static_cast<std::uint8_t>(MsgType::HubProperties), &HubPropertiesMsg::decode},
        {static_cast<std::uint8_t>(MsgType::HubAction), &HubActionMsg::decode},
        {static_cast<std::uint8_t>(MsgType::HubAlert), &HubAlertMsg::decode},
        {static_cast<std::uint8_t>(MsgType::HubAttachedIo), &HubAttachedIoMsg::decode},
        {static_cast<std::uint8_t>(MsgType::GenericError), &GenericErrorMsg::decode},
        {static_cast<std::uint8_t>(MsgType::PortValueSingle), &PortValueSingleMsg::decode},
        {static_cast<std::uint8_t>(MsgType::PortValueCombined), &PortValueCombinedMsg::decode},
        {static_cast<std::uint8_t>(MsgType::PortInputFmtSingle), &PortInputFmtSingleMsg::decode},
    };
};

Registry &registry()
{
    static Registry r;
    return r;
}

}  // namespace

// ======================================================================
// Message framing
// ======================================================================
std::string Message::describe() const
{
    return "Msg(" + hex8(static_cast<std::uint8_t>(type())) + " " + brickhub::to_hex(payload()) +
           ")";
}

Bytes Message::bytes() const
{
    const Bytes body = payload();
    if (HDR_SIZE + body.size() > MAX_FRAME)
    {
        LOG_ERROR("bytes: payload too large for a short frame (%zu)", body.size());
        return {};
    }
    Bytes out;
    out.reserve(HDR_SIZE + body.size());
    out.push_back(static_cast<std::uint8_t>(HDR_SIZE + body.size()));
    out.push_back(HUB_ID);
    out.push_back(static_cast<std::uint8_t>(type()));
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

// ======================================================================
// Hub properties
// ======================================================================
Bytes HubPropertiesCmd::payload() const
{
    Bytes out{property_, operation_};
    out.insert(out.end(), parameters_.begin(), parameters_.end());
    return out;
}

std::string HubPropertiesCmd::describe() const
{
    return "HubPropertiesCmd(prop=" + hex8(property_) + " op=" + hex8(operation_) + ")";
}

std::unique_ptr<UpstreamMsg> HubPropertiesMsg::decode(const Bytes &frame)
{
    if (frame.size() < HDR_SIZE + 2)
        return nullptr;
    return std::make_unique<HubPropertiesMsg>(frame[3], frame[4],
                                              Bytes(frame.begin() + 5, frame.end()));
}

Bytes HubPropertiesMsg::payload() const
{
    Bytes out{property_, operation_};
    out.insert(out.end(), parameters_.begin(), parameters_.end());
    return out;
}

bool HubPropertiesMsg::is_reply_to(const DownstreamMsg &req) const
{
    if (req.type() != MsgType::HubProperties)
        return false;
    const auto &cmd = static_cast<const HubPropertiesCmd &>(req);
    return operation_ == prop::OP_UPSTREAM_UPDATE && cmd.property() == property_;
}

std::string HubPropertiesMsg::describe() const
{
    return "HubProperties(prop=" + hex8(property_) + " op=" + hex8(operation_) +
           " params=" + brickhub::to_hex(parameters_) + ")";
}

// ======================================================================
// Hub actions
// ======================================================================
std::unique_ptr<UpstreamMsg> HubActionMsg::decode(const Bytes &frame)
{
    if (frame.size() < HDR_SIZE + 1)
        return nullptr;
    return std::make_unique<HubActionMsg>(frame[3]);
}

bool HubActionMsg::is_reply_to(const DownstreamMsg &req) const
{
    if (req.type() != MsgType::HubAction)
        return false;
    const auto &cmd = static_cast<const HubActionCmd &>(req);
    return (cmd.action() == action::DISCONNECT && action_ == action::UPSTREAM_DISCONNECT) ||
           (cmd.action() == action::SWITCH_OFF && action_ == action::UPSTREAM_SHUTDOWN);
}

std::string HubActionMsg::describe() const
{
    return "HubAction(" + hex8(action_) + ")";
}

// ======================================================================
// Hub alerts
// ======================================================================
std::unique_ptr<UpstreamMsg> HubAlertMsg::decode(const Bytes &frame)
{
    if (frame.size() < HDR_SIZE + 3)
        return nullptr;
    return std::make_unique<HubAlertMsg>(frame[3], frame[4], frame[5]);
}

bool HubAlertMsg::is_reply_to(const DownstreamMsg &req) const
{
    if (req.type() != MsgType::HubAlert)
        return false;
    const auto &cmd = static_cast<const HubAlertCmd &>(req);
    return operation_ == alert::OP_UPSTREAM_UPDATE && cmd.alert() == alert_;
}

std::string HubAlertMsg::describe() const
{
    return "HubAlert(alert=" + hex8(alert_) + " op=" + hex8(operation_) +
           (is_ok() ? " ok)" : " ALERT)");
}

// ======================================================================
// Attached I/O
// ======================================================================
std::unique_ptr<UpstreamMsg> HubAttachedIoMsg::decode(const Bytes &frame)
{
    if (frame.size() < HDR_SIZE + 2)
        return nullptr;
    return std::make_unique<HubAttachedIoMsg>(frame[3], frame[4],
                                              Bytes(frame.begin() + 5, frame.end()));
}

HubAttachedIoMsg HubAttachedIoMsg::attached(std::uint8_t port, std::uint16_t device_type)
{
    // device type + zeroed hw/sw revisions
    Bytes rest{static_cast<std::uint8_t>(device_type & 0xFF),
               static_cast<std::uint8_t>(device_type >> 8)};
    rest.resize(10, 0);
    return HubAttachedIoMsg(port, io_event::ATTACHED, std::move(rest));
}

HubAttachedIoMsg HubAttachedIoMsg::attached_virtual(std::uint8_t  port,
                                                    std::uint16_t device_type,
                                                    std::uint8_t  port_a,
                                                    std::uint8_t  port_b)
{
    return HubAttachedIoMsg(port, io_event::ATTACHED_VIRTUAL,
                            {static_cast<std::uint8_t>(device_type & 0xFF),
                             static_cast<std::uint8_t>(device_type >> 8), port_a, port_b});
}

HubAttachedIoMsg HubAttachedIoMsg::detached(std::uint8_t port)
{
    return HubAttachedIoMsg(port, io_event::DETACHED);
}

Bytes HubAttachedIoMsg::payload() const
{
    Bytes out{port_, event_};
    out.insert(out.end(), rest_.begin(), rest_.end());
    return out;
}

std::optional<std::uint16_t> HubAttachedIoMsg::device_type() const
{
    if (event_ == io_event::DETACHED || rest_.size() < 2)
        return std::nullopt;
    return le16(rest_, 0);
}

std::optional<std::pair<std::uint8_t, std::uint8_t>> HubAttachedIoMsg::virtual_ports() const
{
    if (event_ != io_event::ATTACHED_VIRTUAL || rest_.size() < 4)
        return std::nullopt;
    return std::make_pair(rest_[2], rest_[3]);
}

bool HubAttachedIoMsg::is_reply_to(const DownstreamMsg &req) const
{
    if (req.type() != MsgType::VirtualPortSetup)
        return false;
    const auto &cmd = static_cast<const VirtualPortSetupCmd &>(req);
    if (cmd.is_connect())
    {
        auto pair = virtual_ports();
        return pair && pair->first == cmd.port_a() && pair->second == cmd.port_b();
    }
    return event_ == io_event::DETACHED && port_ == cmd.port_a();
}

std::string HubAttachedIoMsg::describe() const
{
    const char *ev = event_ == io_event::DETACHED           ? "detached"
                     : event_ == io_event::ATTACHED         ? "attached"
                     : event_ == io_event::ATTACHED_VIRTUAL ? "attached-virtual"
                                                            : "?";
    std::string s  = "HubAttachedIo(port=" + hex8(port_) + " " + ev;
    if (auto t = device_type())
    {
        char buf[16];
        std::snprintf(buf, sizeof(buf), " type=0x%04x", (unsigned)*t);
        s += buf;
    }
    return s + ")";
}

// ======================================================================
// Generic error
// ======================================================================
std::unique_ptr<UpstreamMsg> GenericErrorMsg::decode(const Bytes &frame)
{
    if (frame.size() < HDR_SIZE + 2)
        return nullptr;
    return std::make_unique<GenericErrorMsg>(frame[3], frame[4]);
}

std::string GenericErrorMsg::message() const
{
    return "Command " + hex8(command_type_) + " caused error " + hex8(code_) + ": " +
           error_name(code_);
}

// ======================================================================
// Port input format
// ======================================================================
Bytes PortInputFmtSetupSingleCmd::payload() const
{
    Bytes out{port_, mode_};
    put_le32(out, delta_);
    out.push_back(update_enable_ ? 1 : 0);
    return out;
}

std::unique_ptr<UpstreamMsg> PortInputFmtSingleMsg::decode(const Bytes &frame)
{
    if (frame.size() < HDR_SIZE + 7)
        return nullptr;
    const Bytes b = body_of(frame);
    return std::make_unique<PortInputFmtSingleMsg>(b[0], b[1], le32(b, 2), b[6] != 0);
}

Bytes PortInputFmtSingleMsg::payload() const
{
    Bytes out{port_, mode_};
    put_le32(out, delta_);
    out.push_back(enabled_ ? 1 : 0);
    return out;
}

bool PortInputFmtSingleMsg::is_reply_to(const DownstreamMsg &req) const
{
    if (req.type() != MsgType::PortInputFmtSetupSingle)
        return false;
    return static_cast<const PortInputFmtSetupSingleCmd &>(req).port() == port_;
}

std::string PortInputFmtSingleMsg::describe() const
{
    return "PortInputFmtSingle(port=" + hex8(port_) + " mode=" + hex8(mode_) +
           (enabled_ ? " on)" : " off)");
}

// ======================================================================
// Port values
// ======================================================================
Bytes PortValueMsg::payload() const
{
    Bytes out{port_};
    out.insert(out.end(), value_.begin(), value_.end());
    return out;
}

std::string PortValueMsg::describe() const
{
    return "PortValue(port=" + hex8(port_) + " " + brickhub::to_hex(value_) + ")";
}

std::unique_ptr<UpstreamMsg> PortValueSingleMsg::decode(const Bytes &frame)
{
    if (frame.size() < HDR_SIZE + 1)
        return nullptr;
    return std::make_unique<PortValueSingleMsg>(frame[3], Bytes(frame.begin() + 4, frame.end()));
}

std::unique_ptr<UpstreamMsg> PortValueCombinedMsg::decode(const Bytes &frame)
{
    if (frame.size() < HDR_SIZE + 1)
        return nullptr;
    return std::make_unique<PortValueCombinedMsg>(frame[3],
                                                  Bytes(frame.begin() + 4, frame.end()));
}

// ======================================================================
// Virtual port setup
// ======================================================================
VirtualPortSetupCmd VirtualPortSetupCmd::connect(std::uint8_t port_a, std::uint8_t port_b)
{
    return VirtualPortSetupCmd(true, port_a, port_b);
}

VirtualPortSetupCmd VirtualPortSetupCmd::disconnect(std::uint8_t virtual_port)
{
    return VirtualPortSetupCmd(false, virtual_port, 0);
}

Bytes VirtualPortSetupCmd::payload() const
{
    if (connect_)
        return {0x01, a_, b_};
    return {0x00, a_};
}

// ======================================================================
// Decoder registry
// ======================================================================
void register_decoder(std::uint8_t type, Decoder fn)
{
    auto                       &r = registry();
    std::lock_guard<std::mutex> lk(r.mu);
    r.decoders[type] = fn;
}

bool has_decoder(std::uint8_t type)
{
    auto                       &r = registry();
    std::lock_guard<std::mutex> lk(r.mu);
    return r.decoders.count(type) != 0;
}

UpstreamPtr decode(const Bytes &frame)
{
    if (frame.size() < HDR_SIZE)
    {
        LOG_ERROR("decode: frame too short (%zu)", frame.size());
        return nullptr;
    }
    if (frame[0] != frame.size())
    {
        LOG_WARN("decode: length byte %u != frame size %zu", (unsigned)frame[0], frame.size());
    }

    const std::uint8_t type = frame[TYPE_INDEX];
    Decoder            fn   = nullptr;
    {
        auto                       &r = registry();
        std::lock_guard<std::mutex> lk(r.mu);
        auto                        it = r.decoders.find(type);
        if (it != r.decoders.end())
            fn = it->second;
    }
    if (!fn)
    {
        LOG_ERROR("decode: unknown message type 0x%02x (%s)", (unsigned)type,
                  brickhub::to_hex(frame).c_str());
        return nullptr;
    }

    std::unique_ptr<UpstreamMsg> msg = fn(frame);
    if (!msg)
    {
        LOG_ERROR("decode: malformed 0x%02x frame (%s)", (unsigned)type,
                  brickhub::to_hex(frame).c_str());
        return nullptr;
    }
    LOG_DEBUG("Decoded message: %s", msg->describe().c_str());
    return UpstreamPtr(std::move(msg));
}

}  // namespace proto
