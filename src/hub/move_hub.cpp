#include <chrono>
#include <cstdio>
#include <thread>

#include "hub/move_hub.hpp"
#include "util/env.hpp"
#include "util/log.hpp"

namespace hub
{

namespace
{
std::string format_mac(const proto::Bytes &b)
{
    std::string out;
    char        buf[4];
    for (std::size_t i = 0; i < b.size(); ++i)
    {
        std::snprintf(buf, sizeof(buf), i ? ":%02X" : "%02X", (unsigned)b[i]);
        out += buf;
    }
    return out;
}

std::string join(const std::vector<std::string> &v)
{
    std::string out;
    for (const auto &s : v)
    {
        if (!out.empty())
            out += ", ";
        out += s;
    }
    return out;
}

// Reply of the expected message type, or null when the request failed.
template <class T>
const T *reply_as(const SendResult &r, proto::MsgType type)
{
    if (!r.ok() || !r.reply || r.reply->type() != type)
        return nullptr;
    return static_cast<const T *>(r.reply.get());
}
}  // namespace

MoveHubConfig MoveHubConfig::from_env()
{
    MoveHubConfig c;
    brickhub::env_u32("BRICKHUB_WAIT_ATTEMPTS", 1, 1000, c.wait_attempts);
    brickhub::env_u32("BRICKHUB_WAIT_INTERVAL_MS", 1, 10000, c.wait_interval_ms);
    return c;
}

MoveHub::MoveHub(std::unique_ptr<transport::IConnection> conn, MoveHubConfig mcfg, HubConfig cfg)
    : Hub(std::move(conn), cfg), mcfg_(mcfg), button_(*this)
{
    // runs after the base attachment handler, so the peripheral is already tracked;
    // devices announced before it was in place are bound from the snapshot
    add_attach_handler([this](const proto::UpstreamPtr &m) { on_attached_io(m); },
                       [this](const PeripheralMap &current) {
                           std::lock_guard<std::mutex> lk(named_mu_);
                           for (const auto &kv : current)
                               bind_locked(kv.second);
                       });
    add_message_handler(proto::MsgType::HubProperties, [this](const proto::UpstreamPtr &m) {
        button_.handle_property(static_cast<const proto::HubPropertiesMsg &>(*m));
    });

    wait_for_devices();
    report_status();
}

MoveHub::~MoveHub()
{
    teardown();
}

void MoveHub::on_attached_io(const proto::UpstreamPtr &msg)
{
    const auto &io = static_cast<const proto::HubAttachedIoMsg &>(*msg);

    std::lock_guard<std::mutex> lk(named_mu_);
    if (io.event() == proto::io_event::DETACHED)
    {
        unbind_locked(io.port());
        return;
    }
    if (auto p = peripheral(io.port()))
        bind_locked(p);
}

void MoveHub::bind_locked(const std::shared_ptr<Peripheral> &p)
{
    const std::uint8_t port = p->port();
    switch (port)
    {
        case PORT_A:
            named_.motor_a = p;
            break;
        case PORT_B:
            named_.motor_b = p;
            break;
        case PORT_AB:
            named_.motor_ab = p;
            break;
        case PORT_C:
            named_.port_c = p;
            break;
        case PORT_D:
            named_.port_d = p;
            break;
        case PORT_LED:
            named_.led = p;
            break;
        case PORT_TILT:
            named_.tilt_sensor = p;
            break;
        case PORT_CURRENT:
            named_.current = p;
            break;
        case PORT_VOLTAGE:
            named_.voltage = p;
            break;
        default:
            break;
    }

    switch (p->capability())
    {
        case Capability::VisionSensor:
            named_.vision_sensor = p;
            break;
        case Capability::EncodedMotor:
            if (port != PORT_A && port != PORT_B && port != PORT_AB)
                named_.motor_external = p;
            break;
        default:
            break;
    }
}

void MoveHub::unbind_locked(std::uint8_t port)
{
    std::shared_ptr<Peripheral> *slots[] = {
        &named_.motor_a, &named_.motor_b,     &named_.motor_ab, &named_.port_c,
        &named_.port_d,  &named_.led,         &named_.tilt_sensor,
        &named_.current, &named_.voltage,     &named_.vision_sensor,
        &named_.motor_external,
    };
    for (auto *slot : slots)
    {
        if (*slot && (*slot)->port() == port)
            slot->reset();
    }
}

std::shared_ptr<Peripheral> MoveHub::motor_a() const
{
    std::lock_guard<std::mutex> lk(named_mu_);
    return named_.motor_a;
}

std::shared_ptr<Peripheral> MoveHub::motor_b() const
{
    std::lock_guard<std::mutex> lk(named_mu_);
    return named_.motor_b;
}

std::shared_ptr<Peripheral> MoveHub::motor_ab() const
{
    std::lock_guard<std::mutex> lk(named_mu_);
    return named_.motor_ab;
}

std::shared_ptr<Peripheral> MoveHub::port_c() const
{
    std::lock_guard<std::mutex> lk(named_mu_);
    return named_.port_c;
}

std::shared_ptr<Peripheral> MoveHub::port_d() const
{
    std::lock_guard<std::mutex> lk(named_mu_);
    return named_.port_d;
}

std::shared_ptr<Peripheral> MoveHub::led() const
{
    std::lock_guard<std::mutex> lk(named_mu_);
    return named_.led;
}

std::shared_ptr<Peripheral> MoveHub::tilt_sensor() const
{
    std::lock_guard<std::mutex> lk(named_mu_);
    return named_.tilt_sensor;
}

std::shared_ptr<Peripheral> MoveHub::current() const
{
    std::lock_guard<std::mutex> lk(named_mu_);
    return named_.current;
}

std::shared_ptr<Peripheral> MoveHub::voltage() const
{
    std::lock_guard<std::mutex> lk(named_mu_);
    return named_.voltage;
}

std::shared_ptr<Peripheral> MoveHub::vision_sensor() const
{
    std::lock_guard<std::mutex> lk(named_mu_);
    return named_.vision_sensor;
}

std::shared_ptr<Peripheral> MoveHub::motor_external() const
{
    std::lock_guard<std::mutex> lk(named_mu_);
    return named_.motor_external;
}

HubInfo MoveHub::info() const
{
    std::lock_guard<std::mutex> lk(info_mu_);
    return info_;
}

std::vector<std::string> MoveHub::missing_devices() const
{
    std::vector<std::string>    out;
    std::lock_guard<std::mutex> lk(named_mu_);
    if (!named_.motor_a)
        out.emplace_back("motor A");
    if (!named_.motor_b)
        out.emplace_back("motor B");
    if (!named_.motor_ab)
        out.emplace_back("motor AB");
    if (!named_.led)
        out.emplace_back("LED");
    if (!named_.tilt_sensor)
        out.emplace_back("tilt sensor");
    if (!named_.current)
        out.emplace_back("current sensor");
    if (!named_.voltage)
        out.emplace_back("voltage sensor");
    return out;
}

// ======================================================================
// Function: MoveHub::wait_for_devices
// - In: none (attempts and interval from MoveHubConfig)
// - Out: true when all built-in devices are bound
// - Note: a partial set is logged, not treated as an error
// ======================================================================
bool MoveHub::wait_for_devices()
{
    for (std::uint32_t i = 0; i < mcfg_.wait_attempts; ++i)
    {
        if (missing_devices().empty())
        {
            LOG_DEBUG("[MOVEHUB] all built-in devices present");
            return true;
        }
        if (desynced() || !is_connected())
            break;
        std::this_thread::sleep_for(std::chrono::milliseconds(mcfg_.wait_interval_ms));
    }

    auto missing = missing_devices();
    if (missing.empty())
        return true;
    LOG_WARN("[MOVEHUB] still missing: %s", join(missing).c_str());
    return false;
}

void MoveHub::report_status()
{
    HubInfo info;

    SendResult r =
        send(proto::HubPropertiesCmd(proto::prop::ADVERTISE_NAME, proto::prop::OP_UPD_REQUEST));
    if (auto *m = reply_as<proto::HubPropertiesMsg>(r, proto::MsgType::HubProperties))
        info.name = m->as_string();
    else
        LOG_WARN("[MOVEHUB] name query failed: %s %s", send_status_name(r.status), r.error.c_str());

    r = send(proto::HubPropertiesCmd(proto::prop::PRIMARY_MAC, proto::prop::OP_UPD_REQUEST));
    if (auto *m = reply_as<proto::HubPropertiesMsg>(r, proto::MsgType::HubProperties))
        info.mac = format_mac(m->parameters());
    else
        LOG_WARN("[MOVEHUB] MAC query failed: %s %s", send_status_name(r.status), r.error.c_str());

    if (info.name || info.mac)
        LOG_INFO("[MOVEHUB] %s on %s", info.name ? info.name->c_str() : "?",
                 info.mac ? info.mac->c_str() : "?");

    r = send(proto::HubPropertiesCmd(proto::prop::VOLTAGE_PERC, proto::prop::OP_UPD_REQUEST));
    auto *volt = reply_as<proto::HubPropertiesMsg>(r, proto::MsgType::HubProperties);
    if (volt && !volt->parameters().empty())
    {
        info.battery_percent = volt->parameters()[0];
        LOG_INFO("[MOVEHUB] battery %u%%", *info.battery_percent);
    }
    else
    {
        LOG_WARN("[MOVEHUB] battery query failed: %s %s", send_status_name(r.status),
                 r.error.c_str());
    }

    r = send(proto::HubAlertCmd(proto::alert::LOW_VOLTAGE, proto::alert::OP_UPD_REQUEST));
    if (auto *m = reply_as<proto::HubAlertMsg>(r, proto::MsgType::HubAlert))
    {
        info.low_voltage = !m->is_ok();
        if (*info.low_voltage)
            LOG_WARN("[MOVEHUB] low voltage, check the batteries");
    }
    else
    {
        LOG_WARN("[MOVEHUB] low-voltage query failed: %s %s", send_status_name(r.status),
                 r.error.c_str());
    }

    std::lock_guard<std::mutex> lk(info_mu_);
    info_ = std::move(info);
}

}  // namespace hub
