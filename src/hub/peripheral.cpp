#include <cstdio>

#include "hub/hub.hpp"
#include "hub/peripheral.hpp"
#include "util/hex.hpp"
#include "util/log.hpp"

namespace hub
{

const char *capability_name(Capability c)
{
    switch (c)
    {
        case Capability::Generic:
            return "Peripheral";
        case Capability::Motor:
            return "Motor";
        case Capability::EncodedMotor:
            return "EncodedMotor";
        case Capability::VisionSensor:
            return "VisionSensor";
        case Capability::RgbLight:
            return "RgbLight";
        case Capability::TiltSensor:
            return "TiltSensor";
        case Capability::CurrentSensor:
            return "CurrentSensor";
        case Capability::VoltageSensor:
            return "VoltageSensor";
    }
    return "?";
}

Peripheral::Peripheral(Hub &hub, std::uint8_t port, std::uint16_t device_type)
    : hub_(hub), port_(port), device_type_(device_type), rx_(std::make_shared<ReaderState>())
{
}

Peripheral::~Peripheral()
{
    stop_reader();
}

void Peripheral::start()
{
    std::weak_ptr<Peripheral> self = weak_from_this();
    if (self.expired())
    {
        LOG_ERROR("[PERIPH] port 0x%02x: not owned by a shared_ptr, values will not be read",
                  (unsigned)port_);
        return;
    }
    std::lock_guard<std::mutex> lk(rx_->mu);
    if (rx_->stop || reader_.joinable())
        return;
    reader_ = std::thread(&Peripheral::reader_loop, rx_, std::move(self), port_);
}

// ======================================================================
// Function: Peripheral::stop_reader
// - In: none
// - Out: none
// - Note: only reached once no strong reference is left, so the reader is
//         either waiting on the queue or about to find the peripheral gone.
//         When the last reference was dropped by the reader itself the
//         thread is detached; it only touches the shared ReaderState after.
// ======================================================================
void Peripheral::stop_reader()
{
    std::thread t;
    {
        std::lock_guard<std::mutex> lk(rx_->mu);
        rx_->stop = true;
        rx_->queue.clear();
        t = std::move(reader_);
    }
    rx_->cv.notify_all();
    if (!t.joinable())
        return;
    if (t.get_id() == std::this_thread::get_id())
        t.detach();
    else
        t.join();
}

std::optional<Peripheral::VirtualPorts> Peripheral::virtual_ports() const
{
    std::lock_guard<std::mutex> lk(state_mu_);
    return virtual_ports_;
}

void Peripheral::set_virtual_ports(std::uint8_t a, std::uint8_t b)
{
    std::lock_guard<std::mutex> lk(state_mu_);
    virtual_ports_ = VirtualPorts{a, b};
}

std::string Peripheral::describe() const
{
    char buf[96];
    auto vp = virtual_ports();
    if (vp)
        std::snprintf(buf, sizeof(buf), "%s on port 0x%02x (type 0x%04x, virtual 0x%02x+0x%02x)",
                      capability_name(capability()), (unsigned)port_, (unsigned)device_type_,
                      (unsigned)vp->first, (unsigned)vp->second);
    else
        std::snprintf(buf, sizeof(buf), "%s on port 0x%02x (type 0x%04x)",
                      capability_name(capability()), (unsigned)port_, (unsigned)device_type_);
    return buf;
}

void Peripheral::queue_port_data(proto::UpstreamPtr msg)
{
    if (!msg)
        return;
    {
        std::lock_guard<std::mutex> lk(rx_->mu);
        if (rx_->stop)
            return;
        rx_->queue.push_back(std::move(msg));
    }
    rx_->cv.notify_one();
}

void Peripheral::reader_loop(std::shared_ptr<ReaderState> rx,
                             std::weak_ptr<Peripheral>    self,
                             std::uint8_t                 port)
{
    while (true)
    {
        proto::UpstreamPtr msg;
        {
            std::unique_lock<std::mutex> lk(rx->mu);
            rx->cv.wait(lk, [&rx] { return rx->stop || !rx->queue.empty(); });
            if (rx->stop)
                return;
            msg = std::move(rx->queue.front());
            rx->queue.pop_front();
        }
        if (msg->type() != proto::MsgType::PortValueSingle &&
            msg->type() != proto::MsgType::PortValueCombined)
        {
            LOG_WARN("[PERIPH] port 0x%02x: unexpected %s", (unsigned)port,
                     msg->describe().c_str());
            continue;
        }
        std::shared_ptr<Peripheral> p = self.lock();
        if (!p)
            return;
        p->handle_port_data(static_cast<const proto::PortValueMsg &>(*msg));
        // may be the last reference; the destructor then detaches this thread
        p.reset();
    }
}

void Peripheral::handle_port_data(const proto::PortValueMsg &msg)
{
    OnValue cb;
    {
        std::lock_guard<std::mutex> lk(state_mu_);
        last_value_ = msg.value();
        cb          = on_value_;
    }
    values_seen_.fetch_add(1);
    LOG_DEBUG("[PERIPH] port 0x%02x value %s", (unsigned)port_,
              brickhub::to_hex(msg.value()).c_str());
    if (cb)
        cb(port_, msg.value());
}

// ======================================================================
// Function: Peripheral::subscribe
// - In: callback for raw values, sensor mode, delta interval
// - Out: true when the hub acknowledged the input format setup
// - Note: blocks on a synchronous hub request; not callable from the
//         notification context
// ======================================================================
bool Peripheral::subscribe(OnValue cb, std::uint8_t mode, std::uint32_t delta)
{
    proto::PortInputFmtSetupSingleCmd cmd(port_, mode, delta, true);
    SendResult                        res = hub_.send(cmd);
    if (!res.ok())
    {
        LOG_WARN("[PERIPH] subscribe port 0x%02x mode %u failed: %s %s", (unsigned)port_,
                 (unsigned)mode, send_status_name(res.status), res.error.c_str());
        return false;
    }

    std::lock_guard<std::mutex> lk(state_mu_);
    mode_     = mode;
    on_value_ = std::move(cb);
    return true;
}

bool Peripheral::unsubscribe()
{
    std::optional<std::uint8_t> mode;
    {
        std::lock_guard<std::mutex> lk(state_mu_);
        mode = mode_;
    }
    if (!mode)
        return true;

    proto::PortInputFmtSetupSingleCmd cmd(port_, *mode, 1, false);
    SendResult                        res = hub_.send(cmd);
    if (!res.ok())
    {
        LOG_WARN("[PERIPH] unsubscribe port 0x%02x failed: %s %s", (unsigned)port_,
                 send_status_name(res.status), res.error.c_str());
        return false;
    }

    std::lock_guard<std::mutex> lk(state_mu_);
    mode_.reset();
    on_value_ = nullptr;
    return true;
}

std::optional<std::uint8_t> Peripheral::subscribed_mode() const
{
    std::lock_guard<std::mutex> lk(state_mu_);
    return mode_;
}

proto::Bytes Peripheral::last_value() const
{
    std::lock_guard<std::mutex> lk(state_mu_);
    return last_value_;
}

}  // namespace hub
