#include "transport/loopback_connection.hpp"
#include "util/constants.hpp"
#include "util/hex.hpp"
#include "util/log.hpp"

namespace transport
{
// LoopbackConnection: a fake hub link to drive the hub engine without BLE.
bool LoopbackConnection::write(std::uint16_t handle, const Frame &data)
{
    if (!alive_.load())
    {
        LOG_WARN("[LOOPBACK] write on closed link (handle=0x%02x)", (unsigned)handle);
        return false;
    }

    Responder responder;
    {
        std::lock_guard<std::mutex> lk(mu_);
        written_.push_back(data);
        responder = responder_;
    }
    LOG_DEBUG("[LOOPBACK] write handle=0x%02x %s", (unsigned)handle,
              brickhub::to_hex(data).c_str());

    if (responder)
    {
        // answers go out before write() returns, like a very fast device
        for (const auto &f : responder(data))
            deliver(f);
    }
    return true;
}

void LoopbackConnection::set_notify_handler(OnNotify cb)
{
    std::lock_guard<std::mutex> lk(mu_);
    on_notify_ = std::move(cb);
}

bool LoopbackConnection::enable_notifications()
{
    if (!alive_.load())
        return false;
    notifying_.store(true);
    return true;
}

void LoopbackConnection::disconnect()
{
    if (!alive_.exchange(false))
        return;
    notifying_.store(false);
    disconnects_.fetch_add(1);
    LOG_DEBUG("[LOOPBACK] disconnected");
}

bool LoopbackConnection::is_alive() const
{
    return alive_.load();
}

void LoopbackConnection::set_responder(Responder r)
{
    std::lock_guard<std::mutex> lk(mu_);
    responder_ = std::move(r);
}

void LoopbackConnection::inject(const Frame &frame)
{
    deliver(frame);
}

std::vector<Frame> LoopbackConnection::written() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return written_;
}

std::size_t LoopbackConnection::write_count() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return written_.size();
}

void LoopbackConnection::deliver(const Frame &frame)
{
    OnNotify cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        cb = on_notify_;
    }
    if (!cb)
        return;
    std::lock_guard<std::mutex> lk(deliver_mu_);
    cb(constants::HUB_HARDWARE_HANDLE, frame);
}

}  // namespace transport
