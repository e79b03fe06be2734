#include "hub/attachment_tracker.hpp"
#include "util/log.hpp"

namespace hub
{

const char *attach_status_name(AttachStatus s)
{
    switch (s)
    {
        case AttachStatus::Attached:
            return "attached";
        case AttachStatus::Detached:
            return "detached";
        case AttachStatus::UnknownPort:
            return "unknown port";
        case AttachStatus::PortOccupied:
            return "port occupied";
        case AttachStatus::BadEvent:
            return "bad event";
    }
    return "?";
}

AttachmentTracker::AttachmentTracker(PeripheralRegistry registry) : registry_(std::move(registry))
{
}

AttachOutcome AttachmentTracker::apply(Hub &hub, const proto::HubAttachedIoMsg &msg)
{
    switch (msg.event())
    {
        case proto::io_event::ATTACHED:
        case proto::io_event::ATTACHED_VIRTUAL:
            return attach(hub, msg);
        case proto::io_event::DETACHED:
            return detach(msg);
        default:
            LOG_ERROR("[ATTACH] port 0x%02x: unknown event 0x%02x", (unsigned)msg.port(),
                      (unsigned)msg.event());
            return {AttachStatus::BadEvent, nullptr};
    }
}

AttachOutcome AttachmentTracker::attach(Hub &hub, const proto::HubAttachedIoMsg &msg)
{
    const std::uint8_t port = msg.port();
    const auto         type = msg.device_type();
    if (!type)
    {
        LOG_ERROR("[ATTACH] port 0x%02x: attach event without device type", (unsigned)port);
        return {AttachStatus::BadEvent, nullptr};
    }

    std::optional<std::pair<std::uint8_t, std::uint8_t>> vports;
    if (msg.event() == proto::io_event::ATTACHED_VIRTUAL)
    {
        vports = msg.virtual_ports();
        if (!vports)
        {
            LOG_ERROR("[ATTACH] port 0x%02x: virtual attach without port pair", (unsigned)port);
            return {AttachStatus::BadEvent, nullptr};
        }
    }

    {
        std::lock_guard<std::mutex> lk(mu_);
        auto                        it = set_.find(port);
        if (it != set_.end())
        {
            LOG_ERROR("[ATTACH] port 0x%02x already holds %s", (unsigned)port,
                      it->second->describe().c_str());
            return {AttachStatus::PortOccupied, nullptr};
        }
    }

    // construction starts the reader thread; keep it outside the lock
    std::shared_ptr<Peripheral> p = registry_.create(hub, port, *type);
    if (vports)
        p->set_virtual_ports(vports->first, vports->second);

    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!set_.emplace(port, p).second)
        {
            LOG_ERROR("[ATTACH] port 0x%02x taken concurrently", (unsigned)port);
            return {AttachStatus::PortOccupied, nullptr};
        }
    }
    LOG_INFO("[ATTACH] %s", p->describe().c_str());
    return {AttachStatus::Attached, p};
}

AttachOutcome AttachmentTracker::detach(const proto::HubAttachedIoMsg &msg)
{
    std::shared_ptr<Peripheral> gone;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto                        it = set_.find(msg.port());
        if (it == set_.end())
        {
            LOG_ERROR("[ATTACH] detach for untracked port 0x%02x", (unsigned)msg.port());
            return {AttachStatus::UnknownPort, nullptr};
        }
        gone = std::move(it->second);
        set_.erase(it);
    }
    LOG_INFO("[ATTACH] removed %s", gone->describe().c_str());
    return {AttachStatus::Detached, gone};
}

std::shared_ptr<Peripheral> AttachmentTracker::find(std::uint8_t port) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = set_.find(port);
    return it == set_.end() ? nullptr : it->second;
}

PeripheralMap AttachmentTracker::snapshot() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return set_;
}

std::size_t AttachmentTracker::size() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return set_.size();
}

PeripheralMap AttachmentTracker::take_all()
{
    std::lock_guard<std::mutex> lk(mu_);
    PeripheralMap               out;
    out.swap(set_);
    return out;
}

}  // namespace hub
