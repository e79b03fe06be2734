#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>

#include "hub/peripheral.hpp"
#include "hub/peripheral_registry.hpp"
#include "proto/messages.hpp"

namespace hub
{

using PeripheralMap = std::map<std::uint8_t, std::shared_ptr<Peripheral>>;

enum class AttachStatus
{
    Attached,
    Detached,
    UnknownPort,   // detach for a port that is not tracked
    PortOccupied,  // attach for a port that is already tracked
    BadEvent,      // unknown event code or truncated device description
};

const char *attach_status_name(AttachStatus s);

struct AttachOutcome
{
    AttachStatus                status = AttachStatus::BadEvent;
    std::shared_ptr<Peripheral> peripheral{};  // created on attach, removed on detach
};

/*
Per-port state: absent -> attached | attached-virtual -> absent.
apply() is the only mutator and runs on the hub's notification path; lookups
may come from any thread.
*/
class AttachmentTracker
{
  public:
    explicit AttachmentTracker(PeripheralRegistry registry);

    AttachOutcome apply(Hub &hub, const proto::HubAttachedIoMsg &msg);

    std::shared_ptr<Peripheral> find(std::uint8_t port) const;
    PeripheralMap               snapshot() const;
    std::size_t                 size() const;

    // Empties the set and hands the peripherals to the caller.
    PeripheralMap take_all();

  private:
    AttachOutcome attach(Hub &hub, const proto::HubAttachedIoMsg &msg);
    AttachOutcome detach(const proto::HubAttachedIoMsg &msg);

    const PeripheralRegistry registry_;

    mutable std::mutex mu_;
    PeripheralMap      set_;
};

}  // namespace hub
