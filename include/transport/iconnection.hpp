#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace transport
{

using Frame    = std::vector<std::uint8_t>;
using OnNotify = std::function<void(std::uint16_t handle, const Frame &)>;

// Link to one physical hub. Notifications are delivered from a single context,
// in arrival order; that context may differ from the threads calling write().
struct IConnection
{
    virtual bool        write(std::uint16_t handle, const Frame &data) = 0;
    virtual void        set_notify_handler(OnNotify cb)                 = 0;
    virtual bool        enable_notifications()                          = 0;
    virtual void        disconnect()                                    = 0;  // idempotent
    virtual bool        is_alive() const                                = 0;
    virtual std::string name() const { return ""; }
    virtual ~IConnection() = default;
};

}  // namespace transport
