#include "hub/button.hpp"
#include "hub/hub.hpp"
#include "util/log.hpp"

namespace hub
{

bool Button::subscribe(OnButton cb)
{
    bool first = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        first = subscribers_.empty();
        subscribers_.push_back(std::move(cb));
    }
    if (!first)
        return true;

    SendResult res =
        hub_.send(proto::HubPropertiesCmd(proto::prop::BUTTON, proto::prop::OP_UPD_ENABLE));
    if (!res.ok())
    {
        LOG_WARN("[MOVEHUB] enabling button updates failed: %s", send_status_name(res.status));
        std::lock_guard<std::mutex> lk(mu_);
        subscribers_.clear();
        return false;
    }
    return true;
}

bool Button::unsubscribe()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (subscribers_.empty())
            return true;
        subscribers_.clear();
    }
    SendResult res =
        hub_.send(proto::HubPropertiesCmd(proto::prop::BUTTON, proto::prop::OP_UPD_DISABLE));
    if (!res.ok())
    {
        LOG_WARN("[MOVEHUB] disabling button updates failed: %s", send_status_name(res.status));
        return false;
    }
    return true;
}

bool Button::pressed() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return pressed_;
}

bool Button::subscribed() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return !subscribers_.empty();
}

void Button::handle_property(const proto::HubPropertiesMsg &msg)
{
    if (msg.property() != proto::prop::BUTTON ||
        msg.operation() != proto::prop::OP_UPSTREAM_UPDATE || msg.parameters().empty())
        return;

    const bool            down = msg.parameters()[0] != 0;
    std::vector<OnButton> subs;
    {
        std::lock_guard<std::mutex> lk(mu_);
        pressed_ = down;
        subs     = subscribers_;
    }
    LOG_DEBUG("[MOVEHUB] button %s", down ? "pressed" : "released");
    for (const auto &cb : subs)
    {
        if (cb)
            cb(down);
    }
}

}  // namespace hub
