#include <chrono>

#include "hub/hub.hpp"
#include "util/constants.hpp"
#include "util/env.hpp"
#include "util/hex.hpp"
#include "util/log.hpp"

namespace hub
{

const char *send_status_name(SendStatus s)
{
    switch (s)
    {
        case SendStatus::Ok:
            return "ok";
        case SendStatus::Busy:
            return "busy";
        case SendStatus::NotConnected:
            return "not connected";
        case SendStatus::EncodeFailed:
            return "encode failed";
        case SendStatus::WriteFailed:
            return "write failed";
        case SendStatus::CommandError:
            return "command error";
        case SendStatus::Timeout:
            return "timeout";
        case SendStatus::Disconnected:
            return "disconnected";
        case SendStatus::Desynced:
            return "desynced";
    }
    return "?";
}

HubConfig HubConfig::from_env()
{
    HubConfig c;
    brickhub::env_u32("BRICKHUB_REPLY_TIMEOUT_MS", 0, 600000, c.reply_timeout_ms);
    return c;
}

Hub::Hub(std::unique_ptr<transport::IConnection> conn, HubConfig cfg, PeripheralRegistry registry)
    : conn_(std::move(conn)), cfg_(cfg), tracker_(std::move(registry))
{
    add_message_handler(proto::MsgType::HubAttachedIo,
                        [this](const proto::UpstreamPtr &m) { handle_attached_io(m); });
    add_message_handler(proto::MsgType::PortValueSingle,
                        [this](const proto::UpstreamPtr &m) { handle_port_value(m); });
    add_message_handler(proto::MsgType::PortValueCombined,
                        [this](const proto::UpstreamPtr &m) { handle_port_value(m); });
    add_message_handler(proto::MsgType::GenericError,
                        [this](const proto::UpstreamPtr &m) { handle_error(m); });
    add_message_handler(proto::MsgType::HubAction,
                        [this](const proto::UpstreamPtr &m) { handle_action(m); });

    if (!conn_)
    {
        LOG_ERROR("[HUB] constructed without a connection");
        released_.store(true);
        return;
    }

    conn_->set_notify_handler(
        [this](std::uint16_t handle, const transport::Frame &data) { on_notify(handle, data); });
    if (!conn_->enable_notifications())
        LOG_WARN("[HUB] enabling notifications on %s failed", conn_->name().c_str());
}

Hub::~Hub()
{
    teardown();
}

void Hub::teardown()
{
    close();
    // joins the delivery thread, so no handler runs past this point
    conn_.reset();
    PeripheralMap gone = tracker_.take_all();
    gone.clear();
}

void Hub::add_message_handler(proto::MsgType type, Handler h)
{
    std::lock_guard<std::mutex> lk(handlers_mu_);
    handlers_.emplace_back(type, std::move(h));
}

void Hub::add_attach_handler(Handler h, const Adopt &adopt)
{
    std::lock_guard<std::mutex> lk(dispatch_mu_);
    add_message_handler(proto::MsgType::HubAttachedIo, std::move(h));
    if (adopt)
        adopt(tracker_.snapshot());
}

bool Hub::is_connected() const
{
    return !released_.load() && conn_ && conn_->is_alive();
}

// ======================================================================
// Function: Hub::send
// - In: downstream command
// - Out: SendResult; reply set when the command needs one and it arrived
// - Note: at most one command awaiting a reply per hub; a second one is
//         refused with Busy before anything is written
// ======================================================================
SendResult Hub::send(const proto::DownstreamMsg &msg)
{
    if (desynced_.load())
        return {SendStatus::Desynced, nullptr, "hub is desynchronized"};
    if (!is_connected())
        return {SendStatus::NotConnected, nullptr, "no live connection"};

    const proto::Bytes frame = msg.bytes();
    if (frame.empty())
    {
        LOG_ERROR("[HUB] cannot encode %s", msg.describe().c_str());
        return {SendStatus::EncodeFailed, nullptr, "frame too long"};
    }
    LOG_DEBUG("[HUB] send %s: %s", msg.describe().c_str(), brickhub::to_hex(frame).c_str());

    if (!msg.needs_reply())
    {
        if (!conn_->write(constants::HUB_HARDWARE_HANDLE, frame))
        {
            LOG_WARN("[HUB] write of %s failed", msg.describe().c_str());
            return {SendStatus::WriteFailed, nullptr, "write failed"};
        }
        return {};
    }

    auto ex     = std::make_shared<Exchange>();
    ex->request = &msg;
    std::future<SendResult> reply = ex->done.get_future();
    {
        std::lock_guard<std::mutex> lk(sync_mu_);
        if (pending_)
        {
            LOG_ERROR("[HUB] %s refused: %s still awaits a reply", msg.describe().c_str(),
                      pending_->request->describe().c_str());
            return {SendStatus::Busy, nullptr, "another request is pending"};
        }
        if (closed_.load() || desynced_.load())
            return {desynced_.load() ? SendStatus::Desynced : SendStatus::Disconnected, nullptr,
                    "hub closed"};
        pending_ = ex;
    }

    // the reply may be delivered before write() returns
    if (!conn_->write(constants::HUB_HARDWARE_HANDLE, frame))
    {
        std::lock_guard<std::mutex> lk(sync_mu_);
        if (pending_ == ex)
        {
            pending_.reset();
            LOG_WARN("[HUB] write of %s failed", msg.describe().c_str());
            return {SendStatus::WriteFailed, nullptr, "write failed"};
        }
    }

    if (cfg_.reply_timeout_ms == 0)
    {
        reply.wait();
    }
    else if (reply.wait_for(std::chrono::milliseconds(cfg_.reply_timeout_ms)) !=
             std::future_status::ready)
    {
        std::lock_guard<std::mutex> lk(sync_mu_);
        if (pending_ == ex)
        {
            pending_.reset();
            LOG_WARN("[HUB] no reply to %s within %u ms", msg.describe().c_str(),
                     (unsigned)cfg_.reply_timeout_ms);
            return {SendStatus::Timeout, nullptr, "no reply"};
        }
        // completed between the timeout and the lock
    }

    SendResult res = reply.get();
    if (res.ok())
        LOG_DEBUG("[HUB] %s answered by %s", msg.describe().c_str(),
                  res.reply->describe().c_str());
    return res;
}

SendResult Hub::disconnect()
{
    return send(proto::HubActionCmd(proto::action::DISCONNECT));
}

SendResult Hub::switch_off()
{
    return send(proto::HubActionCmd(proto::action::SWITCH_OFF));
}

void Hub::close()
{
    if (closed_.exchange(true))
        return;
    LOG_DEBUG("[HUB] closing");
    if (conn_)
        conn_->set_notify_handler(nullptr);
    release_connection();
    fail_pending(SendStatus::Disconnected, "hub closed");
}

std::shared_ptr<Peripheral> Hub::peripheral(std::uint8_t port) const
{
    return tracker_.find(port);
}

PeripheralMap Hub::peripherals() const
{
    return tracker_.snapshot();
}

// ======================================================================
// Function: Hub::on_notify
// - In: raw notification frame from the connection
// - Out: none
// - Note: correlates with the pending request first, then runs every
//         handler registered for the message type, in order
// ======================================================================
void Hub::on_notify(std::uint16_t handle, const transport::Frame &data)
{
    std::lock_guard<std::mutex> lk(dispatch_mu_);
    if (desynced_.load() || closed_.load())
        return;

    LOG_DEBUG("[HUB] notify handle=0x%02x %s", (unsigned)handle, brickhub::to_hex(data).c_str());
    proto::UpstreamPtr msg = proto::decode(data);
    if (!msg)
    {
        mark_desynced("undecodable notification " + brickhub::to_hex(data));
        return;
    }

    std::shared_ptr<Exchange> answered;
    {
        std::lock_guard<std::mutex> slk(sync_mu_);
        if (pending_ && msg->is_reply_to(*pending_->request))
            answered = std::move(pending_);
    }
    if (answered)
        answered->done.set_value(SendResult{SendStatus::Ok, msg, {}});

    dispatch(msg);
}

void Hub::dispatch(const proto::UpstreamPtr &msg)
{
    std::vector<std::pair<proto::MsgType, Handler>> table;
    {
        std::lock_guard<std::mutex> lk(handlers_mu_);
        table = handlers_;
    }
    for (const auto &h : table)
    {
        if (h.first != msg->type())
            continue;
        h.second(msg);
        if (desynced_.load())
            return;
    }
}

void Hub::handle_attached_io(const proto::UpstreamPtr &msg)
{
    const auto   &io  = static_cast<const proto::HubAttachedIoMsg &>(*msg);
    AttachOutcome out = tracker_.apply(*this, io);
    switch (out.status)
    {
        case AttachStatus::Attached:
        case AttachStatus::Detached:
            break;
        case AttachStatus::UnknownPort:
        case AttachStatus::PortOccupied:
        case AttachStatus::BadEvent:
            mark_desynced(std::string(attach_status_name(out.status)) + " in " + io.describe());
            break;
    }
}

void Hub::handle_port_value(const proto::UpstreamPtr &msg)
{
    const auto &pv = static_cast<const proto::PortValueMsg &>(*msg);
    auto        p  = tracker_.find(pv.port());
    if (!p)
    {
        LOG_WARN("[HUB] value for unattached port 0x%02x dropped", (unsigned)pv.port());
        return;
    }
    p->queue_port_data(msg);
}

void Hub::handle_error(const proto::UpstreamPtr &msg)
{
    const auto &e = static_cast<const proto::GenericErrorMsg &>(*msg);
    LOG_WARN("[HUB] %s", e.message().c_str());

    std::shared_ptr<Exchange> failed;
    {
        std::lock_guard<std::mutex> lk(sync_mu_);
        failed = std::move(pending_);
    }
    if (failed)
        failed->done.set_value(SendResult{SendStatus::CommandError, msg, e.message()});
}

void Hub::handle_action(const proto::UpstreamPtr &msg)
{
    const auto &a = static_cast<const proto::HubActionMsg &>(*msg);
    if (a.action() != proto::action::UPSTREAM_DISCONNECT &&
        a.action() != proto::action::UPSTREAM_SHUTDOWN)
        return;

    LOG_INFO("[HUB] hub reports %s, releasing connection",
             a.action() == proto::action::UPSTREAM_SHUTDOWN ? "shutdown" : "disconnect");
    release_connection();
    fail_pending(SendStatus::Disconnected, "hub went away");
}

bool Hub::fail_pending(SendStatus status, const std::string &why)
{
    std::shared_ptr<Exchange> ex;
    {
        std::lock_guard<std::mutex> lk(sync_mu_);
        ex = std::move(pending_);
    }
    if (!ex)
        return false;
    LOG_WARN("[HUB] %s: %s", ex->request->describe().c_str(), why.c_str());
    ex->done.set_value(SendResult{status, nullptr, why});
    return true;
}

void Hub::mark_desynced(const std::string &why)
{
    if (desynced_.exchange(true))
        return;
    LOG_ERROR("[HUB] protocol desync, hub unusable: %s", why.c_str());
    fail_pending(SendStatus::Desynced, why);
    release_connection();
}

void Hub::release_connection()
{
    if (released_.exchange(true))
        return;
    if (conn_ && conn_->is_alive())
        conn_->disconnect();
}

}  // namespace hub
