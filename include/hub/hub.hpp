#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "hub/attachment_tracker.hpp"
#include "hub/peripheral.hpp"
#include "hub/peripheral_registry.hpp"
#include "proto/messages.hpp"
#include "transport/iconnection.hpp"

namespace hub
{

enum class SendStatus
{
    Ok,
    Busy,          // another synchronous request is in flight; nothing was written
    NotConnected,  // connection released or not alive
    EncodeFailed,  // frame does not fit the short length form
    WriteFailed,
    CommandError,  // the hub answered with a generic error
    Timeout,
    Disconnected,  // hub closed or link torn down while waiting
    Desynced,      // protocol state lost; the hub is unusable
};

const char *send_status_name(SendStatus s);

struct SendResult
{
    SendStatus         status = SendStatus::Ok;
    proto::UpstreamPtr reply{};
    std::string        error{};

    bool ok() const { return status == SendStatus::Ok; }
};

struct HubConfig
{
    // 0 waits until a reply arrives or the hub is closed
    std::uint32_t reply_timeout_ms = 0;

    // BRICKHUB_REPLY_TIMEOUT_MS
    static HubConfig from_env();
};

/*
Hub engine: owns the connection, decodes every notification, hands replies to
the one waiting synchronous sender and dispatches to the handler table.

Threads:
- caller threads: send(), accessors, close()
- connection delivery thread: on_notify() -> handlers, one notification at a time

Handlers run on the delivery thread and must not call send() for a command
that needs a reply.
*/
class Hub
{
  public:
    using Handler = std::function<void(const proto::UpstreamPtr &msg)>;

    explicit Hub(std::unique_ptr<transport::IConnection> conn,
                 HubConfig                               cfg = HubConfig{},
                 PeripheralRegistry registry = PeripheralRegistry::defaults());
    virtual ~Hub();

    Hub(const Hub &)            = delete;
    Hub &operator=(const Hub &) = delete;

    // Appends to the handler table; handlers run in registration order.
    void add_message_handler(proto::MsgType type, Handler h);

    SendResult send(const proto::DownstreamMsg &msg);

    // Asks the hub to drop the link / power off; the hub's answer also tears
    // the connection down.
    SendResult disconnect();
    SendResult switch_off();

    // Detaches from the connection and releases it. Idempotent.
    void close();

    std::shared_ptr<Peripheral> peripheral(std::uint8_t port) const;
    PeripheralMap               peripherals() const;

    bool desynced() const { return desynced_.load(); }
    bool is_closed() const { return closed_.load(); }
    bool is_connected() const;

    const HubConfig &config() const { return cfg_; }

  protected:
    using Adopt = std::function<void(const PeripheralMap &current)>;

    // Registers an attach handler and hands the currently tracked peripherals
    // to `adopt`, both while no notification is being dispatched. Every
    // peripheral is then seen exactly once: by `adopt` or by the handler.
    void add_attach_handler(Handler h, const Adopt &adopt);

    // close(), then stop the connection's delivery thread and drop the
    // peripherals. Derived destructors call it before their members go away.
    void teardown();

  private:
    struct Exchange
    {
        const proto::DownstreamMsg *request = nullptr;
        std::promise<SendResult>    done;
    };

    void on_notify(std::uint16_t handle, const transport::Frame &data);
    void dispatch(const proto::UpstreamPtr &msg);

    void handle_attached_io(const proto::UpstreamPtr &msg);
    void handle_port_value(const proto::UpstreamPtr &msg);
    void handle_error(const proto::UpstreamPtr &msg);
    void handle_action(const proto::UpstreamPtr &msg);

    // Completes and clears the pending exchange, if any.
    bool fail_pending(SendStatus status, const std::string &why);
    void mark_desynced(const std::string &why);
    void release_connection();

    std::unique_ptr<transport::IConnection> conn_;
    const HubConfig                         cfg_;
    AttachmentTracker                       tracker_;

    std::mutex                                      handlers_mu_;
    std::vector<std::pair<proto::MsgType, Handler>> handlers_;

    std::mutex                sync_mu_;
    std::shared_ptr<Exchange> pending_;

    std::mutex dispatch_mu_;

    std::atomic<bool> released_{false};
    std::atomic<bool> closed_{false};
    std::atomic<bool> desynced_{false};
};

}  // namespace hub
