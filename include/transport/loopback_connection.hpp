#pragma once
#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <vector>

#include "transport/iconnection.hpp"

namespace transport
{

// In-process stand-in for a hub link. Writes are recorded; notifications are
// pushed with inject() or produced by a responder that answers each write.
class LoopbackConnection final : public IConnection
{
  public:
    using Responder = std::function<std::vector<Frame>(const Frame &written)>;

    bool        write(std::uint16_t handle, const Frame &data) override;
    void        set_notify_handler(OnNotify cb) override;
    bool        enable_notifications() override;
    void        disconnect() override;
    bool        is_alive() const override;
    std::string name() const override { return "loopback"; }

    void set_responder(Responder r);
    void inject(const Frame &frame);

    std::vector<Frame> written() const;
    std::size_t        write_count() const;
    int                disconnect_count() const { return disconnects_.load(); }
    bool               notifications_enabled() const { return notifying_.load(); }

  private:
    void deliver(const Frame &frame);

    mutable std::mutex mu_;
    OnNotify           on_notify_{};
    Responder          responder_{};
    std::vector<Frame> written_;
    std::atomic_bool   alive_{true};
    std::atomic_bool   notifying_{false};
    std::atomic_int    disconnects_{0};
    std::mutex         deliver_mu_;  // one delivery context at a time
};

}  // namespace transport
