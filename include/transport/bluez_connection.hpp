#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "transport/iconnection.hpp"
#include "util/constants.hpp"

namespace transport
{

struct BluezConfig
{
    std::string                adapter   = "hci0";
    std::string                svc_uuid  = std::string(constants::HUB_SVC_UUID);
    std::string                char_uuid = std::string(constants::HUB_CHAR_UUID);  // write + notify
    std::optional<std::string> hub_addr{};  // "AA:BB:CC:DD:EE:FF"; first hub seen when unset

    // BRICKHUB_ADAPTER, BRICKHUB_HUB_MAC
    static BluezConfig from_env();
};

// Central-role link to one hub over the BlueZ D-Bus API.
class BluezConnection final : public IConnection
{
  public:
    explicit BluezConnection(BluezConfig cfg);
    ~BluezConnection() override;

    // Opens the system bus, starts discovery and the bus thread.
    bool start();
    // Blocks until the hub is connected and its characteristic resolved.
    bool wait_ready(std::uint32_t timeout_ms);
    void stop();

    bool        write(std::uint16_t handle, const Frame &data) override;
    void        set_notify_handler(OnNotify cb) override;
    bool        enable_notifications() override;
    void        disconnect() override;
    bool        is_alive() const override;
    std::string name() const override;

    const BluezConfig &config() const { return cfg_; }

    // ---- used by the D-Bus callbacks, bus thread with bus_mu held ----
    const std::string &dev_path() const;
    void               set_dev_path(const std::string &path);
    const std::string &char_path() const;
    bool               connected() const;
    void               set_connected(bool v);
    void               set_connect_inflight(bool v);
    void               set_services_resolved(bool v);
    void               set_next_connect_at_ms(std::uint64_t ms);
    bool               has_uuid_discovery_filter() const;
    // Link dropped by the device or BlueZ after it was ready.
    void on_link_lost(const char *why);
    // Queues a characteristic value; delivered outside bus_mu on the bus thread.
    void queue_rx(const std::uint8_t *data, std::size_t len);

  private:
    bool set_discovery_filter();
    bool start_discovery();
    bool cold_scan();
    bool connect_device();
    bool discover_services();
    bool find_char_path();
    bool write_value(const std::uint8_t *data, std::size_t len);
    void pump();
    void deliver_rx();
    void bus_loop();

    BluezConfig      cfg_;
    std::atomic_bool running_{false};
    std::atomic_bool released_{false};

    std::mutex handler_mu_;
    OnNotify   on_notify_{};

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace transport
