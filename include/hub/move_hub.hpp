#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "hub/button.hpp"
#include "hub/hub.hpp"
#include "util/constants.hpp"

namespace hub
{

struct MoveHubConfig
{
    std::uint32_t wait_attempts    = constants::DEVICE_WAIT_ATTEMPTS;
    std::uint32_t wait_interval_ms = constants::DEVICE_WAIT_INTERVAL_MS;

    // BRICKHUB_WAIT_ATTEMPTS, BRICKHUB_WAIT_INTERVAL_MS
    static MoveHubConfig from_env();
};

// Results of the start-up status queries; unset when a query failed.
struct HubInfo
{
    std::optional<std::string> name;
    std::optional<std::string> mac;
    std::optional<unsigned>    battery_percent;
    std::optional<bool>        low_voltage;
};

/*
LEGO Boost Move Hub: two internal tacho motors (A, B) and their virtual pair
(AB), two external ports (C, D), RGB light, tilt, current and voltage sensors.

The constructor waits (bounded) for the built-in devices, then runs the status
queries. Missing devices are logged; the hub stays usable.
*/
class MoveHub : public Hub
{
  public:
    static constexpr std::uint8_t PORT_A       = 0x00;
    static constexpr std::uint8_t PORT_B       = 0x01;
    static constexpr std::uint8_t PORT_C       = 0x02;
    static constexpr std::uint8_t PORT_D       = 0x03;
    static constexpr std::uint8_t PORT_AB      = 0x10;
    static constexpr std::uint8_t PORT_LED     = 0x32;
    static constexpr std::uint8_t PORT_TILT    = 0x3A;
    static constexpr std::uint8_t PORT_CURRENT = 0x3B;
    static constexpr std::uint8_t PORT_VOLTAGE = 0x3C;

    explicit MoveHub(std::unique_ptr<transport::IConnection> conn,
                     MoveHubConfig                           mcfg = MoveHubConfig{},
                     HubConfig                               cfg  = HubConfig{});
    ~MoveHub() override;

    std::shared_ptr<Peripheral> motor_a() const;
    std::shared_ptr<Peripheral> motor_b() const;
    std::shared_ptr<Peripheral> motor_ab() const;
    std::shared_ptr<Peripheral> port_c() const;
    std::shared_ptr<Peripheral> port_d() const;
    std::shared_ptr<Peripheral> led() const;
    std::shared_ptr<Peripheral> tilt_sensor() const;
    std::shared_ptr<Peripheral> current() const;
    std::shared_ptr<Peripheral> voltage() const;
    std::shared_ptr<Peripheral> vision_sensor() const;
    std::shared_ptr<Peripheral> motor_external() const;

    Button &button() { return button_; }

    HubInfo info() const;

    // Names of built-in devices not attached yet (empty when complete).
    std::vector<std::string> missing_devices() const;

    // Polls until every built-in device is bound or the attempts run out.
    bool wait_for_devices();

    // Queries name, MAC, battery level and low-voltage alert into info().
    void report_status();

  private:
    struct Named
    {
        std::shared_ptr<Peripheral> motor_a;
        std::shared_ptr<Peripheral> motor_b;
        std::shared_ptr<Peripheral> motor_ab;
        std::shared_ptr<Peripheral> port_c;
        std::shared_ptr<Peripheral> port_d;
        std::shared_ptr<Peripheral> led;
        std::shared_ptr<Peripheral> tilt_sensor;
        std::shared_ptr<Peripheral> current;
        std::shared_ptr<Peripheral> voltage;
        std::shared_ptr<Peripheral> vision_sensor;
        std::shared_ptr<Peripheral> motor_external;
    };

    void on_attached_io(const proto::UpstreamPtr &msg);
    void bind_locked(const std::shared_ptr<Peripheral> &p);
    void unbind_locked(std::uint8_t port);

    const MoveHubConfig mcfg_;
    Button              button_;

    mutable std::mutex named_mu_;
    Named              named_;

    mutable std::mutex info_mu_;
    HubInfo            info_;
};

}  // namespace hub
