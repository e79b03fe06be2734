#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>

#include "proto/messages.hpp"

namespace hub
{

class Hub;

enum class Capability
{
    Generic,
    Motor,
    EncodedMotor,
    VisionSensor,
    RgbLight,
    TiltSensor,
    CurrentSensor,
    VoltageSensor
};

const char *capability_name(Capability c);

// A device on one hub port. Created and destroyed only by the hub's attachment
// tracking; holds a non-owning back-reference to that hub.
// Always owned through a shared_ptr: the reader thread only reaches the
// peripheral through a weak reference taken around each value.
class Peripheral : public std::enable_shared_from_this<Peripheral>
{
  public:
    using OnValue      = std::function<void(std::uint8_t port, const proto::Bytes &value)>;
    using VirtualPorts = std::pair<std::uint8_t, std::uint8_t>;

    Peripheral(Hub &hub, std::uint8_t port, std::uint16_t device_type);
    virtual ~Peripheral();

    Peripheral(const Peripheral &)            = delete;
    Peripheral &operator=(const Peripheral &) = delete;

    virtual Capability capability() const { return Capability::Generic; }

    std::uint8_t                port() const { return port_; }
    std::uint16_t               device_type() const { return device_type_; }
    std::optional<VirtualPorts> virtual_ports() const;
    void                        set_virtual_ports(std::uint8_t a, std::uint8_t b);
    std::string                 describe() const;

    // Starts the reader thread. Called once by the registry after construction.
    void start();

    // Called from the notification context; processed later on the reader thread.
    void queue_port_data(proto::UpstreamPtr msg);

    // Enables value notifications for `mode` (synchronous round-trip through the hub).
    bool subscribe(OnValue cb, std::uint8_t mode = 0, std::uint32_t delta = 1);
    bool unsubscribe();

    std::optional<std::uint8_t> subscribed_mode() const;
    proto::Bytes                last_value() const;
    std::size_t                 values_seen() const { return values_seen_.load(); }

  protected:
    // Runs on the reader thread, once per queued value, in arrival order.
    virtual void handle_port_data(const proto::PortValueMsg &msg);

    Hub &hub_;

  private:
    // Outlives the peripheral when the reader thread has to be detached.
    struct ReaderState
    {
        std::mutex                     mu;
        std::condition_variable        cv;
        std::deque<proto::UpstreamPtr> queue;
        bool                           stop{false};
    };

    static void reader_loop(std::shared_ptr<ReaderState> rx,
                            std::weak_ptr<Peripheral>    self,
                            std::uint8_t                 port);
    void        stop_reader();

    const std::uint8_t  port_;
    const std::uint16_t device_type_;

    mutable std::mutex          state_mu_;
    std::optional<VirtualPorts> virtual_ports_;
    std::optional<std::uint8_t> mode_;
    OnValue                     on_value_{};
    proto::Bytes                last_value_;
    std::atomic<std::size_t>    values_seen_{0};

    std::shared_ptr<ReaderState> rx_;
    std::thread                  reader_;
};

class Motor : public Peripheral
{
  public:
    using Peripheral::Peripheral;
    Capability capability() const override { return Capability::Motor; }
};

class EncodedMotor : public Motor
{
  public:
    using Motor::Motor;
    Capability capability() const override { return Capability::EncodedMotor; }
};

class VisionSensor : public Peripheral
{
  public:
    using Peripheral::Peripheral;
    Capability capability() const override { return Capability::VisionSensor; }
};

class RgbLight : public Peripheral
{
  public:
    using Peripheral::Peripheral;
    Capability capability() const override { return Capability::RgbLight; }
};

class TiltSensor : public Peripheral
{
  public:
    using Peripheral::Peripheral;
    Capability capability() const override { return Capability::TiltSensor; }
};

class CurrentSensor : public Peripheral
{
  public:
    using Peripheral::Peripheral;
    Capability capability() const override { return Capability::CurrentSensor; }
};

class VoltageSensor : public Peripheral
{
  public:
    using Peripheral::Peripheral;
    Capability capability() const override { return Capability::VoltageSensor; }
};

}  // namespace hub
