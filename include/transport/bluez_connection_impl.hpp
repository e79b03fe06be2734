// include/transport/bluez_connection_impl.hpp
#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

#include <systemd/sd-bus.h>

#include "transport/bluez_connection.hpp"

namespace transport
{
struct BluezConnection::Impl
{
    sd_bus *bus = nullptr;

    // serialize all sd-bus access
    std::mutex bus_mu;

    sd_bus_slot     *added_slot        = nullptr;
    sd_bus_slot     *removed_slot      = nullptr;
    sd_bus_slot     *props_slot        = nullptr;
    sd_bus_slot     *connect_call_slot = nullptr;
    std::atomic_bool discovery_on{false};
    bool             uuid_filter_ok{false};

    std::thread loop;

    // guarded by bus_mu
    std::string adapter_path;  // "/org/bluez/hci0"
    std::string dev_path;      // "/org/bluez/hci0/dev_XX_XX_XX_XX_XX_XX"
    std::string char_path;     // hub characteristic under dev_path
    std::string unique_name;   // our bus unique name (debug)

    std::atomic_bool connected{false};
    std::atomic_bool connect_inflight{false};
    std::atomic_bool services_resolved{false};
    std::atomic_bool discover_submitted{false};
    std::atomic_bool gatt_ready{false};
    std::atomic_bool notifying{false};

    // bus thread only
    std::uint64_t next_connect_at_ms{0};
    std::uint64_t last_scan_ms{0};
    std::uint32_t scan_min_interval_ms{2000};

    // notification values waiting for delivery
    std::mutex        rx_mu;
    std::deque<Frame> rx;

    std::mutex              ready_mu;
    std::condition_variable ready_cv;
};
}  // namespace transport
