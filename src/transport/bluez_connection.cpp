/* ======================================================================
 * BlueZ hub connection (facade)
 *
 *  Caller thread                    Bus thread                       BlueZ/DBus
 *  -------------                    ----------                       ----------
 *  start()
 *    └─ open system bus, signal matches
 *    └─ SetDiscoveryFilter / StartDiscovery ───────────────────────▶  Adapter1
 *    └─ spawn bus loop
 *                                   bus_loop()
 *                                     └─ sd_bus_process (bus_mu)  ◀── signals, replies
 *                                     └─ deliver_rx (no lock)      ──▶ notify handler
 *                                     └─ sd_bus_wait (no lock)
 *                                     └─ pump: scan / connect / resolve characteristic
 *  wait_ready(timeout)
 *    └─ until connected and characteristic resolved
 *  enable_notifications() ────────────────────────────────────────▶  GattCharacteristic1.StartNotify
 *  write(handle, frame)   ────────────────────────────────────────▶  GattCharacteristic1.WriteValue
 *  disconnect()           ────────────────────────────────────────▶  Device1.Disconnect
 *  stop()
 *    └─ disconnect, sd_bus_close, join the bus thread outside bus_mu
 *
 *  Notes
 *    └─ all DBus calls are made under impl_->bus_mu
 *    └─ notification handlers run on the bus thread with no lock held, so
 *       they may call write() and disconnect()
 * ====================================================================== */

#include <cerrno>
#include <chrono>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include <systemd/sd-bus.h>

// clang-format off
#include "transport/bluez_connection.hpp"
#include "transport/bluez_connection_impl.hpp"
#include "transport/bluez_dbus_util.hpp"
#include "transport/bluez_helper.hpp"
#include "util/env.hpp"
#include "util/log.hpp"
// clang-format on

namespace transport
{

BluezConfig BluezConfig::from_env()
{
    BluezConfig c;
    c.adapter = brickhub::env_or("BRICKHUB_ADAPTER", "hci0");
    std::string mac = brickhub::env_or("BRICKHUB_HUB_MAC", "");
    if (!mac.empty())
        c.hub_addr = mac;
    return c;
}

BluezConnection::BluezConnection(BluezConfig cfg) : cfg_(std::move(cfg)) {}

BluezConnection::~BluezConnection()
{
    stop();
}

// ============== Impl accessors ==============
const std::string &BluezConnection::dev_path() const
{
    return impl_->dev_path;
}
void BluezConnection::set_dev_path(const std::string &path)
{
    impl_->dev_path = path;
}
const std::string &BluezConnection::char_path() const
{
    return impl_->char_path;
}
bool BluezConnection::connected() const
{
    return impl_ && impl_->connected.load();
}
void BluezConnection::set_connected(bool v)
{
    impl_->connected.store(v);
}
void BluezConnection::set_connect_inflight(bool v)
{
    impl_->connect_inflight.store(v);
}
void BluezConnection::set_services_resolved(bool v)
{
    impl_->services_resolved.store(v);
}
void BluezConnection::set_next_connect_at_ms(std::uint64_t ms)
{
    impl_->next_connect_at_ms = ms;
}
bool BluezConnection::has_uuid_discovery_filter() const
{
    return impl_ && impl_->uuid_filter_ok;
}
// ============= End of Impl accessors =============

std::string BluezConnection::name() const
{
    return "bluez/" + cfg_.adapter;
}

// ======================================================================
// Function: BluezConnection::start
// - In: none (adapter and UUIDs from config)
// - Out: true when the bus thread is running and discovery is kicked off
// - Note: the hub is not connected yet; see wait_ready()
// ======================================================================
bool BluezConnection::start()
{
    if (running_.load())
        return true;
    if (released_.load())
    {
        LOG_ERROR("[BLUEZ] connection was already released");
        return false;
    }
    impl_ = std::make_unique<Impl>();

    auto fail = [this] {
        unref_slot(impl_->added_slot);
        unref_slot(impl_->removed_slot);
        unref_slot(impl_->props_slot);
        if (impl_->bus)
            sd_bus_flush_close_unref(impl_->bus);
        impl_.reset();
        return false;
    };

    int r = sd_bus_open_system(&impl_->bus);
    if (r < 0 || !impl_->bus)
    {
        LOG_ERROR("[BLUEZ] failed to connect system bus: %s", strerror(-r));
        impl_->bus = nullptr;
        return fail();
    }

    impl_->adapter_path = "/org/bluez/" + cfg_.adapter;
    const char *uname   = nullptr;
    if (sd_bus_get_unique_name(impl_->bus, &uname) >= 0 && uname)
        impl_->unique_name = uname;

    r = sd_bus_match_signal(impl_->bus, &impl_->added_slot, "org.bluez", "/",
                            "org.freedesktop.DBus.ObjectManager", "InterfacesAdded",
                            bluez_on_iface_added, this);
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ] subscribe to InterfacesAdded failed: %s", strerror(-r));
        return fail();
    }
    r = sd_bus_match_signal(impl_->bus, &impl_->removed_slot, "org.bluez", "/",
                            "org.freedesktop.DBus.ObjectManager", "InterfacesRemoved",
                            bluez_on_iface_removed, this);
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ] subscribe to InterfacesRemoved failed: %s", strerror(-r));
        return fail();
    }
    // Device1.Connected / ServicesResolved and GattCharacteristic1.Value
    r = sd_bus_match_signal(impl_->bus, &impl_->props_slot, "org.bluez", nullptr,
                            "org.freedesktop.DBus.Properties", "PropertiesChanged",
                            bluez_on_props_changed, this);
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ] subscribe to PropertiesChanged failed: %s", strerror(-r));
        return fail();
    }
    LOG_INFO("[BLUEZ] adapter=%s svc=%s hub=%s (bus name %s)", cfg_.adapter.c_str(),
             cfg_.svc_uuid.c_str(), cfg_.hub_addr ? cfg_.hub_addr->c_str() : "any",
             impl_->unique_name.c_str());

    if (!set_discovery_filter())
        LOG_WARN("[BLUEZ] no discovery filter, matching devices by advertised UUIDs");
    if (!start_discovery())
        LOG_WARN("[BLUEZ] StartDiscovery failed (continue with known devices)");

    running_.store(true);
    impl_->loop = std::thread([this] { bus_loop(); });
    return true;
}

void BluezConnection::bus_loop()
{
    while (running_.load())
    {
        {
            std::lock_guard<std::mutex> lk(impl_->bus_mu);
            while (true)
            {
                int pr = sd_bus_process(impl_->bus, nullptr);
                if (pr < 0)
                {
                    LOG_ERROR("[BLUEZ] sd_bus_process failed: %s", strerror(-pr));
                    break;
                }
                if (pr == 0)
                    break;
            }
        }
        deliver_rx();
        if (!running_.load())
            break;
        // do not hold the lock while waiting, writers on other threads need it
        {
            const uint64_t WAIT_USEC = 100000;  // 100ms
            sd_bus_wait(impl_->bus, WAIT_USEC);
        }
        pump();
    }
    LOG_DEBUG("[BLUEZ] bus loop exit");
}

bool BluezConnection::wait_ready(std::uint32_t timeout_ms)
{
    if (!impl_)
        return false;
    std::unique_lock<std::mutex> lk(impl_->ready_mu);
    impl_->ready_cv.wait_for(lk, std::chrono::milliseconds(timeout_ms), [this] {
        return impl_->gatt_ready.load() || !running_.load();
    });
    if (impl_->gatt_ready.load())
        return true;
    LOG_ERROR("[BLUEZ] hub not ready within %u ms", (unsigned)timeout_ms);
    return false;
}

void BluezConnection::set_notify_handler(OnNotify cb)
{
    std::lock_guard<std::mutex> lk(handler_mu_);
    on_notify_ = std::move(cb);
}

void BluezConnection::queue_rx(const std::uint8_t *data, std::size_t len)
{
    if (!data || len == 0)
        return;
    std::lock_guard<std::mutex> lk(impl_->rx_mu);
    impl_->rx.emplace_back(data, data + len);
}

// Bus thread, no lock held: handlers may write or disconnect.
void BluezConnection::deliver_rx()
{
    while (true)
    {
        Frame f;
        {
            std::lock_guard<std::mutex> lk(impl_->rx_mu);
            if (impl_->rx.empty())
                return;
            f = std::move(impl_->rx.front());
            impl_->rx.pop_front();
        }
        OnNotify cb;
        {
            std::lock_guard<std::mutex> lk(handler_mu_);
            cb = on_notify_;
        }
        if (cb)
            cb(constants::HUB_HARDWARE_HANDLE, f);
    }
}

bool BluezConnection::write(std::uint16_t handle, const Frame &data)
{
    // the hub has a single characteristic; the handle only names it
    if (handle != constants::HUB_HARDWARE_HANDLE)
        LOG_DEBUG("[BLUEZ] write to handle 0x%02x goes to the hub characteristic", (unsigned)handle);
    if (!is_alive())
    {
        LOG_WARN("[BLUEZ] write on a link that is not up");
        return false;
    }
    if (data.empty())
        return false;
    return write_value(data.data(), data.size());
}

bool BluezConnection::is_alive() const
{
    return !released_.load() && running_.load() && impl_ && impl_->connected.load() &&
           impl_->gatt_ready.load();
}

void BluezConnection::on_link_lost(const char *why)
{
    impl_->connected.store(false);
    impl_->notifying.store(false);
    if (!impl_->gatt_ready.exchange(false))
    {
        LOG_DEBUG("[BLUEZ] link down before ready (%s), retrying", why);
        return;
    }
    LOG_WARN("[BLUEZ] hub link lost: %s", why);
    released_.store(true);
    running_.store(false);
    impl_->ready_cv.notify_all();
}

// ======================================================================
// Function: BluezConnection::disconnect
// - In: any thread, including the notification handler on the bus thread
// - Out: asks BlueZ to drop the link and lets the bus loop wind down
// - Note: idempotent; the bus thread is joined later by stop()
// ======================================================================
void BluezConnection::disconnect()
{
    if (released_.exchange(true))
        return;
    if (!impl_)
        return;
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        if (impl_->bus && !impl_->dev_path.empty() && impl_->connected.load())
        {
            sd_bus_error    derr{};
            sd_bus_message *drep = nullptr;
            int r = sd_bus_call_method(impl_->bus, "org.bluez", impl_->dev_path.c_str(),
                                       "org.bluez.Device1", "Disconnect", &derr, &drep, "");
            if (r < 0)
                LOG_WARN("[BLUEZ] Disconnect failed: %s",
                         derr.message ? derr.message : strerror(-r));
            if (drep)
                sd_bus_message_unref(drep);
            sd_bus_error_free(&derr);
        }
    }
    impl_->connected.store(false);
    impl_->gatt_ready.store(false);
    impl_->notifying.store(false);
    running_.store(false);
    impl_->ready_cv.notify_all();
    LOG_INFO("[BLUEZ] disconnected");
}

// ======================================================================
// Function: BluezConnection::stop
// - In: any thread except the bus thread
// - Out: link released, bus thread joined, bus closed
// - Note: joins the bus loop thread outside of locks
// ======================================================================
void BluezConnection::stop()
{
    if (!impl_)
        return;
    disconnect();
    running_.store(false);

    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        if (impl_->bus && impl_->discovery_on.load())
        {
            sd_bus_error    err{};
            sd_bus_message *rep = nullptr;
            (void)sd_bus_call_method(impl_->bus, "org.bluez", impl_->adapter_path.c_str(),
                                     "org.bluez.Adapter1", "StopDiscovery", &err, &rep, "");
            if (rep)
                sd_bus_message_unref(rep);
            sd_bus_error_free(&err);
            impl_->discovery_on.store(false);
        }
        // wake the loop if it sits in sd_bus_wait()
        if (impl_->bus)
            sd_bus_close(impl_->bus);
    }

    if (impl_->loop.joinable())
    {
        if (impl_->loop.get_id() == std::this_thread::get_id())
        {
            LOG_ERROR("[BLUEZ] stop() from the bus thread; leaving bus state to the thread");
            impl_->loop.detach();
            return;
        }
        impl_->loop.join();
    }

    unref_slot(impl_->added_slot);
    unref_slot(impl_->removed_slot);
    unref_slot(impl_->props_slot);
    unref_slot(impl_->connect_call_slot);

    if (impl_->bus)
    {
        sd_bus_flush_close_unref(impl_->bus);
        impl_->bus = nullptr;
    }
    impl_.reset();
    LOG_DEBUG("[BLUEZ] stopped");
}

}  // namespace transport
