/* ======================================================================
 * BlueZ central path to the hub
 *
 *  pump() (bus thread)                                    BlueZ/DBus
 *  -------------------                                    ----------
 *    └─ no device yet  → cold_scan ──────────────────────▶  ObjectManager.GetManagedObjects
 *                        (or InterfacesAdded adopts one)
 *    └─ device known   → connect_device ─────────────────▶  Device1.Connect (async)
 *                                  ◀── on_connect_reply
 *    └─ connected      → discover_services ──────────────▶  Device1.DiscoverServices
 *                                  ◀── PropertiesChanged: ServicesResolved=true
 *                      → find_char_path (cache walk) ────▶  ObjectManager.GetManagedObjects
 *                      → ready, StopDiscovery
 *
 *  Ready condition: connected && hub characteristic resolved
 * ====================================================================== */

#include <cerrno>
#include <chrono>
#include <cstring>
#include <mutex>
#include <string>
#include <vector>

#include <systemd/sd-bus.h>

// clang-format off
#include "transport/bluez_connection.hpp"
#include "transport/bluez_connection_impl.hpp"
#include "transport/bluez_dbus_util.hpp"
#include "transport/bluez_helper.hpp"
#include "util/log.hpp"
// clang-format on

namespace
{

std::uint64_t now_ms()
{
    using namespace std::chrono;
    return (std::uint64_t)duration_cast<milliseconds>(steady_clock::now().time_since_epoch())
        .count();
}

// ======================================================================
// Function: adapter_start_discovery_locked
// - In: bus_mu locked, adapter_path valid
// - Out: true if StartDiscovery succeeds and discovery_on becomes true
// - Note: safe to call repeatedly, only starts when off
// ======================================================================
bool adapter_start_discovery_locked(sd_bus            *bus,
                                    const std::string &adapter_path,
                                    std::atomic_bool  &discovery_on)
{
    if (!bus)
        return false;
    if (discovery_on.load())
        return true;

    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(bus, "org.bluez", adapter_path.c_str(), "org.bluez.Adapter1",
                               "StartDiscovery", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        if (err.name && std::string(err.name) == "org.bluez.Error.InProgress")
        {
            discovery_on.store(true);
            LOG_INFO("[BLUEZ] StartDiscovery already in progress on %s", adapter_path.c_str());
            sd_bus_error_free(&err);
            return true;
        }
        LOG_WARN("[BLUEZ] StartDiscovery failed: %s", err.message ? err.message : strerror(-r));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    discovery_on.store(true);
    LOG_INFO("[BLUEZ] StartDiscovery OK on %s", adapter_path.c_str());
    return true;
}

// ======================================================================
// Function: adapter_stop_discovery_locked
// - In: bus_mu locked, adapter_path valid
// - Out: true once discovery is considered off
// - Note: clears discovery_on even if StopDiscovery fails
// ======================================================================
bool adapter_stop_discovery_locked(sd_bus            *bus,
                                   const std::string &adapter_path,
                                   std::atomic_bool  &discovery_on)
{
    if (!bus)
        return false;

    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(bus, "org.bluez", adapter_path.c_str(), "org.bluez.Adapter1",
                               "StopDiscovery", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
        LOG_WARN("[BLUEZ] StopDiscovery failed (treat as off): %s",
                 err.message ? err.message : strerror(-r));
    else
        LOG_INFO("[BLUEZ] StopDiscovery OK");
    discovery_on.store(false);
    sd_bus_error_free(&err);
    return true;
}

// ======================================================================
// Function: char_start_notify_locked
// - In: bus valid, bus_mu locked, char_path is the hub characteristic
// - Out: true if StartNotify returns success on DBus
// ======================================================================
bool char_start_notify_locked(sd_bus *bus, const std::string &char_path, std::atomic_bool &notifying)
{
    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int             r   = sd_bus_call_method(bus, "org.bluez", char_path.c_str(),
                                             "org.bluez.GattCharacteristic1", "StartNotify", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        const char *ename = err.name ? err.name : "";
        const char *emsg  = err.message ? err.message : "";
        // already notifying for another client is fine
        if (std::strcmp(ename, "org.bluez.Error.InProgress") == 0)
        {
            LOG_INFO("[BLUEZ] StartNotify in progress on %s", char_path.c_str());
            sd_bus_error_free(&err);
            notifying.store(true);
            return true;
        }
        LOG_WARN("[BLUEZ] StartNotify failed: %s", *emsg ? emsg : strerror(-r));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    notifying.store(true);
    LOG_INFO("[BLUEZ] notifications enabled on %s", char_path.c_str());
    return true;
}

}  // namespace

namespace transport
{

// ======================================================================
// Function: BluezConnection::set_discovery_filter
// - In: bus valid, sets Adapter1.SetDiscoveryFilter to LE and the hub service UUID
// - Out: true on success and marks uuid_filter_ok
// - Note: reduces scan noise and speeds up find
// ======================================================================
bool BluezConnection::set_discovery_filter()
{
    if (!impl_->bus)
        return false;

    std::lock_guard<std::mutex> lk(impl_->bus_mu);

    sd_bus_message *msg = nullptr, *rep = nullptr;
    sd_bus_error    err{};
    int             r = sd_bus_message_new_method_call(impl_->bus, &msg, "org.bluez",
                                                       impl_->adapter_path.c_str(), "org.bluez.Adapter1",
                                                       "SetDiscoveryFilter");
    if (r < 0)
        goto out;

    // a{sv}
    r = sd_bus_message_open_container(msg, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        goto out;
    // Transport="le"
    r = sd_bus_message_append(msg, "{sv}", "Transport", "s", "le");
    if (r < 0)
        goto out;
    // DuplicateData=false
    r = sd_bus_message_append(msg, "{sv}", "DuplicateData", "b", 0);
    if (r < 0)
        goto out;
    // UUIDs=["<svc_uuid>"]
    r = sd_bus_message_append(msg, "{sv}", "UUIDs", "as", 1, cfg_.svc_uuid.c_str());
    if (r < 0)
        goto out;
    r = sd_bus_message_close_container(msg);  // a{sv}
    if (r < 0)
        goto out;

    r = sd_bus_call(impl_->bus, msg, 0, &err, &rep);
out:
    if (msg)
        sd_bus_message_unref(msg);
    if (rep)
        sd_bus_message_unref(rep);

    if (r < 0)
    {
        LOG_WARN("[BLUEZ] SetDiscoveryFilter failed: %s", err.message ? err.message : strerror(-r));
        sd_bus_error_free(&err);
        impl_->uuid_filter_ok = false;
        return false;
    }
    sd_bus_error_free(&err);
    impl_->uuid_filter_ok = true;
    LOG_INFO("[BLUEZ] SetDiscoveryFilter OK (Transport=le, UUID=%s)", cfg_.svc_uuid.c_str());
    return true;
}

bool BluezConnection::start_discovery()
{
    if (!impl_ || !impl_->bus)
        return false;

    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    return adapter_start_discovery_locked(impl_->bus, impl_->adapter_path, impl_->discovery_on);
}

// ======================================================================
// Function: BluezConnection::cold_scan
// - In: bus thread, takes bus_mu for the call
// - Out: true if the walk succeeds, may set dev_path from the BlueZ cache
// - Note: picks up hubs BlueZ already knows, which raise no InterfacesAdded
// ======================================================================
bool BluezConnection::cold_scan()
{
    sd_bus_message *reply = nullptr;
    sd_bus_error    err{};
    int             r = 0;
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        if (!impl_->bus)
            return false;
        r = sd_bus_call_method(impl_->bus, "org.bluez", "/", "org.freedesktop.DBus.ObjectManager",
                               "GetManagedObjects", &err, &reply, "");
    }
    if (r < 0)
    {
        LOG_WARN("[BLUEZ] GetManagedObjects failed: %s", err.message ? err.message : strerror(-r));
        sd_bus_error_free(&err);
        if (reply)
            sd_bus_message_unref(reply);
        return false;
    }

    const std::string dev_prefix = "/org/bluez/" + cfg_.adapter + "/dev_";

    struct LocalDev
    {
        std::string path, addr;
        bool        svc_hit;
    };
    std::vector<LocalDev> found;

    // Walk a{oa{sa{sv}}}
    r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{oa{sa{sv}}}");
    if (r < 0)
        goto out;
    // --- Objects
    while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "oa{sa{sv}}")) > 0)
    {
        const char *obj = nullptr;
        if ((r = sd_bus_message_read(reply, "o", &obj)) < 0)
            goto out;
        if (!obj)
        {
            r = -EINVAL;
            goto out;
        }

        std::string path(obj);
        if (path.rfind(dev_prefix, 0) != 0 || path.find('/', dev_prefix.size()) != std::string::npos)
        {
            // device objects only
            if ((r = sd_bus_message_skip(reply, "a{sa{sv}}")) < 0)
                goto out;
            if ((r = sd_bus_message_exit_container(reply)) < 0)
                goto out;
            continue;
        }

        bool        svc_hit = false;
        std::string addr;

        // --- Interfaces
        if ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{sa{sv}}")) < 0)
            goto out;
        while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
        {
            const char *iface = nullptr;
            if ((r = sd_bus_message_read(reply, "s", &iface)) < 0)
                goto out;

            if (iface && std::strcmp(iface, "org.bluez.Device1") == 0)
            {
                if ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{sv}")) < 0)
                    goto out;
                // --- Properties: UUIDs (as), Address (s)
                while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "sv")) >
                       0)
                {
                    const char *key = nullptr;
                    if ((r = sd_bus_message_read(reply, "s", &key)) < 0)
                        goto out;
                    if (key && std::strcmp(key, "UUIDs") == 0)
                    {
                        bool hit = false;
                        if ((r = var_as_has_uuid(reply, cfg_.svc_uuid, hit)) < 0)
                            goto out;
                        svc_hit |= hit;
                    }
                    else if (key && std::strcmp(key, "Address") == 0)
                    {
                        if ((r = read_var_s(reply, addr)) < 0)
                            goto out;
                    }
                    else
                    {
                        if ((r = sd_bus_message_skip(reply, "v")) < 0)
                            goto out;
                    }
                    if ((r = sd_bus_message_exit_container(reply)) < 0)
                        goto out;  // dict-entry
                }
                if (r < 0)
                    goto out;
                if ((r = sd_bus_message_exit_container(reply)) < 0)
                    goto out;  // a{sv}
            }
            else
            {
                if ((r = sd_bus_message_skip(reply, "a{sv}")) < 0)
                    goto out;
            }

            if ((r = sd_bus_message_exit_container(reply)) < 0)
                goto out;  // {sa{sv}}
        }
        if (r < 0)
            goto out;

        if ((r = sd_bus_message_exit_container(reply)) < 0)
            goto out;  // a{sa{sv}}
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            goto out;  // {oa{sa{sv}}}

        found.push_back(LocalDev{path, addr, svc_hit});
    }
    if (r < 0)
        goto out;

    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        const bool has_addr = cfg_.hub_addr && !cfg_.hub_addr->empty();
        for (const auto &d : found)
        {
            bool ok = has_addr ? ((!d.addr.empty() && mac_eq(d.addr, *cfg_.hub_addr)) ||
                                  path_mac_eq(d.path, *cfg_.hub_addr))
                               : d.svc_hit;
            if (!ok || !impl_->dev_path.empty())
                continue;
            impl_->dev_path = d.path;
            LOG_INFO("[BLUEZ] cold-scan found hub %s addr=%s", d.path.c_str(),
                     d.addr.empty() ? "?" : d.addr.c_str());
        }
    }

out:
    if (reply)
        sd_bus_message_unref(reply);
    sd_bus_error_free(&err);
    return r >= 0;
}

// ======================================================================
// Function: BluezConnection::connect_device
// - In: bus thread, dev_path set
// - Out: true after Connect is submitted, sets connect_inflight
// - Note: scanning is stopped first, some controllers abort connects otherwise
// ======================================================================
bool BluezConnection::connect_device()
{
    if (!impl_->bus)
        return false;
    if (impl_->connect_inflight.load() || impl_->connected.load())
        return true;

    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (impl_->dev_path.empty())
        return false;
    if (impl_->discovery_on.load())
        (void)adapter_stop_discovery_locked(impl_->bus, impl_->adapter_path, impl_->discovery_on);

    unref_slot(impl_->connect_call_slot);
    int r = sd_bus_call_method_async(impl_->bus, &impl_->connect_call_slot, "org.bluez",
                                     impl_->dev_path.c_str(), "org.bluez.Device1", "Connect",
                                     bluez_on_connect_reply, this, "");
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ] submit Connect() failed: %s", strerror(-r));
        return false;
    }
    impl_->connect_inflight.store(true);
    LOG_DEBUG("[BLUEZ] Connect() submitted to %s", impl_->dev_path.c_str());
    return true;
}

// ======================================================================
// Function: BluezConnection::discover_services
// - In: bus thread, dev_path set
// - Out: true after Device1.DiscoverServices is sent (once per connection)
// - Note: completion is seen via ServicesResolved; older BlueZ resolves on its own
// ======================================================================
bool BluezConnection::discover_services()
{
    if (!impl_->bus)
        return false;
    if (impl_->discover_submitted.load())
        return true;

    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (impl_->dev_path.empty())
        return false;
    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(impl_->bus, "org.bluez", impl_->dev_path.c_str(),
                               "org.bluez.Device1", "DiscoverServices", &err, &rep, "s",
                               cfg_.svc_uuid.c_str());
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        const char *ename = err.name ? err.name : "";
        if (strcmp(ename, "org.freedesktop.DBus.Error.UnknownMethod") == 0)
        {
            LOG_DEBUG("[BLUEZ] DiscoverServices not supported; rely on auto-discovery");
            impl_->discover_submitted.store(true);
            sd_bus_error_free(&err);
            return false;
        }
        LOG_WARN("[BLUEZ] DiscoverServices('%s') failed: %s", cfg_.svc_uuid.c_str(),
                 err.message ? err.message : strerror(-r));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    impl_->discover_submitted.store(true);
    LOG_INFO("[BLUEZ] DiscoverServices('%s') submitted", cfg_.svc_uuid.c_str());
    return true;
}

// ======================================================================
// Function: BluezConnection::find_char_path
// - In: bus thread, reads the ObjectManager cache
// - Out: true when the hub characteristic under dev_path is known
// ======================================================================
bool BluezConnection::find_char_path()
{
    if (!impl_->bus)
        return false;

    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (impl_->dev_path.empty())
        return false;
    if (!impl_->char_path.empty())
        return true;

    sd_bus_message *reply = nullptr;
    sd_bus_error    err{};
    int r = sd_bus_call_method(impl_->bus, "org.bluez", "/", "org.freedesktop.DBus.ObjectManager",
                               "GetManagedObjects", &err, &reply, "");
    if (r < 0)
    {
        LOG_WARN("[BLUEZ] GetManagedObjects failed: %s", err.message ? err.message : strerror(-r));
        if (reply)
            sd_bus_message_unref(reply);
        sd_bus_error_free(&err);
        return false;
    }

    const std::string dev_prefix = impl_->dev_path + "/";
    std::string       found;

    // Walk a{oa{sa{sv}}}
    r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{oa{sa{sv}}}");
    // --- Objects
    while (r >= 0 &&
           (r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "oa{sa{sv}}")) > 0)
    {
        const char *obj = nullptr;
        if ((r = sd_bus_message_read(reply, "o", &obj)) < 0 || !obj)
            break;

        std::string path(obj);
        if (path.rfind(dev_prefix, 0) != 0)
        {
            if ((r = sd_bus_message_skip(reply, "a{sa{sv}}")) < 0)
                break;
            if ((r = sd_bus_message_exit_container(reply)) < 0)
                break;
            continue;
        }

        // --- Interfaces
        if ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{sa{sv}}")) < 0)
            break;
        while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
        {
            const char *iface = nullptr;
            if ((r = sd_bus_message_read(reply, "s", &iface)) < 0)
                break;
            if (iface && strcmp(iface, "org.bluez.GattCharacteristic1") == 0)
            {
                // --- Characteristic properties (looking for "UUID")
                std::string uuid;
                if ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{sv}")) < 0)
                    break;
                while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "sv")) >
                       0)
                {
                    const char *key = nullptr;
                    if ((r = sd_bus_message_read(reply, "s", &key)) < 0)
                        break;
                    if (key && strcmp(key, "UUID") == 0)
                        r = read_var_s(reply, uuid);
                    else
                        r = sd_bus_message_skip(reply, "v");
                    if (r < 0)
                        break;
                    if ((r = sd_bus_message_exit_container(reply)) < 0)
                        break;
                }
                if (r < 0)
                    break;
                if ((r = sd_bus_message_exit_container(reply)) < 0)
                    break;  // a{sv}
                if (!uuid.empty() && ieq(uuid, cfg_.char_uuid))
                    found = path;
            }
            else
            {
                if ((r = sd_bus_message_skip(reply, "a{sv}")) < 0)
                    break;
            }
            if ((r = sd_bus_message_exit_container(reply)) < 0)
                break;  // {sa{sv}}
        }
        if (r < 0 || !found.empty())
            break;
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            break;  // a{sa{sv}}
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            break;  // {oa{sa{sv}}}
    }

    if (reply)
        sd_bus_message_unref(reply);
    sd_bus_error_free(&err);

    if (found.empty())
    {
        if (r < 0)
            LOG_WARN("[BLUEZ] parsing managed objects failed: %s", strerror(-r));
        return false;
    }
    impl_->char_path = found;
    LOG_INFO("[BLUEZ] hub characteristic: %s", found.c_str());
    return true;
}

bool BluezConnection::enable_notifications()
{
    if (!impl_ || !impl_->bus)
        return false;

    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (impl_->char_path.empty())
    {
        LOG_WARN("[BLUEZ] StartNotify before the characteristic is known");
        return false;
    }
    if (impl_->notifying.load())
        return true;
    return char_start_notify_locked(impl_->bus, impl_->char_path, impl_->notifying);
}

// ======================================================================
// Function: BluezConnection::write_value
// - In: any thread; takes bus_mu, char_path resolved
// - Out: true if WriteValue succeeds on DBus
// - Note: "request" write type, the hub acknowledges at ATT level
// ======================================================================
bool BluezConnection::write_value(const std::uint8_t *data, std::size_t len)
{
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus || impl_->char_path.empty() || !data || len == 0)
        return false;

    sd_bus_message *msg = nullptr;
    sd_bus_message *rep = nullptr;
    sd_bus_error    err{};
    int r = sd_bus_message_new_method_call(impl_->bus, &msg, "org.bluez", impl_->char_path.c_str(),
                                           "org.bluez.GattCharacteristic1", "WriteValue");
    if (r < 0)
    {
        LOG_WARN("[BLUEZ] WriteValue new_method_call failed: %s", strerror(-r));
        return false;
    }

    // ay payload, then options a{sv}: type=request, offset=0
    r = sd_bus_message_append_array(msg, 'y', data, len);
    if (r >= 0)
        r = sd_bus_message_open_container(msg, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r >= 0)
        r = sd_bus_message_append(msg, "{sv}", "type", "s", "request");
    if (r >= 0)
        r = sd_bus_message_append(msg, "{sv}", "offset", "q", (uint16_t)0);
    if (r >= 0)
        r = sd_bus_message_close_container(msg);
    if (r < 0)
    {
        LOG_WARN("[BLUEZ] WriteValue build message failed: %s", strerror(-r));
        sd_bus_message_unref(msg);
        return false;
    }

    r = sd_bus_call(impl_->bus, msg, 0, &err, &rep);
    sd_bus_message_unref(msg);
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        LOG_WARN("[BLUEZ] WriteValue failed: %s", err.message ? err.message : strerror(-r));
        sd_bus_error_free(&err);
        return false;
    }

    sd_bus_error_free(&err);
    LOG_DEBUG("[BLUEZ] WriteValue OK (len=%zu)", len);
    return true;
}

// ======================================================================
// Function: BluezConnection::pump
// - In: bus thread, no lock held
// - Out: moves the link one step towards ready
// - Note: discovery stays on only while no hub is connected
// ======================================================================
void BluezConnection::pump()
{
    if (released_.load())
        return;

    bool have_dev = false;
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        have_dev = !impl_->dev_path.empty();
        if (!impl_->connected.load())
        {
            impl_->char_path.clear();
            impl_->discover_submitted.store(false);
        }
    }

    const std::uint64_t now = now_ms();
    if (!have_dev && now - impl_->last_scan_ms >= impl_->scan_min_interval_ms)
    {
        impl_->last_scan_ms = now;
        (void)cold_scan();
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        have_dev = !impl_->dev_path.empty();
    }

    if (have_dev && !impl_->connected.load() && !impl_->connect_inflight.load() &&
        now >= impl_->next_connect_at_ms)
    {
        impl_->next_connect_at_ms = now;
        (void)connect_device();
    }

    if (impl_->connected.load() && !impl_->gatt_ready.load())
    {
        if (!impl_->services_resolved.load())
            (void)discover_services();
        if (find_char_path())
        {
            {
                std::lock_guard<std::mutex> lk(impl_->ready_mu);
                impl_->gatt_ready.store(true);
            }
            impl_->ready_cv.notify_all();
            LOG_INFO("[BLUEZ] hub link ready");
        }
    }

    // Discovery policy: off once a hub is connecting or connected
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    const bool want_scan = !impl_->connect_inflight.load() && !impl_->connected.load();
    if (want_scan && !impl_->discovery_on.load())
        (void)adapter_start_discovery_locked(impl_->bus, impl_->adapter_path, impl_->discovery_on);
    else if (!want_scan && impl_->discovery_on.load())
        (void)adapter_stop_discovery_locked(impl_->bus, impl_->adapter_path, impl_->discovery_on);
}

}  // namespace transport
