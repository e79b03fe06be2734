// src/transport/bluez_helper.cpp
#include <cerrno>
#include <chrono>
#include <cstring>
#include <string>

#include <systemd/sd-bus.h>

// clang-format off
#include "transport/bluez_connection.hpp"
#include "transport/bluez_helper.hpp"
#include "transport/bluez_dbus_util.hpp"
#include "util/log.hpp"
// clang-format on

namespace transport
{

// ======================================================================
// Function: bluez_on_iface_added
// - In: InterfacesAdded signal (o, a{sa{sv}})
// - Out: may adopt the object as the hub device path
// - Note: accepts a device advertising the hub service; with a hub address
//         configured, the address must match as well
// ======================================================================
int bluez_on_iface_added(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto *self = static_cast<BluezConnection *>(userdata);

    const char *obj = nullptr;
    int         r   = sd_bus_message_read(m, "o", &obj);
    if (r < 0 || !obj)
        return r < 0 ? r : -EINVAL;

    const std::string obj_path(obj);
    const std::string prefix = "/org/bluez/" + self->config().adapter + "/dev_";
    if (obj_path.rfind(prefix, 0) != 0)
        return 0;
    // only the device object itself, not its GATT children
    if (obj_path.find('/', prefix.size()) != std::string::npos)
        return 0;

    bool        svc_hit = false;
    std::string addr;
    int16_t     rssi      = 0;
    bool        have_rssi = false;

    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sa{sv}}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
    {
        const char *iface = nullptr;
        if ((r = sd_bus_message_read(m, "s", &iface)) < 0)
            return r;

        if (iface && strcmp(iface, "org.bluez.Device1") == 0)
        {
            if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}")) < 0)
                return r;

            while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
            {
                const char *key = nullptr;
                if ((r = sd_bus_message_read(m, "s", &key)) < 0)
                    return r;

                if (key && strcmp(key, "UUIDs") == 0)
                {
                    bool hit = false;
                    if ((r = var_as_has_uuid(m, self->config().svc_uuid, hit)) < 0)
                        return r;
                    svc_hit |= hit;
                }
                else if (key && strcmp(key, "Address") == 0)
                {
                    if ((r = read_var_s(m, addr)) < 0)
                        return r;
                }
                else if (key && strcmp(key, "RSSI") == 0)
                {
                    if ((r = read_var_i16(m, rssi)) < 0)
                        return r;
                    have_rssi = true;
                }
                else
                {
                    if ((r = sd_bus_message_skip(m, "v")) < 0)
                        return r;
                }

                if ((r = sd_bus_message_exit_container(m)) < 0)
                    return r;
            }
            if (r < 0)
                return r;
            if ((r = sd_bus_message_exit_container(m)) < 0)
                return r;
        }
        else
        {
            if ((r = sd_bus_message_skip(m, "a{sv}")) < 0)
                return r;
        }

        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    if ((r = sd_bus_message_exit_container(m)) < 0)
        return r;

    // the adapter only reports devices matching the UUID filter
    if (!svc_hit && self->has_uuid_discovery_filter())
        svc_hit = true;

    const auto &want = self->config().hub_addr;
    if (want && !want->empty())
    {
        bool addr_ok = (!addr.empty() && mac_eq(addr, *want)) || path_mac_eq(obj_path, *want);
        if (!addr_ok)
            return 0;
    }
    else if (!svc_hit)
    {
        return 0;
    }

    if (self->dev_path().empty())
    {
        self->set_dev_path(obj_path);
        if (have_rssi)
            LOG_INFO("[BLUEZ] found hub %s addr=%s rssi=%d", obj, addr.empty() ? "?" : addr.c_str(),
                     (int)rssi);
        else
            LOG_INFO("[BLUEZ] found hub %s addr=%s", obj, addr.empty() ? "?" : addr.c_str());
    }
    return 0;
}

int bluez_on_iface_removed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto       *self = static_cast<BluezConnection *>(userdata);
    const char *obj  = nullptr;
    int         r    = sd_bus_message_read(m, "o", &obj);
    if (r < 0 || !obj)
        return r < 0 ? r : -EINVAL;
    r = sd_bus_message_skip(m, "as");
    if (r < 0)
        return r;

    const std::string path(obj);
    if (!self->dev_path().empty() && self->dev_path() == path)
    {
        self->on_link_lost("device object removed");
        self->set_dev_path("");
    }
    return 0;
}

// ======================================================================
// Function: bluez_on_props_changed
// - In: PropertiesChanged signal (s, a{sv}, as)
// - Out: tracks Device1 Connected/ServicesResolved for the hub device and
//        queues GattCharacteristic1 Value updates of the hub characteristic
// ======================================================================
int bluez_on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret_error*/)
{
    auto       *self  = static_cast<BluezConnection *>(userdata);
    const char *iface = nullptr;
    int         r     = sd_bus_message_read(m, "s", &iface);
    if (r < 0)
        return r;

    const bool is_device = iface && strcmp(iface, "org.bluez.Device1") == 0;
    const bool is_char   = iface && strcmp(iface, "org.bluez.GattCharacteristic1") == 0;

    bool services_resolved_hit = false;
    bool services_resolved_val = false;
    bool connected_hit         = false;
    bool connected_val         = false;

    bool        value_hit = false;
    const void *val_buf   = nullptr;
    size_t      val_len   = 0;

    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;

    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        r               = sd_bus_message_read(m, "s", &key);
        if (r < 0)
            return r;

        if (is_device && key && strcmp(key, "ServicesResolved") == 0)
        {
            if ((r = read_var_b(m, services_resolved_val)) < 0)
                return r;
            services_resolved_hit = true;
        }
        else if (is_device && key && strcmp(key, "Connected") == 0)
        {
            if ((r = read_var_b(m, connected_val)) < 0)
                return r;
            connected_hit = true;
        }
        else if (is_char && key && strcmp(key, "Value") == 0)
        {
            r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "ay");
            if (r < 0)
                return r;
            r = sd_bus_message_read_array(m, 'y', &val_buf, &val_len);
            if (r < 0)
                return r;
            value_hit = true;
            r         = sd_bus_message_exit_container(m);
            if (r < 0)
                return r;
        }
        else
        {
            r = sd_bus_message_skip(m, "v");
            if (r < 0)
                return r;
        }
        r = sd_bus_message_exit_container(m);
        if (r < 0)
            return r;
    }
    if (r < 0)
        return r;
    r = sd_bus_message_exit_container(m);
    if (r < 0)
        return r;

    r = sd_bus_message_skip(m, "as");
    if (r < 0)
        return r;

    const char *path = sd_bus_message_get_path(m);
    if (!path)
        return 0;

    if (self->dev_path() == path && connected_hit)
    {
        if (connected_val && !self->connected())
        {
            self->set_connected(true);
            LOG_INFO("[BLUEZ] Connected property became true (%s)", path);
        }
        else if (!connected_val && self->connected())
        {
            self->on_link_lost("Connected property became false");
        }
    }

    if (self->dev_path() == path && services_resolved_hit)
    {
        self->set_services_resolved(services_resolved_val);
        LOG_INFO("[BLUEZ] ServicesResolved=%s on %s", services_resolved_val ? "true" : "false",
                 path);
    }

    if (value_hit && !self->char_path().empty() && self->char_path() == path)
    {
        LOG_DEBUG("[BLUEZ] notify on %s len=%zu", path, val_len);
        if (val_buf && val_len)
            self->queue_rx(static_cast<const uint8_t *>(val_buf), val_len);
    }

    return 0;
}

int bluez_on_connect_reply(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto *self = static_cast<BluezConnection *>(userdata);

    self->set_connect_inflight(false);

    if (sd_bus_message_is_method_error(m, nullptr))
    {
        const sd_bus_error *e          = sd_bus_message_get_error(m);
        const char         *ename      = (e && e->name) ? e->name : "unknown";
        const char         *emsg       = (e && e->message) ? e->message : "no message";
        uint32_t            backoff_ms = 2000;
        if (strcmp(ename, "org.freedesktop.DBus.Error.NoReply") == 0 ||
            strcmp(ename, "org.bluez.Error.InProgress") == 0 ||
            (strcmp(ename, "org.bluez.Error.Failed") == 0 &&
             (emsg && strstr(emsg, "already in progress"))))
        {
            backoff_ms = 5000;
            LOG_WARN("[BLUEZ] Connect in progress/timeouts, backoff %ums: %s: %s", backoff_ms,
                     ename, emsg);
        }
        else
        {
            LOG_ERROR("[BLUEZ] Device1.Connect failed, backoff %ums: %s: %s", backoff_ms, ename,
                      emsg);
        }
        self->set_connected(false);
        // the device object disappeared; pump will scan again
        if (strcmp(ename, "org.freedesktop.DBus.Error.UnknownObject") == 0 ||
            strcmp(ename, "org.freedesktop.DBus.Error.UnknownMethod") == 0)
        {
            self->set_dev_path("");
            LOG_DEBUG("[BLUEZ] cleared device path after UnknownObject/Method");
        }
        uint64_t now_ms =
            (uint64_t)std::chrono::duration_cast<
                std::chrono::milliseconds>(std::chrono::steady_clock::now().time_since_epoch())
                .count();
        self->set_next_connect_at_ms(now_ms + backoff_ms);
        return 1;
    }

    self->set_connected(true);
    self->set_services_resolved(false);
    LOG_INFO("[BLUEZ] device connected: %s", self->dev_path().c_str());
    return 1;
}

}  // namespace transport
