// include/transport/bluez_helper.hpp
#pragma once
#include <systemd/sd-bus.h>

namespace transport
{

// DBus callbacks; userdata is the BluezConnection, bus_mu is held
int bluez_on_iface_added(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
int bluez_on_iface_removed(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
int bluez_on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
int bluez_on_connect_reply(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);

}  // namespace transport
