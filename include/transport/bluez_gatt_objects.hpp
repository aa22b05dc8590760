// include/transport/bluez_gatt_objects.hpp
#pragma once

#if CLIPSYNC_HAVE_SDBUS
#include <systemd/sd-bus.h>

// userdata: transport::GattObject*
extern const sd_bus_vtable gatt_service_vtable[];
extern const sd_bus_vtable gatt_notify_vtable[];
extern const sd_bus_vtable gatt_write_vtable[];
// userdata: transport::BluezTransport::Impl*
extern const sd_bus_vtable adv_vtable[];

// userdata: transport::BluezTransport*
int on_reg_app_reply(sd_bus_message *m, void *userdata, sd_bus_error *);
int on_reg_adv_reply(sd_bus_message *m, void *userdata, sd_bus_error *);

#endif  // CLIPSYNC_HAVE_SDBUS
