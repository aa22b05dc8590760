// src/transport/bluez_gatt_objects.cpp
#include <cerrno>
#include <cstring>

#include "transport/bluez_gatt_objects.hpp"
#include "transport/bluez_transport_impl.hpp"
#include "util/log.hpp"

#if CLIPSYNC_HAVE_SDBUS

using transport::BluezTransport;
using transport::GattObject;

namespace
{

GattObject *as_object(void *userdata)
{
    return static_cast<GattObject *>(userdata);
}

int append_string_array(sd_bus_message *reply, const std::vector<std::string> &items)
{
    int r = sd_bus_message_open_container(reply, 'a', "s");
    if (r < 0)
        return r;
    for (const auto &s : items)
    {
        r = sd_bus_message_append_basic(reply, 's', s.c_str());
        if (r < 0)
            return r;
    }
    return sd_bus_message_close_container(reply);
}

// ---- properties shared by service and characteristics ----

int prop_uuid(sd_bus *, const char *, const char *, const char *, sd_bus_message *reply,
              void *userdata, sd_bus_error *)
{
    return sd_bus_message_append(reply, "s", as_object(userdata)->uuid.c_str());
}

int svc_prop_primary(sd_bus *, const char *, const char *, const char *, sd_bus_message *reply,
                     void *, sd_bus_error *)
{
    return sd_bus_message_append(reply, "b", 1);
}

int svc_prop_includes(sd_bus *, const char *, const char *, const char *,
                      sd_bus_message *reply, void *, sd_bus_error *)
{
    int r = sd_bus_message_open_container(reply, 'a', "o");
    if (r < 0)
        return r;
    return sd_bus_message_close_container(reply);
}

int chr_prop_service(sd_bus *, const char *, const char *, const char *, sd_bus_message *reply,
                     void *userdata, sd_bus_error *)
{
    return sd_bus_message_append(reply, "o", as_object(userdata)->parent.c_str());
}

int chr_prop_flags(sd_bus *, const char *, const char *, const char *, sd_bus_message *reply,
                   void *userdata, sd_bus_error *)
{
    return append_string_array(reply, as_object(userdata)->flags);
}

int chr_prop_notifying(sd_bus *, const char *, const char *, const char *,
                       sd_bus_message *reply, void *userdata, sd_bus_error *)
{
    const auto *obj = as_object(userdata);
    return sd_bus_message_append(reply, "b", obj->owner->link_ready() ? 1 : 0);
}

// ---- notify characteristic ----

int notify_start(sd_bus_message *m, void *userdata, sd_bus_error *)
{
    as_object(userdata)->owner->set_notifying(true);
    return sd_bus_reply_method_return(m, "");
}

int notify_stop(sd_bus_message *m, void *userdata, sd_bus_error *)
{
    as_object(userdata)->owner->set_notifying(false);
    return sd_bus_reply_method_return(m, "");
}

// ======================================================================
// Function: write_value
// - In: WriteValue(ay value, a{sv} options) on the write characteristic
// - Out: hands the bytes to the transport unchanged, replies success
// - Note: long writes (offset != 0) are refused, one write is one frame
// ======================================================================
int write_value(sd_bus_message *m, void *userdata, sd_bus_error *)
{
    auto       *obj = as_object(userdata);
    const void *buf = nullptr;
    size_t      len = 0;

    int r = sd_bus_message_read_array(m, 'y', &buf, &len);
    if (r < 0)
        return r;

    uint16_t offset = 0;
    uint16_t mtu    = 0;
    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        if ((r = sd_bus_message_read(m, "s", &key)) < 0)
            return r;

        uint16_t *target = nullptr;
        if (key && std::strcmp(key, "offset") == 0)
            target = &offset;
        else if (key && std::strcmp(key, "mtu") == 0)
            target = &mtu;

        if (target)
        {
            if ((r = sd_bus_message_read(m, "v", "q", target)) < 0)
                return r;
        }
        else if ((r = sd_bus_message_skip(m, "v")) < 0)
        {
            return r;
        }
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    if ((r = sd_bus_message_exit_container(m)) < 0)
        return r;

    if (offset != 0)
        return sd_bus_reply_method_errorf(m, "org.bluez.Error.InvalidOffset",
                                          "Offset %u not supported", offset);
    if (mtu)
        obj->owner->note_att_mtu(mtu);

    LOG_DEBUG("[BLUEZ] write len=%zu", len);
    if (buf && len != 0)
        obj->owner->deliver_rx_bytes(static_cast<const uint8_t *>(buf), len);
    return sd_bus_reply_method_return(m, "");
}

// ---- advertisement ----

int adv_prop_type(sd_bus *, const char *, const char *, const char *, sd_bus_message *reply,
                  void *, sd_bus_error *)
{
    return sd_bus_message_append(reply, "s", "peripheral");
}

int adv_prop_service_uuids(sd_bus *, const char *, const char *, const char *,
                           sd_bus_message *reply, void *userdata, sd_bus_error *)
{
    const auto *impl = static_cast<BluezTransport::Impl *>(userdata);
    return append_string_array(reply, {impl->service.uuid});
}

int adv_prop_local_name(sd_bus *, const char *, const char *, const char *,
                        sd_bus_message *reply, void *userdata, sd_bus_error *)
{
    const auto *impl = static_cast<BluezTransport::Impl *>(userdata);
    return sd_bus_message_append(reply, "s", impl->local_name.c_str());
}

int adv_prop_include_tx_power(sd_bus *, const char *, const char *, const char *,
                              sd_bus_message *reply, void *, sd_bus_error *)
{
    return sd_bus_message_append(reply, "b", 0);
}

int adv_release(sd_bus_message *m, void *, sd_bus_error *)
{
    LOG_INFO("[BLUEZ] advertisement released by BlueZ");
    return sd_bus_reply_method_return(m, "");
}

void log_reply_error(sd_bus_message *m, const char *what)
{
    const sd_bus_error *e = sd_bus_message_get_error(m);
    LOG_ERROR("[BLUEZ] %s failed: %s: %s", what, e && e->name ? e->name : "unknown",
              e && e->message ? e->message : "no message");
}

}  // namespace

const sd_bus_vtable gatt_service_vtable[] = {
    SD_BUS_VTABLE_START(0),
    SD_BUS_PROPERTY("UUID", "s", prop_uuid, 0, SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_PROPERTY("Primary", "b", svc_prop_primary, 0, SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_PROPERTY("Includes", "ao", svc_prop_includes, 0, SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_VTABLE_END};

const sd_bus_vtable gatt_notify_vtable[] = {
    SD_BUS_VTABLE_START(0),
    SD_BUS_PROPERTY("UUID", "s", prop_uuid, 0, SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_PROPERTY("Service", "o", chr_prop_service, 0, SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_PROPERTY("Flags", "as", chr_prop_flags, 0, SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_PROPERTY("Notifying", "b", chr_prop_notifying, 0,
                    SD_BUS_VTABLE_PROPERTY_EMITS_CHANGE),
    SD_BUS_METHOD("StartNotify", "", "", notify_start, SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_METHOD("StopNotify", "", "", notify_stop, SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_VTABLE_END};

const sd_bus_vtable gatt_write_vtable[] = {
    SD_BUS_VTABLE_START(0),
    SD_BUS_PROPERTY("UUID", "s", prop_uuid, 0, SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_PROPERTY("Service", "o", chr_prop_service, 0, SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_PROPERTY("Flags", "as", chr_prop_flags, 0, SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_METHOD("WriteValue", "aya{sv}", "", write_value, SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_VTABLE_END};

const sd_bus_vtable adv_vtable[] = {
    SD_BUS_VTABLE_START(0),
    SD_BUS_PROPERTY("Type", "s", adv_prop_type, 0, SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_PROPERTY("ServiceUUIDs", "as", adv_prop_service_uuids, 0,
                    SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_PROPERTY("LocalName", "s", adv_prop_local_name, 0, SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_PROPERTY("IncludeTxPower", "b", adv_prop_include_tx_power, 0,
                    SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_METHOD("Release", "", "", adv_release, SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_VTABLE_END};

int on_reg_app_reply(sd_bus_message *m, void *, sd_bus_error *)
{
    if (sd_bus_message_is_method_error(m, nullptr))
        log_reply_error(m, "RegisterApplication");
    else
        LOG_DEBUG("[BLUEZ] GATT application registered");
    return 1;
}

int on_reg_adv_reply(sd_bus_message *m, void *, sd_bus_error *)
{
    if (sd_bus_message_is_method_error(m, nullptr))
        log_reply_error(m, "RegisterAdvertisement");
    else
        LOG_SYSTEM("[BLUEZ] advertising, waiting for a central to subscribe");
    return 1;
}

#endif  // CLIPSYNC_HAVE_SDBUS
