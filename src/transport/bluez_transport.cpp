/* ======================================================================
 * BlueZ Transport (GATT peripheral)
 *
 *  App thread                       Bus thread                 BlueZ/DBus           Peer (Central)
 *  ----------                       -----------                -----------          --------------
 *  start(settings, on_frame)
 *    └─ export Service / notify / write
 *    └─ RegisterApplication + RegisterAdvertisement (async) ─────────────────────▶  adapter
 *    └─ spawn bus loop
 *
 *                                   ◀───── StartNotify on notify char ───────────  subscribe
 *                                      └─ Notifying=true, link_ready()
 *
 *  send(frame)
 *    └─ PropertiesChanged(Value=ay) on notify char ──────────────────────────────▶  notification
 *    └─ tx_pause_ms sleep (outside the bus lock)
 *
 *                                   ◀───── WriteValue on write char ─────────────  frame from peer
 *                                      └─ copy into the rx pump
 *  Rx thread
 *    └─ on_frame(bytes), no bus lock held
 *
 *  stop()
 *    └─ Unregister ADV / application, close bus, join loop, stop rx pump
 *
 *  All sd-bus calls hold impl_->bus_mu; the loop thread polls the bus fd without it.
 * ====================================================================== */

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <thread>
#include <utility>

// clang-format off
#include "transport/bluez_transport.hpp"
#include "transport/bluez_transport_impl.hpp"
#include "transport/bluez_gatt_objects.hpp"
#include "util/log.hpp"
// clang-format on

#if CLIPSYNC_HAVE_SDBUS
#include <poll.h>
#include <systemd/sd-bus.h>

namespace
{

inline void unref_slot(sd_bus_slot *&s)
{
    if (s)
    {
        sd_bus_slot_unref(s);
        s = nullptr;
    }
}

// ======================================================================
// Function: emit_value_changed
// - In: bus and characteristic path, frame bytes
// - Out: PropertiesChanged(Value=ay) on the characteristic, which BlueZ turns into a notification
// ======================================================================
bool emit_value_changed(sd_bus *bus, const std::string &path, const uint8_t *data, size_t len)
{
    sd_bus_message *sig = nullptr;
    int r = sd_bus_message_new_signal(bus, &sig, path.c_str(), "org.freedesktop.DBus.Properties",
                                      "PropertiesChanged");
    if (r < 0)
        return false;

    // clang-format off
    if (r >= 0) r = sd_bus_message_append(sig, "s", "org.bluez.GattCharacteristic1");
    if (r >= 0) r = sd_bus_message_open_container(sig, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r >= 0) r = sd_bus_message_open_container(sig, SD_BUS_TYPE_DICT_ENTRY, "sv");
    if (r >= 0) r = sd_bus_message_append(sig, "s", "Value");
    if (r >= 0) r = sd_bus_message_open_container(sig, SD_BUS_TYPE_VARIANT, "ay");
    if (r >= 0) r = sd_bus_message_append_array(sig, 'y', data, len);
    if (r >= 0) r = sd_bus_message_close_container(sig);  // variant
    if (r >= 0) r = sd_bus_message_close_container(sig);  // dict entry
    if (r >= 0) r = sd_bus_message_close_container(sig);  // a{sv}
    if (r >= 0) r = sd_bus_message_append_strv(sig, nullptr);  // invalidated: none
    if (r >= 0) r = sd_bus_send(bus, sig, nullptr);
    // clang-format on

    sd_bus_message_unref(sig);
    return r >= 0;
}

void unregister(sd_bus *bus, const std::string &adapter, const char *iface, const char *method,
                const std::string &path)
{
    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    const int r = sd_bus_call_method(bus, "org.bluez", adapter.c_str(), iface, method, &err, &rep,
                                     "o", path.c_str());
    if (r < 0)
        LOG_DEBUG("[BLUEZ] %s: %s", method, err.message ? err.message : strerror(-r));
    if (rep)
        sd_bus_message_unref(rep);
    sd_bus_error_free(&err);
}

}  // namespace
#endif

namespace transport
{

BluezTransport::BluezTransport(BluezConfig cfg) : cfg_(std::move(cfg)) {}

BluezTransport::~BluezTransport()
{
    stop();
}

// ======================================================================
// Function: BluezTransport::start
// - In: UUIDs and local name in settings, adapter in config
// - Out: true once objects are exported and registration is submitted
// - Note: registration replies arrive later on the bus thread
// ======================================================================
bool BluezTransport::start(const Settings &s, OnFrame cb)
{
    if (running_.load(std::memory_order_relaxed))
        return true;

    settings_ = s;
    on_frame_ = std::move(cb);
    impl_     = std::make_unique<Impl>();

    impl_->adapter_path = "/org/bluez/" + cfg_.adapter;
    impl_->app_path     = cfg_.base_path + "/app";
    impl_->adv_path     = cfg_.base_path + "/adv0";
    impl_->local_name   = s.local_name;
    impl_->tx_pause_ms  = s.tx_pause_ms;

    impl_->service.owner = this;
    impl_->service.path  = impl_->app_path + "/svc0";
    impl_->service.uuid  = s.svc_uuid;

    impl_->notify_chr.owner  = this;
    impl_->notify_chr.path   = impl_->service.path + "/char_notify";
    impl_->notify_chr.uuid   = s.notify_uuid;
    impl_->notify_chr.parent = impl_->service.path;
    impl_->notify_chr.flags  = {"notify"};

    impl_->write_chr.owner  = this;
    impl_->write_chr.path   = impl_->service.path + "/char_write";
    impl_->write_chr.uuid   = s.write_uuid;
    impl_->write_chr.parent = impl_->service.path;
    impl_->write_chr.flags  = {"write", "write-without-response"};

    LOG_DEBUG("[BLUEZ] start: adapter=%s svc=%s notify=%s write=%s name=%s pause=%ums",
              cfg_.adapter.c_str(), s.svc_uuid.c_str(), s.notify_uuid.c_str(),
              s.write_uuid.c_str(), s.local_name.c_str(), s.tx_pause_ms);

    if (!impl_->rx.start(on_frame_) || !start_bus())
    {
        teardown();
        impl_.reset();
        return false;
    }
    return true;
}

bool BluezTransport::start_bus()
{
#if !CLIPSYNC_HAVE_SDBUS
    LOG_ERROR("[BLUEZ] built without sd-bus (CLIPSYNC_HAVE_SDBUS=0)");
    return false;
#else
    int r = sd_bus_open_system(&impl_->bus);
    if (r < 0 || !impl_->bus)
    {
        LOG_ERROR("[BLUEZ] cannot connect to the system bus: %s", strerror(-r));
        return false;
    }
    const char *uniq = nullptr;
    if (sd_bus_get_unique_name(impl_->bus, &uniq) >= 0 && uniq)
        impl_->unique_name = uniq;

    // ObjectManager -> GattService1 -> characteristics -> LEAdvertisement1
    r = sd_bus_add_object_manager(impl_->bus, &impl_->om_slot, impl_->app_path.c_str());
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ] add object manager failed: %s", strerror(-r));
        return false;
    }
    struct Export
    {
        GattObject          *obj;
        const char          *iface;
        const sd_bus_vtable *vtable;
    };
    const Export exports[] = {
        {&impl_->service, "org.bluez.GattService1", gatt_service_vtable},
        {&impl_->notify_chr, "org.bluez.GattCharacteristic1", gatt_notify_vtable},
        {&impl_->write_chr, "org.bluez.GattCharacteristic1", gatt_write_vtable},
    };
    for (const auto &e : exports)
    {
        r = sd_bus_add_object_vtable(impl_->bus, &e.obj->slot, e.obj->path.c_str(), e.iface,
                                     e.vtable, e.obj);
        if (r < 0)
        {
            LOG_ERROR("[BLUEZ] export %s failed: %s", e.obj->path.c_str(), strerror(-r));
            return false;
        }
    }
    r = sd_bus_add_object_vtable(impl_->bus, &impl_->adv_slot, impl_->adv_path.c_str(),
                                 "org.bluez.LEAdvertisement1", adv_vtable, impl_.get());
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ] export advertisement failed: %s", strerror(-r));
        return false;
    }

    r = sd_bus_call_method_async(impl_->bus, &impl_->reg_app_slot, "org.bluez",
                                 impl_->adapter_path.c_str(), "org.bluez.GattManager1",
                                 "RegisterApplication", on_reg_app_reply, this, "oa{sv}",
                                 impl_->app_path.c_str(), 0);
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ] RegisterApplication submit failed: %s", strerror(-r));
        return false;
    }
    r = sd_bus_call_method_async(impl_->bus, &impl_->reg_adv_slot, "org.bluez",
                                 impl_->adapter_path.c_str(), "org.bluez.LEAdvertisingManager1",
                                 "RegisterAdvertisement", on_reg_adv_reply, this, "oa{sv}",
                                 impl_->adv_path.c_str(), 0);
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ] RegisterAdvertisement submit failed: %s", strerror(-r));
        return false;
    }

    running_.store(true, std::memory_order_relaxed);
    impl_->loop = std::thread([this] { bus_loop(); });
    LOG_INFO("[BLUEZ] GATT service exported on %s as '%s' (bus=%s)", cfg_.adapter.c_str(),
             impl_->local_name.c_str(), impl_->unique_name.c_str());
    return true;
#endif
}

void BluezTransport::bus_loop()
{
#if CLIPSYNC_HAVE_SDBUS
    while (running_.load(std::memory_order_relaxed))
    {
        struct pollfd pfd
        {
        };
        uint64_t timeout_usec = UINT64_MAX;
        {
            std::lock_guard<std::mutex> lk(impl_->bus_mu);
            int                         r = 0;
            while ((r = sd_bus_process(impl_->bus, nullptr)) > 0)
            {
            }
            if (r < 0)
            {
                LOG_ERROR("[BLUEZ] bus processing failed: %s", strerror(-r));
                break;
            }
            pfd.fd     = sd_bus_get_fd(impl_->bus);
            pfd.events = static_cast<short>(sd_bus_get_events(impl_->bus));
            if (sd_bus_get_timeout(impl_->bus, &timeout_usec) < 0)
                timeout_usec = UINT64_MAX;
        }
        if (pfd.fd < 0)
            break;

        // sd_bus_get_timeout is absolute (CLOCK_MONOTONIC); cap the wait so stop() is noticed
        int wait_ms = 100;
        if (timeout_usec != UINT64_MAX)
        {
            const uint64_t now = static_cast<uint64_t>(
                std::chrono::duration_cast<std::chrono::microseconds>(
                    std::chrono::steady_clock::now().time_since_epoch())
                    .count());
            const uint64_t left = timeout_usec > now ? (timeout_usec - now) / 1000 : 0;
            wait_ms             = static_cast<int>(std::min<uint64_t>(left, 100));
        }
        (void)::poll(&pfd, 1, wait_ms);
    }
#endif
}

void BluezTransport::set_notifying(bool on)
{
    if (!impl_)
        return;
    const bool was = impl_->notifying.exchange(on);
    if (was == on)
        return;
    emit_notifying_changed();
    if (on)
        LOG_SYSTEM("[BLUEZ] central subscribed, link ready");
    else
        LOG_SYSTEM("[BLUEZ] central unsubscribed, link down");
}

// Called with the bus lock held (from a vtable callback)
void BluezTransport::emit_notifying_changed()
{
#if CLIPSYNC_HAVE_SDBUS
    if (impl_ && impl_->bus)
        sd_bus_emit_properties_changed(impl_->bus, impl_->notify_chr.path.c_str(),
                                       "org.bluez.GattCharacteristic1", "Notifying", nullptr);
#endif
}

void BluezTransport::note_att_mtu(std::uint16_t mtu)
{
    if (!impl_)
        return;
    if (impl_->att_mtu.exchange(mtu) != mtu)
    {
        // ATT value = MTU - 3
        const std::size_t room = mtu > 3 ? mtu - 3u : 0;
        if (settings_.max_frame && room < settings_.max_frame)
            LOG_WARN("[BLUEZ] ATT MTU %u leaves %zu bytes per write, frames are up to %zu", mtu,
                     room, settings_.max_frame);
        else
            LOG_INFO("[BLUEZ] ATT MTU %u", mtu);
    }
}

void BluezTransport::deliver_rx_bytes(const std::uint8_t *data, std::size_t len)
{
    if (!data || len == 0 || !is_running() || !impl_)
        return;
    // runs under the bus lock; the frame is processed on the rx thread
    (void)impl_->rx.push(data, len);
}

bool BluezTransport::emit_value(const Frame &f)
{
#if !CLIPSYNC_HAVE_SDBUS
    (void)f;
    return false;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus)
        return false;
    return emit_value_changed(impl_->bus, impl_->notify_chr.path, f.data(), f.size());
#endif
}

// ======================================================================
// Function: BluezTransport::send
// - In: one serialized frame
// - Out: true when the notification was queued on the bus
// - Note: dropped (false) while no central is subscribed
// ======================================================================
bool BluezTransport::send(const Frame &f)
{
    if (!running_.load(std::memory_order_relaxed) || !impl_ || f.empty())
        return false;
    if (!link_ready())
    {
        LOG_DEBUG("[BLUEZ] drop send (Notifying=false)");
        return false;
    }
    if (settings_.max_frame && f.size() > settings_.max_frame)
    {
        LOG_WARN("[BLUEZ] frame of %zu bytes exceeds %zu", f.size(), settings_.max_frame);
        return false;
    }
    if (!emit_value(f))
    {
        LOG_WARN("[BLUEZ] notify failed");
        return false;
    }
    if (impl_->tx_pause_ms)
        std::this_thread::sleep_for(std::chrono::milliseconds(impl_->tx_pause_ms));
    return true;
}

// ======================================================================
// Function: BluezTransport::stop
// - In: can be called anytime
// - Out: unregisters from BlueZ, closes the bus and joins the loop thread
// ======================================================================
void BluezTransport::stop()
{
    if (!running_.exchange(false, std::memory_order_relaxed))
        return;
    if (!impl_)
        return;
    teardown();
    LOG_DEBUG("[BLUEZ] stopped");
    impl_.reset();
}

void BluezTransport::teardown()
{
#if CLIPSYNC_HAVE_SDBUS
    if (impl_->bus)
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        unregister(impl_->bus, impl_->adapter_path, "org.bluez.LEAdvertisingManager1",
                   "UnregisterAdvertisement", impl_->adv_path);
        unregister(impl_->bus, impl_->adapter_path, "org.bluez.GattManager1",
                   "UnregisterApplication", impl_->app_path);
        // wakes the loop thread out of poll()
        sd_bus_close(impl_->bus);
    }
    if (impl_->loop.joinable())
        impl_->loop.join();

    unref_slot(impl_->reg_adv_slot);
    unref_slot(impl_->reg_app_slot);
    unref_slot(impl_->adv_slot);
    unref_slot(impl_->write_chr.slot);
    unref_slot(impl_->notify_chr.slot);
    unref_slot(impl_->service.slot);
    unref_slot(impl_->om_slot);
    if (impl_->bus)
    {
        sd_bus_flush_close_unref(impl_->bus);
        impl_->bus = nullptr;
    }
#endif
    impl_->rx.stop();
    impl_->notifying.store(false);
}

bool BluezTransport::link_ready() const
{
    return impl_ && impl_->notifying.load();
}

}  // namespace transport
