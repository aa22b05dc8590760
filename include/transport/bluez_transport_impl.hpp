// include/transport/bluez_transport_impl.hpp
#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "transport/bluez_transport.hpp"
#include "transport/rx_pump.hpp"

#if CLIPSYNC_HAVE_SDBUS
#include <systemd/sd-bus.h>
#endif

namespace transport
{

// One exported D-Bus object; handed to sd-bus as vtable userdata
struct GattObject
{
    BluezTransport          *owner = nullptr;
    std::string              path;
    std::string              uuid;
    std::string              parent;  // characteristics: owning service path
    std::vector<std::string> flags;   // characteristics: GATT flags
#if CLIPSYNC_HAVE_SDBUS
    sd_bus_slot *slot = nullptr;
#endif
};

struct BluezTransport::Impl
{
#if CLIPSYNC_HAVE_SDBUS
    sd_bus      *bus          = nullptr;
    sd_bus_slot *om_slot      = nullptr;  // ObjectManager at app_path
    sd_bus_slot *reg_app_slot = nullptr;  // RegisterApplication (async)
    sd_bus_slot *adv_slot     = nullptr;  // LEAdvertisement1 vtable
    sd_bus_slot *reg_adv_slot = nullptr;  // RegisterAdvertisement (async)
#endif
    // serialize all sd-bus access
    std::mutex  bus_mu;
    std::thread loop;
    RxPump      rx;  // frames from WriteValue, handed up off the bus thread

    std::string adapter_path;  // "/org/bluez/hci0"
    std::string app_path;      // <base>/app
    std::string adv_path;      // <base>/adv0
    std::string local_name;

    GattObject service;
    GattObject notify_chr;  // our TX
    GattObject write_chr;   // our RX

    std::atomic_bool          notifying{false};
    std::atomic<std::uint16_t> att_mtu{0};
    std::uint32_t             tx_pause_ms{0};
    std::string               unique_name;  // our bus unique name (debug)
};

}  // namespace transport
