#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "transport/itransport.hpp"

namespace transport
{

struct BluezConfig
{
    std::string adapter   = "hci0";
    std::string base_path = "/com/clipsync";  // our exported object tree
};

// GATT peripheral over BlueZ: one primary service, a notify characteristic carrying our frames
// to the central, and a write characteristic carrying the central's frames to us.
class BluezTransport final : public ITransport
{
  public:
    explicit BluezTransport(BluezConfig cfg);
    ~BluezTransport() override;

    bool        start(const Settings &s, OnFrame cb) override;
    bool        send(const Frame &f) override;
    void        stop() override;
    std::string name() const override { return "bluez"; }
    // A central is subscribed to the notify characteristic
    bool        link_ready() const override;

    const BluezConfig &config() const { return cfg_; }
    bool is_running() const noexcept { return running_.load(std::memory_order_relaxed); }

    // sd-bus callbacks (bus thread, bus lock held). Received bytes are queued, never processed here.
    void set_notifying(bool on);
    void deliver_rx_bytes(const std::uint8_t *data, std::size_t len);
    void note_att_mtu(std::uint16_t mtu);

    struct Impl;

  private:
    bool start_bus();
    void bus_loop();
    void teardown();
    bool emit_value(const Frame &f);
    void emit_notifying_changed();

    BluezConfig           cfg_;
    Settings              settings_{};
    OnFrame               on_frame_{};
    std::atomic_bool      running_{false};
    std::unique_ptr<Impl> impl_;
};

}  // namespace transport
