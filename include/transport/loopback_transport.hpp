#pragma once
#include <cstddef>
#include <mutex>

#include "transport/itransport.hpp"

namespace transport
{

// In-process link. Unlinked, every frame comes straight back to the sender; linked, frames go to
// the peer loopback. Delivery is synchronous on the sending thread.
class LoopbackTransport final : public ITransport
{
  public:
    bool        start(const Settings &s, OnFrame on_rx) override;
    bool        send(const Frame &one_frame) override;
    void        stop() override;
    std::string name() const override { return "loopback"; }
    bool        link_ready() const override;

    // Both ends must outlive the link
    static void link(LoopbackTransport &a, LoopbackTransport &b);
    void        unlink();

    // Test hook: the next n sends are dropped but reported as sent
    void        drop_next(std::size_t n);
    std::size_t frames_sent() const;

  private:
    void deliver(const Frame &f);

    mutable std::mutex mu_;
    OnFrame            on_rx_{};
    std::size_t        max_frame_{0};
    bool               started_{false};
    LoopbackTransport *peer_{nullptr};
    std::size_t        drop_{0};
    std::size_t        sent_{0};
};

}  // namespace transport
