#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace transport
{

// One serialized protocol frame, exactly as written to / notified by the link
using Frame = std::vector<std::uint8_t>;
// Called once per received frame, in arrival order and never concurrently for one link.
// No transport lock is held while it runs, so it may block or call send().
using OnFrame = std::function<void(const Frame &)>;

struct Settings
{
    std::string   svc_uuid, notify_uuid, write_uuid;
    std::string   local_name;
    std::size_t   max_frame   = 0;  // header + chunk; 0 = unchecked
    std::uint32_t tx_pause_ms = 0;  // pause after each frame
};

// Message-oriented link to one peer. Delivery is best effort: no retry, no acks.
struct ITransport
{
    virtual bool start(const Settings &s, OnFrame on_rx) = 0;
    // false when the link is down or the frame was refused; the caller abandons the message
    virtual bool        send(const Frame &one_frame) = 0;
    // joins transport threads; frames arriving afterwards are not delivered
    virtual void        stop()                       = 0;
    virtual std::string name() const { return ""; }
    // a peer is connected and listening for our frames
    virtual bool link_ready() const = 0;
    virtual ~ITransport()           = default;
};

}  // namespace transport
