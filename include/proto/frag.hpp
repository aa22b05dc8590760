#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <utility>
#include <vector>

/*
TX:
service.send_content(content)
  -> proto::encode_body(sender_id, encode_content(content))
     -> Envelope::wrap(body, type) = [u32 len|deflate] -> nonce + ciphertext + tag
        -> make_frames(type, flags, bytes, chunk)
           -> for each Frame {hdr, payload}:
                serialize(Frame)  // [8B header][payload]
                  -> transport.send(frame_bytes)

RX:
transport.on_rx(frame_bytes)
  -> parse(frame_bytes)  // validate and extract Frame [hdr, payload]
      -> ok? reassembler.append(Frame)
            -> complete ? Envelope::unwrap(...) -> body -> trust gate -> clipboard
*/

namespace frag
{

// --- Protocol constants ---
inline constexpr std::uint8_t FLAG_LAST       = 1 << 0;
inline constexpr std::uint8_t FLAG_COMPRESSED = 1 << 1;
inline constexpr std::uint8_t FLAG_ENCRYPTED  = 1 << 2;
inline constexpr std::uint8_t ENVELOPE_MASK   = FLAG_COMPRESSED | FLAG_ENCRYPTED;
inline constexpr std::size_t  HDR_SIZE        = 8;
inline constexpr std::size_t  DEFAULT_CHUNK   = 180;  // stays under a 185-byte ATT MTU
inline constexpr std::size_t  MAX_FRAMES      = UINT16_MAX;

// On-wire frame header, big-endian
struct Header
{
    std::uint8_t  type{0};   // 1B
    std::uint8_t  flags{0};  // 1B
    std::uint16_t seq{0};    // 2B
    std::uint16_t total{0};  // 2B
    std::uint16_t len{0};    // 2B
};

struct Frame
{
    Header                    hdr;
    std::vector<std::uint8_t> payload;
};

// A fully reassembled enveloped body. flags never carries FLAG_LAST.
struct Message
{
    std::uint8_t              type{0};
    std::uint8_t              flags{0};
    std::vector<std::uint8_t> body;
};

// TX
std::vector<Frame>        make_frames(std::uint8_t                     type,
                                      std::uint8_t                     flags_base,
                                      const std::vector<std::uint8_t> &body,
                                      std::size_t                      max_chunk);
std::vector<std::uint8_t> serialize(const Frame &f);
bool                      pack_header(const Header &in, std::uint8_t out[HDR_SIZE]);
// RX
std::optional<Frame>      parse(const std::vector<std::uint8_t> &bytes);
bool                      unpack_header(const std::uint8_t in[HDR_SIZE], Header &out);

// One in-flight message per inbound stream; frames may arrive out of order.
class Reassembler
{
  public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    Reassembler() : now_([] { return Clock::now(); }) {}
    explicit Reassembler(NowFn now) : now_(std::move(now)) {}

    // Feed one frame, return the message once every fragment is present
    std::optional<Message> append(const Frame &f);

    // 0 disables idle eviction
    void set_idle_timeout(std::chrono::milliseconds t) { idle_timeout_ = t; }
    // Drops a partial message idle for longer than the timeout; true if one was dropped
    bool evict_idle();
    void reset();
    bool in_progress() const { return active_; }

  private:
    bool is_stale(Clock::time_point now) const;

    NowFn                                               now_;
    std::chrono::milliseconds                           idle_timeout_{0};
    bool                                                active_{false};
    std::uint8_t                                        type_{0};
    std::uint16_t                                       total_{0};
    std::uint8_t                                        flags_{0};
    std::map<std::uint16_t, std::vector<std::uint8_t>> chunks_;
    Clock::time_point                                   last_activity_{};
};

}  // namespace frag
