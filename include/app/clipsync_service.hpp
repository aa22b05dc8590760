#pragma once
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "app/session.hpp"
#include "app/trust_store.hpp"
#include "clip/iclipboard.hpp"
#include "proto/body.hpp"
#include "proto/error.hpp"
#include "transport/itransport.hpp"

namespace app
{

inline constexpr std::size_t ERROR_KINDS = static_cast<std::size_t>(proto::Error::ClipboardError) + 1;
// Unknown devices whose content may wait for consent at the same time
inline constexpr std::size_t MAX_HELD_SENDERS = 8;

struct Stats
{
    std::uint64_t frames_out{0};
    std::uint64_t messages_out{0};
    std::uint64_t frames_in{0};
    std::uint64_t delivered{0};
    std::uint64_t echo_skipped{0};  // local changes not sent because they echo the last receive
    std::array<std::uint64_t, ERROR_KINDS> drops{};  // indexed by proto::Error

    std::uint64_t dropped(proto::Error e) const { return drops[static_cast<std::size_t>(e)]; }
};

// Clipboard <-> link pipeline for one peer session.
//   TX: clipboard change -> [sender id | content] -> envelope -> frames -> transport
//   RX: transport -> frame -> reassembly -> envelope -> trust gate -> clipboard
class ClipSyncService
{
  public:
    // (label, frames sent, frames total)
    using Progress = std::function<void(const std::string &, std::size_t, std::size_t)>;

    ClipSyncService(transport::ITransport &t,
                    clip::IClipboard      &clipboard,
                    TrustStore            &trust,
                    Session               &session);
    ~ClipSyncService();

    bool start(const transport::Settings &s);
    void stop();

    bool send_content(const proto::Content &content);
    bool send_text(const std::string &text);
    bool send_file(const std::string &path);
    // Aborts the send in progress before its next frame
    void cancel_send();
    bool sending() const { return sending_.load(); }
    // Set before start()
    void set_progress(Progress cb) { progress_ = std::move(cb); }

    void         on_local_change();
    void         on_rx(const transport::Frame &f);
    proto::Error handle_frame(const transport::Frame &f);

    // Housekeeping: idle reassembly eviction and link edge detection
    void tick();

    Stats       stats() const;
    std::string status_line() const;
    // Messages parked for consent; at most one per sender, newest wins
    std::size_t held_messages() const;

  private:
    struct Inbound
    {
        std::uint64_t      sender{0};
        proto::Content     content;
        proto::ContentHash hash{};
    };

    proto::Error hold_for_consent(const std::shared_ptr<Inbound> &in);
    proto::Error deliver(const Inbound &in);
    void         count_drop(proto::Error e);

    transport::ITransport &tx_;
    clip::IClipboard      &clipboard_;
    TrustStore            &trust_;
    Session               &session_;
    Progress               progress_;

    std::mutex        tx_mu_;  // one outbound message at a time
    std::atomic<bool> cancel_{false};
    std::atomic<bool> sending_{false};
    std::atomic<bool> running_{false};
    std::atomic<bool> link_up_{false};

    mutable std::mutex                                 held_mu_;
    std::map<std::uint64_t, std::shared_ptr<Inbound>> held_;
    // thread inside clipboard_.write(); its change notifications are ours
    std::atomic<std::thread::id> delivering_{};

    std::atomic<std::uint64_t>                           frames_out_{0};
    std::atomic<std::uint64_t>                           messages_out_{0};
    std::atomic<std::uint64_t>                           frames_in_{0};
    std::atomic<std::uint64_t>                           delivered_{0};
    std::atomic<std::uint64_t>                           echo_skipped_{0};
    std::array<std::atomic<std::uint64_t>, ERROR_KINDS> drops_{};
};

}  // namespace app
