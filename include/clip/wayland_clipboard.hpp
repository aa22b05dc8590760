#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "clip/iclipboard.hpp"

namespace clip
{

// wl-clipboard (wl-paste / wl-copy) driven clipboard. Wayland offers no change signal to
// ordinary clients, so the offer is polled.
class WaylandClipboard final : public IClipboard
{
  public:
    WaylandClipboard(std::string recv_dir, std::chrono::milliseconds poll_interval);
    ~WaylandClipboard() override;

    bool                          start() override;
    void                          stop() override;
    std::optional<proto::Content> read_current() override;
    bool                          write(const proto::Content &content) override;
    void                          set_on_change(OnChange cb) override;
    std::string                   name() const override { return "wayland"; }

  private:
    void poll_loop();
    void note_and_notify(const proto::Content &content);
    // Received files land in recv_dir_; returns the stored path
    std::optional<std::string> store_file(const proto::Content &content);

    std::string               recv_dir_;
    std::chrono::milliseconds poll_interval_;

    std::mutex                                mu_;
    OnChange                                  on_change_;
    std::optional<proto::ContentHash>         last_seen_;
    std::thread                               poll_thr_;
    std::atomic<bool>                         stop_{true};
    std::condition_variable                   stop_cv_;
};

// Helpers shared with tests
std::string sanitize_file_name(const std::string &name);
std::string shell_quote(const std::string &s);
std::string file_uri(const std::string &path);
// First file:// entry of a text/uri-list, percent-decoded
std::optional<std::string> path_from_uri_list(const std::string &uri_list);

}  // namespace clip
