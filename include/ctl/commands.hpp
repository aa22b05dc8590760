#pragma once
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "app/clipsync_service.hpp"
#include "app/consent.hpp"
#include "app/trust_store.hpp"

namespace ctl
{

// Daemon side of the control protocol. Every reply starts with "OK" or "ERR".
class CommandDispatcher
{
  public:
    // Runs a send job; the daemon hands it to its SendQueue, tests run it inline
    using Executor = std::function<bool(std::function<void()>)>;

    CommandDispatcher(app::ClipSyncService &svc,
                      app::TrustStore      &trust,
                      app::PendingConsent  &consent,
                      Executor              exec);

    std::vector<std::string> handle(const std::string &line);

    // Wire to ClipSyncService::set_progress
    void note_progress(const std::string &label, std::size_t sent, std::size_t total);

  private:
    std::vector<std::string> cmd_send(const std::string &arg);
    std::vector<std::string> cmd_send_file(const std::string &arg);
    std::vector<std::string> cmd_status();
    std::vector<std::string> cmd_trust(const std::string &arg);

    app::ClipSyncService &svc_;
    app::TrustStore      &trust_;
    app::PendingConsent  &consent_;
    Executor              exec_;

    std::mutex  progress_mu_;
    std::string progress_;
};

}  // namespace ctl
