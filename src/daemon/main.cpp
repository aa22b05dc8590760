#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <memory>
#include <mutex>
#include <optional>
#include <pthread.h>
#include <string>
#include <thread>

#include "app/clipsync_service.hpp"
#include "app/consent.hpp"
#include "app/identity.hpp"
#include "app/send_queue.hpp"
#include "app/session.hpp"
#include "app/trust_store.hpp"
#include "clip/memory_clipboard.hpp"
#include "clip/wayland_clipboard.hpp"
#include "crypto/psk_aead.hpp"
#include "ctl/commands.hpp"
#include "ctl/ipc.hpp"
#include "proto/envelope.hpp"
#include "proto/frag.hpp"
#include "transport/bluez_transport.hpp"
#include "transport/loopback_transport.hpp"
#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

std::atomic<bool> g_stop{false};

void on_signal(int)
{
    g_stop.store(true);
}

// No SA_RESTART: accept() must return EINTR so the server loop sees g_stop
void install_signal_handlers()
{
    struct sigaction sa{};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    std::signal(SIGPIPE, SIG_IGN);
}

// Worker threads inherit the mask; only the main thread takes SIGINT/SIGTERM
void set_stop_signals_blocked(bool blocked)
{
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    pthread_sigmask(blocked ? SIG_BLOCK : SIG_UNBLOCK, &set, nullptr);
}

std::unique_ptr<transport::ITransport> make_transport(const config::Config &cfg)
{
    if (cfg.transport == "bluez")
    {
        transport::BluezConfig bc;
        bc.adapter = cfg.adapter;
        return std::make_unique<transport::BluezTransport>(std::move(bc));
    }
    // default - loopback
    return std::make_unique<transport::LoopbackTransport>();
}

std::unique_ptr<clip::IClipboard> make_clipboard(const config::Config &cfg)
{
    if (cfg.clipboard == "wayland")
        return std::make_unique<clip::WaylandClipboard>(cfg.recv_dir,
                                                        std::chrono::milliseconds(cfg.poll_ms));
    return std::make_unique<clip::MemoryClipboard>();
}

// Once a second: reassembly timeout and link edge detection
class Ticker
{
  public:
    explicit Ticker(app::ClipSyncService &svc) : svc_(svc) {}
    ~Ticker() { stop(); }

    void start()
    {
        thr_ = std::thread([this] {
            std::unique_lock<std::mutex> lk(mu_);
            while (!cv_.wait_for(lk, std::chrono::seconds(1), [this] { return done_; }))
            {
                lk.unlock();
                svc_.tick();
                lk.lock();
            }
        });
    }

    void stop()
    {
        {
            std::lock_guard<std::mutex> lk(mu_);
            done_ = true;
        }
        cv_.notify_all();
        if (thr_.joinable())
            thr_.join();
    }

  private:
    app::ClipSyncService   &svc_;
    std::mutex              mu_;
    std::condition_variable cv_;
    bool                    done_{false};
    std::thread             thr_;
};

}  // namespace

int main()
{
    const config::Config cfg = config::Config::from_env();
    clipsync::set_log_level_by_name(cfg.log_level);

    LOG_SYSTEM("Config: transport=%s adapter=%s clipboard=%s chunk=%zu compress>=%zu state=%s",
               cfg.transport.c_str(), cfg.adapter.c_str(), cfg.clipboard.c_str(), cfg.chunk_size,
               cfg.compress_threshold, cfg.state_dir.c_str());

    const auto local_id =
        app::load_or_create_device_id(cfg.state_dir + "/" + std::string(constants::DEVICE_ID_FILE));
    if (!local_id)
    {
        LOG_ERROR("no usable device identity in %s", cfg.state_dir.c_str());
        return exitc::failure;
    }
    LOG_SYSTEM("Device id %s", app::format_device_id(*local_id).c_str());

    app::TrustStore trust(cfg.state_dir + "/" + std::string(constants::TRUST_FILE));
    if (!trust.load())
    {
        LOG_ERROR("cannot read trust store %s", trust.path().c_str());
        return exitc::failure;
    }
    app::PendingConsent consent;
    trust.set_consent(consent.consent_fn());

    // AEAD: AES-GCM when a key is configured, else plaintext
    std::optional<aead::GcmPskAead> cipher = aead::GcmPskAead::from_env("CLIPSYNC_PSK");
    if (cipher)
        LOG_INFO("Using AES-%zu-GCM (key from CLIPSYNC_PSK)", cipher->key_size() * 8);
    else
        LOG_WARN("CLIPSYNC_PSK not set: clipboard content travels unencrypted");

    envelope::Envelope env(cipher ? &*cipher : nullptr, cfg.compress_threshold);
    app::Session session(*local_id, env, cfg.chunk_size,
                         std::chrono::milliseconds(cfg.reasm_timeout_ms));

    auto tx        = make_transport(cfg);
    auto clipboard = make_clipboard(cfg);

    transport::Settings settings;
    settings.svc_uuid    = std::string(constants::SVC_UUID);
    settings.notify_uuid = std::string(constants::NOTIFY_UUID);
    settings.write_uuid  = std::string(constants::WRITE_UUID);
    settings.local_name  = std::string(constants::LOCAL_NAME);
    settings.max_frame   = frag::HDR_SIZE + cfg.chunk_size;
    settings.tx_pause_ms = cfg.tx_pause_ms;

    set_stop_signals_blocked(true);
    install_signal_handlers();

    app::ClipSyncService svc(*tx, *clipboard, trust, session);
    app::SendQueue       queue;
    ctl::CommandDispatcher dispatcher(svc, trust, consent, [&queue](std::function<void()> job) {
        return queue.push(std::move(job));
    });
    svc.set_progress([&dispatcher](const std::string &label, std::size_t sent, std::size_t total) {
        dispatcher.note_progress(label, sent, total);
    });

    if (!svc.start(settings))
    {
        LOG_ERROR("ClipSyncService start failed");
        return exitc::failure;
    }
    queue.start();
    Ticker ticker(svc);
    ticker.start();

    set_stop_signals_blocked(false);

    // IPC server
    const std::string sock = ipc::expand_user(cfg.ctl_sock);
    const bool        served =
        ipc::start_server(sock, [&dispatcher](const std::string &line) { return dispatcher.handle(line); },
                          &g_stop);
    if (!served)
        LOG_ERROR("start_server failed on %s", sock.c_str());

    LOG_SYSTEM("Shutting down");
    consent.deny_all();
    ticker.stop();
    svc.cancel_send();
    queue.stop();
    svc.stop();
    return served ? exitc::ok : exitc::failure;
}
