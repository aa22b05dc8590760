#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include "app/clipsync_service.hpp"
#include "app/identity.hpp"
#include "proto/frag.hpp"
#include "util/log.hpp"

namespace fs = std::filesystem;

namespace app
{

namespace
{

// Larger payloads cannot be framed at any allowed chunk size
constexpr std::uintmax_t MAX_SEND_FILE = 64u << 20;

const char *type_name(proto::ContentType t)
{
    switch (t)
    {
        case proto::ContentType::Text:
            return "text";
        case proto::ContentType::Image:
            return "image";
        case proto::ContentType::File:
            return "file";
    }
    return "?";
}

struct ClearOnExit
{
    std::atomic<bool> &flag;
    ~ClearOnExit() { flag.store(false); }
};

}  // namespace

ClipSyncService::ClipSyncService(transport::ITransport &t,
                                 clip::IClipboard      &clipboard,
                                 TrustStore            &trust,
                                 Session               &session)
    : tx_(t), clipboard_(clipboard), trust_(trust), session_(session)
{
}

ClipSyncService::~ClipSyncService()
{
    stop();
}

bool ClipSyncService::start(const transport::Settings &s)
{
    if (running_.load())
        return true;

    clipboard_.set_on_change([this] { on_local_change(); });
    if (!tx_.start(s, [this](const transport::Frame &f) { on_rx(f); }))
    {
        LOG_ERROR("transport '%s' failed to start", tx_.name().c_str());
        clipboard_.set_on_change(nullptr);
        return false;
    }
    if (!clipboard_.start())
    {
        LOG_ERROR("clipboard '%s' failed to start", clipboard_.name().c_str());
        tx_.stop();
        clipboard_.set_on_change(nullptr);
        return false;
    }
    running_.store(true);
    link_up_.store(tx_.link_ready());
    LOG_INFO("sync started: transport=%s clipboard=%s id=%s", tx_.name().c_str(),
             clipboard_.name().c_str(), format_device_id(session_.local_id()).c_str());
    return true;
}

void ClipSyncService::stop()
{
    if (!running_.exchange(false))
        return;
    cancel_send();
    clipboard_.set_on_change(nullptr);
    clipboard_.stop();
    tx_.stop();
    // waits for a send in flight to notice the cancel
    std::lock_guard<std::mutex> lk(tx_mu_);
    session_.reset();
    std::lock_guard<std::mutex> hk(held_mu_);
    held_.clear();
}

// ======================================================================
// Function: ClipSyncService::send_content
// - In: clipboard content
// - Out: true when every frame was handed to the transport
// - Note: no retry; the first transport failure or a cancel ends the message
// ======================================================================
bool ClipSyncService::send_content(const proto::Content &content)
{
    std::lock_guard<std::mutex> lk(tx_mu_);
    cancel_.store(false);
    sending_.store(true);
    ClearOnExit clear{sending_};

    const auto type = static_cast<std::uint8_t>(content.type);
    const auto body = proto::encode_body(session_.local_id(), proto::encode_content(content));

    auto wrapped = session_.codec().wrap(body, type);
    if (!wrapped)
        return false;

    auto frames = frag::make_frames(type, wrapped->flags, wrapped->bytes, session_.chunk_size());
    if (frames.empty())
    {
        LOG_ERROR("send: %zu-byte %s does not fit in a message", body.size(),
                  type_name(content.type));
        return false;
    }

    const std::string label =
        content.type == proto::ContentType::File ? content.file_name : type_name(content.type);
    const std::size_t total = frames.size();
    for (std::size_t i = 0; i < total; ++i)
    {
        if (cancel_.exchange(false))
        {
            LOG_SYSTEM("[SEND] %s cancelled after %zu/%zu frames", label.c_str(), i, total);
            return false;
        }
        auto bytes = frag::serialize(frames[i]);
        if (bytes.empty())
        {
            LOG_ERROR("send: serialize failed at frame %zu", i);
            return false;
        }
        if (!tx_.send(bytes))
        {
            LOG_ERROR("send: transport.send failed at frame %zu/%zu", i + 1, total);
            return false;
        }
        frames_out_.fetch_add(1);
        if (progress_)
            progress_(label, i + 1, total);
    }
    messages_out_.fetch_add(1);
    LOG_INFO("[SEND] %s: %zu bytes in %zu frame(s), flags=0x%02x", label.c_str(),
             content.data.size(), total, wrapped->flags);
    return true;
}

bool ClipSyncService::send_text(const std::string &text)
{
    return send_content(proto::text_content(text));
}

bool ClipSyncService::send_file(const std::string &path)
{
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
    {
        LOG_ERROR("send_file: %s is not a regular file", path.c_str());
        return false;
    }
    const auto size = fs::file_size(path, ec);
    if (ec || size > MAX_SEND_FILE)
    {
        LOG_ERROR("send_file: %s is too large or unreadable", path.c_str());
        return false;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
    {
        LOG_ERROR("send_file: cannot open %s", path.c_str());
        return false;
    }

    proto::Content c;
    c.type      = proto::ContentType::File;
    c.file_name = fs::path(path).filename().string();
    c.data.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    LOG_SYSTEM("[SEND] file %s (%zu bytes)", c.file_name.c_str(), c.data.size());
    return send_content(c);
}

void ClipSyncService::cancel_send()
{
    if (sending_.load())
        cancel_.store(true);
}

void ClipSyncService::on_local_change()
{
    auto &guard = session_.loop_guard();
    if (delivering_.load() == std::this_thread::get_id())
    {
        guard.consume_ignore_flag();
        LOG_DEBUG("clipboard reported our own write, not sending");
        return;
    }
    if (guard.consume_ignore_flag())
    {
        LOG_DEBUG("clipboard change caused by our own write, not sending");
        return;
    }
    auto content = clipboard_.read_current();
    if (!content)
        return;
    if (guard.should_skip_send(proto::content_hash(proto::encode_content(*content))))
    {
        echo_skipped_.fetch_add(1);
        LOG_DEBUG("clipboard holds the last received content, not echoing it");
        return;
    }
    if (!tx_.link_ready())
    {
        LOG_DEBUG("clipboard changed but no peer is connected");
        return;
    }
    (void)send_content(*content);
}

void ClipSyncService::on_rx(const transport::Frame &f)
{
    const auto e = handle_frame(f);
    if (e != proto::Error::None && e != proto::Error::Incomplete)
        LOG_DEBUG("frame outcome: %s", proto::error_name(e));
}

// ======================================================================
// Function: ClipSyncService::handle_frame
// - In: one frame as received from the transport
// - Out: None once a message is delivered, otherwise why it was not (yet)
// - Note: the rx lock is not held across the trust gate, consent may answer on another thread
// ======================================================================
proto::Error ClipSyncService::handle_frame(const transport::Frame &f)
{
    frames_in_.fetch_add(1);
    auto frame = frag::parse(f);
    if (!frame)
    {
        LOG_WARN("[RX] dropping malformed frame (%zu bytes)", f.size());
        count_drop(proto::Error::MalformedFrame);
        return proto::Error::MalformedFrame;
    }

    auto in = std::make_shared<Inbound>();
    {
        std::lock_guard<std::mutex> lk(session_.rx_mutex());
        auto                        msg = session_.reassembler().append(*frame);
        if (!msg)
            return proto::Error::Incomplete;

        std::vector<std::uint8_t> body;
        const auto e = session_.codec().unwrap(msg->body, msg->type, msg->flags, body);
        if (e != proto::Error::None)
        {
            LOG_SYSTEM("[SEC] dropping message: %s (type=%u flags=0x%02x, %zu bytes)",
                       proto::error_name(e), msg->type, msg->flags, msg->body.size());
            count_drop(e);
            return e;
        }

        auto decoded = proto::decode_body(body);
        auto content = decoded ? proto::decode_content(msg->type, decoded->content) : std::nullopt;
        if (!content)
        {
            LOG_WARN("[RX] dropping message with malformed body (type=%u, %zu bytes)", msg->type,
                     body.size());
            count_drop(proto::Error::MalformedBody);
            return proto::Error::MalformedBody;
        }
        if (decoded->sender_id == session_.local_id())
        {
            LOG_DEBUG("[RX] dropping our own message");
            count_drop(proto::Error::SelfEcho);
            return proto::Error::SelfEcho;
        }
        in->sender  = decoded->sender_id;
        in->hash    = proto::content_hash(decoded->content);
        in->content = std::move(*content);
    }

    if (trust_.is_trusted(in->sender))
        return deliver(*in);
    return hold_for_consent(in);
}

// ======================================================================
// Function: ClipSyncService::hold_for_consent
// - In: a decoded message from a sender that is not trusted (yet)
// - Out: None when consent arrived synchronously and the content was delivered
// - Note: one slot per sender. A newer message replaces the held one instead of asking again.
// ======================================================================
proto::Error ClipSyncService::hold_for_consent(const std::shared_ptr<Inbound> &in)
{
    const std::uint64_t sender = in->sender;
    {
        std::lock_guard<std::mutex> lk(held_mu_);
        auto                        it = held_.find(sender);
        if (it != held_.end())
        {
            it->second = in;
            count_drop(proto::Error::UntrustedSender);
            LOG_INFO("[TRUST] newer content from %s replaces the held one",
                     format_device_id(sender).c_str());
            return proto::Error::UntrustedSender;
        }
        if (held_.size() >= MAX_HELD_SENDERS)
        {
            LOG_WARN("[TRUST] %zu unknown devices already waiting, dropping content from %s",
                     held_.size(), format_device_id(sender).c_str());
            count_drop(proto::Error::UntrustedSender);
            return proto::Error::UntrustedSender;
        }
        held_.emplace(sender, in);
    }

    // Filled in only when the decision arrives before ensure_trusted returns
    auto sync_result = std::make_shared<proto::Error>(proto::Error::UntrustedSender);
    auto answered    = std::make_shared<std::atomic<bool>>(false);
    trust_.ensure_trusted(sender, [this, sender, sync_result, answered](bool allow) {
        std::shared_ptr<Inbound> held;
        {
            std::lock_guard<std::mutex> lk(held_mu_);
            auto                        it = held_.find(sender);
            if (it != held_.end())
            {
                held = std::move(it->second);
                held_.erase(it);
            }
        }
        proto::Error r = proto::Error::UntrustedSender;
        if (!held)
        {
            LOG_DEBUG("[TRUST] decision for %s after shutdown", format_device_id(sender).c_str());
        }
        else if (allow)
        {
            r = deliver(*held);
        }
        else
        {
            LOG_SYSTEM("[TRUST] dropping content from untrusted %s",
                       format_device_id(sender).c_str());
            count_drop(proto::Error::UntrustedSender);
        }
        *sync_result = r;
        answered->store(true);
    });
    if (answered->load())
        return *sync_result;
    LOG_INFO("[TRUST] holding content from %s until consent", format_device_id(sender).c_str());
    return proto::Error::UntrustedSender;
}

proto::Error ClipSyncService::deliver(const Inbound &in)
{
    std::lock_guard<std::mutex> lk(session_.rx_mutex());
    auto                       &guard = session_.loop_guard();
    // recorded before the write so the change notification it triggers is recognised
    guard.mark_received(in.hash);
    delivering_.store(std::this_thread::get_id());
    const bool written = clipboard_.write(in.content);
    delivering_.store(std::thread::id());
    if (!written)
    {
        guard.consume_ignore_flag();
        LOG_ERROR("[RX] clipboard write failed");
        count_drop(proto::Error::ClipboardError);
        return proto::Error::ClipboardError;
    }
    delivered_.fetch_add(1);
    if (in.content.type == proto::ContentType::File)
        LOG_SYSTEM("[RECV] file %s (%zu bytes) from %s", in.content.file_name.c_str(),
                   in.content.data.size(), trust_.display_name(in.sender).c_str());
    else
        LOG_SYSTEM("[RECV] %s (%zu bytes) from %s", type_name(in.content.type),
                   in.content.data.size(), trust_.display_name(in.sender).c_str());
    return proto::Error::None;
}

void ClipSyncService::count_drop(proto::Error e)
{
    drops_[static_cast<std::size_t>(e)].fetch_add(1);
}

void ClipSyncService::tick()
{
    if (!running_.load())
        return;
    {
        std::lock_guard<std::mutex> lk(session_.rx_mutex());
        if (session_.reassembler().evict_idle())
            LOG_WARN("[RX] dropped a partial message after the reassembly timeout");
    }

    const bool up  = tx_.link_ready();
    const bool was = link_up_.exchange(up);
    if (was && !up)
    {
        // a new connection must not complete a message from the old one
        session_.reset();
        LOG_INFO("link down, session state cleared");
    }
    else if (!was && up)
    {
        LOG_INFO("link up");
    }
}

Stats ClipSyncService::stats() const
{
    Stats s;
    s.frames_out   = frames_out_.load();
    s.messages_out = messages_out_.load();
    s.frames_in    = frames_in_.load();
    s.delivered    = delivered_.load();
    s.echo_skipped = echo_skipped_.load();
    for (std::size_t i = 0; i < ERROR_KINDS; ++i)
        s.drops[i] = drops_[i].load();
    return s;
}

std::size_t ClipSyncService::held_messages() const
{
    std::lock_guard<std::mutex> lk(held_mu_);
    return held_.size();
}

std::string ClipSyncService::status_line() const
{
    const Stats s = stats();
    std::string out = "id=" + format_device_id(session_.local_id());
    out += " transport=" + tx_.name();
    out += tx_.link_ready() ? " link=up" : " link=down";
    out += session_.codec().encrypting() ? " key=psk" : " key=none";
    out += sending_.load() ? " sending=yes" : " sending=no";
    out += " sent=" + std::to_string(s.messages_out) + "/" + std::to_string(s.frames_out);
    out += " received=" + std::to_string(s.delivered) + "/" + std::to_string(s.frames_in);
    for (std::size_t i = static_cast<std::size_t>(proto::Error::MalformedFrame); i < ERROR_KINDS;
         ++i)
    {
        if (s.drops[i])
            out += std::string(" ") + proto::error_name(static_cast<proto::Error>(i)) + "=" +
                   std::to_string(s.drops[i]);
    }
    return out;
}

}  // namespace app
