#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unistd.h>
#include <vector>

#include "app/clipsync_service.hpp"
#include "app/consent.hpp"
#include "app/session.hpp"
#include "app/trust_store.hpp"
#include "clip/memory_clipboard.hpp"
#include "crypto/psk_aead.hpp"
#include "proto/body.hpp"
#include "proto/envelope.hpp"
#include "proto/frag.hpp"
#include "transport/loopback_transport.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using proto::Error;

namespace
{

constexpr std::uint64_t ID_A = 0x1122334455667788ULL;
constexpr std::uint64_t ID_B = 0x8877665544332211ULL;

// Records every frame instead of delivering it
class RecordingTransport final : public transport::ITransport
{
  public:
    bool start(const transport::Settings &, transport::OnFrame) override { return true; }
    bool send(const transport::Frame &f) override
    {
        std::lock_guard<std::mutex> lk(mu);
        frames.push_back(f);
        return true;
    }
    void        stop() override {}
    std::string name() const override { return "recording"; }
    bool        link_ready() const override { return ready; }

    std::mutex                     mu;
    std::vector<transport::Frame> frames;
    bool                           ready{true};
};

struct Peer
{
    Peer(std::uint64_t                    id,
         const std::string               &tag,
         transport::ITransport           &t,
         const std::vector<std::uint8_t> &key = {},
         frag::Reassembler::NowFn         now = {})
        : dir(fs::temp_directory_path() /
              ("clipsync-svc-" + tag + "-" + std::to_string(::getpid()))),
          trust((dir / "trusted_devices").string()),
          cipher(key.empty() ? std::nullopt : aead::GcmPskAead::from_key(key)),
          session(id,
                  envelope::Envelope(cipher ? &*cipher : nullptr, 256),
                  frag::DEFAULT_CHUNK,
                  30000ms,
                  std::move(now)),
          svc(t, clip, trust, session)
    {
        fs::remove_all(dir);
        trust.load();
        trust.set_consent(consent.consent_fn());
    }
    ~Peer()
    {
        consent.deny_all();
        svc.stop();
        fs::remove_all(dir);
    }

    bool start()
    {
        transport::Settings s;
        s.max_frame = frag::HDR_SIZE + frag::DEFAULT_CHUNK;
        return svc.start(s);
    }

    std::string clip_text()
    {
        auto c = clip.read_current();
        return c ? std::string(c->data.begin(), c->data.end()) : std::string();
    }

    fs::path                        dir;
    clip::MemoryClipboard           clip;
    app::TrustStore                 trust;
    app::PendingConsent             consent;
    std::optional<aead::GcmPskAead> cipher;
    app::Session                    session;
    app::ClipSyncService            svc;
};

std::vector<std::uint8_t> noise(std::size_t n, std::uint32_t seed)
{
    std::vector<std::uint8_t> v(n);
    for (auto &b : v)
    {
        seed = seed * 1103515245u + 12345u;
        b    = static_cast<std::uint8_t>(seed >> 16);
    }
    return v;
}

// Lets a test act between a write and the change notification it causes
class HookedClipboard final : public clip::IClipboard
{
  public:
    bool                          start() override { return true; }
    void                          stop() override {}
    std::optional<proto::Content> read_current() override { return current; }
    bool                          write(const proto::Content &content) override
    {
        current = content;
        if (before_notify)
            before_notify();
        if (on_change)
            on_change();
        return true;
    }
    void set_on_change(clip::OnChange cb) override { on_change = std::move(cb); }

    std::optional<proto::Content> current;
    std::function<void()>         before_notify;
    clip::OnChange                on_change;
};

// Plaintext single-frame text message as device `sender` would send it
transport::Frame text_frame(std::uint64_t sender, const std::string &text)
{
    const auto body = proto::encode_body(sender, proto::encode_content(proto::text_content(text)));
    auto frames = frag::make_frames(static_cast<std::uint8_t>(proto::ContentType::Text), 0, body,
                                    frag::DEFAULT_CHUNK);
    return frag::serialize(frames.at(0));
}

proto::Content text_of(const std::vector<std::uint8_t> &bytes)
{
    proto::Content c;
    c.type = proto::ContentType::Text;
    c.data = bytes;
    return c;
}

}  // namespace

TEST(Service, HelloIsOneFrame)
{
    RecordingTransport ta;
    Peer               a(ID_A, "hello", ta);
    ASSERT_TRUE(a.start());

    ASSERT_TRUE(a.svc.send_text("hello"));
    ASSERT_EQ(ta.frames.size(), 1u);
    const std::vector<std::uint8_t> want = {0x01, 0x01, 0x00, 0x00, 0x00, 0x01, 0x00, 0x0D,
                                            0x11, 0x22, 0x33, 0x44, 0x55, 0x66, 0x77, 0x88,
                                            'h',  'e',  'l',  'l',  'o'};
    EXPECT_EQ(ta.frames[0], want);
    EXPECT_EQ(a.svc.stats().messages_out, 1u);
    EXPECT_EQ(a.svc.stats().frames_out, 1u);
}

TEST(Service, CompressedEncryptedMultiFrame)
{
    const std::vector<std::uint8_t> key(32, 0x33);
    RecordingTransport              ta, tb;
    Peer                            a(ID_A, "multi-a", ta, key);
    Peer                            b(ID_B, "multi-b", tb, key);
    ASSERT_TRUE(a.start());
    ASSERT_TRUE(b.start());
    ASSERT_TRUE(b.trust.add(ID_A));

    const auto data = noise(500, 7);
    ASSERT_TRUE(a.svc.send_content(text_of(data)));

    std::vector<std::uint8_t> z;
    ASSERT_TRUE(envelope::deflate_raw(proto::encode_body(ID_A, data), z));
    const std::size_t wire   = aead::NONCE_SIZE + envelope::LEN_PREFIX + z.size() + aead::TAG_SIZE;
    const std::size_t frames = (wire + frag::DEFAULT_CHUNK - 1) / frag::DEFAULT_CHUNK;
    ASSERT_EQ(ta.frames.size(), frames);

    for (std::size_t i = 0; i < frames; ++i)
    {
        const bool last = i + 1 == frames;
        EXPECT_EQ(ta.frames[i][1], last ? 0x07 : 0x06) << "frame " << i;
        EXPECT_EQ(b.svc.handle_frame(ta.frames[i]), last ? Error::None : Error::Incomplete);
    }
    auto got = b.clip.read_current();
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->data, data);
}

TEST(Service, LinkedLoopbacksSyncClipboards)
{
    transport::LoopbackTransport ta, tb;
    transport::LoopbackTransport::link(ta, tb);
    Peer a(ID_A, "link-a", ta);
    Peer b(ID_B, "link-b", tb);
    ASSERT_TRUE(a.start());
    ASSERT_TRUE(b.start());
    ASSERT_TRUE(a.trust.add(ID_B));
    ASSERT_TRUE(b.trust.add(ID_A));

    a.clip.set_local(proto::text_content("copied on a"));
    EXPECT_EQ(b.clip_text(), "copied on a");
    EXPECT_EQ(b.clip.write_count(), 1u);
    // b applied it without sending it back
    EXPECT_EQ(a.clip.write_count(), 0u);
    EXPECT_EQ(b.svc.stats().messages_out, 0u);

    b.clip.set_local(proto::text_content("reply from b"));
    EXPECT_EQ(a.clip_text(), "reply from b");
}

TEST(Service, UntrustedSenderHeldUntilAllowed)
{
    RecordingTransport ta, tb;
    Peer               a(ID_A, "consent-a", ta);
    Peer               b(ID_B, "consent-b", tb);
    ASSERT_TRUE(a.start());
    ASSERT_TRUE(b.start());

    ASSERT_TRUE(a.svc.send_text("hi"));
    EXPECT_EQ(b.svc.handle_frame(ta.frames[0]), Error::UntrustedSender);
    EXPECT_EQ(b.clip.write_count(), 0u);
    EXPECT_EQ(b.consent.pending(), (std::vector<std::uint64_t>{ID_A}));

    ASSERT_TRUE(b.consent.resolve(ID_A, true));
    EXPECT_EQ(b.clip_text(), "hi");
    EXPECT_TRUE(b.trust.is_trusted(ID_A));
    EXPECT_EQ(b.svc.stats().delivered, 1u);

    // trusted from now on
    ASSERT_TRUE(a.svc.send_text("again"));
    EXPECT_EQ(b.svc.handle_frame(ta.frames[1]), Error::None);
    EXPECT_EQ(b.clip_text(), "again");
}

TEST(Service, UntrustedSenderDenied)
{
    RecordingTransport ta, tb;
    Peer               a(ID_A, "deny-a", ta);
    Peer               b(ID_B, "deny-b", tb);
    ASSERT_TRUE(a.start());
    ASSERT_TRUE(b.start());

    ASSERT_TRUE(a.svc.send_text("hi"));
    EXPECT_EQ(b.svc.handle_frame(ta.frames[0]), Error::UntrustedSender);
    ASSERT_TRUE(b.consent.resolve(ID_A, false));
    EXPECT_EQ(b.clip.write_count(), 0u);
    EXPECT_FALSE(b.trust.is_trusted(ID_A));
    EXPECT_EQ(b.svc.stats().dropped(Error::UntrustedSender), 1u);
}

TEST(Service, UntrustedSenderKeepsOnlyNewestMessage)
{
    RecordingTransport tb;
    Peer               b(ID_B, "newest", tb);
    ASSERT_TRUE(b.start());

    for (int i = 0; i < 5; ++i)
        EXPECT_EQ(b.svc.handle_frame(text_frame(ID_A, "msg" + std::to_string(i))),
                  Error::UntrustedSender);
    EXPECT_EQ(b.svc.held_messages(), 1u);
    EXPECT_EQ(b.consent.pending(), (std::vector<std::uint64_t>{ID_A}));
    EXPECT_EQ(b.svc.stats().dropped(Error::UntrustedSender), 4u);

    ASSERT_TRUE(b.consent.resolve(ID_A, true));
    EXPECT_EQ(b.clip.write_count(), 1u);
    EXPECT_EQ(b.clip_text(), "msg4");
    EXPECT_EQ(b.svc.held_messages(), 0u);
    EXPECT_EQ(b.svc.stats().delivered, 1u);
}

TEST(Service, HeldSendersAreBounded)
{
    RecordingTransport tb;
    Peer               b(ID_B, "bounded", tb);
    ASSERT_TRUE(b.start());

    for (std::uint64_t id = 1; id <= app::MAX_HELD_SENDERS + 2; ++id)
        EXPECT_EQ(b.svc.handle_frame(text_frame(id, "knock")), Error::UntrustedSender);
    EXPECT_EQ(b.svc.held_messages(), app::MAX_HELD_SENDERS);
    EXPECT_EQ(b.consent.pending().size(), app::MAX_HELD_SENDERS);
    EXPECT_EQ(b.svc.stats().dropped(Error::UntrustedSender), 2u);

    // answering one frees its slot
    ASSERT_TRUE(b.consent.resolve(1, false));
    EXPECT_EQ(b.svc.held_messages(), app::MAX_HELD_SENDERS - 1);
    EXPECT_EQ(b.svc.handle_frame(text_frame(0x99, "late")), Error::UntrustedSender);
    EXPECT_EQ(b.svc.held_messages(), app::MAX_HELD_SENDERS);
}

TEST(Service, AllowNextTrustsWithoutAsking)
{
    RecordingTransport ta, tb;
    Peer               a(ID_A, "grant-a", ta);
    Peer               b(ID_B, "grant-b", tb);
    ASSERT_TRUE(a.start());
    ASSERT_TRUE(b.start());
    b.trust.grant_next_unknown();

    ASSERT_TRUE(a.svc.send_text("hi"));
    EXPECT_EQ(b.svc.handle_frame(ta.frames[0]), Error::None);
    EXPECT_TRUE(b.trust.is_trusted(ID_A));
    EXPECT_TRUE(b.consent.pending().empty());
}

TEST(Service, OwnMessageIsDropped)
{
    transport::LoopbackTransport t;  // unlinked: frames come straight back
    Peer                         a(ID_A, "self", t);
    ASSERT_TRUE(a.start());

    ASSERT_TRUE(a.svc.send_text("me"));
    EXPECT_EQ(a.clip.write_count(), 0u);
    EXPECT_EQ(a.svc.stats().dropped(Error::SelfEcho), 1u);
    EXPECT_NE(a.svc.status_line().find("self-echo=1"), std::string::npos);
}

TEST(Service, TypeChangeDiscardsPartialText)
{
    RecordingTransport ta, tb;
    Peer               a(ID_A, "type-a", ta);
    Peer               b(ID_B, "type-b", tb);
    ASSERT_TRUE(a.start());
    ASSERT_TRUE(b.start());
    ASSERT_TRUE(b.trust.add(ID_A));

    ASSERT_TRUE(a.svc.send_content(text_of(noise(400, 3))));
    const std::size_t text_frames = ta.frames.size();
    ASSERT_GE(text_frames, 3u);

    proto::Content img;
    img.type = proto::ContentType::Image;
    img.data = {0x89, 'P', 'N', 'G'};
    ASSERT_TRUE(a.svc.send_content(img));
    ASSERT_EQ(ta.frames.size(), text_frames + 1);

    EXPECT_EQ(b.svc.handle_frame(ta.frames[0]), Error::Incomplete);
    EXPECT_EQ(b.svc.handle_frame(ta.frames[1]), Error::Incomplete);
    EXPECT_EQ(b.svc.handle_frame(ta.frames[text_frames]), Error::None);
    auto got = b.clip.read_current();
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->type, proto::ContentType::Image);

    // the rest of the text can no longer complete
    for (std::size_t i = 2; i < text_frames; ++i)
        EXPECT_EQ(b.svc.handle_frame(ta.frames[i]), Error::Incomplete);
    EXPECT_EQ(b.clip.write_count(), 1u);
}

TEST(Service, ReceivedContentIsNotEchoed)
{
    RecordingTransport ta, tb;
    Peer               a(ID_A, "echo-a", ta);
    Peer               b(ID_B, "echo-b", tb);
    ASSERT_TRUE(a.start());
    ASSERT_TRUE(b.start());
    ASSERT_TRUE(b.trust.add(ID_A));

    ASSERT_TRUE(a.svc.send_text("hello"));
    EXPECT_EQ(b.svc.handle_frame(ta.frames[0]), Error::None);
    // applying it fired a change notification; nothing went out
    EXPECT_TRUE(tb.frames.empty());

    // the user copies the same text again
    b.clip.set_local(proto::text_content("hello"));
    EXPECT_TRUE(tb.frames.empty());
    EXPECT_EQ(b.svc.stats().echo_skipped, 1u);

    b.clip.set_local(proto::text_content("something new"));
    EXPECT_EQ(tb.frames.size(), 1u);
}

TEST(Service, NoSendWithoutLink)
{
    RecordingTransport ta;
    ta.ready = false;
    Peer a(ID_A, "nolink", ta);
    ASSERT_TRUE(a.start());

    a.clip.set_local(proto::text_content("lonely"));
    EXPECT_TRUE(ta.frames.empty());
    EXPECT_NE(a.svc.status_line().find("link=down"), std::string::npos);
}

TEST(Service, IdlePartialEvictedOnTick)
{
    auto               now = std::make_shared<frag::Reassembler::Clock::time_point>();
    RecordingTransport ta, tb;
    Peer               a(ID_A, "idle-a", ta);
    Peer b(ID_B, "idle-b", tb, {}, [now] { return *now; });
    ASSERT_TRUE(a.start());
    ASSERT_TRUE(b.start());
    ASSERT_TRUE(b.trust.add(ID_A));

    ASSERT_TRUE(a.svc.send_content(text_of(noise(400, 5))));
    ASSERT_GE(ta.frames.size(), 3u);

    EXPECT_EQ(b.svc.handle_frame(ta.frames[0]), Error::Incomplete);
    *now += 31s;
    b.svc.tick();
    for (std::size_t i = 1; i < ta.frames.size(); ++i)
        EXPECT_EQ(b.svc.handle_frame(ta.frames[i]), Error::Incomplete);
    EXPECT_EQ(b.clip.write_count(), 0u);
}

TEST(Service, LinkDropClearsPartial)
{
    RecordingTransport ta, tb;
    Peer               a(ID_A, "drop-a", ta);
    Peer               b(ID_B, "drop-b", tb);
    ASSERT_TRUE(a.start());
    ASSERT_TRUE(b.start());
    ASSERT_TRUE(b.trust.add(ID_A));

    ASSERT_TRUE(a.svc.send_content(text_of(noise(400, 9))));
    EXPECT_EQ(b.svc.handle_frame(ta.frames[0]), Error::Incomplete);

    tb.ready = false;
    b.svc.tick();
    tb.ready = true;
    b.svc.tick();

    for (std::size_t i = 1; i < ta.frames.size(); ++i)
        EXPECT_EQ(b.svc.handle_frame(ta.frames[i]), Error::Incomplete);
}

TEST(Service, CancelStopsBeforeNextFrame)
{
    RecordingTransport ta;
    Peer               a(ID_A, "cancel", ta);
    a.svc.set_progress([&a](const std::string &, std::size_t sent, std::size_t) {
        if (sent == 1)
            a.svc.cancel_send();
    });
    ASSERT_TRUE(a.start());

    EXPECT_FALSE(a.svc.send_content(text_of(noise(2000, 11))));
    EXPECT_EQ(ta.frames.size(), 1u);
    EXPECT_EQ(a.svc.stats().messages_out, 0u);
    EXPECT_FALSE(a.svc.sending());

    // the next send is unaffected
    EXPECT_TRUE(a.svc.send_text("after"));
}

TEST(Service, WrongKeyIsDecryptError)
{
    RecordingTransport ta, tb, tc;
    Peer               a(ID_A, "key-a", ta, std::vector<std::uint8_t>(32, 0x01));
    Peer               b(ID_B, "key-b", tb, std::vector<std::uint8_t>(32, 0x02));
    Peer               c(0x42, "key-c", tc);
    ASSERT_TRUE(a.start());
    ASSERT_TRUE(b.start());
    ASSERT_TRUE(c.start());
    ASSERT_TRUE(b.trust.add(ID_A));
    ASSERT_TRUE(c.trust.add(ID_A));

    ASSERT_TRUE(a.svc.send_text("secret"));
    EXPECT_EQ(b.svc.handle_frame(ta.frames[0]), Error::DecryptError);
    EXPECT_EQ(c.svc.handle_frame(ta.frames[0]), Error::DecryptError);
    EXPECT_EQ(b.svc.stats().dropped(Error::DecryptError), 1u);
    EXPECT_EQ(b.clip.write_count(), 0u);
}

TEST(Service, MalformedFrameCounted)
{
    RecordingTransport tb;
    Peer               b(ID_B, "malformed", tb);
    ASSERT_TRUE(b.start());

    EXPECT_EQ(b.svc.handle_frame({0x01, 0x01, 0x00}), Error::MalformedFrame);
    // complete frame, body shorter than a sender id
    EXPECT_EQ(b.svc.handle_frame({0x01, 0x01, 0x00, 0x00, 0x00, 0x01, 0x00, 0x02, 'h', 'i'}),
              Error::MalformedBody);
    EXPECT_EQ(b.svc.stats().dropped(Error::MalformedFrame), 1u);
    EXPECT_EQ(b.svc.stats().dropped(Error::MalformedBody), 1u);
}

TEST(Service, ClipboardFailureReported)
{
    RecordingTransport ta, tb;
    Peer               a(ID_A, "clipfail-a", ta);
    Peer               b(ID_B, "clipfail-b", tb);
    ASSERT_TRUE(a.start());
    ASSERT_TRUE(b.start());
    ASSERT_TRUE(b.trust.add(ID_A));
    b.clip.set_fail_writes(true);

    ASSERT_TRUE(a.svc.send_text("nope"));
    EXPECT_EQ(b.svc.handle_frame(ta.frames[0]), Error::ClipboardError);
    EXPECT_EQ(b.svc.stats().dropped(Error::ClipboardError), 1u);
    EXPECT_EQ(b.svc.stats().delivered, 0u);
}

TEST(Service, SendFileCarriesName)
{
    RecordingTransport ta, tb;
    Peer               a(ID_A, "file-a", ta);
    Peer               b(ID_B, "file-b", tb);
    ASSERT_TRUE(a.start());
    ASSERT_TRUE(b.start());
    ASSERT_TRUE(b.trust.add(ID_A));

    fs::create_directories(a.dir);
    const auto path = a.dir / "notes.txt";
    {
        std::ofstream out(path, std::ios::binary);
        out << "abc";
    }
    ASSERT_TRUE(a.svc.send_file(path.string()));
    EXPECT_EQ(ta.frames[0][0], 3);  // file

    for (const auto &f : ta.frames)
        b.svc.handle_frame(f);
    auto got = b.clip.read_current();
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->type, proto::ContentType::File);
    EXPECT_EQ(got->file_name, "notes.txt");
    EXPECT_EQ(got->data, (std::vector<std::uint8_t>{'a', 'b', 'c'}));

    EXPECT_FALSE(a.svc.send_file((a.dir / "missing").string()));
}

TEST(Service, StatusLineSummary)
{
    RecordingTransport ta;
    Peer               a(ID_A, "status", ta, std::vector<std::uint8_t>(16, 0x01));
    ASSERT_TRUE(a.start());
    ASSERT_TRUE(a.svc.send_text("x"));

    const auto line = a.svc.status_line();
    EXPECT_NE(line.find("id=1122334455667788"), std::string::npos);
    EXPECT_NE(line.find("transport=recording"), std::string::npos);
    EXPECT_NE(line.find("link=up"), std::string::npos);
    EXPECT_NE(line.find("key=psk"), std::string::npos);
    EXPECT_NE(line.find("sent=1/1"), std::string::npos);
}

TEST(Service, WriteNotificationNeverSendsFromReceivePath)
{
    const fs::path dir =
        fs::temp_directory_path() / ("clipsync-svc-hooked-" + std::to_string(::getpid()));
    fs::remove_all(dir);

    RecordingTransport tb;
    HookedClipboard    clip;
    app::TrustStore    trust((dir / "trusted_devices").string());
    ASSERT_TRUE(trust.add(ID_A));
    app::Session         session(ID_B, envelope::Envelope(nullptr, 256), frag::DEFAULT_CHUNK,
                                 30000ms);
    app::ClipSyncService svc(tb, clip, trust, session);
    transport::Settings  s;
    ASSERT_TRUE(svc.start(s));

    // another watcher takes the ignore flag and the user copies something while we write
    clip.before_notify = [&] {
        session.loop_guard().consume_ignore_flag();
        clip.current = proto::text_content("user copy");
    };
    EXPECT_EQ(svc.handle_frame(text_frame(ID_A, "from a")), Error::None);
    EXPECT_TRUE(tb.frames.empty());

    // the user's copy goes out on the next change seen outside the receive path
    clip.before_notify = nullptr;
    clip.on_change();
    ASSERT_EQ(tb.frames.size(), 1u);
    auto f = frag::parse(tb.frames[0]);
    ASSERT_TRUE(f.has_value());
    auto body = proto::decode_body(f->payload);
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ(std::string(body->content.begin(), body->content.end()), "user copy");

    svc.stop();
    fs::remove_all(dir);
}
