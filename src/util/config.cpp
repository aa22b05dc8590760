#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <string>

#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace config
{

std::optional<std::uint64_t> parse_uint(const char *s, std::uint64_t lo, std::uint64_t hi)
{
    if (!s || !*s || *s == '-' || *s == '+')
        return std::nullopt;
    char *end = nullptr;
    errno     = 0;
    unsigned long long v = std::strtoull(s, &end, 10);
    if (errno != 0 || !end || *end != '\0')
        return std::nullopt;
    if (v < lo || v > hi)
        return std::nullopt;
    return static_cast<std::uint64_t>(v);
}

namespace
{

template <typename T>
void read_uint(const char *var, T &dst, std::uint64_t lo, std::uint64_t hi)
{
    const char *e = std::getenv(var);
    if (!e)
        return;
    if (auto v = parse_uint(e, lo, hi))
    {
        dst = static_cast<T>(*v);
        return;
    }
    LOG_WARN("Ignoring invalid %s='%s' (expect %llu..%llu)", var, e, (unsigned long long)lo,
             (unsigned long long)hi);
}

void read_choice(const char *var, std::string &dst, const char *a, const char *b)
{
    const char *e = std::getenv(var);
    if (!e)
        return;
    std::string v(e);
    for (auto &c : v)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (v == a || v == b)
    {
        dst = v;
        return;
    }
    LOG_WARN("Ignoring invalid %s='%s' (expect %s|%s)", var, e, a, b);
}

}  // namespace

Config Config::from_env()
{
    Config c;
    if (const char *lv = std::getenv("CLIPSYNC_LOG_LEVEL"); lv && *lv)
    {
        if (clipsync::parse_log_level(lv))
            c.log_level = lv;
        else
            LOG_WARN("CLIPSYNC_LOG_LEVEL=%s is not a level, using %s", lv, c.log_level.c_str());
    }

    read_uint("CLIPSYNC_COMPRESS_THRESHOLD", c.compress_threshold, 0, UINT32_MAX);
    read_uint("CLIPSYNC_CHUNK_SIZE", c.chunk_size, MIN_CHUNK_SIZE, MAX_CHUNK_SIZE);
    read_uint("CLIPSYNC_REASM_TIMEOUT_MS", c.reasm_timeout_ms, 0, 24u * 3600u * 1000u);
    read_choice("CLIPSYNC_TRANSPORT", c.transport, "loopback", "bluez");
    if (const char *a = std::getenv("CLIPSYNC_ADAPTER"); a && *a)
        c.adapter = a;
    read_uint("CLIPSYNC_TX_PAUSE_MS", c.tx_pause_ms, 0, 1000);
    read_choice("CLIPSYNC_CLIPBOARD", c.clipboard, "memory", "wayland");
    read_uint("CLIPSYNC_POLL_MS", c.poll_ms, 50, 60000);

    c.state_dir = constants::state_dir();
    if (const char *r = std::getenv("CLIPSYNC_RECV_DIR"); r && *r)
        c.recv_dir = r;
    else
        c.recv_dir = c.state_dir + "/received";
    c.ctl_sock = constants::ctl_sock_path();
    return c;
}

}  // namespace config
