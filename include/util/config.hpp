#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace config
{

inline constexpr std::size_t DEFAULT_COMPRESS_THRESHOLD = 256;
inline constexpr std::size_t DEFAULT_CHUNK_SIZE         = 180;
inline constexpr std::size_t MIN_CHUNK_SIZE             = 20;
inline constexpr std::size_t MAX_CHUNK_SIZE             = 504;  // 512-byte ATT value - header
inline constexpr std::uint32_t DEFAULT_REASM_TIMEOUT_MS = 30000;

struct Config
{
    std::string   log_level = "info";
    std::size_t   compress_threshold = DEFAULT_COMPRESS_THRESHOLD;
    std::size_t   chunk_size         = DEFAULT_CHUNK_SIZE;
    std::uint32_t reasm_timeout_ms   = DEFAULT_REASM_TIMEOUT_MS;
    std::string   transport          = "loopback";  // "loopback" | "bluez"
    std::string   adapter            = "hci0";
    std::uint32_t tx_pause_ms        = 8;
    std::string   clipboard          = "memory";  // "memory" | "wayland"
    std::uint32_t poll_ms            = 800;
    std::string   state_dir;
    std::string   recv_dir;
    std::string   ctl_sock;

    // Reads CLIPSYNC_* variables; invalid values keep the default and log a warning.
    static Config from_env();
};

// Strict decimal parse of [lo, hi]; nullopt on junk or out of range
std::optional<std::uint64_t> parse_uint(const char *s, std::uint64_t lo, std::uint64_t hi);

}  // namespace config
