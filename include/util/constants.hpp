#pragma once
#include <cstddef>
#include <cstdlib>
#include <string>
#include <string_view>

#include "util/log.hpp"

namespace constants
{
// GATT layout shared with the macOS/Windows peers
inline constexpr std::string_view SVC_UUID    = "a1b2c3d4-0000-1000-8000-00805f9b34fb";
inline constexpr std::string_view NOTIFY_UUID = "a1b2c3d4-0001-1000-8000-00805f9b34fb";  // our TX
inline constexpr std::string_view WRITE_UUID  = "a1b2c3d4-0002-1000-8000-00805f9b34fb";  // our RX
inline constexpr std::string_view LOCAL_NAME  = "BLEClipboardSync";

inline constexpr std::string_view DEVICE_ID_FILE = "device_id";
inline constexpr std::string_view TRUST_FILE     = "trusted_devices";

// Control socket path (Unix domain socket)
[[maybe_unused]] static std::string ctl_sock_path()
{
    if (const char *p = std::getenv("CLIPSYNC_CTL_SOCK"); p && *p)
    {
        return std::string(p);
    }
    const char *home = std::getenv("HOME");
    std::string base = home && *home ? std::string(home) : "/tmp";
    std::string sock_path = base + "/.cache/clipsync/ctl.sock";
    LOG_DEBUG("Control socket defaults to %s", sock_path.c_str());
    return sock_path;
}

// Directory holding the device identity and the trust store
[[maybe_unused]] static std::string state_dir()
{
    if (const char *p = std::getenv("CLIPSYNC_STATE_DIR"); p && *p)
        return std::string(p);
    if (const char *x = std::getenv("XDG_DATA_HOME"); x && *x)
        return std::string(x) + "/clipsync";
    const char *home = std::getenv("HOME");
    std::string base = home && *home ? std::string(home) : "/tmp";
    return base + "/.local/share/clipsync";
}

}  // namespace constants
