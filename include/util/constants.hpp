#pragma once
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

#include "util/log.hpp"

namespace constants
{
// Bluetooth SIG base UUID; short forms replace the leading 32 bits
inline constexpr std::string_view BASE_UUID_SUFFIX = "-0000-1000-8000-00805f9b34fb";

// Event names published toward the host application
inline constexpr std::string_view EVENT_NOTIFICATION      = "web-bluetooth://characteristic-value-changed";
inline constexpr std::string_view EVENT_GATT_DISCONNECTED = "web-bluetooth://gattserver-disconnected";
inline constexpr std::string_view EVENT_SELECTION_UPDATED = "web-bluetooth://device-selection-updated";

// Timing defaults (milliseconds)
inline constexpr std::uint32_t DEFAULT_SCAN_TIMEOUT_MS      = 10000;
inline constexpr std::uint32_t DEFAULT_SELECTION_TIMEOUT_MS = 30000;
inline constexpr std::uint32_t DEFAULT_SCAN_POLL_MS         = 200;

inline constexpr std::string_view DEFAULT_ADAPTER = "hci0";

// Control socket path (Unix domain socket)
[[maybe_unused]] static std::string ctl_sock_path()
{
    if (const char *p = std::getenv("WEBBLE_CTL_SOCK"); p && *p)
    {
        return std::string(p);
    }
    const char *home      = std::getenv("HOME");
    std::string base      = home && *home ? std::string(home) : "/tmp";
    std::string sock_path = base + "/.cache/webble/ctl.sock";
    LOG_DEBUG("Control socket defaults to %s", sock_path.c_str());
    return sock_path;
}

}  // namespace constants
