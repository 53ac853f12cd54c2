#pragma once
#include <cstdint>
#include <string>

#include "util/constants.hpp"

namespace config
{

enum class Backend
{
    Sim,
    Bluez
};

enum class SelectionMode
{
    FirstMatch,
    Interactive
};

struct DaemonConfig
{
    Backend       backend              = Backend::Sim;
    std::string   adapter              = std::string(constants::DEFAULT_ADAPTER);
    std::string   ctl_sock;  // empty => constants::ctl_sock_path()
    SelectionMode selection            = SelectionMode::FirstMatch;
    std::uint32_t selection_timeout_ms = constants::DEFAULT_SELECTION_TIMEOUT_MS;
    bool          full_scan            = true;  // interactive selection only
    std::uint32_t scan_poll_ms         = constants::DEFAULT_SCAN_POLL_MS;
};

// Reads WEBBLE_* variables; invalid values are logged and replaced by defaults.
DaemonConfig load_config_from_env();

// Parses a decimal in [lo, hi]; false leaves `out` untouched.
bool parse_u32_in_range(const char *s, std::uint32_t lo, std::uint32_t hi, std::uint32_t &out);

const char *backend_name(Backend b);
const char *selection_mode_name(SelectionMode m);

}  // namespace config
