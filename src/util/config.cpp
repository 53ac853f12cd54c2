#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

#include "util/config.hpp"
#include "util/log.hpp"

namespace config
{

static std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parse_u32_in_range(const char *s, std::uint32_t lo, std::uint32_t hi, std::uint32_t &out)
{
    if (!s || !*s)
        return false;
    char         *p = nullptr;
    unsigned long v = std::strtoul(s, &p, 10);
    if (!p || *p != '\0' || v < lo || v > hi)
        return false;
    out = static_cast<std::uint32_t>(v);
    return true;
}

const char *backend_name(Backend b)
{
    return b == Backend::Bluez ? "bluez" : "sim";
}

const char *selection_mode_name(SelectionMode m)
{
    return m == SelectionMode::Interactive ? "interactive" : "first";
}

DaemonConfig load_config_from_env()
{
    DaemonConfig cfg;

    if (const char *b = std::getenv("WEBBLE_BACKEND"))
    {
        std::string v = lower(b);
        if (v == "bluez")
            cfg.backend = Backend::Bluez;
        else if (v == "sim")
            cfg.backend = Backend::Sim;
        else
            LOG_WARN("Ignoring invalid WEBBLE_BACKEND='%s' (expect sim|bluez)", b);
    }

    if (const char *a = std::getenv("WEBBLE_ADAPTER"); a && *a)
        cfg.adapter = a;

    if (const char *s = std::getenv("WEBBLE_CTL_SOCK"); s && *s)
        cfg.ctl_sock = s;

    if (const char *m = std::getenv("WEBBLE_SELECTION"))
    {
        std::string v = lower(m);
        if (v == "interactive")
            cfg.selection = SelectionMode::Interactive;
        else if (v == "first")
            cfg.selection = SelectionMode::FirstMatch;
        else
            LOG_WARN("Ignoring invalid WEBBLE_SELECTION='%s' (expect first|interactive)", m);
    }

    if (const char *e = std::getenv("WEBBLE_SELECTION_TIMEOUT_MS"))
    {
        if (!parse_u32_in_range(e, 1, 600000, cfg.selection_timeout_ms))
            LOG_WARN("Ignoring invalid WEBBLE_SELECTION_TIMEOUT_MS='%s' (expect 1..600000)", e);
    }

    if (const char *e = std::getenv("WEBBLE_FULL_SCAN"))
    {
        if (std::string(e) == "0")
            cfg.full_scan = false;
        else if (std::string(e) == "1")
            cfg.full_scan = true;
        else
            LOG_WARN("Ignoring invalid WEBBLE_FULL_SCAN='%s' (expect 0|1)", e);
    }

    if (const char *e = std::getenv("WEBBLE_SCAN_POLL_MS"))
    {
        if (!parse_u32_in_range(e, 10, 5000, cfg.scan_poll_ms))
            LOG_WARN("Ignoring invalid WEBBLE_SCAN_POLL_MS='%s' (expect 10..5000)", e);
    }

    return cfg;
}

}  // namespace config
