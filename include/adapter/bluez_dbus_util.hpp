// include/adapter/bluez_dbus_util.hpp
#pragma once
#include <cctype>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#if WEBBLE_HAVE_SDBUS
#include <systemd/sd-bus.h>
#endif

namespace adapter
{

static inline std::string lower(std::string s)
{
    for (auto &c : s)
        c = (char)std::tolower((unsigned char)c);
    return s;
}

static inline bool path_under(const std::string &path, const std::string &parent)
{
    return path.size() > parent.size() + 1 && path.compare(0, parent.size(), parent) == 0 &&
           path[parent.size()] == '/';
}

[[maybe_unused]] static inline std::string mac_from_path(const std::string &obj_path)
{
    // DBus path "/org/bluez/hci0/dev_XX_YY_ZZ" -> "XX:YY:ZZ"
    auto pos = obj_path.rfind("/dev_");
    if (pos == std::string::npos)
        return "";
    std::string tail = obj_path.substr(pos + 5);
    for (auto &c : tail)
        if (c == '_')
            c = ':';
    return tail;
}

// "/org/bluez/hci0/dev_AA_BB/service000a/char000b" -> "/org/bluez/hci0/dev_AA_BB"
[[maybe_unused]] static inline std::string device_path_of(const std::string &obj_path)
{
    auto pos = obj_path.find("/dev_");
    if (pos == std::string::npos)
        return "";
    auto end = obj_path.find('/', pos + 1);
    return end == std::string::npos ? obj_path : obj_path.substr(0, end);
}

// Snapshot of the org.bluez object tree below one adapter
struct DeviceInfo
{
    std::string                 address;
    std::optional<std::string>  name;
    std::vector<std::string>    uuids;
    std::optional<std::int16_t> rssi;
    bool                        connected         = false;
    bool                        services_resolved = false;
};

struct ServiceInfo
{
    std::string uuid;
    bool        primary = true;
    std::string device;  // object path
};

struct CharInfo
{
    std::string              uuid;
    std::string              service;  // object path
    std::vector<std::string> flags;
};

struct DescInfo
{
    std::string uuid;
    std::string characteristic;  // object path
};

struct ObjectTree
{
    bool                               adapter_present = false;
    bool                               powered         = false;
    std::map<std::string, DeviceInfo>  devices;
    std::map<std::string, ServiceInfo> services;
    std::map<std::string, CharInfo>    chars;
    std::map<std::string, DescInfo>    descs;
};

// GattCharacteristic1.Flags -> CharProp bits
std::uint32_t flags_to_props(const std::vector<std::string> &flags);

#if WEBBLE_HAVE_SDBUS
[[maybe_unused]] static inline int read_var_s(sd_bus_message *m, const char *sig, std::string &out)
{
    // read variant "s" or "o"
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, sig);
    if (r < 0)
        return r;
    const char *s = nullptr;
    r             = sd_bus_message_read(m, sig, &s);
    if (r >= 0 && s)
        out = s;
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_b(sd_bus_message *m, bool &out)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "b");
    if (r < 0)
        return r;
    int b = 0;
    r     = sd_bus_message_read(m, "b", &b);
    out   = b != 0;
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_i16(sd_bus_message *m, int16_t &out)
{
    // read variant "n" (int16)
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "n");
    if (r < 0)
        return r;
    r      = sd_bus_message_read(m, "n", &out);
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_as(sd_bus_message *m, std::vector<std::string> &out)
{
    out.clear();
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "as");
    if (r < 0)
        return r;
    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "s");
    if (r < 0)
        return r;
    while (true)
    {
        const char *u  = nullptr;
        int         rr = sd_bus_message_read_basic(m, 's', &u);
        if (rr < 0)
            return rr;
        if (rr == 0)
            break;
        if (u)
            out.emplace_back(u);
    }
    int r1 = sd_bus_message_exit_container(m);
    int r2 = sd_bus_message_exit_container(m);
    return (r1 < 0 || r2 < 0) ? -1 : 0;
}

[[maybe_unused]] static inline int read_var_ay(sd_bus_message *m, std::vector<std::uint8_t> &out)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "ay");
    if (r < 0)
        return r;
    const void *buf = nullptr;
    size_t      len = 0;
    r               = sd_bus_message_read_array(m, 'y', &buf, &len);
    if (r >= 0)
    {
        const auto *p = static_cast<const std::uint8_t *>(buf);
        out.assign(p, p + len);
    }
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

// Walks one a{sv}. on_key(key) consumes the variant and returns 1, returns
// 0 to have it skipped, or a negative errno.
template <typename F>
int read_props(sd_bus_message *m, F &&on_key)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        if ((r = sd_bus_message_read(m, "s", &key)) < 0)
            return r;
        r = key ? on_key(std::string(key)) : 0;
        if (r < 0)
            return r;
        if (r == 0 && (r = sd_bus_message_skip(m, "v")) < 0)
            return r;
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    return sd_bus_message_exit_container(m);
}

static inline int consumed(int r)
{
    return r < 0 ? r : 1;
}

// Reads the a{sa{sv}} interface map of object `path` into `tree`.
// Objects outside `adapter_path` are skipped.
int parse_interfaces(sd_bus_message    *m,
                     const std::string &path,
                     const std::string &adapter_path,
                     ObjectTree        &tree);

// Walks a GetManagedObjects reply: a{oa{sa{sv}}}
int parse_managed_objects(sd_bus_message *reply, const std::string &adapter_path, ObjectTree &tree);

// Appends the a{sv} options map of Read/WriteValue: offset=0 and, when
// given, type="request"|"command"
int append_gatt_options(sd_bus_message *msg, const char *write_type);
#endif

}  // namespace adapter
