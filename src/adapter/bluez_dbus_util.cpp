#include <cerrno>
#include <cstring>
#include <string>

#include "adapter/bluez_dbus_util.hpp"
#include "adapter/iadapter.hpp"

namespace adapter
{

std::uint32_t flags_to_props(const std::vector<std::string> &flags)
{
    static const std::map<std::string, std::uint32_t> table = {
        {"broadcast", PROP_BROADCAST},
        {"read", PROP_READ},
        {"write-without-response", PROP_WRITE_WITHOUT_RESPONSE},
        {"write", PROP_WRITE},
        {"notify", PROP_NOTIFY},
        {"indicate", PROP_INDICATE},
        {"authenticated-signed-writes", PROP_AUTHENTICATED_SIGNED_WRITES},
        {"extended-properties", PROP_EXTENDED_PROPERTIES},
        {"reliable-write", PROP_RELIABLE_WRITE},
        {"writable-auxiliaries", PROP_WRITABLE_AUXILIARIES},
    };
    std::uint32_t bits = 0;
    for (const auto &f : flags)
    {
        auto it = table.find(f);
        if (it != table.end())
            bits |= it->second;
    }
    return bits;
}

#if WEBBLE_HAVE_SDBUS

// ======================================================================
// Function: parse_interfaces
// - In: message positioned at a{sa{sv}} of object `path`
// - Out: fills the matching entry of `tree` (Adapter1, Device1, GattService1,
//        GattCharacteristic1, GattDescriptor1), skips anything else
// ======================================================================
int parse_interfaces(sd_bus_message    *m,
                     const std::string &path,
                     const std::string &adapter_path,
                     ObjectTree        &tree)
{
    const bool is_adapter = path == adapter_path;
    const bool below      = path_under(path, adapter_path);
    if (!is_adapter && !below)
        return sd_bus_message_skip(m, "a{sa{sv}}");

    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sa{sv}}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
    {
        const char *iface = nullptr;
        if ((r = sd_bus_message_read(m, "s", &iface)) < 0)
            return r;
        const std::string i = iface ? iface : "";

        if (is_adapter && i == "org.bluez.Adapter1")
        {
            tree.adapter_present = true;
            r = read_props(m, [&](const std::string &k) {
                if (k == "Powered")
                    return consumed(read_var_b(m, tree.powered));
                return 0;
            });
        }
        else if (below && i == "org.bluez.Device1")
        {
            DeviceInfo &d = tree.devices[path];
            r             = read_props(m, [&](const std::string &k) {
                if (k == "Address")
                    return consumed(read_var_s(m, "s", d.address));
                if (k == "Name")
                {
                    std::string n;
                    int         rr = read_var_s(m, "s", n);
                    d.name         = n;
                    return consumed(rr);
                }
                if (k == "UUIDs")
                    return consumed(read_var_as(m, d.uuids));
                if (k == "RSSI")
                {
                    int16_t v  = 0;
                    int     rr = read_var_i16(m, v);
                    d.rssi     = v;
                    return consumed(rr);
                }
                if (k == "Connected")
                    return consumed(read_var_b(m, d.connected));
                if (k == "ServicesResolved")
                    return consumed(read_var_b(m, d.services_resolved));
                return 0;
            });
        }
        else if (below && i == "org.bluez.GattService1")
        {
            ServiceInfo &s = tree.services[path];
            r              = read_props(m, [&](const std::string &k) {
                if (k == "UUID")
                    return consumed(read_var_s(m, "s", s.uuid));
                if (k == "Primary")
                    return consumed(read_var_b(m, s.primary));
                if (k == "Device")
                    return consumed(read_var_s(m, "o", s.device));
                return 0;
            });
        }
        else if (below && i == "org.bluez.GattCharacteristic1")
        {
            CharInfo &c = tree.chars[path];
            r           = read_props(m, [&](const std::string &k) {
                if (k == "UUID")
                    return consumed(read_var_s(m, "s", c.uuid));
                if (k == "Service")
                    return consumed(read_var_s(m, "o", c.service));
                if (k == "Flags")
                    return consumed(read_var_as(m, c.flags));
                return 0;
            });
        }
        else if (below && i == "org.bluez.GattDescriptor1")
        {
            DescInfo &d = tree.descs[path];
            r           = read_props(m, [&](const std::string &k) {
                if (k == "UUID")
                    return consumed(read_var_s(m, "s", d.uuid));
                if (k == "Characteristic")
                    return consumed(read_var_s(m, "o", d.characteristic));
                return 0;
            });
        }
        else
        {
            r = sd_bus_message_skip(m, "a{sv}");
        }
        if (r < 0)
            return r;

        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;  // {sa{sv}} dict-entry
    }
    if (r < 0)
        return r;
    return sd_bus_message_exit_container(m);  // a{sa{sv}}
}

int parse_managed_objects(sd_bus_message *reply, const std::string &adapter_path, ObjectTree &tree)
{
    // Hierarchy:
    // Object path (o)
    // |- Interfaces (a{sa{sv}})
    //     |- Properties ({sv})
    int r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{oa{sa{sv}}}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "oa{sa{sv}}")) > 0)
    {
        const char *obj = nullptr;
        if ((r = sd_bus_message_read(reply, "o", &obj)) < 0)
            return r;
        if (!obj)
            return -EINVAL;
        if ((r = parse_interfaces(reply, obj, adapter_path, tree)) < 0)
            return r;
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    return sd_bus_message_exit_container(reply);
}

int append_gatt_options(sd_bus_message *msg, const char *write_type)
{
    int r = sd_bus_message_open_container(msg, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;
    if (write_type)
    {
        // "type" -> "request" (ATT Write Request) or "command" (Write Command)
        r = sd_bus_message_append(msg, "{sv}", "type", "s", write_type);
        if (r < 0)
            return r;
    }
    r = sd_bus_message_append(msg, "{sv}", "offset", "q", (uint16_t)0);
    if (r < 0)
        return r;
    return sd_bus_message_close_container(msg);
}
#endif

}  // namespace adapter
