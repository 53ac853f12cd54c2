#include <string>

#include "gatt/models.hpp"
#include "gatt/uuid.hpp"
#include "util/log.hpp"

namespace gatt
{

static webble::Status normalize_all(std::vector<std::string> &uuids)
{
    for (auto &u : uuids)
    {
        std::string n;
        webble::Status st = normalize_uuid(u, n);
        if (!st.ok())
            return st;
        u = n;
    }
    return webble::Status::Ok();
}

webble::Status validate_options(RequestDeviceOptions &opts)
{
    if (!opts.accept_all_devices && opts.filters.empty())
        return webble::Status::invalid_request(
            "Either acceptAllDevices must be true or at least one filter must be given");
    if (opts.scan_timeout.count() <= 0)
        return webble::Status::invalid_request("scanTimeout must be at least 1 ms");

    for (auto &f : opts.filters)
    {
        webble::Status st = normalize_all(f.services);
        if (!st.ok())
            return st;
    }
    return normalize_all(opts.optional_services);
}

webble::Status describe(adapter::IPeripheral &p, DeviceDescriptor &out)
{
    adapter::PeripheralProperties props;
    webble::Status                st = p.properties(props);
    if (!st.ok())
        return st;

    out      = DeviceDescriptor{};
    out.id   = p.id();
    out.name = props.local_name;
    for (const auto &u : props.services)
    {
        std::string n;
        if (normalize_uuid(u, n).ok())
            out.uuids.push_back(n);
        else
            LOG_DEBUG("%s advertises malformed uuid '%s'", out.id.c_str(), u.c_str());
    }
    out.connected = p.is_connected();
    return webble::Status::Ok();
}

CharacteristicProperties to_properties(std::uint32_t bits)
{
    CharacteristicProperties p;
    p.broadcast                   = bits & adapter::PROP_BROADCAST;
    p.read                        = bits & adapter::PROP_READ;
    p.write_without_response      = bits & adapter::PROP_WRITE_WITHOUT_RESPONSE;
    p.write                       = bits & adapter::PROP_WRITE;
    p.notify                      = bits & adapter::PROP_NOTIFY;
    p.indicate                    = bits & adapter::PROP_INDICATE;
    p.authenticated_signed_writes = bits & adapter::PROP_AUTHENTICATED_SIGNED_WRITES;
    p.reliable_write              = bits & adapter::PROP_RELIABLE_WRITE;
    p.writable_auxiliaries        = bits & adapter::PROP_WRITABLE_AUXILIARIES;
    return p;
}

static std::string canon(const std::string &u)
{
    std::string n;
    return normalize_uuid(u, n).ok() ? n : u;
}

BluetoothCharacteristic to_view(const adapter::Characteristic &c)
{
    BluetoothCharacteristic v;
    v.uuid         = canon(c.uuid);
    v.service_uuid = canon(c.service_uuid);
    v.properties   = to_properties(c.properties);
    for (const auto &d : c.descriptors)
        v.descriptors.push_back(BluetoothDescriptor{canon(d.uuid)});
    return v;
}

BluetoothService to_view(const adapter::Service &s)
{
    BluetoothService v;
    v.uuid       = canon(s.uuid);
    v.is_primary = s.primary;
    for (const auto &c : s.characteristics)
    {
        v.characteristics.push_back(to_view(c));
        v.characteristics.back().service_uuid = v.uuid;
    }
    return v;
}

// ---------------- rendering ----------------
static std::string join(const std::vector<std::string> &xs, char sep)
{
    std::string r;
    for (size_t i = 0; i < xs.size(); ++i)
    {
        if (i)
            r += sep;
        r += xs[i];
    }
    return r;
}

static std::string flags(const CharacteristicProperties &p)
{
    std::vector<std::string> f;
    if (p.broadcast)
        f.push_back("broadcast");
    if (p.read)
        f.push_back("read");
    if (p.write_without_response)
        f.push_back("writeWithoutResponse");
    if (p.write)
        f.push_back("write");
    if (p.notify)
        f.push_back("notify");
    if (p.indicate)
        f.push_back("indicate");
    if (p.authenticated_signed_writes)
        f.push_back("authenticatedSignedWrites");
    if (p.reliable_write)
        f.push_back("reliableWrite");
    if (p.writable_auxiliaries)
        f.push_back("writableAuxiliaries");
    return join(f, '|');
}

std::string render(const DeviceDescriptor &d)
{
    std::string r = "{id=" + d.id;
    if (d.name)
        r += " name=\"" + *d.name + "\"";
    r += " services=" + join(d.uuids, ',');
    r += d.connected ? " connected=1}" : " connected=0}";
    return r;
}

std::string render(const std::vector<DeviceDescriptor> &ds)
{
    std::string r = "[";
    for (size_t i = 0; i < ds.size(); ++i)
    {
        if (i)
            r += ' ';
        r += render(ds[i]);
    }
    return r + "]";
}

std::string render(const BluetoothCharacteristic &c)
{
    std::vector<std::string> ds;
    for (const auto &d : c.descriptors)
        ds.push_back(d.uuid);
    return "{uuid=" + c.uuid + " service=" + c.service_uuid + " props=" + flags(c.properties) +
           " descriptors=" + join(ds, ',') + "}";
}

std::string render(const BluetoothService &s)
{
    std::string r = "{uuid=" + s.uuid + (s.is_primary ? " primary=1" : " primary=0") + " chars=[";
    for (size_t i = 0; i < s.characteristics.size(); ++i)
    {
        if (i)
            r += ' ';
        r += render(s.characteristics[i]);
    }
    return r + "]}";
}

std::string render(const GattServerInfo &g)
{
    std::string r = "{device=" + g.device_id + (g.connected ? " connected=1" : " connected=0") +
                    " services=[";
    for (size_t i = 0; i < g.services.size(); ++i)
    {
        if (i)
            r += ' ';
        r += render(g.services[i]);
    }
    return r + "]}";
}

}  // namespace gatt
