#include <chrono>
#include <cstring>
#include <string>
#include <thread>

// clang-format off
#include "adapter/bluez_peripheral.hpp"
#include "adapter/bluez_impl.hpp"
#include "util/log.hpp"
// clang-format on

#include <systemd/sd-bus.h>

namespace adapter
{

namespace
{

constexpr auto SERVICES_RESOLVE_TIMEOUT = std::chrono::seconds(15);
constexpr auto SERVICES_RESOLVE_POLL    = std::chrono::milliseconds(250);

// Runs fn(bus) under bus_mu while the adapter is alive
template <typename F>
webble::Status with_bus(const std::weak_ptr<BluezImpl> &w, F &&fn)
{
    auto impl = w.lock();
    if (!impl)
        return webble::Status::adapter_error("BlueZ adapter is closed");
    std::lock_guard<std::mutex> lk(impl->bus_mu);
    if (!impl->bus)
        return webble::Status::adapter_error("BlueZ bus is closed");
    return fn(impl->bus);
}

// Argument-less method call; AlreadyConnected-style replies are passed in `benign`
webble::Status call_simple(sd_bus            *bus,
                           const std::string &path,
                           const char        *iface,
                           const char        *method,
                           const char        *benign = nullptr)
{
    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(bus, "org.bluez", path.c_str(), iface, method, &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    webble::Status st;
    if (r < 0 && !(benign && err.name && std::strcmp(err.name, benign) == 0))
        st = bus_error((std::string(method) + " failed on " + path).c_str(), err, r);
    sd_bus_error_free(&err);
    return st;
}

// ReadValue(a{sv}) -> ay on a characteristic or descriptor object
webble::Status read_value(sd_bus *bus, const std::string &path, const char *iface, Bytes &out)
{
    sd_bus_message *msg = nullptr, *rep = nullptr;
    sd_bus_error    err{};
    webble::Status  st;
    int r = sd_bus_message_new_method_call(bus, &msg, "org.bluez", path.c_str(), iface, "ReadValue");
    if (r >= 0)
        r = append_gatt_options(msg, nullptr);
    if (r >= 0)
        r = sd_bus_call(bus, msg, 0, &err, &rep);
    if (r >= 0)
    {
        const void *buf = nullptr;
        size_t      len = 0;
        r               = sd_bus_message_read_array(rep, 'y', &buf, &len);
        if (r >= 0)
        {
            const auto *p = static_cast<const std::uint8_t *>(buf);
            out.assign(p, p + len);
        }
    }
    if (r < 0)
        st = bus_error(("ReadValue failed on " + path).c_str(), err, r);
    if (msg)
        sd_bus_message_unref(msg);
    if (rep)
        sd_bus_message_unref(rep);
    sd_bus_error_free(&err);
    return st;
}

// WriteValue(ay, a{sv}); write_type is "request", "command" or null (descriptors)
webble::Status write_value(sd_bus            *bus,
                           const std::string &path,
                           const char        *iface,
                           const Bytes       &data,
                           const char        *write_type)
{
    sd_bus_message *msg = nullptr, *rep = nullptr;
    sd_bus_error    err{};
    webble::Status  st;
    int r = sd_bus_message_new_method_call(bus, &msg, "org.bluez", path.c_str(), iface, "WriteValue");
    if (r >= 0)
        r = sd_bus_message_append_array(msg, 'y', data.data(), data.size());
    if (r >= 0)
        r = append_gatt_options(msg, write_type);
    if (r >= 0)
        r = sd_bus_call(bus, msg, 0, &err, &rep);
    if (r < 0)
        st = bus_error(("WriteValue failed on " + path).c_str(), err, r);
    else
        LOG_DEBUG("[BLUEZ] WriteValue OK on %s (len=%zu)", path.c_str(), data.size());
    if (msg)
        sd_bus_message_unref(msg);
    if (rep)
        sd_bus_message_unref(rep);
    sd_bus_error_free(&err);
    return st;
}

std::string char_key(const std::string &svc, const std::string &chr)
{
    return lower(svc) + "|" + lower(chr);
}

}  // namespace

BluezPeripheral::BluezPeripheral(std::weak_ptr<BluezImpl> impl, std::string path, std::string address)
    : impl_(std::move(impl)), path_(std::move(path)), address_(std::move(address))
{
    props_.address = address_;
}

webble::Status BluezPeripheral::properties(PeripheralProperties &out)
{
    std::lock_guard<std::mutex> lk(mu_);
    out = props_;
    return webble::Status::Ok();
}

void BluezPeripheral::update_properties(const PeripheralProperties &p)
{
    std::lock_guard<std::mutex> lk(mu_);
    props_         = p;
    props_.address = address_;
}

webble::Status BluezPeripheral::connect()
{
    webble::Status st = with_bus(impl_, [&](sd_bus *bus) {
        return call_simple(bus, path_, "org.bluez.Device1", "Connect",
                           "org.bluez.Error.AlreadyConnected");
    });
    if (!st.ok())
    {
        LOG_ERROR("[BLUEZ] Device1.Connect failed: %s", st.message().c_str());
        return st;
    }
    if (!set_connected(true))
    {
        LOG_SYSTEM("[BLUEZ] Device connected: %s", path_.c_str());
        if (auto impl = impl_.lock())
            impl->events.publish(AdapterEvent{EventKind::DeviceConnected, address_});
    }
    return webble::Status::Ok();
}

webble::Status BluezPeripheral::disconnect()
{
    webble::Status st = with_bus(impl_, [&](sd_bus *bus) {
        return call_simple(bus, path_, "org.bluez.Device1", "Disconnect");
    });
    if (!st.ok())
        return st;
    set_services_resolved(false);
    if (set_connected(false))
    {
        LOG_SYSTEM("[BLUEZ] Device disconnected: %s", path_.c_str());
        if (auto impl = impl_.lock())
            impl->events.publish(AdapterEvent{EventKind::DeviceDisconnected, address_});
    }
    return webble::Status::Ok();
}

// ======================================================================
// Function: BluezPeripheral::discover_services
// - In: connected device
// - Out: services() filled from the GATT objects BlueZ exported
// - Note: BlueZ resolves services on its own after Connect; this waits for
//         ServicesResolved, bounded by SERVICES_RESOLVE_TIMEOUT
// ======================================================================
webble::Status BluezPeripheral::discover_services()
{
    if (!is_connected())
        return webble::Status::adapter_error("Device " + address_ + " is not connected");

    auto impl = impl_.lock();
    if (!impl)
        return webble::Status::adapter_error("BlueZ adapter is closed");

    const auto deadline = std::chrono::steady_clock::now() + SERVICES_RESOLVE_TIMEOUT;
    for (;;)
    {
        ObjectTree     tree;
        webble::Status st = impl->managed_objects(tree);
        if (!st.ok())
            return st;
        impl->merge(tree);

        auto it = tree.devices.find(path_);
        if (it == tree.devices.end())
            return webble::Status::device_not_found(address_);
        if (it->second.services_resolved)
        {
            load_gatt(tree);
            LOG_INFO("[BLUEZ] ServicesResolved on %s", path_.c_str());
            return webble::Status::Ok();
        }
        if (!it->second.connected)
            return webble::Status::adapter_error("Device " + address_ + " disconnected during discovery");
        if (std::chrono::steady_clock::now() >= deadline)
            return webble::Status::adapter_error("Service discovery timed out on " + address_);
        std::this_thread::sleep_for(SERVICES_RESOLVE_POLL);
    }
}

void BluezPeripheral::load_gatt(const ObjectTree &tree)
{
    std::vector<Service>               services;
    std::map<std::string, std::string> chars, descs;

    for (const auto &sv : tree.services)
    {
        if (sv.second.device != path_ && !path_under(sv.first, path_))
            continue;
        Service s;
        s.uuid    = lower(sv.second.uuid);
        s.primary = sv.second.primary;
        for (const auto &cv : tree.chars)
        {
            if (cv.second.service != sv.first)
                continue;
            Characteristic c;
            c.uuid         = lower(cv.second.uuid);
            c.service_uuid = s.uuid;
            c.properties   = flags_to_props(cv.second.flags);
            for (const auto &dv : tree.descs)
            {
                if (dv.second.characteristic != cv.first)
                    continue;
                c.descriptors.push_back(Descriptor{lower(dv.second.uuid)});
                descs[char_key(s.uuid, c.uuid) + "|" + lower(dv.second.uuid)] = dv.first;
            }
            chars[char_key(s.uuid, c.uuid)] = cv.first;
            s.characteristics.push_back(std::move(c));
        }
        services.push_back(std::move(s));
    }

    std::lock_guard<std::mutex> lk(mu_);
    services_   = std::move(services);
    char_paths_ = std::move(chars);
    desc_paths_ = std::move(descs);
}

std::vector<Service> BluezPeripheral::services()
{
    std::lock_guard<std::mutex> lk(mu_);
    return services_;
}

webble::Status BluezPeripheral::char_path(const Characteristic &c, std::string &out) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto it = char_paths_.find(char_key(c.service_uuid, c.uuid));
    if (it == char_paths_.end())
        return webble::Status::characteristic_not_found(address_, c.uuid);
    out = it->second;
    return webble::Status::Ok();
}

webble::Status BluezPeripheral::desc_path(const Characteristic &c,
                                          const Descriptor     &d,
                                          std::string          &out) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto it = desc_paths_.find(char_key(c.service_uuid, c.uuid) + "|" + lower(d.uuid));
    if (it == desc_paths_.end())
        return webble::Status::descriptor_not_found(address_, d.uuid);
    out = it->second;
    return webble::Status::Ok();
}

webble::Status BluezPeripheral::read(const Characteristic &c, Bytes &out)
{
    std::string    path;
    webble::Status st = char_path(c, path);
    if (!st.ok())
        return st;
    return with_bus(impl_, [&](sd_bus *bus) {
        return read_value(bus, path, "org.bluez.GattCharacteristic1", out);
    });
}

webble::Status BluezPeripheral::write(const Characteristic &c, const Bytes &data, WriteType type)
{
    std::string    path;
    webble::Status st = char_path(c, path);
    if (!st.ok())
        return st;
    const char *wt = type == WriteType::WithResponse ? "request" : "command";
    return with_bus(impl_, [&](sd_bus *bus) {
        return write_value(bus, path, "org.bluez.GattCharacteristic1", data, wt);
    });
}

webble::Status BluezPeripheral::read_descriptor(const Characteristic &c,
                                                const Descriptor     &d,
                                                Bytes                &out)
{
    std::string    path;
    webble::Status st = desc_path(c, d, path);
    if (!st.ok())
        return st;
    return with_bus(impl_, [&](sd_bus *bus) {
        return read_value(bus, path, "org.bluez.GattDescriptor1", out);
    });
}

webble::Status BluezPeripheral::write_descriptor(const Characteristic &c,
                                                 const Descriptor     &d,
                                                 const Bytes          &data)
{
    std::string    path;
    webble::Status st = desc_path(c, d, path);
    if (!st.ok())
        return st;
    return with_bus(impl_, [&](sd_bus *bus) {
        return write_value(bus, path, "org.bluez.GattDescriptor1", data, nullptr);
    });
}

webble::Status BluezPeripheral::subscribe(const Characteristic &c)
{
    std::string    path;
    webble::Status st = char_path(c, path);
    if (!st.ok())
        return st;
    st = with_bus(impl_, [&](sd_bus *bus) {
        return call_simple(bus, path, "org.bluez.GattCharacteristic1", "StartNotify");
    });
    if (st.ok())
        LOG_SYSTEM("[BLUEZ] Notifications enabled on %s", path.c_str());
    return st;
}

webble::Status BluezPeripheral::unsubscribe(const Characteristic &c)
{
    std::string    path;
    webble::Status st = char_path(c, path);
    if (!st.ok())
        return st;
    return with_bus(impl_, [&](sd_bus *bus) {
        return call_simple(bus, path, "org.bluez.GattCharacteristic1", "StopNotify");
    });
}

std::shared_ptr<NotificationStream> BluezPeripheral::notifications()
{
    return notify_.subscribe();
}

void BluezPeripheral::deliver(const std::string &char_uuid, Bytes value)
{
    notify_.publish(ValueNotification{char_uuid, std::move(value)});
}

}  // namespace adapter
