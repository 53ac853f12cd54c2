#include <cerrno>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

#include "adapter/bluez_impl.hpp"
#include "util/log.hpp"

#include <systemd/sd-bus.h>

namespace adapter
{

int bluez_on_iface_added(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto *self = static_cast<BluezImpl *>(userdata);

    const char *obj = nullptr;
    int         r   = sd_bus_message_read(m, "o", &obj);
    if (r < 0 || !obj)
        return r < 0 ? r : -EINVAL;

    ObjectTree tree;
    if ((r = parse_interfaces(m, obj, self->adapter_path, tree)) < 0)
        return r;
    if (!tree.devices.empty() || !tree.chars.empty())
        self->merge(tree);
    return 0;
}

int bluez_on_iface_removed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto       *self = static_cast<BluezImpl *>(userdata);
    const char *obj  = nullptr;
    int         r    = sd_bus_message_read(m, "o", &obj);
    if (r < 0 || !obj)
        return r < 0 ? r : -EINVAL;

    bool device_gone = false;
    if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "s")) < 0)
        return r;
    for (;;)
    {
        const char *iface = nullptr;
        int         rr    = sd_bus_message_read_basic(m, 's', &iface);
        if (rr < 0)
            return rr;
        if (rr == 0)
            break;
        if (iface && std::strcmp(iface, "org.bluez.Device1") == 0)
            device_gone = true;
    }
    if ((r = sd_bus_message_exit_container(m)) < 0)
        return r;

    if (!device_gone)
        return 0;
    const std::string path(obj);
    auto              p = self->device_at(path);
    if (!p)
        return 0;
    const bool was_connected = p->set_connected(false);
    self->forget_device(path);
    LOG_SYSTEM("[BLUEZ] InterfacesRemoved -> dropped device %s", obj);
    if (was_connected)
        self->events.publish(AdapterEvent{EventKind::DeviceDisconnected, p->id()});
    return 0;
}

// ======================================================================
// Function: bluez_on_props_changed
// - In: PropertiesChanged(s iface, a{sv} changed, as invalidated)
// - Out: Device1 Connected transitions become lifecycle events, Name/UUIDs/
//        RSSI refresh the peripheral, GattCharacteristic1.Value is routed to
//        the owning peripheral's notification stream
// ======================================================================
int bluez_on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret_error*/)
{
    auto       *self  = static_cast<BluezImpl *>(userdata);
    const char *iface = nullptr;
    int         r     = sd_bus_message_read(m, "s", &iface);
    if (r < 0)
        return r;

    const char *cpath = sd_bus_message_get_path(m);
    if (!cpath || !iface || !path_under(cpath, self->adapter_path))
        return 0;
    const std::string path(cpath);

    if (std::strcmp(iface, "org.bluez.Device1") == 0)
    {
        std::optional<bool>                     connected, resolved;
        std::optional<std::string>              name;
        std::optional<std::vector<std::string>> uuids;
        std::optional<int16_t>                  rssi;

        r = read_props(m, [&](const std::string &k) {
            if (k == "Connected")
            {
                bool b = false;
                int  rr = read_var_b(m, b);
                connected = b;
                return consumed(rr);
            }
            if (k == "ServicesResolved")
            {
                bool b = false;
                int  rr = read_var_b(m, b);
                resolved = b;
                return consumed(rr);
            }
            if (k == "Name")
            {
                std::string s;
                int         rr = read_var_s(m, "s", s);
                name           = s;
                return consumed(rr);
            }
            if (k == "UUIDs")
            {
                std::vector<std::string> v;
                int                      rr = read_var_as(m, v);
                uuids                       = v;
                return consumed(rr);
            }
            if (k == "RSSI")
            {
                int16_t v  = 0;
                int     rr = read_var_i16(m, v);
                rssi       = v;
                return consumed(rr);
            }
            return 0;
        });
        if (r < 0)
            return r;

        auto p = self->device_at(path);
        if (!p)
            return 0;  // next cold scan picks it up

        if (name || uuids || rssi)
        {
            PeripheralProperties props;
            if (p->properties(props).ok())
            {
                if (name)
                    props.local_name = *name;
                if (uuids)
                    props.services = *uuids;
                if (rssi)
                    props.rssi = *rssi;
                p->update_properties(props);
                self->events.publish(AdapterEvent{EventKind::DeviceUpdated, p->id()});
            }
        }
        if (resolved)
        {
            p->set_services_resolved(*resolved);
            LOG_DEBUG("[BLUEZ] ServicesResolved=%d on %s", *resolved ? 1 : 0, cpath);
        }
        if (connected)
        {
            const bool was = p->set_connected(*connected);
            if (*connected && !was)
            {
                LOG_SYSTEM("[BLUEZ] Connected (%s)", cpath);
                self->events.publish(AdapterEvent{EventKind::DeviceConnected, p->id()});
            }
            else if (!*connected && was)
            {
                p->set_services_resolved(false);
                LOG_SYSTEM("[BLUEZ] Disconnected (%s)", cpath);
                self->events.publish(AdapterEvent{EventKind::DeviceDisconnected, p->id()});
            }
        }
        return 0;
    }

    if (std::strcmp(iface, "org.bluez.GattCharacteristic1") == 0)
    {
        bool  value_hit = false;
        Bytes value;
        r = read_props(m, [&](const std::string &k) {
            if (k == "Value")
            {
                value_hit = true;
                return consumed(read_var_ay(m, value));
            }
            return 0;
        });
        if (r < 0)
            return r;
        if (!value_hit)
            return 0;

        std::string dev_path, uuid;
        if (!self->char_at(path, dev_path, uuid))
            return 0;
        if (auto p = self->device_at(dev_path))
        {
            LOG_DEBUG("[BLUEZ] notify on %s len=%zu", cpath, value.size());
            p->deliver(uuid, std::move(value));
        }
        return 0;
    }

    return 0;
}

}  // namespace adapter
