#include "gatt/uuid.hpp"
#include "session/gatt_resolver.hpp"
#include "util/log.hpp"

namespace session
{

webble::Status GattResolver::peripheral(const std::string &device_id, adapter::PeripheralPtr &out)
{
    if ((out = cache_.find(device_id)))
        return webble::Status::Ok();

    std::vector<adapter::PeripheralPtr> known;
    webble::Status                      st = adapter_.peripherals(known);
    if (!st.ok())
        return st;
    for (const auto &p : known)
    {
        if (p && p->id() == device_id)
        {
            cache_.insert(device_id, p);
            LOG_DEBUG("Loaded %s from adapter", device_id.c_str());
            out = p;
            return webble::Status::Ok();
        }
    }
    return webble::Status::device_not_found(device_id);
}

// ======================================================================
// Function: ensure_services
// - In: peripheral handle
// - Out: discovered services (connects and discovers if needed)
// ======================================================================
webble::Status GattResolver::ensure_services(const adapter::PeripheralPtr  &p,
                                             std::vector<adapter::Service> &out)
{
    if (!p->is_connected())
    {
        webble::Status st = p->connect();
        if (!st.ok())
            return st;
    }
    out = p->services();
    if (!out.empty())
        return webble::Status::Ok();

    webble::Status st = p->discover_services();
    if (!st.ok())
        return st;
    out = p->services();
    return webble::Status::Ok();
}

webble::Status GattResolver::find_service(const std::string                   &device_id,
                                          const std::vector<adapter::Service> &services,
                                          const std::string                   &service_uuid,
                                          adapter::Service                    &out)
{
    std::string want;
    webble::Status st = gatt::normalize_uuid(service_uuid, want);
    if (!st.ok())
        return st;
    for (const auto &s : services)
    {
        if (gatt::uuid_eq(s.uuid, want))
        {
            out = s;
            return webble::Status::Ok();
        }
    }
    return webble::Status::service_not_found(device_id, want);
}

webble::Status GattResolver::connect(const std::string &device_id, gatt::GattServerInfo &out)
{
    adapter::PeripheralPtr p;
    webble::Status         st = peripheral(device_id, p);
    if (!st.ok())
        return st;

    if (!p->is_connected())
    {
        LOG_INFO("Connecting to %s", device_id.c_str());
        st = p->connect();
        if (!st.ok())
            return st;
    }
    st = p->discover_services();
    if (!st.ok())
        return st;

    out           = gatt::GattServerInfo{};
    out.device_id = device_id;
    out.connected = p->is_connected();
    for (const auto &s : p->services())
        out.services.push_back(gatt::to_view(s));
    LOG_INFO("Connected to %s (%zu services)", device_id.c_str(), out.services.size());
    return webble::Status::Ok();
}

webble::Status GattResolver::disconnect(const std::string &device_id)
{
    adapter::PeripheralPtr p;
    webble::Status         st = peripheral(device_id, p);
    if (!st.ok())
        return st;
    if (!p->is_connected())
        return webble::Status::Ok();
    LOG_INFO("Disconnecting %s", device_id.c_str());
    return p->disconnect();
}

webble::Status GattResolver::forget(const std::string &device_id)
{
    if (cache_.erase(device_id))
        LOG_INFO("Forgot %s", device_id.c_str());
    return webble::Status::Ok();
}

webble::Status GattResolver::primary_services(const std::string                   &device_id,
                                               const std::optional<std::string>    &service_uuid,
                                               std::vector<gatt::BluetoothService> &out)
{
    out.clear();
    adapter::PeripheralPtr p;
    webble::Status         st = peripheral(device_id, p);
    if (!st.ok())
        return st;

    std::vector<adapter::Service> services;
    st = ensure_services(p, services);
    if (!st.ok())
        return st;

    std::vector<adapter::Service> primary;
    for (const auto &s : services)
        if (s.primary)
            primary.push_back(s);

    if (!service_uuid)
    {
        for (const auto &s : primary)
            out.push_back(gatt::to_view(s));
        return webble::Status::Ok();
    }

    adapter::Service svc;
    st = find_service(device_id, primary, *service_uuid, svc);
    if (!st.ok())
        return st;
    out.push_back(gatt::to_view(svc));
    return webble::Status::Ok();
}

webble::Status GattResolver::characteristics(
    const std::string                          &device_id,
    const std::string                          &service_uuid,
    const std::optional<std::string>           &characteristic_uuid,
    std::vector<gatt::BluetoothCharacteristic> &out)
{
    out.clear();
    if (characteristic_uuid)
    {
        ResolvedCharacteristic rc;
        webble::Status st = resolve_characteristic(device_id, service_uuid, *characteristic_uuid, rc);
        if (!st.ok())
            return st;
        out.push_back(gatt::to_view(rc.characteristic));
        out.back().service_uuid = rc.service_uuid;
        return webble::Status::Ok();
    }

    // same service lookup as resolve_characteristic: secondary services included
    adapter::PeripheralPtr p;
    webble::Status         st = peripheral(device_id, p);
    if (!st.ok())
        return st;

    std::vector<adapter::Service> services;
    st = ensure_services(p, services);
    if (!st.ok())
        return st;

    adapter::Service svc;
    st = find_service(device_id, services, service_uuid, svc);
    if (!st.ok())
        return st;
    out = gatt::to_view(svc).characteristics;
    return webble::Status::Ok();
}

// ======================================================================
// Function: resolve_characteristic
// - In: device id, service and characteristic tokens (any accepted UUID form)
// - Out: peripheral handle plus the characteristic as the adapter knows it
// - Note: ServiceNotFound / CharacteristicNotFound carry the device id and
//         the canonical uuid that missed
// ======================================================================
webble::Status GattResolver::resolve_characteristic(const std::string      &device_id,
                                                    const std::string      &service_uuid,
                                                    const std::string      &characteristic_uuid,
                                                    ResolvedCharacteristic &out)
{
    std::string chr;
    webble::Status st = gatt::normalize_uuid(characteristic_uuid, chr);
    if (!st.ok())
        return st;

    adapter::PeripheralPtr p;
    st = peripheral(device_id, p);
    if (!st.ok())
        return st;

    std::vector<adapter::Service> services;
    st = ensure_services(p, services);
    if (!st.ok())
        return st;

    adapter::Service svc;
    st = find_service(device_id, services, service_uuid, svc);
    if (!st.ok())
        return st;

    for (const auto &c : svc.characteristics)
    {
        if (gatt::uuid_eq(c.uuid, chr))
        {
            out.peripheral     = p;
            out.device_id      = device_id;
            out.characteristic = c;
            if (!gatt::normalize_uuid(svc.uuid, out.service_uuid).ok())
                out.service_uuid = svc.uuid;
            return webble::Status::Ok();
        }
    }
    return webble::Status::characteristic_not_found(device_id, chr);
}

webble::Status GattResolver::resolve_descriptor(const std::string      &device_id,
                                                const std::string      &service_uuid,
                                                const std::string      &characteristic_uuid,
                                                const std::string      &descriptor_uuid,
                                                ResolvedCharacteristic &out,
                                                adapter::Descriptor    &descriptor)
{
    std::string dsc;
    webble::Status st = gatt::normalize_uuid(descriptor_uuid, dsc);
    if (!st.ok())
        return st;

    st = resolve_characteristic(device_id, service_uuid, characteristic_uuid, out);
    if (!st.ok())
        return st;

    for (const auto &d : out.characteristic.descriptors)
    {
        if (gatt::uuid_eq(d.uuid, dsc))
        {
            descriptor = d;
            return webble::Status::Ok();
        }
    }
    return webble::Status::descriptor_not_found(device_id, dsc);
}

}  // namespace session
