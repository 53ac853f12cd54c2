/* ======================================================================
 * BlueZ adapter: flow
 *
 *  Caller thread                    Bus thread                 BlueZ/DBus
 *  -------------                    ----------                 ----------
 *  open(hci0)
 *    └─ GetManagedObjects ───────────────────────────────────▶  ObjectManager (Adapter1 present?)
 *    └─ match InterfacesAdded/Removed, PropertiesChanged
 *    └─ spawn bus loop
 *
 *  start_scan(filter)
 *    └─ SetDiscoveryFilter (le, UUIDs) ──────────────────────▶  Adapter1.SetDiscoveryFilter
 *    └─ StartDiscovery ──────────────────────────────────────▶  Adapter1.StartDiscovery
 *                                   ◀── InterfacesAdded(Device1) -> DeviceDiscovered
 *  peripherals()
 *    └─ GetManagedObjects (cold scan, merged into the registry)
 *
 *  stop_scan() ──────────────────────────────────────────────▶  Adapter1.StopDiscovery
 *
 *  Events
 *    PropertiesChanged(Device1.Connected) -> DeviceConnected / DeviceDisconnected
 *    PropertiesChanged(GattCharacteristic1.Value) -> peripheral notification stream
 *
 *  DBus calls on caller threads are under impl_->bus_mu
 * ====================================================================== */

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

// clang-format off
#include "adapter/bluez_adapter.hpp"
#include "adapter/bluez_impl.hpp"
#include "util/log.hpp"
// clang-format on

#include <systemd/sd-bus.h>

namespace adapter
{

webble::Status bus_error(const char *what, const sd_bus_error &err, int r)
{
    return webble::Status::adapter_error(std::string(what) + ": " +
                                         (err.message ? err.message : strerror(-r)));
}

namespace
{

// ======================================================================
// Function: adapter_stop_discovery_locked
// - In: bus_mu locked, adapter_path valid
// - Out: Ok if StopDiscovery succeeds or discovery was already off
// - Note: clears discovery_on even if StopDiscovery fails
// ======================================================================
webble::Status adapter_stop_discovery_locked(sd_bus            *bus,
                                             const std::string &adapter_path,
                                             std::atomic_bool  &discovery_on)
{
    if (!bus || !discovery_on.load())
        return webble::Status::Ok();

    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(bus, "org.bluez", adapter_path.c_str(), "org.bluez.Adapter1",
                               "StopDiscovery", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    discovery_on.store(false);

    webble::Status st;
    if (r < 0)
        st = bus_error("StopDiscovery failed", err, r);
    else
        LOG_SYSTEM("[BLUEZ] StopDiscovery OK");
    sd_bus_error_free(&err);
    return st;
}

// ======================================================================
// Function: adapter_set_discovery_filter_locked
// - In: bus_mu locked, service UUIDs (empty => no UUID constraint)
// - Out: r >= 0 on success
// - Note: Transport=le, DuplicateData=false
// ======================================================================
int adapter_set_discovery_filter_locked(sd_bus                         *bus,
                                        const std::string              &adapter_path,
                                        const std::vector<std::string> &uuids,
                                        sd_bus_error                   &err)
{
    sd_bus_message *msg = nullptr, *rep = nullptr;
    int r = sd_bus_message_new_method_call(bus, &msg, "org.bluez", adapter_path.c_str(),
                                           "org.bluez.Adapter1", "SetDiscoveryFilter");
    if (r < 0)
        goto out;

    // a{sv}
    r = sd_bus_message_open_container(msg, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        goto out;
    r = sd_bus_message_append(msg, "{sv}", "Transport", "s", "le");
    if (r < 0)
        goto out;
    r = sd_bus_message_append(msg, "{sv}", "DuplicateData", "b", 0);
    if (r < 0)
        goto out;
    if (!uuids.empty())
    {
        std::vector<char *> strv;
        for (const auto &u : uuids)
            strv.push_back(const_cast<char *>(u.c_str()));
        strv.push_back(nullptr);

        r = sd_bus_message_open_container(msg, SD_BUS_TYPE_DICT_ENTRY, "sv");
        if (r < 0)
            goto out;
        r = sd_bus_message_append(msg, "s", "UUIDs");
        if (r < 0)
            goto out;
        r = sd_bus_message_open_container(msg, SD_BUS_TYPE_VARIANT, "as");
        if (r < 0)
            goto out;
        r = sd_bus_message_append_strv(msg, strv.data());
        if (r < 0)
            goto out;
        r = sd_bus_message_close_container(msg);  // variant
        if (r < 0)
            goto out;
        r = sd_bus_message_close_container(msg);  // dict
        if (r < 0)
            goto out;
    }
    r = sd_bus_message_close_container(msg);  // a{sv}
    if (r < 0)
        goto out;

    r = sd_bus_call(bus, msg, 0, &err, &rep);
out:
    if (msg)
        sd_bus_message_unref(msg);
    if (rep)
        sd_bus_message_unref(rep);
    return r;
}

// Stops discovery, closes the bus, joins the loop. Safe to call twice.
void teardown(BluezImpl &impl)
{
    impl.running.store(false);
    {
        std::lock_guard<std::mutex> lk(impl.bus_mu);
        if (impl.bus)
        {
            webble::Status st =
                adapter_stop_discovery_locked(impl.bus, impl.adapter_path, impl.discovery_on);
            if (!st.ok())
                LOG_WARN("[BLUEZ] %s", st.message().c_str());
            // Wake the loop thread if it's in sd_bus_wait()
            sd_bus_close(impl.bus);
        }
    }

    // Join OUTSIDE of the mutex to avoid deadlocks with the loop thread.
    if (impl.loop.joinable())
        impl.loop.join();

    impl.added_slot   = sd_bus_slot_unref(impl.added_slot);
    impl.removed_slot = sd_bus_slot_unref(impl.removed_slot);
    impl.props_slot   = sd_bus_slot_unref(impl.props_slot);
    if (impl.bus)
    {
        sd_bus_flush_close_unref(impl.bus);
        impl.bus = nullptr;
    }
    impl.events.close_all();
}

}  // namespace

// ---------------- BluezImpl ----------------
void BluezImpl::merge(const ObjectTree &tree)
{
    std::vector<AdapterEvent> fresh;
    {
        std::lock_guard<std::mutex> lk(state_mu);
        for (const auto &kv : tree.devices)
        {
            const std::string &path = kv.first;
            const DeviceInfo  &info = kv.second;

            std::shared_ptr<BluezPeripheral> p;
            auto                             it = devices.find(path);
            if (it == devices.end())
            {
                const std::string addr = info.address.empty() ? mac_from_path(path) : info.address;
                p                      = std::make_shared<BluezPeripheral>(weak_from_this(), path, addr);
                devices.emplace(path, p);
                order.push_back(path);
                fresh.push_back(AdapterEvent{EventKind::DeviceDiscovered, addr});
                LOG_DEBUG("[BLUEZ] found %s addr=%s", path.c_str(), addr.c_str());
            }
            else
                p = it->second;

            p->update_properties(PeripheralProperties{p->id(), info.name, info.uuids, info.rssi});
            p->set_connected(info.connected);
            p->set_services_resolved(info.services_resolved);
        }
        for (const auto &kv : tree.chars)
            char_owner[kv.first] = std::make_pair(device_path_of(kv.first), lower(kv.second.uuid));
    }
    for (const auto &ev : fresh)
        events.publish(ev);
}

std::shared_ptr<BluezPeripheral> BluezImpl::device_at(const std::string &path)
{
    std::lock_guard<std::mutex> lk(state_mu);
    auto it = devices.find(path);
    return it == devices.end() ? nullptr : it->second;
}

bool BluezImpl::char_at(const std::string &path, std::string &dev_path, std::string &uuid)
{
    std::lock_guard<std::mutex> lk(state_mu);
    auto it = char_owner.find(path);
    if (it == char_owner.end())
        return false;
    dev_path = it->second.first;
    uuid     = it->second.second;
    return true;
}

void BluezImpl::forget_device(const std::string &path)
{
    std::lock_guard<std::mutex> lk(state_mu);
    devices.erase(path);
    order.erase(std::remove(order.begin(), order.end(), path), order.end());
    for (auto it = char_owner.begin(); it != char_owner.end();)
    {
        if (it->second.first == path)
            it = char_owner.erase(it);
        else
            ++it;
    }
}

webble::Status BluezImpl::managed_objects(ObjectTree &out)
{
    std::lock_guard<std::mutex> lk(bus_mu);
    if (!bus)
        return webble::Status::adapter_error("BlueZ bus is closed");

    sd_bus_message *reply = nullptr;
    sd_bus_error    err{};
    int r = sd_bus_call_method(bus, "org.bluez", "/", "org.freedesktop.DBus.ObjectManager",
                               "GetManagedObjects", &err, &reply, "");
    if (r < 0)
    {
        webble::Status st = bus_error("GetManagedObjects failed", err, r);
        if (reply)
            sd_bus_message_unref(reply);
        sd_bus_error_free(&err);
        return st;
    }
    r = parse_managed_objects(reply, adapter_path, out);
    sd_bus_message_unref(reply);
    sd_bus_error_free(&err);
    if (r < 0)
        return webble::Status::adapter_error(std::string("Malformed GetManagedObjects reply: ") +
                                             strerror(-r));
    return webble::Status::Ok();
}

// ---------------- BluezAdapter ----------------
BluezAdapter::BluezAdapter(std::shared_ptr<BluezImpl> impl) : impl_(std::move(impl)) {}

BluezAdapter::~BluezAdapter()
{
    close();
}

void BluezAdapter::close()
{
    if (impl_)
        teardown(*impl_);
}

// ======================================================================
// Function: BluezAdapter::open
// - In: adapter name ("hci0")
// - Out: Ok and a running adapter, or NoAdapter
// - Note: spawns the bus loop thread
// ======================================================================
webble::Status BluezAdapter::open(const std::string &adapter_name, std::shared_ptr<BluezAdapter> &out)
{
    auto impl          = std::make_shared<BluezImpl>();
    impl->adapter_name = adapter_name;
    impl->adapter_path = "/org/bluez/" + adapter_name;

    // connect system bus
    int r = sd_bus_open_system(&impl->bus);
    if (r < 0 || !impl->bus)
    {
        LOG_ERROR("[BLUEZ] failed to connect system bus: %s", strerror(-r));
        impl->bus = nullptr;
        return webble::Status::no_adapter();
    }

    ObjectTree     tree;
    webble::Status st = impl->managed_objects(tree);
    if (!st.ok() || !tree.adapter_present)
    {
        LOG_ERROR("[BLUEZ] adapter %s not found%s%s", impl->adapter_path.c_str(),
                  st.ok() ? "" : ": ", st.ok() ? "" : st.message().c_str());
        teardown(*impl);
        return webble::Status::no_adapter();
    }

    // subscribe signals (iface added/removed, property changes on any path)
    r = sd_bus_match_signal(impl->bus, &impl->added_slot, "org.bluez", "/",
                            "org.freedesktop.DBus.ObjectManager", "InterfacesAdded",
                            bluez_on_iface_added, impl.get());
    if (r >= 0)
        r = sd_bus_match_signal(impl->bus, &impl->removed_slot, "org.bluez", "/",
                                "org.freedesktop.DBus.ObjectManager", "InterfacesRemoved",
                                bluez_on_iface_removed, impl.get());
    if (r >= 0)
        r = sd_bus_match_signal(impl->bus, &impl->props_slot, "org.bluez", nullptr,
                                "org.freedesktop.DBus.Properties", "PropertiesChanged",
                                bluez_on_props_changed, impl.get());
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ] signal subscription failed: %s", strerror(-r));
        teardown(*impl);
        return webble::Status::adapter_error(std::string("Signal subscription failed: ") +
                                             strerror(-r));
    }

    impl->merge(tree);

    impl->running.store(true);
    BluezImpl *raw = impl.get();
    impl->loop     = std::thread([raw] {
        while (raw->running.load())
        {
            {
                std::lock_guard<std::mutex> lk(raw->bus_mu);
                while (sd_bus_process(raw->bus, nullptr) > 0)
                {
                }
            }
            // do not hold the lock while waiting, callers would stall
            const uint64_t WAIT_USEC = 100000;  // 100ms
            sd_bus_wait(raw->bus, WAIT_USEC);
        }
    });

    LOG_SYSTEM("[BLUEZ] adapter %s ready (powered=%d, %zu known devices)",
               impl->adapter_path.c_str(), tree.powered ? 1 : 0, tree.devices.size());
    out.reset(new BluezAdapter(std::move(impl)));
    return webble::Status::Ok();
}

webble::Status BluezAdapter::available(bool &out)
{
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    out = false;
    if (!impl_->bus)
        return webble::Status::Ok();

    sd_bus_error err{};
    int          powered = 0;
    int r = sd_bus_get_property_trivial(impl_->bus, "org.bluez", impl_->adapter_path.c_str(),
                                        "org.bluez.Adapter1", "Powered", &err, 'b', &powered);
    if (r < 0)
        LOG_DEBUG("[BLUEZ] Powered unreadable: %s", err.message ? err.message : strerror(-r));
    else
        out = powered != 0;
    sd_bus_error_free(&err);
    return webble::Status::Ok();
}

webble::Status BluezAdapter::start_scan(const ScanFilter &filter)
{
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus)
        return webble::Status::adapter_error("BlueZ bus is closed");

    sd_bus_error ferr{};
    int          r = adapter_set_discovery_filter_locked(impl_->bus, impl_->adapter_path,
                                                         filter.services, ferr);
    if (r < 0)
        LOG_WARN("[BLUEZ] SetDiscoveryFilter failed (scanning unfiltered): %s",
                 ferr.message ? ferr.message : strerror(-r));
    else
        LOG_INFO("[BLUEZ] SetDiscoveryFilter OK (Transport=le, %zu UUIDs)", filter.services.size());
    sd_bus_error_free(&ferr);

    if (impl_->discovery_on.load())
        return webble::Status::Ok();

    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    r = sd_bus_call_method(impl_->bus, "org.bluez", impl_->adapter_path.c_str(),
                           "org.bluez.Adapter1", "StartDiscovery", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        if (err.name && std::string(err.name) == "org.bluez.Error.InProgress")
        {
            impl_->discovery_on.store(true);
            LOG_INFO("[BLUEZ] StartDiscovery already in progress on %s",
                     impl_->adapter_path.c_str());
            sd_bus_error_free(&err);
            return webble::Status::Ok();
        }
        webble::Status st = bus_error("StartDiscovery failed", err, r);
        sd_bus_error_free(&err);
        return st;
    }
    sd_bus_error_free(&err);
    impl_->discovery_on.store(true);
    LOG_SYSTEM("[BLUEZ] StartDiscovery OK on %s", impl_->adapter_path.c_str());
    return webble::Status::Ok();
}

webble::Status BluezAdapter::stop_scan()
{
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    return adapter_stop_discovery_locked(impl_->bus, impl_->adapter_path, impl_->discovery_on);
}

webble::Status BluezAdapter::peripherals(std::vector<PeripheralPtr> &out)
{
    out.clear();
    ObjectTree     tree;
    webble::Status st = impl_->managed_objects(tree);
    if (!st.ok())
        return st;
    impl_->merge(tree);

    std::lock_guard<std::mutex> lk(impl_->state_mu);
    for (const auto &path : impl_->order)
    {
        auto it = impl_->devices.find(path);
        if (it != impl_->devices.end())
            out.push_back(it->second);
    }
    return webble::Status::Ok();
}

webble::Status BluezAdapter::events(std::shared_ptr<EventStream> &out)
{
    out = impl_->events.subscribe();
    return webble::Status::Ok();
}

}  // namespace adapter
