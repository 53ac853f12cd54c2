// include/adapter/bluez_impl.hpp
#pragma once
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

struct sd_bus;
struct sd_bus_slot;
struct sd_bus_message;
struct sd_bus_error;

#include "adapter/bluez_dbus_util.hpp"
#include "adapter/bluez_peripheral.hpp"
#include "adapter/fanout.hpp"
#include "util/status.hpp"

namespace adapter
{

struct BluezImpl : std::enable_shared_from_this<BluezImpl>
{
#if WEBBLE_HAVE_SDBUS
    sd_bus      *bus          = nullptr;
    sd_bus_slot *added_slot   = nullptr;
    sd_bus_slot *removed_slot = nullptr;
    sd_bus_slot *props_slot   = nullptr;
#endif
    // serialize all sd-bus access
    std::mutex bus_mu;

    std::thread      loop;
    std::atomic_bool running{false};
    std::atomic_bool discovery_on{false};

    std::string adapter_name;  // "hci0"
    std::string adapter_path;  // "/org/bluez/hci0"

    EventHub events;

    // ---- device registry (bus thread and caller threads) ----
    std::mutex                                              state_mu;
    std::map<std::string, std::shared_ptr<BluezPeripheral>> devices;     // by object path
    std::vector<std::string>                                order;       // discovery order
    std::map<std::string, std::pair<std::string, std::string>> char_owner;  // char path -> (dev path, uuid)

    // Creates or refreshes peripherals from a snapshot; publishes
    // DeviceDiscovered for new ones.
    void merge(const ObjectTree &tree);
    std::shared_ptr<BluezPeripheral> device_at(const std::string &path);
    // Owner device and uuid of a characteristic object path
    bool char_at(const std::string &path, std::string &dev_path, std::string &uuid);
    void forget_device(const std::string &path);

    // GetManagedObjects, parsed below adapter_path
    webble::Status managed_objects(ObjectTree &out);
};

#if WEBBLE_HAVE_SDBUS
// org.bluez signal handlers (userdata = BluezImpl*), run on the bus thread
int bluez_on_iface_added(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
int bluez_on_iface_removed(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
int bluez_on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);

// "<what>: <dbus message or errno text>"
webble::Status bus_error(const char *what, const sd_bus_error &err, int r);
#endif

}  // namespace adapter
