#pragma once
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "adapter/fanout.hpp"
#include "adapter/iadapter.hpp"

namespace adapter
{

struct BluezImpl;
struct ObjectTree;

// org.bluez.Device1 object and its GATT subtree
class BluezPeripheral final : public IPeripheral
{
  public:
    BluezPeripheral(std::weak_ptr<BluezImpl> impl, std::string path, std::string address);

    std::string          id() const override { return address_; }
    webble::Status       properties(PeripheralProperties &out) override;
    bool                 is_connected() override { return connected_.load(); }
    webble::Status       connect() override;
    webble::Status       disconnect() override;
    webble::Status       discover_services() override;
    std::vector<Service> services() override;

    webble::Status read(const Characteristic &c, Bytes &out) override;
    webble::Status write(const Characteristic &c, const Bytes &data, WriteType type) override;
    webble::Status read_descriptor(const Characteristic &c,
                                   const Descriptor     &d,
                                   Bytes                &out) override;
    webble::Status write_descriptor(const Characteristic &c,
                                    const Descriptor     &d,
                                    const Bytes          &data) override;
    webble::Status subscribe(const Characteristic &c) override;
    webble::Status unsubscribe(const Characteristic &c) override;
    std::shared_ptr<NotificationStream> notifications() override;

    // ---- fed by the adapter (bus thread or scan poll) ----
    const std::string &path() const { return path_; }
    void               update_properties(const PeripheralProperties &p);
    // returns the previous value
    bool set_connected(bool v) { return connected_.exchange(v); }
    void set_services_resolved(bool v) { services_resolved_.store(v); }
    void deliver(const std::string &char_uuid, Bytes value);
    // Rebuilds the GATT view from a managed-objects snapshot
    void load_gatt(const ObjectTree &tree);

  private:
    webble::Status char_path(const Characteristic &c, std::string &out) const;
    webble::Status desc_path(const Characteristic &c, const Descriptor &d, std::string &out) const;

    std::weak_ptr<BluezImpl>           impl_;
    const std::string                  path_;     // /org/bluez/hci0/dev_AA_BB_...
    const std::string                  address_;  // AA:BB:...
    std::atomic_bool                   connected_{false};
    std::atomic_bool                   services_resolved_{false};
    mutable std::mutex                 mu_;
    PeripheralProperties               props_;
    std::vector<Service>               services_;
    std::map<std::string, std::string> char_paths_;  // "svc|chr" -> object path
    std::map<std::string, std::string> desc_paths_;  // "svc|chr|desc" -> object path
    Fanout<ValueNotification>          notify_;
};

}  // namespace adapter
