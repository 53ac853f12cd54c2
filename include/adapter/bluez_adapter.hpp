#pragma once
#include <memory>
#include <string>
#include <vector>

#include "adapter/iadapter.hpp"

namespace adapter
{

struct BluezImpl;

// BlueZ over the systemd sd-bus client. One bus connection per adapter, one
// bus loop thread dispatching InterfacesAdded/Removed and PropertiesChanged.
// Method calls are issued synchronously from caller threads under bus_mu.
class BluezAdapter final : public IAdapter
{
  public:
    // NoAdapter when the system bus or /org/bluez/<adapter_name> is missing
    static webble::Status open(const std::string &adapter_name, std::shared_ptr<BluezAdapter> &out);
    ~BluezAdapter() override;

    BluezAdapter(const BluezAdapter &)            = delete;
    BluezAdapter &operator=(const BluezAdapter &) = delete;

    std::string    name() const override { return "bluez"; }
    webble::Status available(bool &out) override;
    webble::Status start_scan(const ScanFilter &filter) override;
    webble::Status stop_scan() override;
    webble::Status peripherals(std::vector<PeripheralPtr> &out) override;
    webble::Status events(std::shared_ptr<EventStream> &out) override;

  private:
    explicit BluezAdapter(std::shared_ptr<BluezImpl> impl);
    void close();

    std::shared_ptr<BluezImpl> impl_;
};

}  // namespace adapter
