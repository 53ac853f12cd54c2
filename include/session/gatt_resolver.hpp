#pragma once
#include <optional>
#include <string>
#include <vector>

#include "adapter/iadapter.hpp"
#include "gatt/models.hpp"
#include "session/peripheral_cache.hpp"
#include "util/status.hpp"

namespace session
{

struct ResolvedCharacteristic
{
    adapter::PeripheralPtr  peripheral;
    std::string             device_id;
    std::string             service_uuid;  // canonical
    adapter::Characteristic characteristic;
};

// Device id -> peripheral -> service -> characteristic -> descriptor lookups.
// Connection and service discovery are triggered on demand.
class GattResolver
{
  public:
    GattResolver(adapter::IAdapter &adapter, PeripheralCache &cache)
        : adapter_(adapter), cache_(cache)
    {
    }

    // Cache hit, else loaded from the adapter's known peripherals and cached
    webble::Status peripheral(const std::string &device_id, adapter::PeripheralPtr &out);

    webble::Status connect(const std::string &device_id, gatt::GattServerInfo &out);
    webble::Status disconnect(const std::string &device_id);
    // Idempotent; does not require a prior disconnect
    webble::Status forget(const std::string &device_id);

    webble::Status primary_services(const std::string                   &device_id,
                                    const std::optional<std::string>    &service_uuid,
                                    std::vector<gatt::BluetoothService> &out);
    webble::Status characteristics(const std::string                          &device_id,
                                   const std::string                          &service_uuid,
                                   const std::optional<std::string>           &characteristic_uuid,
                                   std::vector<gatt::BluetoothCharacteristic> &out);

    webble::Status resolve_characteristic(const std::string      &device_id,
                                          const std::string      &service_uuid,
                                          const std::string      &characteristic_uuid,
                                          ResolvedCharacteristic &out);
    webble::Status resolve_descriptor(const std::string      &device_id,
                                      const std::string      &service_uuid,
                                      const std::string      &characteristic_uuid,
                                      const std::string      &descriptor_uuid,
                                      ResolvedCharacteristic &out,
                                      adapter::Descriptor    &descriptor);

  private:
    webble::Status ensure_services(const adapter::PeripheralPtr &p,
                                   std::vector<adapter::Service> &out);
    webble::Status find_service(const std::string                   &device_id,
                                const std::vector<adapter::Service> &services,
                                const std::string                   &service_uuid,
                                adapter::Service                    &out);

    adapter::IAdapter &adapter_;
    PeripheralCache   &cache_;
};

}  // namespace session
