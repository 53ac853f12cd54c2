#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "adapter/iadapter.hpp"
#include "gatt/models.hpp"
#include "session/adapter_listener.hpp"
#include "session/event_sink.hpp"
#include "session/gatt_resolver.hpp"
#include "session/notification_registry.hpp"
#include "session/peripheral_cache.hpp"
#include "session/scan_orchestrator.hpp"
#include "session/selection.hpp"
#include "util/constants.hpp"
#include "util/status.hpp"

namespace session
{

struct SessionConfig
{
    std::chrono::milliseconds poll_interval{constants::DEFAULT_SCAN_POLL_MS};
};

// One discovery / GATT session over one adapter. Every operation may be
// called concurrently from any thread. Teardown stops the adapter listener
// and every notification task.
class SessionManager
{
  public:
    // NoAdapter when `adapter` is null. A null selection handler means
    // first-match, a null sink means LogEventSink.
    static webble::Status create(std::shared_ptr<adapter::IAdapter>  adapter,
                                 std::unique_ptr<ISelectionHandler>  selection,
                                 std::shared_ptr<IEventSink>         sink,
                                 SessionConfig                       cfg,
                                 std::unique_ptr<SessionManager>    &out);
    ~SessionManager();

    SessionManager(const SessionManager &)            = delete;
    SessionManager &operator=(const SessionManager &) = delete;

    webble::Status get_availability(bool &out);
    webble::Status get_devices(std::vector<gatt::DeviceDescriptor> &out);
    webble::Status request_device(const gatt::RequestDeviceOptions &opts,
                                  gatt::DeviceDescriptor           &out);

    webble::Status connect_gatt(const std::string &device_id, gatt::GattServerInfo &out);
    webble::Status disconnect_gatt(const std::string &device_id);
    webble::Status forget_device(const std::string &device_id);

    webble::Status get_primary_services(const std::string                   &device_id,
                                        const std::optional<std::string>    &service_uuid,
                                        std::vector<gatt::BluetoothService> &out);
    webble::Status get_characteristics(const std::string                          &device_id,
                                       const std::string                          &service_uuid,
                                       const std::optional<std::string>           &characteristic_uuid,
                                       std::vector<gatt::BluetoothCharacteristic> &out);

    // Values cross this boundary as standard base64
    webble::Status read_characteristic_value(const std::string &device_id,
                                             const std::string &service_uuid,
                                             const std::string &characteristic_uuid,
                                             std::string       &out);
    webble::Status write_characteristic_value(const std::string &device_id,
                                              const std::string &service_uuid,
                                              const std::string &characteristic_uuid,
                                              const std::string &value,
                                              bool               with_response = true);
    webble::Status read_descriptor_value(const std::string &device_id,
                                         const std::string &service_uuid,
                                         const std::string &characteristic_uuid,
                                         const std::string &descriptor_uuid,
                                         std::string       &out);
    webble::Status write_descriptor_value(const std::string &device_id,
                                          const std::string &service_uuid,
                                          const std::string &characteristic_uuid,
                                          const std::string &descriptor_uuid,
                                          const std::string &value);

    webble::Status start_notifications(const std::string &device_id,
                                       const std::string &service_uuid,
                                       const std::string &characteristic_uuid);
    webble::Status stop_notifications(const std::string &device_id,
                                      const std::string &service_uuid,
                                      const std::string &characteristic_uuid);

    const NotificationRegistry &notifications() const { return registry_; }
    const PeripheralCache      &cache() const { return cache_; }
    bool                        listening() const { return listener_.running(); }

  private:
    SessionManager(std::shared_ptr<adapter::IAdapter> adapter,
                   std::unique_ptr<ISelectionHandler> selection,
                   std::shared_ptr<IEventSink>        sink,
                   SessionConfig                      cfg);

    webble::Status scan_and_select(const std::string                &request_id,
                                   const gatt::RequestDeviceOptions &opts,
                                   std::vector<Candidate>           &found,
                                   std::optional<std::string>       &chosen);

    std::shared_ptr<adapter::IAdapter> adapter_;
    std::unique_ptr<ISelectionHandler> selection_;
    std::shared_ptr<IEventSink>        sink_;
    SessionConfig                      cfg_;
    ScanCoordinator                    scans_;
    PeripheralCache                    cache_;
    GattResolver                       resolver_;
    NotificationRegistry               registry_;
    AdapterListener                    listener_;
    std::atomic<unsigned>              next_request_{1};
};

}  // namespace session
