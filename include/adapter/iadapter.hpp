#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "util/channel.hpp"
#include "util/status.hpp"

namespace adapter
{

using Bytes = std::vector<std::uint8_t>;

// GATT characteristic property bits (Bluetooth Core Vol 3 Part G 3.3.1.1, plus the
// extended-properties bits folded in above 0xff)
enum CharProp : std::uint32_t
{
    PROP_BROADCAST                   = 0x001,
    PROP_READ                        = 0x002,
    PROP_WRITE_WITHOUT_RESPONSE      = 0x004,
    PROP_WRITE                       = 0x008,
    PROP_NOTIFY                      = 0x010,
    PROP_INDICATE                    = 0x020,
    PROP_AUTHENTICATED_SIGNED_WRITES = 0x040,
    PROP_EXTENDED_PROPERTIES         = 0x080,
    PROP_RELIABLE_WRITE              = 0x100,
    PROP_WRITABLE_AUXILIARIES        = 0x200,
};

struct Descriptor
{
    std::string uuid;
};

struct Characteristic
{
    std::string             uuid;
    std::string             service_uuid;
    std::uint32_t           properties = 0;
    std::vector<Descriptor> descriptors;
};

struct Service
{
    std::string                 uuid;
    bool                        primary = true;
    std::vector<Characteristic> characteristics;
};

// Advertised / cached state of a peripheral
struct PeripheralProperties
{
    std::string                 address;
    std::optional<std::string>  local_name;
    std::vector<std::string>    services;
    std::optional<std::int16_t> rssi;
};

struct ValueNotification
{
    std::string uuid;  // characteristic uuid
    Bytes       value;
};

enum class WriteType
{
    WithResponse,
    WithoutResponse
};

enum class EventKind
{
    DeviceDiscovered,
    DeviceUpdated,
    DeviceConnected,
    DeviceDisconnected
};

struct AdapterEvent
{
    EventKind   kind;
    std::string peripheral_id;
};

struct ScanFilter
{
    std::vector<std::string> services;  // empty => unfiltered
};

using NotificationStream = webble::Channel<ValueNotification>;
using EventStream        = webble::Channel<AdapterEvent>;

// One remote device. All calls may block on I/O and must be thread safe.
class IPeripheral
{
  public:
    virtual ~IPeripheral() = default;

    virtual std::string    id() const                               = 0;
    virtual webble::Status properties(PeripheralProperties &out)    = 0;
    virtual bool           is_connected()                           = 0;
    virtual webble::Status connect()                                = 0;
    virtual webble::Status disconnect()                             = 0;
    virtual webble::Status discover_services()                      = 0;
    virtual std::vector<Service> services()                         = 0;  // empty before discovery

    virtual webble::Status read(const Characteristic &c, Bytes &out) = 0;
    virtual webble::Status write(const Characteristic &c, const Bytes &data, WriteType type) = 0;
    virtual webble::Status read_descriptor(const Characteristic &c,
                                           const Descriptor     &d,
                                           Bytes                &out)        = 0;
    virtual webble::Status write_descriptor(const Characteristic &c,
                                            const Descriptor     &d,
                                            const Bytes          &data)      = 0;
    virtual webble::Status subscribe(const Characteristic &c)               = 0;
    virtual webble::Status unsubscribe(const Characteristic &c)             = 0;

    // Fresh subscriber stream carrying every value notification of this
    // peripheral; closing it detaches the subscriber.
    virtual std::shared_ptr<NotificationStream> notifications() = 0;
};

using PeripheralPtr = std::shared_ptr<IPeripheral>;

// Local radio/controller.
class IAdapter
{
  public:
    virtual ~IAdapter() = default;

    virtual std::string    name() const { return ""; }
    virtual webble::Status available(bool &out)                          = 0;
    virtual webble::Status start_scan(const ScanFilter &filter)          = 0;
    virtual webble::Status stop_scan()                                   = 0;
    virtual webble::Status peripherals(std::vector<PeripheralPtr> &out) = 0;
    // Fresh subscriber stream of connection-lifecycle events
    virtual webble::Status events(std::shared_ptr<EventStream> &out) = 0;
};

}  // namespace adapter
