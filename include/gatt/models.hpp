#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "adapter/iadapter.hpp"
#include "util/constants.hpp"
#include "util/status.hpp"

namespace gatt
{

using DeviceId = std::string;

// All present constraints must hold. No constraints at all matches any device.
struct DeviceFilterSpec
{
    std::vector<std::string>   services;
    std::optional<std::string> name;
    std::optional<std::string> name_prefix;
};

struct RequestDeviceOptions
{
    bool                          accept_all_devices = false;
    std::vector<DeviceFilterSpec> filters;
    std::vector<std::string>      optional_services;  // validated, informational
    std::chrono::milliseconds     scan_timeout{constants::DEFAULT_SCAN_TIMEOUT_MS};
};

// Derived per response from a live peripheral handle
struct DeviceDescriptor
{
    DeviceId                   id;
    std::optional<std::string> name;
    std::vector<std::string>   uuids;  // normalized
    bool                       watching_advertisements = false;
    bool                       connected               = false;
};

struct CharacteristicProperties
{
    bool broadcast                   = false;
    bool read                        = false;
    bool write_without_response      = false;
    bool write                       = false;
    bool notify                      = false;
    bool indicate                    = false;
    bool authenticated_signed_writes = false;
    bool reliable_write              = false;
    bool writable_auxiliaries        = false;
};

struct BluetoothDescriptor
{
    std::string uuid;
};

struct BluetoothCharacteristic
{
    std::string                      uuid;
    std::string                      service_uuid;
    CharacteristicProperties         properties;
    std::vector<BluetoothDescriptor> descriptors;
};

struct BluetoothService
{
    std::string                          uuid;
    bool                                 is_primary = true;
    std::vector<BluetoothCharacteristic> characteristics;
};

struct GattServerInfo
{
    DeviceId                      device_id;
    bool                          connected = false;
    std::vector<BluetoothService> services;
};

struct NotificationEvent
{
    DeviceId    device_id;
    std::string service_uuid;
    std::string characteristic_uuid;
    std::string value;  // base64
};

struct CandidateUpdate
{
    std::vector<DeviceDescriptor> devices;
    bool                          completed = false;
};

// Checks the request invariants and rewrites every UUID to canonical form.
// InvalidRequest: no filters without accept-all, or a zero scan timeout.
// InvalidUuid: a malformed service token in a filter or optional_services.
webble::Status validate_options(RequestDeviceOptions &opts);

// Snapshot of a peripheral; unparseable advertised UUIDs are skipped.
webble::Status describe(adapter::IPeripheral &p, DeviceDescriptor &out);

CharacteristicProperties to_properties(std::uint32_t bits);
BluetoothCharacteristic  to_view(const adapter::Characteristic &c);
BluetoothService         to_view(const adapter::Service &s);

// Single-line text renderings used on the control socket and event lines
std::string render(const DeviceDescriptor &d);
std::string render(const std::vector<DeviceDescriptor> &ds);
std::string render(const BluetoothCharacteristic &c);
std::string render(const BluetoothService &s);
std::string render(const GattServerInfo &g);

}  // namespace gatt
