#pragma once
#include "gatt/models.hpp"

namespace gatt
{

// AND across the constraints of one filter. Service UUIDs on both sides are
// expected in canonical form (validate_options / describe produce it).
bool matches(const DeviceFilterSpec &filter, const DeviceDescriptor &d);

// accept_all_devices, or OR across filters
bool matches(const RequestDeviceOptions &opts, const DeviceDescriptor &d);

}  // namespace gatt
