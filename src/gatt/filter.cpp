#include <algorithm>

#include "gatt/filter.hpp"

namespace gatt
{

bool matches(const DeviceFilterSpec &filter, const DeviceDescriptor &d)
{
    if (filter.name)
    {
        if (!d.name || *d.name != *filter.name)
            return false;
    }
    if (filter.name_prefix)
    {
        if (!d.name || d.name->compare(0, filter.name_prefix->size(), *filter.name_prefix) != 0)
            return false;
    }
    for (const auto &svc : filter.services)
    {
        if (std::find(d.uuids.begin(), d.uuids.end(), svc) == d.uuids.end())
            return false;
    }
    return true;
}

bool matches(const RequestDeviceOptions &opts, const DeviceDescriptor &d)
{
    if (opts.accept_all_devices)
        return true;
    return std::any_of(opts.filters.begin(), opts.filters.end(),
                       [&](const DeviceFilterSpec &f) { return matches(f, d); });
}

}  // namespace gatt
