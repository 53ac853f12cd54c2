#include "util/status.hpp"

namespace webble
{

const char *error_kind_name(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::Ok:
            return "Ok";
        case ErrorKind::Adapter:
            return "Adapter";
        case ErrorKind::NoAdapter:
            return "NoAdapter";
        case ErrorKind::InvalidRequest:
            return "InvalidRequest";
        case ErrorKind::DeviceNotFound:
            return "DeviceNotFound";
        case ErrorKind::ServiceNotFound:
            return "ServiceNotFound";
        case ErrorKind::CharacteristicNotFound:
            return "CharacteristicNotFound";
        case ErrorKind::DescriptorNotFound:
            return "DescriptorNotFound";
        case ErrorKind::SelectionCancelled:
            return "SelectionCancelled";
        case ErrorKind::NotificationsAlreadyActive:
            return "NotificationsAlreadyActive";
        case ErrorKind::NotificationsNotActive:
            return "NotificationsNotActive";
        case ErrorKind::InvalidUuid:
            return "InvalidUuid";
    }
    return "?";
}

Status Status::adapter_error(const std::string &what)
{
    return Status(ErrorKind::Adapter, what);
}

Status Status::no_adapter()
{
    return Status(ErrorKind::NoAdapter, "Bluetooth adapter is not available on this system");
}

Status Status::invalid_request(const std::string &what)
{
    return Status(ErrorKind::InvalidRequest, what);
}

Status Status::device_not_found(const std::string &device_id)
{
    return Status(ErrorKind::DeviceNotFound, "Device " + device_id + " not found");
}

Status Status::service_not_found(const std::string &device_id, const std::string &service_uuid)
{
    return Status(ErrorKind::ServiceNotFound,
                  "Service " + service_uuid + " not found for device " + device_id);
}

Status Status::characteristic_not_found(const std::string &device_id,
                                        const std::string &characteristic_uuid)
{
    return Status(ErrorKind::CharacteristicNotFound,
                  "Characteristic " + characteristic_uuid + " not found for device " + device_id);
}

Status Status::descriptor_not_found(const std::string &device_id,
                                    const std::string &descriptor_uuid)
{
    return Status(ErrorKind::DescriptorNotFound,
                  "Descriptor " + descriptor_uuid + " not found for device " + device_id);
}

Status Status::selection_cancelled()
{
    return Status(ErrorKind::SelectionCancelled, "Device selection was cancelled");
}

Status Status::notifications_already_active(const std::string &device_id,
                                            const std::string &characteristic_uuid)
{
    return Status(ErrorKind::NotificationsAlreadyActive, "Notifications already active for " +
                                                             characteristic_uuid + " on device " +
                                                             device_id);
}

Status Status::notifications_not_active(const std::string &device_id,
                                        const std::string &characteristic_uuid)
{
    return Status(ErrorKind::NotificationsNotActive, "Notifications not active for " +
                                                         characteristic_uuid + " on device " +
                                                         device_id);
}

Status Status::invalid_uuid(const std::string &token)
{
    return Status(ErrorKind::InvalidUuid, "Invalid UUID '" + token + "'");
}

std::string Status::to_string() const
{
    if (ok())
        return "Ok";
    return std::string(error_kind_name(kind_)) + ": " + message_;
}

}  // namespace webble
