#pragma once
#include <string>

namespace webble
{

enum class ErrorKind
{
    Ok = 0,
    Adapter,  // failure reported by the underlying BLE stack
    NoAdapter,
    InvalidRequest,
    DeviceNotFound,
    ServiceNotFound,
    CharacteristicNotFound,
    DescriptorNotFound,
    SelectionCancelled,
    NotificationsAlreadyActive,
    NotificationsNotActive,
    InvalidUuid,
};

const char *error_kind_name(ErrorKind kind);

// Outcome of a fallible operation. Results travel through out-parameters,
// the Status carries the failure kind and a message naming the offending ids.
class Status
{
  public:
    Status() = default;
    Status(ErrorKind kind, std::string message) : kind_(kind), message_(std::move(message)) {}

    static Status Ok() { return Status(); }

    static Status adapter_error(const std::string &what);
    static Status no_adapter();
    static Status invalid_request(const std::string &what);
    static Status device_not_found(const std::string &device_id);
    static Status service_not_found(const std::string &device_id, const std::string &service_uuid);
    static Status characteristic_not_found(const std::string &device_id,
                                           const std::string &characteristic_uuid);
    static Status descriptor_not_found(const std::string &device_id,
                                       const std::string &descriptor_uuid);
    static Status selection_cancelled();
    static Status notifications_already_active(const std::string &device_id,
                                               const std::string &characteristic_uuid);
    static Status notifications_not_active(const std::string &device_id,
                                           const std::string &characteristic_uuid);
    static Status invalid_uuid(const std::string &token);

    bool               ok() const { return kind_ == ErrorKind::Ok; }
    ErrorKind          kind() const { return kind_; }
    const std::string &message() const { return message_; }

    // "<Kind>: <message>", or "Ok"
    std::string to_string() const;

  private:
    ErrorKind   kind_ = ErrorKind::Ok;
    std::string message_;
};

}  // namespace webble
