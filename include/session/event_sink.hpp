#pragma once
#include <string>

#include "gatt/models.hpp"

namespace session
{

// Collaborator receiving asynchronous events. Called from background threads
// (notification tasks, adapter listener, scan loop); implementations must be
// thread safe and must not block for long.
class IEventSink
{
  public:
    virtual ~IEventSink() = default;

    virtual void on_value_changed(const gatt::NotificationEvent &ev)                      = 0;
    virtual void on_gatt_disconnected(const std::string &device_id)                       = 0;
    virtual void on_candidates(const std::string &request_id, const gatt::CandidateUpdate &u) = 0;
};

// Publishes each event as one LOG_SYSTEM line: "[EVENT] <name> key=value ..."
class LogEventSink final : public IEventSink
{
  public:
    void on_value_changed(const gatt::NotificationEvent &ev) override;
    void on_gatt_disconnected(const std::string &device_id) override;
    void on_candidates(const std::string &request_id, const gatt::CandidateUpdate &u) override;
};

}  // namespace session
