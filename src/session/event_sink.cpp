#include <string>

#include "session/event_sink.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace session
{

void LogEventSink::on_value_changed(const gatt::NotificationEvent &ev)
{
    LOG_EVENT(constants::EVENT_NOTIFICATION,
              "deviceId=%s serviceUuid=%s characteristicUuid=%s value=%s", ev.device_id.c_str(),
              ev.service_uuid.c_str(), ev.characteristic_uuid.c_str(), ev.value.c_str());
}

void LogEventSink::on_gatt_disconnected(const std::string &device_id)
{
    LOG_EVENT(constants::EVENT_GATT_DISCONNECTED, "deviceId=%s", device_id.c_str());
}

void LogEventSink::on_candidates(const std::string &request_id, const gatt::CandidateUpdate &u)
{
    LOG_EVENT(constants::EVENT_SELECTION_UPDATED, "requestId=%s completed=%d devices=%s",
              request_id.c_str(), u.completed ? 1 : 0, gatt::render(u.devices).c_str());
}

}  // namespace session
