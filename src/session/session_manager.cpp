#include <chrono>

#include "session/session_manager.hpp"
#include "util/base64.hpp"
#include "util/log.hpp"

namespace session
{

static std::vector<gatt::DeviceDescriptor> descriptors_of(const std::vector<Candidate> &cs)
{
    std::vector<gatt::DeviceDescriptor> out;
    out.reserve(cs.size());
    for (const auto &c : cs)
        out.push_back(c.descriptor);
    return out;
}

static bool is_ready(SelectionResult &f)
{
    return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

webble::Status SessionManager::create(std::shared_ptr<adapter::IAdapter> adapter,
                                      std::unique_ptr<ISelectionHandler> selection,
                                      std::shared_ptr<IEventSink>        sink,
                                      SessionConfig                      cfg,
                                      std::unique_ptr<SessionManager>   &out)
{
    if (!adapter)
        return webble::Status::no_adapter();
    if (!selection)
        selection = std::make_unique<FirstMatchSelection>();
    if (!sink)
        sink = std::make_shared<LogEventSink>();

    out.reset(new SessionManager(std::move(adapter), std::move(selection), std::move(sink), cfg));
    out->listener_.start();
    LOG_INFO("Session ready (adapter=%s, selection=%s, poll=%lldms)", out->adapter_->name().c_str(),
             out->selection_->wants_full_scan() ? "full-scan" : "streaming",
             (long long)cfg.poll_interval.count());
    return webble::Status::Ok();
}

SessionManager::SessionManager(std::shared_ptr<adapter::IAdapter> adapter,
                               std::unique_ptr<ISelectionHandler> selection,
                               std::shared_ptr<IEventSink>        sink,
                               SessionConfig                      cfg)
    : adapter_(std::move(adapter)),
      selection_(std::move(selection)),
      sink_(std::move(sink)),
      cfg_(cfg),
      scans_(*adapter_),
      resolver_(*adapter_, cache_),
      registry_(resolver_, sink_),
      listener_(*adapter_, registry_, sink_)
{
}

SessionManager::~SessionManager()
{
    listener_.stop();
    registry_.clear();
}

webble::Status SessionManager::get_availability(bool &out)
{
    return adapter_->available(out);
}

webble::Status SessionManager::get_devices(std::vector<gatt::DeviceDescriptor> &out)
{
    out.clear();
    for (const auto &p : cache_.snapshot())
    {
        gatt::DeviceDescriptor d;
        webble::Status         st = gatt::describe(*p, d);
        if (!st.ok())
        {
            LOG_WARN("Skipping %s: %s", p->id().c_str(), st.to_string().c_str());
            continue;
        }
        out.push_back(std::move(d));
    }
    return webble::Status::Ok();
}

// ======================================================================
// Function: scan_and_select
// - In: request id, validated options
// - Out: candidates found, arbiter's answer (nullopt = cancelled)
// - Note: full-scan handlers see the complete list once the deadline has
//         passed. Streaming handlers are called on the first match and fed
//         every later change; the scan ends as soon as they resolve. On a
//         scan failure the arbiter is cancelled and awaited.
// ======================================================================
webble::Status SessionManager::scan_and_select(const std::string                &request_id,
                                               const gatt::RequestDeviceOptions &opts,
                                               std::vector<Candidate>           &found,
                                               std::optional<std::string>       &chosen)
{
    ScanOrchestrator scan(scans_, cfg_.poll_interval);
    auto             cancel = std::make_shared<webble::Cancellation>();
    SelectionResult  result;

    if (selection_->wants_full_scan())
    {
        webble::Status st = scan.discover(opts, nullptr, found);
        if (!st.ok())
            return st;
        result = selection_->select(SelectionContext{request_id, opts, descriptors_of(found),
                                                     nullptr, cancel});
    }
    else
    {
        auto feed     = std::make_shared<CandidateFeed>();
        bool selected = false;

        auto observer = [&](const std::vector<Candidate> &all, bool changed) {
            if (!selected)
            {
                if (all.empty())
                    return false;
                selected = true;
                result   = selection_->select(
                    SelectionContext{request_id, opts, descriptors_of(all), feed, cancel});
            }
            else if (changed)
            {
                feed->push(gatt::CandidateUpdate{descriptors_of(all), false});
            }
            return result.valid() && is_ready(result);
        };

        webble::Status st = scan.discover(opts, observer, found);
        if (selected)
        {
            feed->push(gatt::CandidateUpdate{descriptors_of(found), true});
            feed->close();
        }
        if (!st.ok())
        {
            if (result.valid())
            {
                cancel->cancel();
                result.wait();
            }
            return st;
        }
    }

    if (!result.valid())
    {
        LOG_ERROR("Selection handler returned no result for %s", request_id.c_str());
        return webble::Status::selection_cancelled();
    }
    chosen = result.get();
    return webble::Status::Ok();
}

webble::Status SessionManager::request_device(const gatt::RequestDeviceOptions &opts,
                                              gatt::DeviceDescriptor           &out)
{
    gatt::RequestDeviceOptions checked = opts;
    webble::Status             st      = gatt::validate_options(checked);
    if (!st.ok())
        return st;

    const std::string request_id = "req-" + std::to_string(next_request_++);
    LOG_INFO("Request %s: acceptAll=%d filters=%zu timeout=%lldms", request_id.c_str(),
             checked.accept_all_devices ? 1 : 0, checked.filters.size(),
             (long long)checked.scan_timeout.count());

    std::vector<Candidate>     found;
    std::optional<std::string> chosen;
    st = scan_and_select(request_id, checked, found, chosen);
    if (!st.ok())
    {
        LOG_INFO("Request %s failed: %s", request_id.c_str(), st.to_string().c_str());
        return st;
    }
    if (!chosen)
        return webble::Status::selection_cancelled();

    for (const auto &c : found)
    {
        if (c.descriptor.id == *chosen)
        {
            cache_.insert(c.descriptor.id, c.peripheral);
            out = c.descriptor;
            LOG_INFO("Request %s selected %s", request_id.c_str(), chosen->c_str());
            return webble::Status::Ok();
        }
    }
    return webble::Status::device_not_found(*chosen);
}

webble::Status SessionManager::connect_gatt(const std::string &device_id, gatt::GattServerInfo &out)
{
    return resolver_.connect(device_id, out);
}

webble::Status SessionManager::disconnect_gatt(const std::string &device_id)
{
    return resolver_.disconnect(device_id);
}

webble::Status SessionManager::forget_device(const std::string &device_id)
{
    registry_.stop_device(device_id);
    return resolver_.forget(device_id);
}

webble::Status SessionManager::get_primary_services(const std::string                   &device_id,
                                                    const std::optional<std::string>    &service_uuid,
                                                    std::vector<gatt::BluetoothService> &out)
{
    return resolver_.primary_services(device_id, service_uuid, out);
}

webble::Status SessionManager::get_characteristics(
    const std::string                          &device_id,
    const std::string                          &service_uuid,
    const std::optional<std::string>           &characteristic_uuid,
    std::vector<gatt::BluetoothCharacteristic> &out)
{
    return resolver_.characteristics(device_id, service_uuid, characteristic_uuid, out);
}

webble::Status SessionManager::read_characteristic_value(const std::string &device_id,
                                                         const std::string &service_uuid,
                                                         const std::string &characteristic_uuid,
                                                         std::string       &out)
{
    ResolvedCharacteristic rc;
    webble::Status st = resolver_.resolve_characteristic(device_id, service_uuid,
                                                         characteristic_uuid, rc);
    if (!st.ok())
        return st;

    adapter::Bytes value;
    st = rc.peripheral->read(rc.characteristic, value);
    if (!st.ok())
        return st;
    out = b64::encode(value);
    return webble::Status::Ok();
}

webble::Status SessionManager::write_characteristic_value(const std::string &device_id,
                                                          const std::string &service_uuid,
                                                          const std::string &characteristic_uuid,
                                                          const std::string &value,
                                                          bool               with_response)
{
    adapter::Bytes bytes;
    webble::Status st = b64::decode(value, bytes);
    if (!st.ok())
        return st;

    ResolvedCharacteristic rc;
    st = resolver_.resolve_characteristic(device_id, service_uuid, characteristic_uuid, rc);
    if (!st.ok())
        return st;

    return rc.peripheral->write(rc.characteristic, bytes,
                                with_response ? adapter::WriteType::WithResponse
                                              : adapter::WriteType::WithoutResponse);
}

webble::Status SessionManager::read_descriptor_value(const std::string &device_id,
                                                     const std::string &service_uuid,
                                                     const std::string &characteristic_uuid,
                                                     const std::string &descriptor_uuid,
                                                     std::string       &out)
{
    ResolvedCharacteristic rc;
    adapter::Descriptor    d;
    webble::Status st = resolver_.resolve_descriptor(device_id, service_uuid, characteristic_uuid,
                                                     descriptor_uuid, rc, d);
    if (!st.ok())
        return st;

    adapter::Bytes value;
    st = rc.peripheral->read_descriptor(rc.characteristic, d, value);
    if (!st.ok())
        return st;
    out = b64::encode(value);
    return webble::Status::Ok();
}

webble::Status SessionManager::write_descriptor_value(const std::string &device_id,
                                                      const std::string &service_uuid,
                                                      const std::string &characteristic_uuid,
                                                      const std::string &descriptor_uuid,
                                                      const std::string &value)
{
    adapter::Bytes bytes;
    webble::Status st = b64::decode(value, bytes);
    if (!st.ok())
        return st;

    ResolvedCharacteristic rc;
    adapter::Descriptor    d;
    st = resolver_.resolve_descriptor(device_id, service_uuid, characteristic_uuid,
                                      descriptor_uuid, rc, d);
    if (!st.ok())
        return st;
    return rc.peripheral->write_descriptor(rc.characteristic, d, bytes);
}

webble::Status SessionManager::start_notifications(const std::string &device_id,
                                                   const std::string &service_uuid,
                                                   const std::string &characteristic_uuid)
{
    return registry_.start(device_id, service_uuid, characteristic_uuid);
}

webble::Status SessionManager::stop_notifications(const std::string &device_id,
                                                  const std::string &service_uuid,
                                                  const std::string &characteristic_uuid)
{
    return registry_.stop(device_id, service_uuid, characteristic_uuid);
}

}  // namespace session
