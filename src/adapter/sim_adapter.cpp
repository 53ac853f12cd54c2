#include <algorithm>
#include <cctype>
#include <chrono>
#include <string>

#include "adapter/sim_adapter.hpp"
#include "util/log.hpp"

namespace adapter
{

static std::string lower(std::string s)
{
    for (auto &c : s)
        c = (char)std::tolower((unsigned char)c);
    return s;
}

// ---------------- SimPeripheral ----------------
SimPeripheral::SimPeripheral(PeripheralProperties props, std::vector<Service> services)
    : props_(std::move(props)), all_services_(std::move(services))
{
    for (auto &svc : all_services_)
        for (auto &ch : svc.characteristics)
            ch.service_uuid = svc.uuid;
}

std::string SimPeripheral::id() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return props_.address;
}

webble::Status SimPeripheral::properties(PeripheralProperties &out)
{
    std::lock_guard<std::mutex> lk(mu_);
    out = props_;
    return webble::Status::Ok();
}

bool SimPeripheral::is_connected()
{
    std::lock_guard<std::mutex> lk(mu_);
    return connected_;
}

webble::Status SimPeripheral::connect()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        ++connect_calls_;
        if (!connect_error_.ok())
            return connect_error_;
        if (connected_)
            return webble::Status::Ok();
        connected_ = true;
    }
    publish(EventKind::DeviceConnected);
    return webble::Status::Ok();
}

webble::Status SimPeripheral::disconnect()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!connected_)
            return webble::Status::Ok();
        connected_ = false;
    }
    publish(EventKind::DeviceDisconnected);
    return webble::Status::Ok();
}

webble::Status SimPeripheral::discover_services()
{
    std::lock_guard<std::mutex> lk(mu_);
    ++discover_calls_;
    if (!connected_)
        return webble::Status::adapter_error("Device " + props_.address + " is not connected");
    discovered_ = true;
    return webble::Status::Ok();
}

std::vector<Service> SimPeripheral::services()
{
    std::lock_guard<std::mutex> lk(mu_);
    return discovered_ ? all_services_ : std::vector<Service>{};
}

const Characteristic *SimPeripheral::find_char_locked(const std::string &uuid) const
{
    const std::string want = lower(uuid);
    for (const auto &svc : all_services_)
        for (const auto &ch : svc.characteristics)
            if (lower(ch.uuid) == want)
                return &ch;
    return nullptr;
}

webble::Status SimPeripheral::read(const Characteristic &c, Bytes &out)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (!connected_)
        return webble::Status::adapter_error("Device " + props_.address + " is not connected");
    const Characteristic *ch = find_char_locked(c.uuid);
    if (!ch || !(ch->properties & PROP_READ))
        return webble::Status::adapter_error("Read not permitted on " + c.uuid);
    auto it = values_.find(lower(c.uuid));
    out     = it == values_.end() ? Bytes{} : it->second;
    return webble::Status::Ok();
}

webble::Status SimPeripheral::write(const Characteristic &c, const Bytes &data, WriteType type)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (!connected_)
        return webble::Status::adapter_error("Device " + props_.address + " is not connected");
    const Characteristic *ch   = find_char_locked(c.uuid);
    const std::uint32_t   need = type == WriteType::WithResponse ? PROP_WRITE
                                                                 : PROP_WRITE_WITHOUT_RESPONSE;
    if (!ch || !(ch->properties & need))
        return webble::Status::adapter_error("Write not permitted on " + c.uuid);
    values_[lower(c.uuid)] = data;
    return webble::Status::Ok();
}

webble::Status SimPeripheral::read_descriptor(const Characteristic &c,
                                              const Descriptor     &d,
                                              Bytes                &out)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (!connected_)
        return webble::Status::adapter_error("Device " + props_.address + " is not connected");
    auto it = desc_values_.find(lower(c.uuid) + "|" + lower(d.uuid));
    out     = it == desc_values_.end() ? Bytes{} : it->second;
    return webble::Status::Ok();
}

webble::Status SimPeripheral::write_descriptor(const Characteristic &c,
                                               const Descriptor     &d,
                                               const Bytes          &data)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (!connected_)
        return webble::Status::adapter_error("Device " + props_.address + " is not connected");
    desc_values_[lower(c.uuid) + "|" + lower(d.uuid)] = data;
    return webble::Status::Ok();
}

webble::Status SimPeripheral::subscribe(const Characteristic &c)
{
    std::lock_guard<std::mutex> lk(mu_);
    ++subscribe_calls_;
    if (!connected_)
        return webble::Status::adapter_error("Device " + props_.address + " is not connected");
    const Characteristic *ch = find_char_locked(c.uuid);
    if (!ch || !(ch->properties & (PROP_NOTIFY | PROP_INDICATE)))
        return webble::Status::adapter_error("Notify not supported on " + c.uuid);
    subscribed_.insert(lower(c.uuid));
    return webble::Status::Ok();
}

webble::Status SimPeripheral::unsubscribe(const Characteristic &c)
{
    std::lock_guard<std::mutex> lk(mu_);
    ++unsubscribe_calls_;
    if (!unsubscribe_error_.ok())
        return unsubscribe_error_;
    subscribed_.erase(lower(c.uuid));
    return webble::Status::Ok();
}

std::shared_ptr<NotificationStream> SimPeripheral::notifications()
{
    return notify_.subscribe();
}

void SimPeripheral::set_value(const std::string &char_uuid, Bytes value)
{
    std::lock_guard<std::mutex> lk(mu_);
    values_[lower(char_uuid)] = std::move(value);
}

bool SimPeripheral::emit_notification(const std::string &char_uuid, const Bytes &value)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (!connected_ || subscribed_.count(lower(char_uuid)) == 0)
        return false;
    values_[lower(char_uuid)] = value;
    notify_.publish(ValueNotification{lower(char_uuid), value});
    return true;
}

void SimPeripheral::drop_link()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!connected_)
            return;
        connected_ = false;
        subscribed_.clear();
    }
    LOG_DEBUG("[SIM] %s dropped link", id().c_str());
    publish(EventKind::DeviceDisconnected);
}

void SimPeripheral::set_connect_error(webble::Status st)
{
    std::lock_guard<std::mutex> lk(mu_);
    connect_error_ = std::move(st);
}

void SimPeripheral::set_unsubscribe_error(webble::Status st)
{
    std::lock_guard<std::mutex> lk(mu_);
    unsubscribe_error_ = std::move(st);
}

int SimPeripheral::connect_calls() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return connect_calls_;
}

int SimPeripheral::discover_calls() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return discover_calls_;
}

int SimPeripheral::subscribe_calls() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return subscribe_calls_;
}

int SimPeripheral::unsubscribe_calls() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return unsubscribe_calls_;
}

bool SimPeripheral::subscribed(const std::string &char_uuid) const
{
    std::lock_guard<std::mutex> lk(mu_);
    return subscribed_.count(lower(char_uuid)) != 0;
}

void SimPeripheral::attach(const std::shared_ptr<EventHub> &hub)
{
    std::lock_guard<std::mutex> lk(mu_);
    hub_ = hub;
}

void SimPeripheral::publish(EventKind kind)
{
    std::shared_ptr<EventHub> hub;
    {
        std::lock_guard<std::mutex> lk(mu_);
        hub = hub_.lock();
    }
    if (hub)
        hub->publish(AdapterEvent{kind, id()});
}

// ---------------- SimAdapter ----------------
SimAdapter::SimAdapter() : hub_(std::make_shared<EventHub>()) {}

SimAdapter::~SimAdapter()
{
    hub_->close_all();
}

webble::Status SimAdapter::available(bool &out)
{
    std::lock_guard<std::mutex> lk(mu_);
    out = available_;
    return webble::Status::Ok();
}

webble::Status SimAdapter::start_scan(const ScanFilter &filter)
{
    std::lock_guard<std::mutex> lk(mu_);
    ++start_scan_calls_;
    last_filter_ = filter;
    if (!scanning_)
    {
        scanning_ = true;
        if (!scanned_)
        {
            scanned_      = true;
            scan_started_ = std::chrono::steady_clock::now();
        }
    }
    LOG_DEBUG("[SIM] scan started (%zu service filters)", filter.services.size());
    return webble::Status::Ok();
}

webble::Status SimAdapter::stop_scan()
{
    std::lock_guard<std::mutex> lk(mu_);
    ++stop_scan_calls_;
    scanning_ = false;
    if (!stop_scan_error_.ok())
        return stop_scan_error_;
    LOG_DEBUG("[SIM] scan stopped");
    return webble::Status::Ok();
}

webble::Status SimAdapter::peripherals(std::vector<PeripheralPtr> &out)
{
    out.clear();
    std::vector<std::string> fresh;
    {
        std::lock_guard<std::mutex> lk(mu_);
        const auto now = std::chrono::steady_clock::now();
        for (auto &e : entries_)
        {
            if (!e.seen)
            {
                const bool up_front = e.appear_after.count() == 0;
                const bool in_scan  = scanned_ && now - scan_started_ >= e.appear_after;
                if (!up_front && !in_scan)
                    continue;
                e.seen = true;
                fresh.push_back(e.peripheral->id());
            }
            out.push_back(e.peripheral);
        }
    }
    for (const auto &id : fresh)
        hub_->publish(AdapterEvent{EventKind::DeviceDiscovered, id});
    return webble::Status::Ok();
}

webble::Status SimAdapter::events(std::shared_ptr<EventStream> &out)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!events_error_.ok())
            return events_error_;
    }
    out = hub_->subscribe();
    return webble::Status::Ok();
}

void SimAdapter::add_peripheral(const std::shared_ptr<SimPeripheral> &p,
                                std::chrono::milliseconds             appear_after)
{
    p->attach(hub_);
    std::lock_guard<std::mutex> lk(mu_);
    entries_.push_back(Entry{p, appear_after, false});
}

void SimAdapter::remove_peripheral(const std::string &id)
{
    std::lock_guard<std::mutex> lk(mu_);
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [&](const Entry &e) { return e.peripheral->id() == id; }),
                   entries_.end());
}

void SimAdapter::emit(const AdapterEvent &ev)
{
    hub_->publish(ev);
}

void SimAdapter::set_available(bool v)
{
    std::lock_guard<std::mutex> lk(mu_);
    available_ = v;
}

void SimAdapter::set_events_error(webble::Status st)
{
    std::lock_guard<std::mutex> lk(mu_);
    events_error_ = std::move(st);
}

void SimAdapter::set_stop_scan_error(webble::Status st)
{
    std::lock_guard<std::mutex> lk(mu_);
    stop_scan_error_ = std::move(st);
}

int SimAdapter::start_scan_calls() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return start_scan_calls_;
}

int SimAdapter::stop_scan_calls() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return stop_scan_calls_;
}

bool SimAdapter::scanning() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return scanning_;
}

ScanFilter SimAdapter::last_scan_filter() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return last_filter_;
}

}  // namespace adapter
