#include "gatt/uuid.hpp"
#include "session/notification_registry.hpp"
#include "util/base64.hpp"
#include "util/log.hpp"

namespace session
{

// ---------------- NotificationTask ----------------
NotificationTask::NotificationTask(ResolvedCharacteristic                       target,
                                   std::shared_ptr<adapter::NotificationStream> stream,
                                   std::shared_ptr<IEventSink>                  sink)
    : target_(std::move(target)), stream_(std::move(stream)), sink_(std::move(sink))
{
    if (!gatt::normalize_uuid(target_.characteristic.uuid, char_uuid_).ok())
        char_uuid_ = target_.characteristic.uuid;
    th_ = std::thread([this] { run(); });
}

NotificationTask::~NotificationTask()
{
    abort();
}

void NotificationTask::abort()
{
    cancel_.cancel();
    stream_->close();
    if (th_.joinable())
    {
        if (th_.get_id() == std::this_thread::get_id())
            th_.detach();
        else
            th_.join();
    }
}

void NotificationTask::run()
{
    LOG_DEBUG("Notification task up for %s %s", target_.device_id.c_str(), char_uuid_.c_str());
    adapter::ValueNotification n;
    while (stream_->pop(n))
    {
        if (cancel_.cancelled())
            break;
        if (!gatt::uuid_eq(n.uuid, char_uuid_))
            continue;
        sink_->on_value_changed(gatt::NotificationEvent{target_.device_id, target_.service_uuid,
                                                        char_uuid_, b64::encode(n.value)});
    }
    LOG_DEBUG("Notification task down for %s %s", target_.device_id.c_str(), char_uuid_.c_str());
}

// ---------------- NotificationRegistry ----------------
NotificationRegistry::~NotificationRegistry()
{
    clear();
}

std::string NotificationRegistry::key_of(const std::string &device_id, const std::string &char_uuid)
{
    return device_id + "|" + char_uuid;
}

void NotificationRegistry::drop_reservation(const std::string &key, std::uint64_t serial)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto it = tasks_.find(key);
    if (it != tasks_.end() && it->second.serial == serial)
        tasks_.erase(it);
}

// ======================================================================
// Function: start
// - In: device id, service and characteristic tokens
// - Out: Ok once subscribed and the forwarding task runs
// - Note: the key is reserved before any adapter call so a concurrent start
//         for the same key fails with NotificationsAlreadyActive. If a stop
//         or disconnect removed the reservation meanwhile, the fresh
//         subscription is torn down again and Ok is returned.
// ======================================================================
webble::Status NotificationRegistry::start(const std::string &device_id,
                                           const std::string &service_uuid,
                                           const std::string &characteristic_uuid)
{
    std::string chr, svc;
    webble::Status st = gatt::normalize_uuid(characteristic_uuid, chr);
    if (!st.ok())
        return st;
    st = gatt::normalize_uuid(service_uuid, svc);
    if (!st.ok())
        return st;

    const std::string key = key_of(device_id, chr);
    std::uint64_t     serial;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (tasks_.count(key))
            return webble::Status::notifications_already_active(device_id, chr);
        serial                   = next_serial_++;
        tasks_[key].serial       = serial;
        tasks_[key].service_uuid = svc;
    }

    ResolvedCharacteristic rc;
    st = resolver_.resolve_characteristic(device_id, svc, chr, rc);
    if (!st.ok())
    {
        drop_reservation(key, serial);
        return st;
    }

    // Open the stream first so nothing delivered right after subscribe is lost
    auto stream = rc.peripheral->notifications();
    st          = rc.peripheral->subscribe(rc.characteristic);
    if (!st.ok())
    {
        stream->close();
        drop_reservation(key, serial);
        LOG_WARN("Subscribe %s on %s failed: %s", chr.c_str(), device_id.c_str(),
                 st.to_string().c_str());
        return st;
    }

    auto task = std::make_unique<NotificationTask>(rc, stream, sink_);
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = tasks_.find(key);
        if (it != tasks_.end() && it->second.serial == serial)
        {
            it->second.task   = std::move(task);
            it->second.target = rc;
            LOG_INFO("Notifications started for %s on %s", chr.c_str(), device_id.c_str());
            return webble::Status::Ok();
        }
    }

    LOG_INFO("Notifications for %s on %s stopped while starting", chr.c_str(), device_id.c_str());
    task->abort();
    webble::Status un = rc.peripheral->unsubscribe(rc.characteristic);
    if (!un.ok())
        LOG_WARN("Unsubscribe %s on %s failed (ignored): %s", chr.c_str(), device_id.c_str(),
                 un.to_string().c_str());
    return webble::Status::Ok();
}

// Aborts the task, then unsubscribes at the adapter (best-effort)
void NotificationRegistry::release(Entry &e)
{
    if (e.task)
        e.task->abort();
    if (!e.target.peripheral)
        return;
    webble::Status st = e.target.peripheral->unsubscribe(e.target.characteristic);
    if (!st.ok())
        LOG_WARN("Unsubscribe %s on %s failed (ignored): %s", e.target.characteristic.uuid.c_str(),
                 e.target.device_id.c_str(), st.to_string().c_str());
}

webble::Status NotificationRegistry::stop(const std::string &device_id,
                                          const std::string &service_uuid,
                                          const std::string &characteristic_uuid)
{
    std::string chr, svc;
    webble::Status st = gatt::normalize_uuid(characteristic_uuid, chr);
    if (!st.ok())
        return st;
    st = gatt::normalize_uuid(service_uuid, svc);
    if (!st.ok())
        return st;

    Entry e;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = tasks_.find(key_of(device_id, chr));
        // a task started under another service is not this one
        if (it == tasks_.end() || it->second.service_uuid != svc)
            return webble::Status::notifications_not_active(device_id, chr);
        e = std::move(it->second);
        tasks_.erase(it);
    }

    if (e.task)
        e.task->abort();
    LOG_INFO("Notifications stopped for %s on %s", chr.c_str(), device_id.c_str());
    if (!e.target.peripheral)
        return webble::Status::Ok();  // start() still in flight cleans up after itself
    return e.target.peripheral->unsubscribe(e.target.characteristic);
}

std::size_t NotificationRegistry::stop_device(const std::string &device_id)
{
    const std::string prefix = device_id + "|";
    std::vector<Entry> removed;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto it = tasks_.begin(); it != tasks_.end();)
        {
            if (it->first.compare(0, prefix.size(), prefix) == 0)
            {
                removed.push_back(std::move(it->second));
                it = tasks_.erase(it);
            }
            else
                ++it;
        }
    }
    for (auto &e : removed)
        release(e);
    if (!removed.empty())
        LOG_INFO("Removed %zu notification task(s) of %s", removed.size(), device_id.c_str());
    return removed.size();
}

void NotificationRegistry::clear()
{
    std::map<std::string, Entry> all;
    {
        std::lock_guard<std::mutex> lk(mu_);
        all.swap(tasks_);
    }
    for (auto &kv : all)
        release(kv.second);
}

bool NotificationRegistry::active(const std::string &device_id,
                                  const std::string &characteristic_uuid) const
{
    std::string chr;
    if (!gatt::normalize_uuid(characteristic_uuid, chr).ok())
        return false;
    std::lock_guard<std::mutex> lk(mu_);
    return tasks_.count(key_of(device_id, chr)) != 0;
}

std::size_t NotificationRegistry::size() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return tasks_.size();
}

std::vector<std::string> NotificationRegistry::keys() const
{
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> out;
    for (const auto &kv : tasks_)
        out.push_back(kv.first);
    return out;
}

}  // namespace session
