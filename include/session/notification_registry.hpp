#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "adapter/iadapter.hpp"
#include "session/event_sink.hpp"
#include "session/gatt_resolver.hpp"
#include "util/cancel.hpp"
#include "util/status.hpp"

namespace session
{

// Background forwarder of one characteristic's notifications to the event
// sink. Owned by the registry; destroying the handle aborts and joins it.
class NotificationTask
{
  public:
    NotificationTask(ResolvedCharacteristic                       target,
                     std::shared_ptr<adapter::NotificationStream> stream,
                     std::shared_ptr<IEventSink>                  sink);
    ~NotificationTask();

    NotificationTask(const NotificationTask &)            = delete;
    NotificationTask &operator=(const NotificationTask &) = delete;

    // Idempotent; returns once the thread has exited
    void abort();

  private:
    void run();

    ResolvedCharacteristic                       target_;
    std::string                                  char_uuid_;  // canonical
    std::shared_ptr<adapter::NotificationStream> stream_;
    std::shared_ptr<IEventSink>                  sink_;
    webble::Cancellation                         cancel_;
    std::thread                                  th_;
};

// At most one task per (device id, characteristic uuid). stop() must name the
// service the task was started under.
class NotificationRegistry
{
  public:
    NotificationRegistry(GattResolver &resolver, std::shared_ptr<IEventSink> sink)
        : resolver_(resolver), sink_(std::move(sink))
    {
    }
    ~NotificationRegistry();

    webble::Status start(const std::string &device_id,
                         const std::string &service_uuid,
                         const std::string &characteristic_uuid);
    // Propagates the adapter's unsubscribe failure
    webble::Status stop(const std::string &device_id,
                        const std::string &service_uuid,
                        const std::string &characteristic_uuid);

    // Disconnect / forget path: removes every task of `device_id`, unsubscribes
    // best-effort. Returns how many entries were removed; 0 is not an error.
    std::size_t stop_device(const std::string &device_id);
    void        clear();

    bool                     active(const std::string &device_id, const std::string &characteristic_uuid) const;
    std::size_t              size() const;
    std::vector<std::string> keys() const;

  private:
    struct Entry
    {
        std::uint64_t                     serial = 0;
        std::string                       service_uuid;  // canonical, as given to start()
        std::unique_ptr<NotificationTask> task;  // null while start() is in flight
        ResolvedCharacteristic            target;
    };

    static std::string key_of(const std::string &device_id, const std::string &char_uuid);
    void               release(Entry &e);
    void               drop_reservation(const std::string &key, std::uint64_t serial);

    GattResolver               &resolver_;
    std::shared_ptr<IEventSink> sink_;
    mutable std::mutex          mu_;
    std::map<std::string, Entry> tasks_;
    std::uint64_t               next_serial_ = 1;
};

}  // namespace session
