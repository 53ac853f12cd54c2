#pragma once
#include <atomic>
#include <memory>
#include <thread>

#include "adapter/iadapter.hpp"
#include "session/event_sink.hpp"
#include "session/notification_registry.hpp"

namespace session
{

// Drains the adapter's lifecycle events. On DeviceDisconnected it removes the
// device's notification tasks, then emits exactly one disconnect notice.
class AdapterListener
{
  public:
    AdapterListener(adapter::IAdapter           &adapter,
                    NotificationRegistry        &registry,
                    std::shared_ptr<IEventSink> sink)
        : adapter_(adapter), registry_(registry), sink_(std::move(sink))
    {
    }
    ~AdapterListener();

    AdapterListener(const AdapterListener &)            = delete;
    AdapterListener &operator=(const AdapterListener &) = delete;

    // Subscribes once. A subscribe failure is logged and the listener stays
    // down for the lifetime of the session (no retry).
    void start();
    void stop();
    bool running() const { return running_.load(); }

  private:
    void run();

    adapter::IAdapter                     &adapter_;
    NotificationRegistry                  &registry_;
    std::shared_ptr<IEventSink>            sink_;
    std::shared_ptr<adapter::EventStream>  events_;
    std::thread                            th_;
    std::atomic_bool                       running_{false};
};

}  // namespace session
