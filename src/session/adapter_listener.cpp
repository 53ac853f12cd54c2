#include "session/adapter_listener.hpp"
#include "util/log.hpp"

namespace session
{

AdapterListener::~AdapterListener()
{
    stop();
}

void AdapterListener::start()
{
    if (running_.load())
        return;
    webble::Status st = adapter_.events(events_);
    if (!st.ok() || !events_)
    {
        LOG_ERROR("Adapter event subscription failed, disconnect tracking disabled: %s",
                  st.to_string().c_str());
        events_.reset();
        return;
    }
    running_ = true;
    th_      = std::thread([this] { run(); });
}

void AdapterListener::stop()
{
    if (events_)
        events_->close();
    if (th_.joinable())
        th_.join();
    running_ = false;
}

void AdapterListener::run()
{
    LOG_DEBUG("Adapter listener up (%s)", adapter_.name().c_str());
    adapter::AdapterEvent ev;
    while (events_->pop(ev))
    {
        switch (ev.kind)
        {
            case adapter::EventKind::DeviceDisconnected:
            {
                LOG_INFO("%s disconnected", ev.peripheral_id.c_str());
                registry_.stop_device(ev.peripheral_id);
                sink_->on_gatt_disconnected(ev.peripheral_id);
                break;
            }
            case adapter::EventKind::DeviceConnected:
                LOG_DEBUG("%s connected", ev.peripheral_id.c_str());
                break;
            case adapter::EventKind::DeviceDiscovered:
            case adapter::EventKind::DeviceUpdated:
                break;
        }
    }
    running_ = false;
    LOG_DEBUG("Adapter listener down");
}

}  // namespace session
