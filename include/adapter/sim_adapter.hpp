#pragma once
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "adapter/fanout.hpp"
#include "adapter/iadapter.hpp"

namespace adapter
{

// In-memory peripheral: written values read back unchanged, notifications are
// injected with emit_notification(). Used by tests and the "sim" backend.
class SimPeripheral final : public IPeripheral
{
  public:
    SimPeripheral(PeripheralProperties props, std::vector<Service> services);

    std::string          id() const override;
    webble::Status       properties(PeripheralProperties &out) override;
    bool                 is_connected() override;
    webble::Status       connect() override;
    webble::Status       disconnect() override;
    webble::Status       discover_services() override;
    std::vector<Service> services() override;

    webble::Status read(const Characteristic &c, Bytes &out) override;
    webble::Status write(const Characteristic &c, const Bytes &data, WriteType type) override;
    webble::Status read_descriptor(const Characteristic &c,
                                   const Descriptor     &d,
                                   Bytes                &out) override;
    webble::Status write_descriptor(const Characteristic &c,
                                    const Descriptor     &d,
                                    const Bytes          &data) override;
    webble::Status subscribe(const Characteristic &c) override;
    webble::Status unsubscribe(const Characteristic &c) override;
    std::shared_ptr<NotificationStream> notifications() override;

    // ---- driver hooks ----
    void set_value(const std::string &char_uuid, Bytes value);
    // Delivered only while connected and subscribed; returns whether it was.
    bool emit_notification(const std::string &char_uuid, const Bytes &value);
    // Remote side drops the link (publishes DeviceDisconnected)
    void drop_link();
    void set_connect_error(webble::Status st);
    void set_unsubscribe_error(webble::Status st);

    int  connect_calls() const;
    int  discover_calls() const;
    int  subscribe_calls() const;
    int  unsubscribe_calls() const;
    bool subscribed(const std::string &char_uuid) const;

  private:
    friend class SimAdapter;
    void attach(const std::shared_ptr<EventHub> &hub);
    void publish(EventKind kind);

    const Characteristic *find_char_locked(const std::string &uuid) const;

    mutable std::mutex                             mu_;
    PeripheralProperties                           props_;
    std::vector<Service>                           all_services_;
    bool                                           connected_  = false;
    bool                                           discovered_ = false;
    std::map<std::string, Bytes>                   values_;       // char uuid
    std::map<std::string, Bytes>                   desc_values_;  // "char|desc"
    std::set<std::string>                          subscribed_;
    Fanout<ValueNotification>                      notify_;
    std::weak_ptr<EventHub>                        hub_;
    webble::Status                                 connect_error_;
    webble::Status                                 unsubscribe_error_;
    int                                            connect_calls_     = 0;
    int                                            discover_calls_    = 0;
    int                                            subscribe_calls_   = 0;
    int                                            unsubscribe_calls_ = 0;
};

class SimAdapter final : public IAdapter
{
  public:
    SimAdapter();
    ~SimAdapter() override;

    std::string    name() const override { return "sim"; }
    webble::Status available(bool &out) override;
    webble::Status start_scan(const ScanFilter &filter) override;
    webble::Status stop_scan() override;
    webble::Status peripherals(std::vector<PeripheralPtr> &out) override;
    webble::Status events(std::shared_ptr<EventStream> &out) override;

    // Becomes visible `appear_after` into the first scan (0 => known up front)
    void add_peripheral(const std::shared_ptr<SimPeripheral> &p,
                        std::chrono::milliseconds             appear_after = {});
    void remove_peripheral(const std::string &id);
    void emit(const AdapterEvent &ev);

    void set_available(bool v);
    void set_events_error(webble::Status st);
    void set_stop_scan_error(webble::Status st);

    int        start_scan_calls() const;
    int        stop_scan_calls() const;
    bool       scanning() const;
    ScanFilter last_scan_filter() const;

  private:
    struct Entry
    {
        std::shared_ptr<SimPeripheral> peripheral;
        std::chrono::milliseconds      appear_after{};
        bool                           seen = false;
    };

    mutable std::mutex                    mu_;
    std::shared_ptr<EventHub>             hub_;
    std::vector<Entry>                    entries_;
    bool                                  available_ = true;
    bool                                  scanning_  = false;
    bool                                  scanned_   = false;
    std::chrono::steady_clock::time_point scan_started_{};
    ScanFilter                            last_filter_{};
    webble::Status                        events_error_;
    webble::Status                        stop_scan_error_;
    int                                   start_scan_calls_ = 0;
    int                                   stop_scan_calls_  = 0;
};

}  // namespace adapter
