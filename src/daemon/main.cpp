#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include "adapter/sim_adapter.hpp"
#include "ctl/commands.hpp"
#include "ctl/ipc.hpp"
#include "session/event_sink.hpp"
#include "session/selection.hpp"
#include "session/session_manager.hpp"
#include "util/cancel.hpp"
#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"
#if WEBBLE_HAVE_SDBUS
#include "adapter/bluez_adapter.hpp"
#endif

namespace
{

const char *const HEART_RATE_SVC = "0000180d-0000-1000-8000-00805f9b34fb";
const char *const HEART_RATE_MSR = "00002a37-0000-1000-8000-00805f9b34fb";
const char *const BODY_LOCATION  = "00002a38-0000-1000-8000-00805f9b34fb";
const char *const BATTERY_SVC    = "0000180f-0000-1000-8000-00805f9b34fb";
const char *const BATTERY_LEVEL  = "00002a19-0000-1000-8000-00805f9b34fb";
const char *const CCCD           = "00002902-0000-1000-8000-00805f9b34fb";
const char *const USER_DESC      = "00002901-0000-1000-8000-00805f9b34fb";

// Two demo peripherals for the sim backend: a heart-rate sensor known up
// front and a battery-only tag that shows up one second into the scan.
std::shared_ptr<adapter::SimAdapter> make_demo_adapter(std::shared_ptr<adapter::SimPeripheral> &hr)
{
    using namespace adapter;
    auto sim = std::make_shared<SimAdapter>();

    Characteristic hrm{HEART_RATE_MSR, "", PROP_NOTIFY, {Descriptor{CCCD}}};
    Characteristic loc{BODY_LOCATION, "", PROP_READ, {}};
    Characteristic bat{BATTERY_LEVEL, "", PROP_READ | PROP_NOTIFY, {Descriptor{USER_DESC}}};

    hr = std::make_shared<SimPeripheral>(
        PeripheralProperties{"AA:BB:CC:00:00:01", std::string("Demo HR"), {HEART_RATE_SVC}, -48},
        std::vector<Service>{Service{HEART_RATE_SVC, true, {hrm, loc}},
                             Service{BATTERY_SVC, true, {bat}}});
    hr->set_value(BODY_LOCATION, Bytes{0x01});  // chest
    hr->set_value(BATTERY_LEVEL, Bytes{87});

    auto tag = std::make_shared<SimPeripheral>(
        PeripheralProperties{"AA:BB:CC:00:00:02", std::string("Demo Tag"), {BATTERY_SVC}, -71},
        std::vector<Service>{Service{BATTERY_SVC, true, {bat}}});
    tag->set_value(BATTERY_LEVEL, Bytes{42});

    sim->add_peripheral(hr);
    sim->add_peripheral(tag, std::chrono::milliseconds(1000));
    return sim;
}

// Emits a heart-rate measurement once a second while someone listens
class DemoHeartbeat
{
  public:
    explicit DemoHeartbeat(std::shared_ptr<adapter::SimPeripheral> p) : p_(std::move(p))
    {
        th_ = std::thread([this] { run(); });
    }
    ~DemoHeartbeat()
    {
        cancel_.cancel();
        if (th_.joinable())
            th_.join();
    }

  private:
    void run()
    {
        std::uint8_t bpm = 60;
        while (!cancel_.wait_for(std::chrono::seconds(1)))
        {
            // flags=0 (uint8 bpm), value
            if (p_->emit_notification(HEART_RATE_MSR, adapter::Bytes{0x00, bpm}))
                LOG_DEBUG("[SIM] heartbeat %u bpm", (unsigned)bpm);
            bpm = bpm >= 90 ? 60 : static_cast<std::uint8_t>(bpm + 1);
        }
    }

    std::shared_ptr<adapter::SimPeripheral> p_;
    webble::Cancellation                    cancel_;
    std::thread                             th_;
};

}  // namespace

int main()
{
    webble::set_log_level_from_env("WEBBLE_LOG_LEVEL");
    const config::DaemonConfig cfg = config::load_config_from_env();

    std::string sock = cfg.ctl_sock.empty() ? constants::ctl_sock_path() : cfg.ctl_sock;
    sock             = ipc::expand_user(sock);

    LOG_SYSTEM("Config: backend=%s adapter=%s selection=%s selection_timeout_ms=%u full_scan=%d "
               "scan_poll_ms=%u sock=%s",
               config::backend_name(cfg.backend), cfg.adapter.c_str(),
               config::selection_mode_name(cfg.selection), cfg.selection_timeout_ms,
               cfg.full_scan ? 1 : 0, cfg.scan_poll_ms, sock.c_str());

    // Bind adapter backend
    std::shared_ptr<adapter::IAdapter>      adapter;
    std::shared_ptr<adapter::SimPeripheral> demo_hr;
    if (cfg.backend == config::Backend::Bluez)
    {
#if WEBBLE_HAVE_SDBUS
        std::shared_ptr<adapter::BluezAdapter> bluez;
        webble::Status                         st = adapter::BluezAdapter::open(cfg.adapter, bluez);
        if (!st.ok())
        {
            LOG_ERROR("BlueZ backend unavailable: %s", st.to_string().c_str());
            return 1;
        }
        adapter = bluez;
#else
        LOG_ERROR("webbled was built without sd-bus; WEBBLE_BACKEND=bluez is not available");
        return 1;
#endif
    }
    else
    {
        adapter = make_demo_adapter(demo_hr);
    }

    auto                        sink = std::make_shared<session::LogEventSink>();
    session::SelectionResponses responses;
    session::EventSinkSurface   surface(sink);

    std::unique_ptr<session::ISelectionHandler> selection;
    if (cfg.selection == config::SelectionMode::Interactive)
    {
        session::InteractiveSelection::Config icfg;
        icfg.full_scan = cfg.full_scan;
        icfg.timeout   = std::chrono::milliseconds(cfg.selection_timeout_ms);
        selection      = std::make_unique<session::InteractiveSelection>(icfg, surface, responses);
    }
    else
    {
        selection = std::make_unique<session::FirstMatchSelection>();
    }

    session::SessionConfig scfg;
    scfg.poll_interval = std::chrono::milliseconds(cfg.scan_poll_ms);

    std::unique_ptr<session::SessionManager> mgr;
    webble::Status st = session::SessionManager::create(adapter, std::move(selection), sink, scfg, mgr);
    if (!st.ok())
    {
        LOG_ERROR("Session start failed: %s", st.to_string().c_str());
        return 1;
    }

    std::unique_ptr<DemoHeartbeat> heartbeat;
    if (demo_hr)
        heartbeat = std::make_unique<DemoHeartbeat>(demo_hr);

    // IPC server
    bool ok = ipc::start_server(
        sock, [&](const std::string &line) { return ctl::handle_line(*mgr, responses, line); });
    if (!ok)
    {
        LOG_ERROR("start_server failed");
        return 1;
    }
    LOG_INFO("webbled stopped");
    return 0;
}
