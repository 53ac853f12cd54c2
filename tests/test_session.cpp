// tests/test_session.cpp
#include <chrono>
#include <future>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "session/session_manager.hpp"
#include "test_support.hpp"

using namespace test_support;
using namespace std::chrono_literals;

namespace
{
gatt::RequestDeviceOptions hr_request(std::chrono::milliseconds timeout = 300ms)
{
    gatt::RequestDeviceOptions o;
    gatt::DeviceFilterSpec     f;
    f.services = {"180d"};
    o.filters.push_back(f);
    o.scan_timeout = timeout;
    return o;
}

// Arbiter that records what it was offered and picks a fixed id
class ScriptedSelection final : public session::ISelectionHandler
{
  public:
    ScriptedSelection(std::optional<std::string> pick, bool full_scan)
        : pick_(std::move(pick)), full_scan_(full_scan)
    {
    }

    session::SelectionResult select(const session::SelectionContext &ctx) override
    {
        ++calls;
        offered   = ctx.devices;
        streaming = ctx.updates != nullptr;
        std::promise<std::optional<std::string>> p;
        p.set_value(pick_);
        return p.get_future();
    }
    bool wants_full_scan() const override { return full_scan_; }

    int                                 calls     = 0;
    bool                                streaming = false;
    std::vector<gatt::DeviceDescriptor> offered;

  private:
    std::optional<std::string> pick_;
    bool                       full_scan_;
};
}  // namespace

class SessionTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        sim = std::make_shared<adapter::SimAdapter>();
        hr  = make_hr("AA:00:00:00:00:01");
        sim->add_peripheral(hr);
        sim->add_peripheral(make_plain("AA:00:00:00:00:02", std::string("Tag"), {"180f"}));
    }

    void open(std::unique_ptr<session::ISelectionHandler> selection = nullptr)
    {
        session::SessionConfig cfg;
        cfg.poll_interval = 10ms;
        ASSERT_TRUE(session::SessionManager::create(sim, std::move(selection), sink, cfg, mgr).ok());
    }

    void request_hr()
    {
        gatt::DeviceDescriptor d;
        ASSERT_TRUE(mgr->request_device(hr_request(), d).ok());
        ASSERT_EQ(d.id, "AA:00:00:00:00:01");
    }

    std::shared_ptr<adapter::SimAdapter>     sim;
    std::shared_ptr<adapter::SimPeripheral>  hr;
    std::shared_ptr<RecordingSink>           sink = std::make_shared<RecordingSink>();
    std::unique_ptr<session::SessionManager> mgr;
};

TEST(SessionCreate, NullAdapterIsNoAdapter)
{
    std::unique_ptr<session::SessionManager> mgr;
    webble::Status st = session::SessionManager::create(nullptr, nullptr, nullptr, {}, mgr);
    EXPECT_EQ(st.kind(), webble::ErrorKind::NoAdapter);
    EXPECT_TRUE(mgr == nullptr);
}

TEST_F(SessionTest, AvailabilityFollowsAdapter)
{
    open();
    EXPECT_TRUE(mgr->listening());
    bool on = false;
    ASSERT_TRUE(mgr->get_availability(on).ok());
    EXPECT_TRUE(on);
    sim->set_available(false);
    ASSERT_TRUE(mgr->get_availability(on).ok());
    EXPECT_FALSE(on);
}

TEST_F(SessionTest, RequestDeviceFirstMatchEndsScanEarly)
{
    open();
    const auto             t0 = std::chrono::steady_clock::now();
    gatt::DeviceDescriptor d;
    ASSERT_TRUE(mgr->request_device(hr_request(5000ms), d).ok());
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 1000ms);
    EXPECT_EQ(d.id, "AA:00:00:00:00:01");
    ASSERT_TRUE(d.name.has_value());
    EXPECT_EQ(*d.name, "HR Strap");
    EXPECT_EQ(d.uuids, std::vector<std::string>{HR_SVC});
    EXPECT_TRUE(mgr->cache().contains("AA:00:00:00:00:01"));
    EXPECT_FALSE(sim->scanning());
}

TEST_F(SessionTest, InvalidRequestNeverScans)
{
    open();
    gatt::DeviceDescriptor     d;
    gatt::RequestDeviceOptions none;
    EXPECT_EQ(mgr->request_device(none, d).kind(), webble::ErrorKind::InvalidRequest);

    gatt::RequestDeviceOptions bad = hr_request();
    bad.filters[0].services        = {"nope"};
    EXPECT_EQ(mgr->request_device(bad, d).kind(), webble::ErrorKind::InvalidUuid);
    EXPECT_EQ(sim->start_scan_calls(), 0);
}

TEST_F(SessionTest, NothingMatchingIsDeviceNotFound)
{
    auto sel = std::make_unique<ScriptedSelection>(std::string("x"), false);
    auto raw = sel.get();
    open(std::move(sel));

    gatt::RequestDeviceOptions o;
    gatt::DeviceFilterSpec     f;
    f.name = "Nobody";
    o.filters.push_back(f);
    o.scan_timeout = 200ms;

    gatt::DeviceDescriptor d;
    const auto             t0 = std::chrono::steady_clock::now();
    EXPECT_EQ(mgr->request_device(o, d).kind(), webble::ErrorKind::DeviceNotFound);
    const auto dt = std::chrono::steady_clock::now() - t0;
    EXPECT_GE(dt, 200ms);
    EXPECT_LT(dt, 400ms);
    EXPECT_EQ(raw->calls, 0);
    EXPECT_FALSE(sim->scanning());
}

TEST_F(SessionTest, FullScanArbiterSeesEveryMatch)
{
    sim->add_peripheral(make_hr("AA:00:00:00:00:03", "Late HR"), 40ms);
    auto sel = std::make_unique<ScriptedSelection>(std::string("AA:00:00:00:00:03"), true);
    auto raw = sel.get();
    open(std::move(sel));

    gatt::DeviceDescriptor d;
    ASSERT_TRUE(mgr->request_device(hr_request(150ms), d).ok());
    EXPECT_EQ(d.id, "AA:00:00:00:00:03");
    EXPECT_EQ(raw->calls, 1);
    EXPECT_FALSE(raw->streaming);
    ASSERT_EQ(raw->offered.size(), 2u);
    EXPECT_EQ(raw->offered[0].id, "AA:00:00:00:00:01");
}

TEST_F(SessionTest, CancelledSelection)
{
    open(std::make_unique<ScriptedSelection>(std::nullopt, true));
    gatt::DeviceDescriptor d;
    EXPECT_EQ(mgr->request_device(hr_request(30ms), d).kind(), webble::ErrorKind::SelectionCancelled);
    EXPECT_FALSE(mgr->cache().contains("AA:00:00:00:00:01"));
}

TEST_F(SessionTest, SelectionOfUnknownIdIsDeviceNotFound)
{
    open(std::make_unique<ScriptedSelection>(std::string("AA:00:00:00:00:02"), true));
    gatt::DeviceDescriptor d;
    // the tag does not match the heart-rate filter
    EXPECT_EQ(mgr->request_device(hr_request(30ms), d).kind(), webble::ErrorKind::DeviceNotFound);
}

TEST_F(SessionTest, InteractiveStreamingSelectionThroughResponses)
{
    RecordingSink                        *events = sink.get();
    session::SelectionResponses           responses;
    session::EventSinkSurface             surface(sink);
    session::InteractiveSelection::Config icfg;
    icfg.full_scan = false;
    icfg.timeout   = 2000ms;
    open(std::make_unique<session::InteractiveSelection>(icfg, surface, responses));

    auto pending = std::async(std::launch::async, [&] {
        gatt::DeviceDescriptor d;
        webble::Status         st = mgr->request_device(hr_request(3000ms), d);
        return std::make_pair(st, d);
    });

    ASSERT_TRUE(events->wait([&] { return !events->candidates.empty(); }));
    const std::string req = events->snapshot_candidates()[0].first;
    EXPECT_EQ(req.rfind("req-", 0), 0u);
    EXPECT_FALSE(events->snapshot_candidates()[0].second.completed);

    ASSERT_TRUE(responses.respond(req, std::string("AA:00:00:00:00:01")));
    auto r = pending.get();
    ASSERT_TRUE(r.first.ok()) << r.first.to_string();
    EXPECT_EQ(r.second.id, "AA:00:00:00:00:01");
    EXPECT_FALSE(sim->scanning());
    mgr.reset();
}

TEST_F(SessionTest, GetDevicesListsGrantedDevicesAndForgetRemoves)
{
    open();
    std::vector<gatt::DeviceDescriptor> devs;
    ASSERT_TRUE(mgr->get_devices(devs).ok());
    EXPECT_TRUE(devs.empty());

    request_hr();
    ASSERT_TRUE(mgr->get_devices(devs).ok());
    ASSERT_EQ(devs.size(), 1u);
    EXPECT_EQ(devs[0].id, "AA:00:00:00:00:01");

    EXPECT_TRUE(mgr->forget_device("AA:00:00:00:00:01").ok());
    ASSERT_TRUE(mgr->get_devices(devs).ok());
    EXPECT_TRUE(devs.empty());
    EXPECT_TRUE(mgr->forget_device("AA:00:00:00:00:01").ok());
}

TEST_F(SessionTest, ConnectAndBrowse)
{
    open();
    request_hr();

    gatt::GattServerInfo info;
    ASSERT_TRUE(mgr->connect_gatt("AA:00:00:00:00:01", info).ok());
    EXPECT_TRUE(info.connected);

    std::vector<gatt::DeviceDescriptor> devs;
    ASSERT_TRUE(mgr->get_devices(devs).ok());
    EXPECT_TRUE(devs[0].connected);

    std::vector<gatt::BluetoothService> svcs;
    ASSERT_TRUE(mgr->get_primary_services("AA:00:00:00:00:01", std::nullopt, svcs).ok());
    EXPECT_EQ(svcs.size(), 2u);

    std::vector<gatt::BluetoothCharacteristic> chars;
    ASSERT_TRUE(mgr->get_characteristics("AA:00:00:00:00:01", "180f", std::nullopt, chars).ok());
    ASSERT_EQ(chars.size(), 1u);
    EXPECT_EQ(chars[0].uuid, BAT_LVL);

    EXPECT_EQ(mgr->connect_gatt("FF:FF:FF:FF:FF:FF", info).kind(), webble::ErrorKind::DeviceNotFound);
}

TEST_F(SessionTest, ReadWriteCharacteristicAsBase64)
{
    open();
    request_hr();
    hr->set_value(HR_LOC, {0x01});

    std::string v;
    ASSERT_TRUE(mgr->read_characteristic_value("AA:00:00:00:00:01", "180d", "2a38", v).ok());
    EXPECT_EQ(v, "AQ==");

    ASSERT_TRUE(mgr->write_characteristic_value("AA:00:00:00:00:01", "180d", "2a39", "AQID").ok());
    ASSERT_TRUE(mgr->write_characteristic_value("AA:00:00:00:00:01", "180d", "2a39", "BAU=", false).ok());

    EXPECT_EQ(mgr->write_characteristic_value("AA:00:00:00:00:01", "180d", "2a39", "%%%").kind(),
              webble::ErrorKind::InvalidRequest);
    // not writable
    EXPECT_EQ(mgr->write_characteristic_value("AA:00:00:00:00:01", "180d", "2a38", "AQ==").kind(),
              webble::ErrorKind::Adapter);
    EXPECT_EQ(mgr->read_characteristic_value("AA:00:00:00:00:01", "180d", "2a99", v).kind(),
              webble::ErrorKind::CharacteristicNotFound);
}

TEST_F(SessionTest, DescriptorRoundTrip)
{
    open();
    request_hr();

    ASSERT_TRUE(
        mgr->write_descriptor_value("AA:00:00:00:00:01", "180d", "2a37", "2902", "AQA=").ok());
    std::string v;
    ASSERT_TRUE(mgr->read_descriptor_value("AA:00:00:00:00:01", "180d", "2a37", "2902", v).ok());
    EXPECT_EQ(v, "AQA=");

    EXPECT_EQ(mgr->read_descriptor_value("AA:00:00:00:00:01", "180d", "2a37", "2901", v).kind(),
              webble::ErrorKind::DescriptorNotFound);
}

TEST_F(SessionTest, NotificationsFlowUntilDisconnect)
{
    open();
    request_hr();

    ASSERT_TRUE(mgr->start_notifications("AA:00:00:00:00:01", "180d", "2a37").ok());
    EXPECT_EQ(mgr->start_notifications("AA:00:00:00:00:01", "180d", "2a37").kind(),
              webble::ErrorKind::NotificationsAlreadyActive);

    ASSERT_TRUE(hr->emit_notification(HR_MEAS, {0x00, 0x50}));
    ASSERT_TRUE(sink->wait([&] { return sink->values.size() == 1; }));
    EXPECT_EQ(sink->snapshot_values()[0].value, "AFA=");

    ASSERT_TRUE(mgr->disconnect_gatt("AA:00:00:00:00:01").ok());
    ASSERT_TRUE(sink->wait([&] { return sink->disconnects.size() == 1; }));
    EXPECT_TRUE(eventually([&] { return mgr->notifications().size() == 0; }));
    EXPECT_EQ(mgr->stop_notifications("AA:00:00:00:00:01", "180d", "2a37").kind(),
              webble::ErrorKind::NotificationsNotActive);
}

TEST_F(SessionTest, StopNotifications)
{
    open();
    request_hr();
    ASSERT_TRUE(mgr->start_notifications("AA:00:00:00:00:01", "180d", "2a37").ok());
    ASSERT_TRUE(mgr->stop_notifications("AA:00:00:00:00:01", "180d", "2a37").ok());
    EXPECT_FALSE(hr->subscribed(HR_MEAS));
    EXPECT_EQ(mgr->notifications().size(), 0u);
}

TEST_F(SessionTest, ForgetStopsNotifications)
{
    open();
    request_hr();
    ASSERT_TRUE(mgr->start_notifications("AA:00:00:00:00:01", "180d", "2a37").ok());
    ASSERT_TRUE(mgr->forget_device("AA:00:00:00:00:01").ok());
    EXPECT_EQ(mgr->notifications().size(), 0u);
    EXPECT_FALSE(hr->subscribed(HR_MEAS));
}

TEST_F(SessionTest, TeardownReleasesSubscriptions)
{
    open();
    request_hr();
    ASSERT_TRUE(mgr->start_notifications("AA:00:00:00:00:01", "180d", "2a37").ok());
    mgr.reset();
    EXPECT_FALSE(hr->subscribed(HR_MEAS));
}
