// tests/test_listener.cpp
#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "session/adapter_listener.hpp"
#include "session/gatt_resolver.hpp"
#include "session/notification_registry.hpp"
#include "session/peripheral_cache.hpp"
#include "test_support.hpp"
#include "util/log.hpp"

using namespace test_support;

class ListenerTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        hr = make_hr("AA:00:00:00:00:01");
        sim.add_peripheral(hr);
    }

    adapter::SimAdapter                     sim;
    session::PeripheralCache                cache;
    session::GattResolver                   resolver{sim, cache};
    std::shared_ptr<RecordingSink>          sink = std::make_shared<RecordingSink>();
    session::NotificationRegistry           registry{resolver, sink};
    session::AdapterListener                listener{sim, registry, sink};
    std::shared_ptr<adapter::SimPeripheral> hr;
};

TEST_F(ListenerTest, LinkLossDropsTasksAndEmitsOneEvent)
{
    listener.start();
    ASSERT_TRUE(listener.running());
    ASSERT_TRUE(registry.start("AA:00:00:00:00:01", "180d", "2a37").ok());
    ASSERT_TRUE(registry.start("AA:00:00:00:00:01", "180f", "2a19").ok());

    hr->drop_link();

    ASSERT_TRUE(sink->wait([&] { return sink->disconnects.size() == 1; }));
    // the registry is emptied before the notice goes out
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(sink->snapshot_disconnects()[0], "AA:00:00:00:00:01");

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(sink->snapshot_disconnects().size(), 1u);
}

TEST_F(ListenerTest, LinkLossLeavesOtherDevicesTasksRunning)
{
    auto other = make_hr("AA:00:00:00:00:02", "Other");
    sim.add_peripheral(other);

    listener.start();
    ASSERT_TRUE(registry.start("AA:00:00:00:00:01", "180d", "2a37").ok());
    ASSERT_TRUE(registry.start("AA:00:00:00:00:02", "180d", "2a37").ok());

    hr->drop_link();
    ASSERT_TRUE(sink->wait([&] { return sink->disconnects.size() == 1; }));
    EXPECT_EQ(sink->snapshot_disconnects()[0], "AA:00:00:00:00:01");

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_FALSE(registry.active("AA:00:00:00:00:01", "2a37"));
    EXPECT_TRUE(registry.active("AA:00:00:00:00:02", "2a37"));
    EXPECT_TRUE(other->subscribed(HR_MEAS));
    EXPECT_EQ(other->unsubscribe_calls(), 0);

    // and it still forwards values
    ASSERT_TRUE(other->emit_notification(HR_MEAS, {0x00, 0x50}));
    ASSERT_TRUE(sink->wait([&] { return sink->values.size() == 1; }));
    EXPECT_EQ(sink->snapshot_values()[0].device_id, "AA:00:00:00:00:02");
}

TEST_F(ListenerTest, OtherEventsAreIgnored)
{
    listener.start();
    sim.emit(adapter::AdapterEvent{adapter::EventKind::DeviceDiscovered, "AA:00:00:00:00:01"});
    sim.emit(adapter::AdapterEvent{adapter::EventKind::DeviceConnected, "AA:00:00:00:00:01"});
    sim.emit(adapter::AdapterEvent{adapter::EventKind::DeviceUpdated, "AA:00:00:00:00:01"});
    sim.emit(adapter::AdapterEvent{adapter::EventKind::DeviceDisconnected, "AA:00:00:00:00:09"});

    ASSERT_TRUE(sink->wait([&] { return sink->disconnects.size() == 1; }));
    EXPECT_EQ(sink->snapshot_disconnects()[0], "AA:00:00:00:00:09");
}

TEST_F(ListenerTest, SubscribeFailureLeavesListenerDown)
{
    sim.set_events_error(webble::Status::adapter_error("no signals"));
    webble::set_log_level(webble::Level::Info);
    testing::internal::CaptureStderr();
    listener.start();
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_FALSE(listener.running());
    EXPECT_NE(err.find("[ERROR]"), std::string::npos);
    hr->drop_link();
    EXPECT_TRUE(sink->snapshot_disconnects().empty());
}

TEST_F(ListenerTest, StopJoinsAndIsRepeatable)
{
    listener.start();
    listener.stop();
    EXPECT_FALSE(listener.running());
    listener.stop();
    EXPECT_FALSE(listener.running());
}
