// tests/test_commands.cpp
#include <chrono>
#include <future>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

#include "ctl/commands.hpp"
#include "session/session_manager.hpp"
#include "test_support.hpp"

using namespace test_support;
using namespace std::chrono_literals;

class CommandsTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        sim = std::make_shared<adapter::SimAdapter>();
        hr  = make_hr("AA:00:00:00:00:01");
        hr->set_value(HR_LOC, {0x01});
        sim->add_peripheral(hr);
        sim->add_peripheral(make_plain("AA:00:00:00:00:02", std::string("Tag"), {"180f"}));
    }

    void open(std::unique_ptr<session::ISelectionHandler> selection = nullptr)
    {
        session::SessionConfig cfg;
        cfg.poll_interval = 10ms;
        ASSERT_TRUE(session::SessionManager::create(sim, std::move(selection), sink, cfg, mgr).ok());
    }

    std::string run(const std::string &line) { return ctl::handle_line(*mgr, responses, line); }

    std::shared_ptr<adapter::SimAdapter>     sim;
    std::shared_ptr<adapter::SimPeripheral>  hr;
    std::shared_ptr<RecordingSink>           sink = std::make_shared<RecordingSink>();
    session::SelectionResponses              responses;
    std::unique_ptr<session::SessionManager> mgr;
};

TEST(ParseRequestArgs, AcceptsEveryForm)
{
    gatt::RequestDeviceOptions o;
    ASSERT_TRUE(ctl::parse_request_args({"filter:name=HR,services=180d+180f", "filter:prefix=Dem",
                                         "optional=2a19", "timeout=250"},
                                        o)
                    .ok());
    ASSERT_EQ(o.filters.size(), 2u);
    EXPECT_EQ(o.filters[0].name, std::optional<std::string>("HR"));
    EXPECT_EQ(o.filters[0].services, (std::vector<std::string>{"180d", "180f"}));
    EXPECT_EQ(o.filters[1].name_prefix, std::optional<std::string>("Dem"));
    EXPECT_EQ(o.optional_services, std::vector<std::string>{"2a19"});
    EXPECT_EQ(o.scan_timeout, 250ms);
    EXPECT_FALSE(o.accept_all_devices);

    ASSERT_TRUE(ctl::parse_request_args({"accept_all"}, o).ok());
    EXPECT_TRUE(o.accept_all_devices);
    EXPECT_TRUE(o.filters.empty());
}

TEST(ParseRequestArgs, RejectsUnknownTokens)
{
    gatt::RequestDeviceOptions o;
    EXPECT_EQ(ctl::parse_request_args({"everything"}, o).kind(), webble::ErrorKind::InvalidRequest);
    EXPECT_EQ(ctl::parse_request_args({"timeout=soon"}, o).kind(), webble::ErrorKind::InvalidRequest);
    EXPECT_EQ(ctl::parse_request_args({"filter:color=red"}, o).kind(),
              webble::ErrorKind::InvalidRequest);
    EXPECT_EQ(ctl::parse_request_args({"filter:name"}, o).kind(), webble::ErrorKind::InvalidRequest);
}

TEST(SplitWords, CollapsesWhitespace)
{
    EXPECT_EQ(ctl::split_words("  READ  a\tb c \r"), (std::vector<std::string>{"READ", "a", "b", "c"}));
    EXPECT_TRUE(ctl::split_words("   ").empty());
}

TEST_F(CommandsTest, AvailabilityAndDevices)
{
    open();
    EXPECT_EQ(run("AVAILABILITY"), "OK true");
    sim->set_available(false);
    EXPECT_EQ(run("AVAILABILITY"), "OK false");
    EXPECT_EQ(run("DEVICES"), "OK []");
}

TEST_F(CommandsTest, RequestThenGattOperations)
{
    open();
    std::string r = run("REQUEST filter:services=180d timeout=300");
    ASSERT_EQ(r.rfind("OK {id=AA:00:00:00:00:01", 0), 0u) << r;

    EXPECT_EQ(run("DEVICES").rfind("OK [{id=AA:00:00:00:00:01", 0), 0u);

    r = run("CONNECT AA:00:00:00:00:01");
    ASSERT_EQ(r.rfind("OK {device=AA:00:00:00:00:01 connected=1", 0), 0u) << r;

    r = run("SERVICES AA:00:00:00:00:01 180f");
    EXPECT_EQ(r.rfind("OK [{uuid=" + BAT_SVC + " primary=1", 0), 0u) << r;

    r = run("CHARS AA:00:00:00:00:01 180d 2a37");
    EXPECT_EQ(r, "OK [{uuid=" + HR_MEAS + " service=" + HR_SVC + " props=notify descriptors=" +
                     CCCD + "}]");

    EXPECT_EQ(run("READ AA:00:00:00:00:01 180d 2a38"), "OK AQ==");
    EXPECT_EQ(run("WRITE AA:00:00:00:00:01 180d 2a39 AQ== noresp"), "OK");
    EXPECT_EQ(run("WRITEDESC AA:00:00:00:00:01 180d 2a37 2902 AQA="), "OK");
    EXPECT_EQ(run("READDESC AA:00:00:00:00:01 180d 2a37 2902"), "OK AQA=");

    EXPECT_EQ(run("NOTIFY AA:00:00:00:00:01 180d 2a37 on"), "OK");
    EXPECT_EQ(run("NOTIFY AA:00:00:00:00:01 180d 2a37 on").rfind("ERR NotificationsAlreadyActive", 0),
              0u);
    EXPECT_EQ(run("NOTIFY AA:00:00:00:00:01 180d 2a37 off"), "OK");

    EXPECT_EQ(run("DISCONNECT AA:00:00:00:00:01"), "OK");
    EXPECT_EQ(run("FORGET AA:00:00:00:00:01"), "OK");
    EXPECT_EQ(run("DEVICES"), "OK []");
}

TEST_F(CommandsTest, ErrorsBecomeErrReplies)
{
    open();
    EXPECT_EQ(run("CONNECT AA:00:00:00:00:09"), "ERR DeviceNotFound: Device AA:00:00:00:00:09 not found");
    EXPECT_EQ(run("REQUEST"), "ERR InvalidRequest: Either acceptAllDevices must be true or at least one "
                              "filter must be given");
    EXPECT_EQ(run("REQUEST filter:services=heart timeout=50"), "ERR InvalidUuid: Invalid UUID 'heart'");
    EXPECT_EQ(run("REQUEST filter:name=Nobody timeout=50").rfind("ERR DeviceNotFound", 0), 0u);
    EXPECT_EQ(run("WRITE AA:00:00:00:00:01 180d 2a39 !!!").rfind("ERR InvalidRequest", 0), 0u);
}

TEST_F(CommandsTest, UsageAndUnknownCommands)
{
    open();
    EXPECT_EQ(run(""), "ERR InvalidRequest: Empty command");
    EXPECT_EQ(run("FROB x"), "ERR InvalidRequest: Unknown command 'FROB'");
    EXPECT_EQ(run("READ a b"), "ERR InvalidRequest: usage: READ <id> <svc> <chr>");
    EXPECT_EQ(run("NOTIFY a b c maybe"), "ERR InvalidRequest: usage: NOTIFY <id> <svc> <chr> on|off");
    EXPECT_EQ(run("WRITE a b c d later"),
              "ERR InvalidRequest: usage: WRITE <id> <svc> <chr> <b64> [noresp]");
}

TEST_F(CommandsTest, SelectWithoutPendingRequest)
{
    open();
    EXPECT_EQ(run("SELECT req-1 AA:00:00:00:00:01"), "ERR InvalidRequest: No pending selection req-1");
    EXPECT_EQ(run("CANCEL req-1"), "ERR InvalidRequest: No pending selection req-1");
    EXPECT_EQ(run("QUIT"), "OK");
}

TEST_F(CommandsTest, SelectAnswersInteractiveRequest)
{
    session::EventSinkSurface surface(sink);
    open(std::make_unique<session::InteractiveSelection>(
        session::InteractiveSelection::Config{true, 5000ms}, surface, responses));

    auto pending = std::async(std::launch::async, [&] { return run("REQUEST accept_all timeout=100"); });
    ASSERT_TRUE(eventually([&] { return !responses.pending().empty(); }, 3s));

    const std::string req = responses.pending().front();
    EXPECT_EQ(run("SELECT " + req + " AA:00:00:00:00:02"), "OK");

    std::string r = pending.get();
    EXPECT_EQ(r.rfind("OK {id=AA:00:00:00:00:02 name=\"Tag\"", 0), 0u) << r;
}

TEST_F(CommandsTest, QuitReleasesPendingSelection)
{
    session::EventSinkSurface surface(sink);
    open(std::make_unique<session::InteractiveSelection>(
        session::InteractiveSelection::Config{true, 5000ms}, surface, responses));

    auto pending = std::async(std::launch::async, [&] { return run("REQUEST accept_all timeout=100"); });
    ASSERT_TRUE(eventually([&] { return !responses.pending().empty(); }, 3s));

    EXPECT_EQ(run("QUIT"), "OK");
    EXPECT_EQ(pending.get(), "ERR SelectionCancelled: Device selection was cancelled");
}
