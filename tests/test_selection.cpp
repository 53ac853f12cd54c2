// tests/test_selection.cpp
#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "session/selection.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;

namespace
{
gatt::DeviceDescriptor dev(const std::string &id)
{
    gatt::DeviceDescriptor d;
    d.id = id;
    return d;
}

session::SelectionContext ctx_with(const std::string &req, std::vector<gatt::DeviceDescriptor> ds)
{
    session::SelectionContext ctx;
    ctx.request_id = req;
    ctx.devices    = std::move(ds);
    ctx.cancel     = std::make_shared<webble::Cancellation>();
    return ctx;
}

class FakeSurface final : public session::ISelectionSurface
{
  public:
    void open(const std::string &req, const gatt::CandidateUpdate &initial) override
    {
        std::lock_guard<std::mutex> lk(mu);
        opened.push_back(req);
        updates.push_back(initial);
    }
    void update(const std::string &, const gatt::CandidateUpdate &u) override
    {
        std::lock_guard<std::mutex> lk(mu);
        updates.push_back(u);
    }
    void close(const std::string &req) override
    {
        std::lock_guard<std::mutex> lk(mu);
        closed.push_back(req);
    }

    size_t closed_count()
    {
        std::lock_guard<std::mutex> lk(mu);
        return closed.size();
    }
    std::vector<gatt::CandidateUpdate> all_updates()
    {
        std::lock_guard<std::mutex> lk(mu);
        return updates;
    }

    std::mutex                         mu;
    std::vector<std::string>           opened;
    std::vector<std::string>           closed;
    std::vector<gatt::CandidateUpdate> updates;
};
}  // namespace

TEST(FirstMatch, PicksFirstCandidateImmediately)
{
    session::FirstMatchSelection sel;
    EXPECT_FALSE(sel.wants_full_scan());

    auto f = sel.select(ctx_with("req-1", {dev("A"), dev("B")}));
    ASSERT_EQ(f.wait_for(0s), std::future_status::ready);
    auto v = f.get();
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, "A");

    auto none = sel.select(ctx_with("req-2", {}));
    EXPECT_FALSE(none.get().has_value());
}

TEST(SelectionResponses, RespondOnlyToSubscribers)
{
    session::SelectionResponses r;
    EXPECT_FALSE(r.respond("req-1", std::string("A")));

    auto ch = r.subscribe("req-1");
    EXPECT_EQ(r.pending(), std::vector<std::string>{"req-1"});
    EXPECT_TRUE(r.respond("req-1", std::string("A")));

    std::optional<std::string> got;
    ASSERT_TRUE(ch->try_pop(got));
    EXPECT_EQ(got, std::optional<std::string>("A"));

    r.unsubscribe("req-1");
    EXPECT_TRUE(ch->closed());
    EXPECT_TRUE(r.pending().empty());
    EXPECT_FALSE(r.respond("req-1", std::nullopt));
}

TEST(Interactive, ResolvesToTheUsersChoice)
{
    FakeSurface                   surface;
    session::SelectionResponses   responses;
    session::InteractiveSelection sel({true, 2000ms}, surface, responses);
    EXPECT_TRUE(sel.wants_full_scan());

    auto f = sel.select(ctx_with("req-7", {dev("A"), dev("B")}));
    ASSERT_EQ(surface.opened, std::vector<std::string>{"req-7"});
    ASSERT_TRUE(surface.all_updates().front().completed);  // full scan: list is final

    EXPECT_TRUE(responses.respond("req-7", std::string("B")));
    auto v = f.get();
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, "B");

    EXPECT_EQ(surface.closed_count(), 1u);
    EXPECT_TRUE(responses.pending().empty());
}

TEST(Interactive, ExplicitCancelYieldsNothing)
{
    FakeSurface                   surface;
    session::SelectionResponses   responses;
    session::InteractiveSelection sel({true, 2000ms}, surface, responses);

    auto f = sel.select(ctx_with("req-8", {dev("A")}));
    EXPECT_TRUE(responses.respond("req-8", std::nullopt));
    EXPECT_FALSE(f.get().has_value());
    EXPECT_EQ(surface.closed_count(), 1u);
    EXPECT_TRUE(responses.pending().empty());
}

TEST(Interactive, TimeoutReleasesSurfaceAndSubscription)
{
    FakeSurface                   surface;
    session::SelectionResponses   responses;
    session::InteractiveSelection sel({true, 80ms}, surface, responses);

    const auto t0 = std::chrono::steady_clock::now();
    auto       f  = sel.select(ctx_with("req-9", {dev("A")}));
    EXPECT_FALSE(f.get().has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - t0, 80ms);
    EXPECT_EQ(surface.closed_count(), 1u);
    EXPECT_TRUE(responses.pending().empty());
    // a late answer finds nobody waiting
    EXPECT_FALSE(responses.respond("req-9", std::string("A")));
}

TEST(Interactive, ScanCancellationAbortsTheWait)
{
    FakeSurface                   surface;
    session::SelectionResponses   responses;
    session::InteractiveSelection sel({false, 5000ms}, surface, responses);

    auto ctx = ctx_with("req-10", {dev("A")});
    auto f   = sel.select(ctx);
    ctx.cancel->cancel();
    ASSERT_EQ(f.wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(f.get().has_value());
    EXPECT_EQ(surface.closed_count(), 1u);
}

TEST(Interactive, StreamingUpdatesReachTheSurface)
{
    FakeSurface                   surface;
    session::SelectionResponses   responses;
    session::InteractiveSelection sel({false, 2000ms}, surface, responses);
    EXPECT_FALSE(sel.wants_full_scan());

    auto ctx    = ctx_with("req-11", {dev("A")});
    ctx.updates = std::make_shared<session::CandidateFeed>();
    auto f      = sel.select(ctx);
    EXPECT_FALSE(surface.all_updates().front().completed);

    ctx.updates->push(gatt::CandidateUpdate{{dev("A"), dev("B")}, false});
    ctx.updates->push(gatt::CandidateUpdate{{dev("A"), dev("B")}, true});
    ctx.updates->close();

    ASSERT_TRUE(test_support::eventually([&] { return surface.all_updates().size() == 3; }));
    auto ups = surface.all_updates();
    EXPECT_EQ(ups[1].devices.size(), 2u);
    EXPECT_TRUE(ups[2].completed);

    EXPECT_TRUE(responses.respond("req-11", std::string("B")));
    EXPECT_EQ(f.get(), std::optional<std::string>("B"));
}

TEST(EventSinkSurface, PublishesCandidateEvents)
{
    auto                      sink = std::make_shared<test_support::RecordingSink>();
    session::EventSinkSurface surface(sink);

    surface.open("req-1", gatt::CandidateUpdate{{dev("A")}, false});
    surface.update("req-1", gatt::CandidateUpdate{{dev("A"), dev("B")}, true});
    surface.close("req-1");

    auto c = sink->snapshot_candidates();
    ASSERT_EQ(c.size(), 2u);
    EXPECT_EQ(c[0].first, "req-1");
    EXPECT_EQ(c[1].second.devices.size(), 2u);
    EXPECT_TRUE(c[1].second.completed);
}
