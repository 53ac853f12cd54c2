#include <algorithm>
#include <chrono>

#include "session/event_sink.hpp"
#include "session/selection.hpp"
#include "util/log.hpp"

namespace session
{

SelectionResult FirstMatchSelection::select(const SelectionContext &ctx)
{
    std::promise<std::optional<std::string>> p;
    if (ctx.devices.empty())
        p.set_value(std::nullopt);
    else
        p.set_value(ctx.devices.front().id);
    return p.get_future();
}

// ---------------- EventSinkSurface ----------------
void EventSinkSurface::open(const std::string &request_id, const gatt::CandidateUpdate &initial)
{
    LOG_INFO("Selection %s opened with %zu candidates", request_id.c_str(),
             initial.devices.size());
    sink_->on_candidates(request_id, initial);
}

void EventSinkSurface::update(const std::string &request_id, const gatt::CandidateUpdate &update)
{
    sink_->on_candidates(request_id, update);
}

void EventSinkSurface::close(const std::string &request_id)
{
    LOG_DEBUG("Selection %s closed", request_id.c_str());
}

// ---------------- SelectionResponses ----------------
std::shared_ptr<SelectionResponses::Channel> SelectionResponses::subscribe(
    const std::string &request_id)
{
    auto ch = std::make_shared<Channel>();
    std::lock_guard<std::mutex> lk(mu_);
    subs_[request_id] = ch;
    return ch;
}

bool SelectionResponses::respond(const std::string &request_id, std::optional<std::string> device_id)
{
    std::shared_ptr<Channel> ch;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = subs_.find(request_id);
        if (it == subs_.end())
            return false;
        ch = it->second;
    }
    return ch->push(std::move(device_id));
}

void SelectionResponses::unsubscribe(const std::string &request_id)
{
    std::shared_ptr<Channel> ch;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = subs_.find(request_id);
        if (it == subs_.end())
            return;
        ch = it->second;
        subs_.erase(it);
    }
    ch->close();
}

std::vector<std::string> SelectionResponses::pending() const
{
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> ids;
    for (const auto &kv : subs_)
        ids.push_back(kv.first);
    return ids;
}

// ---------------- InteractiveSelection ----------------
namespace
{
struct SelectionGuard
{
    ISelectionSurface  &surface;
    SelectionResponses &responses;
    std::string         request_id;

    ~SelectionGuard()
    {
        responses.unsubscribe(request_id);
        surface.close(request_id);
    }
};
}  // namespace

SelectionResult InteractiveSelection::select(const SelectionContext &ctx)
{
    // Subscribe before the surface is shown so an immediate answer is not lost
    auto resp = responses_.subscribe(ctx.request_id);
    surface_.open(ctx.request_id, gatt::CandidateUpdate{ctx.devices, ctx.updates == nullptr});

    return std::async(std::launch::async, [this, ctx, resp]() {
        SelectionGuard g{surface_, responses_, ctx.request_id};
        return wait_for_choice(ctx, resp);
    });
}

// ======================================================================
// Function: wait_for_choice
// - In: context, response channel for ctx.request_id
// - Out: chosen id, or nullopt on timeout / cancel / explicit cancel reply
// - Note: forwards streaming updates to the surface while waiting
// ======================================================================
std::optional<std::string> InteractiveSelection::wait_for_choice(
    const SelectionContext &ctx, const std::shared_ptr<SelectionResponses::Channel> &resp)
{
    using clock         = std::chrono::steady_clock;
    const auto deadline = clock::now() + cfg_.timeout;
    const auto slice    = std::chrono::milliseconds(50);

    for (;;)
    {
        if (ctx.cancel && ctx.cancel->cancelled())
        {
            LOG_INFO("Selection %s aborted by the scan", ctx.request_id.c_str());
            return std::nullopt;
        }

        if (ctx.updates)
        {
            gatt::CandidateUpdate u;
            while (ctx.updates->try_pop(u))
                surface_.update(ctx.request_id, u);
        }

        const auto now = clock::now();
        if (now >= deadline)
        {
            LOG_INFO("Selection %s timed out", ctx.request_id.c_str());
            return std::nullopt;
        }

        const auto wait = std::min<clock::duration>(slice, deadline - now);
        std::optional<std::string> choice;
        if (resp->pop_for(choice, wait))
        {
            if (choice)
                LOG_INFO("Selection %s resolved to %s", ctx.request_id.c_str(), choice->c_str());
            else
                LOG_INFO("Selection %s cancelled", ctx.request_id.c_str());
            return choice;
        }
        if (resp->closed())
            return std::nullopt;
    }
}

}  // namespace session
