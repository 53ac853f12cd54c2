#pragma once
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "gatt/models.hpp"
#include "util/cancel.hpp"
#include "util/channel.hpp"
#include "util/constants.hpp"

namespace session
{

class IEventSink;

using CandidateFeed   = webble::Channel<gatt::CandidateUpdate>;
using SelectionResult = std::future<std::optional<std::string>>;

// Request-scoped snapshot handed to the arbiter. `updates` is set only when the
// scan is still running (streaming mode); the last update has completed=true
// and the feed is closed after it.
struct SelectionContext
{
    std::string                           request_id;
    gatt::RequestDeviceOptions            options;
    std::vector<gatt::DeviceDescriptor>   devices;
    std::shared_ptr<CandidateFeed>        updates;
    std::shared_ptr<webble::Cancellation> cancel;
};

// Device chooser injected at session construction. select() is called at most
// once per request; nullopt means the user (or a timeout) cancelled.
class ISelectionHandler
{
  public:
    virtual ~ISelectionHandler() = default;

    virtual SelectionResult select(const SelectionContext &ctx) = 0;
    // true => scan to the deadline before select(); false => streaming
    virtual bool wants_full_scan() const = 0;
};

// Resolves immediately to the first candidate.
class FirstMatchSelection final : public ISelectionHandler
{
  public:
    SelectionResult select(const SelectionContext &ctx) override;
    bool            wants_full_scan() const override { return false; }
};

// Out-of-process chooser UI.
class ISelectionSurface
{
  public:
    virtual ~ISelectionSurface() = default;

    virtual void open(const std::string &request_id, const gatt::CandidateUpdate &initial)  = 0;
    virtual void update(const std::string &request_id, const gatt::CandidateUpdate &update) = 0;
    virtual void close(const std::string &request_id)                                       = 0;
};

// Surface that publishes candidate lists as selection-updated events; the UI
// answers through SelectionResponses (SELECT / CANCEL on the control socket).
class EventSinkSurface final : public ISelectionSurface
{
  public:
    explicit EventSinkSurface(std::shared_ptr<IEventSink> sink) : sink_(std::move(sink)) {}

    void open(const std::string &request_id, const gatt::CandidateUpdate &initial) override;
    void update(const std::string &request_id, const gatt::CandidateUpdate &update) override;
    void close(const std::string &request_id) override;

  private:
    std::shared_ptr<IEventSink> sink_;
};

// Per-request response channels between the UI and waiting arbiters.
class SelectionResponses
{
  public:
    using Channel = webble::Channel<std::optional<std::string>>;

    std::shared_ptr<Channel> subscribe(const std::string &request_id);
    // false when nobody waits on `request_id`
    bool respond(const std::string &request_id, std::optional<std::string> device_id);
    void unsubscribe(const std::string &request_id);
    std::vector<std::string> pending() const;

  private:
    mutable std::mutex                              mu_;
    std::map<std::string, std::shared_ptr<Channel>> subs_;
};

class InteractiveSelection final : public ISelectionHandler
{
  public:
    struct Config
    {
        bool                      full_scan = true;
        std::chrono::milliseconds timeout{constants::DEFAULT_SELECTION_TIMEOUT_MS};
    };

    InteractiveSelection(Config cfg, ISelectionSurface &surface, SelectionResponses &responses)
        : cfg_(cfg), surface_(surface), responses_(responses)
    {
    }

    // Timeout and cancellation both resolve to nullopt. The response
    // subscription and the surface are released on every exit path.
    SelectionResult select(const SelectionContext &ctx) override;
    bool            wants_full_scan() const override { return cfg_.full_scan; }

  private:
    std::optional<std::string> wait_for_choice(const SelectionContext                     &ctx,
                                               const std::shared_ptr<SelectionResponses::Channel> &resp);

    Config              cfg_;
    ISelectionSurface  &surface_;
    SelectionResponses &responses_;
};

}  // namespace session
