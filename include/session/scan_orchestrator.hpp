#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "adapter/iadapter.hpp"
#include "gatt/models.hpp"
#include "util/constants.hpp"
#include "util/status.hpp"

namespace session
{

struct Candidate
{
    gatt::DeviceDescriptor descriptor;
    adapter::PeripheralPtr peripheral;
};

// Shares the adapter scan between concurrent requests: the first user starts
// it, the last one stops it. While more than one request is scanning the
// adapter runs unfiltered. The mutex only serializes start/stop.
class ScanCoordinator
{
  public:
    explicit ScanCoordinator(adapter::IAdapter &adapter) : adapter_(adapter) {}

    ScanCoordinator(const ScanCoordinator &)            = delete;
    ScanCoordinator &operator=(const ScanCoordinator &) = delete;

    // On failure the caller holds no share and must not release()
    webble::Status acquire(const adapter::ScanFilter &filter);
    // Stop failures are logged and swallowed
    void release();

    adapter::IAdapter &adapter() { return adapter_; }
    int                users() const;

  private:
    adapter::IAdapter  &adapter_;
    mutable std::mutex  mu_;
    int                 users_ = 0;
    adapter::ScanFilter active_;
};

// Time-bounded discovery loop over one adapter.
class ScanOrchestrator
{
  public:
    // Called once per poll iteration with every match so far (discovery order)
    // and whether this iteration added any. Returning true ends the scan.
    using Observer = std::function<bool(const std::vector<Candidate> &all, bool changed)>;

    // Private coordinator: this orchestrator is the adapter's only scanner
    explicit ScanOrchestrator(adapter::IAdapter        &adapter,
                              std::chrono::milliseconds poll_interval =
                                  std::chrono::milliseconds(constants::DEFAULT_SCAN_POLL_MS))
        : own_(std::make_unique<ScanCoordinator>(adapter)), scans_(*own_), poll_(poll_interval)
    {
    }
    // Shared with the other requests of a session
    explicit ScanOrchestrator(ScanCoordinator          &scans,
                              std::chrono::milliseconds poll_interval =
                                  std::chrono::milliseconds(constants::DEFAULT_SCAN_POLL_MS))
        : scans_(scans), poll_(poll_interval)
    {
    }

    // Validates `opts`, then scans until the deadline or until `observer`
    // asks to stop (no observer => exhaustive). The first sighting of a
    // matching id wins. DeviceNotFound when nothing matched.
    webble::Status discover(gatt::RequestDeviceOptions opts,
                            const Observer            &observer,
                            std::vector<Candidate>    &out);

    static adapter::ScanFilter scan_filter_for(const gatt::RequestDeviceOptions &opts);

  private:
    std::unique_ptr<ScanCoordinator> own_;
    ScanCoordinator                 &scans_;
    std::chrono::milliseconds        poll_;
};

}  // namespace session
