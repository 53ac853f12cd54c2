#include <algorithm>
#include <set>
#include <string>
#include <thread>

#include "gatt/filter.hpp"
#include "session/scan_orchestrator.hpp"
#include "util/log.hpp"

namespace session
{

namespace
{
// Gives the scan share back on every exit path of discover()
struct ScanShareGuard
{
    ScanCoordinator &scans;

    ~ScanShareGuard() { scans.release(); }
};
}  // namespace

// ---------------- ScanCoordinator ----------------
webble::Status ScanCoordinator::acquire(const adapter::ScanFilter &filter)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (users_ == 0)
    {
        webble::Status st = adapter_.start_scan(filter);
        if (!st.ok())
            return st;
        active_ = filter;
        users_  = 1;
        return st;
    }

    // Joining a running scan: a service filter would hide the newcomer's devices
    if (!active_.services.empty())
    {
        webble::Status st = adapter_.start_scan(adapter::ScanFilter{});
        if (!st.ok())
            return st;
        active_ = adapter::ScanFilter{};
        LOG_DEBUG("Scan shared by %d requests, filter dropped", users_ + 1);
    }
    ++users_;
    return webble::Status::Ok();
}

void ScanCoordinator::release()
{
    std::lock_guard<std::mutex> lk(mu_);
    if (users_ == 0)
        return;
    if (--users_ > 0)
        return;
    webble::Status st = adapter_.stop_scan();
    if (!st.ok())
        LOG_WARN("stop_scan failed (ignored): %s", st.to_string().c_str());
}

int ScanCoordinator::users() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return users_;
}

adapter::ScanFilter ScanOrchestrator::scan_filter_for(const gatt::RequestDeviceOptions &opts)
{
    adapter::ScanFilter filter;
    if (opts.accept_all_devices || opts.filters.empty())
        return filter;

    std::set<std::string> seen;
    for (const auto &f : opts.filters)
    {
        // One filter without services can match anything: scan unfiltered
        if (f.services.empty())
            return adapter::ScanFilter{};
        for (const auto &s : f.services)
            if (seen.insert(s).second)
                filter.services.push_back(s);
    }
    return filter;
}

// ======================================================================
// Function: discover
// - In: request options (validated here), optional per-iteration observer
// - Out: Ok and matched candidates in discovery order, or the failure
// - Note: adapter calls run without any lock; the sleep never overshoots
//         the deadline
// ======================================================================
webble::Status ScanOrchestrator::discover(gatt::RequestDeviceOptions opts,
                                          const Observer            &observer,
                                          std::vector<Candidate>    &out)
{
    out.clear();

    webble::Status st = gatt::validate_options(opts);
    if (!st.ok())
        return st;

    const adapter::ScanFilter filter = scan_filter_for(opts);
    st                               = scans_.acquire(filter);
    if (!st.ok())
    {
        LOG_ERROR("start_scan failed: %s", st.to_string().c_str());
        return st;
    }
    ScanShareGuard guard{scans_};

    using clock         = std::chrono::steady_clock;
    const auto deadline = clock::now() + opts.scan_timeout;
    LOG_DEBUG("Scan started (timeout=%lldms, poll=%lldms, filter=%zu services)",
              (long long)opts.scan_timeout.count(), (long long)poll_.count(),
              filter.services.size());

    std::set<std::string> matched;
    for (;;)
    {
        std::vector<adapter::PeripheralPtr> found;
        st = scans_.adapter().peripherals(found);
        if (!st.ok())
        {
            LOG_ERROR("Listing peripherals failed: %s", st.to_string().c_str());
            return st;
        }

        bool changed = false;
        for (const auto &p : found)
        {
            if (!p || matched.count(p->id()))
                continue;
            gatt::DeviceDescriptor d;
            if (!gatt::describe(*p, d).ok())
                continue;
            if (!gatt::matches(opts, d))
                continue;
            matched.insert(d.id);
            LOG_DEBUG("Matched %s (%s)", d.id.c_str(), d.name ? d.name->c_str() : "-");
            out.push_back(Candidate{std::move(d), p});
            changed = true;
        }

        if (observer && observer(out, changed))
        {
            LOG_DEBUG("Scan ended early with %zu matches", out.size());
            break;
        }

        const auto now = clock::now();
        if (now >= deadline)
            break;
        std::this_thread::sleep_for(std::min<clock::duration>(poll_, deadline - now));
    }

    if (out.empty())
        return webble::Status(webble::ErrorKind::DeviceNotFound,
                              "No device matching the request was found");
    return webble::Status::Ok();
}

}  // namespace session
