#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace webble
{

// Shared one-shot cancellation flag that sleepers can wait on.
class Cancellation
{
  public:
    void cancel()
    {
        {
            std::lock_guard<std::mutex> lk(mu_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    bool cancelled() const
    {
        std::lock_guard<std::mutex> lk(mu_);
        return cancelled_;
    }

    // Sleeps up to `d`; returns true if cancelled meanwhile.
    template <typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> d) const
    {
        std::unique_lock<std::mutex> lk(mu_);
        return cv_.wait_for(lk, d, [&] { return cancelled_; });
    }

  private:
    mutable std::mutex              mu_;
    mutable std::condition_variable cv_;
    bool                            cancelled_ = false;
};

}  // namespace webble
