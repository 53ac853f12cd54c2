#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace webble
{

// Multi-producer queue with close(). pop() returns false once the channel is
// closed and drained; push() after close() is dropped.
template <typename T>
class Channel
{
  public:
    bool push(T v)
    {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closed_)
                return false;
            q_.push_back(std::move(v));
        }
        cv_.notify_one();
        return true;
    }

    bool pop(T &out)
    {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [&] { return closed_ || !q_.empty(); });
        if (q_.empty())
            return false;
        out = std::move(q_.front());
        q_.pop_front();
        return true;
    }

    // false on timeout, or when closed and empty
    template <typename Rep, typename Period>
    bool pop_for(T &out, std::chrono::duration<Rep, Period> timeout)
    {
        std::unique_lock<std::mutex> lk(mu_);
        if (!cv_.wait_for(lk, timeout, [&] { return closed_ || !q_.empty(); }))
            return false;
        if (q_.empty())
            return false;
        out = std::move(q_.front());
        q_.pop_front();
        return true;
    }

    bool try_pop(T &out)
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (q_.empty())
            return false;
        out = std::move(q_.front());
        q_.pop_front();
        return true;
    }

    void close()
    {
        {
            std::lock_guard<std::mutex> lk(mu_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const
    {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_;
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lk(mu_);
        return q_.size();
    }

  private:
    std::deque<T>           q_;
    mutable std::mutex      mu_;
    std::condition_variable cv_;
    bool                    closed_ = false;
};

}  // namespace webble
