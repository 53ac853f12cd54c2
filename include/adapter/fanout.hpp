#pragma once
#include <algorithm>
#include <memory>
#include <mutex>
#include <vector>

#include "adapter/iadapter.hpp"
#include "util/channel.hpp"

namespace adapter
{

// Copies each published value into every live subscriber channel. Dropped or
// closed subscribers are pruned on the next publish.
template <typename T>
class Fanout
{
  public:
    std::shared_ptr<webble::Channel<T>> subscribe()
    {
        auto ch = std::make_shared<webble::Channel<T>>();
        std::lock_guard<std::mutex> lk(mu_);
        subs_.push_back(ch);
        return ch;
    }

    void publish(const T &v)
    {
        std::lock_guard<std::mutex> lk(mu_);
        subs_.erase(std::remove_if(subs_.begin(), subs_.end(),
                                   [&](const std::weak_ptr<webble::Channel<T>> &w) {
                                       auto ch = w.lock();
                                       return !ch || !ch->push(v);
                                   }),
                    subs_.end());
    }

    void close_all()
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto &w : subs_)
            if (auto ch = w.lock())
                ch->close();
        subs_.clear();
    }

  private:
    std::mutex                                       mu_;
    std::vector<std::weak_ptr<webble::Channel<T>>> subs_;
};

using EventHub = Fanout<AdapterEvent>;

}  // namespace adapter
