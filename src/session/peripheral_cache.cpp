#include <mutex>

#include "session/peripheral_cache.hpp"

namespace session
{

void PeripheralCache::insert(const std::string &id, adapter::PeripheralPtr p)
{
    std::unique_lock<std::shared_mutex> lk(mu_);
    map_[id] = std::move(p);
}

adapter::PeripheralPtr PeripheralCache::find(const std::string &id) const
{
    std::shared_lock<std::shared_mutex> lk(mu_);
    auto it = map_.find(id);
    return it == map_.end() ? nullptr : it->second;
}

bool PeripheralCache::contains(const std::string &id) const
{
    std::shared_lock<std::shared_mutex> lk(mu_);
    return map_.count(id) != 0;
}

bool PeripheralCache::erase(const std::string &id)
{
    std::unique_lock<std::shared_mutex> lk(mu_);
    return map_.erase(id) != 0;
}

std::vector<adapter::PeripheralPtr> PeripheralCache::snapshot() const
{
    std::shared_lock<std::shared_mutex> lk(mu_);
    std::vector<adapter::PeripheralPtr> out;
    out.reserve(map_.size());
    for (const auto &kv : map_)
        out.push_back(kv.second);
    return out;
}

std::size_t PeripheralCache::size() const
{
    std::shared_lock<std::shared_mutex> lk(mu_);
    return map_.size();
}

}  // namespace session
