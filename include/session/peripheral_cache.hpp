#pragma once
#include <cstddef>
#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

#include "adapter/iadapter.hpp"

namespace session
{

// DeviceId -> live peripheral handle. Readers share the lock, insert/erase
// take it exclusively. Entries leave only through erase() (forget).
class PeripheralCache
{
  public:
    // Last writer wins for a concurrent insert of the same id
    void insert(const std::string &id, adapter::PeripheralPtr p);
    adapter::PeripheralPtr find(const std::string &id) const;
    bool                   contains(const std::string &id) const;
    bool                   erase(const std::string &id);
    std::vector<adapter::PeripheralPtr> snapshot() const;
    std::size_t                         size() const;

  private:
    mutable std::shared_mutex                     mu_;
    std::map<std::string, adapter::PeripheralPtr> map_;
};

}  // namespace session
