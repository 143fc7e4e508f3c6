/**
 * @file provider_adapter.cpp
 */
#include "sluice/provider/provider_adapter.hpp"

#include <algorithm>
#include <mutex>

namespace sluice::provider {

void AdapterSet::bind(std::shared_ptr<ProviderAdapter> adapter) {
    if (!adapter) return;
    std::string id(adapter->id());
    std::unique_lock lk(mu_);
    map_.insert_or_assign(std::move(id), std::move(adapter));
}

bool AdapterSet::unbind(std::string_view id) {
    std::unique_lock lk(mu_);
    auto it = map_.find(id);
    if (it == map_.end()) return false;
    map_.erase(it);
    return true;
}

std::shared_ptr<ProviderAdapter> AdapterSet::find(std::string_view id) const {
    std::shared_lock lk(mu_);
    auto it = map_.find(id);
    return it == map_.end() ? nullptr : it->second;
}

std::vector<std::string> AdapterSet::ids() const {
    std::shared_lock lk(mu_);
    std::vector<std::string> out;
    out.reserve(map_.size());
    for (const auto& kv : map_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

std::size_t AdapterSet::size() const {
    std::shared_lock lk(mu_);
    return map_.size();
}

} // namespace sluice::provider
