#include "local_pool.h"
#include <stdexcept>

namespace termgate {

LocalPoolManager::LocalPoolManager(Loader loader_) : loader{std::move(loader_)} {
    if (!loader)
        throw std::invalid_argument("LocalPoolManager requires a pool loader");
    pools = load_pools();
}

LocalPoolManager::LocalPoolManager(std::vector<PoolAssets> defs)
    : LocalPoolManager{[defs = std::move(defs)] { return defs; }} {}

// Called with `mutex` held (or during construction).
std::unordered_map<std::string, LocalPoolManager::pool_state> LocalPoolManager::load_pools() {
    std::unordered_map<std::string, pool_state> loaded;
    for (auto& def : loader()) {
        auto [it, inserted] = loaded.try_emplace(def.pool);
        if (!inserted)
            throw std::invalid_argument("Duplicate pool `" + def.pool + "' in pool definitions");
        for (auto& endpoint : def.endpoints)
            it->second.idle.push_back(Asset{std::move(endpoint), next_token++});
    }
    return loaded;
}

std::optional<Asset> LocalPoolManager::lease(const std::string& pool) {
    std::lock_guard lock{mutex};
    auto it = pools.find(pool);
    if (it == pools.end())
        throw std::out_of_range("Unknown pool `" + pool + "'");
    auto& p = it->second;
    if (p.idle.empty())
        return std::nullopt;
    Asset a = std::move(p.idle.front());
    p.idle.pop_front();
    p.leased.insert(a.token);
    return a;
}

void LocalPoolManager::release(const std::string& pool, Asset asset) {
    std::lock_guard lock{mutex};
    auto it = pools.find(pool);
    if (it == pools.end())
        return; // pool went away in a reload
    auto& p = it->second;
    if (p.leased.erase(asset.token))
        p.idle.push_back(std::move(asset));
}

int LocalPoolManager::idle_count() {
    std::lock_guard lock{mutex};
    int count = 0;
    for (const auto& [name, p] : pools)
        count += static_cast<int>(p.idle.size());
    return count;
}

int LocalPoolManager::idle_count(const std::string& pool) {
    std::lock_guard lock{mutex};
    return static_cast<int>(pools.at(pool).idle.size());
}

void LocalPoolManager::reload() {
    std::lock_guard lock{mutex};
    pools = load_pools();
}

}
