#pragma once
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "pool.h"

namespace termgate {

/// The workers of one pool, as produced by a LocalPoolManager loader.
struct PoolAssets {
    std::string pool;
    std::vector<std::string> endpoints; ///< One asset is created per endpoint
};

/**
 * In-memory PoolManager holding a fixed set of assets per pool.  The pool definitions come from a
 * loader callback that is invoked at construction and again on every `reload()`.
 *
 * A reload replaces every pool with freshly created assets.  Assets leased before the reload are
 * not handed out again: returning one after a reload simply discards it.
 */
class LocalPoolManager : public PoolManager {
public:
    using Loader = std::function<std::vector<PoolAssets>()>;

    explicit LocalPoolManager(Loader loader);

    /// Convenience constructor for a fixed set of pools; `reload()` restores this same set.
    explicit LocalPoolManager(std::vector<PoolAssets> pools);

    std::optional<Asset> lease(const std::string& pool) override;
    void release(const std::string& pool, Asset asset) override;
    int idle_count() override;
    void reload() override;

    /// Number of idle assets in one pool; throws std::out_of_range for an unknown pool.
    int idle_count(const std::string& pool);

private:
    struct pool_state {
        std::deque<Asset> idle;
        std::unordered_set<uint64_t> leased; // tokens currently out on lease
    };

    std::unordered_map<std::string, pool_state> load_pools();

    Loader loader;
    std::mutex mutex;
    std::unordered_map<std::string, pool_state> pools;
    uint64_t next_token = 1;
};

}
