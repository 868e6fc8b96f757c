#pragma once
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace termgate {

/// A leased handle on one out-of-process worker.  An asset is owned by exactly one in-flight task
/// between `PoolManager::lease()` and `PoolManager::release()`.
struct Asset {
    std::string endpoint; ///< Where the worker can be reached (e.g. a zmq address for ZmqTransport)
    uint64_t token = 0;   ///< Pool-manager assigned id, unique for the lifetime of the manager

    bool operator==(const Asset& o) const { return token == o.token && endpoint == o.endpoint; }
    bool operator!=(const Asset& o) const { return !(*this == o); }
};

std::ostream& operator<<(std::ostream& o, const Asset& a);

/// Owns the per-pool worker assets.  All methods may be called from any thread: `lease()` is called
/// from the gateway's proxy thread, `release()` from task threads, and `idle_count()`/`reload()`
/// from connection threads handling admin commands.
class PoolManager {
public:
    virtual ~PoolManager() = default;

    /// Leases an idle asset from the given pool.  Returns std::nullopt if the pool currently has no
    /// idle asset; throws if the pool does not exist.
    virtual std::optional<Asset> lease(const std::string& pool) = 0;

    /// Returns a previously leased asset to its pool.
    virtual void release(const std::string& pool, Asset asset) = 0;

    /// Total number of idle assets across all pools.
    virtual int idle_count() = 0;

    /// Reloads the pool definitions and restarts the workers behind them.
    virtual void reload() = 0;
};

/// Performs the actual out-of-process call of a raw action frame on a leased asset.
class WorkerTransport {
public:
    virtual ~WorkerTransport() = default;

    /// Sends `request` (an encoded action term) to the worker behind `asset` and returns its raw
    /// encoded response.  Throws on any failure.
    virtual std::string rpc(const Asset& asset, std::string_view request) = 0;
};

}
