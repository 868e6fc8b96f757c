#pragma once
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace termgate {

/// One worker pool and the module names it serves.
struct PoolConfig {
    std::string pool;
    std::vector<std::string> modules;
};

/// Immutable module name -> pool mapping.  When more than one pool claims a module the
/// first-registered pool wins and later claims are ignored.
class RoutingTable {
public:
    RoutingTable() = default;
    explicit RoutingTable(const std::vector<PoolConfig>& configs);

    /// Returns the pool serving `module`, or std::nullopt if the module is not extern-routed.
    std::optional<std::string> lookup(std::string_view module) const;

    size_t size() const { return routes.size(); }
    bool empty() const { return routes.empty(); }

private:
    std::map<std::string, std::string, std::less<>> routes;
};

}
