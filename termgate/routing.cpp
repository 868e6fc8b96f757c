#include "routing.h"

namespace termgate {

RoutingTable::RoutingTable(const std::vector<PoolConfig>& configs) {
    for (const auto& config : configs)
        for (const auto& mod : config.modules)
            routes.emplace(mod, config.pool); // no-op if an earlier pool already claimed `mod`
}

std::optional<std::string> RoutingTable::lookup(std::string_view module) const {
    auto it = routes.find(module);
    if (it == routes.end())
        return std::nullopt;
    return it->second;
}

}
