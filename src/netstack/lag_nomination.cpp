#include "netstack/lag_nomination.hpp"

#include <vector>

namespace netstack {

std::optional<LagNomination> nominate_lacp_datapath(uint32_t lacp_id, const DatapathTable& datapaths,
                                                    const std::string& root_name) {
    std::vector<const Datapath*> best;
    std::size_t most_ports = 0;
    for (const auto& [name, dp] : datapaths) {
        (void)name;
        auto lags = dp.lags_up();
        auto it = lags.find(lacp_id);
        if (it == lags.end() || it->second == 0) {
            continue;
        }
        if (it->second > most_ports) {
            most_ports = it->second;
            best.clear();
        }
        if (it->second == most_ports) {
            best.push_back(&dp);
        }
    }
    if (best.empty()) {
        return std::nullopt;
    }

    LagNomination nomination;
    nomination.ports_up = most_ports;
    if (best.size() == 1) {
        nomination.dp_name = best.front()->name();
        nomination.dp_id = best.front()->dp_id();
        nomination.reason = "most LAG ports up";
        return nomination;
    }
    for (const Datapath* dp : best) {
        if (!root_name.empty() && dp->name() == root_name) {
            nomination.dp_name = dp->name();
            nomination.dp_id = dp->dp_id();
            nomination.reason = "stack root";
            return nomination;
        }
    }
    const Datapath* lowest = best.front();
    for (const Datapath* dp : best) {
        if (dp->dp_id() < lowest->dp_id()) {
            lowest = dp;
        }
    }
    nomination.dp_name = lowest->name();
    nomination.dp_id = lowest->dp_id();
    nomination.reason = "lowest dp_id";
    return nomination;
}

} // namespace netstack
