#include "netstack/stack_config.hpp"
#include "netstack/stack_graph.hpp"

#include <algorithm> // For std::sort
#include <set>

namespace netstack {

namespace {

const StackPortConfig* find_stack_port(const DatapathConfig& dp, PortNumber number) {
    for (const auto& port : dp.stack_ports) {
        if (port.number == number) {
            return &port;
        }
    }
    return nullptr;
}

bool is_reciprocal(const StackTopologyConfig& config, const std::string& dp_name,
                   const StackPortConfig& port) {
    auto peer_it = config.datapaths.find(port.peer_dp);
    if (peer_it == config.datapaths.end()) {
        return false;
    }
    const StackPortConfig* peer_port = find_stack_port(peer_it->second, port.peer_port);
    return peer_port && peer_port->peer_dp == dp_name && peer_port->peer_port == port.number;
}

} // namespace

std::vector<std::string> find_stack_config_errors(const StackTopologyConfig& config) {
    std::vector<std::string> errors;

    if (config.timing.probe_interval.count() <= 0) {
        errors.push_back("stack probe interval must be positive");
    }
    if (config.timing.max_probes_lost == 0) {
        errors.push_back("stack max_probes_lost must be positive");
    }
    if (config.timing.health_check_interval.count() <= 0) {
        errors.push_back("stack health check interval must be positive");
    }

    std::map<DpId, std::string> seen_ids;
    bool stacking = false;
    for (const auto& [name, dp] : config.datapaths) {
        if (name.empty() || dp.name != name) {
            errors.push_back("DP entry '" + name + "' has mismatched name '" + dp.name + "'");
        }
        if (dp.dp_id == 0) {
            errors.push_back("DP " + name + " has no dp_id");
        } else {
            auto [it, inserted] = seen_ids.emplace(dp.dp_id, name);
            if (!inserted) {
                errors.push_back("DP " + name + " reuses dp_id of DP " + it->second);
            }
        }
        if (dp.priority && *dp.priority <= 0) {
            errors.push_back("DP " + name + " stack priority must be a positive integer");
        }
        if (dp.root_down_time_multiple == 0) {
            errors.push_back("DP " + name + " root_down_time_multiple must be positive");
        }

        std::set<PortNumber> port_numbers;
        for (const auto& port : dp.stack_ports) {
            stacking = true;
            PortRef local{name, port.number};
            if (port.number == 0) {
                errors.push_back("DP " + name + " stack port number must be positive");
            }
            if (!port_numbers.insert(port.number).second) {
                errors.push_back("DP " + name + " port " + std::to_string(port.number) + " declared twice");
            }
            if (port.peer_dp.empty()) {
                errors.push_back("stack port " + local.to_string() + " has no peer DP");
                continue;
            }
            if (!config.datapaths.count(port.peer_dp)) {
                errors.push_back("stack port " + local.to_string() + " references unknown DP " + port.peer_dp);
                continue;
            }
            if (!is_reciprocal(config, name, port)) {
                errors.push_back("stack link " + local.to_string() + " to " +
                                 PortRef{port.peer_dp, port.peer_port}.to_string() +
                                 " defined only in one direction");
            }
        }
        for (const auto& port : dp.local_ports) {
            if (!port_numbers.insert(port.number).second) {
                errors.push_back("DP " + name + " port " + std::to_string(port.number) + " declared twice");
            }
        }
    }

    if (!stacking) {
        return errors;
    }

    std::vector<std::string> roots = ordered_root_candidates(config);
    if (roots.empty()) {
        errors.push_back("stacking enabled but no root DP");
        return errors;
    }

    StackGraph graph = build_configured_graph(config);
    const std::string& root = roots.front();
    for (const auto& [name, dp] : config.datapaths) {
        if (!dp.is_stacked() && !dp.is_root_candidate()) {
            continue;
        }
        if (graph.shortest_path(name, root).empty()) {
            errors.push_back("DP " + name + " not connected to stack root " + root);
        }
    }
    return errors;
}

void validate_stack_config(const StackTopologyConfig& config) {
    std::vector<std::string> errors = find_stack_config_errors(config);
    if (!errors.empty()) {
        throw ConfigError(errors.front());
    }
}

StackGraph build_configured_graph(const StackTopologyConfig& config) {
    StackGraph graph;
    for (const auto& [name, dp] : config.datapaths) {
        if (dp.is_stacked() || dp.is_root_candidate()) {
            graph.add_node(name);
        }
        for (const auto& port : dp.stack_ports) {
            if (!is_reciprocal(config, name, port) ||
                graph.has_link(name, port.number, port.peer_dp, port.peer_port)) {
                continue;
            }
            // A port declared twice is reported by validation; keep the first link.
            if (graph.peer_of({name, port.number}) || graph.peer_of({port.peer_dp, port.peer_port})) {
                continue;
            }
            graph.add_link(name, port.number, port.peer_dp, port.peer_port);
        }
    }
    return graph;
}

std::vector<std::string> ordered_root_candidates(const StackTopologyConfig& config) {
    std::vector<std::pair<int64_t, std::string>> ranked;
    for (const auto& [name, dp] : config.datapaths) {
        if (dp.priority) {
            ranked.emplace_back(*dp.priority, name);
        }
    }
    std::sort(ranked.begin(), ranked.end());
    std::vector<std::string> names;
    for (const auto& entry : ranked) {
        names.push_back(entry.second);
    }
    return names;
}

} // namespace netstack
