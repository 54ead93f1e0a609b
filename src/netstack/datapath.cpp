#include "netstack/datapath.hpp"

#include <stdexcept>

namespace netstack {

Datapath::Datapath(const DatapathConfig& config, const std::map<std::string, DatapathConfig>& all_datapaths)
    : name_(config.name),
      dp_id_(config.dp_id),
      priority_(config.priority),
      root_down_time_multiple_(config.root_down_time_multiple) {
    for (const auto& port_cfg : config.stack_ports) {
        auto peer_it = all_datapaths.find(port_cfg.peer_dp);
        if (peer_it == all_datapaths.end()) {
            throw std::invalid_argument("Datapath " + name_ + ": stack port " +
                                        std::to_string(port_cfg.number) + " has no known peer");
        }
        StackPort port;
        port.number = port_cfg.number;
        port.peer = PortRef{port_cfg.peer_dp, port_cfg.peer_port};
        port.expected_peer_dp_id = peer_it->second.dp_id;
        stack_ports_[port.number] = port;
    }
    for (const auto& port_cfg : config.local_ports) {
        LocalPort port;
        port.number = port_cfg.number;
        port.loop_protect_external = port_cfg.loop_protect_external;
        port.lacp_id = port_cfg.lacp_id;
        local_ports_[port.number] = port;
    }
}

StackPort* Datapath::find_stack_port(PortNumber number) {
    auto it = stack_ports_.find(number);
    return it == stack_ports_.end() ? nullptr : &it->second;
}

const StackPort* Datapath::find_stack_port(PortNumber number) const {
    auto it = stack_ports_.find(number);
    return it == stack_ports_.end() ? nullptr : &it->second;
}

LocalPort* Datapath::find_local_port(PortNumber number) {
    auto it = local_ports_.find(number);
    return it == local_ports_.end() ? nullptr : &it->second;
}

bool Datapath::any_stack_port_up() const {
    for (const auto& [number, port] : stack_ports_) {
        (void)number;
        if (port.is_up()) {
            return true;
        }
    }
    return false;
}

bool Datapath::has_externals() const {
    for (const auto& [number, port] : local_ports_) {
        (void)number;
        if (port.loop_protect_external) {
            return true;
        }
    }
    return false;
}

std::set<uint32_t> Datapath::lacp_ids() const {
    std::set<uint32_t> ids;
    for (const auto& [number, port] : local_ports_) {
        (void)number;
        if (port.lacp_id) {
            ids.insert(*port.lacp_id);
        }
    }
    return ids;
}

std::map<uint32_t, std::size_t> Datapath::lags_up() const {
    std::map<uint32_t, std::size_t> counts;
    for (const auto& [number, port] : local_ports_) {
        (void)number;
        if (port.lacp_id && port.up) {
            counts[*port.lacp_id]++;
        }
    }
    return counts;
}

bool Datapath::all_lags_down() const {
    return has_lags() && lags_up().empty();
}

} // namespace netstack
