#include "netstack/stack_metrics.hpp"
#include "netstack/management_interface.hpp"

#include <sstream>

namespace netstack {

uint64_t StackMetrics::total_cabling_errors() const {
    uint64_t total = 0;
    for (const auto& [dp, count] : cabling_errors_) {
        (void)dp;
        total += count;
    }
    return total;
}

bool StackMetrics::is_dp_stack_root(const std::string& dp) const {
    auto it = is_dp_stack_root_.find(dp);
    return it != is_dp_stack_root_.end() && it->second;
}

std::optional<uint32_t> StackMetrics::port_stack_state(const PortRef& port) const {
    auto it = port_stack_state_.find(port);
    if (it == port_stack_state_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<PortNumber> StackMetrics::root_hop_port(const std::string& dp) const {
    auto it = root_hop_port_.find(dp);
    if (it == root_hop_port_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void StackMetrics::clear() {
    cabling_errors_.clear();
    probes_received_.clear();
    flow_send_failures_.clear();
    topology_changes_ = 0;
    stack_root_dpid_.reset();
    is_dp_stack_root_.clear();
    port_stack_state_.clear();
    root_hop_port_.clear();
}

void StackMetrics::clear_topology_gauges() {
    is_dp_stack_root_.clear();
    port_stack_state_.clear();
    root_hop_port_.clear();
}

std::string StackMetrics::render() const {
    std::ostringstream oss;
    for (const auto& [dp, count] : cabling_errors_) {
        oss << "stack_cabling_errors{dp_name=\"" << dp << "\"} " << count << "\n";
    }
    for (const auto& [dp, count] : probes_received_) {
        oss << "stack_probes_received{dp_name=\"" << dp << "\"} " << count << "\n";
    }
    for (const auto& [dp, count] : flow_send_failures_) {
        oss << "stack_flow_send_failures{dp_name=\"" << dp << "\"} " << count << "\n";
    }
    oss << "stack_topology_changes " << topology_changes_ << "\n";
    if (stack_root_dpid_) {
        oss << "stack_root_dpid " << *stack_root_dpid_ << "\n";
    }
    for (const auto& [dp, is_root] : is_dp_stack_root_) {
        oss << "is_dp_stack_root{dp_name=\"" << dp << "\"} " << (is_root ? 1 : 0) << "\n";
    }
    for (const auto& [port, code] : port_stack_state_) {
        oss << "port_stack_state{dp_name=\"" << port.dp << "\",port=\"" << port.port << "\"} "
            << code << "\n";
    }
    for (const auto& [dp, port] : root_hop_port_) {
        oss << "dp_root_hop_port{dp_name=\"" << dp << "\"} " << port << "\n";
    }
    return oss.str();
}

void StackMetrics::register_oids(ManagementInterface& management, const std::string& base_oid) const {
    management.register_oid_handler(base_oid + ".1.0", [this]() {
        return std::to_string(total_cabling_errors());
    });
    management.register_oid_handler(base_oid + ".2.0", [this]() {
        uint64_t total = 0;
        for (const auto& [dp, count] : probes_received_) {
            (void)dp;
            total += count;
        }
        return std::to_string(total);
    });
    management.register_oid_handler(base_oid + ".3.0", [this]() {
        return stack_root_dpid_ ? std::to_string(*stack_root_dpid_) : std::string("0");
    });
    management.register_oid_handler(base_oid + ".4.0", [this]() {
        return std::to_string(topology_changes_);
    });
}

} // namespace netstack
