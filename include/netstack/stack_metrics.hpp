#ifndef NETSTACK_STACK_METRICS_HPP
#define NETSTACK_STACK_METRICS_HPP

#include "netstack/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace netstack {

class ManagementInterface;

// Counters and gauges exported by the stacking subsystem. Values are
// updated in place by the components and read by scrapers.
class StackMetrics {
public:
    void inc_cabling_errors(const std::string& dp) { cabling_errors_[dp]++; }
    void inc_probes_received(const std::string& dp) { probes_received_[dp]++; }
    void inc_flow_send_failures(const std::string& dp) { flow_send_failures_[dp]++; }
    void inc_topology_changes() { topology_changes_++; }

    void set_stack_root_dpid(DpId dp_id) { stack_root_dpid_ = dp_id; }
    void set_is_dp_stack_root(const std::string& dp, bool is_root) { is_dp_stack_root_[dp] = is_root; }
    void set_port_stack_state(const PortRef& port, StackState state) { port_stack_state_[port] = state_code(state); }
    // 0 when the datapath has no root-ward port (the root itself, or no path).
    void set_root_hop_port(const std::string& dp, PortNumber port) { root_hop_port_[dp] = port; }

    uint64_t cabling_errors(const std::string& dp) const { return lookup(cabling_errors_, dp); }
    uint64_t total_cabling_errors() const;
    uint64_t probes_received(const std::string& dp) const { return lookup(probes_received_, dp); }
    uint64_t flow_send_failures(const std::string& dp) const { return lookup(flow_send_failures_, dp); }
    uint64_t topology_changes() const { return topology_changes_; }
    std::optional<DpId> stack_root_dpid() const { return stack_root_dpid_; }
    bool is_dp_stack_root(const std::string& dp) const;
    std::optional<uint32_t> port_stack_state(const PortRef& port) const;
    std::optional<PortNumber> root_hop_port(const std::string& dp) const;

    void clear();
    // Drops the per-datapath and per-port gauges; counters are kept.
    void clear_topology_gauges();

    // Text exposition, one "name{labels} value" sample per line.
    std::string render() const;

    // Registers read-only OIDs for the scalar metrics under base_oid.
    void register_oids(ManagementInterface& management, const std::string& base_oid) const;

private:
    template <typename Key>
    static uint64_t lookup(const std::map<Key, uint64_t>& values, const Key& key) {
        auto it = values.find(key);
        return it == values.end() ? 0 : it->second;
    }

    std::map<std::string, uint64_t> cabling_errors_;
    std::map<std::string, uint64_t> probes_received_;
    std::map<std::string, uint64_t> flow_send_failures_;
    uint64_t topology_changes_ = 0;
    std::optional<DpId> stack_root_dpid_;
    std::map<std::string, bool> is_dp_stack_root_;
    std::map<PortRef, uint32_t> port_stack_state_;
    std::map<std::string, PortNumber> root_hop_port_;
};

} // namespace netstack

#endif // NETSTACK_STACK_METRICS_HPP
