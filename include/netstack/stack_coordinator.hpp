#ifndef NETSTACK_STACK_COORDINATOR_HPP
#define NETSTACK_STACK_COORDINATOR_HPP

#include "netstack/datapath.hpp"
#include "netstack/flood_policy.hpp"
#include "netstack/flow_rules.hpp"
#include "netstack/lag_nomination.hpp"
#include "netstack/link_state_monitor.hpp"
#include "netstack/port_role_classifier.hpp"
#include "netstack/root_election.hpp"
#include "netstack/stack_config.hpp"
#include "netstack/stack_events.hpp"
#include "netstack/stack_graph.hpp"
#include "netstack/tunnel_path_resolver.hpp"
#include "netstack/types.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace netstack {

class StackLogger;
class StackMetrics;

// Owns the stack state of every managed datapath and processes external
// events one at a time. Link transitions from the monitor are queued and
// drained by a single loop that mutates the runtime graph, after which
// roles, flood rules and tunnel rules are recomputed for every datapath
// and the resulting rule deltas are emitted.
class StackCoordinator {
public:
    StackCoordinator(StackLogger& logger, StackMetrics& metrics);

    StackCoordinator(const StackCoordinator&) = delete;
    StackCoordinator& operator=(const StackCoordinator&) = delete;

    void set_flow_rule_sink(FlowRuleSink* sink) { flow_sink_ = sink; }
    void set_event_sink(EventSink* sink) { event_sink_ = sink; }
    // Replaces the canonical port order and recomputes roles, rules and
    // tunnel outputs of every datapath with it.
    void set_port_order(PortOrder order);

    // Validates (throws ConfigError) and replaces every datapath wholesale.
    void apply_config(const StackTopologyConfig& config, TimePoint now);

    void datapath_connect(const std::string& dp, TimePoint now);
    void datapath_disconnect(const std::string& dp, TimePoint now);

    // Issues a probe on every stack port of every running datapath and
    // returns the ports that sent one.
    std::vector<PortRef> send_probes(TimePoint now);
    void keepalive_received(const KeepaliveProbe& probe);
    void port_status_changed(const std::string& dp, PortNumber port, bool up, TimePoint now);
    // Periodic: refresh liveness, expire silent links, run the election.
    void health_tick(TimePoint now);

    void add_tunnel(const TunnelDefinition& tunnel);
    bool remove_tunnel(uint32_t tunnel_id);

    const StackGraph& graph() const { return graph_; }
    const StackGraph& configured_graph() const { return configured_graph_; }
    const RootState& root_state() const { return election_.state(); }
    const std::string& root_name() const { return election_.state().root_name; }
    const DatapathTable& datapaths() const { return datapaths_; }
    const Datapath& datapath(const std::string& name) const;
    const PortRoleSets& port_roles(const std::string& dp) const;
    FloodMode flood_mode() const { return flood_engine_.mode(); }
    const StackTimingConfig& timing() const { return config_.timing; }
    const std::vector<TunnelDefinition>& tunnels() const { return tunnels_; }
    bool link_is_up(const PortRef& port) const { return monitor_.link_is_up(port); }

    FloodContext flood_context(const std::string& dp) const;
    std::vector<FloodAction> flood_actions(const std::string& dp, std::optional<PortNumber> in_port) const;
    std::optional<PortNumber> tunnel_outport(const std::string& dp, uint32_t tunnel_id) const;
    std::optional<PortNumber> relative_port_towards(const std::string& dp, const std::string& dest) const;
    std::optional<LagNomination> lacp_nomination(uint32_t lacp_id) const;
    // Last rule set emitted to the datapath.
    const FlowRuleSet& installed_rules(const std::string& dp) const;

private:
    Datapath& mutable_datapath(const std::string& name);
    void rebuild_port_order_users();
    void enqueue(std::optional<LinkTransition> transition);
    void enqueue(const std::vector<LinkTransition>& transitions);
    bool drain_events();
    bool apply_link_state(const LinkTransition& transition);
    void finish_event(TimePoint now, bool graph_changed);
    void select_flood_mode();
    void reconfigure_all();
    void regenerate_rules(const Datapath& dp);
    std::vector<FlowRule> build_tunnel_rules(const std::string& dp) const;
    void publish_state_change(const LinkTransition& transition);
    void publish_topology_change();

    StackLogger& logger_;
    StackMetrics& metrics_;
    FlowRuleSink* flow_sink_ = nullptr;
    EventSink* event_sink_ = nullptr;
    PortOrder port_order_ = ascending_port_order();

    StackTopologyConfig config_;
    DatapathTable datapaths_;
    StackGraph graph_;
    StackGraph configured_graph_;
    RootElection election_;
    LinkStateMonitor monitor_;
    std::map<std::string, PortRoleClassifier> classifiers_;
    FloodPolicyEngine flood_engine_;
    TunnelPathResolver tunnel_resolver_;
    std::vector<TunnelDefinition> tunnels_;
    std::map<std::string, FlowRuleSet> installed_rules_;
    std::deque<LinkTransition> pending_;
};

} // namespace netstack

#endif // NETSTACK_STACK_COORDINATOR_HPP
