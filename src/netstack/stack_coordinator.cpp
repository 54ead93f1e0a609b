#include "netstack/stack_coordinator.hpp"
#include "netstack/logger.hpp"
#include "netstack/stack_metrics.hpp"

#include <algorithm> // For std::remove_if
#include <exception>
#include <iterator>  // For std::next
#include <stdexcept>
#include <utility>   // For std::move

namespace netstack {

StackCoordinator::StackCoordinator(StackLogger& logger, StackMetrics& metrics)
    : logger_(logger),
      metrics_(metrics),
      election_(StackTimingConfig{}.health_check_interval, &logger),
      monitor_(datapaths_, StackTimingConfig{}, &logger, &metrics) {}

Datapath& StackCoordinator::mutable_datapath(const std::string& name) {
    auto it = datapaths_.find(name);
    if (it == datapaths_.end()) {
        throw std::invalid_argument("StackCoordinator: unknown datapath " + name);
    }
    return it->second;
}

const Datapath& StackCoordinator::datapath(const std::string& name) const {
    auto it = datapaths_.find(name);
    if (it == datapaths_.end()) {
        throw std::invalid_argument("StackCoordinator: unknown datapath " + name);
    }
    return it->second;
}

const PortRoleSets& StackCoordinator::port_roles(const std::string& dp) const {
    auto it = classifiers_.find(dp);
    if (it == classifiers_.end()) {
        throw std::invalid_argument("StackCoordinator: unknown datapath " + dp);
    }
    return it->second.current();
}

const FlowRuleSet& StackCoordinator::installed_rules(const std::string& dp) const {
    static const FlowRuleSet empty;
    auto it = installed_rules_.find(dp);
    return it == installed_rules_.end() ? empty : it->second;
}

void StackCoordinator::apply_config(const StackTopologyConfig& config, TimePoint now) {
    validate_stack_config(config);

    DatapathTable previous;
    previous.swap(datapaths_);
    config_ = config;
    for (const auto& [name, dp_config] : config.datapaths) {
        Datapath dp(dp_config, config.datapaths);
        auto old = previous.find(name);
        if (old != previous.end()) {
            dp.set_running(old->second.running());
            if (old->second.last_live_time()) {
                dp.update_live_time(*old->second.last_live_time());
            }
        }
        datapaths_.emplace(name, std::move(dp));
    }

    for (auto it = installed_rules_.begin(); it != installed_rules_.end();) {
        it = datapaths_.count(it->first) ? std::next(it) : installed_rules_.erase(it);
    }
    tunnels_.erase(std::remove_if(tunnels_.begin(), tunnels_.end(),
                                  [this](const TunnelDefinition& tunnel) {
                                      return !datapaths_.count(tunnel.src_dp) || !datapaths_.count(tunnel.dst_dp);
                                  }),
                   tunnels_.end());

    metrics_.clear_topology_gauges();
    for (const auto& [name, dp] : datapaths_) {
        for (const auto& [number, port] : dp.stack_ports()) {
            metrics_.set_port_stack_state(PortRef{name, number}, port.state);
        }
    }

    pending_.clear();
    graph_.clear();
    configured_graph_ = build_configured_graph(config);
    rebuild_port_order_users();
    monitor_.set_timing(config.timing);
    election_.set_health_check_interval(config.timing.health_check_interval);
    election_.reset();
    election_.set_candidates(datapaths_);
    select_flood_mode();

    logger_.info("STACK", "Applied stack configuration: " + std::to_string(datapaths_.size()) +
                              " datapaths, " + std::to_string(configured_graph_.edge_count()) +
                              " stack links, flood mode " + to_string(flood_engine_.mode()));
    finish_event(now, true);
}

void StackCoordinator::set_port_order(PortOrder order) {
    port_order_ = std::move(order);
    rebuild_port_order_users();
    if (datapaths_.empty()) {
        return;
    }
    logger_.info("STACK", "Stack port order changed, recomputing port roles");
    reconfigure_all();
    publish_topology_change();
}

void StackCoordinator::rebuild_port_order_users() {
    classifiers_.clear();
    for (const auto& [name, dp] : datapaths_) {
        (void)dp;
        classifiers_.emplace(name, PortRoleClassifier(name, port_order_));
    }
    tunnel_resolver_ = TunnelPathResolver(port_order_);
}

void StackCoordinator::datapath_connect(const std::string& name, TimePoint now) {
    Datapath& dp = mutable_datapath(name);
    dp.set_running(true);
    dp.update_live_time(now);
    installed_rules_.erase(name);
    logger_.info("STACK", "DP " + name + " (" + StackLogger::dpid_to_string(dp.dp_id()) + ") connected");
    regenerate_rules(dp);
    finish_event(now, false);
}

void StackCoordinator::datapath_disconnect(const std::string& name, TimePoint now) {
    Datapath& dp = mutable_datapath(name);
    dp.set_running(false);
    installed_rules_.erase(name);
    logger_.warning("STACK", "DP " + name + " (" + StackLogger::dpid_to_string(dp.dp_id()) + ") disconnected");
    finish_event(now, false);
}

std::vector<PortRef> StackCoordinator::send_probes(TimePoint now) {
    std::vector<PortRef> sent;
    for (auto& [name, dp] : datapaths_) {
        if (!dp.running()) {
            continue;
        }
        for (auto& [number, port] : dp.stack_ports()) {
            if (!port.physical_up) {
                continue;
            }
            enqueue(monitor_.probe_sent(name, number, now));
            sent.push_back(PortRef{name, number});
        }
    }
    finish_event(now, drain_events());
    return sent;
}

void StackCoordinator::keepalive_received(const KeepaliveProbe& probe) {
    Datapath& dp = mutable_datapath(probe.receiving_dp);
    if (dp.running()) {
        dp.update_live_time(probe.now);
    }
    enqueue(monitor_.probe_received(probe));
    finish_event(probe.now, drain_events());
}

void StackCoordinator::port_status_changed(const std::string& name, PortNumber port, bool up, TimePoint now) {
    Datapath& dp = mutable_datapath(name);
    if (dp.find_stack_port(port)) {
        enqueue(monitor_.port_status_changed(name, port, up, now));
        finish_event(now, drain_events());
        return;
    }
    LocalPort* local = dp.find_local_port(port);
    if (!local) {
        logger_.debug("STACK", "Ignoring status of unmanaged port " + PortRef{name, port}.to_string());
        return;
    }
    local->up = up;
    if (local->lacp_id) {
        logger_.info("STACK", "LAG " + std::to_string(*local->lacp_id) + " member " +
                                  PortRef{name, port}.to_string() + (up ? " up" : " down"));
    }
    finish_event(now, false);
}

void StackCoordinator::health_tick(TimePoint now) {
    for (auto& [name, dp] : datapaths_) {
        (void)name;
        if (dp.running()) {
            dp.update_live_time(now);
        }
    }
    enqueue(monitor_.check_timeouts(now));
    finish_event(now, drain_events());
}

void StackCoordinator::add_tunnel(const TunnelDefinition& tunnel) {
    if (!datapaths_.count(tunnel.src_dp) || !datapaths_.count(tunnel.dst_dp)) {
        throw std::invalid_argument("StackCoordinator::add_tunnel: tunnel " + std::to_string(tunnel.id) +
                                    " references an unknown datapath");
    }
    remove_tunnel(tunnel.id);
    tunnels_.push_back(tunnel);
    for (const auto& [name, dp] : datapaths_) {
        (void)name;
        regenerate_rules(dp);
    }
}

bool StackCoordinator::remove_tunnel(uint32_t tunnel_id) {
    auto it = std::remove_if(tunnels_.begin(), tunnels_.end(),
                             [tunnel_id](const TunnelDefinition& tunnel) { return tunnel.id == tunnel_id; });
    if (it == tunnels_.end()) {
        return false;
    }
    tunnels_.erase(it, tunnels_.end());
    for (const auto& [name, dp] : datapaths_) {
        (void)name;
        regenerate_rules(dp);
    }
    return true;
}

FloodContext StackCoordinator::flood_context(const std::string& dp) const {
    return FloodContext::from_datapath(datapath(dp), port_roles(dp), root_name());
}

std::vector<FloodAction> StackCoordinator::flood_actions(const std::string& dp,
                                                         std::optional<PortNumber> in_port) const {
    return flood_engine_.flood_actions(flood_context(dp), in_port);
}

std::optional<PortNumber> StackCoordinator::tunnel_outport(const std::string& dp, uint32_t tunnel_id) const {
    for (const auto& tunnel : tunnels_) {
        if (tunnel.id == tunnel_id) {
            return tunnel_resolver_.tunnel_outport(graph_, dp, tunnel);
        }
    }
    return std::nullopt;
}

std::optional<PortNumber> StackCoordinator::relative_port_towards(const std::string& dp,
                                                                  const std::string& dest) const {
    return tunnel_resolver_.relative_port_towards(graph_, dp, root_name(), port_roles(dp), dest);
}

std::optional<LagNomination> StackCoordinator::lacp_nomination(uint32_t lacp_id) const {
    return nominate_lacp_datapath(lacp_id, datapaths_, root_name());
}

void StackCoordinator::enqueue(std::optional<LinkTransition> transition) {
    if (transition) {
        pending_.push_back(std::move(*transition));
    }
}

void StackCoordinator::enqueue(const std::vector<LinkTransition>& transitions) {
    pending_.insert(pending_.end(), transitions.begin(), transitions.end());
}

bool StackCoordinator::drain_events() {
    bool graph_changed = false;
    while (!pending_.empty()) {
        LinkTransition transition = pending_.front();
        pending_.pop_front();
        publish_state_change(transition);
        if (apply_link_state(transition)) {
            graph_changed = true;
        }
    }
    return graph_changed;
}

bool StackCoordinator::apply_link_state(const LinkTransition& transition) {
    const PortRef& local = transition.port;
    const PortRef& peer = transition.peer;
    // A link is in the graph only while both ends consider it up.
    const bool up = monitor_.link_is_up(local) && monitor_.link_is_up(peer);
    const std::string link = StackGraph::canonical_edge_key(local, peer);
    if (up) {
        if (graph_.add_link(local.dp, local.port, peer.dp, peer.port)) {
            logger_.info("STACK", "Stack link " + link + " up");
            return true;
        }
        return false;
    }
    if (graph_.remove_link(local.dp, local.port, peer.dp, peer.port)) {
        logger_.warning("STACK", "Stack link " + link + " down");
        return true;
    }
    return false;
}

void StackCoordinator::finish_event(TimePoint now, bool graph_changed) {
    std::optional<ElectionResult> result = election_.elect(datapaths_, now);
    const bool root_changed = result && result->root_changed;
    if (root_changed) {
        select_flood_mode();
    }
    if (result) {
        metrics_.set_stack_root_dpid(datapaths_.at(result->root_name).dp_id());
    }
    if (graph_changed || (result && result->reconfigure_required())) {
        reconfigure_all();
        publish_topology_change();
    }
}

void StackCoordinator::select_flood_mode() {
    std::string root = election_.state().root_name;
    if (root.empty() && !election_.state().roots_names.empty()) {
        root = election_.state().roots_names.front();
    }
    FloodMode mode = FloodPolicyEngine::select_mode(configured_graph_.longest_path_to(root));
    if (mode != flood_engine_.mode()) {
        logger_.info("STACK", "Flood mode " + to_string(flood_engine_.mode()) + " -> " + to_string(mode));
        flood_engine_ = FloodPolicyEngine(mode);
    }
}

void StackCoordinator::reconfigure_all() {
    const std::string& root = election_.state().root_name;
    for (auto& [name, dp] : datapaths_) {
        const PortRoleSets& roles = classifiers_.at(name).recompute(graph_, root);
        dp.set_cached_root(root);
        metrics_.set_is_dp_stack_root(name, !root.empty() && name == root);
        metrics_.set_root_hop_port(name, roles.chosen_towards_port.value_or(0));
    }
    for (const auto& [name, dp] : datapaths_) {
        (void)name;
        regenerate_rules(dp);
    }
}

std::vector<FlowRule> StackCoordinator::build_tunnel_rules(const std::string& dp) const {
    std::vector<FlowRule> rules;
    for (const auto& [tunnel_id, output] : tunnel_resolver_.resolve_all(graph_, dp, tunnels_)) {
        if (!output) {
            continue;
        }
        FlowRule rule;
        rule.kind = FlowRuleKind::TUNNEL;
        rule.tunnel_id = tunnel_id;
        rule.actions = {FloodAction::output(*output)};
        rules.push_back(rule);
    }
    return rules;
}

void StackCoordinator::regenerate_rules(const Datapath& dp) {
    if (!dp.running()) {
        return;
    }
    std::vector<FlowRule> rules = flood_engine_.build_flood_rules(
        FloodContext::from_datapath(dp, classifiers_.at(dp.name()).current(), root_name()));
    std::vector<FlowRule> tunnel_rules = build_tunnel_rules(dp.name());
    rules.insert(rules.end(), tunnel_rules.begin(), tunnel_rules.end());

    FlowRuleSet next = make_rule_set(rules);
    std::vector<FlowRuleDelta> deltas = diff_rule_sets(installed_rules_[dp.name()], next);
    installed_rules_[dp.name()] = std::move(next);
    if (deltas.empty()) {
        return;
    }
    if (!flow_sink_) {
        logger_.debug("FLOW", std::to_string(deltas.size()) + " rule deltas for " + dp.name() + " (no sink)");
        return;
    }

    bool sent = false;
    try {
        sent = flow_sink_->send(dp.dp_id(), dp.name(), deltas);
    } catch (const std::exception& e) {
        logger_.error("FLOW", "Flow rule sink threw for " + dp.name() + ": " + e.what());
    }
    if (!sent) {
        metrics_.inc_flow_send_failures(dp.name());
        logger_.error("FLOW", "Failed to send " + std::to_string(deltas.size()) + " rule deltas to " + dp.name());
    }
}

void StackCoordinator::publish_state_change(const LinkTransition& transition) {
    if (!event_sink_) {
        return;
    }
    const Datapath& dp = datapath(transition.port.dp);
    event_sink_->notify(StackEvent{dp.dp_id(), dp.name(),
                                   StackStateEvent{transition.port.port, transition.after}});
}

void StackCoordinator::publish_topology_change() {
    metrics_.inc_topology_changes();
    StackTopoChangeEvent change;
    change.stack_root = root_name();
    change.graph = graph_.to_node_link_string();
    for (const auto& [name, classifier] : classifiers_) {
        change.root_hop_ports[name] = classifier.current().chosen_towards_port.value_or(0);
    }
    logger_.info("STACK", "Stack topology changed, root " +
                              (change.stack_root.empty() ? std::string("(none)") : change.stack_root) +
                              ", " + std::to_string(graph_.edge_count()) + " links up");
    if (!event_sink_) {
        return;
    }
    DpId root_id = 0;
    auto root_it = datapaths_.find(change.stack_root);
    if (root_it != datapaths_.end()) {
        root_id = root_it->second.dp_id();
    }
    event_sink_->notify(StackEvent{root_id, change.stack_root, change});
}

} // namespace netstack
