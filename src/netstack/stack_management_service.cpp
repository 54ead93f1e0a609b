#include "netstack/stack_management_service.hpp"

#include <iomanip>   // For std::setw
#include <sstream>   // For std::ostringstream
#include <stdexcept> // For std::invalid_argument

namespace {

std::string join_ports(const std::vector<netstack::PortNumber>& ports) {
    if (ports.empty()) return "-";
    std::ostringstream oss;
    for (std::size_t i = 0; i < ports.size(); ++i) {
        if (i > 0) oss << ",";
        oss << ports[i];
    }
    return oss.str();
}

std::string port_role(const netstack::PortRoleSets& roles, netstack::PortNumber port) {
    if (roles.chosen_towards_port && *roles.chosen_towards_port == port) return "towards (chosen)";
    if (roles.is_towards(port)) return "towards";
    if (roles.is_pruned(port)) return "away (pruned)";
    if (roles.is_inactive(port)) return "away (inactive)";
    if (roles.is_away(port)) return "away";
    return "none";
}

} // namespace

namespace netstack {

StackManagementService::StackManagementService(StackLogger& logger, ManagementInterface& mi,
                                               StackCoordinator& coordinator, StackMetrics& metrics)
    : logger_(logger), management_interface_(mi), coordinator_(coordinator), metrics_(metrics) {}

void StackManagementService::register_cli_commands() {
    management_interface_.register_command(
        {"show", "stack"},
        [this](const std::vector<std::string>& args) {
            if (!args.empty()) return "Error: Unknown 'show stack' option: " + args[0];
            return this->show_stack_summary();
        });
    management_interface_.register_command(
        {"show", "stack", "ports"},
        [this](const std::vector<std::string>& args) { return this->show_stack_ports(args); });
    management_interface_.register_command(
        {"show", "stack", "root"},
        [this](const std::vector<std::string>&) { return this->show_stack_root(); });
    management_interface_.register_command(
        {"show", "stack", "graph"},
        [this](const std::vector<std::string>&) { return this->show_stack_graph(); });
    management_interface_.register_command(
        {"show", "stack", "tunnels"},
        [this](const std::vector<std::string>&) { return this->show_stack_tunnels(); });
    management_interface_.register_command(
        {"show", "stack", "metrics"},
        [this](const std::vector<std::string>&) { return this->show_stack_metrics(); });
    management_interface_.register_command(
        {"help"},
        [this](const std::vector<std::string>&) { return this->show_help(); });
    logger_.debug("MGMT", "Registered stack CLI commands");
}

void StackManagementService::register_oids(const std::string& base_oid) {
    metrics_.register_oids(management_interface_, base_oid);
    management_interface_.register_oid_handler(base_oid + ".5.0", [this]() {
        return this->coordinator_.root_name();
    });
    management_interface_.register_oid_handler(base_oid + ".6.0", [this]() {
        return std::to_string(this->coordinator_.graph().edge_count());
    });
    logger_.debug("MGMT", "Registered stack OIDs under " + base_oid);
}

std::string StackManagementService::show_stack_summary() const {
    std::ostringstream oss;
    const std::string& root = coordinator_.root_name();
    oss << "Stack root: " << (root.empty() ? "none" : root) << "\n";
    oss << "Flood mode: " << to_string(coordinator_.flood_mode()) << "\n";
    oss << "Links up: " << coordinator_.graph().edge_count() << "/"
        << coordinator_.configured_graph().edge_count() << "\n";
    oss << std::left << std::setw(12) << "DP" << std::setw(20) << "dp_id" << std::setw(10) << "running"
        << std::setw(14) << "placement" << std::setw(10) << "hops" << "root port\n";
    for (const auto& [name, dp] : coordinator_.datapaths()) {
        if (!dp.is_stacked()) continue;
        const PortRoleSets& roles = coordinator_.port_roles(name);
        oss << std::left << std::setw(12) << name << std::setw(20) << StackLogger::dpid_to_string(dp.dp_id())
            << std::setw(10) << (dp.running() ? "yes" : "no") << std::setw(14) << to_string(roles.placement)
            << std::setw(10) << (roles.distance_to_root ? std::to_string(*roles.distance_to_root) : "-")
            << (roles.chosen_towards_port ? std::to_string(*roles.chosen_towards_port) : "-") << "\n";
    }
    return oss.str();
}

std::string StackManagementService::show_stack_ports(const std::vector<std::string>& args) const {
    if (args.size() != 1) {
        return "Error: Usage: show stack ports <dp>";
    }
    const std::string& name = args[0];
    const Datapath* dp = nullptr;
    const PortRoleSets* roles = nullptr;
    try {
        dp = &coordinator_.datapath(name);
        roles = &coordinator_.port_roles(name);
    } catch (const std::invalid_argument&) {
        return "Error: Unknown datapath: " + name;
    }

    std::ostringstream oss;
    oss << "Stack ports of " << name << ":\n";
    if (dp->stack_ports().empty()) {
        oss << "  (none)\n";
        return oss.str();
    }
    for (const auto& [number, port] : dp->stack_ports()) {
        PortRef ref{name, number};
        oss << "  " << std::left << std::setw(6) << number
            << std::setw(10) << to_string(port.state)
            << std::setw(14) << ("-> " + port.peer.to_string())
            << std::setw(10) << (coordinator_.link_is_up(ref) ? "link up" : "link down")
            << port_role(*roles, number) << "\n";
    }
    return oss.str();
}

std::string StackManagementService::show_stack_root() const {
    const RootState& state = coordinator_.root_state();
    std::ostringstream oss;
    oss << "Stack root: " << (state.root_name.empty() ? "none" : state.root_name);
    if (auto dpid = metrics_.stack_root_dpid()) {
        oss << " (" << StackLogger::dpid_to_string(*dpid) << ")";
    }
    oss << "\n";
    oss << "Candidates:";
    for (const auto& candidate : state.roots_names) oss << " " << candidate;
    oss << "\nHealthy:";
    for (const auto& healthy : state.healthy) oss << " " << healthy;
    oss << "\nUnhealthy:";
    for (const auto& unhealthy : state.unhealthy) oss << " " << unhealthy;
    oss << "\n";
    return oss.str();
}

std::string StackManagementService::show_stack_graph() const {
    std::ostringstream oss;
    oss << coordinator_.graph().to_node_link_string() << "\n";
    for (const auto& [name, dp] : coordinator_.datapaths()) {
        if (!dp.is_stacked()) continue;
        const PortRoleSets& roles = coordinator_.port_roles(name);
        oss << name << ": towards=" << join_ports(roles.towards_root)
            << " away=" << join_ports(roles.away)
            << " inactive=" << join_ports(roles.inactive_away)
            << " pruned=" << join_ports(roles.pruned_away) << "\n";
    }
    return oss.str();
}

std::string StackManagementService::show_stack_tunnels() const {
    const auto& tunnels = coordinator_.tunnels();
    if (tunnels.empty()) {
        return "No tunnels configured.\n";
    }
    std::ostringstream oss;
    for (const auto& tunnel : tunnels) {
        oss << "Tunnel " << tunnel.id << ": " << tunnel.src_dp << " -> "
            << tunnel.dst_dp << ":" << tunnel.dst_port << "\n";
        for (const auto& [name, dp] : coordinator_.datapaths()) {
            if (auto port = coordinator_.tunnel_outport(name, tunnel.id)) {
                oss << "  " << name << " out port " << *port << "\n";
            }
        }
    }
    return oss.str();
}

std::string StackManagementService::show_stack_metrics() const {
    return metrics_.render();
}

std::string StackManagementService::show_help() const {
    std::ostringstream oss;
    oss << "Available commands:\n";
    for (const auto& command : management_interface_.registered_commands()) {
        oss << "  " << command << "\n";
    }
    return oss.str();
}

} // namespace netstack
