#include "netstack/tunnel_path_resolver.hpp"

#include <algorithm> // For std::sort, std::find
#include <utility>

namespace netstack {

TunnelPathResolver::TunnelPathResolver(PortOrder order) : order_(std::move(order)) {}

std::vector<PortNumber> TunnelPathResolver::up_ports_to(const StackGraph& graph, const std::string& self,
                                                        const std::string& peer_dp) const {
    std::vector<PortNumber> ports;
    for (const auto& [port, peer] : graph.ports_of(self)) {
        if (peer.dp == peer_dp) {
            ports.push_back(port);
        }
    }
    std::sort(ports.begin(), ports.end(), order_);
    return ports;
}

std::optional<PortNumber> TunnelPathResolver::shortest_path_port(const StackGraph& graph, const std::string& self,
                                                                 const std::string& dest) const {
    std::vector<std::string> path = graph.shortest_path(self, dest);
    if (path.size() < 2) {
        return std::nullopt;
    }
    std::vector<PortNumber> ports = up_ports_to(graph, self, path[1]);
    if (ports.empty()) {
        return std::nullopt;
    }
    return ports.front();
}

std::optional<PortNumber> TunnelPathResolver::tunnel_outport(const StackGraph& graph, const std::string& self,
                                                             const TunnelDefinition& tunnel) const {
    if (tunnel.src_dp == tunnel.dst_dp) {
        if (self == tunnel.dst_dp) {
            return tunnel.dst_port;
        }
        return std::nullopt;
    }
    std::vector<std::string> path = graph.shortest_path(tunnel.src_dp, tunnel.dst_dp);
    if (path.empty()) {
        return std::nullopt;
    }
    if (std::find(path.begin(), path.end(), self) == path.end()) {
        return std::nullopt;
    }
    if (self == tunnel.dst_dp) {
        return tunnel.dst_port;
    }
    return shortest_path_port(graph, self, tunnel.dst_dp);
}

std::map<uint32_t, std::optional<PortNumber>> TunnelPathResolver::resolve_all(
    const StackGraph& graph, const std::string& self, const std::vector<TunnelDefinition>& tunnels) const {
    std::map<uint32_t, std::optional<PortNumber>> outputs;
    for (const auto& tunnel : tunnels) {
        outputs[tunnel.id] = tunnel_outport(graph, self, tunnel);
    }
    return outputs;
}

std::optional<PortNumber> TunnelPathResolver::default_port_towards(const StackGraph& graph, const std::string& self,
                                                                   const std::string& dest) const {
    return shortest_path_port(graph, self, dest);
}

std::optional<PortNumber> TunnelPathResolver::relative_port_towards(const StackGraph& graph, const std::string& self,
                                                                    const std::string& root,
                                                                    const PortRoleSets& roles,
                                                                    const std::string& dest) const {
    if (graph.shortest_path(self, root).empty() || self == dest) {
        return default_port_towards(graph, self, dest);
    }
    std::vector<std::string> dest_to_root = graph.shortest_path(dest, root);
    auto self_it = std::find(dest_to_root.begin(), dest_to_root.end(), self);
    if (self_it != dest_to_root.end() && self_it != dest_to_root.begin()) {
        // Transit between root and dest: head away from the root.
        const std::string& away_dp = *(self_it - 1);
        for (PortNumber port : up_ports_to(graph, self, away_dp)) {
            if (roles.is_away(port)) {
                return port;
            }
        }
        return std::nullopt;
    }
    return roles.chosen_towards_port;
}

std::optional<PortNumber> TunnelPathResolver::shortest_symmetric_path_port(const StackGraph& graph,
                                                                           const std::string& self,
                                                                           const std::string& peer_dp) const {
    std::vector<std::string> path = graph.shortest_path(peer_dp, self);
    if (path.size() != 2) {
        return std::nullopt;
    }
    std::vector<PortNumber> ports = up_ports_to(graph, self, peer_dp);
    if (ports.empty()) {
        return std::nullopt;
    }
    auto remote_port = [&](PortNumber port) { return graph.peer_of({self, port})->port; };
    std::sort(ports.begin(), ports.end(),
              [&](PortNumber a, PortNumber b) { return order_(remote_port(a), remote_port(b)); });
    return ports.front();
}

} // namespace netstack
