#include "netstack/port_role_classifier.hpp"

#include <algorithm> // For std::sort, std::find
#include <map>
#include <utility>

namespace netstack {

namespace {

bool contains(const std::vector<PortNumber>& ports, PortNumber port) {
    return std::find(ports.begin(), ports.end(), port) != ports.end();
}

} // namespace

std::string to_string(NodePlacement placement) {
    switch (placement) {
        case NodePlacement::ROOT:         return "ROOT";
        case NodePlacement::EDGE:         return "EDGE";
        case NodePlacement::TRANSIT:      return "TRANSIT";
        case NodePlacement::PENDING_CALC: return "PENDING_CALC";
        default:                          return "UNKNOWN";
    }
}

bool PortRoleSets::is_towards(PortNumber port) const { return contains(towards_root, port); }
bool PortRoleSets::is_away(PortNumber port) const { return contains(away, port); }
bool PortRoleSets::is_inactive(PortNumber port) const { return contains(inactive_away, port); }
bool PortRoleSets::is_pruned(PortNumber port) const { return contains(pruned_away, port); }

bool PortRoleSets::operator==(const PortRoleSets& other) const {
    return towards_root == other.towards_root &&
           chosen_towards == other.chosen_towards &&
           chosen_towards_port == other.chosen_towards_port &&
           chosen_peer == other.chosen_peer &&
           away == other.away &&
           inactive_away == other.inactive_away &&
           pruned_away == other.pruned_away &&
           placement == other.placement &&
           distance_to_root == other.distance_to_root &&
           longest_path_to_root == other.longest_path_to_root;
}

PortRoleClassifier::PortRoleClassifier(std::string dp_name, PortOrder order)
    : dp_name_(std::move(dp_name)), order_(std::move(order)) {}

const PortRoleSets& PortRoleClassifier::recompute(const StackGraph& graph, const std::string& root_name) {
    if (cache_key_ && cache_key_->graph == &graph && cache_key_->generation == graph.generation() &&
        cache_key_->root == root_name) {
        return result_;
    }
    result_ = classify(graph, dp_name_, root_name, order_);
    cache_key_ = CacheKey{&graph, graph.generation(), root_name};
    return result_;
}

PortRoleSets PortRoleClassifier::classify(const StackGraph& graph, const std::string& dp_name,
                                          const std::string& root_name, const PortOrder& order) {
    PortRoleSets roles;
    const std::map<PortNumber, PortRef> up_ports = graph.ports_of(dp_name);

    std::vector<PortNumber> canonical_up;
    for (const auto& entry : up_ports) {
        canonical_up.push_back(entry.first);
    }
    std::sort(canonical_up.begin(), canonical_up.end(), order);

    roles.longest_path_to_root = graph.longest_path_to(root_name);
    const bool is_root = !root_name.empty() && dp_name == root_name;

    if (is_root) {
        roles.away = canonical_up;
        roles.distance_to_root = 0;
        roles.placement = NodePlacement::ROOT;
    } else {
        std::map<PortNumber, std::size_t> peer_distance;
        std::optional<std::size_t> best;
        for (PortNumber port : canonical_up) {
            auto distance = graph.distance(up_ports.at(port).dp, root_name);
            if (!distance) {
                continue; // peer cannot reach the root
            }
            peer_distance[port] = *distance;
            if (!best || *distance < *best) {
                best = *distance;
            }
        }
        for (PortNumber port : canonical_up) {
            auto it = peer_distance.find(port);
            if (best && it != peer_distance.end() && it->second == *best) {
                roles.towards_root.push_back(port);
            } else {
                roles.away.push_back(port);
            }
        }

        std::vector<std::string> path = graph.shortest_path(dp_name, root_name);
        if (!path.empty()) {
            roles.distance_to_root = path.size() - 1;
        }
        if (path.size() > 1) {
            roles.chosen_peer = path[1];
        } else if (!roles.towards_root.empty()) {
            roles.chosen_peer = up_ports.at(roles.towards_root.front()).dp;
        }
        if (roles.chosen_peer) {
            for (PortNumber port : roles.towards_root) {
                if (up_ports.at(port).dp == *roles.chosen_peer) {
                    roles.chosen_towards.push_back(port);
                }
            }
        }
        if (!roles.chosen_towards.empty()) {
            roles.chosen_towards_port = roles.chosen_towards.front();
        }

        if (!roles.distance_to_root) {
            roles.placement = NodePlacement::PENDING_CALC;
        } else if (roles.longest_path_to_root && *roles.distance_to_root + 1 == *roles.longest_path_to_root) {
            roles.placement = NodePlacement::EDGE;
        } else {
            roles.placement = NodePlacement::TRANSIT;
        }
    }

    // An away link is inactive when the peer reaches the root without us.
    std::map<std::string, std::vector<PortNumber>> away_by_peer;
    for (PortNumber port : roles.away) {
        const PortRef& peer = up_ports.at(port);
        if (!graph.is_in_path(peer.dp, root_name, dp_name)) {
            roles.inactive_away.push_back(port);
        }
        away_by_peer[peer.dp].push_back(port);
    }

    // Of parallel away links to one peer keep the one landing on the peer's
    // canonically first port, which is the port the peer chooses towards us.
    for (auto& [peer_dp, ports] : away_by_peer) {
        (void)peer_dp;
        if (ports.size() < 2) {
            continue;
        }
        std::sort(ports.begin(), ports.end(), [&](PortNumber a, PortNumber b) {
            return order(up_ports.at(a).port, up_ports.at(b).port);
        });
        roles.pruned_away.insert(roles.pruned_away.end(), ports.begin() + 1, ports.end());
    }
    std::sort(roles.pruned_away.begin(), roles.pruned_away.end(), order);

    return roles;
}

} // namespace netstack
