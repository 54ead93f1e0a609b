#include "netstack/stack_graph.hpp"

#include <algorithm> // For std::max
#include <deque>
#include <functional> // For std::hash
#include <initializer_list>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace netstack {

namespace {
constexpr std::size_t UNREACHABLE = std::numeric_limits<std::size_t>::max();
}

std::string StackGraph::canonical_edge_key(const PortRef& end1, const PortRef& end2) {
    const PortRef& first = (end2 < end1) ? end2 : end1;
    const PortRef& second = (end2 < end1) ? end1 : end2;
    return first.to_string() + "-" + second.to_string();
}

std::optional<std::size_t> StackGraph::index_of(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end() || !present_[it->second]) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t StackGraph::ensure_node(const std::string& name) {
    auto it = index_.find(name);
    if (it != index_.end()) {
        present_[it->second] = true;
        return it->second;
    }
    std::size_t index = names_.size();
    index_[name] = index;
    names_.push_back(name);
    present_.push_back(true);
    adjacency_.emplace_back();
    return index;
}

bool StackGraph::add_node(const std::string& name) {
    if (name.empty()) {
        throw std::invalid_argument("StackGraph::add_node: empty datapath name");
    }
    if (index_of(name)) {
        return false;
    }
    ensure_node(name);
    ++generation_;
    return true;
}

bool StackGraph::has_node(const std::string& name) const {
    return index_of(name).has_value();
}

bool StackGraph::add_link(const std::string& dp, PortNumber port,
                          const std::string& peer_dp, PortNumber peer_port) {
    PortRef local{dp, port};
    PortRef remote{peer_dp, peer_port};
    if (dp.empty() || peer_dp.empty()) {
        throw std::invalid_argument("StackGraph::add_link: empty datapath name");
    }
    if (local == remote) {
        throw std::invalid_argument("StackGraph::add_link: link from " + local.to_string() + " to itself");
    }

    std::string key = canonical_edge_key(local, remote);
    if (edges_.count(key)) {
        return false;
    }
    for (const PortRef& end : {local, remote}) {
        auto used = port_edges_.find(end);
        if (used != port_edges_.end()) {
            throw std::invalid_argument("StackGraph::add_link: port " + end.to_string() +
                                        " already carries link " + used->second);
        }
    }

    const PortRef& first = (remote < local) ? remote : local;
    const PortRef& second = (remote < local) ? local : remote;
    std::size_t a_index = ensure_node(first.dp);
    std::size_t b_index = ensure_node(second.dp);

    edges_[key] = EdgeRecord{a_index, first.port, b_index, second.port};
    port_edges_[first] = key;
    port_edges_[second] = key;
    adjacency_[a_index][b_index]++;
    if (a_index != b_index) {
        adjacency_[b_index][a_index]++;
    }
    ++generation_;
    return true;
}

bool StackGraph::remove_link(const std::string& dp, PortNumber port,
                             const std::string& peer_dp, PortNumber peer_port) {
    std::string key = canonical_edge_key({dp, port}, {peer_dp, peer_port});
    auto it = edges_.find(key);
    if (it == edges_.end()) {
        return false;
    }
    const EdgeRecord record = it->second;
    edges_.erase(it);
    port_edges_.erase(PortRef{names_[record.a_index], record.a_port});
    port_edges_.erase(PortRef{names_[record.b_index], record.b_port});

    auto drop_adjacency = [this](std::size_t from, std::size_t to) {
        auto adj = adjacency_[from].find(to);
        if (adj != adjacency_[from].end() && --adj->second == 0) {
            adjacency_[from].erase(adj);
        }
    };
    drop_adjacency(record.a_index, record.b_index);
    if (record.a_index != record.b_index) {
        drop_adjacency(record.b_index, record.a_index);
    }
    for (std::size_t index : {record.a_index, record.b_index}) {
        if (adjacency_[index].empty()) {
            present_[index] = false;
        }
    }
    ++generation_;
    return true;
}

bool StackGraph::has_link(const std::string& dp, PortNumber port,
                          const std::string& peer_dp, PortNumber peer_port) const {
    return edges_.count(canonical_edge_key({dp, port}, {peer_dp, peer_port})) > 0;
}

std::vector<std::size_t> StackGraph::bfs_distances(std::size_t from) const {
    std::vector<std::size_t> dist(names_.size(), UNREACHABLE);
    std::deque<std::size_t> queue;
    dist[from] = 0;
    queue.push_back(from);
    while (!queue.empty()) {
        std::size_t current = queue.front();
        queue.pop_front();
        for (const auto& [neighbour, link_count] : adjacency_[current]) {
            (void)link_count;
            if (dist[neighbour] == UNREACHABLE) {
                dist[neighbour] = dist[current] + 1;
                queue.push_back(neighbour);
            }
        }
    }
    return dist;
}

std::vector<std::string> StackGraph::shortest_path(const std::string& src, const std::string& dst) const {
    auto src_index = index_of(src);
    auto dst_index = index_of(dst);
    if (!src_index || !dst_index) {
        return {};
    }

    // Distances are measured from dst; walking from src we always step to
    // the smallest-named neighbour one hop closer, which yields the
    // lexicographically smallest of all shortest paths.
    std::vector<std::size_t> dist = bfs_distances(*dst_index);
    if (dist[*src_index] == UNREACHABLE) {
        return {};
    }

    std::vector<std::string> path{names_[*src_index]};
    std::size_t current = *src_index;
    while (current != *dst_index) {
        std::optional<std::size_t> next;
        for (const auto& [neighbour, link_count] : adjacency_[current]) {
            (void)link_count;
            if (dist[neighbour] + 1 != dist[current]) {
                continue;
            }
            if (!next || names_[neighbour] < names_[*next]) {
                next = neighbour;
            }
        }
        if (!next) {
            throw std::logic_error("StackGraph::shortest_path: BFS distances inconsistent at " + names_[current]);
        }
        current = *next;
        path.push_back(names_[current]);
    }
    return path;
}

std::optional<std::size_t> StackGraph::distance(const std::string& src, const std::string& dst) const {
    auto src_index = index_of(src);
    auto dst_index = index_of(dst);
    if (!src_index || !dst_index) {
        return std::nullopt;
    }
    std::vector<std::size_t> dist = bfs_distances(*dst_index);
    if (dist[*src_index] == UNREACHABLE) {
        return std::nullopt;
    }
    return dist[*src_index];
}

bool StackGraph::is_in_path(const std::string& src, const std::string& dst, const std::string& node) const {
    std::vector<std::string> path = shortest_path(src, dst);
    return std::find(path.begin(), path.end(), node) != path.end();
}

std::optional<std::size_t> StackGraph::longest_path_to(const std::string& root) const {
    auto root_index = index_of(root);
    if (!root_index) {
        return std::nullopt;
    }
    std::vector<std::size_t> dist = bfs_distances(*root_index);
    std::size_t longest = 0;
    for (std::size_t i = 0; i < dist.size(); ++i) {
        if (present_[i] && dist[i] != UNREACHABLE) {
            longest = std::max(longest, dist[i] + 1);
        }
    }
    return longest;
}

std::set<PortRef> StackGraph::all_up_ports() const {
    std::set<PortRef> ports;
    for (const auto& [port, key] : port_edges_) {
        (void)key;
        ports.insert(port);
    }
    return ports;
}

std::map<PortNumber, PortRef> StackGraph::ports_of(const std::string& dp) const {
    std::map<PortNumber, PortRef> ports;
    for (auto it = port_edges_.lower_bound(PortRef{dp, 0});
         it != port_edges_.end() && it->first.dp == dp; ++it) {
        const EdgeRecord& record = edges_.at(it->second);
        PortRef a{names_[record.a_index], record.a_port};
        PortRef b{names_[record.b_index], record.b_port};
        ports[it->first.port] = (a == it->first) ? b : a;
    }
    return ports;
}

std::optional<PortRef> StackGraph::peer_of(const PortRef& port) const {
    auto it = port_edges_.find(port);
    if (it == port_edges_.end()) {
        return std::nullopt;
    }
    const EdgeRecord& record = edges_.at(it->second);
    PortRef a{names_[record.a_index], record.a_port};
    PortRef b{names_[record.b_index], record.b_port};
    return (a == port) ? b : a;
}

std::set<std::string> StackGraph::neighbours(const std::string& dp) const {
    std::set<std::string> result;
    auto index = index_of(dp);
    if (!index) {
        return result;
    }
    for (const auto& [neighbour, link_count] : adjacency_[*index]) {
        (void)link_count;
        result.insert(names_[neighbour]);
    }
    return result;
}

std::vector<std::string> StackGraph::nodes() const {
    std::vector<std::string> result;
    for (const auto& [name, index] : index_) {
        if (present_[index]) {
            result.push_back(name);
        }
    }
    return result;
}

std::vector<StackEdge> StackGraph::edges() const {
    std::vector<StackEdge> result;
    result.reserve(edges_.size());
    for (const auto& [key, record] : edges_) {
        result.push_back(StackEdge{key,
                                   PortRef{names_[record.a_index], record.a_port},
                                   PortRef{names_[record.b_index], record.b_port}});
    }
    return result;
}

std::size_t StackGraph::node_count() const {
    return static_cast<std::size_t>(std::count(present_.begin(), present_.end(), true));
}

std::size_t StackGraph::degree(std::size_t index) const {
    std::size_t total = 0;
    for (const auto& [neighbour, link_count] : adjacency_[index]) {
        (void)neighbour;
        total += link_count;
    }
    return total;
}

void StackGraph::clear() {
    index_.clear();
    names_.clear();
    present_.clear();
    adjacency_.clear();
    edges_.clear();
    port_edges_.clear();
    ++generation_;
}

std::string StackGraph::to_node_link_string() const {
    std::ostringstream oss;
    oss << "{\"directed\": false, \"multigraph\": true, \"nodes\": [";
    bool first = true;
    for (const std::string& name : nodes()) {
        oss << (first ? "" : ", ") << "{\"id\": \"" << name << "\"}";
        first = false;
    }
    oss << "], \"links\": [";
    first = true;
    for (const StackEdge& edge : edges()) {
        oss << (first ? "" : ", ")
            << "{\"source\": \"" << edge.a.dp << "\", \"target\": \"" << edge.b.dp
            << "\", \"key\": \"" << edge.key << "\", \"port_map\": {"
            << "\"dp_a\": \"" << edge.a.dp << "\", \"port_a\": " << edge.a.port
            << ", \"dp_z\": \"" << edge.b.dp << "\", \"port_z\": " << edge.b.port << "}}";
        first = false;
    }
    oss << "]}";
    return oss.str();
}

std::size_t StackGraph::topology_hash() const {
    std::ostringstream oss;
    for (const auto& [name, index] : index_) {
        if (present_[index]) {
            oss << name << "=" << degree(index) << ";";
        }
    }
    return std::hash<std::string>{}(oss.str());
}

} // namespace netstack
