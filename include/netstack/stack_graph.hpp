#ifndef NETSTACK_STACK_GRAPH_HPP
#define NETSTACK_STACK_GRAPH_HPP

#include "netstack/types.hpp"

#include <cstddef>   // For std::size_t
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace netstack {

// One stack link. Endpoints are stored in canonical order (a < b) so the
// same physical link reported from either side maps to the same edge.
struct StackEdge {
    std::string key;
    PortRef a;
    PortRef b;

    bool operator==(const StackEdge& other) const {
        return key == other.key && a == other.a && b == other.b;
    }
};

// Undirected multigraph over datapath names. Nodes live in an arena
// (name -> index); edges are keyed by their canonical "dp:port-dp:port"
// name so parallel links between the same datapaths stay distinct.
// Shortest paths are unweighted and tie-broken on the lexicographically
// smallest sequence of names, so every datapath computes identical paths.
class StackGraph {
public:
    StackGraph() = default;

    static std::string canonical_edge_key(const PortRef& end1, const PortRef& end2);

    // Returns true if the node was not already present.
    bool add_node(const std::string& name);
    bool has_node(const std::string& name) const;

    // Idempotent: adding the same link from both ends yields one edge.
    // Returns true only when a new edge was created.
    bool add_link(const std::string& dp, PortNumber port,
                  const std::string& peer_dp, PortNumber peer_port);
    // Returns true only when an edge was removed. Nodes left without any
    // edge are dropped from the graph.
    bool remove_link(const std::string& dp, PortNumber port,
                     const std::string& peer_dp, PortNumber peer_port);
    bool has_link(const std::string& dp, PortNumber port,
                  const std::string& peer_dp, PortNumber peer_port) const;

    // Ordered list of datapath names from src to dst, empty if unreachable.
    std::vector<std::string> shortest_path(const std::string& src, const std::string& dst) const;
    // Hop count of the shortest path, nullopt if unreachable.
    std::optional<std::size_t> distance(const std::string& src, const std::string& dst) const;
    // True if node lies on shortest_path(src, dst).
    bool is_in_path(const std::string& src, const std::string& dst, const std::string& node) const;
    // Number of datapaths on the longest of all shortest paths to root.
    std::optional<std::size_t> longest_path_to(const std::string& root) const;

    std::set<PortRef> all_up_ports() const;
    // Ports of dp that carry a link, mapped to the remote end.
    std::map<PortNumber, PortRef> ports_of(const std::string& dp) const;
    std::optional<PortRef> peer_of(const PortRef& port) const;
    std::set<std::string> neighbours(const std::string& dp) const;

    std::vector<std::string> nodes() const;
    std::vector<StackEdge> edges() const;
    std::size_t node_count() const;
    std::size_t edge_count() const { return edges_.size(); }
    bool empty() const { return edges_.empty() && node_count() == 0; }

    // Bumped on every structural change; consumers memoize on it.
    uint64_t generation() const { return generation_; }

    void clear();

    // Node-link serialization used by topology change notifications.
    std::string to_node_link_string() const;
    // Hash over the sorted (node, degree) sequence.
    std::size_t topology_hash() const;

private:
    struct EdgeRecord {
        std::size_t a_index;
        PortNumber a_port;
        std::size_t b_index;
        PortNumber b_port;
    };

    std::optional<std::size_t> index_of(const std::string& name) const;
    std::size_t ensure_node(const std::string& name);
    // BFS hop counts from the given node; unreachable nodes hold SIZE_MAX.
    std::vector<std::size_t> bfs_distances(std::size_t from) const;
    std::size_t degree(std::size_t index) const;

    std::map<std::string, std::size_t> index_;
    std::vector<std::string> names_;
    std::vector<bool> present_;
    // adjacency_[i][j] = number of parallel links between i and j
    std::vector<std::map<std::size_t, std::size_t>> adjacency_;
    std::map<std::string, EdgeRecord> edges_;
    std::map<PortRef, std::string> port_edges_;
    uint64_t generation_ = 0;
};

} // namespace netstack

#endif // NETSTACK_STACK_GRAPH_HPP
