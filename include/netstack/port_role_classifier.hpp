#ifndef NETSTACK_PORT_ROLE_CLASSIFIER_HPP
#define NETSTACK_PORT_ROLE_CLASSIFIER_HPP

#include "netstack/stack_graph.hpp"
#include "netstack/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace netstack {

enum class NodePlacement {
    ROOT,
    EDGE,
    TRANSIT,
    PENDING_CALC // no root known, or no path to it
};

std::string to_string(NodePlacement placement);

// Role of every UP stack port of one datapath relative to the root. All
// port lists are kept in canonical port order.
struct PortRoleSets {
    std::vector<PortNumber> towards_root;
    std::vector<PortNumber> chosen_towards;
    std::optional<PortNumber> chosen_towards_port;
    std::optional<std::string> chosen_peer;
    std::vector<PortNumber> away;
    std::vector<PortNumber> inactive_away;
    std::vector<PortNumber> pruned_away;
    NodePlacement placement = NodePlacement::PENDING_CALC;
    std::optional<std::size_t> distance_to_root; // hops
    std::optional<std::size_t> longest_path_to_root; // datapaths on the longest root path

    bool is_towards(PortNumber port) const;
    bool is_away(PortNumber port) const;
    bool is_inactive(PortNumber port) const;
    bool is_pruned(PortNumber port) const;

    bool operator==(const PortRoleSets& other) const;
    bool operator!=(const PortRoleSets& other) const { return !(*this == other); }
};

// Computes PortRoleSets for one datapath. The result only depends on the
// graph and root name, and is memoized on (graph, generation, root).
class PortRoleClassifier {
public:
    explicit PortRoleClassifier(std::string dp_name, PortOrder order = ascending_port_order());

    const std::string& dp_name() const { return dp_name_; }

    const PortRoleSets& recompute(const StackGraph& graph, const std::string& root_name);
    // Last result, empty sets before the first recompute.
    const PortRoleSets& current() const { return result_; }
    void invalidate() { cache_key_.reset(); }

    // Stateless computation backing recompute().
    static PortRoleSets classify(const StackGraph& graph, const std::string& dp_name,
                                 const std::string& root_name, const PortOrder& order);

private:
    struct CacheKey {
        const StackGraph* graph;
        uint64_t generation;
        std::string root;
    };

    std::string dp_name_;
    PortOrder order_;
    std::optional<CacheKey> cache_key_;
    PortRoleSets result_;
};

} // namespace netstack

#endif // NETSTACK_PORT_ROLE_CLASSIFIER_HPP
