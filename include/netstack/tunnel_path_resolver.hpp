#ifndef NETSTACK_TUNNEL_PATH_RESOLVER_HPP
#define NETSTACK_TUNNEL_PATH_RESOLVER_HPP

#include "netstack/port_role_classifier.hpp"
#include "netstack/stack_graph.hpp"
#include "netstack/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace netstack {

struct TunnelDefinition {
    uint32_t id = 0;
    std::string src_dp;
    std::string dst_dp;
    PortNumber dst_port = 0;
};

// Next-hop stack port lookups along shortest paths. All lookups take the
// graph snapshot explicitly so they can be re-run after every change.
class TunnelPathResolver {
public:
    explicit TunnelPathResolver(PortOrder order = ascending_port_order());

    // Canonically first up port from self to the next hop towards dest.
    std::optional<PortNumber> shortest_path_port(const StackGraph& graph, const std::string& self,
                                                 const std::string& dest) const;

    // Port to use at `self` for a tunnel; nullopt when self is not on the
    // source to destination path or there is no path.
    std::optional<PortNumber> tunnel_outport(const StackGraph& graph, const std::string& self,
                                             const TunnelDefinition& tunnel) const;

    std::map<uint32_t, std::optional<PortNumber>> resolve_all(const StackGraph& graph, const std::string& self,
                                                              const std::vector<TunnelDefinition>& tunnels) const;

    std::optional<PortNumber> default_port_towards(const StackGraph& graph, const std::string& self,
                                                   const std::string& dest) const;

    // Away from the root when self is a transit between root and dest,
    // otherwise towards the root along the chosen root-ward port.
    std::optional<PortNumber> relative_port_towards(const StackGraph& graph, const std::string& self,
                                                    const std::string& root, const PortRoleSets& roles,
                                                    const std::string& dest) const;

    // Like shortest_path_port, but picks the port whose peer port is also
    // the peer's choice back to self, so both directions use one link.
    std::optional<PortNumber> shortest_symmetric_path_port(const StackGraph& graph, const std::string& self,
                                                           const std::string& peer_dp) const;

private:
    std::vector<PortNumber> up_ports_to(const StackGraph& graph, const std::string& self,
                                        const std::string& peer_dp) const;

    PortOrder order_;
};

} // namespace netstack

#endif // NETSTACK_TUNNEL_PATH_RESOLVER_HPP
