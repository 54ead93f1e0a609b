#ifndef NETSTACK_FLOOD_POLICY_HPP
#define NETSTACK_FLOOD_POLICY_HPP

#include "netstack/flow_rules.hpp"
#include "netstack/port_role_classifier.hpp"
#include "netstack/types.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace netstack {

class Datapath;

enum class FloodMode {
    DIRECT,   // every non-root datapath is adjacent to the root
    REFLECTED // longer chains, floods are reflected off the root
};

std::string to_string(FloodMode mode);

// Snapshot of everything a flood decision for one datapath depends on.
struct FloodContext {
    std::string dp_name;
    bool is_root = false;
    PortRoleSets roles;
    std::map<PortNumber, PortRef> stack_ports; // every configured stack port and its peer
    std::map<PortNumber, bool> local_ports;    // port -> loop_protect_external
    // Root candidates that are not the root never flood to external ports.
    bool external_root_only = false;

    bool has_externals() const;
    bool is_stack_port(PortNumber port) const { return stack_ports.count(port) > 0; }
    bool is_local_port(PortNumber port) const { return local_ports.count(port) > 0; }

    static FloodContext from_datapath(const Datapath& dp, const PortRoleSets& roles,
                                      const std::string& root_name);
};

// Output candidates for one ingress port after the common exclusions.
struct FloodPorts {
    std::vector<FloodAction> toward;
    std::vector<FloodAction> away;
    std::vector<FloodAction> local;
    bool local_includes_external = false;
    bool external_ingress = false;
};

class FloodStrategy {
public:
    virtual ~FloodStrategy() = default;

    virtual FloodMode mode() const = 0;

    virtual std::vector<FloodAction> flood_actions(const FloodContext& ctx,
                                                   std::optional<PortNumber> in_port,
                                                   const FloodPorts& ports) const = 0;

    // Actions for a frame that this datapath originated arriving back on its
    // root-ward port. nullopt when the strategy never returns frames.
    virtual std::optional<std::vector<FloodAction>> echo_actions(const FloodContext& ctx,
                                                                 PortNumber in_port,
                                                                 const FloodPorts& ports) const = 0;
};

// Non-root floods to the root-ward port, active away ports and local ports.
class DirectFloodStrategy : public FloodStrategy {
public:
    FloodMode mode() const override { return FloodMode::DIRECT; }
    std::vector<FloodAction> flood_actions(const FloodContext& ctx, std::optional<PortNumber> in_port,
                                           const FloodPorts& ports) const override;
    std::optional<std::vector<FloodAction>> echo_actions(const FloodContext& ctx, PortNumber in_port,
                                                         const FloodPorts& ports) const override;
};

// Non-root sends only towards the root; the root reflects the frame down
// every away link, including the one it arrived on.
class ReflectedFloodStrategy : public FloodStrategy {
public:
    FloodMode mode() const override { return FloodMode::REFLECTED; }
    std::vector<FloodAction> flood_actions(const FloodContext& ctx, std::optional<PortNumber> in_port,
                                           const FloodPorts& ports) const override;
    std::optional<std::vector<FloodAction>> echo_actions(const FloodContext& ctx, PortNumber in_port,
                                                         const FloodPorts& ports) const override;
};

std::shared_ptr<const FloodStrategy> make_flood_strategy(FloodMode mode);

class FloodPolicyEngine {
public:
    explicit FloodPolicyEngine(FloodMode mode = FloodMode::DIRECT);

    // Reflection is needed once some datapath is more than one hop from the root.
    static FloodMode select_mode(const std::optional<std::size_t>& longest_path_to_root);

    FloodMode mode() const { return strategy_->mode(); }

    FloodPorts flood_ports(const FloodContext& ctx, std::optional<PortNumber> in_port,
                           bool exclude_all_external = false) const;

    std::vector<FloodAction> flood_actions(const FloodContext& ctx, std::optional<PortNumber> in_port,
                                           bool exclude_all_external = false) const;
    std::optional<std::vector<FloodAction>> echo_flood_actions(const FloodContext& ctx, PortNumber in_port,
                                                               bool exclude_all_external = false) const;

    // Stack ports a frame from in_port leaves through, OUTPUT_IN_PORT included.
    std::set<PortNumber> flood_stack_ports(const FloodContext& ctx, std::optional<PortNumber> in_port) const;

    // True when frames arriving on this stack port are dropped.
    bool is_pruned_ingress(const FloodContext& ctx, PortNumber in_port) const;

    // One rule per local port, one or more per stack port (split by the
    // external forwarding flag when the datapath has external ports).
    std::vector<FlowRule> build_flood_rules(const FloodContext& ctx) const;

private:
    std::shared_ptr<const FloodStrategy> strategy_;
};

} // namespace netstack

#endif // NETSTACK_FLOOD_POLICY_HPP
