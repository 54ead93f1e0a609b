#include "netstack/flood_policy.hpp"
#include "netstack/datapath.hpp"

#include <stdexcept>

namespace netstack {

namespace {

void append(std::vector<FloodAction>& actions, const std::vector<FloodAction>& more) {
    actions.insert(actions.end(), more.begin(), more.end());
}

bool is_local_ingress(const FloodContext& ctx, std::optional<PortNumber> in_port) {
    return !in_port || !ctx.is_stack_port(*in_port);
}

// Frames entering from a host are tagged with whether they have already
// been flooded to an external network. Frames entering from the stack keep
// their tag unless this hop floods them externally.
std::vector<FloodAction> external_flag(const FloodContext& ctx, std::optional<PortNumber> in_port,
                                       const FloodPorts& ports) {
    if (is_local_ingress(ctx, in_port)) {
        if (ports.local_includes_external || ports.external_ingress) {
            return {FloodAction::set_no_external_forwarding()};
        }
        return {FloodAction::set_external_forwarding()};
    }
    if (ports.local_includes_external) {
        return {FloodAction::set_no_external_forwarding()};
    }
    return {};
}

} // namespace

std::string to_string(FloodMode mode) {
    switch (mode) {
        case FloodMode::DIRECT:    return "DIRECT";
        case FloodMode::REFLECTED: return "REFLECTED";
        default:                   return "UNKNOWN";
    }
}

bool FloodContext::has_externals() const {
    for (const auto& [port, external] : local_ports) {
        (void)port;
        if (external) {
            return true;
        }
    }
    return false;
}

FloodContext FloodContext::from_datapath(const Datapath& dp, const PortRoleSets& roles,
                                         const std::string& root_name) {
    FloodContext ctx;
    ctx.dp_name = dp.name();
    ctx.is_root = !root_name.empty() && dp.name() == root_name;
    ctx.roles = roles;
    for (const auto& [number, port] : dp.stack_ports()) {
        ctx.stack_ports[number] = port.peer;
    }
    for (const auto& [number, port] : dp.local_ports()) {
        ctx.local_ports[number] = port.loop_protect_external;
    }
    ctx.external_root_only = ctx.has_externals() && !ctx.is_root && dp.is_root_candidate();
    return ctx;
}

// --- DirectFloodStrategy ---

std::vector<FloodAction> DirectFloodStrategy::flood_actions(const FloodContext& ctx,
                                                            std::optional<PortNumber> in_port,
                                                            const FloodPorts& ports) const {
    std::vector<FloodAction> actions = external_flag(ctx, in_port, ports);
    append(actions, ports.toward);
    append(actions, ports.away);
    append(actions, ports.local);
    return actions;
}

std::optional<std::vector<FloodAction>> DirectFloodStrategy::echo_actions(const FloodContext&, PortNumber,
                                                                          const FloodPorts&) const {
    return std::nullopt;
}

// --- ReflectedFloodStrategy ---

std::vector<FloodAction> ReflectedFloodStrategy::flood_actions(const FloodContext& ctx,
                                                               std::optional<PortNumber> in_port,
                                                               const FloodPorts& ports) const {
    std::vector<FloodAction> actions;
    if (ctx.is_root) {
        actions = external_flag(ctx, in_port, ports);
        append(actions, ports.away);
        if (in_port && ctx.roles.is_away(*in_port)) {
            actions.push_back(FloodAction::output_in_port());
        }
        append(actions, ports.local);
        return actions;
    }

    if (in_port && ctx.roles.is_away(*in_port)) {
        // From further away: only towards the root, which reflects it back.
        return ports.toward;
    }
    if (in_port && ctx.roles.is_towards(*in_port)) {
        actions = external_flag(ctx, in_port, ports);
        append(actions, ports.away);
        append(actions, ports.local);
        return actions;
    }
    if (in_port && ctx.is_stack_port(*in_port)) {
        return actions; // stack port that is not up
    }
    actions = external_flag(ctx, in_port, ports);
    append(actions, ports.toward);
    append(actions, ports.local);
    return actions;
}

std::optional<std::vector<FloodAction>> ReflectedFloodStrategy::echo_actions(const FloodContext& ctx,
                                                                             PortNumber in_port,
                                                                             const FloodPorts& ports) const {
    if (ctx.is_root || !ctx.roles.is_towards(in_port)) {
        return std::nullopt;
    }
    // Local hosts already got the frame at ingress; only pass it further away.
    return ports.away;
}

std::shared_ptr<const FloodStrategy> make_flood_strategy(FloodMode mode) {
    switch (mode) {
        case FloodMode::DIRECT:
            return std::make_shared<DirectFloodStrategy>();
        case FloodMode::REFLECTED:
            return std::make_shared<ReflectedFloodStrategy>();
    }
    throw std::invalid_argument("make_flood_strategy: unknown flood mode");
}

// --- FloodPolicyEngine ---

FloodPolicyEngine::FloodPolicyEngine(FloodMode mode) : strategy_(make_flood_strategy(mode)) {}

FloodMode FloodPolicyEngine::select_mode(const std::optional<std::size_t>& longest_path_to_root) {
    if (longest_path_to_root && *longest_path_to_root > 2) {
        return FloodMode::REFLECTED;
    }
    return FloodMode::DIRECT;
}

FloodPorts FloodPolicyEngine::flood_ports(const FloodContext& ctx, std::optional<PortNumber> in_port,
                                          bool exclude_all_external) const {
    FloodPorts ports;

    std::optional<std::string> in_peer;
    if (in_port) {
        auto it = ctx.stack_ports.find(*in_port);
        if (it != ctx.stack_ports.end()) {
            in_peer = it->second.dp;
        }
        auto local = ctx.local_ports.find(*in_port);
        ports.external_ingress = local != ctx.local_ports.end() && local->second;
    }

    // Never back out the ingress port, nor to the datapath it came from.
    auto excluded = [&](PortNumber port) {
        if (in_port && port == *in_port) {
            return true;
        }
        auto it = ctx.stack_ports.find(port);
        return in_peer && it != ctx.stack_ports.end() && it->second.dp == *in_peer;
    };

    if (ctx.roles.chosen_towards_port && !excluded(*ctx.roles.chosen_towards_port)) {
        ports.toward.push_back(FloodAction::output(*ctx.roles.chosen_towards_port));
    }
    for (PortNumber port : ctx.roles.away) {
        if (ctx.roles.is_inactive(port) || ctx.roles.is_pruned(port) || excluded(port)) {
            continue;
        }
        ports.away.push_back(FloodAction::output(port));
    }

    const bool skip_external = exclude_all_external || ctx.external_root_only || ports.external_ingress;
    for (const auto& [port, external] : ctx.local_ports) {
        if (in_port && port == *in_port) {
            continue;
        }
        if (external && skip_external) {
            continue;
        }
        ports.local.push_back(FloodAction::output(port));
        ports.local_includes_external = ports.local_includes_external || external;
    }
    return ports;
}

std::vector<FloodAction> FloodPolicyEngine::flood_actions(const FloodContext& ctx,
                                                          std::optional<PortNumber> in_port,
                                                          bool exclude_all_external) const {
    if (in_port && ctx.is_stack_port(*in_port) && is_pruned_ingress(ctx, *in_port)) {
        return {};
    }
    return strategy_->flood_actions(ctx, in_port, flood_ports(ctx, in_port, exclude_all_external));
}

std::optional<std::vector<FloodAction>> FloodPolicyEngine::echo_flood_actions(const FloodContext& ctx,
                                                                              PortNumber in_port,
                                                                              bool exclude_all_external) const {
    if (is_pruned_ingress(ctx, in_port)) {
        return std::nullopt;
    }
    return strategy_->echo_actions(ctx, in_port, flood_ports(ctx, in_port, exclude_all_external));
}

std::set<PortNumber> FloodPolicyEngine::flood_stack_ports(const FloodContext& ctx,
                                                          std::optional<PortNumber> in_port) const {
    std::set<PortNumber> result;
    for (const FloodAction& action : flood_actions(ctx, in_port)) {
        if (action.type == FloodAction::Type::OUTPUT && ctx.is_stack_port(action.port)) {
            result.insert(action.port);
        } else if (action.type == FloodAction::Type::OUTPUT_IN_PORT && in_port) {
            result.insert(*in_port);
        }
    }
    return result;
}

bool FloodPolicyEngine::is_pruned_ingress(const FloodContext& ctx, PortNumber in_port) const {
    if (!ctx.is_stack_port(in_port)) {
        return false;
    }
    if (ctx.roles.chosen_towards_port && *ctx.roles.chosen_towards_port == in_port) {
        return false;
    }
    return !(ctx.roles.is_away(in_port) && !ctx.roles.is_pruned(in_port) && !ctx.roles.is_inactive(in_port));
}

std::vector<FlowRule> FloodPolicyEngine::build_flood_rules(const FloodContext& ctx) const {
    std::vector<FlowRule> rules;

    for (const auto& [port, external] : ctx.local_ports) {
        (void)external;
        FlowRule rule;
        rule.in_port = port;
        rule.actions = flood_actions(ctx, port);
        rules.push_back(rule);
    }

    const bool split_by_flag = ctx.has_externals();
    for (const auto& [port, peer] : ctx.stack_ports) {
        (void)peer;
        if (is_pruned_ingress(ctx, port)) {
            FlowRule rule;
            rule.in_port = port;
            rule.drop = true;
            rules.push_back(rule);
            continue;
        }

        std::vector<std::optional<bool>> flags;
        if (split_by_flag) {
            flags = {false, true};
        } else {
            flags = {std::nullopt};
        }
        for (const auto& flag : flags) {
            // A frame tagged "no external" must not reach external ports here.
            const bool exclude_all_external = flag.has_value() && !*flag;

            FlowRule rule;
            rule.in_port = port;
            rule.external_forwarding = flag;
            rule.actions = flood_actions(ctx, port, exclude_all_external);
            rules.push_back(rule);

            auto echo = echo_flood_actions(ctx, port, exclude_all_external);
            if (echo) {
                FlowRule echo_rule = rule;
                echo_rule.source_learned_locally = true;
                echo_rule.actions = *echo;
                rules.push_back(echo_rule);
            }
        }
    }
    return rules;
}

} // namespace netstack
