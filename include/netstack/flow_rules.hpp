#ifndef NETSTACK_FLOW_RULES_HPP
#define NETSTACK_FLOW_RULES_HPP

#include "netstack/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace netstack {

struct FloodAction {
    enum class Type {
        OUTPUT,
        OUTPUT_IN_PORT, // re-output on the ingress port (root reflection)
        SET_EXTERNAL_FORWARDING,
        SET_NO_EXTERNAL_FORWARDING
    };

    Type type = Type::OUTPUT;
    PortNumber port = 0; // OUTPUT only

    static FloodAction output(PortNumber port) { return {Type::OUTPUT, port}; }
    static FloodAction output_in_port() { return {Type::OUTPUT_IN_PORT, 0}; }
    static FloodAction set_external_forwarding() { return {Type::SET_EXTERNAL_FORWARDING, 0}; }
    static FloodAction set_no_external_forwarding() { return {Type::SET_NO_EXTERNAL_FORWARDING, 0}; }

    bool operator==(const FloodAction& other) const {
        return type == other.type && port == other.port;
    }
    bool operator!=(const FloodAction& other) const { return !(*this == other); }

    std::string to_string() const;
};

enum class FlowRuleKind {
    FLOOD,
    TUNNEL
};

// Abstract forwarding rule; the pipeline collaborator turns it into wire
// instructions. Flood rules match on ingress port and optionally on the
// external-forwarding flag and on whether the source host was learned on a
// local port. Tunnel rules match on the tunnel id.
struct FlowRule {
    FlowRuleKind kind = FlowRuleKind::FLOOD;
    PortNumber in_port = 0;
    std::optional<bool> external_forwarding;
    std::optional<bool> source_learned_locally;
    uint32_t tunnel_id = 0;
    bool drop = false;
    std::vector<FloodAction> actions;

    // Identifies the match; two rules with the same key replace each other.
    std::string match_key() const;
    std::string to_string() const;

    bool operator==(const FlowRule& other) const;
    bool operator!=(const FlowRule& other) const { return !(*this == other); }
};

struct FlowRuleDelta {
    enum class Op {
        INSTALL,
        REPLACE,
        DELETE
    };

    Op op = Op::INSTALL;
    FlowRule rule;
};

std::string to_string(FlowRuleDelta::Op op);

using FlowRuleSet = std::map<std::string, FlowRule>;

FlowRuleSet make_rule_set(const std::vector<FlowRule>& rules);

// Deltas turning `previous` into `next`: deletes first, then installs and
// replaces, each in match-key order.
std::vector<FlowRuleDelta> diff_rule_sets(const FlowRuleSet& previous, const FlowRuleSet& next);

// Fire-and-forget emission point. Returning false reports a failed send;
// the caller logs and counts it and does not retry.
class FlowRuleSink {
public:
    virtual ~FlowRuleSink() = default;
    virtual bool send(DpId dp_id, const std::string& dp_name, const std::vector<FlowRuleDelta>& deltas) = 0;
};

} // namespace netstack

#endif // NETSTACK_FLOW_RULES_HPP
