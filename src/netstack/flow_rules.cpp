#include "netstack/flow_rules.hpp"

#include <sstream>

namespace netstack {

std::string FloodAction::to_string() const {
    switch (type) {
        case Type::OUTPUT:                     return "output:" + std::to_string(port);
        case Type::OUTPUT_IN_PORT:             return "output:in_port";
        case Type::SET_EXTERNAL_FORWARDING:    return "set_ext";
        case Type::SET_NO_EXTERNAL_FORWARDING: return "set_noext";
        default:                               return "unknown";
    }
}

std::string FlowRule::match_key() const {
    std::ostringstream oss;
    if (kind == FlowRuleKind::TUNNEL) {
        oss << "tunnel:" << tunnel_id;
        return oss.str();
    }
    oss << "flood:in_port=" << in_port;
    if (external_forwarding) {
        oss << ",ext=" << (*external_forwarding ? 1 : 0);
    }
    if (source_learned_locally) {
        oss << ",src_local=" << (*source_learned_locally ? 1 : 0);
    }
    return oss.str();
}

std::string FlowRule::to_string() const {
    std::ostringstream oss;
    oss << match_key() << " -> ";
    if (drop) {
        oss << "drop";
        return oss.str();
    }
    oss << "[";
    for (std::size_t i = 0; i < actions.size(); ++i) {
        oss << (i ? ", " : "") << actions[i].to_string();
    }
    oss << "]";
    return oss.str();
}

bool FlowRule::operator==(const FlowRule& other) const {
    return kind == other.kind && in_port == other.in_port &&
           external_forwarding == other.external_forwarding &&
           source_learned_locally == other.source_learned_locally &&
           tunnel_id == other.tunnel_id && drop == other.drop && actions == other.actions;
}

std::string to_string(FlowRuleDelta::Op op) {
    switch (op) {
        case FlowRuleDelta::Op::INSTALL: return "INSTALL";
        case FlowRuleDelta::Op::REPLACE: return "REPLACE";
        case FlowRuleDelta::Op::DELETE:  return "DELETE";
        default:                         return "UNKNOWN";
    }
}

FlowRuleSet make_rule_set(const std::vector<FlowRule>& rules) {
    FlowRuleSet set;
    for (const auto& rule : rules) {
        set[rule.match_key()] = rule;
    }
    return set;
}

std::vector<FlowRuleDelta> diff_rule_sets(const FlowRuleSet& previous, const FlowRuleSet& next) {
    std::vector<FlowRuleDelta> deltas;
    for (const auto& [key, rule] : previous) {
        if (!next.count(key)) {
            deltas.push_back({FlowRuleDelta::Op::DELETE, rule});
        }
    }
    for (const auto& [key, rule] : next) {
        auto it = previous.find(key);
        if (it == previous.end()) {
            deltas.push_back({FlowRuleDelta::Op::INSTALL, rule});
        } else if (it->second != rule) {
            deltas.push_back({FlowRuleDelta::Op::REPLACE, rule});
        }
    }
    return deltas;
}

} // namespace netstack
