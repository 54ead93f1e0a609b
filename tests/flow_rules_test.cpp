#include "gtest/gtest.h"
#include "netstack/flow_rules.hpp"

#include <utility>
#include <vector>

using netstack::FloodAction;
using netstack::FlowRule;
using netstack::FlowRuleDelta;

namespace {

FlowRule flood_rule(netstack::PortNumber in_port, std::vector<FloodAction> actions) {
    FlowRule rule;
    rule.in_port = in_port;
    rule.actions = std::move(actions);
    return rule;
}

} // namespace

TEST(FlowRulesTest, MatchKeys) {
    FlowRule rule = flood_rule(3, {FloodAction::output(1)});
    EXPECT_EQ(rule.match_key(), "flood:in_port=3");
    rule.external_forwarding = false;
    rule.source_learned_locally = true;
    EXPECT_EQ(rule.match_key(), "flood:in_port=3,ext=0,src_local=1");

    FlowRule tunnel;
    tunnel.kind = netstack::FlowRuleKind::TUNNEL;
    tunnel.tunnel_id = 42;
    EXPECT_EQ(tunnel.match_key(), "tunnel:42");
}

TEST(FlowRulesTest, RuleText) {
    FlowRule rule = flood_rule(3, {FloodAction::set_no_external_forwarding(), FloodAction::output(1),
                                   FloodAction::output_in_port()});
    EXPECT_EQ(rule.to_string(), "flood:in_port=3 -> [set_noext, output:1, output:in_port]");
    rule.drop = true;
    EXPECT_EQ(rule.to_string(), "flood:in_port=3 -> drop");
}

TEST(FlowRulesTest, DiffEmitsDeletesThenInstallsAndReplaces) {
    netstack::FlowRuleSet previous = netstack::make_rule_set({
        flood_rule(1, {FloodAction::output(2)}),
        flood_rule(2, {FloodAction::output(1)}),
        flood_rule(3, {FloodAction::output(1)}),
    });
    netstack::FlowRuleSet next = netstack::make_rule_set({
        flood_rule(1, {FloodAction::output(2)}),
        flood_rule(2, {FloodAction::output(4)}),
        flood_rule(4, {FloodAction::output(1)}),
    });

    std::vector<FlowRuleDelta> deltas = netstack::diff_rule_sets(previous, next);
    ASSERT_EQ(deltas.size(), 3u);
    EXPECT_EQ(deltas[0].op, FlowRuleDelta::Op::DELETE);
    EXPECT_EQ(deltas[0].rule.in_port, 3u);
    EXPECT_EQ(deltas[1].op, FlowRuleDelta::Op::REPLACE);
    EXPECT_EQ(deltas[1].rule.in_port, 2u);
    EXPECT_EQ(deltas[2].op, FlowRuleDelta::Op::INSTALL);
    EXPECT_EQ(deltas[2].rule.in_port, 4u);
    EXPECT_EQ(netstack::to_string(deltas[1].op), "REPLACE");

    EXPECT_TRUE(netstack::diff_rule_sets(next, next).empty());
}
