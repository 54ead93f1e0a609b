#include "gtest/gtest.h"
#include "netstack/port_role_classifier.hpp"
#include "netstack/stack_config.hpp"
#include "netstack/stack_graph.hpp"
#include "netstack/tunnel_path_resolver.hpp"
#include "test_helpers.hpp"

#include <optional>

using namespace netstack_test;
using netstack::PortNumber;
using netstack::TunnelPathResolver;
using netstack::TunnelDefinition;

class TunnelPathResolverTest : public ::testing::Test {
protected:
    netstack::StackGraph graph;
    TunnelPathResolver resolver;

    // Ring of four: s1:1-s2:2, s2:1-s3:2, s3:1-s4:2, s4:1-s1:2.
    void SetUp() override {
        graph = netstack::build_configured_graph(make_ring_config(4));
    }

    netstack::PortRoleSets roles(const std::string& dp) const {
        return netstack::PortRoleClassifier::classify(graph, dp, "s1", netstack::ascending_port_order());
    }
};

TEST_F(TunnelPathResolverTest, OutportAlongShortestPath) {
    TunnelDefinition tunnel{1, "s3", "s1", 10};
    EXPECT_EQ(resolver.tunnel_outport(graph, "s3", tunnel), PortNumber{2});
    EXPECT_EQ(resolver.tunnel_outport(graph, "s2", tunnel), PortNumber{2});
    EXPECT_EQ(resolver.tunnel_outport(graph, "s1", tunnel), PortNumber{10});
    EXPECT_FALSE(resolver.tunnel_outport(graph, "s4", tunnel).has_value());
}

TEST_F(TunnelPathResolverTest, LocalTunnelOnlyOnItsDatapath) {
    TunnelDefinition tunnel{2, "s2", "s2", 12};
    EXPECT_EQ(resolver.tunnel_outport(graph, "s2", tunnel), PortNumber{12});
    EXPECT_FALSE(resolver.tunnel_outport(graph, "s1", tunnel).has_value());
}

TEST_F(TunnelPathResolverTest, NoPathNoOutport) {
    graph.remove_link("s3", 2, "s2", 1);
    graph.remove_link("s3", 1, "s4", 2);
    TunnelDefinition tunnel{3, "s1", "s3", 10};
    EXPECT_FALSE(resolver.tunnel_outport(graph, "s1", tunnel).has_value());
    EXPECT_FALSE(resolver.shortest_path_port(graph, "s1", "s3").has_value());
}

TEST_F(TunnelPathResolverTest, ReroutesAfterLinkLoss) {
    TunnelDefinition tunnel{4, "s1", "s3", 10};
    EXPECT_EQ(resolver.tunnel_outport(graph, "s1", tunnel), PortNumber{1});
    graph.remove_link("s1", 1, "s2", 2);
    EXPECT_EQ(resolver.tunnel_outport(graph, "s1", tunnel), PortNumber{2});
    EXPECT_EQ(resolver.tunnel_outport(graph, "s4", tunnel), PortNumber{2});
}

TEST_F(TunnelPathResolverTest, ResolveAll) {
    std::vector<TunnelDefinition> tunnels{{1, "s3", "s1", 10}, {2, "s4", "s3", 11}};
    auto outputs = resolver.resolve_all(graph, "s2", tunnels);
    ASSERT_EQ(outputs.size(), 2u);
    EXPECT_EQ(outputs.at(1), PortNumber{2});
    EXPECT_FALSE(outputs.at(2).has_value()); // s4 reaches s3 directly
}

TEST_F(TunnelPathResolverTest, DefaultPortTowards) {
    EXPECT_EQ(resolver.default_port_towards(graph, "s1", "s3"), PortNumber{1});
    EXPECT_FALSE(resolver.default_port_towards(graph, "s1", "s1").has_value());
}

TEST_F(TunnelPathResolverTest, RelativePortTowards) {
    // s2 sits between s3 and the root: head away from the root.
    EXPECT_EQ(resolver.relative_port_towards(graph, "s2", "s1", roles("s2"), "s3"), PortNumber{1});
    // The root heads away towards s3 as well.
    EXPECT_EQ(resolver.relative_port_towards(graph, "s1", "s1", roles("s1"), "s3"), PortNumber{1});
    // s4 is not on s3's root path: go towards the root.
    EXPECT_EQ(resolver.relative_port_towards(graph, "s4", "s1", roles("s4"), "s3"), PortNumber{1});
}

TEST_F(TunnelPathResolverTest, SymmetricPortUsesPeersFirstPort) {
    graph = netstack::build_configured_graph(make_parallel_ring_config());
    EXPECT_EQ(resolver.shortest_symmetric_path_port(graph, "s2", "s1"), PortNumber{1});
    EXPECT_EQ(resolver.shortest_symmetric_path_port(graph, "s3", "s1"), PortNumber{1});

    graph = netstack::build_configured_graph(make_ring_config(4));
    EXPECT_FALSE(resolver.shortest_symmetric_path_port(graph, "s3", "s1").has_value());
}
