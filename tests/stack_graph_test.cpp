#include "gtest/gtest.h"
#include "netstack/stack_graph.hpp"

#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using netstack::PortRef;
using netstack::StackGraph;

class StackGraphTest : public ::testing::Test {
protected:
    StackGraph graph;

    // s1 - s2 - s3 - s4 - s1, with s1:1 <-> s2:2 style wiring.
    void build_ring4() {
        graph.add_link("s1", 1, "s2", 2);
        graph.add_link("s2", 1, "s3", 2);
        graph.add_link("s3", 1, "s4", 2);
        graph.add_link("s4", 1, "s1", 2);
    }
};

TEST_F(StackGraphTest, CanonicalEdgeKeyIsOrderIndependent) {
    EXPECT_EQ(StackGraph::canonical_edge_key({"s2", 3}, {"s1", 1}), "s1:1-s2:3");
    EXPECT_EQ(StackGraph::canonical_edge_key({"s1", 1}, {"s2", 3}), "s1:1-s2:3");
}

TEST_F(StackGraphTest, AddLinkIsIdempotentFromBothEnds) {
    EXPECT_TRUE(graph.add_link("s1", 1, "s2", 1));
    EXPECT_FALSE(graph.add_link("s2", 1, "s1", 1));
    EXPECT_EQ(graph.edge_count(), 1u);
    EXPECT_EQ(graph.node_count(), 2u);
    EXPECT_TRUE(graph.has_link("s2", 1, "s1", 1));
}

TEST_F(StackGraphTest, ParallelLinksAreDistinctEdges) {
    graph.add_link("s1", 1, "s2", 1);
    graph.add_link("s1", 2, "s2", 2);
    EXPECT_EQ(graph.edge_count(), 2u);
    EXPECT_EQ(graph.neighbours("s1"), (std::set<std::string>{"s2"}));

    graph.remove_link("s1", 1, "s2", 1);
    EXPECT_EQ(graph.neighbours("s1"), (std::set<std::string>{"s2"}));
    EXPECT_EQ(graph.distance("s1", "s2"), 1u);
}

TEST_F(StackGraphTest, RejectsInvalidLinks) {
    EXPECT_THROW(graph.add_link("s1", 1, "s1", 1), std::invalid_argument);
    EXPECT_THROW(graph.add_link("", 1, "s2", 1), std::invalid_argument);
    graph.add_link("s1", 1, "s2", 1);
    EXPECT_THROW(graph.add_link("s1", 1, "s3", 1), std::invalid_argument);
    EXPECT_THROW(graph.add_node(""), std::invalid_argument);
}

TEST_F(StackGraphTest, RemoveLinkDropsIsolatedNodes) {
    graph.add_link("s1", 1, "s2", 1);
    graph.add_link("s2", 2, "s3", 1);
    EXPECT_TRUE(graph.remove_link("s3", 1, "s2", 2));
    EXPECT_FALSE(graph.has_node("s3"));
    EXPECT_TRUE(graph.has_node("s2"));
    EXPECT_FALSE(graph.remove_link("s3", 1, "s2", 2));
    EXPECT_TRUE(graph.shortest_path("s1", "s3").empty());
}

TEST_F(StackGraphTest, ShortestPathPrefersLexicographicallySmallestNames) {
    build_ring4();
    // s3 is two hops from s1 through either s2 or s4.
    std::vector<std::string> path = graph.shortest_path("s3", "s1");
    EXPECT_EQ(path, (std::vector<std::string>{"s3", "s2", "s1"}));
    EXPECT_EQ(graph.shortest_path("s1", "s3"), (std::vector<std::string>{"s1", "s2", "s3"}));
    EXPECT_EQ(graph.shortest_path("s2", "s2"), (std::vector<std::string>{"s2"}));
}

TEST_F(StackGraphTest, ShortestPathStepsAreAdjacent) {
    build_ring4();
    graph.add_link("s2", 5, "s4", 5);
    for (const auto& src : graph.nodes()) {
        for (const auto& dst : graph.nodes()) {
            std::vector<std::string> path = graph.shortest_path(src, dst);
            ASSERT_FALSE(path.empty());
            EXPECT_EQ(path.front(), src);
            EXPECT_EQ(path.back(), dst);
            EXPECT_EQ(path.size() - 1, graph.distance(src, dst).value());
            for (std::size_t i = 0; i + 1 < path.size(); ++i) {
                EXPECT_TRUE(graph.neighbours(path[i]).count(path[i + 1])) << path[i] << "->" << path[i + 1];
            }
        }
    }
}

TEST_F(StackGraphTest, UnknownOrUnreachableNodesHaveNoPath) {
    graph.add_link("s1", 1, "s2", 1);
    graph.add_link("s3", 1, "s4", 1);
    EXPECT_TRUE(graph.shortest_path("s1", "s9").empty());
    EXPECT_TRUE(graph.shortest_path("s1", "s3").empty());
    EXPECT_FALSE(graph.distance("s1", "s4").has_value());
    EXPECT_FALSE(graph.is_in_path("s1", "s3", "s2"));
}

TEST_F(StackGraphTest, IsInPathAndLongestPath) {
    build_ring4();
    EXPECT_TRUE(graph.is_in_path("s3", "s1", "s2"));
    EXPECT_FALSE(graph.is_in_path("s3", "s1", "s4"));
    // s3 is two hops from s1: s3, s2, s1.
    EXPECT_EQ(graph.longest_path_to("s1"), 3u);
    EXPECT_FALSE(graph.longest_path_to("s9").has_value());
}

TEST_F(StackGraphTest, PortsAndPeers) {
    build_ring4();
    auto ports = graph.ports_of("s1");
    ASSERT_EQ(ports.size(), 2u);
    EXPECT_EQ(ports.at(1), PortRef("s2", 2));
    EXPECT_EQ(ports.at(2), PortRef("s4", 1));
    EXPECT_EQ(graph.peer_of({"s2", 2}), PortRef("s1", 1));
    EXPECT_FALSE(graph.peer_of({"s2", 9}).has_value());
    EXPECT_EQ(graph.all_up_ports().size(), 8u);
}

TEST_F(StackGraphTest, GenerationTracksStructuralChanges) {
    uint64_t start = graph.generation();
    graph.add_link("s1", 1, "s2", 1);
    uint64_t after_add = graph.generation();
    EXPECT_GT(after_add, start);
    graph.add_link("s2", 1, "s1", 1);
    EXPECT_EQ(graph.generation(), after_add);
    graph.remove_link("s1", 1, "s2", 1);
    EXPECT_GT(graph.generation(), after_add);
}

TEST_F(StackGraphTest, TopologyHashFollowsDegrees) {
    StackGraph other;
    graph.add_link("s1", 1, "s2", 1);
    other.add_link("s1", 7, "s2", 9);
    EXPECT_EQ(graph.topology_hash(), other.topology_hash());
    other.add_link("s1", 8, "s2", 8);
    EXPECT_NE(graph.topology_hash(), other.topology_hash());
}

TEST_F(StackGraphTest, NodeLinkSerialization) {
    graph.add_link("s2", 3, "s1", 1);
    std::string text = graph.to_node_link_string();
    EXPECT_NE(text.find("\"multigraph\": true"), std::string::npos);
    EXPECT_NE(text.find("{\"id\": \"s1\"}"), std::string::npos);
    EXPECT_NE(text.find("\"key\": \"s1:1-s2:3\""), std::string::npos);
    EXPECT_NE(text.find("\"dp_a\": \"s1\", \"port_a\": 1, \"dp_z\": \"s2\", \"port_z\": 3"), std::string::npos);
}

TEST_F(StackGraphTest, ClearEmptiesGraph) {
    build_ring4();
    graph.clear();
    EXPECT_TRUE(graph.empty());
    EXPECT_TRUE(graph.nodes().empty());
    EXPECT_TRUE(graph.shortest_path("s1", "s2").empty());
}
