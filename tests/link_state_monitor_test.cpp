#include "gtest/gtest.h"
#include "netstack/datapath.hpp"
#include "netstack/link_state_monitor.hpp"
#include "netstack/stack_metrics.hpp"
#include "test_helpers.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>

using namespace netstack_test;
using netstack::PortRef;
using netstack::StackState;
using std::chrono::seconds;

// --- Test Fixture ---
class LinkStateMonitorTest : public ::testing::Test {
protected:
    netstack::StackTopologyConfig config;
    netstack::DatapathTable datapaths;
    DummyStackLogger logger;
    netstack::StackMetrics metrics;
    std::unique_ptr<netstack::LinkStateMonitor> monitor;
    netstack::TimePoint t0 = netstack::TimePoint() + seconds(1000);

    void SetUp() override {
        // s1:1 <-> s2:3, s2:4 <-> s5:7
        add_datapath(config, "s1", 0x1, 1);
        add_datapath(config, "s2", 0x2);
        add_datapath(config, "s5", 0x5);
        add_stack_link(config, "s1", 1, "s2", 3);
        add_stack_link(config, "s2", 4, "s5", 7);
        for (const auto& entry : config.datapaths) {
            datapaths.emplace(entry.first, netstack::Datapath(entry.second, config.datapaths));
        }
        monitor = std::make_unique<netstack::LinkStateMonitor>(datapaths, config.timing, &logger, &metrics);
    }

    netstack::KeepaliveProbe probe(const std::string& to_dp, netstack::PortNumber to_port,
                                   const std::string& from_dp, netstack::PortNumber from_port,
                                   netstack::TimePoint now) {
        netstack::KeepaliveProbe p;
        p.receiving_dp = to_dp;
        p.receiving_port = to_port;
        p.remote_dp_name = from_dp;
        p.remote_dp_id = datapaths.at(from_dp).dp_id();
        p.remote_port = from_port;
        p.remote_port_state = datapaths.at(from_dp).find_stack_port(from_port)->state;
        p.now = now;
        return p;
    }

    StackState state(const std::string& dp, netstack::PortNumber port) {
        return monitor->port(PortRef(dp, port)).state;
    }
};

TEST_F(LinkStateMonitorTest, FirstProbeSentMovesToInit) {
    auto transition = monitor->probe_sent("s1", 1, t0);
    ASSERT_TRUE(transition.has_value());
    EXPECT_EQ(transition->before, StackState::NONE);
    EXPECT_EQ(transition->after, StackState::INIT);
    EXPECT_FALSE(transition->link_up);
    EXPECT_EQ(metrics.port_stack_state(PortRef("s1", 1)), 1u);
    EXPECT_FALSE(monitor->probe_sent("s1", 1, t0 + seconds(5)).has_value());
}

TEST_F(LinkStateMonitorTest, ValidProbeBringsPortUp) {
    monitor->probe_sent("s1", 1, t0);
    monitor->probe_sent("s2", 3, t0);
    auto transition = monitor->probe_received(probe("s1", 1, "s2", 3, t0));
    ASSERT_TRUE(transition.has_value());
    EXPECT_EQ(transition->after, StackState::UP);
    EXPECT_TRUE(transition->link_up);
    EXPECT_EQ(transition->peer, PortRef("s2", 3));
    EXPECT_TRUE(monitor->link_is_up(PortRef("s1", 1)));
    // The peer is still INIT but sees the link up because s1 is UP.
    EXPECT_EQ(state("s2", 3), StackState::INIT);
    EXPECT_TRUE(monitor->link_is_up(PortRef("s2", 3)));
    EXPECT_EQ(metrics.probes_received("s1"), 1u);
    EXPECT_TRUE(logger.contains("Stack s1:1 state UP (previous state INIT)"));
}

TEST_F(LinkStateMonitorTest, MiscablingMarksPortBadWithoutThrowing) {
    monitor->probe_sent("s1", 1, t0);
    // s1:1 expects s2:3 but the cable actually lands on s5:7.
    std::optional<netstack::LinkTransition> transition;
    EXPECT_NO_THROW(transition = monitor->probe_received(probe("s1", 1, "s5", 7, t0)));
    ASSERT_TRUE(transition.has_value());
    EXPECT_EQ(transition->after, StackState::BAD);
    EXPECT_FALSE(transition->link_up);
    EXPECT_EQ(metrics.cabling_errors("s1"), 1u);
    EXPECT_FALSE(monitor->port(PortRef("s1", 1)).cabling_correct);
    EXPECT_TRUE(logger.contains("Stack s1:1 cabling incorrect, expected s2:0x2:3, actual s5:0x5:7"));
    EXPECT_GE(logger.count(netstack::LogLevel::ERROR), 1u);

    // Repeated bad probes count but do not re-transition.
    EXPECT_FALSE(monitor->probe_received(probe("s1", 1, "s5", 7, t0 + seconds(5))).has_value());
    EXPECT_EQ(metrics.cabling_errors("s1"), 2u);
    EXPECT_EQ(metrics.total_cabling_errors(), 2u);
}

TEST_F(LinkStateMonitorTest, WrongRemotePortIsMiscabling) {
    monitor->probe_received(probe("s1", 1, "s2", 4, t0));
    EXPECT_EQ(state("s1", 1), StackState::BAD);
}

TEST_F(LinkStateMonitorTest, BadPortRecoversOnValidProbe) {
    monitor->probe_received(probe("s1", 1, "s5", 7, t0));
    auto transition = monitor->probe_received(probe("s1", 1, "s2", 3, t0 + seconds(1)));
    ASSERT_TRUE(transition.has_value());
    EXPECT_EQ(transition->before, StackState::BAD);
    EXPECT_EQ(transition->after, StackState::UP);
}

TEST_F(LinkStateMonitorTest, SilentPortTimesOut) {
    monitor->probe_sent("s1", 1, t0);
    monitor->probe_received(probe("s1", 1, "s2", 3, t0));
    EXPECT_EQ(monitor->liveness_timeout(), seconds(15));

    EXPECT_TRUE(monitor->check_timeouts(t0 + seconds(15)).empty());
    auto transitions = monitor->check_timeouts(t0 + seconds(16));
    ASSERT_EQ(transitions.size(), 1u);
    EXPECT_EQ(transitions[0].port, PortRef("s1", 1));
    EXPECT_EQ(transitions[0].after, StackState::GONE);
    EXPECT_FALSE(transitions[0].link_up);
    EXPECT_TRUE(monitor->check_timeouts(t0 + seconds(30)).empty());
}

TEST_F(LinkStateMonitorTest, PersistentlyMiscabledPortStaysBad) {
    monitor->probe_sent("s2", 4, t0);
    std::size_t transitions = 0;
    // The wrong peer keeps probing every 5s for ten liveness timeouts.
    for (int elapsed = 0; elapsed <= 150; elapsed += 5) {
        if (monitor->probe_received(probe("s2", 4, "s1", 1, t0 + seconds(elapsed)))) {
            transitions++;
        }
        transitions += monitor->check_timeouts(t0 + seconds(elapsed + 1)).size();
    }
    EXPECT_EQ(transitions, 1u); // INIT -> BAD only
    EXPECT_EQ(state("s2", 4), StackState::BAD);
    EXPECT_EQ(metrics.port_stack_state(PortRef("s2", 4)), 2u);

    // Once the probes stop the port times out like any other.
    auto expired = monitor->check_timeouts(t0 + seconds(150 + 16));
    ASSERT_EQ(expired.size(), 1u);
    EXPECT_EQ(expired[0].before, StackState::BAD);
    EXPECT_EQ(expired[0].after, StackState::GONE);
}

TEST_F(LinkStateMonitorTest, InitPortWithoutValidProbeTimesOut) {
    monitor->probe_sent("s2", 4, t0);
    auto transitions = monitor->check_timeouts(t0 + seconds(16));
    ASSERT_EQ(transitions.size(), 1u);
    EXPECT_EQ(transitions[0].before, StackState::INIT);
}

TEST_F(LinkStateMonitorTest, PhysicalPortDownAndUp) {
    monitor->probe_sent("s1", 1, t0);
    monitor->probe_received(probe("s1", 1, "s2", 3, t0));

    auto down = monitor->port_status_changed("s1", 1, false, t0 + seconds(1));
    ASSERT_TRUE(down.has_value());
    EXPECT_EQ(down->after, StackState::GONE);
    // Probes are neither sent nor accepted while down.
    EXPECT_FALSE(monitor->probe_sent("s1", 1, t0 + seconds(2)).has_value());
    EXPECT_FALSE(monitor->probe_received(probe("s1", 1, "s2", 3, t0 + seconds(2))).has_value());
    EXPECT_EQ(state("s1", 1), StackState::GONE);

    auto up = monitor->port_status_changed("s1", 1, true, t0 + seconds(3));
    ASSERT_TRUE(up.has_value());
    EXPECT_EQ(up->after, StackState::INIT);
    EXPECT_FALSE(monitor->port(PortRef("s1", 1)).last_valid_probe.has_value());
}

TEST_F(LinkStateMonitorTest, UnknownPortsThrow) {
    EXPECT_THROW(monitor->probe_sent("s9", 1, t0), std::invalid_argument);
    EXPECT_THROW(monitor->probe_sent("s1", 42, t0), std::invalid_argument);
    EXPECT_THROW(monitor->link_is_up(PortRef("s1", 42)), std::invalid_argument);
}
