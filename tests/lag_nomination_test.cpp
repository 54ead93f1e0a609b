#include "gtest/gtest.h"
#include "netstack/datapath.hpp"
#include "netstack/lag_nomination.hpp"
#include "test_helpers.hpp"

using namespace netstack_test;

class LagNominationTest : public ::testing::Test {
protected:
    netstack::StackTopologyConfig config;
    netstack::DatapathTable datapaths;

    void SetUp() override {
        config = make_ring_config(3);
        // LAG 1: two members on s3, one on s1 and s2 each.
        add_local_port(config, "s1", 20, false, 1);
        add_local_port(config, "s2", 20, false, 1);
        add_local_port(config, "s3", 20, false, 1);
        add_local_port(config, "s3", 21, false, 1);
        for (const auto& entry : config.datapaths) {
            datapaths.emplace(entry.first, netstack::Datapath(entry.second, config.datapaths));
        }
    }

    void set_member(const std::string& dp, netstack::PortNumber port, bool up) {
        datapaths.at(dp).find_local_port(port)->up = up;
    }
};

TEST_F(LagNominationTest, MostMembersUpWins) {
    auto nomination = netstack::nominate_lacp_datapath(1, datapaths, "s1");
    ASSERT_TRUE(nomination.has_value());
    EXPECT_EQ(nomination->dp_name, "s3");
    EXPECT_EQ(nomination->dp_id, 3u);
    EXPECT_EQ(nomination->ports_up, 2u);
    EXPECT_EQ(nomination->reason, "most LAG ports up");
}

TEST_F(LagNominationTest, TieGoesToRoot) {
    set_member("s3", 21, false);
    auto nomination = netstack::nominate_lacp_datapath(1, datapaths, "s2");
    ASSERT_TRUE(nomination.has_value());
    EXPECT_EQ(nomination->dp_name, "s2");
    EXPECT_EQ(nomination->reason, "stack root");
}

TEST_F(LagNominationTest, TieWithoutRootGoesToLowestDpId) {
    set_member("s3", 21, false);
    set_member("s1", 20, false);
    auto nomination = netstack::nominate_lacp_datapath(1, datapaths, "s1");
    ASSERT_TRUE(nomination.has_value());
    EXPECT_EQ(nomination->dp_name, "s2");
    EXPECT_EQ(nomination->reason, "lowest dp_id");
}

TEST_F(LagNominationTest, NoMembersUp) {
    EXPECT_FALSE(netstack::nominate_lacp_datapath(9, datapaths, "s1").has_value());
    set_member("s1", 20, false);
    set_member("s2", 20, false);
    set_member("s3", 20, false);
    set_member("s3", 21, false);
    EXPECT_FALSE(netstack::nominate_lacp_datapath(1, datapaths, "s1").has_value());
    EXPECT_TRUE(datapaths.at("s1").all_lags_down());
}
