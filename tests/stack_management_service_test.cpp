#include "gtest/gtest.h"
#include "netstack/management_interface.hpp"
#include "netstack/stack_coordinator.hpp"
#include "netstack/stack_management_service.hpp"
#include "netstack/stack_metrics.hpp"
#include "test_helpers.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

using namespace netstack_test;
using std::chrono::seconds;

// --- Test Fixture ---
class StackManagementServiceTest : public ::testing::Test {
protected:
    DummyStackLogger logger;
    netstack::StackMetrics metrics;
    netstack::ManagementInterface mi;
    netstack::StackCoordinator coordinator{logger, metrics};
    netstack::StackManagementService service{logger, mi, coordinator, metrics};
    netstack::TimePoint t0 = netstack::TimePoint() + seconds(1000);
    const std::string base = netstack::StackManagementService::kDefaultBaseOid;

    void SetUp() override {
        netstack::StackTopologyConfig config = make_ring_config(3);
        coordinator.apply_config(config, t0);
        for (const auto& entry : config.datapaths) {
            coordinator.datapath_connect(entry.first, t0);
        }
        exchange_probes(coordinator, t0 + seconds(1));
        service.register_cli_commands();
        service.register_oids();
    }

    static bool has(const std::string& output, const std::string& fragment) {
        return output.find(fragment) != std::string::npos;
    }
};

TEST_F(StackManagementServiceTest, ShowStackSummary) {
    std::string output = mi.handle_cli_command("show stack");
    EXPECT_TRUE(has(output, "Stack root: s1")) << output;
    EXPECT_TRUE(has(output, "Flood mode: DIRECT")) << output;
    EXPECT_TRUE(has(output, "Links up: 3/3")) << output;
    EXPECT_TRUE(has(output, "s3")) << output;
}

TEST_F(StackManagementServiceTest, ShowStackRejectsUnknownOption) {
    EXPECT_EQ(mi.handle_cli_command("show stack bogus"), "Error: Unknown 'show stack' option: bogus");
    EXPECT_TRUE(has(mi.handle_cli_command("show bogus"), "Error: Unknown command or prefix"));
}

TEST_F(StackManagementServiceTest, LongestRegisteredCommandWins) {
    mi.register_command({"show", "stack", "ports", "all"}, [](const std::vector<std::string>& args) {
        return "all ports, " + std::to_string(args.size()) + " args";
    });
    EXPECT_EQ(mi.handle_cli_command("show stack ports all extra"), "all ports, 1 args");
    EXPECT_EQ(mi.handle_cli_command("show   stack ports   s9"), "Error: Unknown datapath: s9");
    EXPECT_EQ(mi.handle_cli_command("   "), "Error: Empty command.");
}

TEST_F(StackManagementServiceTest, ShowStackPorts) {
    std::string output = mi.handle_cli_command("show stack ports s2");
    EXPECT_TRUE(has(output, "Stack ports of s2:")) << output;
    EXPECT_TRUE(has(output, "-> s1:1")) << output;
    EXPECT_TRUE(has(output, "-> s3:2")) << output;
    EXPECT_TRUE(has(output, "link up")) << output;
    EXPECT_TRUE(has(output, "towards (chosen)")) << output;
    EXPECT_FALSE(has(output, "link down")) << output;
}

TEST_F(StackManagementServiceTest, ShowStackPortsArgumentErrors) {
    EXPECT_EQ(mi.handle_cli_command("show stack ports"), "Error: Usage: show stack ports <dp>");
    EXPECT_EQ(mi.handle_cli_command("show stack ports s9"), "Error: Unknown datapath: s9");
}

TEST_F(StackManagementServiceTest, ShowStackPortsReflectsLinkLoss) {
    coordinator.port_status_changed("s2", 2, false, t0 + seconds(2));
    std::string output = mi.handle_cli_command("show stack ports s2");
    EXPECT_TRUE(has(output, "GONE")) << output;
    EXPECT_TRUE(has(output, "link down")) << output;
}

TEST_F(StackManagementServiceTest, ShowStackRoot) {
    std::string output = mi.handle_cli_command("show stack root");
    EXPECT_TRUE(has(output, "Stack root: s1 (0x1)")) << output;
    EXPECT_TRUE(has(output, "Candidates: s1 s2")) << output;
}

TEST_F(StackManagementServiceTest, ShowStackGraph) {
    std::string output = mi.handle_cli_command("show stack graph");
    EXPECT_TRUE(has(output, "s2: towards=2")) << output;
    EXPECT_TRUE(has(output, "s1: towards=-")) << output;
}

TEST_F(StackManagementServiceTest, ShowStackTunnels) {
    EXPECT_EQ(mi.handle_cli_command("show stack tunnels"), "No tunnels configured.\n");

    coordinator.add_tunnel({7, "s2", "s1", HOST_PORT});
    std::string output = mi.handle_cli_command("show stack tunnels");
    EXPECT_TRUE(has(output, "Tunnel 7: s2 -> s1:10")) << output;
    EXPECT_TRUE(has(output, "s2 out port 2")) << output;
    EXPECT_FALSE(has(output, "s3 out port")) << output;
}

TEST_F(StackManagementServiceTest, ShowStackMetrics) {
    std::string output = mi.handle_cli_command("show stack metrics");
    EXPECT_TRUE(has(output, "stack_topology_changes")) << output;
    EXPECT_TRUE(has(output, "is_dp_stack_root{dp_name=\"s1\"} 1")) << output;
}

TEST_F(StackManagementServiceTest, HelpListsCommands) {
    std::string output = mi.handle_cli_command("help");
    EXPECT_TRUE(has(output, "Available commands:")) << output;
    EXPECT_TRUE(has(output, "show stack ports")) << output;
    EXPECT_TRUE(has(output, "show stack tunnels")) << output;
}

TEST_F(StackManagementServiceTest, OidsExposeRootAndGraph) {
    EXPECT_EQ(mi.handle_oid_get(base + ".5.0"), std::optional<std::string>("s1"));
    EXPECT_EQ(mi.handle_oid_get(base + ".3.0"), std::optional<std::string>("1"));
    EXPECT_EQ(mi.handle_oid_get(base + ".6.0"), std::optional<std::string>("3"));
    EXPECT_EQ(mi.handle_oid_get(base + ".4.0"),
              std::optional<std::string>(std::to_string(metrics.topology_changes())));
    EXPECT_FALSE(mi.handle_oid_get(base + ".9.0").has_value());
}
