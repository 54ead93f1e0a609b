#include "netstack/config_manager.hpp"
#include "netstack/flow_rules.hpp"
#include "netstack/logger.hpp"
#include "netstack/management_interface.hpp"
#include "netstack/stack_coordinator.hpp"
#include "netstack/stack_events.hpp"
#include "netstack/stack_management_service.hpp"
#include "netstack/stack_metrics.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

namespace {

// Prints every rule delta instead of programming a datapath.
class LoggingFlowRuleSink : public netstack::FlowRuleSink {
public:
    explicit LoggingFlowRuleSink(netstack::StackLogger& logger) : logger_(logger) {}

    bool send(netstack::DpId dp_id, const std::string& dp_name,
              const std::vector<netstack::FlowRuleDelta>& deltas) override {
        for (const auto& delta : deltas) {
            logger_.debug("FLOWS", dp_name + " (" + netstack::StackLogger::dpid_to_string(dp_id) + ") " +
                                       netstack::to_string(delta.op) + " " + delta.rule.to_string());
        }
        logger_.info("FLOWS", "Sent " + std::to_string(deltas.size()) + " rule changes to " + dp_name);
        return true;
    }

private:
    netstack::StackLogger& logger_;
};

class ConsoleEventSink : public netstack::EventSink {
public:
    void notify(const netstack::StackEvent& event) override {
        std::cout << "[EVENT] " << event.type_name() << " dp=" << event.dp_name;
        if (const auto* state = std::get_if<netstack::StackStateEvent>(&event.payload)) {
            std::cout << " port=" << state->port << " state=" << netstack::to_string(state->state);
        } else if (const auto* topo = std::get_if<netstack::StackTopoChangeEvent>(&event.payload)) {
            std::cout << " root=" << topo->stack_root;
        }
        std::cout << std::endl;
    }
};

void default_ring_config(netstack::ConfigManager& config) {
    config.set_parameter("stack.probe_interval_seconds", 5);
    config.set_parameter("stack.max_probes_lost", 3);
    config.set_parameter("stack.health_check_interval_seconds", 10);

    config.set_parameter("dp.s1.dp_id", 1);
    config.set_parameter("dp.s1.stack.priority", 1);
    config.set_parameter("dp.s1.port.1.stack.dp", std::string("s2"));
    config.set_parameter("dp.s1.port.1.stack.port", 1);
    config.set_parameter("dp.s1.port.2.stack.dp", std::string("s3"));
    config.set_parameter("dp.s1.port.2.stack.port", 2);
    config.set_parameter("dp.s1.port.3.description", std::string("host h1"));

    config.set_parameter("dp.s2.dp_id", 2);
    config.set_parameter("dp.s2.stack.priority", 2);
    config.set_parameter("dp.s2.port.1.stack.dp", std::string("s1"));
    config.set_parameter("dp.s2.port.1.stack.port", 1);
    config.set_parameter("dp.s2.port.2.stack.dp", std::string("s3"));
    config.set_parameter("dp.s2.port.2.stack.port", 1);
    config.set_parameter("dp.s2.port.3.description", std::string("host h2"));

    config.set_parameter("dp.s3.dp_id", 3);
    config.set_parameter("dp.s3.port.1.stack.dp", std::string("s2"));
    config.set_parameter("dp.s3.port.1.stack.port", 2);
    config.set_parameter("dp.s3.port.2.stack.dp", std::string("s1"));
    config.set_parameter("dp.s3.port.2.stack.port", 2);
    config.set_parameter("dp.s3.port.3.description", std::string("host h3"));
}

// Loops every probe sent back into the coordinator as the peer's keepalive.
void exchange_probes(netstack::StackCoordinator& coordinator, netstack::TimePoint now) {
    for (const auto& sender : coordinator.send_probes(now)) {
        const netstack::Datapath& dp = coordinator.datapath(sender.dp);
        const netstack::StackPort* port = dp.find_stack_port(sender.port);
        if (!port) continue;
        netstack::KeepaliveProbe probe;
        probe.receiving_dp = port->peer.dp;
        probe.receiving_port = port->peer.port;
        probe.remote_dp_id = dp.dp_id();
        probe.remote_dp_name = dp.name();
        probe.remote_port = port->number;
        probe.remote_port_state = port->state;
        probe.now = now;
        if (coordinator.datapath(probe.receiving_dp).running()) {
            coordinator.keepalive_received(probe);
        }
    }
}

void run_cli(const netstack::ManagementInterface& mi, const std::string& command) {
    std::cout << "\n> " << command << "\n" << mi.handle_cli_command(command) << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    std::cout << "netstack stacking controller simulation" << std::endl;

    netstack::StackLogger logger(netstack::LogLevel::INFO);
    netstack::StackMetrics metrics;
    netstack::ManagementInterface management;
    netstack::ConfigManager config_manager;
    config_manager.set_logger(&logger);

    if (argc > 1) {
        if (!config_manager.load_config(argv[1])) {
            logger.critical("MAIN", std::string("Unable to load configuration from ") + argv[1]);
            return 1;
        }
    } else {
        default_ring_config(config_manager);
    }

    std::vector<std::string> errors = config_manager.validate_config(config_manager.get_current_config_data());
    if (!errors.empty()) {
        for (const auto& error : errors) {
            logger.error("MAIN", error);
        }
        return 1;
    }

    LoggingFlowRuleSink flow_sink(logger);
    ConsoleEventSink event_sink;
    netstack::StackCoordinator coordinator(logger, metrics);
    coordinator.set_flow_rule_sink(&flow_sink);
    coordinator.set_event_sink(&event_sink);

    netstack::StackManagementService service(logger, management, coordinator, metrics);
    service.register_cli_commands();
    service.register_oids();

    netstack::TimePoint now = netstack::Clock::now();
    try {
        config_manager.apply_config(config_manager.get_current_config_data(), coordinator, now);
    } catch (const netstack::ConfigError& e) {
        logger.critical("MAIN", std::string("Configuration rejected: ") + e.what());
        return 1;
    }

    for (const auto& entry : coordinator.datapaths()) {
        coordinator.datapath_connect(entry.first, now);
    }

    const auto interval = coordinator.timing().probe_interval;
    for (int round = 0; round < 3; ++round) {
        now += interval;
        exchange_probes(coordinator, now);
        coordinator.health_tick(now);
    }

    run_cli(management, "show stack");
    run_cli(management, "show stack root");
    run_cli(management, "show stack graph");

    if (coordinator.datapaths().size() > 1) {
        const std::string failed_root = coordinator.root_name();
        logger.info("MAIN", "Disconnecting stack root " + failed_root);
        coordinator.datapath_disconnect(failed_root, now);
        const auto wait = interval * (coordinator.timing().max_probes_lost + 1);
        for (auto elapsed = interval; elapsed <= wait; elapsed += interval) {
            now += interval;
            exchange_probes(coordinator, now);
        }
        // Let the failed root age past the election threshold.
        now += coordinator.timing().health_check_interval * 4;
        coordinator.health_tick(now);
        run_cli(management, "show stack");
    }

    run_cli(management, "show stack metrics");
    if (auto root_oid = management.handle_oid_get(std::string(netstack::StackManagementService::kDefaultBaseOid) + ".5.0")) {
        std::cout << "Root via OID: " << *root_oid << std::endl;
    }
    return 0;
}
