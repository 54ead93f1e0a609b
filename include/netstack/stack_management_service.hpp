#ifndef NETSTACK_STACK_MANAGEMENT_SERVICE_HPP
#define NETSTACK_STACK_MANAGEMENT_SERVICE_HPP

#include "netstack/management_interface.hpp"
#include "netstack/stack_coordinator.hpp"
#include "netstack/stack_metrics.hpp"
#include "netstack/logger.hpp"

#include <string>
#include <vector>

namespace netstack {

// Operator view of the stack: "show stack ..." CLI commands and the
// metric OIDs, wired into a ManagementInterface.
class StackManagementService {
public:
    static constexpr const char* kDefaultBaseOid = "1.3.6.1.4.1.55555.1";

    StackManagementService(StackLogger& logger, ManagementInterface& mi,
                           StackCoordinator& coordinator, StackMetrics& metrics);

    void register_cli_commands();
    void register_oids(const std::string& base_oid = kDefaultBaseOid);

    std::string show_stack_summary() const;
    std::string show_stack_ports(const std::vector<std::string>& args) const;
    std::string show_stack_root() const;
    std::string show_stack_graph() const;
    std::string show_stack_tunnels() const;
    std::string show_stack_metrics() const;
    std::string show_help() const;

private:
    StackLogger& logger_;
    ManagementInterface& management_interface_;
    StackCoordinator& coordinator_;
    StackMetrics& metrics_;
};

} // namespace netstack

#endif // NETSTACK_STACK_MANAGEMENT_SERVICE_HPP
