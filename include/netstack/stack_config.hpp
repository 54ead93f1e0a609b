#ifndef NETSTACK_STACK_CONFIG_HPP
#define NETSTACK_STACK_CONFIG_HPP

#include "netstack/types.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace netstack {

class StackGraph;

// Raised when a stack topology cannot be accepted at load time.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

struct StackPortConfig {
    PortNumber number = 0;
    std::string peer_dp;
    PortNumber peer_port = 0;
};

struct LocalPortConfig {
    PortNumber number = 0;
    bool loop_protect_external = false;
    std::optional<uint32_t> lacp_id; // LAG membership
};

struct DatapathConfig {
    std::string name;
    DpId dp_id = 0;
    // Empty means not a root candidate; lower values win.
    std::optional<int64_t> priority;
    uint32_t root_down_time_multiple = 3;
    std::vector<StackPortConfig> stack_ports;
    std::vector<LocalPortConfig> local_ports;

    bool is_stacked() const { return !stack_ports.empty(); }
    bool is_root_candidate() const { return priority.has_value(); }
};

struct StackTimingConfig {
    std::chrono::seconds probe_interval{5};
    uint32_t max_probes_lost = 3;
    std::chrono::seconds health_check_interval{10};
};

struct StackTopologyConfig {
    StackTimingConfig timing;
    std::map<std::string, DatapathConfig> datapaths;
};

// Every problem found in the topology, empty when it is acceptable.
std::vector<std::string> find_stack_config_errors(const StackTopologyConfig& config);

// Throws ConfigError carrying the first problem found.
void validate_stack_config(const StackTopologyConfig& config);

// Graph of every declared stack link, used for validation and for
// selecting the flood strategy from the stack diameter.
StackGraph build_configured_graph(const StackTopologyConfig& config);

// Root candidates ordered by ascending priority, ties broken by name.
std::vector<std::string> ordered_root_candidates(const StackTopologyConfig& config);

} // namespace netstack

#endif // NETSTACK_STACK_CONFIG_HPP
