#ifndef NETSTACK_DATAPATH_HPP
#define NETSTACK_DATAPATH_HPP

#include "netstack/stack_config.hpp"
#include "netstack/types.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>

namespace netstack {

// Identity carried by a received keepalive probe.
struct ProbeIdentity {
    DpId remote_dp_id = 0;
    std::string remote_dp_name;
    PortNumber remote_port = 0;
    StackState remote_port_state = StackState::NONE;
};

struct StackPort {
    PortNumber number = 0;
    PortRef peer;
    DpId expected_peer_dp_id = 0;
    StackState state = StackState::NONE;
    bool physical_up = true;

    std::optional<TimePoint> last_probe_sent;
    std::optional<TimePoint> last_probe_received;
    // Last probe whose identity matched the configured peer.
    std::optional<TimePoint> last_valid_probe;
    // When the port last entered INIT; liveness reference until a valid probe arrives.
    std::optional<TimePoint> init_time;
    std::optional<ProbeIdentity> last_probe;
    bool cabling_correct = false;

    bool is_up() const { return state == StackState::UP; }
};

struct LocalPort {
    PortNumber number = 0;
    bool loop_protect_external = false;
    std::optional<uint32_t> lacp_id;
    bool up = true;
};

class Datapath {
public:
    Datapath() = default;
    Datapath(const DatapathConfig& config, const std::map<std::string, DatapathConfig>& all_datapaths);

    const std::string& name() const { return name_; }
    DpId dp_id() const { return dp_id_; }
    const std::optional<int64_t>& priority() const { return priority_; }
    uint32_t root_down_time_multiple() const { return root_down_time_multiple_; }
    bool is_root_candidate() const { return priority_.has_value(); }
    bool is_stacked() const { return !stack_ports_.empty(); }

    std::map<PortNumber, StackPort>& stack_ports() { return stack_ports_; }
    const std::map<PortNumber, StackPort>& stack_ports() const { return stack_ports_; }
    std::map<PortNumber, LocalPort>& local_ports() { return local_ports_; }
    const std::map<PortNumber, LocalPort>& local_ports() const { return local_ports_; }

    StackPort* find_stack_port(PortNumber number);
    const StackPort* find_stack_port(PortNumber number) const;
    LocalPort* find_local_port(PortNumber number);

    bool any_stack_port_up() const;
    bool has_externals() const;

    // LAG helpers: the set of configured LAG ids and per-LAG up port counts.
    std::set<uint32_t> lacp_ids() const;
    std::map<uint32_t, std::size_t> lags_up() const;
    bool has_lags() const { return !lacp_ids().empty(); }
    // True only when LAGs exist and none has an up member.
    bool all_lags_down() const;

    bool running() const { return running_; }
    void set_running(bool running) { running_ = running; }

    const std::optional<TimePoint>& last_live_time() const { return last_live_time_; }
    void update_live_time(TimePoint now) { last_live_time_ = now; }

    const std::string& cached_root() const { return cached_root_; }
    void set_cached_root(const std::string& root) { cached_root_ = root; }

private:
    std::string name_;
    DpId dp_id_ = 0;
    std::optional<int64_t> priority_;
    uint32_t root_down_time_multiple_ = 3;
    std::map<PortNumber, StackPort> stack_ports_;
    std::map<PortNumber, LocalPort> local_ports_;
    bool running_ = false;
    std::optional<TimePoint> last_live_time_;
    std::string cached_root_;
};

using DatapathTable = std::map<std::string, Datapath>;

} // namespace netstack

#endif // NETSTACK_DATAPATH_HPP
