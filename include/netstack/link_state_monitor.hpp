#ifndef NETSTACK_LINK_STATE_MONITOR_HPP
#define NETSTACK_LINK_STATE_MONITOR_HPP

#include "netstack/datapath.hpp"
#include "netstack/stack_config.hpp"
#include "netstack/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace netstack {

class StackLogger;
class StackMetrics;

struct KeepaliveProbe {
    std::string receiving_dp;
    PortNumber receiving_port = 0;
    DpId remote_dp_id = 0;
    std::string remote_dp_name;
    PortNumber remote_port = 0;
    StackState remote_port_state = StackState::NONE;
    TimePoint now;
};

// A stack port state change, queued for the coordinator.
struct LinkTransition {
    PortRef port;
    PortRef peer;
    StackState before = StackState::NONE;
    StackState after = StackState::NONE;
    std::string reason;
    // UP, or INIT while the peer end is already UP.
    bool link_up = false;
};

// Per stack port state machine driven by keepalive probes:
//   NONE -> INIT          first probe sent
//   any  -> UP            probe matching the configured peer
//   any  -> BAD           probe from an unexpected peer (cabling error)
//   INIT/UP/BAD -> GONE   no valid probe for max_probes_lost intervals,
//                         or the physical port went down
//   GONE -> INIT          physical port came back up
class LinkStateMonitor {
public:
    LinkStateMonitor(DatapathTable& datapaths, const StackTimingConfig& timing,
                     StackLogger* logger = nullptr, StackMetrics* metrics = nullptr);

    void set_logger(StackLogger* logger) { logger_ = logger; }
    void set_timing(const StackTimingConfig& timing) { timing_ = timing; }

    std::optional<LinkTransition> probe_sent(const std::string& dp, PortNumber port, TimePoint now);
    std::optional<LinkTransition> probe_received(const KeepaliveProbe& probe);
    std::optional<LinkTransition> port_status_changed(const std::string& dp, PortNumber port,
                                                      bool up, TimePoint now);
    std::vector<LinkTransition> check_timeouts(TimePoint now);

    bool link_is_up(const PortRef& port) const;
    std::chrono::seconds liveness_timeout() const;

    const StackPort& port(const PortRef& ref) const;

private:
    Datapath& datapath(const std::string& name);
    StackPort& stack_port(const std::string& dp, PortNumber number);
    bool is_expected_peer(const StackPort& port, const KeepaliveProbe& probe) const;
    LinkTransition transition(const std::string& dp, StackPort& port, StackState next,
                              const std::string& reason);

    DatapathTable& datapaths_;
    StackTimingConfig timing_;
    StackLogger* logger_ = nullptr;
    StackMetrics* metrics_ = nullptr;
};

} // namespace netstack

#endif // NETSTACK_LINK_STATE_MONITOR_HPP
