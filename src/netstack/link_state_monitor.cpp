#include "netstack/link_state_monitor.hpp"
#include "netstack/logger.hpp"
#include "netstack/stack_metrics.hpp"

#include <stdexcept>

namespace netstack {

LinkStateMonitor::LinkStateMonitor(DatapathTable& datapaths, const StackTimingConfig& timing,
                                   StackLogger* logger, StackMetrics* metrics)
    : datapaths_(datapaths), timing_(timing), logger_(logger), metrics_(metrics) {}

Datapath& LinkStateMonitor::datapath(const std::string& name) {
    auto it = datapaths_.find(name);
    if (it == datapaths_.end()) {
        throw std::invalid_argument("LinkStateMonitor: unknown datapath " + name);
    }
    return it->second;
}

StackPort& LinkStateMonitor::stack_port(const std::string& dp, PortNumber number) {
    StackPort* port = datapath(dp).find_stack_port(number);
    if (!port) {
        throw std::invalid_argument("LinkStateMonitor: " + PortRef{dp, number}.to_string() +
                                    " is not a stack port");
    }
    return *port;
}

const StackPort& LinkStateMonitor::port(const PortRef& ref) const {
    auto it = datapaths_.find(ref.dp);
    if (it == datapaths_.end()) {
        throw std::invalid_argument("LinkStateMonitor: unknown datapath " + ref.dp);
    }
    const StackPort* port = it->second.find_stack_port(ref.port);
    if (!port) {
        throw std::invalid_argument("LinkStateMonitor: " + ref.to_string() + " is not a stack port");
    }
    return *port;
}

std::chrono::seconds LinkStateMonitor::liveness_timeout() const {
    return timing_.probe_interval * timing_.max_probes_lost;
}

bool LinkStateMonitor::link_is_up(const PortRef& ref) const {
    const StackPort& local = port(ref);
    if (local.state == StackState::UP) {
        return true;
    }
    if (local.state != StackState::INIT) {
        return false;
    }
    auto peer_dp = datapaths_.find(local.peer.dp);
    if (peer_dp == datapaths_.end()) {
        return false;
    }
    const StackPort* peer = peer_dp->second.find_stack_port(local.peer.port);
    return peer && peer->state == StackState::UP;
}

bool LinkStateMonitor::is_expected_peer(const StackPort& port, const KeepaliveProbe& probe) const {
    return probe.remote_dp_name == port.peer.dp &&
           probe.remote_dp_id == port.expected_peer_dp_id &&
           probe.remote_port == port.peer.port;
}

LinkTransition LinkStateMonitor::transition(const std::string& dp, StackPort& port, StackState next,
                                            const std::string& reason) {
    LinkTransition event;
    event.port = PortRef{dp, port.number};
    event.peer = port.peer;
    event.before = port.state;
    event.after = next;
    event.reason = reason;
    port.state = next;
    event.link_up = link_is_up(event.port);
    if (logger_) {
        logger_->log_stack_port_state(event.port, event.before, event.after, reason);
    }
    if (metrics_) {
        metrics_->set_port_stack_state(event.port, next);
    }
    return event;
}

std::optional<LinkTransition> LinkStateMonitor::probe_sent(const std::string& dp, PortNumber number,
                                                           TimePoint now) {
    StackPort& port = stack_port(dp, number);
    if (!port.physical_up) {
        return std::nullopt;
    }
    port.last_probe_sent = now;
    if (port.state != StackState::NONE) {
        return std::nullopt;
    }
    port.init_time = now;
    return transition(dp, port, StackState::INIT, "probe sent");
}

std::optional<LinkTransition> LinkStateMonitor::probe_received(const KeepaliveProbe& probe) {
    StackPort& port = stack_port(probe.receiving_dp, probe.receiving_port);
    if (metrics_) {
        metrics_->inc_probes_received(probe.receiving_dp);
    }
    port.last_probe_received = probe.now;
    if (!port.init_time) {
        port.init_time = probe.now;
    }
    port.last_probe = ProbeIdentity{probe.remote_dp_id, probe.remote_dp_name,
                                    probe.remote_port, probe.remote_port_state};

    if (!port.physical_up) {
        if (logger_) {
            logger_->debug("STACK", "Ignoring probe on down port " +
                                        PortRef{probe.receiving_dp, port.number}.to_string());
        }
        return std::nullopt;
    }

    port.cabling_correct = is_expected_peer(port, probe);
    if (!port.cabling_correct) {
        if (metrics_) {
            metrics_->inc_cabling_errors(probe.receiving_dp);
        }
        if (logger_) {
            logger_->error("STACK", "Stack " + PortRef{probe.receiving_dp, port.number}.to_string() +
                                        " cabling incorrect, expected " + port.peer.dp + ":" +
                                        StackLogger::dpid_to_string(port.expected_peer_dp_id) + ":" +
                                        std::to_string(port.peer.port) + ", actual " +
                                        probe.remote_dp_name + ":" +
                                        StackLogger::dpid_to_string(probe.remote_dp_id) + ":" +
                                        std::to_string(probe.remote_port));
        }
        if (port.state == StackState::BAD) {
            return std::nullopt;
        }
        return transition(probe.receiving_dp, port, StackState::BAD, "cabling incorrect");
    }

    port.last_valid_probe = probe.now;
    if (port.state == StackState::UP) {
        return std::nullopt;
    }
    return transition(probe.receiving_dp, port, StackState::UP,
                      "probe from " + port.peer.to_string() + " (remote state " +
                          to_string(probe.remote_port_state) + ")");
}

std::optional<LinkTransition> LinkStateMonitor::port_status_changed(const std::string& dp, PortNumber number,
                                                                    bool up, TimePoint now) {
    StackPort& port = stack_port(dp, number);
    port.physical_up = up;
    if (!up) {
        if (port.state == StackState::NONE || port.state == StackState::GONE) {
            return std::nullopt;
        }
        return transition(dp, port, StackState::GONE, "port down");
    }
    if (port.state != StackState::GONE) {
        return std::nullopt;
    }
    port.init_time = now;
    port.last_valid_probe.reset();
    return transition(dp, port, StackState::INIT, "port up");
}

std::vector<LinkTransition> LinkStateMonitor::check_timeouts(TimePoint now) {
    std::vector<LinkTransition> transitions;
    const auto timeout = liveness_timeout();
    for (auto& [dp_name, dp] : datapaths_) {
        for (auto& [number, port] : dp.stack_ports()) {
            (void)number;
            if (port.state != StackState::INIT && port.state != StackState::UP &&
                port.state != StackState::BAD) {
                continue;
            }
            // A BAD port stays BAD while the wrong peer keeps probing it.
            std::optional<TimePoint> reference = port.last_valid_probe ? port.last_valid_probe : port.init_time;
            if (port.state == StackState::BAD && port.last_probe_received &&
                (!reference || *port.last_probe_received > *reference)) {
                reference = port.last_probe_received;
            }
            if (!reference || now - *reference <= timeout) {
                continue;
            }
            transitions.push_back(transition(dp_name, port, StackState::GONE,
                                             "no valid probe within " +
                                                 std::to_string(timeout.count()) + "s"));
        }
    }
    return transitions;
}

} // namespace netstack
