#ifndef NETSTACK_STACK_EVENTS_HPP
#define NETSTACK_STACK_EVENTS_HPP

#include "netstack/types.hpp"

#include <map>
#include <string>
#include <variant>

namespace netstack {

// STACK_STATE: a stack port changed state.
struct StackStateEvent {
    PortNumber port = 0;
    StackState state = StackState::NONE;
};

// STACK_TOPO_CHANGE: the graph or the root changed.
struct StackTopoChangeEvent {
    std::string stack_root;
    std::string graph; // node-link serialization
    std::map<std::string, PortNumber> root_hop_ports; // 0 = none
};

using StackEventPayload = std::variant<StackStateEvent, StackTopoChangeEvent>;

struct StackEvent {
    DpId dp_id = 0;
    std::string dp_name;
    StackEventPayload payload;

    bool is_state_change() const { return std::holds_alternative<StackStateEvent>(payload); }
    bool is_topology_change() const { return std::holds_alternative<StackTopoChangeEvent>(payload); }
    std::string type_name() const { return is_state_change() ? "STACK_STATE" : "STACK_TOPO_CHANGE"; }
};

// Generic external event sink.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void notify(const StackEvent& event) = 0;
};

} // namespace netstack

#endif // NETSTACK_STACK_EVENTS_HPP
