#ifndef NETSTACK_TYPES_HPP
#define NETSTACK_TYPES_HPP

#include <cstdint>    // For uint32_t, uint64_t
#include <string>
#include <chrono>
#include <functional> // For std::function
#include <tuple>      // For std::tie
#include <utility>    // For std::move

namespace netstack {

using DpId = uint64_t;
using PortNumber = uint32_t;
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

// Stack port states. Numeric values are the codes exported through metrics.
enum class StackState : uint32_t {
    NONE = 0,
    INIT = 1,
    BAD = 2,
    UP = 3,
    GONE = 4
};

inline std::string to_string(StackState state) {
    switch (state) {
        case StackState::NONE: return "NONE";
        case StackState::INIT: return "INIT";
        case StackState::BAD:  return "BAD";
        case StackState::UP:   return "UP";
        case StackState::GONE: return "GONE";
        default:               return "UNKNOWN";
    }
}

inline uint32_t state_code(StackState state) {
    return static_cast<uint32_t>(state);
}

// A (datapath name, port number) pair. Ordering is lexicographic on the
// name and then numeric on the port, which is what canonical edge keys use.
struct PortRef {
    std::string dp;
    PortNumber port = 0;

    PortRef() = default;
    PortRef(std::string dp_name, PortNumber port_number)
        : dp(std::move(dp_name)), port(port_number) {}

    bool operator<(const PortRef& other) const {
        return std::tie(dp, port) < std::tie(other.dp, other.port);
    }
    bool operator==(const PortRef& other) const {
        return dp == other.dp && port == other.port;
    }
    bool operator!=(const PortRef& other) const {
        return !(*this == other);
    }

    std::string to_string() const {
        return dp + ":" + std::to_string(port);
    }
};

// Strict weak ordering used to pick the "canonically first" port of a set.
using PortOrder = std::function<bool(PortNumber, PortNumber)>;

inline PortOrder ascending_port_order() {
    return [](PortNumber a, PortNumber b) { return a < b; };
}

} // namespace netstack

#endif // NETSTACK_TYPES_HPP
