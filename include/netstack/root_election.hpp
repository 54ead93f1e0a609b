#ifndef NETSTACK_ROOT_ELECTION_HPP
#define NETSTACK_ROOT_ELECTION_HPP

#include "netstack/datapath.hpp"
#include "netstack/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace netstack {

class StackLogger;

struct RootState {
    std::string root_name;
    // Candidates by ascending priority, ties broken by name.
    std::vector<std::string> roots_names;
    std::vector<std::string> healthy;
    std::vector<std::string> unhealthy;
};

struct ElectionResult {
    std::string root_name;
    std::string previous_root;
    bool root_changed = false;
    // Some datapath's cached root disagrees with the elected one.
    bool inconsistent = false;

    bool reconfigure_required() const { return root_changed || inconsistent; }
};

// Centrally computed root selection over the managed datapaths. Prefers
// keeping a healthy current root, then the best healthy candidate, and
// falls back to the best candidate regardless of health.
class RootElection {
public:
    explicit RootElection(std::chrono::seconds health_check_interval, StackLogger* logger = nullptr);

    void set_logger(StackLogger* logger) { logger_ = logger; }
    void set_health_check_interval(std::chrono::seconds interval) { health_check_interval_ = interval; }
    std::chrono::seconds health_check_interval() const { return health_check_interval_; }

    // Rebuilds the ordered candidate list; the current root is kept.
    void set_candidates(const DatapathTable& datapaths);

    // Recently live, not every LAG down, and at least one stack port UP.
    bool is_healthy(const Datapath& dp, TimePoint now) const;

    // nullopt when there is no root candidate at all.
    std::optional<ElectionResult> elect(const DatapathTable& datapaths, TimePoint now);

    const RootState& state() const { return state_; }
    void reset() { state_ = RootState{}; }

private:
    std::chrono::seconds health_check_interval_;
    StackLogger* logger_ = nullptr;
    RootState state_;
};

} // namespace netstack

#endif // NETSTACK_ROOT_ELECTION_HPP
