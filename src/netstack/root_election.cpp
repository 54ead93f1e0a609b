#include "netstack/root_election.hpp"
#include "netstack/logger.hpp"

#include <algorithm> // For std::sort, std::find
#include <stdexcept>
#include <tuple>

namespace netstack {

RootElection::RootElection(std::chrono::seconds health_check_interval, StackLogger* logger)
    : health_check_interval_(health_check_interval), logger_(logger) {}

void RootElection::set_candidates(const DatapathTable& datapaths) {
    std::vector<std::tuple<int64_t, std::string>> ranked;
    for (const auto& [name, dp] : datapaths) {
        if (dp.priority()) {
            ranked.emplace_back(*dp.priority(), name);
        }
    }
    std::sort(ranked.begin(), ranked.end());
    state_.roots_names.clear();
    for (const auto& entry : ranked) {
        state_.roots_names.push_back(std::get<1>(entry));
    }
    if (std::find(state_.roots_names.begin(), state_.roots_names.end(), state_.root_name) ==
        state_.roots_names.end()) {
        state_.root_name.clear();
    }
}

bool RootElection::is_healthy(const Datapath& dp, TimePoint now) const {
    const auto& last_live = dp.last_live_time();
    if (!last_live) {
        return false;
    }
    const auto down_time = health_check_interval_ * dp.root_down_time_multiple();
    if (now - *last_live > down_time) {
        return false;
    }
    if (dp.all_lags_down()) {
        return false;
    }
    return dp.any_stack_port_up();
}

std::optional<ElectionResult> RootElection::elect(const DatapathTable& datapaths, TimePoint now) {
    if (state_.roots_names.empty()) {
        set_candidates(datapaths);
    }
    if (state_.roots_names.empty()) {
        return std::nullopt;
    }

    state_.healthy.clear();
    state_.unhealthy.clear();
    for (const auto& name : state_.roots_names) {
        auto it = datapaths.find(name);
        if (it == datapaths.end()) {
            throw std::logic_error("RootElection: candidate " + name + " is not a managed datapath");
        }
        if (is_healthy(it->second, now)) {
            state_.healthy.push_back(name);
        } else {
            state_.unhealthy.push_back(name);
        }
    }

    ElectionResult result;
    result.previous_root = state_.root_name;

    const bool current_healthy =
        !state_.root_name.empty() &&
        std::find(state_.healthy.begin(), state_.healthy.end(), state_.root_name) != state_.healthy.end();
    if (current_healthy) {
        result.root_name = state_.root_name;
    } else if (!state_.healthy.empty()) {
        result.root_name = state_.healthy.front();
    } else {
        result.root_name = state_.roots_names.front();
        if (logger_) {
            logger_->warning("STACK_ROOT", "No healthy stack root candidates, using " + result.root_name);
        }
    }

    result.root_changed = result.root_name != result.previous_root;
    for (const auto& [name, dp] : datapaths) {
        (void)name;
        if (dp.cached_root() != result.root_name) {
            result.inconsistent = true;
            break;
        }
    }

    if (result.root_changed && logger_) {
        logger_->log_root_change(result.previous_root, result.root_name,
                                 datapaths.at(result.root_name).dp_id());
    }
    state_.root_name = result.root_name;
    return result;
}

} // namespace netstack
