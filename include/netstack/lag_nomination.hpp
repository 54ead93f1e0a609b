#ifndef NETSTACK_LAG_NOMINATION_HPP
#define NETSTACK_LAG_NOMINATION_HPP

#include "netstack/datapath.hpp"
#include "netstack/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace netstack {

struct LagNomination {
    std::string dp_name;
    DpId dp_id = 0;
    std::size_t ports_up = 0;
    std::string reason;
};

// Picks the one datapath allowed to forward for a LAG spread across the
// stack: most LAG members up, then the stack root, then the lowest dp_id.
// nullopt when no datapath has an up member of the LAG.
std::optional<LagNomination> nominate_lacp_datapath(uint32_t lacp_id, const DatapathTable& datapaths,
                                                    const std::string& root_name);

} // namespace netstack

#endif // NETSTACK_LAG_NOMINATION_HPP
