#ifndef REACTION_HPP
#define REACTION_HPP

#include "network/NetworkTypes.hpp"
#include "network/interfaces/IRateLaw.hpp"
#include <Eigen/Dense>
#include <memory>
#include <string>
#include <vector>

namespace crn {

    /**
     * @brief A reaction after symbol resolution.
     *
     * Produced by NetworkBuilder and owned by ReactionNetwork. `net_change`
     * lists only the species whose count changes; `net_change_dense` holds
     * the same information with one entry per species.
     */
    struct Reaction {
        std::string label;
        std::vector<StoichiometryEntry> reactants;
        std::vector<StoichiometryEntry> products;
        std::vector<StoichiometryEntry> net_change;  ///< products - reactants, zero entries omitted.
        Eigen::VectorXi net_change_dense;
        std::shared_ptr<const IRateLaw> rate_law;
    };

} // namespace crn

#endif // REACTION_HPP
