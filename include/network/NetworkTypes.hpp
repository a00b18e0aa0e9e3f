#ifndef NETWORK_TYPES_HPP
#define NETWORK_TYPES_HPP

#include <vector>

namespace crn {

    /** @brief Species quantities indexed by species order. Stochastic runs store integral counts. */
    using state_type = std::vector<double>;

    /** @brief Parameter values indexed by declaration order. */
    using parameter_type = std::vector<double>;

    /**
     * @brief One species with its stoichiometric coefficient, after name resolution.
     */
    struct StoichiometryEntry {
        int species_index; ///< Index into the network's species table.
        int coefficient;   ///< Strictly positive for reactant/product lists; signed in net-change lists.
    };

} // namespace crn

#endif // NETWORK_TYPES_HPP
