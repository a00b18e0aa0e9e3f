#ifndef I_RATE_LAW_HPP
#define I_RATE_LAW_HPP

#include "network/NetworkTypes.hpp"
#include <string>
#include <vector>

namespace crn {

/**
 * @class IRateLaw
 * @brief Interface for the kinetics attached to a single reaction.
 *
 * A rate law is resolved against the species and parameter tables of its
 * network when the network is built, so evaluation works on plain index
 * lookups. Two forms are exposed:
 * - `propensity`: the discrete form used by the stochastic simulators,
 * - `rate`: the continuous form used by the ODE right-hand side.
 *
 * Implementations must be immutable after construction; one instance is
 * shared by every simulation run of the owning network.
 */
class IRateLaw {
public:
    virtual ~IRateLaw() = default;

    /**
     * @brief Stochastic propensity of the reaction.
     *
     * @param state Current species counts.
     * @param parameters Parameter values in declaration order.
     * @return double Propensity; zero when reactants are insufficient.
     *
     * @throws ModelException If a custom law evaluates to a negative or non-finite value.
     */
    virtual double propensity(const state_type& state, const parameter_type& parameters) const = 0;

    /**
     * @brief Deterministic reaction rate used in the ODE right-hand side.
     *
     * @param state Current species concentrations.
     * @param parameters Parameter values in declaration order.
     * @return double Reaction rate.
     *
     * @throws ModelException If a custom law evaluates to a negative or non-finite value.
     */
    virtual double rate(const state_type& state, const parameter_type& parameters) const = 0;

    /**
     * @brief Human-readable form of the rate expression, used in logs and error messages.
     */
    virtual std::string describe() const = 0;

    /**
     * @brief Indices of the parameters this law reads.
     */
    virtual std::vector<int> getParameterIndices() const = 0;
};

} // namespace crn

#endif // I_RATE_LAW_HPP
