#ifndef MASS_ACTION_RATE_LAW_HPP
#define MASS_ACTION_RATE_LAW_HPP

#include "network/interfaces/IRateLaw.hpp"
#include "network/NetworkTypes.hpp"
#include <string>
#include <vector>

namespace crn {

    /**
     * @class MassActionRateLaw
     * @brief Law-of-mass-action kinetics with a constant or parameter rate coefficient.
     *
     * For a rate coefficient k and reactants {S_i : c_i}:
     * - stochastic propensity: k * prod_i C(n_i, c_i), where C is the binomial
     *   coefficient; zero whenever n_i < c_i,
     * - deterministic rate: k * prod_i x_i^c_i, divided by prod_i c_i! when
     *   combinatoric rate laws are enabled on the network.
     *
     * A zeroth-order reaction (no reactants) has propensity and rate k.
     */
    class MassActionRateLaw : public IRateLaw {
    public:
        /**
         * @brief Mass action with a fixed numeric rate constant.
         *
         * @param reactants Resolved reactant list (positive coefficients).
         * @param rate_constant Non-negative rate constant.
         * @param combinatoric Whether the deterministic rate divides by prod c_i!.
         * @param description Text used by describe().
         */
        MassActionRateLaw(std::vector<StoichiometryEntry> reactants,
                          double rate_constant,
                          bool combinatoric,
                          std::string description);

        /**
         * @brief Mass action whose rate constant is read from a network parameter.
         *
         * @param reactants Resolved reactant list (positive coefficients).
         * @param parameter_index Index of the rate parameter in the parameter vector.
         * @param combinatoric Whether the deterministic rate divides by prod c_i!.
         * @param description Text used by describe().
         */
        MassActionRateLaw(std::vector<StoichiometryEntry> reactants,
                          int parameter_index,
                          bool combinatoric,
                          std::string description);

        double propensity(const state_type& state, const parameter_type& parameters) const override;
        double rate(const state_type& state, const parameter_type& parameters) const override;
        std::string describe() const override;
        std::vector<int> getParameterIndices() const override;

        /**
         * @brief Number of ways to choose c molecules out of n.
         *
         * @param n Available count (integral value stored as double).
         * @param c Number of molecules consumed.
         * @return double C(n, c); 0 when n < c.
         */
        static double binomial(double n, int c);

    private:
        double rateConstant(const parameter_type& parameters) const;

        std::vector<StoichiometryEntry> reactants_;
        double rate_constant_;
        int parameter_index_;       ///< -1 when rate_constant_ is used.
        double factorial_divisor_;  ///< prod c_i! when combinatoric, 1 otherwise.
        std::string description_;
    };

} // namespace crn

#endif // MASS_ACTION_RATE_LAW_HPP
