#ifndef CUSTOM_RATE_LAW_HPP
#define CUSTOM_RATE_LAW_HPP

#include "network/interfaces/IRateLaw.hpp"
#include "network/RateFunctions.hpp"
#include <string>
#include <vector>

namespace crn {

    /**
     * @class CustomRateLaw
     * @brief Rate law given by a user function of selected species and parameters.
     *
     * The function value is used as-is for both the stochastic propensity and
     * the deterministic rate; no combinatorial correction is applied. A
     * negative or non-finite result is a malformed model and raises
     * ModelException at the evaluation that produced it.
     *
     * The deterministic form passes species arguments through max(0, x)
     * before calling the function, so solver trial states with small
     * negative components do not trip the check. Stored solver states are
     * not clamped.
     */
    class CustomRateLaw : public IRateLaw {
    public:
        /**
         * @param name Function name, used in messages.
         * @param function Callable evaluating the law.
         * @param species_indices Argument species, in call order.
         * @param parameter_indices Argument parameters, in call order.
         * @param description Text used by describe().
         *
         * @throws ModelException If `function` is empty.
         */
        CustomRateLaw(std::string name,
                      RateFunction function,
                      std::vector<int> species_indices,
                      std::vector<int> parameter_indices,
                      std::string description);

        double propensity(const state_type& state, const parameter_type& parameters) const override;
        double rate(const state_type& state, const parameter_type& parameters) const override;
        std::string describe() const override;
        std::vector<int> getParameterIndices() const override;

    private:
        double evaluate(const state_type& state, const parameter_type& parameters, bool clamp_species) const;

        std::string name_;
        RateFunction function_;
        std::vector<int> species_indices_;
        std::vector<int> parameter_indices_;
        std::string description_;
    };

} // namespace crn

#endif // CUSTOM_RATE_LAW_HPP
