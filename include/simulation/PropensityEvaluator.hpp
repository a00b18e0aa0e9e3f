#ifndef PROPENSITY_EVALUATOR_HPP
#define PROPENSITY_EVALUATOR_HPP

#include "network/ReactionNetwork.hpp"
#include <memory>
#include <vector>

namespace crn {

    /**
     * @brief Which form of the rate laws to evaluate.
     */
    enum class KineticsMode {
        Stochastic,    ///< Combinatorial propensities on integer counts.
        Deterministic  ///< Power-law rates on real concentrations.
    };

    /**
     * @class PropensityEvaluator
     * @brief Evaluates all reactions of a network at a given state.
     *
     * Holds no mutable state of its own; the caller provides the output
     * buffer so that one evaluator can serve a whole simulation loop without
     * reallocating.
     */
    class PropensityEvaluator {
    public:
        /**
         * @param network Network whose reactions are evaluated.
         * @param mode Stochastic propensities or deterministic rates.
         * @throws InvalidParameterException If `network` is null.
         */
        PropensityEvaluator(std::shared_ptr<const ReactionNetwork> network, KineticsMode mode);

        /**
         * @brief Computes every reaction's propensity (or rate) and their sum.
         *
         * @param state Current state, one entry per species.
         * @param parameters Parameter values in declaration order.
         * @param[out] propensities Resized to the reaction count and filled.
         * @return double Total propensity.
         *
         * @throws InvalidParameterException If the state or parameter size is wrong.
         * @throws ModelException If a custom rate law returns a negative or non-finite value.
         */
        double evaluate(const state_type& state,
                        const parameter_type& parameters,
                        std::vector<double>& propensities) const;

        /**
         * @brief Picks the reaction that fires under the cumulative-sum rule.
         *
         * Returns the smallest index r with a positive propensity such that
         * the running sum up to r reaches `u * total`. If rounding leaves the
         * running sum short of the target, the last reaction with a positive
         * propensity is returned.
         *
         * @param propensities Per-reaction propensities.
         * @param total Their sum; must be positive.
         * @param u Uniform draw in [0, 1).
         *
         * @throws InvalidParameterException If `total` is not positive or no propensity is positive.
         */
        static int selectReaction(const std::vector<double>& propensities, double total, double u);

        KineticsMode getMode() const;

        const ReactionNetwork& getNetwork() const;

    private:
        std::shared_ptr<const ReactionNetwork> network_;
        KineticsMode mode_;
    };

} // namespace crn

#endif // PROPENSITY_EVALUATOR_HPP
