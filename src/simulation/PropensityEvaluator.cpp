#include "simulation/PropensityEvaluator.hpp"
#include "exceptions/Exceptions.hpp"
#include <utility>

namespace crn {

    PropensityEvaluator::PropensityEvaluator(std::shared_ptr<const ReactionNetwork> network, KineticsMode mode)
        : network_(std::move(network)), mode_(mode)
    {
        if (!network_) {
            THROW_INVALID_PARAM("PropensityEvaluator::PropensityEvaluator", "Network pointer cannot be null.");
        }
    }

    double PropensityEvaluator::evaluate(const state_type& state,
                                         const parameter_type& parameters,
                                         std::vector<double>& propensities) const {
        const int num_species = network_->getSpeciesCount();
        const int num_parameters = network_->getParameterCount();
        if (static_cast<int>(state.size()) != num_species) {
            THROW_INVALID_PARAM("PropensityEvaluator::evaluate",
                                "State size " + std::to_string(state.size()) +
                                " does not match species count " + std::to_string(num_species) + ".");
        }
        if (static_cast<int>(parameters.size()) != num_parameters) {
            THROW_INVALID_PARAM("PropensityEvaluator::evaluate",
                                "Parameter vector size " + std::to_string(parameters.size()) +
                                " does not match parameter count " + std::to_string(num_parameters) + ".");
        }

        const int num_reactions = network_->getReactionCount();
        propensities.resize(static_cast<size_t>(num_reactions));

        double total = 0.0;
        for (int r = 0; r < num_reactions; ++r) {
            const IRateLaw& law = *network_->getReaction(r).rate_law;
            const double value = (mode_ == KineticsMode::Stochastic)
                ? law.propensity(state, parameters)
                : law.rate(state, parameters);
            propensities[static_cast<size_t>(r)] = value;
            total += value;
        }
        return total;
    }

    int PropensityEvaluator::selectReaction(const std::vector<double>& propensities, double total, double u) {
        if (!(total > 0.0)) {
            THROW_INVALID_PARAM("PropensityEvaluator::selectReaction",
                                "Total propensity must be positive. Got: " + std::to_string(total));
        }
        const double target = u * total;
        double cumulative = 0.0;
        int last_positive = -1;
        for (size_t r = 0; r < propensities.size(); ++r) {
            if (propensities[r] <= 0.0) {
                continue;
            }
            last_positive = static_cast<int>(r);
            cumulative += propensities[r];
            if (cumulative >= target) {
                return last_positive;
            }
        }
        if (last_positive < 0) {
            THROW_INVALID_PARAM("PropensityEvaluator::selectReaction", "No reaction has a positive propensity.");
        }
        return last_positive;
    }

    KineticsMode PropensityEvaluator::getMode() const {
        return mode_;
    }

    const ReactionNetwork& PropensityEvaluator::getNetwork() const {
        return *network_;
    }

} // namespace crn
