#include "network/CustomRateLaw.hpp"
#include "exceptions/Exceptions.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace crn {

    CustomRateLaw::CustomRateLaw(std::string name,
                                 RateFunction function,
                                 std::vector<int> species_indices,
                                 std::vector<int> parameter_indices,
                                 std::string description)
        : name_(std::move(name)),
          function_(std::move(function)),
          species_indices_(std::move(species_indices)),
          parameter_indices_(std::move(parameter_indices)),
          description_(std::move(description))
    {
        if (!function_) {
            THROW_MODEL_ERROR("CustomRateLaw::CustomRateLaw", "Custom rate law '" + name_ + "' has no callable.");
        }
    }

    double CustomRateLaw::evaluate(const state_type& state, const parameter_type& parameters, bool clamp_species) const {
        std::vector<double> species_values;
        species_values.reserve(species_indices_.size());
        for (int idx : species_indices_) {
            const double x = state[static_cast<size_t>(idx)];
            species_values.push_back(clamp_species ? std::max(0.0, x) : x);
        }
        std::vector<double> parameter_values;
        parameter_values.reserve(parameter_indices_.size());
        for (int idx : parameter_indices_) {
            parameter_values.push_back(parameters[static_cast<size_t>(idx)]);
        }

        const double value = function_(species_values, parameter_values);
        if (!std::isfinite(value) || value < 0.0) {
            THROW_MODEL_ERROR("CustomRateLaw::evaluate",
                              "Rate law " + description_ + " evaluated to " + std::to_string(value) +
                              "; custom rate laws must return finite non-negative values.");
        }
        return value;
    }

    double CustomRateLaw::propensity(const state_type& state, const parameter_type& parameters) const {
        return evaluate(state, parameters, false);
    }

    // Adaptive steppers probe trial states slightly below zero; the law only sees the non-negative part.
    double CustomRateLaw::rate(const state_type& state, const parameter_type& parameters) const {
        return evaluate(state, parameters, true);
    }

    std::string CustomRateLaw::describe() const {
        return description_;
    }

    std::vector<int> CustomRateLaw::getParameterIndices() const {
        return parameter_indices_;
    }

} // namespace crn
