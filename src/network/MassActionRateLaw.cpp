#include "network/MassActionRateLaw.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>
#include <utility>

namespace crn {

    namespace {
        double factorialDivisor(const std::vector<StoichiometryEntry>& reactants, bool combinatoric) {
            double divisor = 1.0;
            if (!combinatoric) return divisor;
            for (const auto& term : reactants) {
                for (int j = 2; j <= term.coefficient; ++j) {
                    divisor *= j;
                }
            }
            return divisor;
        }
    }

    MassActionRateLaw::MassActionRateLaw(std::vector<StoichiometryEntry> reactants,
                                         double rate_constant,
                                         bool combinatoric,
                                         std::string description)
        : reactants_(std::move(reactants)),
          rate_constant_(rate_constant),
          parameter_index_(-1),
          factorial_divisor_(1.0),
          description_(std::move(description))
    {
        if (!std::isfinite(rate_constant_) || rate_constant_ < 0.0) {
            THROW_MODEL_ERROR("MassActionRateLaw::MassActionRateLaw",
                              "Rate constant must be finite and non-negative. Got: " + std::to_string(rate_constant_));
        }
        factorial_divisor_ = factorialDivisor(reactants_, combinatoric);
    }

    MassActionRateLaw::MassActionRateLaw(std::vector<StoichiometryEntry> reactants,
                                         int parameter_index,
                                         bool combinatoric,
                                         std::string description)
        : reactants_(std::move(reactants)),
          rate_constant_(0.0),
          parameter_index_(parameter_index),
          factorial_divisor_(1.0),
          description_(std::move(description))
    {
        if (parameter_index_ < 0) {
            THROW_MODEL_ERROR("MassActionRateLaw::MassActionRateLaw", "Parameter index cannot be negative.");
        }
        factorial_divisor_ = factorialDivisor(reactants_, combinatoric);
    }

    double MassActionRateLaw::binomial(double n, int c) {
        if (n < c) return 0.0;
        double result = 1.0;
        for (int j = 0; j < c; ++j) {
            result *= (n - j) / static_cast<double>(j + 1);
        }
        return result;
    }

    double MassActionRateLaw::rateConstant(const parameter_type& parameters) const {
        if (parameter_index_ < 0) return rate_constant_;
        return parameters[static_cast<size_t>(parameter_index_)];
    }

    double MassActionRateLaw::propensity(const state_type& state, const parameter_type& parameters) const {
        double a = rateConstant(parameters);
        for (const auto& term : reactants_) {
            a *= binomial(state[static_cast<size_t>(term.species_index)], term.coefficient);
            if (a == 0.0) break;
        }
        return a;
    }

    double MassActionRateLaw::rate(const state_type& state, const parameter_type& parameters) const {
        double r = rateConstant(parameters);
        for (const auto& term : reactants_) {
            const double x = state[static_cast<size_t>(term.species_index)];
            for (int j = 0; j < term.coefficient; ++j) {
                r *= x;
            }
        }
        return r / factorial_divisor_;
    }

    std::string MassActionRateLaw::describe() const {
        return description_;
    }

    std::vector<int> MassActionRateLaw::getParameterIndices() const {
        if (parameter_index_ < 0) return {};
        return {parameter_index_};
    }

} // namespace crn
