#include "network/ReactionNetwork.hpp"
#include <cmath>
#include <sstream>
#include <utility>

namespace crn {

    ReactionNetwork::ReactionNetwork(std::vector<std::string> species_names,
                                     std::vector<std::string> parameter_names,
                                     std::vector<Reaction> reactions,
                                     std::vector<int> rate_parameter_indices,
                                     bool combinatoric_ratelaws)
        : species_names_(std::move(species_names)),
          parameter_names_(std::move(parameter_names)),
          reactions_(std::move(reactions)),
          rate_parameter_indices_(std::move(rate_parameter_indices)),
          combinatoric_ratelaws_(combinatoric_ratelaws)
    {
        for (size_t i = 0; i < species_names_.size(); ++i) {
            species_lookup_.emplace(species_names_[i], static_cast<int>(i));
        }
        for (size_t i = 0; i < parameter_names_.size(); ++i) {
            parameter_lookup_.emplace(parameter_names_[i], static_cast<int>(i));
        }
    }

    int ReactionNetwork::getSpeciesCount() const {
        return static_cast<int>(species_names_.size());
    }

    int ReactionNetwork::getParameterCount() const {
        return static_cast<int>(parameter_names_.size());
    }

    int ReactionNetwork::getReactionCount() const {
        return static_cast<int>(reactions_.size());
    }

    const std::vector<std::string>& ReactionNetwork::getSpeciesNames() const {
        return species_names_;
    }

    const std::vector<std::string>& ReactionNetwork::getParameterNames() const {
        return parameter_names_;
    }

    int ReactionNetwork::getSpeciesIndex(const std::string& name) const {
        auto it = species_lookup_.find(name);
        if (it == species_lookup_.end()) {
            THROW_MODEL_ERROR("ReactionNetwork::getSpeciesIndex", "Unknown species '" + name + "'.");
        }
        return it->second;
    }

    int ReactionNetwork::getParameterIndex(const std::string& name) const {
        auto it = parameter_lookup_.find(name);
        if (it == parameter_lookup_.end()) {
            THROW_MODEL_ERROR("ReactionNetwork::getParameterIndex", "Unknown parameter '" + name + "'.");
        }
        return it->second;
    }

    bool ReactionNetwork::hasSpecies(const std::string& name) const {
        return species_lookup_.count(name) > 0;
    }

    bool ReactionNetwork::hasParameter(const std::string& name) const {
        return parameter_lookup_.count(name) > 0;
    }

    void ReactionNetwork::checkReactionIndex(const std::string& caller, int reactionIndex) const {
        if (reactionIndex < 0 || reactionIndex >= getReactionCount()) {
            THROW_INVALID_PARAM(caller, "Reaction index " + std::to_string(reactionIndex) +
                                " out of range [0, " + std::to_string(getReactionCount()) + ").");
        }
    }

    const Reaction& ReactionNetwork::getReaction(int reactionIndex) const {
        checkReactionIndex("ReactionNetwork::getReaction", reactionIndex);
        return reactions_[static_cast<size_t>(reactionIndex)];
    }

    const Eigen::VectorXi& ReactionNetwork::getNetChange(int reactionIndex) const {
        checkReactionIndex("ReactionNetwork::getNetChange", reactionIndex);
        return reactions_[static_cast<size_t>(reactionIndex)].net_change_dense;
    }

    Eigen::MatrixXi ReactionNetwork::getStoichiometryMatrix() const {
        Eigen::MatrixXi S(getSpeciesCount(), getReactionCount());
        for (int r = 0; r < getReactionCount(); ++r) {
            S.col(r) = reactions_[static_cast<size_t>(r)].net_change_dense;
        }
        return S;
    }

    double ReactionNetwork::propensity(int reactionIndex, const state_type& state, const parameter_type& params) const {
        checkReactionIndex("ReactionNetwork::propensity", reactionIndex);
        if (state.size() != species_names_.size() || params.size() != parameter_names_.size()) {
            THROW_INVALID_PARAM("ReactionNetwork::propensity",
                                "Expected state of size " + std::to_string(species_names_.size()) +
                                " and parameters of size " + std::to_string(parameter_names_.size()) +
                                ", got " + std::to_string(state.size()) + " and " + std::to_string(params.size()) + ".");
        }
        return reactions_[static_cast<size_t>(reactionIndex)].rate_law->propensity(state, params);
    }

    double ReactionNetwork::rate(int reactionIndex, const state_type& state, const parameter_type& params) const {
        checkReactionIndex("ReactionNetwork::rate", reactionIndex);
        if (state.size() != species_names_.size() || params.size() != parameter_names_.size()) {
            THROW_INVALID_PARAM("ReactionNetwork::rate",
                                "Expected state of size " + std::to_string(species_names_.size()) +
                                " and parameters of size " + std::to_string(parameter_names_.size()) +
                                ", got " + std::to_string(state.size()) + " and " + std::to_string(params.size()) + ".");
        }
        return reactions_[static_cast<size_t>(reactionIndex)].rate_law->rate(state, params);
    }

    bool ReactionNetwork::usesCombinatoricRateLaws() const {
        return combinatoric_ratelaws_;
    }

    void ReactionNetwork::validateParameters(const parameter_type& params) const {
        if (params.size() != parameter_names_.size()) {
            THROW_MODEL_ERROR("ReactionNetwork::validateParameters",
                              "Network declares " + std::to_string(parameter_names_.size()) +
                              " parameters but " + std::to_string(params.size()) + " values were supplied.");
        }
        for (size_t i = 0; i < params.size(); ++i) {
            if (!std::isfinite(params[i])) {
                THROW_MODEL_ERROR("ReactionNetwork::validateParameters",
                                  "Parameter '" + parameter_names_[i] + "' is not finite.");
            }
        }
        for (int idx : rate_parameter_indices_) {
            if (params[static_cast<size_t>(idx)] < 0.0) {
                THROW_MODEL_ERROR("ReactionNetwork::validateParameters",
                                  "Mass-action rate parameter '" + parameter_names_[static_cast<size_t>(idx)] +
                                  "' cannot be negative. Got: " + std::to_string(params[static_cast<size_t>(idx)]));
            }
        }
    }

    Eigen::VectorXd ReactionNetwork::parameterVector(const std::map<std::string, double>& values) const {
        for (const auto& kv : values) {
            if (!hasParameter(kv.first)) {
                THROW_MODEL_ERROR("ReactionNetwork::parameterVector", "Unknown parameter '" + kv.first + "'.");
            }
        }
        Eigen::VectorXd p(getParameterCount());
        for (int i = 0; i < getParameterCount(); ++i) {
            auto it = values.find(parameter_names_[static_cast<size_t>(i)]);
            if (it == values.end()) {
                THROW_MODEL_ERROR("ReactionNetwork::parameterVector",
                                  "No value supplied for parameter '" + parameter_names_[static_cast<size_t>(i)] + "'.");
            }
            p(i) = it->second;
        }
        return p;
    }

    Eigen::VectorXd ReactionNetwork::stateVector(const std::map<std::string, double>& values) const {
        Eigen::VectorXd x = Eigen::VectorXd::Zero(getSpeciesCount());
        for (const auto& kv : values) {
            x(getSpeciesIndex(kv.first)) = kv.second;
        }
        return x;
    }

    std::string ReactionNetwork::toString() const {
        std::ostringstream oss;
        oss << "ReactionNetwork with " << getSpeciesCount() << " species, "
            << getParameterCount() << " parameters, " << getReactionCount() << " reactions";
        for (const auto& r : reactions_) {
            oss << "\n  " << r.rate_law->describe() << ", " << r.label;
        }
        return oss.str();
    }

} // namespace crn
