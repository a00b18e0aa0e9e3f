#include "network/NetworkBuilder.hpp"
#include "network/MassActionRateLaw.hpp"
#include "network/CustomRateLaw.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <sstream>
#include <unordered_map>
#include <utility>

namespace crn {

    namespace {

        bool contains(const std::vector<std::string>& names, const std::string& name) {
            return std::find(names.begin(), names.end(), name) != names.end();
        }

        // Merges repeated species on one side of a clause; keeps first-mention order, drops zeros.
        std::vector<StoichiometryEntry> resolveSide(const std::vector<std::pair<std::string, int>>& side,
                                                    const std::unordered_map<std::string, int>& species_lookup) {
            std::vector<StoichiometryEntry> entries;
            for (const auto& term : side) {
                const int idx = species_lookup.at(term.first);
                auto it = std::find_if(entries.begin(), entries.end(),
                                       [idx](const StoichiometryEntry& e) { return e.species_index == idx; });
                if (it == entries.end()) {
                    entries.push_back({idx, term.second});
                } else {
                    it->coefficient += term.second;
                }
            }
            entries.erase(std::remove_if(entries.begin(), entries.end(),
                                         [](const StoichiometryEntry& e) { return e.coefficient == 0; }),
                          entries.end());
            return entries;
        }

        std::string formatSide(const std::vector<StoichiometryEntry>& side, const std::vector<std::string>& names) {
            if (side.empty()) return "0";
            std::ostringstream oss;
            for (size_t i = 0; i < side.size(); ++i) {
                if (i > 0) oss << " + ";
                if (side[i].coefficient != 1) oss << side[i].coefficient;
                oss << names[static_cast<size_t>(side[i].species_index)];
            }
            return oss.str();
        }

    } // namespace

    NetworkBuilder& NetworkBuilder::addParameter(const std::string& name) {
        if (name.empty()) {
            THROW_MODEL_ERROR("NetworkBuilder::addParameter", "Parameter name cannot be empty.");
        }
        if (contains(parameters_, name)) {
            THROW_MODEL_ERROR("NetworkBuilder::addParameter", "Parameter '" + name + "' declared twice.");
        }
        if (contains(species_, name)) {
            THROW_MODEL_ERROR("NetworkBuilder::addParameter", "'" + name + "' is already declared as a species.");
        }
        parameters_.push_back(name);
        return *this;
    }

    NetworkBuilder& NetworkBuilder::addParameters(const std::vector<std::string>& names) {
        for (const auto& name : names) {
            addParameter(name);
        }
        return *this;
    }

    NetworkBuilder& NetworkBuilder::addSpecies(const std::string& name) {
        if (name.empty()) {
            THROW_MODEL_ERROR("NetworkBuilder::addSpecies", "Species name cannot be empty.");
        }
        if (contains(species_, name)) {
            THROW_MODEL_ERROR("NetworkBuilder::addSpecies", "Species '" + name + "' declared twice.");
        }
        if (contains(parameters_, name)) {
            THROW_MODEL_ERROR("NetworkBuilder::addSpecies", "'" + name + "' is already declared as a parameter.");
        }
        species_.push_back(name);
        return *this;
    }

    NetworkBuilder& NetworkBuilder::addReaction(const ReactionClause& clause) {
        clauses_.push_back(clause);
        return *this;
    }

    NetworkBuilder& NetworkBuilder::setCombinatoricRateLaws(bool enabled) {
        combinatoric_ratelaws_ = enabled;
        return *this;
    }

    std::shared_ptr<const ReactionNetwork> NetworkBuilder::build() const {
        if (clauses_.empty()) {
            THROW_MODEL_ERROR("NetworkBuilder::build", "A reaction network needs at least one reaction.");
        }

        std::unordered_map<std::string, int> parameter_lookup;
        for (size_t i = 0; i < parameters_.size(); ++i) {
            parameter_lookup.emplace(parameters_[i], static_cast<int>(i));
        }

        // Pass 1: species discovery by first appearance.
        std::vector<std::string> species_names = species_;
        std::unordered_map<std::string, int> species_lookup;
        for (size_t i = 0; i < species_names.size(); ++i) {
            species_lookup.emplace(species_names[i], static_cast<int>(i));
        }
        for (size_t c = 0; c < clauses_.size(); ++c) {
            const ReactionClause& clause = clauses_[c];
            for (const auto* side : {&clause.reactants, &clause.products}) {
                for (const auto& term : *side) {
                    const std::string where = "reaction " + std::to_string(c + 1);
                    if (term.first.empty()) {
                        THROW_MODEL_ERROR("NetworkBuilder::build", "Empty species name in " + where + ".");
                    }
                    if (term.second < 0) {
                        THROW_MODEL_ERROR("NetworkBuilder::build",
                                          "Negative stoichiometric coefficient " + std::to_string(term.second) +
                                          " for species '" + term.first + "' in " + where + ".");
                    }
                    if (parameter_lookup.count(term.first)) {
                        THROW_MODEL_ERROR("NetworkBuilder::build",
                                          "'" + term.first + "' is a parameter but appears in the stoichiometry of " + where + ".");
                    }
                    if (!species_lookup.count(term.first)) {
                        species_lookup.emplace(term.first, static_cast<int>(species_names.size()));
                        species_names.push_back(term.first);
                    }
                }
            }
        }

        // Pass 2: resolve stoichiometry and rate laws.
        const int num_species = static_cast<int>(species_names.size());
        std::vector<Reaction> reactions;
        reactions.reserve(clauses_.size());
        std::vector<int> rate_parameter_indices;

        for (size_t c = 0; c < clauses_.size(); ++c) {
            const ReactionClause& clause = clauses_[c];
            const std::string where = "reaction " + std::to_string(c + 1);

            Reaction reaction;
            reaction.reactants = resolveSide(clause.reactants, species_lookup);
            reaction.products = resolveSide(clause.products, species_lookup);
            if (reaction.reactants.empty() && reaction.products.empty()) {
                THROW_MODEL_ERROR("NetworkBuilder::build", where + " has neither reactants nor products.");
            }

            reaction.net_change_dense = Eigen::VectorXi::Zero(num_species);
            for (const auto& e : reaction.reactants) reaction.net_change_dense(e.species_index) -= e.coefficient;
            for (const auto& e : reaction.products) reaction.net_change_dense(e.species_index) += e.coefficient;
            for (int s = 0; s < num_species; ++s) {
                if (reaction.net_change_dense(s) != 0) {
                    reaction.net_change.push_back({s, reaction.net_change_dense(s)});
                }
            }

            reaction.label = clause.label.empty()
                ? formatSide(reaction.reactants, species_names) + " --> " + formatSide(reaction.products, species_names)
                : clause.label;

            const RateExpression& expr = clause.rate;
            if (expr.kind == RateExpression::Kind::MassAction) {
                if (expr.parameter.empty()) {
                    reaction.rate_law = std::make_shared<MassActionRateLaw>(
                        reaction.reactants, expr.constant, combinatoric_ratelaws_, expr.toString());
                } else {
                    auto it = parameter_lookup.find(expr.parameter);
                    if (it == parameter_lookup.end()) {
                        const std::string hint = species_lookup.count(expr.parameter)
                            ? " ('" + expr.parameter + "' is a species; use a custom rate law for state-dependent rates)"
                            : "";
                        THROW_MODEL_ERROR("NetworkBuilder::build",
                                          "Undeclared parameter '" + expr.parameter + "' in rate of " + where + hint + ".");
                    }
                    reaction.rate_law = std::make_shared<MassActionRateLaw>(
                        reaction.reactants, it->second, combinatoric_ratelaws_, expr.toString());
                }
                // Mass-action constants must be non-negative; custom-law parameters are unconstrained.
                for (int idx : reaction.rate_law->getParameterIndices()) {
                    if (std::find(rate_parameter_indices.begin(), rate_parameter_indices.end(), idx) == rate_parameter_indices.end()) {
                        rate_parameter_indices.push_back(idx);
                    }
                }
            } else {
                std::vector<int> species_args;
                for (const auto& name : expr.species_arguments) {
                    auto it = species_lookup.find(name);
                    if (it == species_lookup.end()) {
                        THROW_MODEL_ERROR("NetworkBuilder::build",
                                          "Undeclared species '" + name + "' in rate " + expr.toString() + " of " + where + ".");
                    }
                    species_args.push_back(it->second);
                }
                std::vector<int> parameter_args;
                for (const auto& name : expr.parameter_arguments) {
                    auto it = parameter_lookup.find(name);
                    if (it == parameter_lookup.end()) {
                        THROW_MODEL_ERROR("NetworkBuilder::build",
                                          "Undeclared parameter '" + name + "' in rate " + expr.toString() + " of " + where + ".");
                    }
                    parameter_args.push_back(it->second);
                }
                reaction.rate_law = std::make_shared<CustomRateLaw>(
                    expr.function_name, expr.function, species_args, parameter_args, expr.toString());
            }

            reactions.push_back(std::move(reaction));
        }

        std::shared_ptr<const ReactionNetwork> network(
            new ReactionNetwork(species_names, parameters_, std::move(reactions),
                                std::move(rate_parameter_indices), combinatoric_ratelaws_));
        Logger::getInstance().debug("NetworkBuilder::build", network->toString());
        return network;
    }

} // namespace crn
