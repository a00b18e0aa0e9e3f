#ifndef REACTION_NETWORK_HPP
#define REACTION_NETWORK_HPP

#include "network/NetworkTypes.hpp"
#include "network/Reaction.hpp"
#include "exceptions/Exceptions.hpp"
#include <Eigen/Dense>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace crn {

    class NetworkBuilder;

    /**
     * @class ReactionNetwork
     * @brief Immutable chemical reaction network: species, parameters and reactions.
     *
     * Instances are created only by NetworkBuilder::build() and handed out as
     * `std::shared_ptr<const ReactionNetwork>`. Every simulator and every
     * ensemble run reads the same instance concurrently; nothing in the
     * network changes after construction.
     *
     * Species are indexed by first appearance (declared species first, then
     * reactants before products in clause order); parameters by declaration
     * order.
     */
    class ReactionNetwork {
    public:
        ReactionNetwork() = delete;

        /** @brief Number of species (state vector length). */
        int getSpeciesCount() const;

        /** @brief Number of declared parameters (parameter vector length). */
        int getParameterCount() const;

        /** @brief Number of reactions. */
        int getReactionCount() const;

        const std::vector<std::string>& getSpeciesNames() const;
        const std::vector<std::string>& getParameterNames() const;

        /**
         * @brief Index of a species by name.
         * @throws ModelException If the species does not exist.
         */
        int getSpeciesIndex(const std::string& name) const;

        /**
         * @brief Index of a parameter by name.
         * @throws ModelException If the parameter does not exist.
         */
        int getParameterIndex(const std::string& name) const;

        bool hasSpecies(const std::string& name) const;
        bool hasParameter(const std::string& name) const;

        /**
         * @brief Resolved reaction by index.
         * @throws InvalidParameterException If the index is out of range.
         */
        const Reaction& getReaction(int reactionIndex) const;

        /**
         * @brief Net stoichiometric change of a reaction, one entry per species.
         * @throws InvalidParameterException If the index is out of range.
         */
        const Eigen::VectorXi& getNetChange(int reactionIndex) const;

        /**
         * @brief Full stoichiometry matrix, species x reactions.
         */
        Eigen::MatrixXi getStoichiometryMatrix() const;

        /**
         * @brief Stochastic propensity of one reaction.
         *
         * Pure function of its arguments. Mass-action laws use the binomial
         * form, so the result is exactly zero when a reactant count is below
         * its coefficient.
         *
         * @param reactionIndex Reaction to evaluate.
         * @param state Species counts.
         * @param params Parameter values in declaration order.
         * @return double Non-negative propensity.
         *
         * @throws InvalidParameterException If the index is out of range or vector sizes mismatch.
         * @throws ModelException If a custom law returns a negative value.
         */
        double propensity(int reactionIndex, const state_type& state, const parameter_type& params) const;

        /**
         * @brief Deterministic (power-law) rate of one reaction. Same contract as propensity().
         */
        double rate(int reactionIndex, const state_type& state, const parameter_type& params) const;

        /** @brief Whether deterministic mass-action rates divide by prod c_i!. */
        bool usesCombinatoricRateLaws() const;

        /**
         * @brief Checks a parameter vector before a solve.
         *
         * @throws ModelException If the size differs from the parameter count, a
         *         value is non-finite, or a mass-action rate parameter is negative.
         */
        void validateParameters(const parameter_type& params) const;

        /**
         * @brief Builds the parameter vector from a name/value map.
         * @throws ModelException If a declared parameter is missing or an unknown name is given.
         */
        Eigen::VectorXd parameterVector(const std::map<std::string, double>& values) const;

        /**
         * @brief Builds a state vector from a name/value map; missing species default to 0.
         * @throws ModelException If an unknown species name is given.
         */
        Eigen::VectorXd stateVector(const std::map<std::string, double>& values) const;

        /** @brief Multi-line listing of the reactions, for logs. */
        std::string toString() const;

    private:
        friend class NetworkBuilder;

        ReactionNetwork(std::vector<std::string> species_names,
                        std::vector<std::string> parameter_names,
                        std::vector<Reaction> reactions,
                        std::vector<int> rate_parameter_indices,
                        bool combinatoric_ratelaws);

        void checkReactionIndex(const std::string& caller, int reactionIndex) const;

        std::vector<std::string> species_names_;
        std::vector<std::string> parameter_names_;
        std::unordered_map<std::string, int> species_lookup_;
        std::unordered_map<std::string, int> parameter_lookup_;
        std::vector<Reaction> reactions_;
        std::vector<int> rate_parameter_indices_;  ///< Parameters used as mass-action rate constants.
        bool combinatoric_ratelaws_;
    };

} // namespace crn

#endif // REACTION_NETWORK_HPP
