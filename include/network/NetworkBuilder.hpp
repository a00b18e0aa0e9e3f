#ifndef NETWORK_BUILDER_HPP
#define NETWORK_BUILDER_HPP

#include "network/ReactionClause.hpp"
#include "network/ReactionNetwork.hpp"
#include <memory>
#include <string>
#include <vector>

namespace crn {

    /**
     * @class NetworkBuilder
     * @brief Collects declarations and reaction clauses and builds a validated ReactionNetwork.
     *
     * Parameters must be declared before build() (declaration order fixes
     * their index). Species may be declared explicitly; any species named
     * in a stoichiometry is discovered by first appearance. Validation is
     * eager: build() either returns a consistent network or throws.
     *
     * Usage:
     * @code
     *   auto network = NetworkBuilder()
     *       .addParameters({"b", "d"})
     *       .addReaction({{}, {{"X", 1}}, RateExpression::massAction("b"), ""})
     *       .addReaction({{{"X", 1}}, {}, RateExpression::massAction("d"), ""})
     *       .build();
     * @endcode
     */
    class NetworkBuilder {
    public:
        NetworkBuilder() = default;

        /**
         * @brief Declares a parameter.
         * @throws ModelException If the name is empty or already declared.
         */
        NetworkBuilder& addParameter(const std::string& name);

        /** @brief Declares several parameters in order. */
        NetworkBuilder& addParameters(const std::vector<std::string>& names);

        /**
         * @brief Declares a species ahead of the reactions.
         * @throws ModelException If the name is empty or already declared.
         */
        NetworkBuilder& addSpecies(const std::string& name);

        /** @brief Appends a reaction clause; checked at build(). */
        NetworkBuilder& addReaction(const ReactionClause& clause);

        /** @brief Enables the 1/prod(c_i!) factor in deterministic mass-action rates. */
        NetworkBuilder& setCombinatoricRateLaws(bool enabled);

        /**
         * @brief Resolves all symbols and creates the network.
         *
         * @return std::shared_ptr<const ReactionNetwork> The immutable network.
         *
         * @throws ModelException If there are no reactions, a coefficient is
         *         negative, a rate references an undeclared parameter or an
         *         unknown species, a name is both species and parameter, or a
         *         numeric rate constant is negative.
         */
        std::shared_ptr<const ReactionNetwork> build() const;

    private:
        std::vector<std::string> parameters_;
        std::vector<std::string> species_;
        std::vector<ReactionClause> clauses_;
        bool combinatoric_ratelaws_ = false;
    };

} // namespace crn

#endif // NETWORK_BUILDER_HPP
