#ifndef REACTION_CLAUSE_HPP
#define REACTION_CLAUSE_HPP

#include "network/RateFunctions.hpp"
#include <string>
#include <utility>
#include <vector>

namespace crn {

    /**
     * @brief Unresolved rate expression of a reaction clause.
     *
     * Tagged record: either mass action with a numeric constant or a named
     * parameter, or a custom function with explicit species and parameter
     * argument lists. Symbols are resolved when the network is built.
     */
    struct RateExpression {
        enum class Kind { MassAction, Custom };

        Kind kind = Kind::MassAction;
        double constant = 0.0;          ///< Used when kind == MassAction and parameter is empty.
        std::string parameter;          ///< Rate parameter name for mass action.
        std::string function_name;      ///< Custom law name.
        RateFunction function;          ///< Custom law callable.
        std::vector<std::string> species_arguments;
        std::vector<std::string> parameter_arguments;

        static RateExpression massAction(double rate_constant) {
            RateExpression e;
            e.kind = Kind::MassAction;
            e.constant = rate_constant;
            return e;
        }

        static RateExpression massAction(const std::string& parameter_name) {
            RateExpression e;
            e.kind = Kind::MassAction;
            e.parameter = parameter_name;
            return e;
        }

        static RateExpression custom(const std::string& name,
                                     RateFunction fn,
                                     std::vector<std::string> species_args,
                                     std::vector<std::string> parameter_args) {
            RateExpression e;
            e.kind = Kind::Custom;
            e.function_name = name;
            e.function = std::move(fn);
            e.species_arguments = std::move(species_args);
            e.parameter_arguments = std::move(parameter_args);
            return e;
        }

        /**
         * @brief Custom law taken from the RateFunctions library.
         * @throws ModelException If the name is unknown or the argument counts do not match its arity.
         */
        static RateExpression library(const std::string& name,
                                      std::vector<std::string> species_args,
                                      std::vector<std::string> parameter_args);

        std::string toString() const;
    };

    /**
     * @brief One declarative reaction: reactants, products and rate.
     *
     * Stoichiometry is kept as an ordered list so that species discovery
     * follows the order in which names are written. Coefficients are
     * validated by the builder (negative values are rejected).
     */
    struct ReactionClause {
        std::vector<std::pair<std::string, int>> reactants;
        std::vector<std::pair<std::string, int>> products;
        RateExpression rate;
        std::string label;  ///< Optional; defaults to "lhs --> rhs" when empty.
    };

} // namespace crn

#endif // REACTION_CLAUSE_HPP
