#include "network/ReactionClause.hpp"
#include "exceptions/Exceptions.hpp"
#include <sstream>
#include <utility>

namespace crn {

    RateExpression RateExpression::library(const std::string& name,
                                           std::vector<std::string> species_args,
                                           std::vector<std::string> parameter_args) {
        RateFunctionDefinition def = RateFunctions::lookup(name);
        if (static_cast<int>(species_args.size()) != def.num_species ||
            static_cast<int>(parameter_args.size()) != def.num_parameters) {
            THROW_MODEL_ERROR("RateExpression::library",
                              "Rate function '" + name + "' expects " + std::to_string(def.num_species) +
                              " species and " + std::to_string(def.num_parameters) + " parameters, got " +
                              std::to_string(species_args.size()) + " and " + std::to_string(parameter_args.size()) + ".");
        }
        return custom(name, def.function, std::move(species_args), std::move(parameter_args));
    }

    std::string RateExpression::toString() const {
        std::ostringstream oss;
        if (kind == Kind::MassAction) {
            if (parameter.empty()) {
                oss << constant;
            } else {
                oss << parameter;
            }
            return oss.str();
        }
        oss << function_name << "(";
        for (size_t i = 0; i < species_arguments.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << species_arguments[i];
        }
        oss << ";";
        for (size_t i = 0; i < parameter_arguments.size(); ++i) {
            oss << (i > 0 ? ", " : " ") << parameter_arguments[i];
        }
        oss << ")";
        return oss.str();
    }

} // namespace crn
