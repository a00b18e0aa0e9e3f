#ifndef RATE_FUNCTIONS_HPP
#define RATE_FUNCTIONS_HPP

#include <functional>
#include <string>
#include <vector>

namespace crn {

    /**
     * @brief Signature of a custom rate law.
     *
     * Receives the current values of its argument species and argument
     * parameters, in the order they were listed in the reaction clause.
     */
    using RateFunction = std::function<double(const std::vector<double>& species_values,
                                              const std::vector<double>& parameter_values)>;

    /**
     * @brief A named rate function with its fixed arity.
     */
    struct RateFunctionDefinition {
        std::string name;
        RateFunction function;
        int num_species;     ///< Number of species arguments expected.
        int num_parameters;  ///< Number of parameter arguments expected.
    };

    /**
     * @namespace RateFunctions
     * @brief Library of standard non-mass-action rate laws.
     *
     * - `hillr(x; v, K, n)` = v K^n / (K^n + x^n), repression
     * - `hill(x; v, K, n)`  = v x^n / (K^n + x^n), activation
     * - `mm(x; v, K)`       = v x / (K + x), Michaelis-Menten
     */
    namespace RateFunctions {

        double hillRepression(double x, double v, double K, double n);
        double hillActivation(double x, double v, double K, double n);
        double michaelisMenten(double x, double v, double K);

        /**
         * @brief Looks up a library function by name.
         *
         * @param name Function name (`hillr`, `hill`, `mm`).
         * @return RateFunctionDefinition The callable together with its arity.
         * @throws ModelException If the name is not in the library.
         */
        RateFunctionDefinition lookup(const std::string& name);

        /**
         * @brief Returns true if a function of that name exists in the library.
         */
        bool contains(const std::string& name);

    } // namespace RateFunctions

} // namespace crn

#endif // RATE_FUNCTIONS_HPP
