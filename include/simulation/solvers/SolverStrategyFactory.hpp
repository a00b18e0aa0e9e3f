#ifndef SOLVER_STRATEGY_FACTORY_HPP
#define SOLVER_STRATEGY_FACTORY_HPP

#include "simulation/interfaces/IOdeSolverStrategy.hpp"
#include <memory>
#include <string>
#include <vector>

namespace crn {

    /**
     * @brief Creates ODE solver strategies from their configuration names.
     */
    class SolverStrategyFactory {
    public:
        SolverStrategyFactory() = delete;

        /**
         * @brief Solver for `dopri5`, `cash_karp` or `fehlberg78`.
         * @throws InvalidParameterException If the name is unknown.
         */
        static std::shared_ptr<IOdeSolverStrategy> create(const std::string& name);

        static std::vector<std::string> availableSolvers();
    };

} // namespace crn

#endif // SOLVER_STRATEGY_FACTORY_HPP
