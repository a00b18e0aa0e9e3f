#ifndef FEHLBERG_SOLVER_STRATEGY_HPP
#define FEHLBERG_SOLVER_STRATEGY_HPP

#include "simulation/interfaces/IOdeSolverStrategy.hpp"

namespace crn {

    /**
     * @brief Controlled Fehlberg 7(8) stepper from Boost.Odeint.
     */
    class FehlbergSolverStrategy : public IOdeSolverStrategy {
    public:
        void integrate(
            const std::function<void(const state_type&, state_type&, double)>& system,
            state_type& initial_state,
            const std::vector<double>& times,
            double dt_hint,
            std::function<void(const state_type&, double)> observer,
            double abs_error,
            double rel_error) const override;

        std::string getName() const override { return "fehlberg78"; }
    };

} // namespace crn

#endif // FEHLBERG_SOLVER_STRATEGY_HPP
