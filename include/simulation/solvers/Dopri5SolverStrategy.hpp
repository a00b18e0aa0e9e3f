#ifndef DOPRI5_SOLVER_STRATEGY_HPP
#define DOPRI5_SOLVER_STRATEGY_HPP

#include "simulation/interfaces/IOdeSolverStrategy.hpp"

namespace crn {

    /**
     * @brief Controlled Dormand-Prince 5(4) stepper from Boost.Odeint.
     *
     * Default solver of DeterministicSimulator. The step size adapts to the
     * absolute and relative tolerances; output times are hit exactly through
     * `integrate_times`, so the grid spacing does not limit accuracy.
     */
    class Dopri5SolverStrategy : public IOdeSolverStrategy {
    public:
        void integrate(
            const std::function<void(const state_type&, state_type&, double)>& system,
            state_type& initial_state,
            const std::vector<double>& times,
            double dt_hint,
            std::function<void(const state_type&, double)> observer,
            double abs_error,
            double rel_error) const override;

        std::string getName() const override { return "dopri5"; }
    };

} // namespace crn

#endif // DOPRI5_SOLVER_STRATEGY_HPP
