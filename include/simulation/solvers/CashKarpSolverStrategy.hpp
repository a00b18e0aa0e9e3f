#ifndef CASH_KARP_SOLVER_STRATEGY_HPP
#define CASH_KARP_SOLVER_STRATEGY_HPP

#include "simulation/interfaces/IOdeSolverStrategy.hpp"

namespace crn {

    /**
     * @brief Controlled Cash-Karp 5(4) stepper from Boost.Odeint.
     */
    class CashKarpSolverStrategy : public IOdeSolverStrategy {
    public:
        void integrate(
            const std::function<void(const state_type&, state_type&, double)>& system,
            state_type& initial_state,
            const std::vector<double>& times,
            double dt_hint,
            std::function<void(const state_type&, double)> observer,
            double abs_error,
            double rel_error) const override;

        std::string getName() const override { return "cash_karp"; }
    };

} // namespace crn

#endif // CASH_KARP_SOLVER_STRATEGY_HPP
