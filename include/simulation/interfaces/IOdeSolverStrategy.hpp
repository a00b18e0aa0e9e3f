#ifndef I_ODE_SOLVER_STRATEGY_HPP
#define I_ODE_SOLVER_STRATEGY_HPP

#include "network/NetworkTypes.hpp"
#include <functional>
#include <string>
#include <vector>

namespace crn {

/**
 * @brief Interface for ODE integration strategies.
 *
 * Lets DeterministicSimulator switch between Boost.Odeint steppers
 * without knowing which one is in use.
 */
class IOdeSolverStrategy {
public:
    virtual ~IOdeSolverStrategy() = default;

    /**
     * @brief Integrates the system and reports the state at each requested time.
     *
     * @param system Derivative function (x, dxdt, t).
     * @param initial_state State at `times.front()`; holds the final state on return.
     * @param times Strictly increasing output times.
     * @param dt_hint Initial step size for the adaptive controller.
     * @param observer Called once per entry of `times` with (x, t).
     * @param abs_error Absolute error tolerance.
     * @param rel_error Relative error tolerance.
     *
     * @throws SimulationException If integration fails.
     */
    virtual void integrate(
        const std::function<void(const state_type&, state_type&, double)>& system,
        state_type& initial_state,
        const std::vector<double>& times,
        double dt_hint,
        std::function<void(const state_type&, double)> observer,
        double abs_error,
        double rel_error) const = 0;

    /** @brief Short stepper name used in logs. */
    virtual std::string getName() const = 0;
};

} // namespace crn

#endif // I_ODE_SOLVER_STRATEGY_HPP
