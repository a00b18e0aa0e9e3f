#include "simulation/solvers/CashKarpSolverStrategy.hpp"
#include "exceptions/Exceptions.hpp"
#include <boost/numeric/odeint.hpp>

namespace crn {

void CashKarpSolverStrategy::integrate(
    const std::function<void(const state_type&, state_type&, double)>& system,
    state_type& initial_state,
    const std::vector<double>& times,
    double dt_hint,
    std::function<void(const state_type&, double)> observer,
    double abs_error,
    double rel_error) const
{
    using stepper_type = boost::numeric::odeint::runge_kutta_cash_karp54<state_type>;
    auto controlled_stepper = boost::numeric::odeint::make_controlled<stepper_type>(abs_error, rel_error);
    try {
        boost::numeric::odeint::integrate_times(controlled_stepper, system, initial_state,
                                                times.begin(), times.end(), dt_hint, observer);
    } catch (const CrnException&) {
        // Rate-law failures keep their own type.
        throw;
    } catch (const std::exception& e) {
        throw SimulationException("CashKarpSolverStrategy::integrate",
                                  "Boost.Odeint integration failed: " + std::string(e.what()));
    }
}

} // namespace crn
