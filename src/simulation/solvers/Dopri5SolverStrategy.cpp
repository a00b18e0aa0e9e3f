#include "simulation/solvers/Dopri5SolverStrategy.hpp"
#include "exceptions/Exceptions.hpp"
#include <boost/numeric/odeint.hpp>

namespace crn {

void Dopri5SolverStrategy::integrate(
    const std::function<void(const state_type&, state_type&, double)>& system,
    state_type& initial_state,
    const std::vector<double>& times,
    double dt_hint,
    std::function<void(const state_type&, double)> observer,
    double abs_error,
    double rel_error) const
{
    namespace odeint = boost::numeric::odeint;
    try {
        odeint::integrate_times(
            odeint::make_controlled<odeint::runge_kutta_dopri5<state_type>>(abs_error, rel_error),
            system,
            initial_state,
            times.begin(), times.end(),
            dt_hint,
            observer
        );
    } catch (const CrnException&) {
        throw;
    } catch (const std::exception& e) {
        throw SimulationException("Dopri5SolverStrategy::integrate", "Boost.Odeint integration failed: " + std::string(e.what()));
    }
}

} // namespace crn
