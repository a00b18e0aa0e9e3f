#include "simulation/DirectMethodSimulator.hpp"
#include "simulation/PropensityEvaluator.hpp"
#include "simulation/TrajectoryRecorder.hpp"
#include "utils/Logger.hpp"
#include <cmath>
#include <limits>
#include <utility>

namespace crn {

    DirectMethodSimulator::DirectMethodSimulator(std::shared_ptr<const ReactionNetwork> network,
                                                 double start_time,
                                                 double end_time)
        : StochasticSimulator(std::move(network), start_time, end_time) {}

    std::string DirectMethodSimulator::getName() const {
        return "ssa";
    }

    Trajectory DirectMethodSimulator::run(const Eigen::VectorXd& initial_state,
                                          const Eigen::VectorXd& parameters,
                                          const std::vector<double>& output_time_points,
                                          RandomStream& rng) const {
        state_type state;
        parameter_type params;
        prepareRun("DirectMethodSimulator::run", initial_state, parameters, output_time_points, state, params);

        PropensityEvaluator evaluator(network_, KineticsMode::Stochastic);
        TrajectoryRecorder recorder(output_time_points, network_->getSpeciesNames(), start_time_, state);
        std::vector<double> propensities;

        double t = start_time_;
        long long events = 0;

        while (true) {
            const double a_total = evaluator.evaluate(state, params, propensities);
            if (a_total <= 0.0) {
                Logger::getInstance().debug("DirectMethodSimulator::run",
                                            "Absorbing state reached at t = " + std::to_string(t) + ".");
                break;
            }
            if (!std::isfinite(a_total)) {
                THROW_SIMULATION_ERROR("DirectMethodSimulator::run",
                                       "Total propensity is not finite at t = " + std::to_string(t) + ".");
            }

            const double tau = rng.exponential(a_total);
            const int r = PropensityEvaluator::selectReaction(propensities, a_total, rng.uniform());

            double t_next = t + tau;
            // tau below the resolution of t would repeat the current time
            if (t_next <= t) {
                t_next = std::nextafter(t, std::numeric_limits<double>::infinity());
            }
            if (t_next > end_time_) {
                break;
            }

            recorder.beforeJump(t_next, state);
            for (const auto& entry : network_->getReaction(r).net_change) {
                state[static_cast<size_t>(entry.species_index)] += entry.coefficient;
            }
            checkNonNegative("DirectMethodSimulator::run", state, t_next,
                             "Firing reaction '" + network_->getReaction(r).label + "'");

            t = t_next;
            ++events;
            recorder.afterJump(t, state);
        }

        Logger::getInstance().debug("DirectMethodSimulator::run",
                                    std::to_string(events) + " events until t = " + std::to_string(end_time_) + ".");
        return recorder.finish(end_time_, state, events);
    }

} // namespace crn
