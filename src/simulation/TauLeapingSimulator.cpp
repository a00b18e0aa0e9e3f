#include "simulation/TauLeapingSimulator.hpp"
#include "simulation/PropensityEvaluator.hpp"
#include "simulation/TrajectoryRecorder.hpp"
#include "utils/Logger.hpp"
#include <cmath>
#include <utility>

namespace crn {

    TauLeapingSimulator::TauLeapingSimulator(std::shared_ptr<const ReactionNetwork> network,
                                             double start_time,
                                             double end_time,
                                             double tau_step)
        : StochasticSimulator(std::move(network), start_time, end_time), tau_step_(tau_step)
    {
        if (!std::isfinite(tau_step_) || tau_step_ <= 0.0) {
            THROW_INVALID_PARAM("TauLeapingSimulator::TauLeapingSimulator",
                                "Tau step must be positive and finite. Got: " + std::to_string(tau_step_));
        }
    }

    std::string TauLeapingSimulator::getName() const {
        return "tau_leaping";
    }

    double TauLeapingSimulator::getTauStep() const {
        return tau_step_;
    }

    Trajectory TauLeapingSimulator::run(const Eigen::VectorXd& initial_state,
                                        const Eigen::VectorXd& parameters,
                                        const std::vector<double>& output_time_points,
                                        RandomStream& rng) const {
        state_type state;
        parameter_type params;
        prepareRun("TauLeapingSimulator::run", initial_state, parameters, output_time_points, state, params);

        PropensityEvaluator evaluator(network_, KineticsMode::Stochastic);
        TrajectoryRecorder recorder(output_time_points, network_->getSpeciesNames(), start_time_, state);
        std::vector<double> propensities;
        state_type next_state(state.size());

        // Step boundaries closer than this to the horizon are snapped onto it.
        const double snap = 1e-9 * tau_step_;
        const int num_reactions = network_->getReactionCount();

        double t = start_time_;
        long long leaps = 0;

        while (t < end_time_) {
            double t_next = start_time_ + static_cast<double>(leaps + 1) * tau_step_;
            if (t_next > end_time_ - snap) {
                t_next = end_time_;
            }
            const double dt = t_next - t;

            const double a_total = evaluator.evaluate(state, params, propensities);
            if (!std::isfinite(a_total)) {
                THROW_SIMULATION_ERROR("TauLeapingSimulator::run",
                                       "Total propensity is not finite at t = " + std::to_string(t) + ".");
            }

            recorder.beforeJump(t_next, state);
            next_state = state;
            for (int r = 0; r < num_reactions; ++r) {
                const double a = propensities[static_cast<size_t>(r)];
                if (a <= 0.0) continue;
                const unsigned int firings = rng.poisson(a * dt);
                if (firings == 0) continue;
                for (const auto& entry : network_->getReaction(r).net_change) {
                    next_state[static_cast<size_t>(entry.species_index)] +=
                        static_cast<double>(firings) * entry.coefficient;
                }
            }
            checkNonNegative("TauLeapingSimulator::run", next_state, t_next, "Leap");
            state.swap(next_state);

            t = t_next;
            ++leaps;
            recorder.afterJump(t, state);
        }

        Logger::getInstance().debug("TauLeapingSimulator::run",
                                    std::to_string(leaps) + " leaps of " + std::to_string(tau_step_) +
                                    " until t = " + std::to_string(end_time_) + ".");
        return recorder.finish(end_time_, state, leaps);
    }

} // namespace crn
