#ifndef TRAJECTORY_HPP
#define TRAJECTORY_HPP

#include "network/NetworkTypes.hpp"
#include <string>
#include <vector>

namespace crn {

    /**
     * @brief Sampled path of one simulation run.
     *
     * `solution[k]` is the state at `time_points[k]`, one entry per species
     * in network order. Deterministic runs hold concentrations, stochastic
     * runs hold integral counts stored as doubles.
     */
    struct Trajectory {
        /** @brief Sample times, strictly increasing. */
        std::vector<double> time_points;

        /** @brief State vector at each sample time. */
        std::vector<state_type> solution;

        /** @brief Species names, in state-vector order. */
        std::vector<std::string> species_names;

        /** @brief Reaction events (SSA) or leaps (tau-leaping) performed; zero for ODE runs. */
        long long event_count = 0;

        Trajectory() = default;

        /**
         * @brief Checks that the trajectory holds data with consistent sizes.
         * @return true if there is at least one sample and every state matches the species count.
         */
        bool isValid() const {
            if (time_points.empty() || time_points.size() != solution.size()) {
                return false;
            }
            for (const auto& state : solution) {
                if (state.size() != species_names.size()) {
                    return false;
                }
            }
            return true;
        }
    };

} // namespace crn

#endif // TRAJECTORY_HPP
