#ifndef TRAJECTORY_RECORDER_HPP
#define TRAJECTORY_RECORDER_HPP

#include "simulation/Trajectory.hpp"
#include <string>
#include <vector>

namespace crn {

    /**
     * @class TrajectoryRecorder
     * @brief Records a piecewise-constant jump path either per event or at checkpoints.
     *
     * Checkpoint mode: the state at checkpoint c is the state after every jump
     * with time <= c (right-continuous path). The simulator calls
     * beforeJump(t_jump, state) with the state that holds up to t_jump; all
     * checkpoints strictly before t_jump are filled with it. finish() fills
     * the remaining checkpoints with the final state.
     *
     * Event mode (no checkpoints): the start state, each post-jump state, and
     * the horizon state if the last event happened before the horizon.
     */
    class TrajectoryRecorder {
    public:
        /**
         * @param checkpoints Validated output grid; empty selects event mode.
         * @param species_names Names copied into the trajectory.
         * @param start_time Start of the horizon.
         * @param initial_state State at `start_time`.
         */
        TrajectoryRecorder(const std::vector<double>& checkpoints,
                           const std::vector<std::string>& species_names,
                           double start_time,
                           const state_type& initial_state);

        /** @brief Records checkpoints that precede a jump at `t_jump`. */
        void beforeJump(double t_jump, const state_type& current_state);

        /** @brief Records the post-jump state in event mode. */
        void afterJump(double t, const state_type& new_state);

        /**
         * @brief Completes the recording at the horizon and releases the trajectory.
         */
        Trajectory finish(double end_time, const state_type& final_state, long long event_count);

        bool recordsEvents() const;

    private:
        const std::vector<double>& checkpoints_;
        size_t next_checkpoint_ = 0;
        Trajectory trajectory_;
    };

} // namespace crn

#endif // TRAJECTORY_RECORDER_HPP
