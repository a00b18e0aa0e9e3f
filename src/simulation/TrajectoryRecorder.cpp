#include "simulation/TrajectoryRecorder.hpp"
#include <utility>

namespace crn {

    TrajectoryRecorder::TrajectoryRecorder(const std::vector<double>& checkpoints,
                                           const std::vector<std::string>& species_names,
                                           double start_time,
                                           const state_type& initial_state)
        : checkpoints_(checkpoints)
    {
        trajectory_.species_names = species_names;
        if (recordsEvents()) {
            trajectory_.time_points.push_back(start_time);
            trajectory_.solution.push_back(initial_state);
        } else {
            trajectory_.time_points.reserve(checkpoints_.size());
            trajectory_.solution.reserve(checkpoints_.size());
        }
    }

    bool TrajectoryRecorder::recordsEvents() const {
        return checkpoints_.empty();
    }

    void TrajectoryRecorder::beforeJump(double t_jump, const state_type& current_state) {
        while (next_checkpoint_ < checkpoints_.size() && checkpoints_[next_checkpoint_] < t_jump) {
            trajectory_.time_points.push_back(checkpoints_[next_checkpoint_]);
            trajectory_.solution.push_back(current_state);
            ++next_checkpoint_;
        }
    }

    void TrajectoryRecorder::afterJump(double t, const state_type& new_state) {
        if (recordsEvents()) {
            trajectory_.time_points.push_back(t);
            trajectory_.solution.push_back(new_state);
        }
    }

    Trajectory TrajectoryRecorder::finish(double end_time, const state_type& final_state, long long event_count) {
        if (recordsEvents()) {
            if (trajectory_.time_points.back() < end_time) {
                trajectory_.time_points.push_back(end_time);
                trajectory_.solution.push_back(final_state);
            }
        } else {
            while (next_checkpoint_ < checkpoints_.size()) {
                trajectory_.time_points.push_back(checkpoints_[next_checkpoint_]);
                trajectory_.solution.push_back(final_state);
                ++next_checkpoint_;
            }
        }
        trajectory_.event_count = event_count;
        return std::move(trajectory_);
    }

} // namespace crn
