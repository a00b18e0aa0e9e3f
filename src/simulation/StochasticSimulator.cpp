#include "simulation/StochasticSimulator.hpp"
#include "utils/TimeGrid.hpp"
#include <cmath>
#include <utility>

namespace crn {

    StochasticSimulator::StochasticSimulator(std::shared_ptr<const ReactionNetwork> network,
                                             double start_time,
                                             double end_time)
        : network_(std::move(network)), start_time_(start_time), end_time_(end_time)
    {
        if (!network_) {
            THROW_INVALID_PARAM("StochasticSimulator::StochasticSimulator", "Network pointer cannot be null.");
        }
        if (!std::isfinite(start_time_) || !std::isfinite(end_time_)) {
            THROW_INVALID_PARAM("StochasticSimulator::StochasticSimulator", "Start and end time must be finite.");
        }
        if (end_time_ <= start_time_) {
            THROW_INVALID_PARAM("StochasticSimulator::StochasticSimulator", "End time must be greater than start time.");
        }
    }

    std::shared_ptr<const ReactionNetwork> StochasticSimulator::getNetwork() const {
        return network_;
    }

    double StochasticSimulator::getStartTime() const {
        return start_time_;
    }

    double StochasticSimulator::getEndTime() const {
        return end_time_;
    }

    void StochasticSimulator::prepareRun(const std::string& caller,
                                         const Eigen::VectorXd& initial_state,
                                         const Eigen::VectorXd& parameters,
                                         const std::vector<double>& output_time_points,
                                         state_type& state,
                                         parameter_type& params) const {
        if (initial_state.size() != network_->getSpeciesCount()) {
            THROW_INVALID_PARAM(caller,
                                "Initial state size (" + std::to_string(initial_state.size()) +
                                ") does not match species count (" +
                                std::to_string(network_->getSpeciesCount()) + ").");
        }
        for (Eigen::Index i = 0; i < initial_state.size(); ++i) {
            const double value = initial_state(i);
            if (!std::isfinite(value) || value < 0.0 || value != std::floor(value)) {
                THROW_INVALID_PARAM(caller,
                                    "Initial count of '" + network_->getSpeciesNames()[static_cast<size_t>(i)] +
                                    "' must be a non-negative integer. Got: " + std::to_string(value));
            }
        }
        TimeGrid::validate(caller, output_time_points, start_time_, end_time_);

        params.assign(parameters.data(), parameters.data() + parameters.size());
        network_->validateParameters(params);
        state.assign(initial_state.data(), initial_state.data() + initial_state.size());
    }

    void StochasticSimulator::checkNonNegative(const std::string& caller, const state_type& state, double t,
                                               const std::string& cause) const {
        for (size_t s = 0; s < state.size(); ++s) {
            if (state[s] < 0.0) {
                THROW_SIMULATION_ERROR(caller,
                                       cause + " would make '" + network_->getSpeciesNames()[s] +
                                       "' negative (" + std::to_string(state[s]) + ") at t = " +
                                       std::to_string(t) + ".");
            }
        }
    }

} // namespace crn
