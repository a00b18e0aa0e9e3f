#include "simulation/DeterministicSimulator.hpp"
#include "simulation/MassActionOdeSystem.hpp"
#include "utils/TimeGrid.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <functional>
#include <utility>

namespace crn {

    DeterministicSimulator::DeterministicSimulator(std::shared_ptr<const ReactionNetwork> network,
                                                   std::shared_ptr<IOdeSolverStrategy> solver_strategy,
                                                   double start_time,
                                                   double end_time,
                                                   double time_step,
                                                   double abs_error,
                                                   double rel_error)
        : network_(std::move(network)),
          solver_strategy_(std::move(solver_strategy)),
          start_time_(start_time),
          end_time_(end_time),
          time_step_(time_step),
          abs_error_(abs_error),
          rel_error_(rel_error)
    {
        if (!network_) {
            THROW_INVALID_PARAM("DeterministicSimulator::DeterministicSimulator", "Network pointer cannot be null.");
        }
        if (!solver_strategy_) {
            THROW_INVALID_PARAM("DeterministicSimulator::DeterministicSimulator", "Solver strategy pointer cannot be null.");
        }
        if (end_time_ <= start_time_) {
            THROW_INVALID_PARAM("DeterministicSimulator::DeterministicSimulator", "End time must be greater than start time.");
        }
        if (time_step_ <= 0) {
            THROW_INVALID_PARAM("DeterministicSimulator::DeterministicSimulator", "Time step hint must be positive.");
        }
        setErrorTolerance(abs_error, rel_error);
    }

    void DeterministicSimulator::setErrorTolerance(double abs_error, double rel_error) {
        if (abs_error < 0 || rel_error < 0) {
            THROW_INVALID_PARAM("DeterministicSimulator::setErrorTolerance",
                                "Error tolerances cannot be negative. Received: abs_error=" +
                                std::to_string(abs_error) + ", rel_error=" + std::to_string(rel_error));
        }
        abs_error_ = abs_error;
        rel_error_ = rel_error;
    }

    Trajectory DeterministicSimulator::run(const Eigen::VectorXd& initial_state,
                                           const Eigen::VectorXd& parameters,
                                           const std::vector<double>& output_time_points) const {
        if (initial_state.size() != network_->getSpeciesCount()) {
            THROW_INVALID_PARAM("DeterministicSimulator::run",
                                "Initial state size (" + std::to_string(initial_state.size()) +
                                ") does not match species count (" +
                                std::to_string(network_->getSpeciesCount()) + ").");
        }
        if (output_time_points.empty()) {
            THROW_INVALID_PARAM("DeterministicSimulator::run", "Output time points vector cannot be empty.");
        }
        TimeGrid::validate("DeterministicSimulator::run", output_time_points, start_time_, end_time_);

        parameter_type params(parameters.data(), parameters.data() + parameters.size());
        MassActionOdeSystem ode_system(network_, params);

        // The initial state belongs to start_time; integrate from there even if
        // the first requested sample is later.
        std::vector<double> integration_times;
        integration_times.reserve(output_time_points.size() + 1);
        const bool prepend_start = output_time_points.front() > start_time_;
        if (prepend_start) {
            integration_times.push_back(start_time_);
        }
        integration_times.insert(integration_times.end(), output_time_points.begin(), output_time_points.end());

        Trajectory result;
        result.species_names = network_->getSpeciesNames();
        result.time_points.reserve(output_time_points.size());
        result.solution.reserve(output_time_points.size());

        bool skip_next = prepend_start;
        auto observer = [&result, &skip_next](const state_type& x, double t) {
            if (skip_next) {
                skip_next = false;
                return;
            }
            result.time_points.push_back(t);
            result.solution.push_back(x);
        };

        std::function<void(const state_type&, state_type&, double)> system_function =
            [&ode_system](const state_type& x, state_type& dxdt, double t) {
                ode_system(x, dxdt, t);
            };

        state_type x(initial_state.data(), initial_state.data() + initial_state.size());
        try {
            solver_strategy_->integrate(system_function, x, integration_times, time_step_,
                                        observer, abs_error_, rel_error_);
        } catch (const ModelException& e) {
            Logger::getInstance().error("DeterministicSimulator::run", e.what());
            throw;
        } catch (const SimulationException& e) {
            Logger::getInstance().error("DeterministicSimulator::run", e.what());
            throw;
        } catch (const std::exception& e) {
            std::string msg = "Integration failed: " + std::string(e.what());
            Logger::getInstance().error("DeterministicSimulator::run", msg);
            throw SimulationException("DeterministicSimulator::run", msg);
        }

        if (result.time_points.size() != output_time_points.size()) {
            throw SimulationException("DeterministicSimulator::run",
                                      "Solver reported " + std::to_string(result.time_points.size()) +
                                      " samples, expected " + std::to_string(output_time_points.size()) + ".");
        }
        // Report the requested times verbatim.
        result.time_points = output_time_points;

        double most_negative = 0.0;
        for (const auto& state : result.solution) {
            for (double value : state) {
                most_negative = std::min(most_negative, value);
            }
        }
        if (most_negative < -abs_error_) {
            Logger::getInstance().warning("DeterministicSimulator::run",
                                          "Mass-action solution went negative (min " + std::to_string(most_negative) +
                                          "); values are returned unclamped.");
        }

        Logger::getInstance().debug("DeterministicSimulator::run",
                                    "Solved " + std::to_string(network_->getSpeciesCount()) + " equations with " +
                                    solver_strategy_->getName() + " over [" + std::to_string(start_time_) + ", " +
                                    std::to_string(end_time_) + "].");
        return result;
    }

    std::shared_ptr<const ReactionNetwork> DeterministicSimulator::getNetwork() const {
        return network_;
    }

    double DeterministicSimulator::getStartTime() const {
        return start_time_;
    }

    double DeterministicSimulator::getEndTime() const {
        return end_time_;
    }

} // namespace crn
