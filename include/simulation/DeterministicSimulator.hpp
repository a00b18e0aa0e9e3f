#ifndef DETERMINISTIC_SIMULATOR_HPP
#define DETERMINISTIC_SIMULATOR_HPP

#include "network/ReactionNetwork.hpp"
#include "simulation/Trajectory.hpp"
#include "simulation/interfaces/IOdeSolverStrategy.hpp"
#include "exceptions/Exceptions.hpp"
#include <Eigen/Dense>
#include <memory>
#include <vector>

namespace crn {

/**
 * @class DeterministicSimulator
 * @brief Integrates the mass-action rate equations of a reaction network.
 *
 * Builds a MassActionOdeSystem for the supplied parameters and hands it to
 * the configured IOdeSolverStrategy. The returned Trajectory contains:
 *  - `time_points`: exactly the requested output times,
 *  - `solution`: the concentrations at those times,
 *  - `species_names`: copied from the network.
 *
 * Concentrations are not clamped. Mass action can drive a species slightly
 * below zero near depletion; when an output value falls below
 * `-abs_error` a warning is logged and the value is returned as computed.
 */
class DeterministicSimulator {
public:
    /**
     * @brief Construct a new DeterministicSimulator.
     *
     * @param network Network to integrate.
     * @param solver_strategy ODE stepper to use.
     * @param start_time Time at which the initial state is given.
     * @param end_time End of the horizon.
     * @param time_step Initial step-size hint for the adaptive stepper.
     * @param abs_error Absolute error tolerance (default: 1.0e-6).
     * @param rel_error Relative error tolerance (default: 1.0e-6).
     *
     * @throws InvalidParameterException If a pointer is null, `end_time <= start_time`,
     *         `time_step <= 0`, or a tolerance is negative.
     */
    DeterministicSimulator(std::shared_ptr<const ReactionNetwork> network,
                           std::shared_ptr<IOdeSolverStrategy> solver_strategy,
                           double start_time,
                           double end_time,
                           double time_step,
                           double abs_error = 1.0e-6,
                           double rel_error = 1.0e-6);

    /**
     * @brief Set new error tolerances for the adaptive stepper.
     * @throws InvalidParameterException If either tolerance is negative.
     */
    void setErrorTolerance(double abs_error, double rel_error);

    /**
     * @brief Solve the rate equations and sample them at the output times.
     *
     * @param initial_state Concentrations at `start_time`, one per species.
     * @param parameters Parameter values in declaration order.
     * @param output_time_points Non-empty, strictly increasing, within [start_time, end_time].
     * @return Trajectory sampled exactly at `output_time_points`.
     *
     * @throws InvalidParameterException If sizes mismatch or the output grid is invalid.
     * @throws ModelException If the parameters are invalid for the network or a custom rate law fails.
     * @throws SimulationException If the ODE stepper fails.
     */
    Trajectory run(const Eigen::VectorXd& initial_state,
                   const Eigen::VectorXd& parameters,
                   const std::vector<double>& output_time_points) const;

    std::shared_ptr<const ReactionNetwork> getNetwork() const;

    double getStartTime() const;
    double getEndTime() const;

private:
    std::shared_ptr<const ReactionNetwork> network_;
    std::shared_ptr<IOdeSolverStrategy> solver_strategy_;
    double start_time_;
    double end_time_;
    ///< Initial step-size hint.
    double time_step_;
    double abs_error_;
    double rel_error_;
};

} // namespace crn

#endif // DETERMINISTIC_SIMULATOR_HPP
