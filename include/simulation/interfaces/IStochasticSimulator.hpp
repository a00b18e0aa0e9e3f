#ifndef I_STOCHASTIC_SIMULATOR_HPP
#define I_STOCHASTIC_SIMULATOR_HPP

#include "network/ReactionNetwork.hpp"
#include "simulation/RandomStream.hpp"
#include "simulation/Trajectory.hpp"
#include <Eigen/Dense>
#include <memory>
#include <string>
#include <vector>

namespace crn {

/**
 * @class IStochasticSimulator
 * @brief Interface for simulators of the chemical master equation.
 *
 * A simulator is configured with a network and a horizon and is itself
 * stateless between calls: every call to run() works on its own copy of the
 * state and draws only from the stream it is handed. One instance can
 * therefore serve all runs of an ensemble, in parallel.
 */
class IStochasticSimulator {
public:
    virtual ~IStochasticSimulator() = default;

    /**
     * @brief Simulates one trajectory.
     *
     * @param initial_state Non-negative integer counts at the start time.
     * @param parameters Parameter values in declaration order.
     * @param output_time_points Checkpoints at which the state is recorded.
     *        When empty, every event is recorded instead.
     * @param rng Random stream owned by this run.
     * @return Trajectory The recorded path.
     *
     * @throws InvalidParameterException If the inputs are malformed.
     * @throws ModelException If parameters are invalid or a custom rate law fails.
     * @throws SimulationException If a state update would make a count negative.
     */
    virtual Trajectory run(const Eigen::VectorXd& initial_state,
                           const Eigen::VectorXd& parameters,
                           const std::vector<double>& output_time_points,
                           RandomStream& rng) const = 0;

    /** @brief Method name used in logs and output file names. */
    virtual std::string getName() const = 0;

    virtual std::shared_ptr<const ReactionNetwork> getNetwork() const = 0;

    virtual double getStartTime() const = 0;

    virtual double getEndTime() const = 0;
};

} // namespace crn

#endif // I_STOCHASTIC_SIMULATOR_HPP
