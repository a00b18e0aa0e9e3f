#ifndef STOCHASTIC_SIMULATOR_HPP
#define STOCHASTIC_SIMULATOR_HPP

#include "simulation/interfaces/IStochasticSimulator.hpp"
#include "exceptions/Exceptions.hpp"
#include <memory>
#include <string>
#include <vector>

namespace crn {

/**
 * @class StochasticSimulator
 * @brief Base class for the stochastic simulators.
 *
 * Holds the network and horizon and implements the input checks shared by
 * the Direct Method and tau-leaping. Derived classes implement run().
 */
class StochasticSimulator : public IStochasticSimulator {
public:
    /**
     * @throws InvalidParameterException If `network` is null, a bound is not
     *         finite, or `end_time <= start_time`.
     */
    StochasticSimulator(std::shared_ptr<const ReactionNetwork> network,
                        double start_time,
                        double end_time);

    std::shared_ptr<const ReactionNetwork> getNetwork() const override;
    double getStartTime() const override;
    double getEndTime() const override;

protected:
    /**
     * @brief Validates the inputs of one run and converts them to std::vector form.
     *
     * @throws InvalidParameterException If the initial state has the wrong
     *         size or holds a negative or non-integral count, or the
     *         checkpoints are invalid for the horizon.
     * @throws ModelException If the parameters fail network validation.
     */
    void prepareRun(const std::string& caller,
                    const Eigen::VectorXd& initial_state,
                    const Eigen::VectorXd& parameters,
                    const std::vector<double>& output_time_points,
                    state_type& state,
                    parameter_type& params) const;

    /**
     * @brief Throws SimulationException naming the first negative species in `state`.
     */
    void checkNonNegative(const std::string& caller, const state_type& state, double t,
                          const std::string& cause) const;

    std::shared_ptr<const ReactionNetwork> network_;
    double start_time_;
    double end_time_;
};

} // namespace crn

#endif // STOCHASTIC_SIMULATOR_HPP
