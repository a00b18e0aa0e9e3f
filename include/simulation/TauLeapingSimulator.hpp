#ifndef TAU_LEAPING_SIMULATOR_HPP
#define TAU_LEAPING_SIMULATOR_HPP

#include "simulation/StochasticSimulator.hpp"

namespace crn {

/**
 * @class TauLeapingSimulator
 * @brief Explicit tau-leaping with a fixed step.
 *
 * Every step draws k_r ~ Poisson(a_r * dt) independently for each reaction,
 * from the propensities at the start of the step, and applies
 * sum_r k_r * netChange_r at once. Steps are taken at start + n*dt; the
 * final step is shortened so that the run ends exactly at the horizon.
 *
 * A leap that would make any count negative raises SimulationException.
 * There is no clamping and no retry with a smaller step.
 */
class TauLeapingSimulator : public StochasticSimulator {
public:
    /**
     * @param network Network to simulate.
     * @param start_time Start of the horizon.
     * @param end_time End of the horizon.
     * @param tau_step Leap length; must be positive and finite.
     *
     * @throws InvalidParameterException If an argument is invalid.
     */
    TauLeapingSimulator(std::shared_ptr<const ReactionNetwork> network,
                        double start_time,
                        double end_time,
                        double tau_step);

    Trajectory run(const Eigen::VectorXd& initial_state,
                   const Eigen::VectorXd& parameters,
                   const std::vector<double>& output_time_points,
                   RandomStream& rng) const override;

    std::string getName() const override;

    double getTauStep() const;

private:
    double tau_step_;
};

} // namespace crn

#endif // TAU_LEAPING_SIMULATOR_HPP
