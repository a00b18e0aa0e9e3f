#ifndef DIRECT_METHOD_SIMULATOR_HPP
#define DIRECT_METHOD_SIMULATOR_HPP

#include "simulation/StochasticSimulator.hpp"

namespace crn {

/**
 * @class DirectMethodSimulator
 * @brief Exact stochastic simulation with Gillespie's Direct Method.
 *
 * Each iteration evaluates all propensities, draws the waiting time
 * tau = -ln(u1) / a_total and the firing reaction by the cumulative-sum
 * rule on u2 * a_total, then applies that reaction's net change. A jump
 * that would land beyond the horizon is not applied. When the total
 * propensity is zero the state is absorbing and is held to the horizon.
 *
 * Recorded event times are strictly increasing.
 */
class DirectMethodSimulator : public StochasticSimulator {
public:
    /**
     * @param network Network to simulate.
     * @param start_time Start of the horizon.
     * @param end_time End of the horizon.
     *
     * @throws InvalidParameterException If `network` is null or `end_time <= start_time`.
     */
    DirectMethodSimulator(std::shared_ptr<const ReactionNetwork> network,
                          double start_time,
                          double end_time);

    Trajectory run(const Eigen::VectorXd& initial_state,
                   const Eigen::VectorXd& parameters,
                   const std::vector<double>& output_time_points,
                   RandomStream& rng) const override;

    std::string getName() const override;
};

} // namespace crn

#endif // DIRECT_METHOD_SIMULATOR_HPP
