#ifndef ENSEMBLE_RUNNER_HPP
#define ENSEMBLE_RUNNER_HPP

#include "simulation/interfaces/IStochasticSimulator.hpp"
#include "simulation/Trajectory.hpp"
#include "exceptions/Exceptions.hpp"
#include <Eigen/Dense>
#include <memory>
#include <string>
#include <vector>

namespace crn {

    /**
     * @brief Per-checkpoint summary of an ensemble.
     *
     * Each matrix has one row per time point and one column per species.
     */
    struct EnsembleStatistics {
        std::vector<double> time_points;
        std::vector<std::string> species_names;
        Eigen::MatrixXd mean;
        Eigen::MatrixXd median;
        Eigen::MatrixXd p05;   ///< 5th percentile.
        Eigen::MatrixXd p95;   ///< 95th percentile.
        int num_trajectories = 0;
    };

    /**
     * @class EnsembleRunner
     * @brief Runs independent stochastic trajectories and reduces them.
     *
     * Run i uses a RandomStream seeded with `base_seed + i`, so an ensemble
     * is reproducible regardless of thread count or scheduling. With
     * parallel execution enabled the runs are distributed over OpenMP
     * threads; they share only the simulator, which is read-only.
     */
    class EnsembleRunner {
    public:
        /**
         * @param simulator Simulator used for every run.
         * @param num_trajectories Number of runs; must be positive.
         * @param base_seed Seed of run 0; must be non-zero, and `base_seed + num_trajectories - 1`
         *                  must not wrap around.
         * @param use_parallel Whether to run trajectories in parallel.
         *
         * @throws InvalidParameterException If `simulator` is null, `num_trajectories < 1`,
         *         or the seed range is invalid.
         */
        EnsembleRunner(std::shared_ptr<const IStochasticSimulator> simulator,
                       int num_trajectories,
                       unsigned long base_seed,
                       bool use_parallel = true);

        /**
         * @brief Simulates the ensemble on a common checkpoint grid.
         *
         * If a run fails, the remaining runs still complete and the failure
         * of the lowest-numbered failing run is rethrown afterwards.
         *
         * @param initial_state Initial counts, shared by all runs.
         * @param parameters Parameter values in declaration order.
         * @param output_time_points Checkpoints; must not be empty.
         * @return std::vector<Trajectory> One trajectory per run, in run order.
         *
         * @throws InvalidParameterException If `output_time_points` is empty.
         * @throws SimulationException, ModelException, InvalidParameterException
         *         Whatever the failing run threw.
         */
        std::vector<Trajectory> run(const Eigen::VectorXd& initial_state,
                                    const Eigen::VectorXd& parameters,
                                    const std::vector<double>& output_time_points) const;

        /**
         * @brief Elementwise mean over an ensemble.
         *
         * @throws InvalidResultException If the ensemble is empty, a trajectory is
         *         invalid, or the trajectories do not share one time grid.
         */
        static Trajectory computeMean(const std::vector<Trajectory>& trajectories);

        /**
         * @brief Mean, median and 5th/95th percentiles per time point and species.
         *
         * @throws InvalidResultException Under the same conditions as computeMean().
         */
        static EnsembleStatistics computeStatistics(const std::vector<Trajectory>& trajectories);

        int getNumTrajectories() const;
        unsigned long getBaseSeed() const;

    private:
        static void checkEnsemble(const std::string& caller, const std::vector<Trajectory>& trajectories);

        std::shared_ptr<const IStochasticSimulator> simulator_;
        int num_trajectories_;
        unsigned long base_seed_;
        bool use_parallel_;
    };

} // namespace crn

#endif // ENSEMBLE_RUNNER_HPP
