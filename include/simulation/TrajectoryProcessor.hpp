#ifndef TRAJECTORY_PROCESSOR_HPP
#define TRAJECTORY_PROCESSOR_HPP

#include "simulation/Trajectory.hpp"
#include "simulation/EnsembleRunner.hpp"
#include <Eigen/Dense>
#include <string>

namespace crn {

    /**
     * @class TrajectoryProcessor
     * @brief Extraction, comparison and CSV export of trajectories.
     */
    class TrajectoryProcessor {
    public:
        /** @brief Deleted default constructor to enforce static utility class behavior. */
        TrajectoryProcessor() = delete;

        /**
         * @brief Time course of one species.
         *
         * @param trajectory Source trajectory.
         * @param species Species name (exact match).
         * @return Eigen::VectorXd One value per time point.
         *
         * @throws InvalidResultException If the trajectory is invalid.
         * @throws InvalidParameterException If the species is not in the trajectory.
         */
        static Eigen::VectorXd getSpeciesData(const Trajectory& trajectory, const std::string& species);

        /**
         * @brief Whole trajectory as a (time points x species) matrix.
         * @throws InvalidResultException If the trajectory is invalid.
         */
        static Eigen::MatrixXd toMatrix(const Trajectory& trajectory);

        /**
         * @brief Elementwise relative deviation |candidate - reference| / max(|reference|, floor).
         *
         * The floor keeps the ratio bounded where the reference is near zero.
         *
         * @throws InvalidResultException If either trajectory is invalid or their
         *         time grids or species differ.
         * @throws InvalidParameterException If `floor` is not positive.
         */
        static Eigen::MatrixXd relativeDeviation(const Trajectory& reference,
                                                 const Trajectory& candidate,
                                                 double floor = 1.0);

        /**
         * @brief Writes `Time,<species...>` rows to a CSV file.
         *
         * @throws InvalidResultException If the trajectory is invalid.
         * @throws FileIOException If the file cannot be opened.
         */
        static void saveTrajectoryToCSV(const Trajectory& trajectory, const std::string& filename);

        /**
         * @brief Writes ensemble statistics, four columns per species
         *        (`<name>_mean,<name>_median,<name>_p05,<name>_p95`).
         *
         * @throws InvalidResultException If the statistics are empty or inconsistent.
         * @throws FileIOException If the file cannot be opened.
         */
        static void saveStatisticsToCSV(const EnsembleStatistics& statistics, const std::string& filename);
    };

} // namespace crn

#endif // TRAJECTORY_PROCESSOR_HPP
