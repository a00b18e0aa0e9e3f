#include "simulation/TrajectoryProcessor.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <limits>

namespace crn {

    Eigen::VectorXd TrajectoryProcessor::getSpeciesData(const Trajectory& trajectory, const std::string& species) {
        if (!trajectory.isValid()) {
            throw InvalidResultException("TrajectoryProcessor::getSpeciesData", "Trajectory is invalid or empty.");
        }
        auto it = std::find(trajectory.species_names.begin(), trajectory.species_names.end(), species);
        if (it == trajectory.species_names.end()) {
            THROW_INVALID_PARAM("TrajectoryProcessor::getSpeciesData",
                                "Species '" + species + "' is not part of the trajectory.");
        }
        const size_t index = static_cast<size_t>(std::distance(trajectory.species_names.begin(), it));

        Eigen::VectorXd values(static_cast<Eigen::Index>(trajectory.solution.size()));
        for (size_t k = 0; k < trajectory.solution.size(); ++k) {
            values(static_cast<Eigen::Index>(k)) = trajectory.solution[k][index];
        }
        return values;
    }

    Eigen::MatrixXd TrajectoryProcessor::toMatrix(const Trajectory& trajectory) {
        if (!trajectory.isValid()) {
            throw InvalidResultException("TrajectoryProcessor::toMatrix", "Trajectory is invalid or empty.");
        }
        const auto rows = static_cast<Eigen::Index>(trajectory.solution.size());
        const auto cols = static_cast<Eigen::Index>(trajectory.species_names.size());
        Eigen::MatrixXd matrix(rows, cols);
        for (Eigen::Index k = 0; k < rows; ++k) {
            for (Eigen::Index s = 0; s < cols; ++s) {
                matrix(k, s) = trajectory.solution[static_cast<size_t>(k)][static_cast<size_t>(s)];
            }
        }
        return matrix;
    }

    Eigen::MatrixXd TrajectoryProcessor::relativeDeviation(const Trajectory& reference,
                                                           const Trajectory& candidate,
                                                           double floor) {
        if (!(floor > 0.0)) {
            THROW_INVALID_PARAM("TrajectoryProcessor::relativeDeviation", "Floor must be positive.");
        }
        if (!reference.isValid() || !candidate.isValid()) {
            throw InvalidResultException("TrajectoryProcessor::relativeDeviation", "Trajectory is invalid or empty.");
        }
        if (reference.species_names != candidate.species_names ||
            reference.time_points.size() != candidate.time_points.size()) {
            throw InvalidResultException("TrajectoryProcessor::relativeDeviation",
                                         "Trajectories differ in species or number of time points.");
        }
        for (size_t k = 0; k < reference.time_points.size(); ++k) {
            const double tolerance = 1e-9 * std::max(1.0, std::abs(reference.time_points[k]));
            if (std::abs(reference.time_points[k] - candidate.time_points[k]) > tolerance) {
                throw InvalidResultException("TrajectoryProcessor::relativeDeviation",
                                             "Time grids differ at index " + std::to_string(k) + ".");
            }
        }

        const Eigen::ArrayXXd ref = toMatrix(reference).array();
        const Eigen::ArrayXXd cand = toMatrix(candidate).array();
        return ((cand - ref).abs() / ref.abs().max(floor)).matrix();
    }

    void TrajectoryProcessor::saveTrajectoryToCSV(const Trajectory& trajectory, const std::string& filename) {
        if (!trajectory.isValid()) {
            throw InvalidResultException("TrajectoryProcessor::saveTrajectoryToCSV",
                                         "Trajectory is invalid or empty. Cannot save results.");
        }
        std::ofstream file(filename);
        if (!file.is_open()) {
            throw FileIOException("TrajectoryProcessor::saveTrajectoryToCSV", "Could not open file for writing: " + filename);
        }

        file << std::setprecision(std::numeric_limits<double>::max_digits10);
        file << "Time";
        for (const auto& name : trajectory.species_names) {
            file << "," << name;
        }
        file << "\n";
        for (size_t k = 0; k < trajectory.time_points.size(); ++k) {
            file << trajectory.time_points[k];
            for (double value : trajectory.solution[k]) {
                file << "," << value;
            }
            file << "\n";
        }
        Logger::getInstance().info("TrajectoryProcessor::saveTrajectoryToCSV", "Trajectory saved to: " + filename);
    }

    void TrajectoryProcessor::saveStatisticsToCSV(const EnsembleStatistics& statistics, const std::string& filename) {
        const auto rows = static_cast<Eigen::Index>(statistics.time_points.size());
        const auto cols = static_cast<Eigen::Index>(statistics.species_names.size());
        if (rows == 0 || cols == 0 ||
            statistics.mean.rows() != rows || statistics.mean.cols() != cols ||
            statistics.median.rows() != rows || statistics.median.cols() != cols ||
            statistics.p05.rows() != rows || statistics.p05.cols() != cols ||
            statistics.p95.rows() != rows || statistics.p95.cols() != cols) {
            throw InvalidResultException("TrajectoryProcessor::saveStatisticsToCSV",
                                         "Ensemble statistics are empty or inconsistent.");
        }
        std::ofstream file(filename);
        if (!file.is_open()) {
            throw FileIOException("TrajectoryProcessor::saveStatisticsToCSV", "Could not open file for writing: " + filename);
        }

        file << std::setprecision(std::numeric_limits<double>::max_digits10);
        file << "Time";
        for (const auto& name : statistics.species_names) {
            file << "," << name << "_mean," << name << "_median," << name << "_p05," << name << "_p95";
        }
        file << "\n";
        for (Eigen::Index k = 0; k < rows; ++k) {
            file << statistics.time_points[static_cast<size_t>(k)];
            for (Eigen::Index s = 0; s < cols; ++s) {
                file << "," << statistics.mean(k, s)
                     << "," << statistics.median(k, s)
                     << "," << statistics.p05(k, s)
                     << "," << statistics.p95(k, s);
            }
            file << "\n";
        }
        Logger::getInstance().info("TrajectoryProcessor::saveStatisticsToCSV",
                                   "Statistics of " + std::to_string(statistics.num_trajectories) +
                                   " trajectories saved to: " + filename);
    }

} // namespace crn
