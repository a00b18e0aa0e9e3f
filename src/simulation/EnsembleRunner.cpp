#include "simulation/EnsembleRunner.hpp"
#include "simulation/RandomStream.hpp"
#include "utils/Logger.hpp"
#include <gsl/gsl_statistics.h>
#include <omp.h>
#include <algorithm>
#include <exception>
#include <iterator>
#include <limits>
#include <utility>

namespace crn {

    EnsembleRunner::EnsembleRunner(std::shared_ptr<const IStochasticSimulator> simulator,
                                   int num_trajectories,
                                   unsigned long base_seed,
                                   bool use_parallel)
        : simulator_(std::move(simulator)),
          num_trajectories_(num_trajectories),
          base_seed_(base_seed),
          use_parallel_(use_parallel)
    {
        if (!simulator_) {
            THROW_INVALID_PARAM("EnsembleRunner::EnsembleRunner", "Simulator pointer cannot be null.");
        }
        if (num_trajectories_ < 1) {
            THROW_INVALID_PARAM("EnsembleRunner::EnsembleRunner",
                                "Number of trajectories must be positive. Got: " + std::to_string(num_trajectories_));
        }
        // gsl_rng_set maps seed 0 onto the generator default, which would alias another run.
        const unsigned long last_offset = static_cast<unsigned long>(num_trajectories_ - 1);
        if (base_seed_ == 0 || base_seed_ > std::numeric_limits<unsigned long>::max() - last_offset) {
            THROW_INVALID_PARAM("EnsembleRunner::EnsembleRunner",
                                "Seeds base_seed .. base_seed + " + std::to_string(last_offset) +
                                " must be non-zero without wrapping. Got base_seed: " + std::to_string(base_seed_));
        }
    }

    std::vector<Trajectory> EnsembleRunner::run(const Eigen::VectorXd& initial_state,
                                                const Eigen::VectorXd& parameters,
                                                const std::vector<double>& output_time_points) const {
        if (output_time_points.empty()) {
            THROW_INVALID_PARAM("EnsembleRunner::run", "Ensembles need a common, non-empty checkpoint grid.");
        }

        Logger& logger = Logger::getInstance();
        logger.info("EnsembleRunner::run",
                    "Running " + std::to_string(num_trajectories_) + " " + simulator_->getName() +
                    " trajectories (base seed " + std::to_string(base_seed_) +
                    (use_parallel_ ? ", up to " + std::to_string(omp_get_max_threads()) + " threads)" : ", sequential)"));

        std::vector<Trajectory> trajectories(static_cast<size_t>(num_trajectories_));
        std::vector<std::exception_ptr> failures(static_cast<size_t>(num_trajectories_));

        #pragma omp parallel for if(use_parallel_) schedule(dynamic)
        for (int i = 0; i < num_trajectories_; ++i) {
            try {
                RandomStream rng(base_seed_ + static_cast<unsigned long>(i));
                trajectories[static_cast<size_t>(i)] =
                    simulator_->run(initial_state, parameters, output_time_points, rng);
            } catch (...) {
                // Exceptions must not leave an OpenMP region; rethrown below.
                failures[static_cast<size_t>(i)] = std::current_exception();
            }
        }

        auto first_failure = std::find_if(failures.begin(), failures.end(),
                                          [](const std::exception_ptr& p) { return static_cast<bool>(p); });
        if (first_failure != failures.end()) {
            const auto failed = std::count_if(failures.begin(), failures.end(),
                                              [](const std::exception_ptr& p) { return static_cast<bool>(p); });
            logger.error("EnsembleRunner::run",
                         std::to_string(failed) + " of " + std::to_string(num_trajectories_) +
                         " trajectories failed; rethrowing the failure of run " +
                         std::to_string(std::distance(failures.begin(), first_failure)) + ".");
            std::rethrow_exception(*first_failure);
        }
        return trajectories;
    }

    void EnsembleRunner::checkEnsemble(const std::string& caller, const std::vector<Trajectory>& trajectories) {
        if (trajectories.empty()) {
            throw InvalidResultException(caller, "Ensemble is empty.");
        }
        const Trajectory& reference = trajectories.front();
        for (size_t k = 0; k < trajectories.size(); ++k) {
            const Trajectory& trajectory = trajectories[k];
            if (!trajectory.isValid()) {
                throw InvalidResultException(caller, "Trajectory " + std::to_string(k) + " is invalid or empty.");
            }
            if (trajectory.time_points != reference.time_points ||
                trajectory.species_names != reference.species_names) {
                throw InvalidResultException(caller,
                                             "Trajectory " + std::to_string(k) +
                                             " does not share the time grid and species of trajectory 0.");
            }
        }
    }

    Trajectory EnsembleRunner::computeMean(const std::vector<Trajectory>& trajectories) {
        checkEnsemble("EnsembleRunner::computeMean", trajectories);

        const Trajectory& reference = trajectories.front();
        Trajectory mean;
        mean.time_points = reference.time_points;
        mean.species_names = reference.species_names;
        mean.solution.assign(reference.solution.size(), state_type(reference.species_names.size(), 0.0));

        for (const auto& trajectory : trajectories) {
            for (size_t k = 0; k < trajectory.solution.size(); ++k) {
                for (size_t s = 0; s < trajectory.solution[k].size(); ++s) {
                    mean.solution[k][s] += trajectory.solution[k][s];
                }
            }
            mean.event_count += trajectory.event_count;
        }
        const double n = static_cast<double>(trajectories.size());
        for (auto& state : mean.solution) {
            for (auto& value : state) {
                value /= n;
            }
        }
        mean.event_count /= static_cast<long long>(trajectories.size());
        return mean;
    }

    EnsembleStatistics EnsembleRunner::computeStatistics(const std::vector<Trajectory>& trajectories) {
        checkEnsemble("EnsembleRunner::computeStatistics", trajectories);

        const Trajectory& reference = trajectories.front();
        const size_t num_times = reference.time_points.size();
        const size_t num_species = reference.species_names.size();
        const size_t n = trajectories.size();

        EnsembleStatistics stats;
        stats.time_points = reference.time_points;
        stats.species_names = reference.species_names;
        stats.num_trajectories = static_cast<int>(n);
        stats.mean.resize(static_cast<Eigen::Index>(num_times), static_cast<Eigen::Index>(num_species));
        stats.median.resizeLike(stats.mean);
        stats.p05.resizeLike(stats.mean);
        stats.p95.resizeLike(stats.mean);

        std::vector<double> data(n);
        for (size_t k = 0; k < num_times; ++k) {
            for (size_t s = 0; s < num_species; ++s) {
                for (size_t i = 0; i < n; ++i) {
                    data[i] = trajectories[i].solution[k][s];
                }
                std::sort(data.begin(), data.end());

                const auto row = static_cast<Eigen::Index>(k);
                const auto col = static_cast<Eigen::Index>(s);
                stats.mean(row, col) = gsl_stats_mean(data.data(), 1, n);
                stats.median(row, col) = gsl_stats_median_from_sorted_data(data.data(), 1, n);
                stats.p05(row, col) = gsl_stats_quantile_from_sorted_data(data.data(), 1, n, 0.05);
                stats.p95(row, col) = gsl_stats_quantile_from_sorted_data(data.data(), 1, n, 0.95);
            }
        }
        return stats;
    }

    int EnsembleRunner::getNumTrajectories() const {
        return num_trajectories_;
    }

    unsigned long EnsembleRunner::getBaseSeed() const {
        return base_seed_;
    }

} // namespace crn
