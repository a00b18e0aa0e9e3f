#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <Eigen/Dense>

#include "simulation/DeterministicSimulator.hpp"
#include "simulation/DirectMethodSimulator.hpp"
#include "simulation/TauLeapingSimulator.hpp"
#include "simulation/EnsembleRunner.hpp"
#include "simulation/RandomStream.hpp"
#include "simulation/TrajectoryProcessor.hpp"
#include "simulation/solvers/SolverStrategyFactory.hpp"
#include "utils/FileUtils.hpp"
#include "utils/Logger.hpp"
#include "utils/ReadReactionNetwork.hpp"
#include "utils/ReadSimulationConfiguration.hpp"
#include "utils/TimeGrid.hpp"
#include "exceptions/Exceptions.hpp"
#include "exceptions/NetworkParseException.hpp"

using namespace std;
using namespace crn;

namespace {

    // Runs one stochastic ensemble, writes its files and compares it with the ODE solution when there is one.
    void runEnsemble(const shared_ptr<const IStochasticSimulator>& simulator,
                     const NetworkDescription& description,
                     const SimulationSettings& settings,
                     const vector<double>& checkpoints,
                     unsigned long seed,
                     const Trajectory* ode_solution,
                     const string& prefix) {
        Logger& logger = Logger::getInstance();
        EnsembleRunner runner(simulator, settings.num_trajectories, seed, settings.parallel);
        vector<Trajectory> trajectories = runner.run(description.initial_state, description.parameters, checkpoints);

        EnsembleStatistics stats = EnsembleRunner::computeStatistics(trajectories);
        Trajectory mean = EnsembleRunner::computeMean(trajectories);

        TrajectoryProcessor::saveStatisticsToCSV(stats, FileUtils::getOutputPath(prefix + "_" + simulator->getName() + "_stats.csv"));
        TrajectoryProcessor::saveTrajectoryToCSV(trajectories.front(), FileUtils::getOutputPath(prefix + "_" + simulator->getName() + "_run0.csv"));
        logger.info("main", simulator->getName() + ": mean of " + std::to_string(mean.event_count) + " events per trajectory.");

        if (ode_solution) {
            Eigen::MatrixXd deviation = TrajectoryProcessor::relativeDeviation(*ode_solution, mean);
            logger.info("main", "Max relative deviation between ODE and " + simulator->getName() +
                                " ensemble mean: " + std::to_string(deviation.maxCoeff()));
        }
    }

} // namespace

int main(int argc, char* argv[]) {
    Logger::getInstance().setLogLevel(LogLevel::INFO);
    Logger::getInstance().info("main", "Starting reaction network simulation...");

    try {
        const string settings_path = argc > 1
            ? string(argv[1])
            : FileUtils::joinPaths(FileUtils::getProjectRoot(), "data/config/simulation_settings.txt");
        Logger::getInstance().info("main", "Loading settings from: " + settings_path);
        SimulationSettings settings = readSimulationSettings(settings_path);

        LogLevel level = LogLevel::INFO;
        if (Logger::parseLogLevel(settings.log_level, level)) {
            Logger::getInstance().setLogLevel(level);
        }
        if (!settings.log_file.empty() && !Logger::getInstance().enableFileLogging(true, settings.log_file)) {
            Logger::getInstance().warning("main", "Continuing with console logging only.");
        }

        Logger::getInstance().info("main", "Loading network from: " + settings.network_file);
        NetworkDescription description = readReactionNetwork(settings.network_file);
        Logger::getInstance().debug("main", description.network->toString());

        const vector<double> checkpoints = TimeGrid::linspace(settings.t_start, settings.t_end, settings.num_checkpoints);
        const unsigned long seed = settings.seed != 0 ? settings.seed : RandomStream::makeSeed();
        const string prefix = settings.output_prefix + "_" + description.name;
        Logger::getInstance().info("main", "Horizon [" + std::to_string(settings.t_start) + ", " +
                                           std::to_string(settings.t_end) + "], " +
                                           std::to_string(checkpoints.size()) + " checkpoints, seed " +
                                           std::to_string(seed) + ".");

        unique_ptr<Trajectory> ode_solution;
        if (settings.runsOde()) {
            DeterministicSimulator ode(description.network,
                                       SolverStrategyFactory::create(settings.ode_solver),
                                       settings.t_start, settings.t_end, settings.dt_hint,
                                       settings.abs_error, settings.rel_error);
            ode_solution = std::make_unique<Trajectory>(ode.run(description.initial_state, description.parameters, checkpoints));
            TrajectoryProcessor::saveTrajectoryToCSV(*ode_solution, FileUtils::getOutputPath(prefix + "_ode.csv"));
        }

        if (settings.runsSsa()) {
            auto ssa = make_shared<const DirectMethodSimulator>(description.network, settings.t_start, settings.t_end);
            runEnsemble(ssa, description, settings, checkpoints, seed, ode_solution.get(), prefix);
        }

        if (settings.runsTauLeaping()) {
            auto tau = make_shared<const TauLeapingSimulator>(description.network, settings.t_start,
                                                              settings.t_end, settings.tau_step);
            runEnsemble(tau, description, settings, checkpoints, seed, ode_solution.get(), prefix);
        }

        Logger::getInstance().info("main", "Simulation finished. Results written to " + FileUtils::getOutputPath());
        return 0;
    }
    catch (const NetworkParseException& e) {
        Logger::getInstance().fatal("main", "Network File Error: " + std::string(e.what()));
        cerr << "Critical Error: Failed to read the reaction network. " << e.what() << endl;
        return 1;
    }
    catch (const FileIOException& e) {
        Logger::getInstance().fatal("main", "File IO Error: " + std::string(e.what()));
        cerr << "Critical Error: File operation failed. " << e.what() << endl;
        return 1;
    }
    catch (const DataFormatException& e) {
        Logger::getInstance().fatal("main", "Data Format Error: " + std::string(e.what()));
        cerr << "Critical Error: Invalid settings encountered. " << e.what() << endl;
        return 1;
    }
    catch (const ModelException& e) {
        Logger::getInstance().fatal("main", "Model Error: " + std::string(e.what()));
        cerr << "Critical Error: The reaction network is invalid. " << e.what() << endl;
        return 1;
    }
    catch (const InvalidParameterException& e) {
        Logger::getInstance().fatal("main", "Invalid Parameter Error: " + std::string(e.what()));
        cerr << "Critical Error: Invalid parameter provided. " << e.what() << endl;
        return 1;
    }
    catch (const SimulationException& e) {
        Logger::getInstance().fatal("main", "Simulation Error: " + std::string(e.what()));
        cerr << "Critical Error: Simulation failed. " << e.what() << endl;
        return 1;
    }
    catch (const std::exception& e) {
        Logger::getInstance().fatal("main", "Standard Exception: " + std::string(e.what()));
        cerr << "Error: An unexpected error occurred: " << e.what() << endl;
        return 1;
    }
}
