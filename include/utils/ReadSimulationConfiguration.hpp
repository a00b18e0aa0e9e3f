#ifndef READ_SIMULATION_CONFIGURATION_HPP
#define READ_SIMULATION_CONFIGURATION_HPP

#include <map>
#include <string>

namespace crn {

    /**
     * @brief Settings of one `crn_simulate` invocation.
     *
     * Defaults apply to every key absent from the settings file.
     */
    struct SimulationSettings {
        std::string network_file = "../networks/gene_expression.crn"; ///< Relative to the settings file.
        double t_start = 0.0;
        double t_end = 100.0;
        int num_checkpoints = 101;            ///< Evenly spaced over [t_start, t_end], ends included.
        std::string method = "all";           ///< ssa, tau_leaping, ode or all.
        int num_trajectories = 100;
        unsigned long seed = 0;               ///< 0 selects a time/pid seed.
        double tau_step = 0.1;
        std::string ode_solver = "dopri5";    ///< dopri5, cash_karp or fehlberg78.
        double abs_error = 1.0e-6;
        double rel_error = 1.0e-6;
        double dt_hint = 0.01;
        bool parallel = true;
        std::string log_level = "INFO";
        std::string log_file;                 ///< Empty disables file logging.
        std::string output_prefix = "crn";

        bool runsSsa() const { return method == "ssa" || method == "all"; }
        bool runsTauLeaping() const { return method == "tau_leaping" || method == "all"; }
        bool runsOde() const { return method == "ode" || method == "all"; }
    };

} // namespace crn

/**
 * @brief Reads `<key> <value>` pairs from a settings file.
 *
 * Lines starting with '#' and blank lines are ignored. Each remaining line
 * must hold exactly one key and one value; a repeated key overrides the
 * earlier value.
 *
 * @param filename Path to the settings file.
 * @return std::map<std::string, std::string> Raw key/value pairs.
 *
 * @throws crn::FileIOException If the file cannot be opened.
 * @throws crn::DataFormatException If a line does not hold exactly two fields.
 */
std::map<std::string, std::string> readSettingsFile(const std::string& filename);

/**
 * @brief Reads and validates simulation settings.
 *
 * Unknown keys are logged as warnings and ignored. `network_file` is
 * resolved relative to the directory of `filename`.
 *
 * @param filename Path to the settings file.
 * @return crn::SimulationSettings The populated settings.
 *
 * @throws crn::FileIOException If the file cannot be opened.
 * @throws crn::DataFormatException If a value is malformed or out of range.
 */
crn::SimulationSettings readSimulationSettings(const std::string& filename);

/**
 * @brief Checks value ranges and enumerations of a settings object.
 * @throws crn::DataFormatException On the first offending field.
 */
void validateSimulationSettings(const crn::SimulationSettings& settings);

#endif // READ_SIMULATION_CONFIGURATION_HPP
