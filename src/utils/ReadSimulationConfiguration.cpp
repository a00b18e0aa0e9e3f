#include "utils/ReadSimulationConfiguration.hpp"
#include "utils/FileUtils.hpp"
#include "utils/Logger.hpp"
#include "exceptions/Exceptions.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {

    const char* const kSource = "readSimulationSettings";

    double parseDouble(const std::string& key, const std::string& value) {
        try {
            size_t consumed = 0;
            const double parsed = std::stod(value, &consumed);
            if (consumed != value.size() || !std::isfinite(parsed)) {
                throw std::invalid_argument(value);
            }
            return parsed;
        } catch (const std::logic_error&) {
            throw crn::DataFormatException(kSource, "Setting '" + key + "' expects a number, got '" + value + "'.");
        }
    }

    long long parseInteger(const std::string& key, const std::string& value) {
        try {
            size_t consumed = 0;
            const long long parsed = std::stoll(value, &consumed);
            if (consumed != value.size()) {
                throw std::invalid_argument(value);
            }
            return parsed;
        } catch (const std::logic_error&) {
            throw crn::DataFormatException(kSource, "Setting '" + key + "' expects an integer, got '" + value + "'.");
        }
    }

    bool parseBool(const std::string& key, const std::string& value) {
        std::string lower = value;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
        if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
        throw crn::DataFormatException(kSource, "Setting '" + key + "' expects a boolean, got '" + value + "'.");
    }

} // namespace

std::map<std::string, std::string> readSettingsFile(const std::string& filename) {
    std::map<std::string, std::string> settings;
    std::ifstream file(filename);
    if (!file.is_open()) {
        crn::Logger::getInstance().error("readSettingsFile", "Error opening settings file: " + filename);
        throw crn::FileIOException("readSettingsFile", "Error opening settings file: " + filename);
    }
    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        line_number++;
        line = FileUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        std::istringstream iss(line);
        std::string key;
        std::string value;
        if (!(iss >> key >> value)) {
            throw crn::DataFormatException("readSettingsFile",
                                           "Missing value on line " + std::to_string(line_number) + ": " + line);
        }
        std::string extra;
        if (iss >> extra && extra[0] != '#') {
            throw crn::DataFormatException("readSettingsFile",
                                           "Too many values on line " + std::to_string(line_number) + ": " + line);
        }
        settings[key] = value;
    }
    return settings;
}

crn::SimulationSettings readSimulationSettings(const std::string& filename) {
    const auto raw = readSettingsFile(filename);
    crn::SimulationSettings settings;
    crn::Logger& logger = crn::Logger::getInstance();

    for (const auto& kv : raw) {
        const std::string& key = kv.first;
        const std::string& value = kv.second;
        if (key == "network_file") settings.network_file = value;
        else if (key == "t_start") settings.t_start = parseDouble(key, value);
        else if (key == "t_end") settings.t_end = parseDouble(key, value);
        else if (key == "num_checkpoints") settings.num_checkpoints = static_cast<int>(parseInteger(key, value));
        else if (key == "method") settings.method = value;
        else if (key == "num_trajectories") settings.num_trajectories = static_cast<int>(parseInteger(key, value));
        else if (key == "seed") {
            const long long seed = parseInteger(key, value);
            if (seed < 0) {
                throw crn::DataFormatException(kSource, "Setting 'seed' must be non-negative.");
            }
            settings.seed = static_cast<unsigned long>(seed);
        }
        else if (key == "tau_step") settings.tau_step = parseDouble(key, value);
        else if (key == "ode_solver") settings.ode_solver = value;
        else if (key == "abs_error") settings.abs_error = parseDouble(key, value);
        else if (key == "rel_error") settings.rel_error = parseDouble(key, value);
        else if (key == "dt_hint") settings.dt_hint = parseDouble(key, value);
        else if (key == "parallel") settings.parallel = parseBool(key, value);
        else if (key == "log_level") settings.log_level = value;
        else if (key == "log_file") settings.log_file = value;
        else if (key == "output_prefix") settings.output_prefix = value;
        else {
            logger.warning(kSource, "Unrecognized setting '" + key + "' in " + filename + ". Ignoring.");
        }
    }

    settings.network_file = FileUtils::resolveRelativeTo(filename, settings.network_file);
    validateSimulationSettings(settings);

    logger.info(kSource, "Read " + std::to_string(raw.size()) + " settings from " + filename);
    return settings;
}

void validateSimulationSettings(const crn::SimulationSettings& settings) {
    if (settings.t_end <= settings.t_start) {
        throw crn::DataFormatException(kSource, "t_end must be greater than t_start.");
    }
    if (settings.num_checkpoints < 2) {
        throw crn::DataFormatException(kSource, "num_checkpoints must be at least 2.");
    }
    if (settings.num_trajectories < 1) {
        throw crn::DataFormatException(kSource, "num_trajectories must be positive.");
    }
    if (settings.tau_step <= 0.0) {
        throw crn::DataFormatException(kSource, "tau_step must be positive.");
    }
    if (settings.dt_hint <= 0.0) {
        throw crn::DataFormatException(kSource, "dt_hint must be positive.");
    }
    if (settings.abs_error < 0.0 || settings.rel_error < 0.0) {
        throw crn::DataFormatException(kSource, "Error tolerances cannot be negative.");
    }
    if (settings.method != "ssa" && settings.method != "tau_leaping" &&
        settings.method != "ode" && settings.method != "all") {
        throw crn::DataFormatException(kSource, "Unknown method '" + settings.method +
                                       "'. Expected ssa, tau_leaping, ode or all.");
    }
    if (settings.ode_solver != "dopri5" && settings.ode_solver != "cash_karp" &&
        settings.ode_solver != "fehlberg78") {
        throw crn::DataFormatException(kSource, "Unknown ode_solver '" + settings.ode_solver +
                                       "'. Expected dopri5, cash_karp or fehlberg78.");
    }
    crn::LogLevel level;
    if (!crn::Logger::parseLogLevel(settings.log_level, level)) {
        throw crn::DataFormatException(kSource, "Unknown log_level '" + settings.log_level + "'.");
    }
    if (settings.output_prefix.empty()) {
        throw crn::DataFormatException(kSource, "output_prefix cannot be empty.");
    }
}
