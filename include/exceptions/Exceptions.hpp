#ifndef EXCEPTIONS_HPP
#define EXCEPTIONS_HPP

#include <stdexcept>
#include <string>
#include <sstream>

namespace crn {

    inline std::string buildErrorMessage(const char* file, int line, const std::string& functionName, const std::string& category, const std::string& message) {
        std::ostringstream oss;
        oss << "[" << file << ":" << line << " (" << functionName << ")] " << category << ": " << message;
        return oss.str();
    }

/**
 * @brief Base exception for reaction network modeling and simulation.
 */
class CrnException : public std::runtime_error {
public:
    /**
     * @brief Construct a CrnException.
     * @param functionName Name of the function where the error occurred.
     * @param message Descriptive error message.
     */
    CrnException(const std::string& functionName, const std::string& message)
        : std::runtime_error("[" + functionName + "] " + message),
          functionName_(functionName), file_(nullptr), line_(0) {}
    CrnException(const char* file, int line, const std::string& functionName, const std::string& category, const std::string& message)
        : std::runtime_error(buildErrorMessage(file, line, functionName, category, message)),
          functionName_(functionName), file_(file), line_(line) {}

    /**
     * @brief Get the originating function's name.
     * @return const std::string& Function name.
     */
    const std::string& getFunctionName() const noexcept {
        return functionName_;
    }
    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

private:
    std::string functionName_;
    const char* file_;
    int line_;
};

/**
 * @brief Exception for malformed reaction networks.
 *
 * Raised for undeclared symbols, negative stoichiometric coefficients,
 * parameters missing at solve time, and custom rate laws that evaluate
 * to a negative value.
 */
class ModelException : public CrnException {
public:
    /**
     * @brief Construct a ModelException.
     * @param functionName Name of the function where the error occurred.
     * @param message Details about the malformed model.
     */
    ModelException(const std::string& functionName, const std::string& message)
        : CrnException(functionName, "Model Error: " + message) {}
    ModelException(const char* file, int line, const std::string& functionName, const std::string& message)
        : CrnException(file, line, functionName, "Model Error", message) {}
};

/**
 * @brief Exception for invalid method parameters.
 */
class InvalidParameterException : public CrnException {
public:
    /**
     * @brief Construct an InvalidParameterException.
     * @param functionName Name of the function where the error occurred.
     * @param message Details about the invalid parameter.
     */
    InvalidParameterException(const std::string& functionName, const std::string& message)
        : CrnException(functionName, "Invalid Parameter: " + message) {}
    InvalidParameterException(const char* file, int line, const std::string& functionName, const std::string& message)
        : CrnException(file, line, functionName, "Invalid Parameter", message) {}
};

/**
 * @brief Exception for simulation errors.
 *
 * Raised when a state update would drive a species count negative, and
 * used to wrap failures reported by the ODE solver.
 */
class SimulationException : public CrnException {
public:
    /**
     * @brief Construct a SimulationException.
     * @param functionName Name of the function where the error occurred.
     * @param message Details about the simulation error.
     */
    SimulationException(const std::string& functionName, const std::string& message)
        : CrnException(functionName, "Simulation Error: " + message) {}
    SimulationException(const char* file, int line, const std::string& functionName, const std::string& message)
        : CrnException(file, line, functionName, "Simulation Error", message) {}
};

/**
 * @brief Exception for file input/output errors.
 */
class FileIOException : public CrnException {
public:
    /**
     * @brief Construct a FileIOException.
     * @param functionName Name of the function where the error occurred.
     * @param message Details about the file I/O error.
     */
    FileIOException(const std::string& functionName, const std::string& message)
        : CrnException(functionName, "File IO Error: " + message) {}
};

/**
 * @brief Exception for data parsing or format errors.
 */
class DataFormatException : public CrnException {
public:
    /**
     * @brief Construct a DataFormatException.
     * @param functionName Name of the function where the error occurred.
     * @param message Details about the formatting error.
     */
    DataFormatException(const std::string& functionName, const std::string& message)
        : CrnException(functionName, "Data Format Error: " + message) {}
};

/**
 * @brief Exception for invalid simulation results.
 */
class InvalidResultException : public CrnException {
public:
    /**
     * @brief Construct an InvalidResultException.
     * @param functionName Name of the function where the error occurred.
     * @param message Details about the invalid result.
     */
    InvalidResultException(const std::string& functionName, const std::string& message)
        : CrnException(functionName, "Invalid Result: " + message) {}
};

} // namespace crn

#define THROW_INVALID_PARAM(func, msg) throw crn::InvalidParameterException(__FILE__, __LINE__, func, msg)
#define THROW_SIMULATION_ERROR(func, msg) throw crn::SimulationException(__FILE__, __LINE__, func, msg)
#define THROW_MODEL_ERROR(func, msg) throw crn::ModelException(__FILE__, __LINE__, func, msg)

#endif // EXCEPTIONS_HPP
