#ifndef NETWORK_PARSE_EXCEPTION_HPP
#define NETWORK_PARSE_EXCEPTION_HPP

#include "exceptions/Exceptions.hpp"
#include <string>

namespace crn {

/**
 * @brief Exception class for reaction network file errors
 *
 * Represents the syntax errors that can occur when reading a network
 * description file. Semantic errors (undeclared symbols, negative
 * coefficients) are reported by the network builder as ModelException.
 */
class NetworkParseException : public DataFormatException {
public:
    /**
     * @brief Types of parse errors that can occur
     */
    enum class ErrorType {
        FileOpenError,       ///< Failed to open the network file
        UnknownDirective,    ///< Line starts with an unrecognised keyword
        MalformedReaction,   ///< Reaction line lacks ':' or '->'
        InvalidCoefficient,  ///< Stoichiometric coefficient is not an integer
        InvalidNumberFormat, ///< Could not parse a value as a number
        InvalidRateExpression ///< Rate is not a number, name or function call
    };

    /**
     * @brief Constructs a new network parse exception
     *
     * @param type The specific type of error that occurred
     * @param functionName Name of the function where the error occurred
     * @param details Additional information about the error
     */
    NetworkParseException(ErrorType type, const std::string& functionName, const std::string& details);

    /**
     * @brief Get the type of error that occurred
     *
     * @return ErrorType The error type
     */
    ErrorType getErrorType() const noexcept;

private:
    ErrorType errorType; ///< Stores the type of error that occurred

    static std::string createMessage(ErrorType type, const std::string& details);
};

} // namespace crn

#endif // NETWORK_PARSE_EXCEPTION_HPP
