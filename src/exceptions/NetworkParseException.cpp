#include "exceptions/NetworkParseException.hpp"
#include <string>

namespace crn {

    NetworkParseException::NetworkParseException(ErrorType type, const std::string& functionName, const std::string& details)
    : DataFormatException(functionName, createMessage(type, details)),
      errorType(type) {}

    NetworkParseException::ErrorType NetworkParseException::getErrorType() const noexcept {
        return errorType;
    }

    std::string NetworkParseException::createMessage(ErrorType type, const std::string& details) {
        std::string baseMsg;
        switch (type) {
            case ErrorType::FileOpenError:
                baseMsg = "Could not open network file";
                break;
            case ErrorType::UnknownDirective:
                baseMsg = "Unknown directive";
                break;
            case ErrorType::MalformedReaction:
                baseMsg = "Malformed reaction";
                break;
            case ErrorType::InvalidCoefficient:
                baseMsg = "Invalid stoichiometric coefficient";
                break;
            case ErrorType::InvalidNumberFormat:
                baseMsg = "Invalid number format";
                break;
            case ErrorType::InvalidRateExpression:
                baseMsg = "Invalid rate expression";
                break;
            default:
                 baseMsg = "Unknown network file error";
                 break;
        }
        return baseMsg + (details.empty() ? "" : ": " + details);
    }
}
