#include "exceptions/GraphReadException.hpp"
#include <string>

namespace dissim {

    GraphReadException::GraphReadException(ErrorType type, const std::string& functionName, const std::string& details)
    : DataFormatException(functionName, createMessage(type, details)),
      errorType(type) {}

    GraphReadException::ErrorType GraphReadException::getErrorType() const noexcept {
        return errorType;
    }

    std::string GraphReadException::createMessage(ErrorType type, const std::string& details) {
        std::string baseMsg;
        switch (type) {
            case ErrorType::FileOpenError:
                baseMsg = "Could not open file";
                break;
            case ErrorType::SyntaxError:
                baseMsg = "Malformed graph file";
                break;
            case ErrorType::MissingAttribute:
                baseMsg = "Missing attribute";
                break;
            case ErrorType::InvalidNumberFormat:
                baseMsg = "Invalid number format";
                break;
            default:
                 baseMsg = "Unknown graph read error";
                 break;
        }
        return baseMsg + (details.empty() ? "" : ": " + details); 
    }
}
