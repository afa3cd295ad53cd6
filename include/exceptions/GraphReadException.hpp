#ifndef GRAPH_READ_EXCEPTION_HPP
#define GRAPH_READ_EXCEPTION_HPP

#include "exceptions/Exceptions.hpp"
#include <stdexcept>
#include <string>

namespace dissim {

/**
 * @brief Exception class for graph file reading errors
 * 
 * Represents the errors that can occur when reading a GML or edge-list
 * file, from file access issues to malformed records.
 */
class GraphReadException : public DataFormatException {
public:
    /**
     * @brief Types of graph reading errors that can occur
     */
    enum class ErrorType {
        FileOpenError,       ///< Failed to open the graph file
        SyntaxError,         ///< Unbalanced brackets, unexpected tokens or truncated records
        MissingAttribute,    ///< A node or edge record lacks a required key
        InvalidNumberFormat  ///< Could not parse an id, source or target as an integer
    };

    /**
     * @brief Constructs a new graph read exception
     * 
     * @param type The specific type of error that occurred
     * @param functionName Name of the function where the error occurred
     * @param details Additional information about the error
     */
    GraphReadException(ErrorType type, const std::string& functionName, const std::string& details);
    
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

} // namespace dissim

#endif // GRAPH_READ_EXCEPTION_HPP
