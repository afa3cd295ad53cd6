#ifndef EXCEPTIONS_HPP
#define EXCEPTIONS_HPP

#include <stdexcept>
#include <string>
#include <sstream>

namespace dissim {

    inline std::string buildErrorMessage(const char* file, int line, const std::string& functionName, const std::string& category, const std::string& message) {
        std::ostringstream oss;
        oss << "[" << file << ":" << line << " (" << functionName << ")] " << category << ": " << message;
        return oss.str();
    }
/**
 * @brief Base exception for the disease simulation.
 */
class ModelException : public std::runtime_error {
public:
    /**
     * @brief Construct a ModelException.
     * @param functionName Name of the function where the error occurred.
     * @param message Descriptive error message.
     */
    ModelException(const std::string& functionName, const std::string& message)
        : std::runtime_error("[" + functionName + "] " + message),
          functionName_(functionName), file_(nullptr), line_(0) {}
    ModelException(const char* file, int line, const std::string& functionName, const std::string& category, const std::string& message)
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
 * @brief Exception for invalid configuration values: unknown strategy,
 *        centrality or model names, or numeric values out of range.
 */
class InvalidParameterException : public ModelException {
public:
    InvalidParameterException(const std::string& functionName, const std::string& message)
        : ModelException(functionName, "Invalid Parameter: " + message) {}
    InvalidParameterException(const char* file, int line, const std::string& functionName, const std::string& message)
        : ModelException(file, line, functionName, "Invalid Parameter", message) {}
};

/**
 * @brief Exception for a seed vertex that is absent from the graph,
 *        or that was removed by vaccination.
 */
class InvalidSeedException : public ModelException {
public:
    InvalidSeedException(const std::string& functionName, const std::string& message)
        : ModelException(functionName, "Invalid Seed: " + message) {}
    InvalidSeedException(const char* file, int line, const std::string& functionName, const std::string& message)
        : ModelException(file, line, functionName, "Invalid Seed", message) {}
};

/**
 * @brief Exception for a graph whose vertex or edge sets contradict each other
 *        (duplicate identifiers, edges referencing unknown vertices, self-loops).
 */
class GraphInconsistencyException : public ModelException {
public:
    GraphInconsistencyException(const std::string& functionName, const std::string& message)
        : ModelException(functionName, "Graph Inconsistency: " + message) {}
    GraphInconsistencyException(const char* file, int line, const std::string& functionName, const std::string& message)
        : ModelException(file, line, functionName, "Graph Inconsistency", message) {}
};

/**
 * @brief Exception for failures inside a running trial.
 */
class SimulationException : public ModelException {
public:
    /**
     * @brief Construct a SimulationException.
     * @param functionName Name of the function where the error occurred.
     * @param message Details about the simulation error.
     */
    SimulationException(const std::string& functionName, const std::string& message)
        : ModelException(functionName, "Simulation Error: " + message) {}
};

/**
 * @brief Exception for file input/output errors.
 */
class FileIOException : public ModelException {
public:
    /**
     * @brief Construct a FileIOException.
     * @param functionName Name of the function where the error occurred.
     * @param message Details about the file I/O error.
     */
    FileIOException(const std::string& functionName, const std::string& message)
        : ModelException(functionName, "File IO Error: " + message) {}
};

/**
 * @brief Exception for data parsing or format errors.
 */
class DataFormatException : public ModelException {
public:
    /**
     * @brief Construct a DataFormatException.
     * @param functionName Name of the function where the error occurred.
     * @param message Details about the formatting error.
     */
    DataFormatException(const std::string& functionName, const std::string& message)
        : ModelException(functionName, "Data Format Error: " + message) {}
};

} // namespace dissim

#define THROW_INVALID_PARAM(func, msg) throw dissim::InvalidParameterException(__FILE__, __LINE__, func, msg)
#define THROW_INVALID_SEED(func, msg) throw dissim::InvalidSeedException(__FILE__, __LINE__, func, msg)
#define THROW_GRAPH_INCONSISTENCY(func, msg) throw dissim::GraphInconsistencyException(__FILE__, __LINE__, func, msg)

#endif // EXCEPTIONS_HPP
