#ifndef LOGGER_H
#define LOGGER_H

#include <string>
#include <iostream>
#include <fstream>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <algorithm>
#include <cctype>
#include "exceptions/Exceptions.hpp"

namespace dissim {

/**
 * @enum LogLevel
 * @brief Defines severity levels for log messages.
 */
enum class LogLevel {
    DEBUG,    ///< Detailed debugging information.
    INFO,     ///< General informational messages.
    WARNING,  ///< Indicates potential issues.
    ERROR,    ///< Errors hindering specific operations.
    FATAL     ///< Critical errors halting the program.
};

/**
 * @brief Parses a log level name (case-insensitive).
 * @param name One of debug, info, warning, error, fatal.
 * @return LogLevel The matching level.
 * @throws InvalidParameterException If the name is not a known level.
 */
inline LogLevel parseLogLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "fatal") return LogLevel::FATAL;
    THROW_INVALID_PARAM("parseLogLevel", "Unknown log level '" + name + "'. Valid options are: debug, info, warning, error, fatal");
}

/**
 * @class Logger
 * @brief A thread-safe singleton logger for the simulator.
 *
 * Writes timestamped messages, tagged with severity and source, to the
 * console and optionally to a file. Messages below the configured level
 * are dropped. Trials running on OpenMP worker threads share this instance.
 */
class Logger {
public:
    /**
     * @brief Retrieves the singleton instance of the Logger.
     * @return Logger& Reference to the unique logger instance.
     */
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    /**
     * @brief Sets the minimum severity level for messages to be processed.
     * @param level [in] The minimum LogLevel to output.
     */
    void setLogLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        logLevel_ = level;
    }

    LogLevel getLogLevel() const { return logLevel_; }

    /**
     * @brief Configures file logging.
     *
     * Enables or disables logging to a specified file. The file is opened
     * in append mode; an already open file is closed first.
     *
     * @param enable   [in] True to enable file logging, false to disable.
     * @param filename [in] The path to the log file (used only if enable is true).
     * @return bool True if the requested state was achieved, false if the file could not be opened.
     */
    bool enableFileLogging(bool enable, const std::string& filename = "dissim.log") {
        std::lock_guard<std::mutex> lock(mutex_);
        if (enable) {
            if (logFile_.is_open()) {
                logFile_.close();
            }
            logFile_.open(filename, std::ios::app);
            if (!logFile_.is_open()) {
                std::cerr << formatLogMessage(LogLevel::ERROR, "Logger", "Failed to open log file: " + filename) << std::endl;
                return false;
            }
            writeLocked(formatLogMessage(LogLevel::INFO, "Logger", "File logging enabled to: " + filename));
            return true;
        } else {
            if (logFile_.is_open()) {
                writeLocked(formatLogMessage(LogLevel::INFO, "Logger", "File logging disabled."));
                logFile_.close();
            }
            return true;
        }
    }

    /**
     * @brief Logs a message if its level meets the minimum threshold.
     *
     * @param level   [in] The severity level of the message.
     * @param source  [in] Identifier for the source of the message (e.g., class name, function name).
     * @param message [in] The content of the log message.
     */
    void log(LogLevel level, const std::string& source, const std::string& message) {
        if (level < logLevel_) return;

        std::string formattedMessage = formatLogMessage(level, source, message);

        std::lock_guard<std::mutex> lock(mutex_);
        writeLocked(formattedMessage);
    }

    void debug(const std::string& source, const std::string& message)   { log(LogLevel::DEBUG, source, message); }
    void info(const std::string& source, const std::string& message)    { log(LogLevel::INFO, source, message); }
    void warning(const std::string& source, const std::string& message) { log(LogLevel::WARNING, source, message); }
    void error(const std::string& source, const std::string& message)   { log(LogLevel::ERROR, source, message); }
    void fatal(const std::string& source, const std::string& message)   { log(LogLevel::FATAL, source, message); }

private:
    Logger() : logLevel_(LogLevel::INFO) {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Caller holds mutex_. Errors go to stderr so stdout stays clean for piping.
    void writeLocked(const std::string& formattedMessage) {
        std::ostream& console = (formattedMessage.find("[ERROR]") != std::string::npos ||
                                 formattedMessage.find("[FATAL]") != std::string::npos) ? std::cerr : std::cout;
        console << formattedMessage << std::endl;
        if (logFile_.is_open()) {
            logFile_ << formattedMessage << std::endl;
        }
    }

    /**
     * @brief Formats a log entry with timestamp, level, source, and message.
     */
    std::string formatLogMessage(LogLevel level, const std::string& source, const std::string& message) {
        std::ostringstream oss;
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        oss << std::put_time(std::localtime(&time_t_now), "%Y-%m-%d %H:%M:%S") << " ";

        switch (level) {
            case LogLevel::DEBUG:   oss << "[DEBUG]  "; break;
            case LogLevel::INFO:    oss << "[INFO]   "; break;
            case LogLevel::WARNING: oss << "[WARNING]"; break;
            case LogLevel::ERROR:   oss << "[ERROR]  "; break;
            case LogLevel::FATAL:   oss << "[FATAL]  "; break;
        }

        oss << " [" << source << "] " << message;
        return oss.str();
    }

    LogLevel logLevel_;         ///< Minimum level for messages to be processed.
    std::ofstream logFile_;     ///< Output file stream (if file logging is enabled).
    std::mutex mutex_;          ///< Guards the output streams.
};

} // namespace dissim

#endif // LOGGER_H
