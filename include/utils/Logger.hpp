#ifndef LOGGER_H
#define LOGGER_H

#include <string>
#include <iostream>
#include <fstream>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <atomic>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace crn {

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
 * @class Logger
 * @brief A thread-safe singleton logger shared by the simulators and the driver.
 *
 * Provides centralized logging to console and optionally to a file. Parallel
 * ensemble runs log through the same instance.
 * Messages are timestamped and categorized by severity level and source.
 * Supports filtering messages based on a minimum log level.
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
     * @brief Returns the current minimum severity level.
     * @return LogLevel The active threshold.
     */
    LogLevel getLogLevel() const {
        return logLevel_;
    }

    /**
     * @brief Sets the minimum severity level for messages to be processed.
     *
     * Messages with a level below this setting will be ignored.
     * @param level [in] The minimum LogLevel to output.
     */
    void setLogLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        logLevel_ = level;
    }

    /**
     * @brief Configures file logging.
     *
     * Enables or disables logging to a specified file. If enabling and the file
     * is already open, it will be closed and reopened (potentially truncating or appending
     * based on default behavior, which is appending here).
     *
     * @param enable   [in] True to enable file logging, false to disable.
     * @param filename [in] The path to the log file (used only if enable is true). Defaults to "reaction_network.log".
     * @return bool True if the requested state (enabled/disabled with file open/closed) was achieved, false on failure (e.g., cannot open file).
     */
    bool enableFileLogging(bool enable, const std::string& filename = "reaction_network.log") {
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
            writeUnlocked(LogLevel::INFO, "Logger", "File logging enabled to: " + filename);
            return true;
        } else {
            if (logFile_.is_open()) {
                writeUnlocked(LogLevel::INFO, "Logger", "File logging disabled.");
                logFile_.close();
            }
            return true; // Disabling is always considered successful
        }
    }

    /**
     * @brief Logs a message if its level meets the minimum threshold.
     *
     * This is the core logging method. It formats the message and outputs
     * it to the console and/or file based on current settings. Thread-safe.
     *
     * @param level   [in] The severity level of the message.
     * @param source  [in] Identifier for the source of the message (e.g., class name, function name).
     * @param message [in] The content of the log message.
     */
    void log(LogLevel level, const std::string& source, const std::string& message) {
        if (level < logLevel_) return;

        // std::localtime shares a static buffer, so formatting happens under the lock too
        std::lock_guard<std::mutex> lock(mutex_);
        writeUnlocked(level, source, message);
    }

    /**
     * @brief Parses a level name ("debug", "info", "warning", "error", "fatal"), case-insensitive.
     * @param name  [in] Level name as found in configuration files.
     * @param level [out] Parsed level, untouched when the name is unknown.
     * @return bool True if the name was recognised.
     */
    static bool parseLogLevel(const std::string& name, LogLevel& level) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "debug") level = LogLevel::DEBUG;
        else if (lower == "info") level = LogLevel::INFO;
        else if (lower == "warning" || lower == "warn") level = LogLevel::WARNING;
        else if (lower == "error") level = LogLevel::ERROR;
        else if (lower == "fatal") level = LogLevel::FATAL;
        else return false;
        return true;
    }

    /** @brief Logs a message with DEBUG level. @param source Source identifier. @param message Message content. */
    void debug(const std::string& source, const std::string& message)   { log(LogLevel::DEBUG, source, message); }
    /** @brief Logs a message with INFO level. @param source Source identifier. @param message Message content. */
    void info(const std::string& source, const std::string& message)    { log(LogLevel::INFO, source, message); }
    /** @brief Logs a message with WARNING level. @param source Source identifier. @param message Message content. */
    void warning(const std::string& source, const std::string& message) { log(LogLevel::WARNING, source, message); }
    /** @brief Logs a message with ERROR level. @param source Source identifier. @param message Message content. */
    void error(const std::string& source, const std::string& message)   { log(LogLevel::ERROR, source, message); }
    /** @brief Logs a message with FATAL level. @param source Source identifier. @param message Message content. */
    void fatal(const std::string& source, const std::string& message)   { log(LogLevel::FATAL, source, message); }

private:
    // Private constructor to enforce singleton pattern.
    Logger() : logLevel_(LogLevel::INFO) {}

    // Prevent copying and assignment.
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Caller must hold mutex_.
    void writeUnlocked(LogLevel level, const std::string& source, const std::string& message) {
        if (level < logLevel_) return;
        std::string formattedMessage = formatLogMessage(level, source, message);
        std::cout << formattedMessage << std::endl;
        if (logFile_.is_open()) {
            logFile_ << formattedMessage << std::endl;
        }
    }

    /**
     * @brief Formats a log entry with timestamp, level, source, and message.
     * @param level   [in] The severity level.
     * @param source  [in] The source identifier.
     * @param message [in] The message content.
     * @return std::string The fully formatted log string.
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

    std::atomic<LogLevel> logLevel_; ///< Minimum level; read without the lock by concurrent simulation runs.
    std::ofstream logFile_;     ///< Output file stream (if file logging is enabled).
    std::mutex mutex_;          ///< Ensures thread safety for log operations.
};

} // namespace crn

#endif // LOGGER_H