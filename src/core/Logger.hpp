/**
 * @file Logger.hpp
 * @brief Facility-based logging with verbosity control
 *
 * Every component owns a Logger named after itself ("TinBuilder",
 * "TowerPlacer", ...). Output goes through exactly one outputMessage()
 * method with one verbosity check, so facility levels configured from the
 * command line apply uniformly.
 */

#pragma once

#include <iostream>
#include <fstream>
#include <memory>
#include <string>
#include <optional>
#include <mutex>
#include <cstdlib>
#include <unordered_map>

namespace survey {

/**
 * @brief Log levels
 *
 * Level 1: Errors (run cannot continue)
 * Level 2: Warnings (a feature was skipped)
 * Level 3: Information (stage summaries)
 * Level 4: Detailed information (codepath execution)
 * Level 5: Basic debugging (per-feature decisions)
 * Level 6: Detailed debugging (variable values)
 */
enum class LogLevel {
    ERROR = 1,
    WARNING = 2,
    INFO = 3,
    DETAILED = 4,
    DEBUG = 5,
    TRACE = 6
};

/**
 * @brief Parse a level given as a number ("5") or a name ("debug")
 */
std::optional<LogLevel> parse_log_level(const std::string& text);

/**
 * @brief Component logger with a single point of output control
 */
class Logger {
public:
    /**
     * @brief Default constructor with WARNING level and no facility
     */
    Logger();

    /**
     * @brief Constructor with facility name
     * @param component_name Facility used for per-component level overrides
     */
    Logger(const std::string& component_name);

    /**
     * @brief Constructor with explicit level and optional file output
     * @param level Initial log level
     * @param log_file Optional path to log file (appends if exists)
     */
    Logger(LogLevel level, const std::optional<std::string>& log_file = std::nullopt);

    /**
     * @brief Destructor - reports pending repeats and flushes
     */
    ~Logger();

    /**
     * @brief Output a message if it meets the effective verbosity level
     *
     * Repeated identical messages are collapsed into one line followed by
     * a repeat count when a different message arrives.
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    void setLogLevel(LogLevel level) { current_level_ = level; }
    LogLevel getLogLevel() const { return current_level_; }

    /**
     * @brief Set or change the instance log file
     * @param log_file Path to log file, or nullopt to disable file logging
     */
    void setLogFile(const std::optional<std::string>& log_file);

    bool shouldOutput(LogLevel level) const {
        return static_cast<int>(level) <= static_cast<int>(getEffectiveLevel());
    }

    void error(const std::string& message) const {
        outputMessage(LogLevel::ERROR, message);
    }

    void warning(const std::string& message) const {
        ++warning_count_;
        outputMessage(LogLevel::WARNING, message);
    }

    void warn(const std::string& message) const {
        warning(message);
    }

    void info(const std::string& message) const {
        outputMessage(LogLevel::INFO, message);
    }

    void detailed(const std::string& message) const {
        outputMessage(LogLevel::DETAILED, message);
    }

    void debug(const std::string& message) const {
        outputMessage(LogLevel::DEBUG, message);
    }

    void trace(const std::string& message) const {
        outputMessage(LogLevel::TRACE, message);
        flush();
    }

    /**
     * @brief Number of warnings issued through this instance (shown or not)
     */
    size_t warningCount() const { return warning_count_; }

    /**
     * @brief Flush console and file output, reporting pending repeats
     */
    void flush() const;

    // ========================================================================
    // Facility-based logging control
    // ========================================================================

    /**
     * @brief Set log level for a specific facility
     *
     * @example
     * Logger::setFacilityLevel("TinBuilder", LogLevel::TRACE);
     */
    static void setFacilityLevel(const std::string& facility, LogLevel level);

    /**
     * @brief Set the fallback level for facilities without an override
     */
    static void setDefaultLevel(LogLevel level);

    static LogLevel getFacilityLevel(const std::string& facility);

    /**
     * @brief Parse and apply log configuration from string
     *
     * Supported forms:
     * - "5" or "debug" sets the default level
     * - "TinBuilder=6,ContourExtractor=info" sets facility levels
     * - "3,TowerPlacer=6" mixes both; "default=4" is an alias for the first form
     *
     * @return false if any token could not be parsed (valid tokens still apply)
     */
    static bool parseLogConfig(const std::string& config);

    /**
     * @brief Send all output of every facility to a file as well (append mode)
     */
    static void setGlobalLogFile(const std::optional<std::string>& log_file);

    static void clearFacilityLevels();

    /**
     * @brief Effective level: facility override, then instance, then default
     */
    LogLevel getEffectiveLevel() const;

private:
    LogLevel current_level_;
    std::string component_name_;
    std::optional<std::string> log_file_path_;
    std::shared_ptr<std::ofstream> file_stream_;
    mutable std::mutex output_mutex_;
    mutable size_t warning_count_ = 0;

    // Message deduplication state
    mutable std::string last_message_;
    mutable LogLevel last_level_;
    mutable int repeat_count_;
    mutable bool has_last_message_;

    // Static facility registry
    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::shared_ptr<std::ofstream> global_file_stream_;
    static std::mutex registry_mutex_;

    void initializeFileStream();
    void doOutput(LogLevel level, const std::string& message) const;
};

} // namespace survey
