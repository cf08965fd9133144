/**
 * @file Logger.hpp
 * @brief Centralized logging with per-facility verbosity
 *
 * Every component owns a Logger named after itself (its facility). All
 * output goes through outputMessage(), which holds the single verbosity
 * check and the single console write.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace poprelief {

/**
 * @brief Log levels
 *
 * Level 1: Errors (run is aborted)
 * Level 2: Warnings (something was skipped)
 * Level 3: Information (stage progress)
 * Level 4: Detailed information (codepath execution)
 * Level 5: Basic debugging (objects, sizes)
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
 * @brief Logger with a single point of output control
 */
class Logger {
public:
    /**
     * @brief Anonymous logger using the global default level
     */
    Logger();

    /**
     * @brief Logger for a named facility
     * @param component_name Facility name used for level lookup
     */
    explicit Logger(const std::string& component_name);

    /**
     * @brief Logger with explicit level and optional file output
     * @param level Initial log level
     * @param log_file Optional path to log file (appends if exists)
     */
    Logger(LogLevel level, const std::optional<std::string>& log_file = std::nullopt);

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Output a message if it passes the effective level
     *
     * Repeats of the previous message are counted instead of printed and
     * summarized when a different message arrives or on flush.
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    void setLogLevel(LogLevel level) {
        current_level_ = level;
        level_explicit_ = true;
    }
    LogLevel getLogLevel() const { return current_level_; }

    /**
     * @brief Set or change the log file
     * @param log_file Path to log file, or nullopt to disable file logging
     */
    void setLogFile(const std::optional<std::string>& log_file);

    bool shouldOutput(LogLevel level) const {
        return static_cast<int>(level) <= static_cast<int>(getEffectiveLevel());
    }

    void error(const std::string& message) const { outputMessage(LogLevel::ERROR, message); }
    void warning(const std::string& message) const { outputMessage(LogLevel::WARNING, message); }
    void info(const std::string& message) const { outputMessage(LogLevel::INFO, message); }
    void detailed(const std::string& message) const { outputMessage(LogLevel::DETAILED, message); }
    void debug(const std::string& message) const { outputMessage(LogLevel::DEBUG, message); }

    void trace(const std::string& message) const {
        outputMessage(LogLevel::TRACE, message);
        flush();
    }

    /**
     * @brief Flush console and file output, emitting any pending repeat summary
     */
    void flush() const;

    // ========================================================================
    // Facility registry
    // ========================================================================

    /**
     * @brief Set log level for one facility
     *
     * @example
     * Logger::setFacilityLevel("TerrainProcessor", LogLevel::TRACE);
     */
    static void setFacilityLevel(const std::string& facility, LogLevel level);

    /**
     * @brief Set the level used by facilities without their own setting
     */
    static void setDefaultLevel(LogLevel level);

    static LogLevel getDefaultLevel();

    /**
     * @brief Level for a facility (falls back to the default level)
     */
    static LogLevel getFacilityLevel(const std::string& facility);

    /**
     * @brief Apply a log specification
     *
     * Accepted forms:
     * - "5" sets the default to DEBUG
     * - "RasterCompositor=6,BoundaryLoader=4" sets facility levels
     * - "4,PNGExporter=6" mixes both; "default=2" is also accepted
     *
     * Levels are clamped to 1..6. Malformed entries are reported on stderr
     * and skipped.
     *
     * @return Number of entries applied
     */
    static int parseLogConfig(const std::string& config);

    /**
     * @brief Forget all facility-specific levels
     */
    static void clearFacilityLevels();

    /**
     * @brief Facility level if set, else the instance level if changed from
     * the constructor default, else the global default
     */
    LogLevel getEffectiveLevel() const;

private:
    LogLevel current_level_;
    bool level_explicit_;
    std::string component_name_;
    std::optional<std::string> log_file_path_;
    std::shared_ptr<std::ofstream> file_stream_;
    mutable std::mutex output_mutex_;

    // Repeat collapsing state
    mutable std::string last_message_;
    mutable LogLevel last_level_;
    mutable int repeat_count_;
    mutable bool has_last_message_;

    // Facility registry
    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::optional<std::string> default_log_file_;
    static std::mutex registry_mutex_;

    void initializeFileStream();
    void emitRepeatSummary() const;
    void doOutput(LogLevel level, const std::string& message) const;

public:
    /**
     * @brief Log file used by facility loggers created after this call
     */
    static void setDefaultLogFile(const std::optional<std::string>& log_file);
};

} // namespace poprelief
