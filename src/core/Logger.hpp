/**
 * @file Logger.hpp
 * @brief Component logger with verbosity control and injectable observer
 *
 * Every pipeline component owns a Logger named after itself. With a
 * caller-supplied observer every message is handed over unfiltered and the
 * observer decides what to keep. Without one, messages pass the verbosity
 * check and repeat collapsing and go to the console (plus an optional log
 * file); ERROR lines go to stderr.
 *
 * Copyright (c) 2026 NeuroForge 3D contributors
 * Licensed under the MIT License.
 */

#pragma once

#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace neuroforge {

/**
 * @brief Log levels
 *
 * Level 1: Errors (mesh rejected, I/O failed)
 * Level 2: Warnings (a repair step could not complete)
 * Level 3: Information (pipeline steps)
 * Level 4: Detailed information (codepath execution)
 * Level 5: Basic debugging (per-loop, per-body details)
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

const char* to_string(LogLevel level);

/**
 * @brief Receives messages in place of the console
 *
 * Arguments are the message level, the emitting component and the text.
 */
using LogObserver = std::function<void(LogLevel, const std::string&, const std::string&)>;

class Logger {
public:
    /**
     * @brief Logger for a named component (facility)
     * @param component_name Facility name used for level overrides
     * @param observer Optional sink; when set it receives every level and
     *        nothing is printed
     */
    explicit Logger(const std::string& component_name, LogObserver observer = {});

    /**
     * @brief Standalone logger with a fixed level and optional file output
     * @param level Threshold for this instance
     * @param log_file Optional path to log file (appends if exists)
     */
    Logger(LogLevel level, const std::optional<std::string>& log_file = std::nullopt);

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Hand a message to the observer, or print it if it meets the
     *        effective verbosity level
     *
     * On the console path consecutive identical messages are collapsed into
     * a single "occurred N times" summary. The observer is called without
     * any lock held, so it may log through this same Logger.
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    void setLogLevel(LogLevel level) {
        current_level_ = level;
        explicit_level_ = true;
    }
    LogLevel getLogLevel() const { return current_level_; }

    void setLogFile(const std::optional<std::string>& log_file);

    void setObserver(LogObserver observer);

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
     * @brief Flush pending duplicate summaries and output buffers
     */
    void flush() const;

    // ========================================================================
    // Facility-based level control
    // ========================================================================

    static void setFacilityLevel(const std::string& facility, LogLevel level);
    static void setDefaultLevel(LogLevel level);
    static LogLevel getFacilityLevel(const std::string& facility);

    /**
     * @brief Parse and apply a level configuration string
     *
     * Accepts a bare default ("5"), facility pairs ("MeshRepairer=6") or both
     * ("3,MeshRepairer=6,default=4").
     *
     * @return false if any token could not be parsed
     */
    static bool parseLogConfig(const std::string& config);

    static void clearFacilityLevels();

    /**
     * @brief Console threshold: facility override, then instance level,
     *        then global default
     */
    LogLevel getEffectiveLevel() const;

private:
    LogLevel current_level_;
    bool explicit_level_;
    std::string component_name_;
    LogObserver observer_;
    std::optional<std::string> log_file_path_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex output_mutex_;

    // Last emitted message and how often it has been repeated since
    struct LastMessage {
        std::optional<std::string> text;
        LogLevel level = LogLevel::INFO;
        int repeats = 0;
    };
    mutable LastMessage last_;

    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::mutex registry_mutex_;

    void openLogFile();
    void flushRepeatSummary() const;
    void writeLine(LogLevel level, const std::string& message) const;
};

} // namespace neuroforge
