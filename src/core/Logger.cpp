/**
 * @file Logger.cpp
 * @brief Implementation of the component logger
 *
 * Copyright (c) 2026 NeuroForge 3D contributors
 * Licensed under the MIT License.
 */

#include "Logger.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace neuroforge {

std::unordered_map<std::string, LogLevel> Logger::facility_levels_;
LogLevel Logger::default_level_ = LogLevel::INFO;
std::mutex Logger::registry_mutex_;

namespace {

constexpr const char* WHITESPACE = " \t\n\r";

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(WHITESPACE);
    if (first == std::string::npos) return "";
    return text.substr(first, text.find_last_not_of(WHITESPACE) - first + 1);
}

// Levels outside 1..6 are clamped; anything that is not a whole integer fails
std::optional<LogLevel> parse_level(const std::string& text) {
    std::istringstream stream(text);
    int value = 0;
    if (text.empty() || !(stream >> value) || !stream.eof()) {
        return std::nullopt;
    }
    return static_cast<LogLevel>(std::clamp(value, 1, 6));
}

// HH:MM:SS.mmm in local time
std::string format_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << millis;
    return out.str();
}

/**
 * Apply one comma-separated entry of a log config string.
 * Caller holds the registry lock.
 */
bool apply_config_entry(const std::string& entry,
                        LogLevel& default_level,
                        std::unordered_map<std::string, LogLevel>& facilities) {
    const size_t equals = entry.find('=');
    const std::string facility = equals == std::string::npos ? "default" : trim(entry.substr(0, equals));
    const std::string level_text = equals == std::string::npos ? entry : trim(entry.substr(equals + 1));

    const auto level = parse_level(level_text);
    if (!level) {
        if (equals == std::string::npos) {
            std::cerr << "Warning: Invalid default log level '" << level_text << "'" << std::endl;
        } else {
            std::cerr << "Warning: Invalid log level '" << level_text
                      << "' for facility '" << facility << "'" << std::endl;
        }
        return false;
    }

    if (facility == "default") {
        default_level = *level;
    } else {
        facilities[facility] = *level;
    }
    return true;
}

} // namespace

const char* to_string(LogLevel level) {
    static constexpr const char* NAMES[] = {"ERROR", "WARNING", "INFO", "DETAILED", "DEBUG", "TRACE"};
    const int index = static_cast<int>(level) - 1;
    return index >= 0 && index < 6 ? NAMES[index] : "UNKNOWN";
}

// ============================================================================
// Construction
// ============================================================================

Logger::Logger(const std::string& component_name, LogObserver observer)
    : current_level_(LogLevel::INFO), explicit_level_(false),
      component_name_(component_name), observer_(std::move(observer)) {
}

Logger::Logger(LogLevel level, const std::optional<std::string>& log_file)
    : current_level_(level), explicit_level_(true), log_file_path_(log_file) {
    openLogFile();
}

Logger::~Logger() {
    flush();
}

void Logger::setLogFile(const std::optional<std::string>& log_file) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    file_stream_.reset();
    log_file_path_ = log_file;
    openLogFile();
}

void Logger::setObserver(LogObserver observer) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    observer_ = std::move(observer);
}

void Logger::openLogFile() {
    if (!log_file_path_) return;

    const std::filesystem::path path(*log_file_path_);
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    auto stream = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!stream->is_open()) {
        // Written to stderr directly; this logger has no working sink yet
        std::cerr << "Warning: Failed to open log file: " << path.string();
        if (ec) std::cerr << " (" << ec.message() << ")";
        std::cerr << std::endl;
        return;
    }
    file_stream_ = std::move(stream);
}

// ============================================================================
// Output
// ============================================================================

void Logger::outputMessage(LogLevel level, const std::string& message) const {
    LogObserver observer;
    {
        std::lock_guard<std::mutex> lock(output_mutex_);
        observer = observer_;
    }

    // Observers receive every message as it happens and do their own filtering
    if (observer) {
        observer(level, component_name_, message);
        return;
    }

    if (!shouldOutput(level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(output_mutex_);

    if (last_.text == message && last_.level == level) {
        ++last_.repeats;
        return;
    }

    flushRepeatSummary();
    writeLine(level, message);
    last_ = LastMessage{message, level, 0};
}

void Logger::flush() const {
    std::lock_guard<std::mutex> lock(output_mutex_);
    flushRepeatSummary();

    if (!observer_) {
        std::cout.flush();
    }
    if (file_stream_) {
        file_stream_->flush();
    }
}

void Logger::flushRepeatSummary() const {
    if (last_.repeats == 0) return;

    std::ostringstream summary;
    summary << "The previous message occurred " << (last_.repeats + 1) << " times.";
    last_.repeats = 0;
    writeLine(last_.level, summary.str());
}

void Logger::writeLine(LogLevel level, const std::string& message) const {
    std::ostringstream line;
    line << "[" << format_timestamp() << "] [" << to_string(level) << "] ";
    if (!component_name_.empty()) {
        line << component_name_ << ": ";
    }
    line << message << "\n";

    // Errors go to stderr so that silent runs keep stdout empty
    std::ostream& console = level == LogLevel::ERROR ? std::cerr : std::cout;
    console << line.str();
    if (file_stream_) {
        *file_stream_ << line.str();
    }
}

// ============================================================================
// Facility-based logging
// ============================================================================

void Logger::setFacilityLevel(const std::string& facility, LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_[facility] = level;
}

void Logger::setDefaultLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    default_level_ = level;
}

LogLevel Logger::getFacilityLevel(const std::string& facility) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto found = facility_levels_.find(facility);
    return found != facility_levels_.end() ? found->second : default_level_;
}

bool Logger::parseLogConfig(const std::string& config) {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    bool all_parsed = true;
    std::istringstream entries(config);
    std::string entry;
    while (std::getline(entries, entry, ',')) {
        entry = trim(entry);
        if (!entry.empty() && !apply_config_entry(entry, default_level_, facility_levels_)) {
            all_parsed = false;
        }
    }
    return all_parsed;
}

void Logger::clearFacilityLevels() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_.clear();
}

LogLevel Logger::getEffectiveLevel() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    if (auto found = facility_levels_.find(component_name_);
        !component_name_.empty() && found != facility_levels_.end()) {
        return found->second;
    }
    return explicit_level_ ? current_level_ : default_level_;
}

} // namespace neuroforge
