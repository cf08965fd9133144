/**
 * @file Logger.cpp
 * @brief Implementation of centralized logging
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "Logger.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <sstream>

namespace poprelief {

std::unordered_map<std::string, LogLevel> Logger::facility_levels_;
LogLevel Logger::default_level_ = LogLevel::INFO;
std::optional<std::string> Logger::default_log_file_;
std::mutex Logger::registry_mutex_;

namespace {

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\n\r");
    return s.substr(first, last - first + 1);
}

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARNING: return "WARN ";
        case LogLevel::INFO: return "INFO ";
        case LogLevel::DETAILED: return "DETL ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
    }
    return "?????";
}

} // namespace

Logger::Logger()
    : current_level_(LogLevel::INFO), level_explicit_(false),
      last_level_(LogLevel::INFO), repeat_count_(0), has_last_message_(false) {
}

Logger::Logger(const std::string& component_name)
    : current_level_(LogLevel::INFO), level_explicit_(false), component_name_(component_name),
      last_level_(LogLevel::INFO), repeat_count_(0), has_last_message_(false) {
    std::optional<std::string> log_file;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        log_file = default_log_file_;
    }
    if (log_file.has_value()) {
        log_file_path_ = log_file;
        initializeFileStream();
    }
}

Logger::Logger(LogLevel level, const std::optional<std::string>& log_file)
    : current_level_(level), level_explicit_(true), log_file_path_(log_file),
      last_level_(level), repeat_count_(0), has_last_message_(false) {
    if (log_file.has_value()) {
        initializeFileStream();
    }
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    emitRepeatSummary();
    std::cout.flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::outputMessage(LogLevel level, const std::string& message) const {
    std::lock_guard<std::mutex> lock(output_mutex_);

    if (static_cast<int>(level) <= static_cast<int>(getEffectiveLevel())) {
        if (has_last_message_ && message == last_message_ && level == last_level_) {
            repeat_count_++;
            return;
        }

        emitRepeatSummary();
        doOutput(level, message);

        last_message_ = message;
        last_level_ = level;
        repeat_count_ = 0;
        has_last_message_ = true;
    }
}

void Logger::setLogFile(const std::optional<std::string>& log_file) {
    std::lock_guard<std::mutex> lock(output_mutex_);

    log_file_path_ = log_file;
    if (file_stream_) {
        file_stream_->close();
        file_stream_.reset();
    }
    if (log_file.has_value()) {
        initializeFileStream();
    }
}

void Logger::initializeFileStream() {
    if (!log_file_path_.has_value()) {
        return;
    }

    try {
        std::filesystem::path log_path(log_file_path_.value());
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }

        file_stream_ = std::make_shared<std::ofstream>(log_file_path_.value(), std::ios::app);
        if (!file_stream_->is_open()) {
            // outputMessage would recurse into the broken stream
            std::cerr << "Warning: Failed to open log file: " << log_file_path_.value() << std::endl;
            file_stream_.reset();
        }
    } catch (const std::exception& e) {
        std::cerr << "Warning: Exception opening log file: " << e.what() << std::endl;
        file_stream_.reset();
    }
}

void Logger::emitRepeatSummary() const {
    if (has_last_message_ && repeat_count_ > 0) {
        doOutput(last_level_, "The previous message occurred " +
                              std::to_string(repeat_count_ + 1) + " times.");
        repeat_count_ = 0;
    }
}

void Logger::doOutput(LogLevel level, const std::string& message) const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);
    char timestamp[32];
    std::snprintf(timestamp, sizeof(timestamp), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms.count()));

    std::string prefix = component_name_.empty() ? "" : component_name_ + ": ";

    // ERROR and WARNING go to stderr
    if (level <= LogLevel::WARNING) {
        std::cerr << "[" << timestamp << "] " << level_tag(level) << " " << prefix << message << std::endl;
    } else {
        std::cout << "[" << timestamp << "] " << prefix << message << std::endl;
    }

    if (file_stream_ && file_stream_->is_open()) {
        *file_stream_ << "[" << timestamp << "] " << level_tag(level) << " " << prefix
                      << message << std::endl;
    }
}

void Logger::flush() const {
    std::lock_guard<std::mutex> lock(output_mutex_);
    emitRepeatSummary();
    std::cout.flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

// ============================================================================
// Facility registry
// ============================================================================

void Logger::setFacilityLevel(const std::string& facility, LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_[facility] = level;
}

void Logger::setDefaultLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    default_level_ = level;
}

LogLevel Logger::getDefaultLevel() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return default_level_;
}

void Logger::setDefaultLogFile(const std::optional<std::string>& log_file) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    default_log_file_ = log_file;
}

LogLevel Logger::getFacilityLevel(const std::string& facility) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = facility_levels_.find(facility);
    if (it != facility_levels_.end()) {
        return it->second;
    }
    return default_level_;
}

int Logger::parseLogConfig(const std::string& config) {
    if (config.empty()) return 0;

    std::lock_guard<std::mutex> lock(registry_mutex_);

    std::stringstream ss(config);
    std::string token;
    int applied = 0;

    while (std::getline(ss, token, ',')) {
        token = trim(token);
        if (token.empty()) continue;

        std::string facility;
        std::string level_str = token;

        size_t equals_pos = token.find('=');
        if (equals_pos != std::string::npos) {
            facility = trim(token.substr(0, equals_pos));
            level_str = trim(token.substr(equals_pos + 1));
        }

        int level_int = 0;
        try {
            size_t consumed = 0;
            level_int = std::stoi(level_str, &consumed);
            if (consumed != level_str.size()) {
                throw std::invalid_argument(level_str);
            }
        } catch (const std::exception&) {
            std::cerr << "Warning: Invalid log level '" << level_str << "'"
                      << (facility.empty() ? "" : " for facility '" + facility + "'") << std::endl;
            continue;
        }

        LogLevel level = static_cast<LogLevel>(std::clamp(level_int, 1, 6));
        if (facility.empty() || facility == "default") {
            default_level_ = level;
        } else {
            facility_levels_[facility] = level;
        }
        applied++;
    }

    return applied;
}

void Logger::clearFacilityLevels() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_.clear();
}

LogLevel Logger::getEffectiveLevel() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    if (!component_name_.empty()) {
        auto it = facility_levels_.find(component_name_);
        if (it != facility_levels_.end()) {
            return it->second;
        }
    }

    if (level_explicit_) {
        return current_level_;
    }

    return default_level_;
}

} // namespace poprelief
