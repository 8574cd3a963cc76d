/**
 * @file Logger.cpp
 * @brief Implementation of facility-based logging
 */

#include "Logger.hpp"
#include "TextUtils.hpp"
#include <iostream>
#include <filesystem>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <sstream>
#include <algorithm>

namespace survey {

std::unordered_map<std::string, LogLevel> Logger::facility_levels_;
LogLevel Logger::default_level_ = LogLevel::INFO;
std::shared_ptr<std::ofstream> Logger::global_file_stream_;
std::mutex Logger::registry_mutex_;

namespace {

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

std::optional<LogLevel> parse_log_level(const std::string& text) {
    std::string value = to_lower(trim(text));
    if (value.empty()) {
        return std::nullopt;
    }

    static const std::unordered_map<std::string, LogLevel> names = {
        {"error", LogLevel::ERROR},
        {"warning", LogLevel::WARNING},
        {"warn", LogLevel::WARNING},
        {"info", LogLevel::INFO},
        {"detailed", LogLevel::DETAILED},
        {"debug", LogLevel::DEBUG},
        {"trace", LogLevel::TRACE}
    };
    auto it = names.find(value);
    if (it != names.end()) {
        return it->second;
    }

    try {
        size_t consumed = 0;
        int level_int = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            return std::nullopt;
        }
        return static_cast<LogLevel>(std::clamp(level_int, 1, 6));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

Logger::Logger() : current_level_(LogLevel::WARNING), component_name_(""),
                   repeat_count_(0), has_last_message_(false) {
}

Logger::Logger(const std::string& component_name)
    : current_level_(LogLevel::WARNING), component_name_(component_name),
      repeat_count_(0), has_last_message_(false) {
}

Logger::Logger(LogLevel level, const std::optional<std::string>& log_file)
    : current_level_(level), component_name_(""), log_file_path_(log_file),
      repeat_count_(0), has_last_message_(false) {
    if (log_file.has_value()) {
        initializeFileStream();
    }
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    if (has_last_message_ && repeat_count_ > 0) {
        doOutput(last_level_, "The previous message occurred " + std::to_string(repeat_count_ + 1) + " times.");
        repeat_count_ = 0;
    }

    std::cout.flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::outputMessage(LogLevel level, const std::string& message) const {
    std::lock_guard<std::mutex> lock(output_mutex_);

    // Single verbosity check using the facility-aware effective level
    if (static_cast<int>(level) <= static_cast<int>(getEffectiveLevel())) {

        if (has_last_message_ && message == last_message_ && level == last_level_) {
            repeat_count_++;
            return;
        }

        if (has_last_message_ && repeat_count_ > 0) {
            doOutput(last_level_, "The previous message occurred " + std::to_string(repeat_count_ + 1) + " times.");
        }

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
    try {
        if (log_file_path_.has_value()) {
            std::filesystem::path log_path(log_file_path_.value());
            if (log_path.has_parent_path()) {
                std::filesystem::create_directories(log_path.parent_path());
            }

            file_stream_ = std::make_shared<std::ofstream>(log_file_path_.value(), std::ios::app);

            if (!file_stream_->is_open()) {
                // Not through outputMessage: would recurse
                std::cerr << "Warning: Failed to open log file: " << log_file_path_.value() << std::endl;
                file_stream_.reset();
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Warning: Exception opening log file: " << e.what() << std::endl;
        file_stream_.reset();
    }
}

void Logger::doOutput(LogLevel level, const std::string& message) const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm* tm = std::localtime(&time_t);
    char timestamp[32];
    std::snprintf(timestamp, sizeof(timestamp), "%02d:%02d:%02d.%03d",
                  tm->tm_hour, tm->tm_min, tm->tm_sec, static_cast<int>(ms.count()));

    std::string line = std::string(level_tag(level)) + " ";
    if (!component_name_.empty()) {
        line += "[" + component_name_ + "] ";
    }
    line += message;

    std::cout << "[" << timestamp << "] " << line << std::endl;

    if (file_stream_ && file_stream_->is_open()) {
        *file_stream_ << timestamp << " " << line << std::endl;
        file_stream_->flush();
    }

    std::lock_guard<std::mutex> registry_lock(registry_mutex_);
    if (global_file_stream_ && global_file_stream_->is_open()) {
        *global_file_stream_ << timestamp << " " << line << std::endl;
    }
}

void Logger::flush() const {
    std::lock_guard<std::mutex> lock(output_mutex_);

    if (has_last_message_ && repeat_count_ > 0) {
        doOutput(last_level_, "The previous message occurred " + std::to_string(repeat_count_ + 1) + " times.");
        repeat_count_ = 0;
    }

    std::cout.flush();

    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
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

    auto it = facility_levels_.find(facility);
    if (it != facility_levels_.end()) {
        return it->second;
    }

    return default_level_;
}

bool Logger::parseLogConfig(const std::string& config) {
    if (config.empty()) return true;

    bool all_valid = true;
    std::lock_guard<std::mutex> lock(registry_mutex_);

    std::stringstream ss(config);
    std::string token;

    while (std::getline(ss, token, ',')) {
        token = trim(token);
        if (token.empty()) continue;

        size_t equals_pos = token.find('=');
        if (equals_pos != std::string::npos) {
            std::string facility = trim(token.substr(0, equals_pos));
            std::string level_str = trim(token.substr(equals_pos + 1));

            auto level = parse_log_level(level_str);
            if (!level) {
                std::cerr << "Warning: Invalid log level '" << level_str << "' for facility '" << facility << "'" << std::endl;
                all_valid = false;
                continue;
            }

            if (facility == "default") {
                default_level_ = *level;
            } else {
                facility_levels_[facility] = *level;
            }
        } else {
            auto level = parse_log_level(token);
            if (!level) {
                std::cerr << "Warning: Invalid default log level '" << token << "'" << std::endl;
                all_valid = false;
                continue;
            }
            default_level_ = *level;
        }
    }

    return all_valid;
}

void Logger::setGlobalLogFile(const std::optional<std::string>& log_file) {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    if (global_file_stream_) {
        global_file_stream_->close();
        global_file_stream_.reset();
    }
    if (!log_file.has_value()) {
        return;
    }

    try {
        std::filesystem::path log_path(log_file.value());
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }
        global_file_stream_ = std::make_shared<std::ofstream>(log_file.value(), std::ios::app);
        if (!global_file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << log_file.value() << std::endl;
            global_file_stream_.reset();
        }
    } catch (const std::exception& e) {
        std::cerr << "Warning: Exception opening log file: " << e.what() << std::endl;
        global_file_stream_.reset();
    }
}

void Logger::clearFacilityLevels() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_.clear();
}

LogLevel Logger::getEffectiveLevel() const {
    if (!component_name_.empty()) {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto it = facility_levels_.find(component_name_);
        if (it != facility_levels_.end()) {
            return it->second;
        }
    }

    if (current_level_ != LogLevel::WARNING) {
        return current_level_;
    }

    std::lock_guard<std::mutex> lock(registry_mutex_);
    return default_level_;
}

} // namespace survey
