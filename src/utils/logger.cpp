#include "logger.hpp"
#include <iostream>
#include <fstream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace xvh {

static std::ofstream log_file;
static std::mutex log_mutex;

static LogLevel current_log_level = LogLevel::INFO;
static bool console_output_enabled = true;

LogLevel parse_log_level(const std::string& level) {
    if (level == "DEBUG") {
        return LogLevel::DEBUG;
    } else if (level == "WARNING") {
        return LogLevel::WARNING;
    } else if (level == "ERROR") {
        return LogLevel::ERROR;
    } else if (level == "CRITICAL") {
        return LogLevel::CRITICAL;
    }
    return LogLevel::INFO;
}

void Logger::init(const LoggingConfig& config, LogLevel app_log_level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
    if (config.file_output && !config.file_path.empty()) {
        log_file.open(config.file_path, std::ios::app);
        if (!log_file.is_open()) {
            std::cerr << "Failed to open log file " << config.file_path << std::endl;
        }
    }
    current_log_level = app_log_level;
    console_output_enabled = config.console_output;
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.flush();
        log_file.close();
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level < current_log_level) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::string level_str;
    switch (level) {
        case LogLevel::DEBUG: level_str = "DEBUG"; break;
        case LogLevel::INFO: level_str = "INFO"; break;
        case LogLevel::WARNING: level_str = "WARNING"; break;
        case LogLevel::ERROR: level_str = "ERROR"; break;
        case LogLevel::CRITICAL: level_str = "CRITICAL"; break;
    }

    std::stringstream log_stream;
    log_stream << std::put_time(&local_tm, "%F %T") << " [" << level_str << "] " << message << std::endl;

    if (log_file.is_open()) {
        log_file << log_stream.str();
    }
    if (console_output_enabled) {
        std::cout << log_stream.str();
    }
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

} // namespace xvh
