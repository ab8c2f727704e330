/**
 * @file logger.cpp
 * @brief Implementation of Logger
 */

#include "chimera/logger.h"
#include "chimera/config.h"

#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace chimera {

std::string logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default:              return "UNKNOWN";
    }
}

LogLevel logLevelFromString(const std::string& str) {
    std::string upper;
    for (char c : str) {
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO")  return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    throw std::invalid_argument("Unknown log level: " + str);
}

Logger::Logger(const std::string& log_dir, LogLevel min_level, bool echo_stderr)
    : log_dir_(log_dir), min_level_(min_level), echo_stderr_(echo_stderr) {
    if (!log_dir_.empty()) {
        Config::createDirectoryRecursive(log_dir_);
    }
}

std::string Logger::logFilePath() const {
    if (log_dir_.empty()) {
        return "";
    }
    return log_dir_ + "/server.log";
}

void Logger::setMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!enabled()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_) {
        return;
    }

    std::ostringstream line;
    line << "[" << getTimestamp() << "] [" << logLevelToString(level) << "] " << message << "\n";

    if (!log_dir_.empty()) {
        std::ofstream log_file(logFilePath(), std::ios::app);
        if (log_file.is_open()) {
            log_file << line.str();
            log_file.flush();
        }
    }

    if (echo_stderr_) {
        std::cerr << line.str();
    }
}

std::string Logger::getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_now;
    localtime_r(&time_t_now, &tm_now);

    std::ostringstream oss;
    oss << std::put_time(&tm_now, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::shared_ptr<Logger> Logger::null() {
    static std::shared_ptr<Logger> instance = std::make_shared<Logger>();
    return instance;
}

} // namespace chimera
