/**
 * @file tester_log.cpp
 * @brief Implementation of console/file logging
 */

#include "tester_log.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace clutch_tester {

namespace {

std::mutex log_mutex;
std::ofstream log_file;
LogSeverity min_level = LogSeverity::INFO;

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm local_tm{};
    localtime_r(&now_c, &local_tm);

    std::ostringstream ss;
    ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << ','
       << std::setw(3) << std::setfill('0') << millis;
    return ss.str();
}

} // namespace

const char* log_severity_str(LogSeverity severity) {
    switch (severity) {
        case LogSeverity::DEBUG: return "DEBUG";
        case LogSeverity::INFO: return "INFO";
        case LogSeverity::WARNING: return "WARN";
        case LogSeverity::ERROR: return "ERROR";
        case LogSeverity::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

void log_message(LogSeverity severity, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);

    if (severity < min_level) {
        return;
    }

    std::ostream& out = (severity >= LogSeverity::ERROR) ? std::cerr : std::cout;
    out << "[" << log_severity_str(severity) << "] " << message << std::endl;

    if (log_file.is_open()) {
        log_file << timestamp() << " - " << message << std::endl;
    }
}

bool open_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(log_mutex);

    if (log_file.is_open()) {
        log_file.close();
    }

    log_file.open(path, std::ios::out | std::ios::app);
    if (!log_file.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << path << std::endl;
        return false;
    }
    return true;
}

void close_log_file() {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
}

void set_log_level(LogSeverity level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    min_level = level;
}

LogSeverity get_log_level() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return min_level;
}

bool parse_log_severity(const std::string& name, LogSeverity& level) {
    if (name == "DEBUG") {
        level = LogSeverity::DEBUG;
    } else if (name == "INFO") {
        level = LogSeverity::INFO;
    } else if (name == "WARNING" || name == "WARN") {
        level = LogSeverity::WARNING;
    } else if (name == "ERROR") {
        level = LogSeverity::ERROR;
    } else if (name == "CRITICAL") {
        level = LogSeverity::CRITICAL;
    } else {
        return false;
    }
    return true;
}

} // namespace clutch_tester
