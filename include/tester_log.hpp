/**
 * @file tester_log.hpp
 * @brief Console and file logging for the clutch tester
 *
 * Messages go to stdout (stderr for ERROR and CRITICAL) with a bracketed
 * severity prefix. When a log file is open, each message is also appended as
 * "<timestamp> - <message>" so cycle histories survive restarts.
 */

#pragma once

#include <string>

namespace clutch_tester {

/**
 * @brief Log message severity levels
 */
enum class LogSeverity { DEBUG, INFO, WARNING, ERROR, CRITICAL };

/**
 * @brief Write a log message (thread-safe)
 * @param severity Message severity
 * @param message Message text
 */
void log_message(LogSeverity severity, const std::string& message);

/**
 * @brief Open an append-mode log file in addition to console output
 * @param path Log file path
 * @return true if the file could be opened
 */
bool open_log_file(const std::string& path);

/**
 * @brief Close the log file, console output continues
 */
void close_log_file();

/**
 * @brief Set the minimum severity that gets written
 */
void set_log_level(LogSeverity level);

LogSeverity get_log_level();

/**
 * @brief Parse a level name (DEBUG, INFO, WARNING/WARN, ERROR, CRITICAL)
 * @param name Level name, case-sensitive
 * @param level Receives the parsed level
 * @return false if the name is unknown
 */
bool parse_log_severity(const std::string& name, LogSeverity& level);

const char* log_severity_str(LogSeverity severity);

} // namespace clutch_tester
