/**
 * @file cycle_log.hpp
 * @brief Persistent log of completed clutch cycles
 *
 * Append-only text file with one "No of cycles: <n>" line per completed
 * cycle. The last parseable line is the resume point of the next test.
 */

#pragma once

#include <mutex>
#include <string>

namespace clutch_tester {

/**
 * @class CycleLog
 * @brief Reads the resume count from and appends completed cycles to the log
 */
class CycleLog {
public:
    explicit CycleLog(const std::string& path);

    /**
     * @brief Cycle count recorded by the last valid line
     * @return Last logged count, TesterConstants::FIRST_CYCLE if the file is
     *         missing or has no valid line
     */
    int getLastCycleCount() const;

    /**
     * @brief Same as getLastCycleCount() for an arbitrary file
     */
    static int getLastCycleCount(const std::string& path);

    /**
     * @brief Append one completed cycle
     * @param cycle_number Cycle that completed
     * @return true if the line was written and flushed
     */
    bool append(int cycle_number);

    /**
     * @brief Parse one log line
     * @param line Text line
     * @param cycle_number Receives the count on success
     * @return true if line is "No of cycles: <n>" with n >= 0 (optional leading '+')
     */
    static bool parseLine(const std::string& line, int& cycle_number);

    const std::string& getPath() const { return path_; }

private:
    std::string path_;
    mutable std::mutex file_mutex_;
};

} // namespace clutch_tester
