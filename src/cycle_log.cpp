/**
 * @file cycle_log.cpp
 * @brief Implementation of CycleLog
 */

#include "cycle_log.hpp"
#include "register_map.hpp"
#include "tester_log.hpp"

#include <cctype>
#include <fstream>
#include <vector>

namespace clutch_tester {

namespace {
const std::string LINE_PREFIX = "No of cycles:";
}

CycleLog::CycleLog(const std::string& path) : path_(path) {
}

int CycleLog::getLastCycleCount() const {
    std::lock_guard<std::mutex> lock(file_mutex_);
    return getLastCycleCount(path_);
}

int CycleLog::getLastCycleCount(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return TesterConstants::FIRST_CYCLE;
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }

    // Last valid line wins, anything unparseable after it is ignored
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        int count = 0;
        if (parseLine(*it, count)) {
            return count;
        }
    }

    return TesterConstants::FIRST_CYCLE;
}

bool CycleLog::append(int cycle_number) {
    std::lock_guard<std::mutex> lock(file_mutex_);

    std::ofstream file(path_, std::ios::out | std::ios::app);
    if (!file.is_open()) {
        log_message(LogSeverity::ERROR, "Failed to open cycle log: " + path_);
        return false;
    }

    file << LINE_PREFIX << " " << cycle_number << "\n";
    file.flush();
    if (!file) {
        log_message(LogSeverity::ERROR, "Failed to write cycle log: " + path_);
        return false;
    }
    return true;
}

bool CycleLog::parseLine(const std::string& line, int& cycle_number) {
    if (line.compare(0, LINE_PREFIX.size(), LINE_PREFIX) != 0) {
        return false;
    }

    size_t pos = LINE_PREFIX.size();
    while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) {
        pos++;
    }

    size_t end = line.find_last_not_of(" \t\r\n");
    if (pos >= line.size() || end == std::string::npos || end < pos) {
        return false;
    }

    // Explicit positive sign
    if (line[pos] == '+') {
        pos++;
        if (pos > end) {
            return false;
        }
    }

    std::string digits = line.substr(pos, end - pos + 1);
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }

    if (digits.size() > 9) {
        return false;
    }

    cycle_number = std::stoi(digits);
    return true;
}

} // namespace clutch_tester
