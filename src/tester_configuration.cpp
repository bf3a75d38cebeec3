/**
 * @file tester_configuration.cpp
 * @brief Implementation of TesterConfigParser class
 *
 * Provides CSV configuration file parsing for serial settings, timing,
 * recovery stages, register catalog overrides and fault descriptions.
 */

#include "tester_configuration.hpp"
#include "tester_log.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace clutch_tester {

TesterConfig TesterConfig::defaults() {
    return TesterConfig{};
}

// === TesterConfigParser Implementation ===

TesterConfigParser::TesterConfigParser()
    : loaded_(false), stages_overridden_(false), parameter_count_(0) {
}

TesterConfigParser::~TesterConfigParser() {
}

bool TesterConfigParser::parseCSV(const std::string& filename) {
    clear();
    filename_ = filename;

    std::ifstream file(filename);
    if (!file.is_open()) {
        addError("Failed to open configuration file: " + filename);
        return false;
    }

    log_message(LogSeverity::INFO, "Parsing configuration file: " + filename);
    return parseStream(file);
}

bool TesterConfigParser::parseStream(std::istream& input) {
    std::string line;
    size_t line_number = 0;
    size_t parsed_count = 0;

    while (std::getline(input, line)) {
        line_number++;

        // Skip empty lines and comments
        std::string trimmed_line = trim(line);
        if (trimmed_line.empty() || trimmed_line[0] == '#') {
            continue;
        }

        if (parseLine(trimmed_line, line_number)) {
            parsed_count++;
        }
    }

    parameter_count_ += parsed_count;

    if (parsed_count == 0) {
        addError("No valid parameters found in configuration");
        return false;
    }

    loaded_ = true;
    log_message(LogSeverity::INFO, "Parsed " + std::to_string(parsed_count) + " parameters" +
                (filename_.empty() ? std::string() : " from " + filename_));

    return validateParameters() && errors_.empty();
}

bool TesterConfigParser::parseLine(const std::string& line, size_t line_number) {
    std::stringstream ss(line);
    std::string section, key, value;

    // Parse CSV format: SECTION, KEY, VALUE[, VALUE...]
    if (!std::getline(ss, section, ',') ||
        !std::getline(ss, key, ',') ||
        !std::getline(ss, value)) {
        addError("Line " + std::to_string(line_number) + ": Invalid CSV format");
        return false;
    }

    section = trim(section);
    key = trim(key);
    value = trim(value);

    try {
        if (section == "stage") {
            return applyStage(key, splitFields(value), line_number);
        }
        if (section == "command") {
            return applyCommand(key, splitFields(value), line_number);
        }
        if (section == "telemetry") {
            return applyTelemetry(key, splitFields(value), line_number);
        }
        if (section == "fault" || section == "fault2" ||
            section == "warning" || section == "warning2") {
            return applyDescription(section, key, value, line_number);
        }
        return applySetting(section, key, value, line_number);

    } catch (const std::exception& e) {
        addError("Line " + std::to_string(line_number) + ": Parsing error - " + e.what());
        return false;
    }
}

bool TesterConfigParser::applySetting(const std::string& section, const std::string& key,
                                      const std::string& value, size_t line_number) {
    const std::string where = "Line " + std::to_string(line_number) + ": ";

    if (section == "serial") {
        SerialSettings& s = config_.serial;
        if (key == "port") s.port = value;
        else if (key == "slave_address") s.slave_address = std::stoi(value);
        else if (key == "baudrate") s.baudrate = std::stoi(value);
        else if (key == "bytesize") s.bytesize = std::stoi(value);
        else if (key == "parity") {
            if (value != "N" && value != "E" && value != "O") {
                addError(where + "Parity must be N, E or O");
                return false;
            }
            s.parity = value[0];
        }
        else if (key == "stopbits") s.stopbits = std::stoi(value);
        else if (key == "timeout") s.timeout_s = std::stod(value);
        else if (key == "setup_retries") s.setup_retries = std::stoi(value);
        else if (key == "setup_retry_delay") s.setup_retry_delay_s = std::stod(value);
        else {
            addError(where + "Unknown serial key '" + key + "'");
            return false;
        }
    } else if (section == "retry") {
        if (key == "max_retries") config_.retry.max_retries = std::stoi(value);
        else if (key == "retry_delay") config_.retry.retry_delay_s = std::stod(value);
        else {
            addError(where + "Unknown retry key '" + key + "'");
            return false;
        }
    } else if (section == "recovery") {
        RecoveryConfig& r = config_.recovery;
        if (key == "initial_wait") r.initial_wait_seconds = std::stoi(value);
        else if (key == "check_chunk") r.check_chunk_seconds = std::stoi(value);
        else if (key == "tick") r.tick_s = std::stod(value);
        else if (key == "clear_verify_delay") r.clear_verify_delay_s = std::stod(value);
        else if (key == "error_backoff") r.error_backoff_s = std::stod(value);
        else {
            addError(where + "Unknown recovery key '" + key + "'");
            return false;
        }
    } else if (section == "monitor") {
        MonitorConfig& m = config_.monitor;
        if (key == "interval") m.interval_s = std::stod(value);
        else if (key == "error_backoff") m.error_backoff_s = std::stod(value);
        else if (key == "restart_pause") m.restart_pause_s = std::stod(value);
        else {
            addError(where + "Unknown monitor key '" + key + "'");
            return false;
        }
    } else if (section == "cycle") {
        CycleConfig& c = config_.cycle;
        if (key == "poll_interval") c.poll_interval_s = std::stod(value);
        else if (key == "transition_pause") c.transition_pause_s = std::stod(value);
        else if (key == "step_pause") c.step_pause_s = std::stod(value);
        else if (key == "max_direction_checks") c.max_direction_checks = std::stoi(value);
        else if (key == "forward_rpm_threshold") c.forward_rpm_threshold = std::stod(value);
        else if (key == "freewheel_rpm") c.freewheel_rpm = std::stod(value);
        else if (key == "clutch_failure_rpm") c.clutch_failure_rpm = std::stod(value);
        else if (key == "correction_factor") c.correction_factor = std::stod(value);
        else if (key == "escalation_factor") c.escalation_factor = std::stod(value);
        else if (key == "regen_current_limit") c.regen_current_limit = std::stod(value);
        else if (key == "battery_current_limit") c.battery_current_limit = std::stod(value);
        else {
            addError(where + "Unknown cycle key '" + key + "'");
            return false;
        }
    } else if (section == "files") {
        FileSettings& f = config_.files;
        if (key == "cycle_log") f.cycle_log = value;
        else if (key == "log_file") f.log_file = value;
        else if (key == "log_level") {
            LogSeverity level;
            if (!parse_log_severity(value, level)) {
                addError(where + "Unknown log level '" + value + "'");
                return false;
            }
            f.log_level = value;
        }
        else {
            addError(where + "Unknown files key '" + key + "'");
            return false;
        }
    } else {
        addError(where + "Unknown section '" + section + "'");
        return false;
    }

    return true;
}

bool TesterConfigParser::applyStage(const std::string& key, const std::vector<std::string>& fields,
                                    size_t line_number) {
    if (fields.size() != 2) {
        addError("Line " + std::to_string(line_number) + ": stage needs <n>, <attempts>, <interval>");
        return false;
    }

    if (!stages_overridden_) {
        config_.recovery.stages.clear();
        stages_overridden_ = true;
    }

    size_t index = std::stoul(key);
    if (index != config_.recovery.stages.size()) {
        addError("Line " + std::to_string(line_number) + ": stage " + key +
                 " out of order (expected " + std::to_string(config_.recovery.stages.size()) + ")");
        return false;
    }

    config_.recovery.stages.push_back({std::stoi(fields[0]), std::stoi(fields[1])});
    return true;
}

bool TesterConfigParser::applyCommand(const std::string& name, const std::vector<std::string>& fields,
                                      size_t line_number) {
    if (fields.empty() || fields.size() > 3) {
        addError("Line " + std::to_string(line_number) +
                 ": command needs <name>, <address>[, <multiplier>[, <max_register_value>]]");
        return false;
    }

    RegisterCommand command{name, static_cast<uint16_t>(parseAddress(fields[0])), 1.0, 0};
    if (fields.size() > 1) {
        command.multiplier = std::stod(fields[1]);
    }
    if (fields.size() > 2) {
        command.max_register_value = std::stoi(fields[2]);
    }

    config_.catalog.addCommand(command);
    return true;
}

bool TesterConfigParser::applyTelemetry(const std::string& name, const std::vector<std::string>& fields,
                                        size_t line_number) {
    if (fields.empty() || fields.size() > 2) {
        addError("Line " + std::to_string(line_number) +
                 ": telemetry needs <name>, <address>[, <multiplier>]");
        return false;
    }

    TelemetryPoint point{name, static_cast<uint16_t>(parseAddress(fields[0])), 1.0};
    if (fields.size() > 1) {
        point.multiplier = std::stod(fields[1]);
    }

    config_.catalog.addTelemetry(point);
    return true;
}

bool TesterConfigParser::applyDescription(const std::string& section, const std::string& key,
                                          const std::string& description, size_t line_number) {
    int bit = std::stoi(key);
    if (bit < 0 || bit > 15) {
        addError("Line " + std::to_string(line_number) + ": bit " + key + " outside 0-15");
        return false;
    }

    BitDescriptionTable* table = &config_.fault_tables.faults;
    if (section == "fault2") table = &config_.fault_tables.faults2;
    else if (section == "warning") table = &config_.fault_tables.warnings;
    else if (section == "warning2") table = &config_.fault_tables.warnings2;

    (*table)[bit] = description;
    return true;
}

bool TesterConfigParser::validateParameters() {
    size_t errors_before = errors_.size();

    const RecoveryConfig& recovery = config_.recovery;
    if (recovery.stages.empty()) {
        addError("Recovery stage table is empty");
    }
    for (size_t i = 0; i < recovery.stages.size(); ++i) {
        if (recovery.stages[i].attempts <= 0 || recovery.stages[i].interval_seconds <= 0) {
            addError("Recovery stage " + std::to_string(i) + " needs positive attempts and interval");
        }
    }
    if (recovery.initial_wait_seconds < 0 || recovery.check_chunk_seconds <= 0 || recovery.tick_s <= 0.0) {
        addError("Recovery timing must be positive");
    }

    if (config_.retry.max_retries < 1) {
        addError("retry.max_retries must be at least 1");
    }
    if (config_.serial.setup_retries < 1) {
        addError("serial.setup_retries must be at least 1");
    }
    if (config_.serial.slave_address < 1 || config_.serial.slave_address > 247) {
        addError("serial.slave_address must be within 1-247");
    }
    if (config_.monitor.interval_s <= 0.0 || config_.cycle.poll_interval_s <= 0.0) {
        addError("Monitor interval and cycle poll interval must be positive");
    }
    if (config_.cycle.max_direction_checks < 1) {
        addError("cycle.max_direction_checks must be at least 1");
    }

    // Names the engines rely on
    const char* required_commands[] = {
        TesterConstants::CMD_SPEED_REGULATOR_MODE, TesterConstants::CMD_TORQUE,
        TesterConstants::CMD_REGEN_CURRENT_LIMIT, TesterConstants::CMD_BATTERY_CURRENT_LIMIT,
        TesterConstants::CMD_MOTORING_CURRENT, TesterConstants::CMD_BRAKING_CURRENT,
        TesterConstants::CMD_SPEED, TesterConstants::CMD_STATE, TesterConstants::CMD_CLEAR_FAULTS
    };
    for (const char* name : required_commands) {
        if (!config_.catalog.findCommand(name)) {
            addError(std::string("Missing required command: ") + name);
        }
    }

    const char* required_telemetry[] = {
        TesterConstants::TLM_MOTOR_RPM, TesterConstants::TLM_FAULTS, TesterConstants::TLM_FAULTS2,
        TesterConstants::TLM_WARNINGS, TesterConstants::TLM_WARNINGS2
    };
    for (const char* name : required_telemetry) {
        if (!config_.catalog.findTelemetry(name)) {
            addError(std::string("Missing required telemetry: ") + name);
        }
    }

    return errors_.size() == errors_before;
}

size_t TesterConfigParser::getParameterCount() const {
    return parameter_count_;
}

const TesterConfig& TesterConfigParser::getConfig() const {
    return config_;
}

bool TesterConfigParser::isLoaded() const {
    return loaded_;
}

const std::vector<std::string>& TesterConfigParser::getErrors() const {
    return errors_;
}

void TesterConfigParser::clear() {
    config_ = TesterConfig::defaults();
    errors_.clear();
    loaded_ = false;
    stages_overridden_ = false;
    parameter_count_ = 0;
    filename_.clear();
}

void TesterConfigParser::printSummary() const {
    if (!loaded_) {
        std::cout << "No configuration loaded" << std::endl;
        return;
    }

    std::cout << "\n=== Configuration Summary ===" << std::endl;

    const SerialSettings& s = config_.serial;
    std::cout << "Serial Link:" << std::endl;
    std::cout << "  Port: " << s.port << " (slave " << s.slave_address << ")" << std::endl;
    std::cout << "  Format: " << s.baudrate << " " << s.bytesize << s.parity << s.stopbits
              << ", timeout " << s.timeout_s << " s" << std::endl;

    std::cout << "\nRetry: " << config_.retry.max_retries << " attempts, "
              << config_.retry.retry_delay_s << " s apart" << std::endl;

    std::cout << "\nRecovery Stages:" << std::endl;
    for (size_t i = 0; i < config_.recovery.stages.size(); ++i) {
        std::cout << "  Stage " << (i + 1) << ": " << config_.recovery.stages[i].attempts
                  << " attempts every " << config_.recovery.stages[i].interval_seconds << " s" << std::endl;
    }

    const CycleConfig& c = config_.cycle;
    std::cout << "\nDirection Checks:" << std::endl;
    std::cout << "  Forward > " << c.forward_rpm_threshold << " rpm, freewheel < " << c.freewheel_rpm
              << " rpm, clutch failure > " << c.clutch_failure_rpm << " rpm" << std::endl;
    std::cout << "  Correction x" << c.correction_factor << ", escalation x" << c.escalation_factor << std::endl;

    std::cout << "\nRegister Catalog: " << config_.catalog.getCommandCount() << " commands, "
              << config_.catalog.getTelemetryCount() << " telemetry points" << std::endl;
    std::cout << "Cycle Log: " << config_.files.cycle_log << std::endl;
    std::cout << "========================" << std::endl;
}

// === Private Helper Functions ===

std::string TesterConfigParser::trim(const std::string& str) const {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";

    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::vector<std::string> TesterConfigParser::splitFields(const std::string& value) const {
    std::vector<std::string> fields;
    std::stringstream ss(value);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(trim(field));
    }
    return fields;
}

uint32_t TesterConfigParser::parseAddress(const std::string& str) const {
    uint32_t address = 0;
    if (str.size() > 2 && (str.substr(0, 2) == "0x" || str.substr(0, 2) == "0X")) {
        address = static_cast<uint32_t>(std::stoul(str.substr(2), nullptr, 16));
    } else {
        address = static_cast<uint32_t>(std::stoul(str));
    }

    if (address > 0xFFFF) {
        throw std::out_of_range("register address " + str + " exceeds 0xFFFF");
    }
    return address;
}

void TesterConfigParser::addError(const std::string& message) {
    errors_.push_back(message);
    std::cerr << "[CONFIG ERROR] " << message << std::endl;
}

} // namespace clutch_tester
