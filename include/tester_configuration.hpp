/**
 * @file tester_configuration.hpp
 * @brief Clutch Tester Configuration and Parser
 *
 * TesterConfig holds every tunable of the rig: serial link settings, retry
 * policy, recovery stage table, monitor and cycle timing, file locations, the
 * register catalog and the fault/warning description tables. It is built once
 * at startup (defaults, optionally overridden from a CSV file) and handed to
 * MotorController by value.
 */

#pragma once

#include "fault_decoder.hpp"
#include "register_map.hpp"

#include <istream>
#include <string>
#include <vector>

namespace clutch_tester {

/**
 * @struct SerialSettings
 * @brief Modbus RTU link parameters
 */
struct SerialSettings {
    std::string port = "/dev/ttyUSB0";   ///< Serial device
    int slave_address = 1;               ///< Modbus slave id
    int baudrate = 115200;
    int bytesize = 8;
    char parity = 'N';                   ///< 'N', 'E' or 'O'
    int stopbits = 1;
    double timeout_s = 1.0;              ///< Response timeout
    int setup_retries = 3;               ///< Connection attempts at startup
    double setup_retry_delay_s = 2.0;
};

/**
 * @struct RetryPolicy
 * @brief Per-operation retry bound for register transactions
 */
struct RetryPolicy {
    int max_retries = 3;
    double retry_delay_s = 1.0;
};

/**
 * @struct RecoveryStage
 * @brief One tier of the escalating recovery policy
 */
struct RecoveryStage {
    int attempts;           ///< Clear attempts before escalating
    int interval_seconds;   ///< Wait between attempts, in countdown ticks
};

/**
 * @struct RecoveryConfig
 * @brief Fault recovery timing
 *
 * Countdowns are expressed in ticks of tick_s wall-clock seconds. The
 * production tick is one second, so stage intervals read as seconds.
 */
struct RecoveryConfig {
    std::vector<RecoveryStage> stages = {{5, 60}, {5, 300}, {5, 900}, {5, 1800}};
    int initial_wait_seconds = 10;       ///< Countdown before the first attempt of a stage
    int check_chunk_seconds = 60;        ///< Faults are re-checked after each chunk of an interval
    double tick_s = 1.0;                 ///< Length of one countdown tick
    double clear_verify_delay_s = 0.5;   ///< Settle time between clear command and re-check
    double error_backoff_s = 60.0;       ///< Pause after an unexpected error
};

/**
 * @struct MonitorConfig
 * @brief Fault monitor timing
 */
struct MonitorConfig {
    double interval_s = 1.0;          ///< Poll cadence
    double error_backoff_s = 5.0;     ///< Pause after an unexpected error
    double restart_pause_s = 0.1;     ///< Pause after re-enabling the motor
};

/**
 * @struct CycleConfig
 * @brief Cycle engine timing and verification thresholds
 */
struct CycleConfig {
    double poll_interval_s = 0.01;       ///< Segment timer granularity
    double transition_pause_s = 0.2;     ///< Zero-torque pause between segments
    double step_pause_s = 0.1;           ///< Pause after each startup command
    int max_direction_checks = TesterConstants::DEFAULT_MAX_DIRECTION_CHECKS;
    double forward_rpm_threshold = TesterConstants::DEFAULT_FORWARD_RPM_THRESHOLD;
    double freewheel_rpm = TesterConstants::DEFAULT_FREEWHEEL_RPM;
    double clutch_failure_rpm = TesterConstants::DEFAULT_CLUTCH_FAILURE_RPM;
    double correction_factor = TesterConstants::DEFAULT_CORRECTION_FACTOR;
    double escalation_factor = TesterConstants::DEFAULT_ESCALATION_FACTOR;
    double regen_current_limit = TesterConstants::DEFAULT_REGEN_CURRENT_LIMIT;
    double battery_current_limit = TesterConstants::DEFAULT_BATTERY_CURRENT_LIMIT;
};

/**
 * @struct FileSettings
 * @brief Output file locations
 */
struct FileSettings {
    std::string cycle_log = "No_of_cycles.txt";      ///< Append-only completed cycle log
    std::string log_file = "Log_no_of_cycles.log";   ///< Diagnostic log
    std::string log_level = "INFO";
};

/**
 * @struct TesterConfig
 * @brief Complete tester configuration
 */
struct TesterConfig {
    SerialSettings serial;
    RetryPolicy retry;
    RecoveryConfig recovery;
    MonitorConfig monitor;
    CycleConfig cycle;
    FileSettings files;
    RegisterCatalog catalog = RegisterCatalog::defaults();
    FaultTables fault_tables = FaultTables::defaults();

    static TesterConfig defaults();
};

/**
 * @class TesterConfigParser
 * @brief Configuration file parser for the clutch tester
 *
 * Parses CSV files in the format: SECTION, KEY, VALUE[, VALUE...]. Values not
 * present in the file keep their defaults. Supported sections:
 *
 *   serial, retry, recovery, monitor, cycle, files   scalar settings by key
 *   stage, <n>, <attempts>, <interval>               replaces the default stage table
 *   command, <name>, <address>[, <multiplier>[, <max_register_value>]]
 *   telemetry, <name>, <address>[, <multiplier>]
 *   fault|fault2|warning|warning2, <bit>, <description>
 *
 * Addresses accept decimal or 0x-prefixed hex. Lines starting with '#' are
 * comments. Descriptions may contain commas.
 */
class TesterConfigParser {
public:
    TesterConfigParser();
    ~TesterConfigParser();

    // === Core Parsing Functions ===

    /**
     * @brief Parse configuration from CSV file
     * @param filename Path to CSV configuration file
     * @return true if parsing and validation succeeded
     */
    bool parseCSV(const std::string& filename);

    /**
     * @brief Parse configuration from an input stream
     * @param input Stream with CSV content
     * @return true if parsing and validation succeeded
     */
    bool parseStream(std::istream& input);

    /**
     * @brief Validate the resulting configuration
     * @return true if the configuration is usable
     */
    bool validateParameters();

    size_t getParameterCount() const;

    // === Results ===

    const TesterConfig& getConfig() const;
    bool isLoaded() const;
    const std::vector<std::string>& getErrors() const;

    /**
     * @brief Reset to defaults and drop errors
     */
    void clear();

    void printSummary() const;

private:
    bool parseLine(const std::string& line, size_t line_number);
    bool applySetting(const std::string& section, const std::string& key,
                      const std::string& value, size_t line_number);
    bool applyStage(const std::string& key, const std::vector<std::string>& fields, size_t line_number);
    bool applyCommand(const std::string& name, const std::vector<std::string>& fields, size_t line_number);
    bool applyTelemetry(const std::string& name, const std::vector<std::string>& fields, size_t line_number);
    bool applyDescription(const std::string& section, const std::string& key,
                          const std::string& description, size_t line_number);

    std::string trim(const std::string& str) const;
    std::vector<std::string> splitFields(const std::string& value) const;

    /**
     * @brief Convert decimal or hex string to integer
     */
    uint32_t parseAddress(const std::string& str) const;

    void addError(const std::string& message);

    TesterConfig config_;
    std::vector<std::string> errors_;
    bool loaded_;
    bool stages_overridden_;      ///< First stage line discards the default table
    size_t parameter_count_;
    std::string filename_;
};

} // namespace clutch_tester
