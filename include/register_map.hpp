/**
 * @file register_map.hpp
 * @brief Motor Controller Modbus Register Map
 *
 * Defines the register command and telemetry descriptors used to talk to the
 * traction motor controller over Modbus RTU, together with the protocol
 * constants of the clutch test rig. The catalog maps symbolic names to
 * register addresses and scale factors so the engines never deal with raw
 * addresses directly.
 */

#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace clutch_tester {

/**
 * @struct RegisterCommand
 * @brief Writable register with engineering-unit scaling
 *
 * Values are encoded as round(value * multiplier). When max_register_value is
 * non-zero, negative encodings wrap around (value + max_register_value) so
 * signed quantities fit the unsigned 16-bit register transport.
 */
struct RegisterCommand {
    std::string name;              ///< Symbolic command name
    uint16_t address;              ///< Holding register address
    double multiplier;             ///< Scale factor applied before encoding
    int32_t max_register_value;    ///< Wraparound modulus for negative values (0 = none)
};

/**
 * @struct TelemetryPoint
 * @brief Readable register with engineering-unit scaling
 */
struct TelemetryPoint {
    std::string name;              ///< Symbolic telemetry name
    uint16_t address;              ///< Register address
    double multiplier;             ///< Scale factor applied to the signed raw value
};

/**
 * @class TesterConstants
 * @brief Protocol constants for the clutch test rig
 *
 * Register addresses, command names and verification thresholds. Values that
 * an operator may want to tune are only defaults here; the runtime values live
 * in TesterConfig.
 */
class TesterConstants {
public:
    // === Remote State Command Values ===
    static constexpr int STATE_DISABLED = 0;          ///< Motor disabled
    static constexpr int STATE_ENABLED = 2;           ///< Motor enabled (run)
    static constexpr int SPEED_REGULATOR_MODE = 2;    ///< Speed regulator mode used during torque cycling
    static constexpr int CLEAR_FAULTS_VALUE = 1;      ///< Value written to clear latched faults

    // === Cycle Counting ===
    static constexpr int UNBOUNDED_CYCLES = -1;       ///< Target sentinel: run until stopped
    static constexpr int FIRST_CYCLE = 1;             ///< Cycle number used when no log exists

    // === Register Encoding ===
    static constexpr int32_t REGISTER_MODULUS = 65536;  ///< 2^16 wraparound for signed commands

    // === Default Fault/Warning Register Addresses ===
    static constexpr uint16_t FAULTS_ADDRESS = 258;
    static constexpr uint16_t FAULTS2_ADDRESS = 299;
    static constexpr uint16_t WARNINGS_ADDRESS = 277;
    static constexpr uint16_t WARNINGS2_ADDRESS = 359;

    // === Direction Verification Defaults ===
    static constexpr double DEFAULT_FORWARD_RPM_THRESHOLD = 10.0;   ///< Forward rotation confirmed above this speed
    static constexpr double DEFAULT_FREEWHEEL_RPM = 5.0;            ///< Reverse segment holds below this speed
    static constexpr double DEFAULT_CLUTCH_FAILURE_RPM = 10.0;      ///< Reverse rotation beyond this means clutch slip
    static constexpr int DEFAULT_MAX_DIRECTION_CHECKS = 5;          ///< RPM samples taken per segment
    static constexpr double DEFAULT_CORRECTION_FACTOR = 1.2;        ///< Torque multiplier on direction mismatch
    static constexpr double DEFAULT_ESCALATION_FACTOR = 1.5;        ///< Torque multiplier when verification fails

    // === Fixed Current Limits Applied at Startup ===
    static constexpr double DEFAULT_REGEN_CURRENT_LIMIT = 48.0;
    static constexpr double DEFAULT_BATTERY_CURRENT_LIMIT = 75.0;

    // === Command Names ===
    static constexpr const char* CMD_SPEED_REGULATOR_MODE = "set_speed_regulator_mode";
    static constexpr const char* CMD_TORQUE = "set_remote_torque_command";
    static constexpr const char* CMD_REGEN_CURRENT_LIMIT = "set_remote_maximum_regen_battery_current_limit";
    static constexpr const char* CMD_BATTERY_CURRENT_LIMIT = "set_remote_maximum_battery_current_limit";
    static constexpr const char* CMD_MOTORING_CURRENT = "set_remote_maximum_motoring_current";
    static constexpr const char* CMD_BRAKING_CURRENT = "set_remote_maximum_braking_current";
    static constexpr const char* CMD_BRAKING_TORQUE = "set_remote_maximum_braking_torque";
    static constexpr const char* CMD_SPEED = "set_remote_speed_command";
    static constexpr const char* CMD_STATE = "set_remote_state_command";
    static constexpr const char* CMD_CLEAR_FAULTS = "clear_faults";

    // === Telemetry Names ===
    static constexpr const char* TLM_MOTOR_TEMP = "motor_temp";
    static constexpr const char* TLM_CONTROLLER_TEMP = "controller_temp";
    static constexpr const char* TLM_BATTERY_VOLTAGE = "battery_voltage";
    static constexpr const char* TLM_BATTERY_SOC = "battery_state_of_charge";
    static constexpr const char* TLM_MOTOR_RPM = "motor_rpm";
    static constexpr const char* TLM_MOTOR_CURRENT = "motor_current";
    static constexpr const char* TLM_BATTERY_CURRENT = "battery_current";
    static constexpr const char* TLM_FAULTS = "read_faults";
    static constexpr const char* TLM_FAULTS2 = "read_faults2";
    static constexpr const char* TLM_WARNINGS = "read_warnings";
    static constexpr const char* TLM_WARNINGS2 = "read_warnings2";

    /**
     * @brief Interpret a raw register value as a signed 16-bit quantity
     * @param raw Register content
     * @return Two's-complement value
     */
    static int16_t toSigned(uint16_t raw) {
        return static_cast<int16_t>(raw);
    }
};

/**
 * @class RegisterCatalog
 * @brief Name to register lookup for commands and telemetry
 *
 * Pure lookup table, loaded once at startup. Encoding rules live here so that
 * they can be tested without a transport.
 */
class RegisterCatalog {
public:
    RegisterCatalog() = default;

    /**
     * @brief Build the catalog of the motor controller used on the rig
     * @return Catalog with all known commands and telemetry points
     */
    static RegisterCatalog defaults();

    /**
     * @brief Add or replace a command
     * @param command Command descriptor
     */
    void addCommand(const RegisterCommand& command);

    /**
     * @brief Add or replace a telemetry point
     * @param point Telemetry descriptor
     */
    void addTelemetry(const TelemetryPoint& point);

    /**
     * @brief Look up a command by name
     * @return Command descriptor, nullptr if unknown
     */
    const RegisterCommand* findCommand(const std::string& name) const;

    /**
     * @brief Look up a telemetry point by name
     * @return Telemetry descriptor, nullptr if unknown
     */
    const TelemetryPoint* findTelemetry(const std::string& name) const;

    size_t getCommandCount() const;
    size_t getTelemetryCount() const;

    /**
     * @brief Encode an engineering value for a command register
     * @param command Command descriptor
     * @param value Value in engineering units
     * @param raw Receives the register content
     * @return false if the encoded value does not fit a 16-bit register
     */
    static bool encodeValue(const RegisterCommand& command, double value, uint16_t& raw);

private:
    std::map<std::string, RegisterCommand> commands_;
    std::map<std::string, TelemetryPoint> telemetry_;
};

} // namespace clutch_tester
