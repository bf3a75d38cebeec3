/**
 * @file register_map.cpp
 * @brief Register catalog defaults and command encoding
 *
 * Provides the register layout of the traction motor controller driven by the
 * clutch rig. Addresses and scale factors follow the controller's Modbus
 * parameter map; they can be overridden from the configuration file.
 */

#include "register_map.hpp"

#include <cmath>

namespace clutch_tester {

RegisterCatalog RegisterCatalog::defaults() {
    RegisterCatalog catalog;
    const int32_t wrap = TesterConstants::REGISTER_MODULUS;

    // Commands: name, address, multiplier, wraparound modulus
    catalog.addCommand({TesterConstants::CMD_SPEED_REGULATOR_MODE, 11, 1.0, 0});
    catalog.addCommand({TesterConstants::CMD_TORQUE, 494, 40.46, wrap});
    catalog.addCommand({TesterConstants::CMD_REGEN_CURRENT_LIMIT, 361, 8.0, 0});
    catalog.addCommand({TesterConstants::CMD_BATTERY_CURRENT_LIMIT, 360, 8.0, 0});
    catalog.addCommand({TesterConstants::CMD_MOTORING_CURRENT, 491, 40.96, 0});
    catalog.addCommand({TesterConstants::CMD_BRAKING_CURRENT, 492, 40.96, 0});
    catalog.addCommand({TesterConstants::CMD_BRAKING_TORQUE, 1680, 40.96, 0});
    catalog.addCommand({TesterConstants::CMD_SPEED, 1677, 1.0, wrap});
    catalog.addCommand({TesterConstants::CMD_STATE, 493, 1.0, 0});
    catalog.addCommand({TesterConstants::CMD_CLEAR_FAULTS, 508, 1.0, 0});

    // Telemetry: name, address, multiplier
    catalog.addTelemetry({TesterConstants::TLM_MOTOR_TEMP, 261, 1.0});
    catalog.addTelemetry({TesterConstants::TLM_CONTROLLER_TEMP, 259, 1.0});
    catalog.addTelemetry({TesterConstants::TLM_BATTERY_VOLTAGE, 265, 0.03});
    catalog.addTelemetry({TesterConstants::TLM_BATTERY_SOC, 267, 1.0});
    catalog.addTelemetry({TesterConstants::TLM_MOTOR_RPM, 263, 1.0});
    catalog.addTelemetry({TesterConstants::TLM_MOTOR_CURRENT, 262, 0.032});
    catalog.addTelemetry({TesterConstants::TLM_BATTERY_CURRENT, 266, 0.032});
    catalog.addTelemetry({TesterConstants::TLM_FAULTS, TesterConstants::FAULTS_ADDRESS, 1.0});
    catalog.addTelemetry({TesterConstants::TLM_FAULTS2, TesterConstants::FAULTS2_ADDRESS, 1.0});
    catalog.addTelemetry({TesterConstants::TLM_WARNINGS, TesterConstants::WARNINGS_ADDRESS, 1.0});
    catalog.addTelemetry({TesterConstants::TLM_WARNINGS2, TesterConstants::WARNINGS2_ADDRESS, 1.0});

    return catalog;
}

void RegisterCatalog::addCommand(const RegisterCommand& command) {
    commands_[command.name] = command;
}

void RegisterCatalog::addTelemetry(const TelemetryPoint& point) {
    telemetry_[point.name] = point;
}

const RegisterCommand* RegisterCatalog::findCommand(const std::string& name) const {
    auto it = commands_.find(name);
    return (it != commands_.end()) ? &it->second : nullptr;
}

const TelemetryPoint* RegisterCatalog::findTelemetry(const std::string& name) const {
    auto it = telemetry_.find(name);
    return (it != telemetry_.end()) ? &it->second : nullptr;
}

size_t RegisterCatalog::getCommandCount() const {
    return commands_.size();
}

size_t RegisterCatalog::getTelemetryCount() const {
    return telemetry_.size();
}

bool RegisterCatalog::encodeValue(const RegisterCommand& command, double value, uint16_t& raw) {
    long encoded = std::lround(value * command.multiplier);

    if (command.max_register_value > 0 && encoded < 0) {
        encoded += command.max_register_value;
    }

    if (encoded < 0 || encoded >= TesterConstants::REGISTER_MODULUS) {
        return false;
    }

    raw = static_cast<uint16_t>(encoded);
    return true;
}

} // namespace clutch_tester
