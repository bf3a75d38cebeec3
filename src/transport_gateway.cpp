/**
 * @file transport_gateway.cpp
 * @brief Implementation of TransportGateway
 */

#include "transport_gateway.hpp"
#include "tester_log.hpp"

#include <stdexcept>

namespace clutch_tester {

const char* transportResultStr(TransportResult result) {
    switch (result) {
        case TransportResult::SUCCESS: return "SUCCESS";
        case TransportResult::TIMEOUT: return "TIMEOUT";
        case TransportResult::COMMUNICATION_ERROR: return "COMMUNICATION_ERROR";
        case TransportResult::NOT_CONNECTED: return "NOT_CONNECTED";
    }
    return "UNKNOWN";
}

const char* commandResultStr(CommandResult result) {
    switch (result) {
        case CommandResult::SUCCESS: return "SUCCESS";
        case CommandResult::UNKNOWN_COMMAND: return "UNKNOWN_COMMAND";
        case CommandResult::INVALID_VALUE: return "INVALID_VALUE";
        case CommandResult::TRANSPORT_ERROR: return "TRANSPORT_ERROR";
    }
    return "UNKNOWN";
}

TransportGateway::TransportGateway(std::shared_ptr<RegisterTransport> transport,
                                   const RegisterCatalog& catalog)
    : transport_(std::move(transport)), catalog_(catalog) {
    if (!transport_) {
        throw std::runtime_error("RegisterTransport cannot be null");
    }
}

TransportResult TransportGateway::readRegister(uint16_t address, uint16_t& value) {
    TransportResult result = TransportResult::NOT_CONNECTED;
    std::string error;
    {
        std::lock_guard<std::mutex> gate(gate_);
        result = transport_->readRegister(address, value);
        if (result != TransportResult::SUCCESS) {
            error = transport_->getLastError();
        }
    }

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.reads_attempted++;
    if (result != TransportResult::SUCCESS) {
        stats_.reads_failed++;
        last_error_ = "Read of register " + std::to_string(address) + " failed (" +
                      transportResultStr(result) + "): " + error;
    }
    return result;
}

TransportResult TransportGateway::writeRegister(uint16_t address, uint16_t raw_value) {
    TransportResult result = TransportResult::NOT_CONNECTED;
    std::string error;
    {
        std::lock_guard<std::mutex> gate(gate_);
        result = transport_->writeRegisters(address, {raw_value});
        if (result != TransportResult::SUCCESS) {
            error = transport_->getLastError();
        }
    }

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.writes_attempted++;
    if (result != TransportResult::SUCCESS) {
        stats_.writes_failed++;
        last_error_ = "Write of register " + std::to_string(address) + " failed (" +
                      transportResultStr(result) + "): " + error;
    }
    return result;
}

CommandResult TransportGateway::execute(const std::string& command_name, double value) {
    const RegisterCommand* command = catalog_.findCommand(command_name);
    if (!command) {
        setError("Invalid command name: " + command_name);
        log_message(LogSeverity::ERROR, "Invalid command name: " + command_name);
        return CommandResult::UNKNOWN_COMMAND;
    }

    uint16_t raw = 0;
    if (!RegisterCatalog::encodeValue(*command, value, raw)) {
        setError("Value " + std::to_string(value) + " out of register range for " + command_name);
        log_message(LogSeverity::ERROR, getLastError());
        return CommandResult::INVALID_VALUE;
    }

    if (writeRegister(command->address, raw) != TransportResult::SUCCESS) {
        return CommandResult::TRANSPORT_ERROR;
    }

    log_message(LogSeverity::DEBUG, "Wrote " + std::to_string(raw) + " to address " +
                std::to_string(command->address) + " (" + command_name + ")");
    return CommandResult::SUCCESS;
}

double TransportGateway::readTelemetry(const std::string& name) {
    double value = 0.0;
    readTelemetry(name, value);
    return value;
}

bool TransportGateway::readTelemetry(const std::string& name, double& value) {
    value = 0.0;

    const TelemetryPoint* point = catalog_.findTelemetry(name);
    if (!point) {
        setError("Invalid data type requested: " + name);
        log_message(LogSeverity::ERROR, "Invalid data type requested: " + name);
        return false;
    }

    uint16_t raw = 0;
    if (readRegister(point->address, raw) != TransportResult::SUCCESS) {
        log_message(LogSeverity::ERROR, "Error reading " + name + ": " + getLastError());
        return false;
    }

    value = TesterConstants::toSigned(raw) * point->multiplier;
    return true;
}

GatewayStatistics TransportGateway::getStatistics() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

std::string TransportGateway::getLastError() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return last_error_;
}

const RegisterCatalog& TransportGateway::getCatalog() const {
    return catalog_;
}

void TransportGateway::setError(const std::string& error_message) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    last_error_ = error_message;
}

} // namespace clutch_tester
