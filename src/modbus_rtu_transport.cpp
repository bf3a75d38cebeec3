/**
 * @file modbus_rtu_transport.cpp
 * @brief Implementation of ModbusRtuTransport
 */

#include "modbus_rtu_transport.hpp"
#include "tester_log.hpp"

#include <cerrno>
#include <chrono>
#include <cmath>
#include <thread>

namespace clutch_tester {

ModbusRtuTransport::ModbusRtuTransport(const SerialSettings& settings)
    : settings_(settings), ctx_(nullptr), connected_(false) {
    clearError();
}

ModbusRtuTransport::~ModbusRtuTransport() {
    close();
}

bool ModbusRtuTransport::initialize() {
    if (connected_.load()) {
        setError("Serial port already open: " + settings_.port);
        return false;
    }

    log_message(LogSeverity::INFO, "Opening Modbus RTU link on " + settings_.port + " (" +
                std::to_string(settings_.baudrate) + " " + std::to_string(settings_.bytesize) +
                settings_.parity + std::to_string(settings_.stopbits) + ", slave " +
                std::to_string(settings_.slave_address) + ")");

    ctx_ = modbus_new_rtu(settings_.port.c_str(), settings_.baudrate, settings_.parity,
                          settings_.bytesize, settings_.stopbits);
    if (ctx_ == nullptr) {
        setError("Failed to create Modbus RTU context: " + std::string(modbus_strerror(errno)));
        return false;
    }

    if (modbus_set_slave(ctx_, settings_.slave_address) == -1) {
        setError("Invalid slave address " + std::to_string(settings_.slave_address) + ": " +
                 modbus_strerror(errno));
        close();
        return false;
    }

    double whole = 0.0;
    double fraction = std::modf(settings_.timeout_s, &whole);
    if (modbus_set_response_timeout(ctx_, static_cast<uint32_t>(whole),
                                    static_cast<uint32_t>(fraction * 1000000.0)) == -1) {
        setError("Failed to set response timeout: " + std::string(modbus_strerror(errno)));
        close();
        return false;
    }

    if (modbus_connect(ctx_) == -1) {
        setError("Failed to open " + settings_.port + ": " + modbus_strerror(errno) +
                 " (check the device path and permissions)");
        close();
        return false;
    }

    connected_.store(true);
    clearError();
    return true;
}

bool ModbusRtuTransport::setupConnection(uint16_t probe_address) {
    for (int attempt = 0; attempt < settings_.setup_retries; ++attempt) {
        if (initialize()) {
            uint16_t value = 0;
            if (readRegister(probe_address, value) == TransportResult::SUCCESS) {
                log_message(LogSeverity::INFO, "Connection validated - fault register value: " +
                            std::to_string(value));
                log_message(LogSeverity::INFO, "Motor controller connected successfully on " + settings_.port);
                return true;
            }
            log_message(LogSeverity::WARNING, "Connection validation failed: " + getLastError());
            close();
        }

        log_message(LogSeverity::WARNING, "Setup attempt " + std::to_string(attempt + 1) + " failed: " +
                    getLastError());
        if (attempt < settings_.setup_retries - 1) {
            std::this_thread::sleep_for(std::chrono::duration<double>(settings_.setup_retry_delay_s));
        }
    }

    log_message(LogSeverity::ERROR, "Failed to setup motor after " + std::to_string(settings_.setup_retries) +
                " attempts");
    return false;
}

void ModbusRtuTransport::close() {
    if (ctx_ == nullptr) {
        return;
    }

    if (connected_.load()) {
        modbus_close(ctx_);
        log_message(LogSeverity::INFO, "Serial port " + settings_.port + " closed");
    }
    modbus_free(ctx_);
    ctx_ = nullptr;
    connected_.store(false);
}

bool ModbusRtuTransport::isConnected() const {
    return connected_.load();
}

TransportResult ModbusRtuTransport::readRegister(uint16_t address, uint16_t& value) {
    if (!connected_.load()) {
        setError("Serial port not open");
        return TransportResult::NOT_CONNECTED;
    }

    if (modbus_read_registers(ctx_, address, 1, &value) != 1) {
        int error_number = errno;
        setError("Read of register " + std::to_string(address) + " failed: " + modbus_strerror(error_number));
        return mapErrno(error_number);
    }
    return TransportResult::SUCCESS;
}

TransportResult ModbusRtuTransport::writeRegisters(uint16_t address, const std::vector<uint16_t>& values) {
    if (!connected_.load()) {
        setError("Serial port not open");
        return TransportResult::NOT_CONNECTED;
    }
    if (values.empty()) {
        return TransportResult::SUCCESS;
    }

    int written = modbus_write_registers(ctx_, address, static_cast<int>(values.size()), values.data());
    if (written != static_cast<int>(values.size())) {
        int error_number = errno;
        setError("Write of register " + std::to_string(address) + " failed: " + modbus_strerror(error_number));
        return mapErrno(error_number);
    }
    return TransportResult::SUCCESS;
}

std::string ModbusRtuTransport::getLastError() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
}

const SerialSettings& ModbusRtuTransport::getSettings() const {
    return settings_;
}

// Private helper methods

TransportResult ModbusRtuTransport::mapErrno(int error_number) const {
    if (error_number == ETIMEDOUT) {
        return TransportResult::TIMEOUT;
    }
    return TransportResult::COMMUNICATION_ERROR;
}

void ModbusRtuTransport::setError(const std::string& error_message) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_ = error_message;
}

void ModbusRtuTransport::clearError() {
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_.clear();
}

} // namespace clutch_tester
