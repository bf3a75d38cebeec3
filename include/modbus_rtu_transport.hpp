/**
 * @file modbus_rtu_transport.hpp
 * @brief Modbus RTU register transport over a serial port
 *
 * Binds RegisterTransport onto libmodbus. The wire protocol (framing, CRC,
 * exception responses) is handled by the library; this class owns the
 * context, configures the serial line and maps library errors onto
 * TransportResult codes.
 */

#pragma once

#include "register_map.hpp"
#include "register_transport.hpp"
#include "tester_configuration.hpp"

#include <atomic>
#include <mutex>
#include <string>

extern "C" {
#include <modbus/modbus.h>
}

namespace clutch_tester {

/**
 * @class ModbusRtuTransport
 * @brief libmodbus RTU client for one slave
 */
class ModbusRtuTransport : public RegisterTransport {
public:
    /**
     * @brief Constructor
     * @param settings Serial port, framing, slave id and timeout
     */
    explicit ModbusRtuTransport(const SerialSettings& settings);

    /**
     * @brief Destructor - closes the port
     */
    ~ModbusRtuTransport() override;

    // Delete copy constructor and assignment (serial port is unique)
    ModbusRtuTransport(const ModbusRtuTransport&) = delete;
    ModbusRtuTransport& operator=(const ModbusRtuTransport&) = delete;

    // === Connection Lifecycle ===

    /**
     * @brief Create the libmodbus context and open the serial port
     * @return true if the port is open
     */
    bool initialize();

    /**
     * @brief Open the port and validate the link, retrying on failure
     * @param probe_address Register read to confirm the slave answers
     * @return true once a probe read succeeded
     *
     * Makes SerialSettings::setup_retries attempts, SerialSettings::setup_retry_delay_s apart.
     */
    bool setupConnection(uint16_t probe_address = TesterConstants::FAULTS_ADDRESS);

    /**
     * @brief Close the port and free the context
     */
    void close();

    bool isConnected() const;

    // === RegisterTransport ===

    TransportResult readRegister(uint16_t address, uint16_t& value) override;
    TransportResult writeRegisters(uint16_t address, const std::vector<uint16_t>& values) override;
    std::string getLastError() const override;

    const SerialSettings& getSettings() const;

private:
    TransportResult mapErrno(int error_number) const;
    void setError(const std::string& error_message);
    void clearError();

    SerialSettings settings_;
    modbus_t* ctx_;
    std::atomic<bool> connected_;

    mutable std::mutex error_mutex_;
    std::string last_error_;
};

} // namespace clutch_tester
