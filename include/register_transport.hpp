/**
 * @file register_transport.hpp
 * @brief Register-level transport interface
 *
 * Abstracts the physical link to the motor controller. The production
 * implementation speaks Modbus RTU over a serial port; tests plug in a
 * simulated controller. Implementations may block for up to their configured
 * response timeout and are not required to be thread-safe: all access is
 * serialized by TransportGateway.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace clutch_tester {

/**
 * @brief Transport operation result codes
 */
enum class TransportResult {
    SUCCESS,              ///< Operation completed successfully
    TIMEOUT,              ///< Slave did not answer within the response timeout
    COMMUNICATION_ERROR,  ///< Framing, CRC, exception response or I/O error
    NOT_CONNECTED         ///< Link not open
};

/**
 * @brief Human-readable result name
 */
const char* transportResultStr(TransportResult result);

/**
 * @class RegisterTransport
 * @brief Read/write access to 16-bit holding registers of one slave
 */
class RegisterTransport {
public:
    virtual ~RegisterTransport() = default;

    /**
     * @brief Read a single holding register
     * @param address Register address
     * @param value Receives the raw register content
     * @return Transport result
     */
    virtual TransportResult readRegister(uint16_t address, uint16_t& value) = 0;

    /**
     * @brief Write consecutive holding registers
     * @param address First register address
     * @param values Raw register contents
     * @return Transport result
     */
    virtual TransportResult writeRegisters(uint16_t address, const std::vector<uint16_t>& values) = 0;

    /**
     * @brief Description of the last failure
     */
    virtual std::string getLastError() const = 0;
};

} // namespace clutch_tester
