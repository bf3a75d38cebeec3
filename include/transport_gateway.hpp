/**
 * @file transport_gateway.hpp
 * @brief Serialized access to the motor controller registers
 *
 * The serial link is a single shared resource used concurrently by the cycle
 * driver, the fault monitor and recovery runs. TransportGateway owns the one
 * mutual-exclusion gate: every register read or write holds it for the whole
 * transaction. The gate is not reentrant and two calls are never atomic
 * together.
 */

#pragma once

#include "register_map.hpp"
#include "register_transport.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace clutch_tester {

/**
 * @brief Result of executing a catalog command
 */
enum class CommandResult {
    SUCCESS,           ///< Register written
    UNKNOWN_COMMAND,   ///< Name not in catalog, no I/O performed
    INVALID_VALUE,     ///< Encoded value does not fit the register, no I/O performed
    TRANSPORT_ERROR    ///< Write attempted and failed
};

const char* commandResultStr(CommandResult result);

/**
 * @brief Register access statistics
 */
struct GatewayStatistics {
    uint64_t reads_attempted = 0;
    uint64_t reads_failed = 0;
    uint64_t writes_attempted = 0;
    uint64_t writes_failed = 0;
};

/**
 * @class TransportGateway
 * @brief Mutually exclusive register access plus catalog-level helpers
 */
class TransportGateway {
public:
    /**
     * @brief Constructor
     * @param transport Physical transport (must not be null)
     * @param catalog Register catalog used by execute() and readTelemetry()
     */
    TransportGateway(std::shared_ptr<RegisterTransport> transport, const RegisterCatalog& catalog);

    TransportGateway(const TransportGateway&) = delete;
    TransportGateway& operator=(const TransportGateway&) = delete;

    // === Raw Register Access ===

    TransportResult readRegister(uint16_t address, uint16_t& value);
    TransportResult writeRegister(uint16_t address, uint16_t raw_value);

    // === Catalog Operations ===

    /**
     * @brief Encode and write a named command
     * @param command_name Catalog command name
     * @param value Value in engineering units
     * @return Command result
     */
    CommandResult execute(const std::string& command_name, double value);

    /**
     * @brief Read and scale a named telemetry point
     * @param name Catalog telemetry name
     * @return Scaled value, 0.0 if the name is unknown or the read failed
     *
     * @note 0.0 is also a valid reading. Use the two-argument overload when
     *       the caller has to tell the cases apart.
     */
    double readTelemetry(const std::string& name);

    /**
     * @brief Read and scale a named telemetry point
     * @param name Catalog telemetry name
     * @param value Receives the scaled value (0.0 on failure)
     * @return true if the value was actually read
     */
    bool readTelemetry(const std::string& name, double& value);

    // === Diagnostics ===

    GatewayStatistics getStatistics() const;
    std::string getLastError() const;
    const RegisterCatalog& getCatalog() const;

private:
    void setError(const std::string& error_message);

    std::shared_ptr<RegisterTransport> transport_;  ///< Physical link
    RegisterCatalog catalog_;                       ///< Name lookup
    std::mutex gate_;                               ///< Serializes every register transaction

    mutable std::mutex stats_mutex_;                ///< Protects statistics and last error
    GatewayStatistics stats_;
    std::string last_error_;
};

} // namespace clutch_tester
