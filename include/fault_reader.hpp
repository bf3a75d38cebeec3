/**
 * @file fault_reader.hpp
 * @brief Retried reads of the fault and warning registers
 */

#pragma once

#include "cycle_state.hpp"
#include "fault_decoder.hpp"
#include "tester_configuration.hpp"
#include "transport_gateway.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace clutch_tester {

/**
 * @struct FaultCheckResult
 * @brief Decoded content of one register pair
 *
 * When the read fails after all retries, messages is empty for a timeout and
 * holds the single entry "Internal Modbus error" for any other failure. An
 * aborted read has no messages.
 */
struct FaultCheckResult {
    std::vector<std::string> messages;
    uint16_t reg = 0;
    uint16_t reg2 = 0;
    bool read_ok = false;
    bool aborted = false;   ///< Retry wait interrupted by the abort condition
};

/**
 * @class FaultReader
 * @brief Reads and decodes fault/warning register pairs through the gateway
 *
 * Each register read holds the gateway gate on its own; a pair is not read
 * atomically. The delay between retries is a wait on the shared CycleState,
 * so callers pass their stop condition and get control back within one wake-up
 * of a stop request.
 */
class FaultReader {
public:
    static constexpr const char* INTERNAL_ERROR_MESSAGE = "Internal Modbus error";

    /// Stop condition checked during retry delays; empty means never abort
    using AbortCheck = std::function<bool()>;

    FaultReader(TransportGateway& gateway, const FaultDecoder& decoder, CycleState& state,
                const RetryPolicy& retry);

    FaultCheckResult checkFaults(const AbortCheck& abort = nullptr);
    FaultCheckResult checkWarnings(const AbortCheck& abort = nullptr);

    /**
     * @brief Faults then warnings, decoded into one snapshot
     * @param aborted Set to true if a retry delay was interrupted (optional)
     */
    FaultSnapshot readSnapshot(const AbortCheck& abort = nullptr, bool* aborted = nullptr);

private:
    FaultCheckResult readPair(uint16_t address, uint16_t address2, const char* what,
                              std::vector<std::string> (FaultDecoder::*decode)(uint16_t, uint16_t) const,
                              const AbortCheck& abort);
    uint16_t telemetryAddress(const char* name, uint16_t fallback) const;

    TransportGateway& gateway_;
    const FaultDecoder& decoder_;
    CycleState& state_;
    RetryPolicy retry_;

    uint16_t faults_address_;
    uint16_t faults2_address_;
    uint16_t warnings_address_;
    uint16_t warnings2_address_;
};

} // namespace clutch_tester
