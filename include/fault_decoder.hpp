/**
 * @file fault_decoder.hpp
 * @brief Fault and Warning Register Decoder
 *
 * Turns the bitmapped fault/warning status words of the motor controller into
 * human-readable condition lists. Each register has its own bit description
 * table; set bits without a description are ignored.
 */

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace clutch_tester {

/// Bit position (0-15) to condition description
using BitDescriptionTable = std::map<int, std::string>;

/**
 * @brief Decode a 16-bit register against a description table
 * @param register_value Raw register content
 * @param table Bit descriptions
 * @return Descriptions of all set bits present in the table, bit 0 first
 */
std::vector<std::string> decodeBits(uint16_t register_value, const BitDescriptionTable& table);

/**
 * @struct FaultTables
 * @brief Description tables for the four status registers
 */
struct FaultTables {
    BitDescriptionTable faults;      ///< Fault register (flash codes 1,x and 2,x)
    BitDescriptionTable faults2;     ///< Second fault register (flash codes 3,x and 4,x)
    BitDescriptionTable warnings;    ///< Warning register (flash codes 5,x and 6,x)
    BitDescriptionTable warnings2;   ///< Second warning register (flash codes 7,x and 8,x)

    /**
     * @brief Tables of the motor controller used on the rig
     */
    static FaultTables defaults();
};

/**
 * @struct FaultSnapshot
 * @brief One poll of the fault and warning registers
 */
struct FaultSnapshot {
    uint16_t faults_reg = 0;
    uint16_t faults2_reg = 0;
    uint16_t warnings_reg = 0;
    uint16_t warnings2_reg = 0;
    std::vector<std::string> fault_messages;     ///< Decoded faults, faults register first
    std::vector<std::string> warning_messages;   ///< Decoded warnings, warnings register first

    bool hasFaults() const { return !fault_messages.empty(); }
    bool hasWarnings() const { return !warning_messages.empty(); }
};

/**
 * @class FaultDecoder
 * @brief Applies the configured description tables to register snapshots
 */
class FaultDecoder {
public:
    explicit FaultDecoder(const FaultTables& tables = FaultTables::defaults());

    std::vector<std::string> decodeFaults(uint16_t faults_reg, uint16_t faults2_reg) const;
    std::vector<std::string> decodeWarnings(uint16_t warnings_reg, uint16_t warnings2_reg) const;

    /**
     * @brief Build a complete snapshot from four raw registers
     */
    FaultSnapshot decode(uint16_t faults_reg, uint16_t faults2_reg,
                         uint16_t warnings_reg, uint16_t warnings2_reg) const;

    const FaultTables& getTables() const;

private:
    FaultTables tables_;
};

} // namespace clutch_tester
