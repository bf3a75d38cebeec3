/**
 * @file fault_decoder.cpp
 * @brief Implementation of the fault/warning decoder and default tables
 */

#include "fault_decoder.hpp"

namespace clutch_tester {

std::vector<std::string> decodeBits(uint16_t register_value, const BitDescriptionTable& table) {
    std::vector<std::string> active_messages;

    for (int bit_position = 0; bit_position < 16; bit_position++) {
        if (register_value & (1u << bit_position)) {
            auto it = table.find(bit_position);
            if (it != table.end()) {
                active_messages.push_back(it->second);
            }
        }
    }

    return active_messages;
}

FaultTables FaultTables::defaults() {
    FaultTables tables;

    tables.faults = {
        {0, "Controller over voltage (flash code 1,1)"},
        {1, "Phase over current (flash code 1,2)"},
        {2, "Current sensor calibration (flash code 1,3)"},
        {3, "Current sensor over current (flash code 1,4)"},
        {4, "Controller over temperature (flash code 1,5)"},
        {5, "Motor Hall sensor fault (flash code 1,6)"},
        {6, "Controller under voltage (flash code 1,7)"},
        {7, "POST static gating test (flash code 1,8)"},
        {8, "Network communication timeout (flash code 2,1)"},
        {9, "Instantaneous phase over current (flash code 2,2)"},
        {10, "Motor over temperature (flash code 2,3)"},
        {11, "Throttle voltage outside range (flash code 2,4)"},
        {12, "Instantaneous controller over voltage (flash code 2,5)"},
        {13, "Internal error (flash code 2,6)"},
        {14, "POST dynamic gating test (flash code 2,7)"},
        {15, "Instantaneous under voltage (flash code 2,8)"}
    };

    tables.faults2 = {
        {0, "Parameter CRC (flash code 3,1)"},
        {1, "Current Scaling (flash code 3,2)"},
        {2, "Voltage Scaling (flash code 3,3)"},
        {3, "Headlight Undervoltage (flash code 3,4)"},
        {4, "Parameter 3 CRC (flash code 3,5)"},
        {5, "CAN bus (flash code 3,6)"},
        {6, "Hall Stall (flash code 3,7)"},
        {7, "Bootloader - Not used (flash code 3,8)"},
        {8, "Parameter2CRC (flash code 4,1)"},
        {9, "Hall vs Sensorless position > 30deg (flash code 4,2)"},
        {10, "Dynamic torque sensor voltage outside range (flash code 4,3)"},
        {11, "Dynamic Torque Sensor Static Voltage Fault (flash code 4,4)"},
        {12, "Remote CAN fault (flash code 4,5)"},
        {13, "Accelerometer Side Tilt fault (flash code 4,6)"},
        {14, "Open Phase Fault (flash code 4,7)"},
        {15, "Analog brake voltage out of range (flash code 4,8)"}
    };

    tables.warnings = {
        {0, "Communication Timeout (flash code 5,1)"},
        {1, "Hall Sensor (flash code 5,2)"},
        {2, "Hall stall (flash code 5,3)"},
        {3, "Wheel Speed Sensor (flash code 5,4)"},
        {4, "CAN Bus (flash code 5,5)"},
        {5, "Hall Illegal sector (flash code 5,6)"},
        {6, "Hall illegal transition (flash code 5,7)"},
        {7, "Low battery voltage foldback (flash code 5,8)"},
        {8, "High battery voltage foldback (flash code 6,1)"},
        {9, "Motor temperature foldback (flash code 6,2)"},
        {10, "Controller over temperature foldback (flash code 6,3)"},
        {11, "Low Battery SOC foldback (flash code 6,4)"},
        {12, "High Battery SOC foldback (flash code 6,5)"},
        {13, "12T overload foldback (flash code 6,6)"},
        {14, "Low temperature Battery/Controller foldback (flash code 6,7)"},
        {15, "BMS communication timeout (flash code 6,8)"}
    };

    tables.warnings2 = {
        {0, "Throttle out of range (flash code 7,1)"},
        {1, "Dual speed sensor missing pulses (flash code 7,2)"},
        {2, "Dual speed sensor no pulses (flash code 7,3)"},
        {3, "Dynamic Flash Full (flash code 7,4)"},
        {4, "Dynamic Flash Read Error (flash code 7,5)"},
        {5, "Dynamic Flash Write Error (flash code 7,6)"},
        {6, "Parameters3 missing (flash code 7,7)"},
        {7, "Missed CAN Message (flash code 7,8)"},
        {8, "High Battery temperature foldback (flash code 8,1)"},
        {9, "ADC Saturation Event (flash code 8,2)"},
        {10, "Reserved (flash code 8,3)"},
        {11, "Reserved (flash code 8,4)"},
        {12, "Reserved (flash code 8,5)"},
        {13, "Reserved (flash code 8,6)"},
        {14, "Reserved (flash code 8,7)"},
        {15, "Reserved (flash code 8,8)"}
    };

    return tables;
}

FaultDecoder::FaultDecoder(const FaultTables& tables) : tables_(tables) {
}

std::vector<std::string> FaultDecoder::decodeFaults(uint16_t faults_reg, uint16_t faults2_reg) const {
    std::vector<std::string> messages = decodeBits(faults_reg, tables_.faults);
    std::vector<std::string> messages2 = decodeBits(faults2_reg, tables_.faults2);
    messages.insert(messages.end(), messages2.begin(), messages2.end());
    return messages;
}

std::vector<std::string> FaultDecoder::decodeWarnings(uint16_t warnings_reg, uint16_t warnings2_reg) const {
    std::vector<std::string> messages = decodeBits(warnings_reg, tables_.warnings);
    std::vector<std::string> messages2 = decodeBits(warnings2_reg, tables_.warnings2);
    messages.insert(messages.end(), messages2.begin(), messages2.end());
    return messages;
}

FaultSnapshot FaultDecoder::decode(uint16_t faults_reg, uint16_t faults2_reg,
                                   uint16_t warnings_reg, uint16_t warnings2_reg) const {
    FaultSnapshot snapshot;
    snapshot.faults_reg = faults_reg;
    snapshot.faults2_reg = faults2_reg;
    snapshot.warnings_reg = warnings_reg;
    snapshot.warnings2_reg = warnings2_reg;
    snapshot.fault_messages = decodeFaults(faults_reg, faults2_reg);
    snapshot.warning_messages = decodeWarnings(warnings_reg, warnings2_reg);
    return snapshot;
}

const FaultTables& FaultDecoder::getTables() const {
    return tables_;
}

} // namespace clutch_tester
