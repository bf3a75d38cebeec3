/**
 * @file fault_reader.cpp
 * @brief Implementation of FaultReader
 */

#include "fault_reader.hpp"
#include "tester_log.hpp"

namespace clutch_tester {

FaultReader::FaultReader(TransportGateway& gateway, const FaultDecoder& decoder, CycleState& state,
                         const RetryPolicy& retry)
    : gateway_(gateway), decoder_(decoder), state_(state), retry_(retry) {
    faults_address_ = telemetryAddress(TesterConstants::TLM_FAULTS, TesterConstants::FAULTS_ADDRESS);
    faults2_address_ = telemetryAddress(TesterConstants::TLM_FAULTS2, TesterConstants::FAULTS2_ADDRESS);
    warnings_address_ = telemetryAddress(TesterConstants::TLM_WARNINGS, TesterConstants::WARNINGS_ADDRESS);
    warnings2_address_ = telemetryAddress(TesterConstants::TLM_WARNINGS2, TesterConstants::WARNINGS2_ADDRESS);
}

FaultCheckResult FaultReader::checkFaults(const AbortCheck& abort) {
    return readPair(faults_address_, faults2_address_, "faults", &FaultDecoder::decodeFaults, abort);
}

FaultCheckResult FaultReader::checkWarnings(const AbortCheck& abort) {
    return readPair(warnings_address_, warnings2_address_, "warnings", &FaultDecoder::decodeWarnings, abort);
}

FaultSnapshot FaultReader::readSnapshot(const AbortCheck& abort, bool* aborted) {
    FaultCheckResult faults = checkFaults(abort);
    FaultCheckResult warnings;
    if (!faults.aborted) {
        warnings = checkWarnings(abort);
    }
    if (aborted) {
        *aborted = faults.aborted || warnings.aborted;
    }

    FaultSnapshot snapshot;
    snapshot.faults_reg = faults.reg;
    snapshot.faults2_reg = faults.reg2;
    snapshot.warnings_reg = warnings.reg;
    snapshot.warnings2_reg = warnings.reg2;
    snapshot.fault_messages = std::move(faults.messages);
    snapshot.warning_messages = std::move(warnings.messages);
    return snapshot;
}

FaultCheckResult FaultReader::readPair(uint16_t address, uint16_t address2, const char* what,
                                       std::vector<std::string> (FaultDecoder::*decode)(uint16_t, uint16_t) const,
                                       const AbortCheck& abort) {
    FaultCheckResult result;
    const AbortCheck never = []() { return false; };
    const AbortCheck& stop = abort ? abort : never;

    TransportResult last = TransportResult::NOT_CONNECTED;

    for (int attempt = 0; attempt < retry_.max_retries; ++attempt) {
        uint16_t reg = 0;
        uint16_t reg2 = 0;

        last = gateway_.readRegister(address, reg);
        if (last == TransportResult::SUCCESS) {
            last = gateway_.readRegister(address2, reg2);
        }

        if (last == TransportResult::SUCCESS) {
            result.reg = reg;
            result.reg2 = reg2;
            result.messages = (decoder_.*decode)(reg, reg2);
            result.read_ok = true;
            return result;
        }

        log_message(LogSeverity::WARNING, std::string("Read of ") + what + " failed (attempt " +
                    std::to_string(attempt + 1) + "/" + std::to_string(retry_.max_retries) + "): " +
                    gateway_.getLastError());

        if (attempt < retry_.max_retries - 1 && !state_.sleepUnless(retry_.retry_delay_s, stop)) {
            log_message(LogSeverity::INFO, std::string("Read of ") + what + " abandoned, stop requested");
            result.aborted = true;
            return result;
        }
    }

    if (last != TransportResult::TIMEOUT) {
        log_message(LogSeverity::ERROR, std::string("Error checking ") + what + ": " + gateway_.getLastError());
        result.messages.push_back(INTERNAL_ERROR_MESSAGE);
    }
    return result;
}

uint16_t FaultReader::telemetryAddress(const char* name, uint16_t fallback) const {
    const TelemetryPoint* point = gateway_.getCatalog().findTelemetry(name);
    return point ? point->address : fallback;
}

} // namespace clutch_tester
