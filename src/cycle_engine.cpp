/**
 * @file cycle_engine.cpp
 * @brief Implementation of CycleEngine
 */

#include "cycle_engine.hpp"
#include "tester_log.hpp"

#include <chrono>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>
#include <vector>

namespace clutch_tester {

namespace {

std::string formatValue(double value, int precision = 2) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

} // namespace

// === TestParameters ===

TestParameters TestParameters::defaults() {
    return TestParameters{};
}

bool TestParameters::validate(std::string& error) const {
    if (forward_torque <= 0.0) {
        error = "Forward torque must be positive";
        return false;
    }
    if (reverse_torque >= 0.0) {
        error = "Reverse torque must be negative";
        return false;
    }
    if (forward_duration_s <= 0.0 || reverse_duration_s <= 0.0) {
        error = "Segment durations must be positive";
        return false;
    }
    if (max_motor_current < 0.0 || max_brake_current < 0.0) {
        error = "Current limits must not be negative";
        return false;
    }
    return true;
}

const char* testOutcomeStr(TestOutcome outcome) {
    switch (outcome) {
        case TestOutcome::NOT_STARTED: return "NOT_STARTED";
        case TestOutcome::RUNNING: return "RUNNING";
        case TestOutcome::COMPLETED: return "COMPLETED";
        case TestOutcome::STOPPED: return "STOPPED";
        case TestOutcome::CLUTCH_FAILURE: return "CLUTCH_FAILURE";
        case TestOutcome::STARTUP_FAILED: return "STARTUP_FAILED";
        case TestOutcome::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

// === CycleEngine ===

CycleEngine::CycleEngine(TransportGateway& gateway, CycleState& state, CycleLog& cycle_log,
                         const CycleConfig& config, const RetryPolicy& retry, TesterEventListener* listener)
    : gateway_(gateway), state_(state), cycle_log_(cycle_log), config_(config), retry_(retry),
      listener_(listener), outcome_(TestOutcome::NOT_STARTED) {
}

bool CycleEngine::initializeMotor(const TestParameters& params) {
    const std::vector<std::pair<const char*, double>> commands = {
        {TesterConstants::CMD_SPEED_REGULATOR_MODE, TesterConstants::SPEED_REGULATOR_MODE},
        {TesterConstants::CMD_REGEN_CURRENT_LIMIT, config_.regen_current_limit},
        {TesterConstants::CMD_BATTERY_CURRENT_LIMIT, config_.battery_current_limit},
        {TesterConstants::CMD_MOTORING_CURRENT, params.max_motor_current},
        {TesterConstants::CMD_BRAKING_CURRENT, params.max_brake_current},
        {TesterConstants::CMD_SPEED, params.target_rpm},
        {TesterConstants::CMD_TORQUE, 0.0},
        {TesterConstants::CMD_STATE, TesterConstants::STATE_ENABLED}
    };

    for (const auto& [command, value] : commands) {
        if (!executeWithRetry(command, value)) {
            if (!state_.isRunning()) {
                log_message(LogSeverity::INFO, "Startup interrupted by stop request");
                outcome_.store(TestOutcome::STOPPED);
                return false;
            }
            log_message(LogSeverity::ERROR, std::string("Failed to set ") + command + " after multiple attempts");
            state_.setRunning(false);
            outcome_.store(TestOutcome::STARTUP_FAILED);
            return false;
        }

        log_message(LogSeverity::INFO, std::string("Successfully set ") + command + " to " + formatValue(value));

        if (!state_.sleepWhileRunning(config_.step_pause_s)) {
            outcome_.store(TestOutcome::STOPPED);
            return false;
        }
    }

    log_message(LogSeverity::INFO, "Motor enabled successfully");
    return true;
}

int CycleEngine::runCycles(const TestParameters& params) {
    outcome_.store(TestOutcome::RUNNING);
    int count = state_.getCurrentCycle();

    struct Segment {
        double torque;
        double duration_s;
        TimerDirection direction;
    };
    const Segment segments[] = {
        {params.forward_torque, params.forward_duration_s, TimerDirection::FORWARD},
        {params.reverse_torque, params.reverse_duration_s, TimerDirection::REVERSE}
    };
    const size_t segment_count = sizeof(segments) / sizeof(segments[0]);

    while (state_.isRunning()) {
        auto cycle_start = std::chrono::steady_clock::now();
        log_message(LogSeverity::INFO, "Starting cycle " + std::to_string(count));

        bool forward_verified = false;
        bool reverse_verified = false;

        for (size_t idx = 0; idx < segment_count; ++idx) {
            if (!state_.isRunning()) {
                break;
            }

            const Segment& segment = segments[idx];
            SegmentResult result = runSegment(segment.torque, segment.duration_s, segment.direction);

            if (result == SegmentResult::CLUTCH_FAILURE) {
                log_message(LogSeverity::CRITICAL, "One-way clutch broken! Reverse rotation detected. Stopping test.");
                emergencyShutdown();
                outcome_.store(TestOutcome::CLUTCH_FAILURE);
                return count;
            }

            if (result == SegmentResult::VERIFIED) {
                if (segment.direction == TimerDirection::FORWARD) {
                    forward_verified = true;
                } else {
                    reverse_verified = true;
                }
            }

            // Zero torque between direction changes
            if (idx < segment_count - 1 && state_.isRunning()) {
                if (!executeWithRetry(TesterConstants::CMD_TORQUE, 0.0)) {
                    log_message(LogSeverity::ERROR, "Failed to zero torque between segments");
                }
                state_.sleepWhileRunning(config_.transition_pause_s);
            }
        }

        if (state_.isRunning()) {
            sampleTelemetry();
        }

        if (forward_verified && reverse_verified) {
            if (cycle_log_.append(count)) {
                log_message(LogSeverity::INFO, "Cycle " + std::to_string(count) + " completed and logged successfully");
                count++;
                state_.setCurrentCycle(count);
            }
        } else {
            log_message(LogSeverity::WARNING, "Cycle " + std::to_string(count) +
                        " skipped due to unsuccessful rotation (Forward: " +
                        (forward_verified ? "true" : "false") + ", Reverse: " +
                        (reverse_verified ? "true" : "false") + ")");
        }

        if (state_.targetReached(count)) {
            log_message(LogSeverity::INFO, "Target of " + std::to_string(state_.getTargetCycles()) +
                        " cycles reached");
            outcome_.store(TestOutcome::COMPLETED);
            state_.setRunning(false);
        }

        std::chrono::duration<double> cycle_time = std::chrono::steady_clock::now() - cycle_start;
        log_message(LogSeverity::INFO, "Cycle completed in " + formatValue(cycle_time.count()) + " seconds");
    }

    if (outcome_.load() == TestOutcome::RUNNING) {
        outcome_.store(TestOutcome::STOPPED);
    }
    return count;
}

void CycleEngine::emergencyShutdown() {
    CommandResult torque = gateway_.execute(TesterConstants::CMD_TORQUE, 0.0);
    CommandResult disable = gateway_.execute(TesterConstants::CMD_STATE, TesterConstants::STATE_DISABLED);

    if (torque != CommandResult::SUCCESS || disable != CommandResult::SUCCESS) {
        log_message(LogSeverity::ERROR, "Emergency shutdown incomplete: torque " +
                    std::string(commandResultStr(torque)) + ", state " + commandResultStr(disable));
    }

    state_.requestStop();
}

CycleEngine::SegmentResult CycleEngine::runSegment(double torque, double duration_s, TimerDirection direction) {
    const char* name = timerDirectionName(direction);
    log_message(LogSeverity::INFO, std::string("Setting ") + name + " torque: " + formatValue(torque) +
                " for " + formatValue(duration_s) + " seconds");

    if (!executeWithRetry(TesterConstants::CMD_TORQUE, torque)) {
        log_message(LogSeverity::ERROR, std::string("Failed to set ") + name + " torque after " +
                    std::to_string(retry_.max_retries) + " retries");
        return SegmentResult::SKIPPED;
    }

    bool verified = false;
    int checks = 0;
    auto start = std::chrono::steady_clock::now();

    while (state_.isRunning()) {
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
        if (elapsed.count() >= duration_s) {
            break;
        }

        emitTimer(direction, elapsed.count(), duration_s);

        if (!verified && checks < config_.max_direction_checks) {
            double rpm = 0.0;
            if (!gateway_.readTelemetry(TesterConstants::TLM_MOTOR_RPM, rpm)) {
                log_message(LogSeverity::WARNING, "Error reading motor RPM: " + gateway_.getLastError());
                checks++;
            } else {
                log_message(LogSeverity::INFO, "Motor speed: " + formatValue(rpm) + " RPM, expected " +
                            (torque > 0 ? "positive" : "negative"));

                if (torque > 0 && rpm > config_.forward_rpm_threshold) {
                    verified = true;
                } else if (torque < 0) {
                    if (std::fabs(rpm) > config_.clutch_failure_rpm) {
                        emitTimer(TimerDirection::NONE, 0.0, 1.0);
                        return SegmentResult::CLUTCH_FAILURE;
                    }
                    if (std::fabs(rpm) < config_.freewheel_rpm) {
                        verified = true;
                    }
                } else if (rpm < -config_.forward_rpm_threshold) {
                    log_message(LogSeverity::WARNING, "Motor rotating in wrong direction! Reapplying torque with higher value");
                    CommandResult result = gateway_.execute(TesterConstants::CMD_TORQUE,
                                                            torque * config_.correction_factor);
                    if (result != CommandResult::SUCCESS) {
                        log_message(LogSeverity::ERROR, std::string("Torque correction failed: ") + commandResultStr(result));
                    }
                }

                checks++;

                if (checks >= config_.max_direction_checks && !verified) {
                    log_message(LogSeverity::ERROR, std::string("Failed to achieve ") + name + " rotation after " +
                                std::to_string(config_.max_direction_checks) + " attempts");
                    CommandResult result = gateway_.execute(TesterConstants::CMD_TORQUE,
                                                            torque * config_.escalation_factor);
                    if (result != CommandResult::SUCCESS) {
                        log_message(LogSeverity::ERROR, std::string("Torque escalation failed: ") + commandResultStr(result));
                    }
                }
            }
        }

        state_.sleepWhileRunning(config_.poll_interval_s);
    }

    emitTimer(TimerDirection::NONE, 0.0, 1.0);
    return verified ? SegmentResult::VERIFIED : SegmentResult::UNVERIFIED;
}

bool CycleEngine::executeWithRetry(const char* command, double value) {
    for (int attempt = 0; attempt < retry_.max_retries; ++attempt) {
        CommandResult result = gateway_.execute(command, value);
        if (result == CommandResult::SUCCESS) {
            return true;
        }

        // Unknown names and unencodable values fail the same way every time
        if (result != CommandResult::TRANSPORT_ERROR) {
            return false;
        }

        log_message(LogSeverity::WARNING, std::string("Failed to set ") + command + " (attempt " +
                    std::to_string(attempt + 1) + "): " + gateway_.getLastError());

        if (attempt < retry_.max_retries - 1 && !state_.sleepWhileRunning(retry_.retry_delay_s)) {
            return false;
        }
    }
    return false;
}

void CycleEngine::sampleTelemetry() {
    double motor_temp = gateway_.readTelemetry(TesterConstants::TLM_MOTOR_TEMP);
    double controller_temp = gateway_.readTelemetry(TesterConstants::TLM_CONTROLLER_TEMP);
    double battery_voltage = gateway_.readTelemetry(TesterConstants::TLM_BATTERY_VOLTAGE);

    log_message(LogSeverity::INFO, "Motor temperature: " + formatValue(motor_temp, 1) +
                "°C, Controller: " + formatValue(controller_temp, 1) +
                "°C, Battery: " + formatValue(battery_voltage) + "V");
}

void CycleEngine::emitTimer(TimerDirection direction, double elapsed, double total) {
    if (listener_) {
        listener_->onTimerProgress(direction, elapsed, total);
    }
}

} // namespace clutch_tester
