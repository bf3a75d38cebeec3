/**
 * @file recovery_engine.cpp
 * @brief Implementation of RecoveryEngine
 */

#include "recovery_engine.hpp"
#include "tester_log.hpp"

#include <algorithm>

namespace clutch_tester {

RecoveryEngine::RecoveryEngine(TransportGateway& gateway, FaultReader& reader, CycleState& state,
                               const RecoveryConfig& config, TesterEventListener* listener)
    : gateway_(gateway), reader_(reader), state_(state), config_(config), listener_(listener),
      cancelled_(false), stage_index_(0), attempt_in_stage_(0) {
}

bool RecoveryEngine::run() {
    if (config_.stages.empty()) {
        log_message(LogSeverity::ERROR, "Fault recovery has no stages configured");
        return false;
    }

    stage_index_.store(0);
    attempt_in_stage_.store(0);
    emit(RecoveryEvent::STARTED, stageLabel());

    while (true) {
        if (shouldStop()) {
            return stopped();
        }

        try {
            log_message(LogSeverity::WARNING, "Fault recovery - " + stageLabel());

            // Grace period before the first attempt of every stage
            if (attempt_in_stage_.load() == 0) {
                log_message(LogSeverity::INFO, "Waiting " + std::to_string(config_.initial_wait_seconds) +
                            "s before first recovery attempt");
                if (!countdown(config_.initial_wait_seconds, config_.initial_wait_seconds)) {
                    return stopped();
                }
            }

            log_message(LogSeverity::INFO, "Attempting to clear faults...");
            emit(RecoveryEvent::WAITING, "Clearing faults");
            issueClear();

            if (!state_.sleepUnless(config_.clear_verify_delay_s, [this]() { return shouldStop(); })) {
                return stopped();
            }

            if (faultsCleared()) {
                log_message(LogSeverity::INFO, "Faults successfully cleared");
                emit(RecoveryEvent::SUCCESSFUL, "Faults cleared");
                return true;
            }

            const RecoveryStage stage = config_.stages[stage_index_.load()];
            log_message(LogSeverity::INFO, "Faults still present. Waiting " +
                        std::to_string(stage.interval_seconds) + "s before next attempt");
            emit(RecoveryEvent::WAITING, stageLabel());

            int chunk = std::max(1, std::min(stage.interval_seconds, config_.check_chunk_seconds));
            int elapsed = 0;
            while (elapsed < stage.interval_seconds) {
                int ticks = std::min(chunk, stage.interval_seconds - elapsed);
                if (!countdown(ticks, stage.interval_seconds - elapsed)) {
                    return stopped();
                }
                elapsed += ticks;

                if (faultsCleared()) {
                    log_message(LogSeverity::INFO, "Periodic fault check: no active faults");
                    emit(RecoveryEvent::SUCCESSFUL, "Faults cleared");
                    return true;
                }
            }

            int attempt = attempt_in_stage_.load() + 1;
            if (attempt >= stage.attempts) {
                int next_stage = (stage_index_.load() + 1) % static_cast<int>(config_.stages.size());
                stage_index_.store(next_stage);
                attempt_in_stage_.store(0);
                log_message(LogSeverity::WARNING, "Moving to fault recovery stage " + std::to_string(next_stage + 1));
                emit(RecoveryEvent::STAGE_CHANGE, "Stage " + std::to_string(next_stage + 1));
            } else {
                attempt_in_stage_.store(attempt);
            }

        } catch (const std::exception& e) {
            log_message(LogSeverity::ERROR, std::string("Error during fault recovery: ") + e.what());
            emit(RecoveryEvent::ERROR, e.what());
            if (!state_.sleepUnless(config_.error_backoff_s, [this]() { return shouldStop(); })) {
                return stopped();
            }
        }
    }
}

void RecoveryEngine::cancel() {
    cancelled_.store(true);
    state_.notifyAll();
}

RecoveryState RecoveryEngine::getState() const {
    RecoveryState state;
    state.stage_index = stage_index_.load();
    state.attempt_in_stage = attempt_in_stage_.load();
    return state;
}

bool RecoveryEngine::shouldStop() const {
    return cancelled_.load() || !state_.isAutoRecoveryEnabled();
}

bool RecoveryEngine::countdown(int ticks, int remaining_at_start) {
    for (int i = 0; i < ticks; ++i) {
        emit(RecoveryEvent::COUNTDOWN, std::to_string(remaining_at_start - i) + "s");
        if (!state_.sleepUnless(config_.tick_s, [this]() { return shouldStop(); })) {
            return false;
        }
    }
    return true;
}

void RecoveryEngine::issueClear() {
    CommandResult result = gateway_.execute(TesterConstants::CMD_CLEAR_FAULTS,
                                            TesterConstants::CLEAR_FAULTS_VALUE);
    if (result != CommandResult::SUCCESS) {
        log_message(LogSeverity::WARNING, std::string("Clear faults command failed: ") +
                    commandResultStr(result));
    }
}

bool RecoveryEngine::faultsCleared() {
    FaultCheckResult faults = reader_.checkFaults([this]() { return shouldStop(); });
    return faults.read_ok && faults.messages.empty();
}

bool RecoveryEngine::stopped() {
    log_message(LogSeverity::INFO, "Fault recovery stopped");
    emit(RecoveryEvent::STOPPED, "User stopped recovery");
    return false;
}

void RecoveryEngine::emit(RecoveryEvent event, const std::string& detail) {
    if (listener_) {
        listener_->onRecoveryEvent(event, detail);
    }
}

std::string RecoveryEngine::stageLabel() const {
    return "Stage " + std::to_string(stage_index_.load() + 1) +
           ", Attempt " + std::to_string(attempt_in_stage_.load() + 1);
}

} // namespace clutch_tester
