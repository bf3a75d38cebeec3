/**
 * @file fault_monitor.cpp
 * @brief Implementation of FaultMonitor
 */

#include "fault_monitor.hpp"
#include "tester_log.hpp"

namespace clutch_tester {

namespace {

std::string joinMessages(const std::vector<std::string>& messages) {
    std::string joined;
    for (const auto& message : messages) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += message;
    }
    return joined;
}

} // namespace

FaultMonitor::FaultMonitor(TransportGateway& gateway, FaultReader& reader, CycleState& state,
                           const MonitorConfig& config, const RetryPolicy& retry,
                           TesterEventListener* listener, RecoveryHook run_recovery)
    : gateway_(gateway), reader_(reader), state_(state), config_(config), retry_(retry),
      listener_(listener), run_recovery_(std::move(run_recovery)),
      cancelled_(false), poll_count_(0) {
}

void FaultMonitor::run() {
    log_message(LogSeverity::INFO, "Fault monitor started");
    auto stop = [this]() { return shouldStop(); };

    while (!shouldStop()) {
        try {
            FaultSnapshot snapshot = pollOnce();

            if (snapshot.hasFaults() && state_.isAutoRecoveryEnabled() && !shouldStop()) {
                log_message(LogSeverity::WARNING, "Faults detected by monitor: " +
                            joinMessages(snapshot.fault_messages));

                bool recovered = run_recovery_ ? run_recovery_() : false;
                if (recovered && state_.isRunning()) {
                    log_message(LogSeverity::INFO, "Restarting motor after successful fault recovery");
                    if (restartMotor()) {
                        log_message(LogSeverity::INFO, "Motor re-enabled");
                    }
                    if (!state_.sleepUnless(config_.restart_pause_s, stop)) {
                        break;
                    }
                }
            }

            if (!state_.sleepUnless(config_.interval_s, stop)) {
                break;
            }

        } catch (const std::exception& e) {
            log_message(LogSeverity::ERROR, std::string("Error in fault monitor: ") + e.what());
            if (!state_.sleepUnless(config_.error_backoff_s, stop)) {
                break;
            }
        }
    }

    log_message(LogSeverity::INFO, "Fault monitor stopped");
}

void FaultMonitor::cancel() {
    cancelled_.store(true);
    state_.notifyAll();
}

FaultSnapshot FaultMonitor::pollOnce() {
    bool aborted = false;
    FaultSnapshot snapshot = reader_.readSnapshot([this]() { return shouldStop(); }, &aborted);
    if (aborted) {
        return snapshot;
    }
    poll_count_++;

    if (listener_) {
        listener_->onFaultUpdate(snapshot);
    }
    return snapshot;
}

bool FaultMonitor::shouldStop() const {
    return cancelled_.load() || !state_.isRunning();
}

bool FaultMonitor::restartMotor() {
    for (int attempt = 0; attempt < retry_.max_retries; ++attempt) {
        CommandResult result = gateway_.execute(TesterConstants::CMD_STATE, TesterConstants::STATE_ENABLED);
        if (result == CommandResult::SUCCESS) {
            return true;
        }

        log_message(LogSeverity::WARNING, "Motor restart attempt " + std::to_string(attempt + 1) +
                    " failed: " + commandResultStr(result));
        if (result != CommandResult::TRANSPORT_ERROR) {
            break;
        }
        if (attempt < retry_.max_retries - 1 &&
            !state_.sleepUnless(retry_.retry_delay_s, [this]() { return shouldStop(); })) {
            break;
        }
    }

    log_message(LogSeverity::ERROR, "Failed to restart motor after recovery");
    if (listener_) {
        listener_->onRecoveryEvent(RecoveryEvent::FAILED, "Motor restart failed, manual reset required");
    }
    return false;
}

} // namespace clutch_tester
