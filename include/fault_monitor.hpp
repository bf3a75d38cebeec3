/**
 * @file fault_monitor.hpp
 * @brief Concurrent fault/warning poller
 */

#pragma once

#include "cycle_state.hpp"
#include "fault_reader.hpp"
#include "tester_configuration.hpp"
#include "tester_events.hpp"
#include "transport_gateway.hpp"

#include <atomic>
#include <functional>

namespace clutch_tester {

/**
 * @class FaultMonitor
 * @brief Polls the status registers while the test runs and triggers recovery
 *
 * Every poll publishes a FaultSnapshot to the listener. When faults are
 * present and auto-recovery is enabled the recovery hook is called and
 * awaited; after a successful recovery the motor is re-enabled.
 */
class FaultMonitor {
public:
    /// Starts a recovery run and blocks until it ends; returns its result
    using RecoveryHook = std::function<bool()>;

    FaultMonitor(TransportGateway& gateway, FaultReader& reader, CycleState& state,
                 const MonitorConfig& config, const RetryPolicy& retry,
                 TesterEventListener* listener, RecoveryHook run_recovery);

    FaultMonitor(const FaultMonitor&) = delete;
    FaultMonitor& operator=(const FaultMonitor&) = delete;

    /**
     * @brief Poll loop, returns when the test stops or cancel() is called
     */
    void run();

    void cancel();
    bool isCancelled() const { return cancelled_.load(); }

    /**
     * @brief Read faults and warnings once and publish the snapshot
     *
     * Nothing is published when a stop interrupts the retry delay.
     */
    FaultSnapshot pollOnce();

    uint64_t getPollCount() const { return poll_count_.load(); }

private:
    bool shouldStop() const;

    /**
     * @brief Re-issue the enable command after recovery
     * @return false if every retry failed (emits recovery_failed)
     */
    bool restartMotor();

    TransportGateway& gateway_;
    FaultReader& reader_;
    CycleState& state_;
    MonitorConfig config_;
    RetryPolicy retry_;
    TesterEventListener* listener_;
    RecoveryHook run_recovery_;

    std::atomic<bool> cancelled_;
    std::atomic<uint64_t> poll_count_;
};

} // namespace clutch_tester
