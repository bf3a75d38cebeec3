/**
 * @file recovery_engine.hpp
 * @brief Staged automatic fault recovery
 *
 * One RecoveryEngine instance performs one recovery run: it keeps clearing
 * faults with growing waits between attempts until the faults are gone or
 * the run is stopped. Stages are walked in order and wrap to the first stage
 * after the last, so a run never gives up on its own.
 *
 * Time is counted in ticks of RecoveryConfig::tick_s seconds; every tick is
 * an interruptible wait on the shared CycleState.
 */

#pragma once

#include "cycle_state.hpp"
#include "fault_reader.hpp"
#include "tester_configuration.hpp"
#include "tester_events.hpp"
#include "transport_gateway.hpp"

#include <atomic>

namespace clutch_tester {

/**
 * @struct RecoveryState
 * @brief Position of a run within the stage table
 */
struct RecoveryState {
    int stage_index = 0;        ///< 0-based stage
    int attempt_in_stage = 0;   ///< 0-based attempt within the stage
};

/**
 * @class RecoveryEngine
 * @brief Escalating clear-and-verify loop
 */
class RecoveryEngine {
public:
    /**
     * @brief Constructor
     * @param gateway Register access
     * @param reader Fault re-check
     * @param state Shared test state; the run stops when auto-recovery is cleared
     * @param config Stage table and timing
     * @param listener Event receiver, may be nullptr
     */
    RecoveryEngine(TransportGateway& gateway, FaultReader& reader, CycleState& state,
                   const RecoveryConfig& config, TesterEventListener* listener);

    RecoveryEngine(const RecoveryEngine&) = delete;
    RecoveryEngine& operator=(const RecoveryEngine&) = delete;

    /**
     * @brief Run until faults clear or the run is stopped
     * @return true if the faults were cleared, false if stopped
     */
    bool run();

    /**
     * @brief Stop this run at its next tick
     */
    void cancel();

    bool isCancelled() const { return cancelled_.load(); }

    RecoveryState getState() const;

private:
    bool shouldStop() const;

    /**
     * @brief Count down ticks, emitting the remaining time before each tick
     * @param ticks Number of ticks to wait
     * @param remaining_at_start Value shown on the first countdown event
     * @return false if stopped during the countdown
     */
    bool countdown(int ticks, int remaining_at_start);

    void issueClear();

    /**
     * @brief Re-check the fault registers
     * @return true only if the read succeeded and no fault is active
     */
    bool faultsCleared();
    bool stopped();
    void emit(RecoveryEvent event, const std::string& detail);
    std::string stageLabel() const;

    TransportGateway& gateway_;
    FaultReader& reader_;
    CycleState& state_;
    RecoveryConfig config_;
    TesterEventListener* listener_;

    std::atomic<bool> cancelled_;
    std::atomic<int> stage_index_;
    std::atomic<int> attempt_in_stage_;
};

} // namespace clutch_tester
