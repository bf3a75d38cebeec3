/**
 * @file cycle_state.hpp
 * @brief Shared run state of the clutch test
 *
 * Holds the flags and counters shared between the cycle driver, the fault
 * monitor and recovery runs. Every flag change wakes all interruptible waits
 * so a stop request is observed within one wait slice instead of after a
 * full sleep.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>

namespace clutch_tester {

/**
 * @class CycleState
 * @brief Thread-safe running flag, auto-recovery flag and cycle counter
 */
class CycleState {
public:
    CycleState();

    CycleState(const CycleState&) = delete;
    CycleState& operator=(const CycleState&) = delete;

    // === Lifecycle ===

    /**
     * @brief Mark a new test as running
     * @param start_cycle Cycle number the test resumes at
     * @param target_cycles Cycle bound, TesterConstants::UNBOUNDED_CYCLES for none
     */
    void begin(int start_cycle, int target_cycles);

    /**
     * @brief Clear running and auto-recovery, wake every waiter
     */
    void requestStop();

    void setRunning(bool running);
    void setAutoRecovery(bool enabled);

    bool isRunning() const { return running_.load(); }
    bool isAutoRecoveryEnabled() const { return auto_recovery_.load(); }

    // === Cycle Counter ===

    int getCurrentCycle() const { return current_cycle_.load(); }
    void setCurrentCycle(int cycle) { current_cycle_.store(cycle); }
    int getTargetCycles() const { return target_cycles_.load(); }

    /**
     * @brief True if a finite target exists and count has passed it
     */
    bool targetReached(int count) const;

    // === Interruptible Waits ===

    /**
     * @brief Sleep up to seconds, returning early when abort() turns true
     * @param seconds Maximum wait
     * @param abort Evaluated on every wake-up
     * @return true if the full time elapsed, false if aborted
     */
    bool sleepUnless(double seconds, const std::function<bool()>& abort);

    /**
     * @brief Sleep up to seconds while the test is running
     * @return true if the full time elapsed with the test still running
     */
    bool sleepWhileRunning(double seconds);

    /**
     * @brief Wake all waiters so they re-evaluate their abort condition
     */
    void notifyAll();

private:
    std::atomic<bool> running_;
    std::atomic<bool> auto_recovery_;
    std::atomic<int> current_cycle_;
    std::atomic<int> target_cycles_;

    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};

} // namespace clutch_tester
