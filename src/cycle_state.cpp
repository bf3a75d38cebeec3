/**
 * @file cycle_state.cpp
 * @brief Implementation of CycleState
 */

#include "cycle_state.hpp"
#include "register_map.hpp"

#include <chrono>

namespace clutch_tester {

CycleState::CycleState()
    : running_(false), auto_recovery_(false),
      current_cycle_(TesterConstants::FIRST_CYCLE),
      target_cycles_(TesterConstants::UNBOUNDED_CYCLES) {
}

void CycleState::begin(int start_cycle, int target_cycles) {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        current_cycle_.store(start_cycle);
        target_cycles_.store(target_cycles);
        running_.store(true);
    }
    wait_cv_.notify_all();
}

void CycleState::requestStop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        running_.store(false);
        auto_recovery_.store(false);
    }
    wait_cv_.notify_all();
}

void CycleState::setRunning(bool running) {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        running_.store(running);
    }
    wait_cv_.notify_all();
}

void CycleState::setAutoRecovery(bool enabled) {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        auto_recovery_.store(enabled);
    }
    wait_cv_.notify_all();
}

bool CycleState::targetReached(int count) const {
    int target = target_cycles_.load();
    return target != TesterConstants::UNBOUNDED_CYCLES && count > target;
}

bool CycleState::sleepUnless(double seconds, const std::function<bool()>& abort) {
    if (abort()) {
        return false;
    }
    if (seconds <= 0.0) {
        return true;
    }

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                        std::chrono::duration<double>(seconds));

    std::unique_lock<std::mutex> lock(wait_mutex_);
    bool aborted = wait_cv_.wait_until(lock, deadline, abort);
    return !aborted;
}

bool CycleState::sleepWhileRunning(double seconds) {
    return sleepUnless(seconds, [this]() { return !running_.load(); });
}

void CycleState::notifyAll() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
    }
    wait_cv_.notify_all();
}

} // namespace clutch_tester
