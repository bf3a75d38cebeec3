/**
 * @file tester_events.hpp
 * @brief Observer interface for front-ends of the clutch tester
 *
 * Callbacks arrive on the worker thread that produced them (cycle driver,
 * fault monitor or recovery run). Listeners are responsible for marshalling
 * to their own thread and must not block for long.
 */

#pragma once

#include "fault_decoder.hpp"

#include <string>

namespace clutch_tester {

/**
 * @brief Recovery state machine transitions
 */
enum class RecoveryEvent {
    STARTED,        ///< "Stage s, Attempt a"
    COUNTDOWN,      ///< "<n>s" remaining
    WAITING,        ///< "Clearing faults" or "Stage s, Attempt a"
    SUCCESSFUL,     ///< Faults cleared
    STOPPED,        ///< Auto-recovery disabled or run cancelled
    STAGE_CHANGE,   ///< "Stage s"
    ERROR,          ///< Unexpected error, recovery continues after a backoff
    FAILED          ///< Motor could not be re-enabled after recovery
};

/**
 * @brief Wire name of a recovery event ("recovery_started", ...)
 */
const char* recoveryEventName(RecoveryEvent event);

/**
 * @brief Direction of the running torque segment
 */
enum class TimerDirection {
    FORWARD,
    REVERSE,
    NONE       ///< Between segments
};

const char* timerDirectionName(TimerDirection direction);

/**
 * @class TesterEventListener
 * @brief Receives fault, recovery and timer notifications
 *
 * All methods default to no-ops so listeners override what they need.
 */
class TesterEventListener {
public:
    virtual ~TesterEventListener() = default;

    virtual void onFaultUpdate(const FaultSnapshot& snapshot) {
        (void)snapshot;
    }

    virtual void onRecoveryEvent(RecoveryEvent event, const std::string& detail) {
        (void)event;
        (void)detail;
    }

    /**
     * @brief Segment progress, emitted every poll tick
     * @param direction Segment direction
     * @param elapsed Seconds since the segment started
     * @param total Segment duration in seconds
     */
    virtual void onTimerProgress(TimerDirection direction, double elapsed, double total) {
        (void)direction;
        (void)elapsed;
        (void)total;
    }
};

} // namespace clutch_tester
