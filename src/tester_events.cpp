/**
 * @file tester_events.cpp
 * @brief Event name tables
 */

#include "tester_events.hpp"

namespace clutch_tester {

const char* recoveryEventName(RecoveryEvent event) {
    switch (event) {
        case RecoveryEvent::STARTED: return "recovery_started";
        case RecoveryEvent::COUNTDOWN: return "recovery_countdown";
        case RecoveryEvent::WAITING: return "recovery_waiting";
        case RecoveryEvent::SUCCESSFUL: return "recovery_successful";
        case RecoveryEvent::STOPPED: return "recovery_stopped";
        case RecoveryEvent::STAGE_CHANGE: return "recovery_stage_change";
        case RecoveryEvent::ERROR: return "recovery_error";
        case RecoveryEvent::FAILED: return "recovery_failed";
    }
    return "recovery_unknown";
}

const char* timerDirectionName(TimerDirection direction) {
    switch (direction) {
        case TimerDirection::FORWARD: return "forward";
        case TimerDirection::REVERSE: return "reverse";
        case TimerDirection::NONE: return "none";
    }
    return "none";
}

} // namespace clutch_tester
