/**
 * @file cycle_engine.hpp
 * @brief Bidirectional torque cycling with direction verification
 *
 * One cycle is a forward torque segment followed by a reverse torque
 * segment. The forward segment must spin the motor; the reverse segment must
 * leave it freewheeling on the one-way clutch. A cycle counts only when both
 * segments were verified. Sustained rotation under reverse torque means the
 * clutch slips and ends the test.
 */

#pragma once

#include "cycle_log.hpp"
#include "cycle_state.hpp"
#include "tester_configuration.hpp"
#include "tester_events.hpp"
#include "transport_gateway.hpp"

#include <atomic>
#include <string>

namespace clutch_tester {

/**
 * @struct TestParameters
 * @brief Operator settings of one test run
 */
struct TestParameters {
    double target_rpm = 300.0;           ///< Speed regulator set point
    double forward_torque = 100.0;       ///< Percent, must be positive
    double reverse_torque = -100.0;      ///< Percent, must be negative
    double forward_duration_s = 5.0;
    double reverse_duration_s = 2.0;
    double max_motor_current = 70.0;
    double max_brake_current = 40.0;

    static TestParameters defaults();

    /**
     * @brief Check signs and durations
     * @param error Receives the reason on failure
     * @return true if the parameters can drive a test
     */
    bool validate(std::string& error) const;
};

/**
 * @brief How a test run ended
 */
enum class TestOutcome {
    NOT_STARTED,
    RUNNING,
    COMPLETED,        ///< Target cycle count reached
    STOPPED,          ///< Stop requested
    CLUTCH_FAILURE,   ///< Reverse rotation detected
    STARTUP_FAILED,   ///< Initialization commands failed
    ERROR             ///< Unexpected error in the cycle task
};

const char* testOutcomeStr(TestOutcome outcome);

/**
 * @class CycleEngine
 * @brief Drives the motor through startup and torque cycles
 */
class CycleEngine {
public:
    CycleEngine(TransportGateway& gateway, CycleState& state, CycleLog& cycle_log,
                const CycleConfig& config, const RetryPolicy& retry, TesterEventListener* listener);

    CycleEngine(const CycleEngine&) = delete;
    CycleEngine& operator=(const CycleEngine&) = delete;

    /**
     * @brief Send the startup command sequence and enable the motor
     * @param params Test parameters
     * @return false if a command failed after all retries (running is cleared)
     */
    bool initializeMotor(const TestParameters& params);

    /**
     * @brief Cycle until the test stops, the target is passed or the clutch fails
     * @param params Test parameters
     * @return Cycle count at exit (next cycle number to run)
     */
    int runCycles(const TestParameters& params);

    /**
     * @brief Zero torque, disable the motor and stop the test
     */
    void emergencyShutdown();

    TestOutcome getOutcome() const { return outcome_.load(); }

private:
    enum class SegmentResult {
        VERIFIED,
        UNVERIFIED,
        CLUTCH_FAILURE,
        SKIPPED          ///< Torque command could not be set
    };

    SegmentResult runSegment(double torque, double duration_s, TimerDirection direction);

    /**
     * @brief Execute a command, retrying transport errors
     * @return true once the command succeeded
     */
    bool executeWithRetry(const char* command, double value);

    void sampleTelemetry();
    void emitTimer(TimerDirection direction, double elapsed, double total);

    TransportGateway& gateway_;
    CycleState& state_;
    CycleLog& cycle_log_;
    CycleConfig config_;
    RetryPolicy retry_;
    TesterEventListener* listener_;

    std::atomic<TestOutcome> outcome_;
};

} // namespace clutch_tester
