/**
 * @file motor_controller.hpp
 * @brief Clutch Test Motor Controller Interface
 *
 * This header defines the MotorController class, the entry point of the
 * clutch tester. It owns the register gateway, the shared test state and the
 * worker tasks (cycle driver, fault monitor, recovery run) and exposes the
 * operations a front-end needs: start and stop a test, read telemetry, check
 * and clear faults.
 *
 * @note startTest() blocks until the test ends. Front-ends run it on their own
 *       worker thread and stop it with stopTest() from another thread.
 */

#pragma once

#include "cycle_engine.hpp"
#include "cycle_log.hpp"
#include "cycle_state.hpp"
#include "fault_decoder.hpp"
#include "fault_reader.hpp"
#include "recovery_engine.hpp"
#include "register_transport.hpp"
#include "tester_configuration.hpp"
#include "tester_events.hpp"
#include "transport_gateway.hpp"

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <string>

namespace clutch_tester {

/**
 * @class MotorController
 * @brief Clutch test facade over a Modbus motor controller
 *
 * Task layout while a test runs:
 *   - the cycle task drives torque segments (CycleEngine)
 *   - the monitor task polls faults alongside it (FaultMonitor)
 *   - a recovery task is spawned by the monitor when faults appear (RecoveryEngine)
 * All three share one TransportGateway, so register transactions never overlap.
 */
class MotorController {
public:
    /**
     * @brief Constructor
     * @param transport Register transport to the motor controller (must not be null)
     * @param config Tester configuration
     */
    explicit MotorController(std::shared_ptr<RegisterTransport> transport,
                             const TesterConfig& config = TesterConfig::defaults());

    /**
     * @brief Destructor - stops a running test
     */
    ~MotorController();

    MotorController(const MotorController&) = delete;
    MotorController& operator=(const MotorController&) = delete;

    // === Test Control ===

    /**
     * @brief Run a clutch test until it completes, fails or is stopped
     * @param params Test parameters
     * @param target_cycles Cycle bound, TesterConstants::UNBOUNDED_CYCLES to run until stopped
     * @param listener Event receiver, may be nullptr; must outlive the call
     * @return Cycle count at exit, 0 if the test could not start
     */
    int startTest(const TestParameters& params,
                  int target_cycles = TesterConstants::UNBOUNDED_CYCLES,
                  TesterEventListener* listener = nullptr);

    /**
     * @brief Stop the test, wait for every task and disable the motor
     * @return true if the final torque/disable commands were accepted
     *
     * @warning Blocks until the cycle task has finished. Do not call from a
     *          listener callback; use requestStop() there.
     */
    bool stopTest();

    /**
     * @brief Signal every task to stop without waiting
     */
    void requestStop();

    bool isRunning() const;
    int getCurrentCycle() const;
    TestOutcome getLastOutcome() const;

    // === Register Operations ===

    /**
     * @brief Read a telemetry point, 0.0 on failure
     */
    double readTelemetry(const std::string& name);
    bool readTelemetry(const std::string& name, double& value);

    CommandResult executeCommand(const std::string& command_name, double value);

    FaultCheckResult checkFaults();
    FaultCheckResult checkWarnings();

    /**
     * @brief Send the clear faults command once
     * @return true if the command was written
     */
    bool clearFaults();

    /**
     * @brief Probe the link by reading the fault register
     * @return true if the motor controller answered
     */
    bool validateConnection();

    // === Cycle Log ===

    int getLastCycleCount() const;
    static int getLastCycleCount(const std::string& path);

    // === Diagnostics ===

    const TesterConfig& getConfig() const;
    GatewayStatistics getGatewayStatistics() const;
    std::string getLastError() const;

private:
    int runCycleTask(CycleEngine& engine, const TestParameters& params, TesterEventListener* listener);

    /**
     * @brief Recovery hook of the fault monitor
     *
     * Cancels and awaits any previous run, starts a new one as its own task
     * and blocks until it ends.
     */
    bool runRecovery(TesterEventListener* listener);
    void cancelRecovery();
    void setError(const std::string& error_message);

    TesterConfig config_;
    std::shared_ptr<RegisterTransport> transport_;
    TransportGateway gateway_;
    FaultDecoder decoder_;
    CycleState state_;
    FaultReader reader_;
    CycleLog cycle_log_;

    std::atomic<bool> test_active_;              ///< startTest() in progress
    std::atomic<TestOutcome> last_outcome_;

    std::mutex task_mutex_;                      ///< Protects cycle_task_
    std::shared_future<int> cycle_task_;

    std::mutex recovery_mutex_;                  ///< Protects recovery_ and recovery_task_
    std::unique_ptr<RecoveryEngine> recovery_;
    std::shared_future<bool> recovery_task_;

    mutable std::mutex error_mutex_;
    std::string last_error_;
};

} // namespace clutch_tester
