/**
 * @file motor_controller.cpp
 * @brief Implementation of MotorController class
 *
 * Wires the gateway, the shared state and the engines together and manages
 * the lifetime of the worker tasks.
 */

#include "motor_controller.hpp"
#include "fault_monitor.hpp"
#include "tester_log.hpp"

#include <algorithm>

namespace clutch_tester {

MotorController::MotorController(std::shared_ptr<RegisterTransport> transport, const TesterConfig& config)
    : config_(config),
      transport_(std::move(transport)),
      gateway_(transport_, config_.catalog),
      decoder_(config_.fault_tables),
      reader_(gateway_, decoder_, state_, config_.retry),
      cycle_log_(config_.files.cycle_log),
      test_active_(false),
      last_outcome_(TestOutcome::NOT_STARTED) {
}

MotorController::~MotorController() {
    if (test_active_.load() || state_.isRunning()) {
        if (!stopTest()) {
            log_message(LogSeverity::ERROR, "Motor not confirmed stopped during shutdown: " + gateway_.getLastError());
        }
    }
    cancelRecovery();
}

// === Test Control ===

int MotorController::startTest(const TestParameters& params, int target_cycles, TesterEventListener* listener) {
    std::string error;
    if (!params.validate(error)) {
        setError("Invalid test parameters: " + error);
        log_message(LogSeverity::ERROR, getLastError());
        return 0;
    }

    bool expected = false;
    if (!test_active_.compare_exchange_strong(expected, true)) {
        setError("Test already running");
        log_message(LogSeverity::WARNING, "Test already running");
        return 0;
    }

    // Report the controller status before anything is commanded
    if (listener) {
        listener->onFaultUpdate(reader_.readSnapshot());
    }

    int start_cycle = std::max(TesterConstants::FIRST_CYCLE, cycle_log_.getLastCycleCount());
    state_.begin(start_cycle, target_cycles);
    last_outcome_.store(TestOutcome::RUNNING);

    log_message(LogSeverity::INFO, "Starting test at cycle " + std::to_string(start_cycle) + ", target " +
                (target_cycles == TesterConstants::UNBOUNDED_CYCLES ? std::string("unbounded")
                                                                    : std::to_string(target_cycles)));

    CycleEngine engine(gateway_, state_, cycle_log_, config_.cycle, config_.retry, listener);

    if (!engine.initializeMotor(params)) {
        last_outcome_.store(engine.getOutcome());
        setError(std::string("Motor initialization failed: ") + testOutcomeStr(engine.getOutcome()));
        test_active_.store(false);
        return 0;
    }

    std::shared_future<int> task;
    {
        std::lock_guard<std::mutex> lock(task_mutex_);
        cycle_task_ = std::async(std::launch::async, [this, &engine, params, listener]() {
            return runCycleTask(engine, params, listener);
        }).share();
        task = cycle_task_;
    }

    int final_count = task.get();
    test_active_.store(false);
    return final_count;
}

bool MotorController::stopTest() {
    log_message(LogSeverity::INFO, "Stopping test");
    state_.requestStop();
    cancelRecovery();

    std::shared_future<int> task;
    {
        std::lock_guard<std::mutex> lock(task_mutex_);
        task = cycle_task_;
    }
    if (task.valid()) {
        task.wait();
    }

    CommandResult torque = gateway_.execute(TesterConstants::CMD_TORQUE, 0.0);
    CommandResult disable = gateway_.execute(TesterConstants::CMD_STATE, TesterConstants::STATE_DISABLED);
    if (torque != CommandResult::SUCCESS || disable != CommandResult::SUCCESS) {
        setError("Error stopping motor: " + gateway_.getLastError());
        log_message(LogSeverity::ERROR, getLastError());
        return false;
    }

    log_message(LogSeverity::INFO, "Motor stopped");
    return true;
}

void MotorController::requestStop() {
    state_.requestStop();
}

bool MotorController::isRunning() const {
    return state_.isRunning();
}

int MotorController::getCurrentCycle() const {
    return state_.getCurrentCycle();
}

TestOutcome MotorController::getLastOutcome() const {
    return last_outcome_.load();
}

// === Register Operations ===

double MotorController::readTelemetry(const std::string& name) {
    return gateway_.readTelemetry(name);
}

bool MotorController::readTelemetry(const std::string& name, double& value) {
    return gateway_.readTelemetry(name, value);
}

CommandResult MotorController::executeCommand(const std::string& command_name, double value) {
    return gateway_.execute(command_name, value);
}

FaultCheckResult MotorController::checkFaults() {
    return reader_.checkFaults();
}

FaultCheckResult MotorController::checkWarnings() {
    return reader_.checkWarnings();
}

bool MotorController::clearFaults() {
    log_message(LogSeverity::INFO, "Sending clear faults command");
    CommandResult result = gateway_.execute(TesterConstants::CMD_CLEAR_FAULTS, TesterConstants::CLEAR_FAULTS_VALUE);
    if (result != CommandResult::SUCCESS) {
        setError(std::string("Failed to send clear faults command: ") + commandResultStr(result));
        log_message(LogSeverity::ERROR, getLastError());
        return false;
    }
    return true;
}

bool MotorController::validateConnection() {
    const TelemetryPoint* faults = config_.catalog.findTelemetry(TesterConstants::TLM_FAULTS);
    uint16_t address = faults ? faults->address : TesterConstants::FAULTS_ADDRESS;

    uint16_t value = 0;
    if (gateway_.readRegister(address, value) != TransportResult::SUCCESS) {
        setError("Connection validation failed: " + gateway_.getLastError());
        log_message(LogSeverity::ERROR, getLastError());
        return false;
    }

    log_message(LogSeverity::INFO, "Connection validated");
    return true;
}

// === Cycle Log ===

int MotorController::getLastCycleCount() const {
    return cycle_log_.getLastCycleCount();
}

int MotorController::getLastCycleCount(const std::string& path) {
    return CycleLog::getLastCycleCount(path);
}

// === Diagnostics ===

const TesterConfig& MotorController::getConfig() const {
    return config_;
}

GatewayStatistics MotorController::getGatewayStatistics() const {
    return gateway_.getStatistics();
}

std::string MotorController::getLastError() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
}

// === Private Implementation ===

int MotorController::runCycleTask(CycleEngine& engine, const TestParameters& params, TesterEventListener* listener) {
    state_.setAutoRecovery(true);

    FaultMonitor monitor(gateway_, reader_, state_, config_.monitor, config_.retry, listener,
                         [this, listener]() { return runRecovery(listener); });
    std::future<void> monitor_task = std::async(std::launch::async, [&monitor]() { monitor.run(); });

    int count = state_.getCurrentCycle();
    try {
        count = engine.runCycles(params);
        last_outcome_.store(engine.getOutcome());
    } catch (const std::exception& e) {
        log_message(LogSeverity::ERROR, std::string("Critical error in cycle task: ") + e.what());
        setError(e.what());
        last_outcome_.store(TestOutcome::ERROR);
        count = state_.getCurrentCycle();
        state_.setRunning(false);
    }

    // Monitor and recovery never outlive the cycle task
    monitor.cancel();
    state_.setAutoRecovery(false);
    cancelRecovery();
    try {
        monitor_task.get();
    } catch (const std::exception& e) {
        log_message(LogSeverity::ERROR, std::string("Fault monitor terminated with error: ") + e.what());
    }

    log_message(LogSeverity::INFO, std::string("Test finished: ") + testOutcomeStr(last_outcome_.load()) +
                " at cycle " + std::to_string(count));
    return count;
}

bool MotorController::runRecovery(TesterEventListener* listener) {
    std::shared_future<bool> task;
    {
        std::lock_guard<std::mutex> lock(recovery_mutex_);

        if (recovery_) {
            recovery_->cancel();
            if (recovery_task_.valid()) {
                recovery_task_.wait();
            }
        }

        if (!state_.isAutoRecoveryEnabled()) {
            return false;
        }

        recovery_ = std::make_unique<RecoveryEngine>(gateway_, reader_, state_, config_.recovery, listener);
        RecoveryEngine* engine = recovery_.get();
        recovery_task_ = std::async(std::launch::async, [engine]() { return engine->run(); }).share();
        task = recovery_task_;
    }

    return task.get();
}

void MotorController::cancelRecovery() {
    std::shared_future<bool> task;
    {
        std::lock_guard<std::mutex> lock(recovery_mutex_);
        if (recovery_) {
            recovery_->cancel();
        }
        task = recovery_task_;
    }
    if (task.valid()) {
        task.wait();
    }
}

void MotorController::setError(const std::string& error_message) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_ = error_message;
}

} // namespace clutch_tester
