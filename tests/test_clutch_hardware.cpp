/**
 * @file test_clutch_hardware.cpp
 * @brief Clutch Tester Hardware Run
 *
 * Runs the clutch test on a physical motor controller over Modbus RTU.
 * Ctrl+C stops the test, zeroes torque and disables the motor.
 *
 * Usage: ./test_clutch_hardware <serial_port> [cycles] [config_csv]
 * Example: ./test_clutch_hardware /dev/ttyUSB0 100 config/tester.csv
 */

#include "modbus_rtu_transport.hpp"
#include "motor_controller.hpp"
#include "tester_configuration.hpp"
#include "tester_log.hpp"
#include <chrono>
#include <cstdlib>
#include <future>
#include <iomanip>
#include <iostream>
#include <memory>
#include <signal.h>

using namespace clutch_tester;

volatile sig_atomic_t running = 1;
void signal_handler(int) { running = 0; }

/**
 * @brief Prints tester events to the console
 */
class ConsoleListener : public TesterEventListener {
public:
    void onFaultUpdate(const FaultSnapshot& snapshot) override {
        for (const auto& fault : snapshot.fault_messages) {
            std::cout << "  FAULT: " << fault << std::endl;
        }
        for (const auto& warning : snapshot.warning_messages) {
            std::cout << "  WARNING: " << warning << std::endl;
        }
    }

    void onRecoveryEvent(RecoveryEvent event, const std::string& detail) override {
        std::cout << "  [" << recoveryEventName(event) << "] " << detail << std::endl;
    }

    void onTimerProgress(TimerDirection direction, double elapsed, double total) override {
        if (direction == TimerDirection::NONE) {
            return;
        }
        // One line per second is enough for a terminal
        int second = static_cast<int>(elapsed);
        if (second != last_second_ || direction != last_direction_) {
            last_second_ = second;
            last_direction_ = direction;
            std::cout << "  " << timerDirectionName(direction) << " " << std::fixed << std::setprecision(1)
                      << elapsed << "/" << total << "s" << std::endl;
        }
    }

private:
    int last_second_ = -1;
    TimerDirection last_direction_ = TimerDirection::NONE;
};

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <serial_port> [cycles] [config_csv]" << std::endl;
        std::cerr << "Example: " << argv[0] << " /dev/ttyUSB0 100 config/tester.csv" << std::endl;
        return 1;
    }

    signal(SIGINT, signal_handler);

    int target_cycles = (argc > 2) ? std::atoi(argv[2]) : TesterConstants::UNBOUNDED_CYCLES;
    if (target_cycles <= 0) {
        target_cycles = TesterConstants::UNBOUNDED_CYCLES;
    }

    TesterConfig config = TesterConfig::defaults();
    if (argc > 3) {
        TesterConfigParser parser;
        if (!parser.parseCSV(argv[3])) {
            std::cerr << "❌ Failed to load configuration " << argv[3] << std::endl;
            return 1;
        }
        config = parser.getConfig();
        parser.printSummary();
    }
    config.serial.port = argv[1];

    LogSeverity level = LogSeverity::INFO;
    if (parse_log_severity(config.files.log_level, level)) {
        set_log_level(level);
    }
    if (!open_log_file(config.files.log_file)) {
        std::cerr << "⚠️  Could not open " << config.files.log_file << ", logging to console only" << std::endl;
    }

    std::cout << "Clutch Tester Hardware Run" << std::endl;
    std::cout << "==========================" << std::endl;
    std::cout << "Port: " << config.serial.port << " @ " << config.serial.baudrate << " baud" << std::endl;
    std::cout << "Slave: " << config.serial.slave_address << std::endl;
    std::cout << "Cycles: " << (target_cycles == TesterConstants::UNBOUNDED_CYCLES ? std::string("until stopped")
                                                                                   : std::to_string(target_cycles))
              << std::endl;
    std::cout << "Resume from: " << MotorController::getLastCycleCount(config.files.cycle_log) << std::endl;

    auto transport = std::make_shared<ModbusRtuTransport>(config.serial);
    if (!transport->setupConnection()) {
        std::cerr << "❌ Failed to connect: " << transport->getLastError() << std::endl;
        close_log_file();
        return 1;
    }
    std::cout << "✅ Connected to motor controller" << std::endl;

    bool success = true;
    {
        MotorController controller(transport, config);
        ConsoleListener listener;

        FaultCheckResult faults = controller.checkFaults();
        if (!faults.messages.empty()) {
            std::cout << "⚠️  Faults present before start:" << std::endl;
            for (const auto& fault : faults.messages) {
                std::cout << "   " << fault << std::endl;
            }
        }

        TestParameters params = TestParameters::defaults();
        std::cout << "\nRunning... Press Ctrl+C to stop" << std::endl;

        auto run = std::async(std::launch::async, [&controller, &listener, &params, target_cycles]() {
            return controller.startTest(params, target_cycles, &listener);
        });

        bool stop_sent = false;
        while (run.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
            if (!running) {
                std::cout << "\nStop requested" << std::endl;
                stop_sent = true;
                if (!controller.stopTest()) {
                    std::cerr << "❌ " << controller.getLastError() << std::endl;
                    success = false;
                }
                break;
            }
        }

        int final_count = run.get();

        // Leave the motor disabled when the run ended on its own
        if (!stop_sent && !controller.stopTest()) {
            std::cerr << "❌ " << controller.getLastError() << std::endl;
            success = false;
        }
        TestOutcome outcome = controller.getLastOutcome();

        std::cout << "\n" << std::string(50, '=') << std::endl;
        std::cout << "Outcome: " << testOutcomeStr(outcome) << std::endl;
        std::cout << "Cycle count: " << final_count << std::endl;

        GatewayStatistics stats = controller.getGatewayStatistics();
        std::cout << "Reads: " << stats.reads_attempted << " (" << stats.reads_failed << " failed), "
                  << "Writes: " << stats.writes_attempted << " (" << stats.writes_failed << " failed)" << std::endl;

        if (outcome == TestOutcome::CLUTCH_FAILURE || outcome == TestOutcome::STARTUP_FAILED ||
            outcome == TestOutcome::ERROR) {
            success = false;
        }
    }

    transport->close();
    close_log_file();

    if (success) {
        std::cout << "🎉 CLUTCH TEST RUN FINISHED" << std::endl;
    } else {
        std::cout << "❌ Clutch test run failed" << std::endl;
    }

    return success ? 0 : 1;
}
