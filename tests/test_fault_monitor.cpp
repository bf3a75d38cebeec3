/**
 * @file test_fault_monitor.cpp
 * @brief Fault Reader and Fault Monitor Test (Simulation Mode)
 */

#include "cycle_state.hpp"
#include "fault_monitor.hpp"
#include "fault_reader.hpp"
#include "simulated_motor_controller.hpp"
#include "tester_events.hpp"
#include "transport_gateway.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

using namespace clutch_tester;
using namespace clutch_tester::testing;

class SnapshotListener : public TesterEventListener {
public:
    void onFaultUpdate(const FaultSnapshot& snapshot) override {
        std::lock_guard<std::mutex> lock(mutex_);
        last_ = snapshot;
        updates_++;
    }

    void onRecoveryEvent(RecoveryEvent event, const std::string&) override {
        if (event == RecoveryEvent::FAILED) {
            failed_events_++;
        }
    }

    int updates() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return updates_;
    }

    FaultSnapshot last() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_;
    }

    std::atomic<int> failed_events_{0};

private:
    mutable std::mutex mutex_;
    FaultSnapshot last_;
    int updates_ = 0;
};

class FaultMonitorTest {
private:
    RetryPolicy noDelay() {
        RetryPolicy retry;
        retry.retry_delay_s = 0.0;
        return retry;
    }

    MonitorConfig fastMonitor() {
        MonitorConfig config;
        config.interval_s = 0.01;
        config.error_backoff_s = 0.01;
        config.restart_pause_s = 0.0;
        return config;
    }

    template <typename Predicate>
    bool waitFor(Predicate predicate, int timeout_ms = 2000) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (std::chrono::steady_clock::now() < deadline) {
            if (predicate()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return predicate();
    }

public:
    bool testReadFailures() {
        std::cout << "\n=== Test 1: Fault Read Retries ===" << std::endl;

        auto sim = std::make_shared<SimulatedMotorController>();
        sim->setFaults(0x0003, 0, -1);
        TransportGateway gateway(sim, RegisterCatalog::defaults());
        FaultDecoder decoder;
        CycleState state;
        FaultReader reader(gateway, decoder, state, noDelay());

        // Two failures, third attempt succeeds
        sim->failNextReads(2);
        FaultCheckResult result = reader.checkFaults();
        if (!result.read_ok || result.messages.size() != 2 || result.reg != 0x0003) {
            std::cerr << "❌ Retry did not recover the read" << std::endl;
            return false;
        }

        // Persistent timeout reads as no faults
        sim->setFailAllReads(true, TransportResult::TIMEOUT);
        result = reader.checkFaults();
        if (result.read_ok || !result.messages.empty()) {
            std::cerr << "❌ Timeout not reported as empty list" << std::endl;
            return false;
        }

        // Any other failure reads as internal error
        sim->setFailAllReads(true, TransportResult::COMMUNICATION_ERROR);
        result = reader.checkWarnings();
        if (result.read_ok || result.messages.size() != 1 ||
            result.messages[0] != FaultReader::INTERNAL_ERROR_MESSAGE) {
            std::cerr << "❌ Communication error not reported as internal error" << std::endl;
            return false;
        }

        std::cout << "✅ Retry, timeout and internal error handling correct" << std::endl;
        return true;
    }

    bool testPublishesSnapshots() {
        std::cout << "\n=== Test 2: Periodic Snapshots ===" << std::endl;

        auto sim = std::make_shared<SimulatedMotorController>();
        sim->setWarnings(0x0001, 0);
        TransportGateway gateway(sim, RegisterCatalog::defaults());
        FaultDecoder decoder;
        CycleState state;
        FaultReader reader(gateway, decoder, state, noDelay());
        state.begin(1, TesterConstants::UNBOUNDED_CYCLES);
        state.setAutoRecovery(true);

        SnapshotListener listener;
        std::atomic<int> recoveries{0};
        FaultMonitor monitor(gateway, reader, state, fastMonitor(), noDelay(), &listener,
                             [&recoveries]() { recoveries++; return true; });

        auto task = std::async(std::launch::async, [&monitor]() { monitor.run(); });
        bool polled = waitFor([&listener]() { return listener.updates() >= 3; });

        monitor.cancel();
        if (task.wait_for(std::chrono::seconds(1)) != std::future_status::ready) {
            std::cerr << "❌ Monitor did not exit after cancel" << std::endl;
            state.requestStop();
            task.wait();
            return false;
        }

        FaultSnapshot snapshot = listener.last();
        if (!polled || snapshot.hasFaults() || !snapshot.hasWarnings() || recoveries.load() != 0) {
            std::cerr << "❌ Snapshot content or recovery trigger wrong" << std::endl;
            return false;
        }

        std::cout << "✅ " << listener.updates() << " snapshots published, no recovery on warnings" << std::endl;
        return true;
    }

    bool testRecoveryAndRestart() {
        std::cout << "\n=== Test 3: Recovery Hook and Motor Restart ===" << std::endl;

        auto sim = std::make_shared<SimulatedMotorController>();
        sim->setFaults(0x0001, 0, 1);
        TransportGateway gateway(sim, RegisterCatalog::defaults());
        FaultDecoder decoder;
        CycleState state;
        FaultReader reader(gateway, decoder, state, noDelay());
        state.begin(1, TesterConstants::UNBOUNDED_CYCLES);
        state.setAutoRecovery(true);

        SnapshotListener listener;
        std::atomic<int> recoveries{0};
        FaultMonitor monitor(gateway, reader, state, fastMonitor(), noDelay(), &listener,
                             [&gateway, &recoveries]() {
                                 recoveries++;
                                 return gateway.execute(TesterConstants::CMD_CLEAR_FAULTS, 1) == CommandResult::SUCCESS;
                             });

        auto task = std::async(std::launch::async, [&monitor]() { monitor.run(); });
        bool restarted = waitFor([&sim]() {
            return sim->countWrites(SimRegisters::STATE, TesterConstants::STATE_ENABLED) >= 1;
        });

        state.requestStop();
        task.wait();

        if (!restarted || recoveries.load() != 1) {
            std::cerr << "❌ Expected one recovery and a restart, got " << recoveries.load() << std::endl;
            return false;
        }

        std::cout << "✅ Recovery triggered once, motor re-enabled" << std::endl;
        return true;
    }

    bool testRestartFailure() {
        std::cout << "\n=== Test 4: Restart Failure Reported ===" << std::endl;

        auto sim = std::make_shared<SimulatedMotorController>();
        sim->setFaults(0x0001, 0, -1);
        TransportGateway gateway(sim, RegisterCatalog::defaults());
        FaultDecoder decoder;
        CycleState state;
        FaultReader reader(gateway, decoder, state, noDelay());
        state.begin(1, TesterConstants::UNBOUNDED_CYCLES);
        state.setAutoRecovery(true);

        SnapshotListener listener;
        FaultMonitor monitor(gateway, reader, state, fastMonitor(), noDelay(), &listener,
                             [&sim]() {
                                 sim->setFaults(0, 0, -1);
                                 sim->setFailAllWrites(true);
                                 return true;
                             });

        auto task = std::async(std::launch::async, [&monitor]() { monitor.run(); });
        bool reported = waitFor([&listener]() { return listener.failed_events_.load() >= 1; });

        state.requestStop();
        task.wait();

        if (!reported) {
            std::cerr << "❌ recovery_failed not emitted" << std::endl;
            return false;
        }

        std::cout << "✅ recovery_failed emitted after restart retries" << std::endl;
        return true;
    }

    bool testAutoRecoveryDisabled() {
        std::cout << "\n=== Test 5: Auto-Recovery Disabled ===" << std::endl;

        auto sim = std::make_shared<SimulatedMotorController>();
        sim->setFaults(0x0001, 0, -1);
        TransportGateway gateway(sim, RegisterCatalog::defaults());
        FaultDecoder decoder;
        CycleState state;
        FaultReader reader(gateway, decoder, state, noDelay());
        state.begin(1, TesterConstants::UNBOUNDED_CYCLES);

        SnapshotListener listener;
        std::atomic<int> recoveries{0};
        FaultMonitor monitor(gateway, reader, state, fastMonitor(), noDelay(), &listener,
                             [&recoveries]() { recoveries++; return false; });

        auto task = std::async(std::launch::async, [&monitor]() { monitor.run(); });
        bool polled = waitFor([&listener]() { return listener.updates() >= 3; });

        state.setRunning(false);
        task.wait();

        if (!polled || recoveries.load() != 0 || !listener.last().hasFaults()) {
            std::cerr << "❌ Recovery started without auto-recovery" << std::endl;
            return false;
        }

        std::cout << "✅ Faults reported, recovery not started" << std::endl;
        return true;
    }

    bool testStopDuringLinkOutage() {
        std::cout << "\n=== Test 6: Stop During Link Outage ===" << std::endl;

        auto sim = std::make_shared<SimulatedMotorController>();
        sim->setFailAllReads(true, TransportResult::TIMEOUT);
        TransportGateway gateway(sim, RegisterCatalog::defaults());
        FaultDecoder decoder;
        CycleState state;
        RetryPolicy slow;
        slow.max_retries = 3;
        slow.retry_delay_s = 1.0;
        FaultReader reader(gateway, decoder, state, slow);
        state.begin(1, TesterConstants::UNBOUNDED_CYCLES);

        SnapshotListener listener;
        FaultMonitor monitor(gateway, reader, state, fastMonitor(), noDelay(), &listener, nullptr);

        auto task = std::async(std::launch::async, [&monitor]() { monitor.run(); });
        bool reading = waitFor([&sim]() { return sim->getReadCount() >= 1; });
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        auto stop_time = std::chrono::steady_clock::now();
        state.requestStop();
        bool finished = task.wait_for(std::chrono::milliseconds(1000)) == std::future_status::ready;
        double latency_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - stop_time).count();
        task.wait();

        if (!reading || !finished) {
            std::cerr << "❌ Monitor still in retry delay " << latency_ms << " ms after stop" << std::endl;
            return false;
        }
        if (listener.updates() != 0) {
            std::cerr << "❌ Interrupted read was published" << std::endl;
            return false;
        }

        std::cout << "✅ Monitor stopped " << latency_ms << " ms after stop request" << std::endl;
        return true;
    }

    bool runAllTests() {
        std::cout << "Fault Monitor Test Suite (Simulation Mode)" << std::endl;
        std::cout << "==========================================" << std::endl;

        bool all_passed = true;

        all_passed &= testReadFailures();
        all_passed &= testPublishesSnapshots();
        all_passed &= testRecoveryAndRestart();
        all_passed &= testRestartFailure();
        all_passed &= testAutoRecoveryDisabled();
        all_passed &= testStopDuringLinkOutage();

        std::cout << "\n" << std::string(50, '=') << std::endl;
        if (all_passed) {
            std::cout << "🎉 ALL TESTS PASSED" << std::endl;
        } else {
            std::cout << "❌ Some tests failed" << std::endl;
        }

        return all_passed;
    }
};

int main() {
    FaultMonitorTest test_suite;

    bool success = test_suite.runAllTests();

    return success ? 0 : 1;
}
