/**
 * @file test_fault_decoder.cpp
 * @brief Fault Decoder, Register Catalog and Gateway Test (Simulation Mode)
 *
 * Validates bit decoding, command encoding with negative wraparound and the
 * gateway's catalog operations against the simulated motor controller.
 */

#include "fault_decoder.hpp"
#include "register_map.hpp"
#include "simulated_motor_controller.hpp"
#include "transport_gateway.hpp"
#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

using namespace clutch_tester;
using namespace clutch_tester::testing;

/**
 * @brief Test suite for decoding and register access
 */
class FaultDecoderTest {
public:
    bool testDecodeBits() {
        std::cout << "\n=== Test 1: Bit Decoding ===" << std::endl;

        BitDescriptionTable table = {{0, "A"}, {2, "C"}};
        std::vector<std::string> decoded = decodeBits(0b101, table);
        if (decoded != std::vector<std::string>{"A", "C"}) {
            std::cerr << "❌ decodeBits(0b101) returned " << decoded.size() << " entries" << std::endl;
            return false;
        }

        // Set bit without description is ignored
        decoded = decodeBits(0b110, table);
        if (decoded != std::vector<std::string>{"C"}) {
            std::cerr << "❌ Undescribed bit was not ignored" << std::endl;
            return false;
        }

        if (!decodeBits(0, table).empty()) {
            std::cerr << "❌ Zero register produced messages" << std::endl;
            return false;
        }

        std::cout << "✅ Set bits decoded in ascending order" << std::endl;
        return true;
    }

    bool testDefaultTables() {
        std::cout << "\n=== Test 2: Default Fault Tables ===" << std::endl;

        FaultDecoder decoder;
        const FaultTables& tables = decoder.getTables();
        if (tables.faults.size() != 16 || tables.faults2.size() != 16 ||
            tables.warnings.size() != 16 || tables.warnings2.size() != 16) {
            std::cerr << "❌ Default tables are incomplete" << std::endl;
            return false;
        }

        // Bit 0 of faults and bit 0 of faults2, faults register first
        std::vector<std::string> faults = decoder.decodeFaults(0x0001, 0x0001);
        if (faults.size() != 2 || faults[0] != tables.faults.at(0) || faults[1] != tables.faults2.at(0)) {
            std::cerr << "❌ Fault register order wrong" << std::endl;
            return false;
        }

        FaultSnapshot snapshot = decoder.decode(0, 0, 0x8000, 0);
        if (snapshot.hasFaults() || !snapshot.hasWarnings() || snapshot.warnings_reg != 0x8000 ||
            snapshot.warning_messages.front() != tables.warnings.at(15)) {
            std::cerr << "❌ Snapshot decode mismatch" << std::endl;
            return false;
        }

        std::cout << "✅ 64 descriptions loaded, snapshot decoded" << std::endl;
        std::cout << "   - " << faults[0] << std::endl;
        return true;
    }

    bool testCommandEncoding() {
        std::cout << "\n=== Test 3: Command Encoding ===" << std::endl;

        RegisterCatalog catalog = RegisterCatalog::defaults();
        const RegisterCommand* torque = catalog.findCommand(TesterConstants::CMD_TORQUE);
        if (!torque) {
            std::cerr << "❌ Torque command missing from catalog" << std::endl;
            return false;
        }

        uint16_t raw = 0;
        if (!RegisterCatalog::encodeValue(*torque, -50.0, raw) || raw != 63513) {
            std::cerr << "❌ -50% torque encoded as " << raw << ", expected 63513" << std::endl;
            return false;
        }

        if (!RegisterCatalog::encodeValue(*torque, 100.0, raw) || raw != 4046) {
            std::cerr << "❌ 100% torque encoded as " << raw << std::endl;
            return false;
        }

        // No wraparound on the state register
        const RegisterCommand* state = catalog.findCommand(TesterConstants::CMD_STATE);
        if (RegisterCatalog::encodeValue(*state, -1.0, raw)) {
            std::cerr << "❌ Negative value accepted without wraparound" << std::endl;
            return false;
        }

        if (catalog.findCommand("no_such_command") != nullptr) {
            std::cerr << "❌ Unknown command resolved" << std::endl;
            return false;
        }

        std::cout << "✅ Encoding and wraparound correct" << std::endl;
        return true;
    }

    bool testGatewayExecute() {
        std::cout << "\n=== Test 4: Gateway Execute ===" << std::endl;

        auto sim = std::make_shared<SimulatedMotorController>();
        TransportGateway gateway(sim, RegisterCatalog::defaults());

        if (gateway.execute(TesterConstants::CMD_TORQUE, -50.0) != CommandResult::SUCCESS ||
            sim->getRegister(SimRegisters::TORQUE) != 63513) {
            std::cerr << "❌ Torque write failed" << std::endl;
            return false;
        }

        size_t writes_before = sim->getWrites().size();
        if (gateway.execute("no_such_command", 1.0) != CommandResult::UNKNOWN_COMMAND ||
            sim->getWrites().size() != writes_before) {
            std::cerr << "❌ Unknown command performed I/O" << std::endl;
            return false;
        }

        sim->failNextWrites(1);
        if (gateway.execute(TesterConstants::CMD_STATE, 2) != CommandResult::TRANSPORT_ERROR) {
            std::cerr << "❌ Transport failure not reported" << std::endl;
            return false;
        }

        GatewayStatistics stats = gateway.getStatistics();
        if (stats.writes_attempted != 2 || stats.writes_failed != 1) {
            std::cerr << "❌ Statistics wrong: " << stats.writes_attempted << "/" << stats.writes_failed << std::endl;
            return false;
        }

        std::cout << "✅ Execute results and statistics correct" << std::endl;
        return true;
    }

    bool testTelemetry() {
        std::cout << "\n=== Test 5: Telemetry Scaling ===" << std::endl;

        auto sim = std::make_shared<SimulatedMotorController>();
        TransportGateway gateway(sim, RegisterCatalog::defaults());

        double voltage = gateway.readTelemetry(TesterConstants::TLM_BATTERY_VOLTAGE);
        if (voltage < 47.99 || voltage > 48.01) {
            std::cerr << "❌ Battery voltage " << voltage << ", expected 48.0" << std::endl;
            return false;
        }

        // Raw register is signed
        sim->setRegister(SimRegisters::MOTOR_TEMP, static_cast<uint16_t>(-5));
        if (gateway.readTelemetry(TesterConstants::TLM_MOTOR_TEMP) != -5.0) {
            std::cerr << "❌ Signed telemetry not decoded" << std::endl;
            return false;
        }

        if (gateway.readTelemetry("no_such_point") != 0.0) {
            std::cerr << "❌ Unknown telemetry did not return zero" << std::endl;
            return false;
        }

        sim->failNextReads(1);
        double value = 1.0;
        if (gateway.readTelemetry(TesterConstants::TLM_MOTOR_TEMP, value) || value != 0.0) {
            std::cerr << "❌ Failed read reported success" << std::endl;
            return false;
        }

        std::cout << "✅ Scaling, sign handling and silent-zero failures correct" << std::endl;
        return true;
    }

    bool testNullTransport() {
        std::cout << "\n=== Test 6: Null Transport Rejected ===" << std::endl;

        try {
            TransportGateway gateway(nullptr, RegisterCatalog::defaults());
            std::cerr << "❌ Null transport accepted" << std::endl;
            return false;
        } catch (const std::runtime_error& e) {
            std::cout << "✅ Rejected: " << e.what() << std::endl;
            return true;
        }
    }

    bool testGatewaySerializesAccess() {
        std::cout << "\n=== Test 7: Gateway Serializes Concurrent Access ===" << std::endl;

        const int thread_count = 4;
        const int iterations = 25;

        auto sim = std::make_shared<SimulatedMotorController>();
        sim->setTransactionDelay(std::chrono::microseconds(200));
        TransportGateway gateway(sim, RegisterCatalog::defaults());

        std::atomic<int> failures{0};
        std::vector<std::thread> workers;
        for (int t = 0; t < thread_count; ++t) {
            workers.emplace_back([&gateway, &failures, t]() {
                double rpm = 0.0;
                for (int i = 0; i < iterations; ++i) {
                    if (gateway.execute(TesterConstants::CMD_TORQUE, (t % 2 == 0) ? 10.0 : -10.0) !=
                        CommandResult::SUCCESS) {
                        failures++;
                    }
                    if (!gateway.readTelemetry(TesterConstants::TLM_MOTOR_RPM, rpm)) {
                        failures++;
                    }
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }

        if (failures.load() != 0) {
            std::cerr << "❌ " << failures.load() << " gateway operations failed" << std::endl;
            return false;
        }
        if (sim->getMaxConcurrentTransactions() != 1) {
            std::cerr << "❌ " << sim->getMaxConcurrentTransactions()
                      << " transactions overlapped on the link" << std::endl;
            return false;
        }

        GatewayStatistics stats = gateway.getStatistics();
        const uint64_t expected = static_cast<uint64_t>(thread_count * iterations);
        if (stats.writes_attempted != expected || stats.reads_attempted != expected ||
            stats.writes_failed != 0 || stats.reads_failed != 0) {
            std::cerr << "❌ Statistics mismatch: " << stats.writes_attempted << " writes, "
                      << stats.reads_attempted << " reads" << std::endl;
            return false;
        }

        std::cout << "✅ " << expected * 2 << " transactions from " << thread_count
                  << " threads, never more than one on the link" << std::endl;
        return true;
    }

    bool runAllTests() {
        std::cout << "Fault Decoder and Register Catalog Test Suite" << std::endl;
        std::cout << "=============================================" << std::endl;

        bool all_passed = true;

        all_passed &= testDecodeBits();
        all_passed &= testDefaultTables();
        all_passed &= testCommandEncoding();
        all_passed &= testGatewayExecute();
        all_passed &= testTelemetry();
        all_passed &= testNullTransport();
        all_passed &= testGatewaySerializesAccess();

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
    FaultDecoderTest test_suite;

    bool success = test_suite.runAllTests();

    return success ? 0 : 1;
}
