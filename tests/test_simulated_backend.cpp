#include <catch2/catch_test_macros.hpp>
#include "executor/command_executor.hpp"
#include "executor/simulated_command_backend.hpp"

#include <chrono>
#include <memory>
#include <stop_token>
#include <thread>

using namespace cmdguard;

static SimulatedCommandBackend::Config fast_config() {
    SimulatedCommandBackend::Config cfg;
    cfg.min_latency_ms = 5;
    cfg.max_latency_ms = 10;
    cfg.seed = 7;
    return cfg;
}

TEST_CASE("SimulatedCommandBackend: reports success after the delay", "[backend]") {
    SimulatedCommandBackend backend(fast_config());
    std::stop_source stop;

    const auto start = std::chrono::steady_clock::now();
    const auto outcome = backend.run("git status", stop.get_token());
    const auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK(outcome.success);
    CHECK(outcome.output == "Command executed successfully: git status");
    CHECK(elapsed >= std::chrono::milliseconds(5));
    CHECK(backend.run_count() == 1);
}

TEST_CASE("SimulatedCommandBackend: failure rate of one always fails", "[backend]") {
    auto cfg = fast_config();
    cfg.failure_rate = 1.0;
    SimulatedCommandBackend backend(cfg);
    std::stop_source stop;

    const auto outcome = backend.run("npm test", stop.get_token());
    CHECK_FALSE(outcome.success);
    CHECK(outcome.error == "Command failed: npm test");
}

TEST_CASE("SimulatedCommandBackend: cancellation interrupts the delay", "[backend]") {
    SimulatedCommandBackend::Config cfg;
    cfg.min_latency_ms = 60000;
    cfg.max_latency_ms = 60000;
    SimulatedCommandBackend backend(cfg);
    std::stop_source stop;

    std::thread canceller([&stop] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        stop.request_stop();
    });

    const auto start = std::chrono::steady_clock::now();
    const auto outcome = backend.run("sleep 60", stop.get_token());
    const auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    CHECK_FALSE(outcome.success);
    CHECK(outcome.error == "Command cancelled: sleep 60");
    CHECK(elapsed < std::chrono::seconds(10));
    CHECK(backend.cancelled_count() == 1);
}

TEST_CASE("SimulatedCommandBackend: executor timeout cancels a slow run", "[backend][timeout]") {
    SimulatedCommandBackend::Config cfg;
    cfg.min_latency_ms = 60000;
    cfg.max_latency_ms = 60000;
    auto backend = std::make_shared<SimulatedCommandBackend>(cfg);
    CommandExecutor executor(backend);

    ExecutionOptions opts;
    opts.timeout_ms = 1000;
    const auto record = executor.execute("npm run build", opts);

    CHECK(record.timeout_used);
    CHECK_FALSE(record.success);

    // The worker observes the stop request shortly after the deadline
    for (int i = 0; i < 100 && backend->cancelled_count() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    CHECK(backend->cancelled_count() == 1);

    // The cancelled run is not recorded a second time
    CHECK(executor.history_size() == 1);
    CHECK(executor.get_recent_executions()[0].timeout_used);
}
