#pragma once

#include "executor/icommand_backend.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <random>

namespace cmdguard {

/**
 * @brief Backend that fakes execution with a random delay
 *
 * Sleeps for a uniformly drawn latency in [min_latency_ms, max_latency_ms]
 * and then reports success with "Command executed successfully: {cmd}".
 * With failure_rate > 0 a share of runs fails instead. The sleep wakes up
 * immediately when cancellation is requested.
 */
class SimulatedCommandBackend : public ICommandBackend {
public:
    struct Config {
        uint32_t min_latency_ms = 500;
        uint32_t max_latency_ms = 2500;
        double failure_rate = 0.0;      // 0.0 - 1.0
        uint64_t seed = 0;              // 0 = seed from std::random_device
    };

    SimulatedCommandBackend() : SimulatedCommandBackend(Config{}) {}
    explicit SimulatedCommandBackend(const Config& config);

    [[nodiscard]] BackendOutcome run(const std::string& command, std::stop_token stop) override;

    [[nodiscard]] uint64_t run_count() const {
        return run_count_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] uint64_t cancelled_count() const {
        return cancelled_count_.load(std::memory_order_relaxed);
    }

private:
    Config config_;
    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
    std::atomic<uint64_t> run_count_{0};
    std::atomic<uint64_t> cancelled_count_{0};
};

} // namespace cmdguard
