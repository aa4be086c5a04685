#include "executor/simulated_command_backend.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <format>

namespace cmdguard {

SimulatedCommandBackend::SimulatedCommandBackend(const Config& config)
    : config_(config),
      rng_(config.seed != 0 ? config.seed : std::random_device{}()) {
    if (config_.min_latency_ms > config_.max_latency_ms) {
        std::swap(config_.min_latency_ms, config_.max_latency_ms);
    }
    config_.failure_rate = std::clamp(config_.failure_rate, 0.0, 1.0);
}

BackendOutcome SimulatedCommandBackend::run(const std::string& command, std::stop_token stop) {
    run_count_.fetch_add(1, std::memory_order_relaxed);

    uint32_t latency_ms = 0;
    bool fail = false;
    {
        std::lock_guard lock(rng_mutex_);
        std::uniform_int_distribution<uint32_t> latency(config_.min_latency_ms, config_.max_latency_ms);
        latency_ms = latency(rng_);
        if (config_.failure_rate > 0.0) {
            std::bernoulli_distribution failure(config_.failure_rate);
            fail = failure(rng_);
        }
    }

    // Interruptible sleep: wait_for returns early once stop is requested
    std::mutex m;
    std::condition_variable_any cv;
    {
        std::unique_lock lock(m);
        cv.wait_for(lock, stop, std::chrono::milliseconds(latency_ms), [] { return false; });
    }

    if (stop.stop_requested()) {
        cancelled_count_.fetch_add(1, std::memory_order_relaxed);
        return {false, "", std::format("Command cancelled: {}", command)};
    }

    if (fail) {
        return {false, "", std::format("Command failed: {}", command)};
    }
    return {true, std::format("Command executed successfully: {}", command), ""};
}

} // namespace cmdguard
