#pragma once

#include "executor/icommand_backend.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace cmdguard::testing {

/**
 * @brief Scripted command backend for executor/protection tests
 *
 * SUCCEED and FAIL return immediately, THROW raises, BLOCK waits until
 * the executor requests cancellation. LATE ignores cancellation, sleeps
 * for the late delay and then reports success. fail_first(n) makes the
 * first n runs fail regardless of mode.
 */
class MockCommandBackend : public ICommandBackend {
public:
    enum class Mode { SUCCEED, FAIL, THROW, BLOCK, LATE };

    explicit MockCommandBackend(Mode mode = Mode::SUCCEED) : mode_(mode) {}

    [[nodiscard]] BackendOutcome run(const std::string& command, std::stop_token stop) override {
        const uint64_t n = run_count_.fetch_add(1, std::memory_order_relaxed);
        {
            std::lock_guard lock(mutex_);
            commands_.push_back(command);
        }

        if (n < fail_first_.load(std::memory_order_relaxed)) {
            return {false, "", "Mock failure: " + command};
        }

        switch (mode_.load(std::memory_order_relaxed)) {
            case Mode::SUCCEED:
                return {true, "ok: " + command, ""};
            case Mode::FAIL:
                return {false, "", "Mock failure: " + command};
            case Mode::THROW:
                throw std::runtime_error("backend exploded");
            case Mode::BLOCK: {
                std::mutex m;
                std::condition_variable_any cv;
                std::unique_lock lock(m);
                cv.wait(lock, stop, [] { return false; });
                cancelled_.fetch_add(1, std::memory_order_relaxed);
                return {false, "", "cancelled"};
            }
            case Mode::LATE: {
                std::this_thread::sleep_for(std::chrono::milliseconds(
                    late_delay_ms_.load(std::memory_order_relaxed)));
                late_returns_.fetch_add(1, std::memory_order_relaxed);
                return {true, "late: " + command, ""};
            }
        }
        return {false, "", "unreachable"};
    }

    void set_mode(Mode mode) { mode_.store(mode, std::memory_order_relaxed); }
    void fail_first(uint64_t n) { fail_first_.store(n, std::memory_order_relaxed); }
    void set_late_delay(uint32_t ms) { late_delay_ms_.store(ms, std::memory_order_relaxed); }

    [[nodiscard]] uint64_t run_count() const {
        return run_count_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] uint64_t cancelled_count() const {
        return cancelled_.load(std::memory_order_relaxed);
    }

    // LATE runs that have returned to the executor
    [[nodiscard]] uint64_t late_returns() const {
        return late_returns_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::vector<std::string> commands() const {
        std::lock_guard lock(mutex_);
        return commands_;
    }

private:
    std::atomic<Mode> mode_;
    std::atomic<uint64_t> fail_first_{0};
    std::atomic<uint64_t> run_count_{0};
    std::atomic<uint64_t> cancelled_{0};
    std::atomic<uint32_t> late_delay_ms_{1500};
    std::atomic<uint64_t> late_returns_{0};
    mutable std::mutex mutex_;
    std::vector<std::string> commands_;
};

} // namespace cmdguard::testing
