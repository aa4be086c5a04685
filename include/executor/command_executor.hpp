#pragma once

#include "core/types.hpp"
#include "executor/icommand_backend.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cmdguard {

/**
 * @brief Per-call execution options
 *
 * Defaults match the documented contract. Out-of-range values are clamped
 * by normalized(), which CommandExecutor applies at the call boundary.
 */
struct ExecutionOptions {
    static constexpr uint32_t kDefaultTimeoutMs = 30000;
    static constexpr uint32_t kMinTimeoutMs = 1000;
    static constexpr uint32_t kMaxTimeoutMs = 300000;
    static constexpr uint32_t kMaxRetries = 10;

    uint32_t timeout_ms = kDefaultTimeoutMs;
    bool sanitize = true;
    bool validate = true;
    bool log_execution = true;
    bool retry_on_failure = false;
    uint32_t max_retries = 3;

    [[nodiscard]] ExecutionOptions normalized() const;
};

/**
 * @brief Aggregates over the executor's retained history
 */
struct ExecutionStats {
    uint64_t total = 0;
    uint64_t successful = 0;
    uint64_t failed = 0;
    uint64_t timeouts = 0;
    uint64_t retried = 0;                   // records that needed more than one attempt
    double success_rate = 0.0;              // percent, 0 when empty
    double average_execution_time_ms = 0.0;
    int64_t total_execution_time_ms = 0;
};

/**
 * @brief Dry-run result of test_command()
 *
 * is_valid and issues describe the raw text as given, so a preview shows
 * what sanitization will have to remove. sanitized is what execute() runs.
 */
struct CommandPreview {
    bool is_valid = false;
    std::string sanitized;
    std::vector<std::string> issues;
    uint32_t estimated_execution_time_ms = 0;
};

/**
 * @brief Runs commands under sanitization, validation, timeout and retry
 *
 * Flow for one execute() call:
 *   1. sanitize (optional): strip problematic characters, attach report
 *   2. validate (optional): an invalid command fails without touching the
 *      backend
 *   3. race backend->run() on a worker thread against the timeout; when
 *      the deadline wins, cancellation is requested and the late result
 *      is discarded
 *   4. backend failures are retried when enabled (validation failures and
 *      timeouts never are)
 *   5. the final record goes to the bounded history and the observer
 *
 * execute() never throws: every outcome is a returned ExecutionRecord.
 * History access is serialized by one mutex.
 */
class CommandExecutor {
public:
    struct Config {
        size_t max_history = 1000;
        ExecutionOptions default_options;
    };

    using ExecutionCallback = std::function<void(const ExecutionRecord&)>;

    explicit CommandExecutor(std::shared_ptr<ICommandBackend> backend)
        : CommandExecutor(std::move(backend), Config{}) {}
    CommandExecutor(std::shared_ptr<ICommandBackend> backend, const Config& config);

    CommandExecutor(const CommandExecutor&) = delete;
    CommandExecutor& operator=(const CommandExecutor&) = delete;

    /// Execute with the configured default options
    ExecutionRecord execute(const std::string& command);

    ExecutionRecord execute(const std::string& command, const ExecutionOptions& options);

    /**
     * @brief Execute one after another
     *
     * Each command starts only after the previous record exists. Stops at
     * the first failure unless options.retry_on_failure is set.
     */
    std::vector<ExecutionRecord> execute_commands(
        const std::vector<std::string>& commands, const ExecutionOptions& options);

    /**
     * @brief Execute all commands concurrently and wait for every one
     * @return Records in input order, regardless of completion order
     */
    std::vector<ExecutionRecord> execute_commands_parallel(
        const std::vector<std::string>& commands, const ExecutionOptions& options);

    /**
     * @brief Sanitize and validate without executing
     *
     * The estimate is a coarse guess from the command text: 1s by default,
     * more for git, npm, build and install commands.
     */
    [[nodiscard]] CommandPreview test_command(const std::string& command) const;

    [[nodiscard]] ExecutionStats get_execution_stats() const;

    // Newest-first slices, at most `limit` entries (0 = all)
    [[nodiscard]] std::vector<ExecutionRecord> get_recent_executions(size_t limit = 10) const;
    [[nodiscard]] std::vector<ExecutionRecord> get_failed_executions(size_t limit = 10) const;
    [[nodiscard]] std::vector<ExecutionRecord> get_timeout_executions(size_t limit = 10) const;

    [[nodiscard]] size_t history_size() const;

    void clear_history();

    /// Called with every logged record, outside the history lock
    void set_on_execution(ExecutionCallback callback);

    [[nodiscard]] const ExecutionOptions& default_options() const { return config_.default_options; }

private:
    struct AttemptResult {
        ExecutionRecord record;
        bool retryable = false;     // backend failure, not validation or timeout
    };

    AttemptResult attempt(const std::string& command, const ExecutionOptions& options);

    /**
     * @brief Run the backend on a worker thread, bounded by @p timeout
     * @return Backend outcome, or nullopt when the deadline passed first
     */
    std::optional<BackendOutcome> run_with_timeout(
        const std::string& command, std::chrono::milliseconds timeout);

    void log_record(const ExecutionRecord& record);

    template <typename Pred>
    std::vector<ExecutionRecord> collect_newest(size_t limit, Pred&& pred) const;

    std::shared_ptr<ICommandBackend> backend_;
    Config config_;

    mutable std::mutex mutex_;
    std::deque<ExecutionRecord> history_;
    ExecutionCallback on_execution_;
};

} // namespace cmdguard
