#include "executor/command_executor.hpp"
#include "classifier/command_classifier.hpp"
#include "core/utils.hpp"
#include "sanitizer/command_sanitizer.hpp"

#include <algorithm>
#include <condition_variable>
#include <format>
#include <future>
#include <stop_token>
#include <thread>

namespace cmdguard {

namespace {

// Shared between the waiting caller and the worker thread. Whoever finishes
// last releases it; a late outcome is written here and never read.
struct RaceState {
    std::mutex mutex;
    std::condition_variable cv;
    std::optional<BackendOutcome> outcome;
};

} // anonymous namespace

ExecutionOptions ExecutionOptions::normalized() const {
    ExecutionOptions o = *this;
    o.timeout_ms = std::clamp(timeout_ms, kMinTimeoutMs, kMaxTimeoutMs);
    o.max_retries = std::min(max_retries, kMaxRetries);
    return o;
}

CommandExecutor::CommandExecutor(std::shared_ptr<ICommandBackend> backend, const Config& config)
    : backend_(std::move(backend)),
      config_(config) {
    config_.default_options = config_.default_options.normalized();
    if (config_.max_history == 0) config_.max_history = 1;
}

ExecutionRecord CommandExecutor::execute(const std::string& command) {
    return execute(command, config_.default_options);
}

ExecutionRecord CommandExecutor::execute(const std::string& command, const ExecutionOptions& options) {
    const ExecutionOptions opts = options.normalized();

    AttemptResult result;
    uint32_t attempts = 0;
    while (true) {
        ++attempts;
        result = attempt(command, opts);

        const bool retry = result.retryable
            && opts.retry_on_failure
            && attempts <= opts.max_retries;
        if (!retry) break;

        utils::log::debug(std::format("Retrying command (attempt {} of {}): {}",
            attempts + 1, opts.max_retries + 1, result.record.sanitized_command));
    }

    result.record.attempts = attempts;
    if (opts.log_execution) {
        log_record(result.record);
    }
    return std::move(result.record);
}

CommandExecutor::AttemptResult CommandExecutor::attempt(
    const std::string& command, const ExecutionOptions& options) {

    utils::Timer timer;
    AttemptResult result;
    auto& rec = result.record;
    rec.id = utils::generate_id("cmd");
    rec.original_command = command;

    std::string text = command;
    if (options.sanitize) {
        auto report = CommandSanitizer::sanitization_report(command);
        text = report.sanitized;
        rec.sanitization = std::move(report);
    }
    rec.sanitized_command = text;
    rec.category = CommandClassifier::categorize(text);
    rec.risk_level = CommandClassifier::assess_risk(text);

    const auto finish = [&]() {
        rec.execution_time_ms = timer.elapsed_ms().count();
        rec.timestamp = utils::now();
    };

    if (options.validate) {
        const auto validation = CommandSanitizer::validate(text);
        if (!validation.is_valid) {
            rec.success = false;
            rec.error = "Command validation failed: " + utils::join(validation.issues, ", ");
            finish();
            return result;
        }
    }

    std::optional<BackendOutcome> outcome;
    try {
        outcome = run_with_timeout(text, std::chrono::milliseconds(options.timeout_ms));
    } catch (const std::exception& e) {
        // Worker thread could not be started
        outcome = BackendOutcome{false, "", e.what()};
    }

    if (!outcome) {
        rec.success = false;
        rec.timeout_used = true;
        rec.error = std::format("Command timed out after {}ms: {}", options.timeout_ms, text);
    } else if (outcome->success) {
        rec.success = true;
        rec.output = std::move(outcome->output);
    } else {
        rec.success = false;
        rec.error = outcome->error.empty() ? std::string("Unknown error") : std::move(outcome->error);
        result.retryable = true;
    }

    finish();
    return result;
}

std::optional<BackendOutcome> CommandExecutor::run_with_timeout(
    const std::string& command, std::chrono::milliseconds timeout) {

    if (!backend_) {
        return BackendOutcome{false, "", "No command backend configured"};
    }

    auto state = std::make_shared<RaceState>();
    std::stop_source stop;

    std::thread worker([state, backend = backend_, command, token = stop.get_token()] {
        BackendOutcome outcome;
        try {
            outcome = backend->run(command, token);
        } catch (const std::exception& e) {
            outcome = BackendOutcome{false, "", e.what()};
        } catch (...) {
            outcome = BackendOutcome{false, "", "Unknown error"};
        }
        {
            std::lock_guard lock(state->mutex);
            state->outcome = std::move(outcome);
        }
        state->cv.notify_one();
    });
    // The caller may stop waiting before the backend returns
    worker.detach();

    std::unique_lock lock(state->mutex);
    const bool finished = state->cv.wait_for(lock, timeout,
        [&state] { return state->outcome.has_value(); });
    if (!finished) {
        stop.request_stop();
        return std::nullopt;
    }
    return std::move(*state->outcome);
}

void CommandExecutor::log_record(const ExecutionRecord& record) {
    ExecutionCallback callback;
    {
        std::lock_guard lock(mutex_);
        history_.push_back(record);
        while (history_.size() > config_.max_history) {
            history_.pop_front();
        }
        callback = on_execution_;
    }

    if (record.success) {
        utils::log::info(std::format("Command executed: {} ({}ms, {})",
            record.sanitized_command, record.execution_time_ms,
            category_to_string(record.category)));
    } else {
        utils::log::warn(std::format("Command failed: {} ({}ms): {}",
            record.sanitized_command, record.execution_time_ms,
            record.error.value_or("")));
    }

    if (callback) {
        callback(record);
    }
}

std::vector<ExecutionRecord> CommandExecutor::execute_commands(
    const std::vector<std::string>& commands, const ExecutionOptions& options) {

    std::vector<ExecutionRecord> results;
    results.reserve(commands.size());
    for (const auto& cmd : commands) {
        results.push_back(execute(cmd, options));
        if (!results.back().success && !options.retry_on_failure) {
            utils::log::debug(std::format("Stopping sequence after failure ({} of {} run)",
                results.size(), commands.size()));
            break;
        }
    }
    return results;
}

std::vector<ExecutionRecord> CommandExecutor::execute_commands_parallel(
    const std::vector<std::string>& commands, const ExecutionOptions& options) {

    std::vector<std::future<ExecutionRecord>> futures;
    futures.reserve(commands.size());
    for (const auto& cmd : commands) {
        futures.push_back(std::async(std::launch::async,
            [this, &cmd, &options] { return execute(cmd, options); }));
    }

    std::vector<ExecutionRecord> results;
    results.reserve(futures.size());
    for (auto& f : futures) {
        results.push_back(f.get());
    }
    return results;
}

CommandPreview CommandExecutor::test_command(const std::string& command) const {
    CommandPreview preview;
    auto validation = CommandSanitizer::validate(command);

    preview.is_valid = validation.is_valid;
    preview.sanitized = CommandSanitizer::sanitize(command);
    preview.issues = std::move(validation.issues);

    // Keywords are matched on the raw text; later rules override earlier ones
    uint32_t estimate = 1000;
    if (command.find("git") != std::string::npos) estimate = 2000;
    if (command.find("npm") != std::string::npos) estimate = 5000;
    if (command.find("build") != std::string::npos) estimate = 10000;
    if (command.find("install") != std::string::npos) estimate = 15000;
    preview.estimated_execution_time_ms = estimate;

    return preview;
}

ExecutionStats CommandExecutor::get_execution_stats() const {
    std::lock_guard lock(mutex_);

    ExecutionStats stats;
    stats.total = history_.size();
    for (const auto& r : history_) {
        if (r.success) ++stats.successful;
        else ++stats.failed;
        if (r.timeout_used) ++stats.timeouts;
        if (r.attempts > 1) ++stats.retried;
        stats.total_execution_time_ms += r.execution_time_ms;
    }
    if (stats.total > 0) {
        stats.success_rate = static_cast<double>(stats.successful) * 100.0
                           / static_cast<double>(stats.total);
        stats.average_execution_time_ms = static_cast<double>(stats.total_execution_time_ms)
                                        / static_cast<double>(stats.total);
    }
    return stats;
}

template <typename Pred>
std::vector<ExecutionRecord> CommandExecutor::collect_newest(size_t limit, Pred&& pred) const {
    std::lock_guard lock(mutex_);
    std::vector<ExecutionRecord> result;
    for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
        if (limit != 0 && result.size() >= limit) break;
        if (pred(*it)) result.push_back(*it);
    }
    return result;
}

std::vector<ExecutionRecord> CommandExecutor::get_recent_executions(size_t limit) const {
    return collect_newest(limit, [](const ExecutionRecord&) { return true; });
}

std::vector<ExecutionRecord> CommandExecutor::get_failed_executions(size_t limit) const {
    return collect_newest(limit, [](const ExecutionRecord& r) { return !r.success; });
}

std::vector<ExecutionRecord> CommandExecutor::get_timeout_executions(size_t limit) const {
    return collect_newest(limit, [](const ExecutionRecord& r) { return r.timeout_used; });
}

size_t CommandExecutor::history_size() const {
    std::lock_guard lock(mutex_);
    return history_.size();
}

void CommandExecutor::clear_history() {
    std::lock_guard lock(mutex_);
    history_.clear();
    utils::log::info("Execution history cleared");
}

void CommandExecutor::set_on_execution(ExecutionCallback callback) {
    std::lock_guard lock(mutex_);
    on_execution_ = std::move(callback);
}

} // namespace cmdguard
