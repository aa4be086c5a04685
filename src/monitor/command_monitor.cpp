#include "monitor/command_monitor.hpp"
#include "core/utils.hpp"
#include "serialization/record_serializer.hpp"

#include <algorithm>
#include <format>
#include <map>
#include <unordered_map>

namespace cmdguard {

namespace {

struct WindowSummary {
    size_t count = 0;
    size_t successful = 0;
    int64_t total_time_ms = 0;

    [[nodiscard]] double success_rate() const {
        return count > 0 ? static_cast<double>(successful) * 100.0 / static_cast<double>(count) : 0.0;
    }

    [[nodiscard]] double average_time_ms() const {
        return count > 0 ? static_cast<double>(total_time_ms) / static_cast<double>(count) : 0.0;
    }
};

template <typename It>
WindowSummary summarize(It begin, It end) {
    WindowSummary s;
    for (auto it = begin; it != end; ++it) {
        ++s.count;
        if (it->success) ++s.successful;
        s.total_time_ms += it->execution_time_ms;
    }
    return s;
}

RiskLevel pattern_severity(double percentage) {
    if (percentage > 50.0) return RiskLevel::CRITICAL;
    if (percentage > 25.0) return RiskLevel::HIGH;
    if (percentage > 10.0) return RiskLevel::MEDIUM;
    return RiskLevel::LOW;
}

std::string upper(std::string_view s) {
    std::string out(s);
    for (char& c : out) {
        if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    }
    return out;
}

} // anonymous namespace

CommandMonitor::CommandMonitor(const MonitorConfig& config)
    : config_(config),
      alerts_(AlertStore::Config{config.max_alerts}) {
    if (config_.max_history == 0) config_.max_history = 1;
    if (config_.failure_rate_window == 0) config_.failure_rate_window = 1;
    if (config_.trend_window == 0) config_.trend_window = 1;
}

std::vector<Alert> CommandMonitor::log_execution(const ExecutionRecord& record) {
    size_t window_total = 0;
    size_t window_failed = 0;
    AlertCallback callback;
    {
        std::lock_guard lock(mutex_);
        if (ids_.contains(record.id)) {
            duplicates_ignored_.fetch_add(1, std::memory_order_relaxed);
            utils::log::debug(std::format("Monitor: duplicate execution id ignored: {}", record.id));
            return {};
        }

        ledger_.push_back(record);
        ids_.insert(record.id);
        while (ledger_.size() > config_.max_history) {
            ids_.erase(ledger_.front().id);
            ledger_.pop_front();
        }

        const size_t window = std::min(config_.failure_rate_window, ledger_.size());
        for (auto it = ledger_.rbegin(); it != ledger_.rbegin() + static_cast<std::ptrdiff_t>(window); ++it) {
            if (!it->success) ++window_failed;
        }
        window_total = window;
        callback = on_alert_;
    }

    log_to_console(record);

    auto raised = evaluate_rules(record, window_total, window_failed);
    for (const auto& alert : raised) {
        alerts_.add(alert);
        utils::log::warn(std::format("Alert [{}] {}: {}",
            alert_severity_to_string(alert.severity),
            alert_type_to_string(alert.type), alert.message));
        if (callback) {
            callback(alert);
        }
    }
    return raised;
}

std::vector<Alert> CommandMonitor::evaluate_rules(const ExecutionRecord& record,
                                                  size_t window_total, size_t window_failed) const {
    std::vector<Alert> raised;

    const auto make = [&record](AlertType type, AlertSeverity severity, std::string message) {
        Alert alert;
        alert.type = type;
        alert.severity = severity;
        alert.message = std::move(message);
        alert.related_execution_id = record.id;
        return alert;
    };

    if (window_total > 0) {
        const double failure_rate = static_cast<double>(window_failed) / static_cast<double>(window_total);
        if (failure_rate > config_.failure_rate_threshold) {
            raised.push_back(make(AlertType::HIGH_FAILURE_RATE, AlertSeverity::ERROR,
                std::format("High failure rate detected: {:.1f}%", failure_rate * 100.0)));
        }
    }

    if (record.timeout_used) {
        raised.push_back(make(AlertType::TIMEOUT_INCREASE, AlertSeverity::WARNING,
            std::format("Command timed out: {}", record.sanitized_command)));
    }

    if (record.risk_level == RiskLevel::HIGH || record.risk_level == RiskLevel::CRITICAL) {
        raised.push_back(make(AlertType::SUSPICIOUS_COMMAND, AlertSeverity::WARNING,
            std::format("Suspicious command detected: {}", record.sanitized_command)));
    }

    if (record.execution_time_ms > config_.slow_execution_ms) {
        raised.push_back(make(AlertType::PERFORMANCE_DEGRADATION, AlertSeverity::WARNING,
            std::format("Slow command execution: {}ms for {}",
                record.execution_time_ms, record.sanitized_command)));
    }

    if (config_.alert_on_encoding_issues && record.sanitization
        && record.sanitization->problematic_count() > 0) {
        raised.push_back(make(AlertType::ENCODING_ISSUES, AlertSeverity::INFO,
            std::format("Removed {} problematic character(s) from command: {}",
                record.sanitization->problematic_count(), record.sanitized_command)));
    }

    return raised;
}

void CommandMonitor::log_to_console(const ExecutionRecord& record) const {
    const auto line = std::format("[{}] [{}] [{}ms]{} {}",
        category_to_string(record.category),
        upper(risk_level_to_string(record.risk_level)),
        record.execution_time_ms,
        record.timeout_used ? " (TIMEOUT)" : "",
        record.sanitized_command);

    if (record.success) {
        utils::log::debug(std::format("Monitor: OK {}", line));
    } else {
        utils::log::debug(std::format("Monitor: FAIL {} error={}", line, record.error.value_or("")));
    }
    if (record.sanitization && record.sanitization->characters_removed > 0) {
        utils::log::debug(std::format("Monitor: sanitized, {} characters removed",
            record.sanitization->characters_removed));
    }
}

CommandStatistics CommandMonitor::get_statistics() const {
    std::lock_guard lock(mutex_);

    CommandStatistics stats;
    stats.total_commands = ledger_.size();
    for (const auto& r : ledger_) {
        if (r.success) ++stats.successful_commands;
        else ++stats.failed_commands;
        if (r.timeout_used) ++stats.timeout_commands;
        stats.total_execution_time_ms += r.execution_time_ms;
        ++stats.category_breakdown[static_cast<size_t>(r.category)];
        ++stats.risk_breakdown[static_cast<size_t>(r.risk_level)];
    }

    if (stats.total_commands > 0) {
        const auto total = static_cast<double>(stats.total_commands);
        stats.success_rate = static_cast<double>(stats.successful_commands) * 100.0 / total;
        stats.average_execution_time_ms = static_cast<double>(stats.total_execution_time_ms) / total;
    }

    stats.hourly_stats = hourly_stats();
    stats.daily_stats = daily_stats();
    stats.trends = analyze_trends();
    return stats;
}

std::vector<HourlyStats> CommandMonitor::hourly_stats() const {
    struct Bucket {
        HourlyStats stats;
        int64_t total_time_ms = 0;
    };
    std::map<int, Bucket> buckets;

    for (const auto& r : ledger_) {
        const int hour = utils::local_hour(r.timestamp);
        auto& b = buckets[hour];
        b.stats.hour = hour;
        ++b.stats.total_commands;
        if (r.success) ++b.stats.successful_commands;
        else ++b.stats.failed_commands;
        b.total_time_ms += r.execution_time_ms;
    }

    std::vector<HourlyStats> result;
    result.reserve(buckets.size());
    for (auto& [hour, b] : buckets) {
        b.stats.average_execution_time_ms = static_cast<double>(b.total_time_ms)
                                          / static_cast<double>(b.stats.total_commands);
        result.push_back(b.stats);
    }
    return result;
}

std::vector<DailyStats> CommandMonitor::daily_stats() const {
    struct Bucket {
        DailyStats stats;
        int64_t total_time_ms = 0;
        std::unordered_set<std::string> commands;
    };
    std::map<std::string, Bucket> buckets;

    for (const auto& r : ledger_) {
        const std::string date = utils::format_date(r.timestamp);
        auto& b = buckets[date];
        b.stats.date = date;
        ++b.stats.total_commands;
        if (r.success) ++b.stats.successful_commands;
        else ++b.stats.failed_commands;
        b.total_time_ms += r.execution_time_ms;
        b.commands.insert(r.sanitized_command);
    }

    std::vector<DailyStats> result;
    result.reserve(buckets.size());
    for (auto& [date, b] : buckets) {
        b.stats.average_execution_time_ms = static_cast<double>(b.total_time_ms)
                                          / static_cast<double>(b.stats.total_commands);
        b.stats.unique_commands = b.commands.size();
        result.push_back(std::move(b.stats));
    }
    return result;
}

TrendAnalysis CommandMonitor::analyze_trends() const {
    TrendAnalysis trends;

    const size_t n = ledger_.size();
    const size_t window = config_.trend_window;
    const size_t recent_count = std::min(window, n);
    const size_t older_count = std::min(window, n - recent_count);

    const auto recent_begin = ledger_.end() - static_cast<std::ptrdiff_t>(recent_count);
    const auto older_begin = recent_begin - static_cast<std::ptrdiff_t>(older_count);

    const WindowSummary recent = summarize(recent_begin, ledger_.end());
    const WindowSummary older = summarize(older_begin, recent_begin);

    if (recent.count < config_.trend_min_samples || older.count < config_.trend_min_samples) {
        return trends;
    }

    const double rate_delta = recent.success_rate() - older.success_rate();
    if (rate_delta > config_.success_rate_delta) {
        trends.success_rate = TrendDirection::IMPROVING;
        trends.failure_rate = TrendDirection::DECREASING;
    } else if (rate_delta < -config_.success_rate_delta) {
        trends.success_rate = TrendDirection::DECLINING;
        trends.failure_rate = TrendDirection::INCREASING;
    }

    const double time_delta = recent.average_time_ms() - older.average_time_ms();
    if (time_delta < -config_.execution_time_delta_ms) {
        trends.execution_time = TrendDirection::FASTER;
    } else if (time_delta > config_.execution_time_delta_ms) {
        trends.execution_time = TrendDirection::SLOWER;
    }

    if (recent.count > older.count) {
        trends.command_volume = TrendDirection::INCREASING;
    } else if (recent.count < older.count) {
        trends.command_volume = TrendDirection::DECREASING;
    }

    return trends;
}

std::vector<FailurePattern> CommandMonitor::detect_failure_patterns() const {
    std::lock_guard lock(mutex_);

    std::vector<FailurePattern> groups;
    std::unordered_map<std::string, size_t> index;
    size_t total_failures = 0;

    for (const auto& r : ledger_) {
        if (r.success) continue;
        ++total_failures;

        const std::string key = r.error.value_or("Unknown");
        auto [it, inserted] = index.try_emplace(key, groups.size());
        if (inserted) {
            FailurePattern p;
            p.pattern = key;
            p.last_occurrence = r.timestamp;
            groups.push_back(std::move(p));
        }

        auto& group = groups[it->second];
        ++group.frequency;
        if (group.example_commands.size() < config_.max_pattern_examples) {
            group.example_commands.push_back(r.original_command);
        }
        group.last_occurrence = std::max(group.last_occurrence, r.timestamp);
    }

    std::vector<FailurePattern> patterns;
    for (auto& g : groups) {
        if (g.frequency < config_.min_pattern_frequency) continue;
        g.percentage = static_cast<double>(g.frequency) * 100.0 / static_cast<double>(total_failures);
        g.severity = pattern_severity(g.percentage);
        patterns.push_back(std::move(g));
    }

    std::stable_sort(patterns.begin(), patterns.end(),
        [](const FailurePattern& a, const FailurePattern& b) { return a.frequency > b.frequency; });
    return patterns;
}

std::vector<Alert> CommandMonitor::get_active_alerts() const {
    return alerts_.active();
}

std::vector<Alert> CommandMonitor::get_alerts() const {
    return alerts_.all();
}

bool CommandMonitor::resolve_alert(const std::string& alert_id) {
    const bool found = alerts_.resolve(alert_id);
    if (!found) {
        utils::log::debug(std::format("Monitor: resolve for unknown alert {}", alert_id));
    }
    return found;
}

std::vector<ExecutionRecord> CommandMonitor::get_recent_executions(size_t limit) const {
    std::lock_guard lock(mutex_);
    const size_t count = (limit == 0) ? ledger_.size() : std::min(limit, ledger_.size());
    return {ledger_.rbegin(), ledger_.rbegin() + static_cast<std::ptrdiff_t>(count)};
}

size_t CommandMonitor::size() const {
    std::lock_guard lock(mutex_);
    return ledger_.size();
}

std::string CommandMonitor::export_data(ExportFormat format) const {
    std::vector<ExecutionRecord> records;
    {
        std::lock_guard lock(mutex_);
        records.assign(ledger_.begin(), ledger_.end());
    }

    try {
        if (format == ExportFormat::CSV) {
            return serialization::executions_to_csv(records);
        }
        return serialization::to_json_array(records).dump();
    } catch (const std::exception& e) {
        utils::log::error(std::format("Monitor export ({}) failed: {}",
            export_format_to_string(format), e.what()));
        return {};
    }
}

void CommandMonitor::clear_all_data() {
    {
        std::lock_guard lock(mutex_);
        ledger_.clear();
        ids_.clear();
    }
    alerts_.clear();
    utils::log::info("Monitor data cleared");
}

void CommandMonitor::set_on_alert(AlertCallback callback) {
    std::lock_guard lock(mutex_);
    on_alert_ = std::move(callback);
}

} // namespace cmdguard
