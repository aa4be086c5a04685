#pragma once

#include "alerting/alert_store.hpp"
#include "alerting/alert_types.hpp"
#include "core/types.hpp"
#include "monitor/monitor_types.hpp"

#include <atomic>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace cmdguard {

/**
 * @brief Turns a stream of ExecutionRecords into statistics and alerts
 *
 * Keeps its own bounded copy of every logged record (oldest evicted first,
 * ids unique) and runs a fixed rule set on each insert:
 *   - high_failure_rate        error    failed share of the last N > threshold
 *   - timeout_increase         warning  the record timed out
 *   - suspicious_command       warning  risk level high or critical
 *   - performance_degradation  warning  execution time above the limit
 *   - encoding_issues          info     sanitization removed problematic chars
 * Alerts are never de-duplicated; each trigger adds an entry.
 *
 * Statistics, failure patterns and exports are computed fresh from the
 * ledger on every call. Public operations never throw.
 */
class CommandMonitor {
public:
    using AlertCallback = std::function<void(const Alert&)>;

    CommandMonitor() : CommandMonitor(MonitorConfig{}) {}
    explicit CommandMonitor(const MonitorConfig& config);

    CommandMonitor(const CommandMonitor&) = delete;
    CommandMonitor& operator=(const CommandMonitor&) = delete;

    /**
     * @brief Store a record and evaluate the alert rules
     * @return Alerts raised by this record (empty for a duplicate id)
     */
    std::vector<Alert> log_execution(const ExecutionRecord& record);

    [[nodiscard]] CommandStatistics get_statistics() const;

    /**
     * @brief Group failed records by error string
     *
     * Groups with fewer than min_pattern_frequency members are dropped.
     * Sorted by descending frequency; ties keep first-seen order.
     */
    [[nodiscard]] std::vector<FailurePattern> detect_failure_patterns() const;

    /// Unresolved alerts, newest first
    [[nodiscard]] std::vector<Alert> get_active_alerts() const;

    /// All retained alerts, oldest first
    [[nodiscard]] std::vector<Alert> get_alerts() const;

    /// Idempotent; false when the id is unknown
    bool resolve_alert(const std::string& alert_id);

    /// Newest first, at most `limit` (0 = all)
    [[nodiscard]] std::vector<ExecutionRecord> get_recent_executions(size_t limit = 10) const;

    [[nodiscard]] size_t size() const;

    /**
     * @brief Serialize the full ledger, oldest first
     *
     * JSON is an array of record objects. CSV has the fixed 10-column
     * header. Returns an empty string if serialization fails.
     */
    [[nodiscard]] std::string export_data(ExportFormat format = ExportFormat::JSON) const;

    void clear_all_data();

    /// Called for every raised alert, outside the ledger lock
    void set_on_alert(AlertCallback callback);

    [[nodiscard]] const MonitorConfig& config() const { return config_; }

    [[nodiscard]] AlertStore::Stats get_alert_stats() const { return alerts_.get_stats(); }

    [[nodiscard]] uint64_t duplicates_ignored() const {
        return duplicates_ignored_.load(std::memory_order_relaxed);
    }

private:
    std::vector<Alert> evaluate_rules(const ExecutionRecord& record,
                                      size_t window_total, size_t window_failed) const;

    TrendAnalysis analyze_trends() const;                   // caller holds mutex_
    std::vector<HourlyStats> hourly_stats() const;          // caller holds mutex_
    std::vector<DailyStats> daily_stats() const;            // caller holds mutex_

    void log_to_console(const ExecutionRecord& record) const;

    MonitorConfig config_;

    mutable std::mutex mutex_;
    std::deque<ExecutionRecord> ledger_;
    std::unordered_set<std::string> ids_;
    AlertCallback on_alert_;

    AlertStore alerts_;

    std::atomic<uint64_t> duplicates_ignored_{0};
};

} // namespace cmdguard
