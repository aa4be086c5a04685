#pragma once

#include "alerting/alert_types.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cmdguard {

/**
 * @brief Bounded, insertion-ordered alert store
 *
 * Holds at most max_alerts entries; the oldest alert (resolved or not) is
 * evicted first. Resolution is idempotent: the first resolve stamps
 * resolved_at and later calls leave it untouched.
 */
class AlertStore {
public:
    struct Config {
        size_t max_alerts = 1000;
    };

    struct Stats {
        uint64_t alerts_raised = 0;
        uint64_t alerts_resolved = 0;
        uint64_t alerts_evicted = 0;
        size_t active_alert_count = 0;
        size_t stored_alert_count = 0;
    };

    AlertStore() : AlertStore(Config{}) {}
    explicit AlertStore(const Config& config);

    void add(Alert alert);

    /**
     * @brief Mark an alert resolved
     * @return false if no alert with this id is retained
     */
    bool resolve(const std::string& id);

    /// Unresolved alerts, newest first
    [[nodiscard]] std::vector<Alert> active() const;

    /// Every retained alert, oldest first
    [[nodiscard]] std::vector<Alert> all() const;

    [[nodiscard]] std::optional<Alert> find(const std::string& id) const;

    [[nodiscard]] size_t size() const;

    void clear();

    [[nodiscard]] Stats get_stats() const;

private:
    Config config_;
    mutable std::mutex mutex_;
    std::deque<Alert> alerts_;

    std::atomic<uint64_t> raised_count_{0};
    std::atomic<uint64_t> resolved_count_{0};
    std::atomic<uint64_t> evicted_count_{0};
};

} // namespace cmdguard
