#include "alerting/alert_store.hpp"

#include <algorithm>

namespace cmdguard {

AlertStore::AlertStore(const Config& config)
    : config_(config) {
    if (config_.max_alerts == 0) config_.max_alerts = 1;
}

void AlertStore::add(Alert alert) {
    raised_count_.fetch_add(1, std::memory_order_relaxed);

    std::lock_guard lock(mutex_);
    alerts_.push_back(std::move(alert));
    while (alerts_.size() > config_.max_alerts) {
        alerts_.pop_front();
        evicted_count_.fetch_add(1, std::memory_order_relaxed);
    }
}

bool AlertStore::resolve(const std::string& id) {
    std::lock_guard lock(mutex_);
    const auto it = std::find_if(alerts_.begin(), alerts_.end(),
        [&id](const Alert& a) { return a.id == id; });
    if (it == alerts_.end()) return false;

    if (!it->resolved) {
        it->resolved = true;
        // Clock adjustments must not put resolution before the alert itself
        it->resolved_at = std::max(std::chrono::system_clock::now(), it->timestamp);
        resolved_count_.fetch_add(1, std::memory_order_relaxed);
    }
    return true;
}

std::vector<Alert> AlertStore::active() const {
    std::lock_guard lock(mutex_);
    std::vector<Alert> result;
    for (auto it = alerts_.rbegin(); it != alerts_.rend(); ++it) {
        if (!it->resolved) result.push_back(*it);
    }
    return result;
}

std::vector<Alert> AlertStore::all() const {
    std::lock_guard lock(mutex_);
    return {alerts_.begin(), alerts_.end()};
}

std::optional<Alert> AlertStore::find(const std::string& id) const {
    std::lock_guard lock(mutex_);
    for (const auto& a : alerts_) {
        if (a.id == id) return a;
    }
    return std::nullopt;
}

size_t AlertStore::size() const {
    std::lock_guard lock(mutex_);
    return alerts_.size();
}

void AlertStore::clear() {
    std::lock_guard lock(mutex_);
    alerts_.clear();
}

AlertStore::Stats AlertStore::get_stats() const {
    Stats s;
    s.alerts_raised = raised_count_.load(std::memory_order_relaxed);
    s.alerts_resolved = resolved_count_.load(std::memory_order_relaxed);
    s.alerts_evicted = evicted_count_.load(std::memory_order_relaxed);
    {
        std::lock_guard lock(mutex_);
        s.stored_alert_count = alerts_.size();
        s.active_alert_count = static_cast<size_t>(std::count_if(alerts_.begin(), alerts_.end(),
            [](const Alert& a) { return !a.resolved; }));
    }
    return s;
}

} // namespace cmdguard
