#pragma once

#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace cmdguard {

// ============================================================================
// Monitor Configuration
// ============================================================================

struct MonitorConfig {
    size_t max_history = 10000;
    size_t max_alerts = 1000;

    // high_failure_rate: failed share of the last N records
    size_t failure_rate_window = 50;
    double failure_rate_threshold = 0.2;

    // performance_degradation
    int64_t slow_execution_ms = 10000;

    // encoding_issues (raised when sanitization removed problematic characters)
    bool alert_on_encoding_issues = true;

    // Trend analysis: last window vs the window before it
    size_t trend_window = 100;
    size_t trend_min_samples = 10;
    double success_rate_delta = 5.0;            // percentage points
    double execution_time_delta_ms = 1000.0;

    // Failure patterns
    size_t min_pattern_frequency = 3;
    size_t max_pattern_examples = 3;
};

// ============================================================================
// Statistics
// ============================================================================

enum class TrendDirection {
    STABLE,
    IMPROVING,
    DECLINING,
    FASTER,
    SLOWER,
    INCREASING,
    DECREASING
};

[[nodiscard]] constexpr std::string_view trend_to_string(TrendDirection t) {
    switch (t) {
        case TrendDirection::STABLE:     return "stable";
        case TrendDirection::IMPROVING:  return "improving";
        case TrendDirection::DECLINING:  return "declining";
        case TrendDirection::FASTER:     return "faster";
        case TrendDirection::SLOWER:     return "slower";
        case TrendDirection::INCREASING: return "increasing";
        case TrendDirection::DECREASING: return "decreasing";
        default: return "stable";
    }
}

struct TrendAnalysis {
    TrendDirection success_rate = TrendDirection::STABLE;      // improving | stable | declining
    TrendDirection execution_time = TrendDirection::STABLE;    // faster | stable | slower
    TrendDirection failure_rate = TrendDirection::STABLE;      // decreasing | stable | increasing
    TrendDirection command_volume = TrendDirection::STABLE;    // increasing | stable | decreasing
};

struct HourlyStats {
    int hour = 0;                   // local time, 0-23
    uint64_t total_commands = 0;
    uint64_t successful_commands = 0;
    uint64_t failed_commands = 0;
    double average_execution_time_ms = 0.0;
};

struct DailyStats {
    std::string date;               // UTC, YYYY-MM-DD
    uint64_t total_commands = 0;
    uint64_t successful_commands = 0;
    uint64_t failed_commands = 0;
    double average_execution_time_ms = 0.0;
    size_t unique_commands = 0;     // distinct sanitized commands that day
};

struct CommandStatistics {
    uint64_t total_commands = 0;
    uint64_t successful_commands = 0;
    uint64_t failed_commands = 0;
    uint64_t timeout_commands = 0;
    double success_rate = 0.0;      // percent, 0 when the ledger is empty
    double average_execution_time_ms = 0.0;
    int64_t total_execution_time_ms = 0;
    CategoryBreakdown category_breakdown{};
    RiskBreakdown risk_breakdown{};
    std::vector<HourlyStats> hourly_stats;      // hours present, ascending
    std::vector<DailyStats> daily_stats;        // dates present, ascending
    TrendAnalysis trends;
};

// ============================================================================
// Failure Patterns
// ============================================================================

/**
 * @brief Failed records sharing one error string
 *
 * Derived on demand from the ledger, never stored. Severity uses the
 * low/medium/high/critical scale of RiskLevel.
 */
struct FailurePattern {
    std::string pattern;
    size_t frequency = 0;
    double percentage = 0.0;                    // share of all failures
    std::vector<std::string> example_commands;  // original text, first few
    std::chrono::system_clock::time_point last_occurrence;
    RiskLevel severity = RiskLevel::LOW;
};

} // namespace cmdguard
