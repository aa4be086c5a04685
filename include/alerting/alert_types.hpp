#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "core/utils.hpp"

namespace cmdguard {

namespace keys {
    inline constexpr std::string_view HIGH_FAILURE_RATE       = "high_failure_rate";
    inline constexpr std::string_view TIMEOUT_INCREASE        = "timeout_increase";
    inline constexpr std::string_view SUSPICIOUS_COMMAND      = "suspicious_command";
    inline constexpr std::string_view PERFORMANCE_DEGRADATION = "performance_degradation";
    inline constexpr std::string_view ENCODING_ISSUES         = "encoding_issues";
    inline constexpr std::string_view SYSTEM_ERROR            = "system_error";
}

enum class AlertType {
    HIGH_FAILURE_RATE,
    TIMEOUT_INCREASE,
    SUSPICIOUS_COMMAND,
    PERFORMANCE_DEGRADATION,
    ENCODING_ISSUES,
    SYSTEM_ERROR
};

enum class AlertSeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

/**
 * @brief One raised notification
 *
 * Created unresolved by the monitor's rule engine. The only mutation is the
 * single transition to resolved, which stamps resolved_at.
 */
struct Alert {
    std::string id;
    AlertType type = AlertType::SYSTEM_ERROR;
    AlertSeverity severity = AlertSeverity::INFO;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::optional<std::string> related_execution_id;
    bool resolved = false;
    std::optional<std::chrono::system_clock::time_point> resolved_at;

    Alert()
        : id(utils::generate_id("alert")),
          timestamp(std::chrono::system_clock::now()) {}
};

[[nodiscard]] constexpr std::string_view alert_type_to_string(AlertType t) {
    switch (t) {
        case AlertType::HIGH_FAILURE_RATE:       return keys::HIGH_FAILURE_RATE;
        case AlertType::TIMEOUT_INCREASE:        return keys::TIMEOUT_INCREASE;
        case AlertType::SUSPICIOUS_COMMAND:      return keys::SUSPICIOUS_COMMAND;
        case AlertType::PERFORMANCE_DEGRADATION: return keys::PERFORMANCE_DEGRADATION;
        case AlertType::ENCODING_ISSUES:         return keys::ENCODING_ISSUES;
        case AlertType::SYSTEM_ERROR:            return keys::SYSTEM_ERROR;
        default: return "unknown";
    }
}

[[nodiscard]] inline AlertType parse_alert_type(std::string_view s) {
    static const std::unordered_map<std::string_view, AlertType> lookup = {
        {keys::HIGH_FAILURE_RATE,       AlertType::HIGH_FAILURE_RATE},
        {keys::TIMEOUT_INCREASE,        AlertType::TIMEOUT_INCREASE},
        {keys::SUSPICIOUS_COMMAND,      AlertType::SUSPICIOUS_COMMAND},
        {keys::PERFORMANCE_DEGRADATION, AlertType::PERFORMANCE_DEGRADATION},
        {keys::ENCODING_ISSUES,         AlertType::ENCODING_ISSUES},
    };

    const auto it = lookup.find(s);
    return (it != lookup.end()) ? it->second : AlertType::SYSTEM_ERROR;
}

[[nodiscard]] constexpr std::string_view alert_severity_to_string(AlertSeverity s) {
    switch (s) {
        case AlertSeverity::INFO:     return "info";
        case AlertSeverity::WARNING:  return "warning";
        case AlertSeverity::ERROR:    return "error";
        case AlertSeverity::CRITICAL: return "critical";
        default: return "info";
    }
}

} // namespace cmdguard
