#include "serialization/record_serializer.hpp"
#include "core/utils.hpp"

#include <cstdint>

namespace cmdguard::serialization {

namespace {

JsonValue string_array(const std::vector<std::string>& items) {
    auto arr = JsonValue::array();
    for (const auto& s : items) {
        arr.push_back(s);
    }
    return arr;
}

} // anonymous namespace

JsonValue to_json(const CategoryBreakdown& breakdown) {
    auto obj = JsonValue::object();
    for (const auto category : kAllCategories) {
        obj.set(category_to_string(category), breakdown[static_cast<size_t>(category)]);
    }
    return obj;
}

JsonValue to_json(const RiskBreakdown& breakdown) {
    auto obj = JsonValue::object();
    for (const auto level : kAllRiskLevels) {
        obj.set(risk_level_to_string(level), breakdown[static_cast<size_t>(level)]);
    }
    return obj;
}

JsonValue to_json(const SanitizationReport& report) {
    auto obj = JsonValue::object();
    obj.set("original", report.original)
       .set("sanitized", report.sanitized)
       .set("charactersRemoved", static_cast<uint64_t>(report.characters_removed))
       .set("thaiRemoved", static_cast<uint64_t>(report.thai_removed))
       .set("invisibleRemoved", static_cast<uint64_t>(report.invisible_removed))
       .set("controlRemoved", static_cast<uint64_t>(report.control_removed))
       .set("invalidRemoved", static_cast<uint64_t>(report.invalid_removed))
       .set("problematicCharacters", string_array(report.problematic_characters));
    return obj;
}

JsonValue to_json(const ValidationResult& result) {
    auto obj = JsonValue::object();
    obj.set("isValid", result.is_valid)
       .set("issues", string_array(result.issues))
       .set("sanitized", result.sanitized);
    return obj;
}

JsonValue to_json(const ExecutionRecord& record) {
    auto obj = JsonValue::object();
    obj.set("id", record.id)
       .set("timestamp", utils::format_timestamp(record.timestamp))
       .set("originalCommand", record.original_command)
       .set("sanitizedCommand", record.sanitized_command)
       .set("success", record.success)
       .set("executionTime", static_cast<int64_t>(record.execution_time_ms))
       .set("timeoutUsed", record.timeout_used)
       .set("category", category_to_string(record.category))
       .set("riskLevel", risk_level_to_string(record.risk_level))
       .set("attempts", static_cast<uint64_t>(record.attempts));
    if (record.error) {
        obj.set("error", *record.error);
    }
    if (!record.output.empty()) {
        obj.set("output", record.output);
    }
    if (record.sanitization) {
        obj.set("sanitizationStats", to_json(*record.sanitization));
    }
    return obj;
}

JsonValue to_json(const ExecutionStats& stats) {
    auto obj = JsonValue::object();
    obj.set("total", stats.total)
       .set("successful", stats.successful)
       .set("failed", stats.failed)
       .set("timeouts", stats.timeouts)
       .set("retried", stats.retried)
       .set("successRate", stats.success_rate)
       .set("averageExecutionTime", stats.average_execution_time_ms)
       .set("totalExecutionTime", static_cast<int64_t>(stats.total_execution_time_ms));
    return obj;
}

JsonValue to_json(const CommandPreview& preview) {
    auto obj = JsonValue::object();
    obj.set("isValid", preview.is_valid)
       .set("sanitized", preview.sanitized)
       .set("issues", string_array(preview.issues))
       .set("estimatedExecutionTime", static_cast<uint64_t>(preview.estimated_execution_time_ms));
    return obj;
}

JsonValue to_json(const Alert& alert) {
    auto obj = JsonValue::object();
    obj.set("id", alert.id)
       .set("type", alert_type_to_string(alert.type))
       .set("severity", alert_severity_to_string(alert.severity))
       .set("message", alert.message)
       .set("timestamp", utils::format_timestamp(alert.timestamp))
       .set("resolved", alert.resolved);
    if (alert.related_execution_id) {
        obj.set("relatedExecutionId", *alert.related_execution_id);
    }
    if (alert.resolved_at) {
        obj.set("resolvedAt", utils::format_timestamp(*alert.resolved_at));
    }
    return obj;
}

JsonValue to_json(const CommandStatistics& stats) {
    auto hourly = JsonValue::array();
    for (const auto& h : stats.hourly_stats) {
        auto entry = JsonValue::object();
        entry.set("hour", h.hour)
             .set("totalCommands", h.total_commands)
             .set("successfulCommands", h.successful_commands)
             .set("failedCommands", h.failed_commands)
             .set("averageExecutionTime", h.average_execution_time_ms);
        hourly.push_back(std::move(entry));
    }

    auto daily = JsonValue::array();
    for (const auto& d : stats.daily_stats) {
        auto entry = JsonValue::object();
        entry.set("date", d.date)
             .set("totalCommands", d.total_commands)
             .set("successfulCommands", d.successful_commands)
             .set("failedCommands", d.failed_commands)
             .set("averageExecutionTime", d.average_execution_time_ms)
             .set("uniqueCommands", static_cast<uint64_t>(d.unique_commands));
        daily.push_back(std::move(entry));
    }

    auto trends = JsonValue::object();
    trends.set("successRateTrend", trend_to_string(stats.trends.success_rate))
          .set("executionTimeTrend", trend_to_string(stats.trends.execution_time))
          .set("failureRateTrend", trend_to_string(stats.trends.failure_rate))
          .set("commandVolumeTrend", trend_to_string(stats.trends.command_volume));

    auto obj = JsonValue::object();
    obj.set("totalCommands", stats.total_commands)
       .set("successfulCommands", stats.successful_commands)
       .set("failedCommands", stats.failed_commands)
       .set("timeoutCommands", stats.timeout_commands)
       .set("successRate", stats.success_rate)
       .set("averageExecutionTime", stats.average_execution_time_ms)
       .set("totalExecutionTime", static_cast<int64_t>(stats.total_execution_time_ms))
       .set("categoryBreakdown", to_json(stats.category_breakdown))
       .set("riskLevelBreakdown", to_json(stats.risk_breakdown))
       .set("hourlyStats", std::move(hourly))
       .set("dailyStats", std::move(daily))
       .set("recentTrends", std::move(trends));
    return obj;
}

JsonValue to_json(const FailurePattern& pattern) {
    auto obj = JsonValue::object();
    obj.set("pattern", pattern.pattern)
       .set("frequency", static_cast<uint64_t>(pattern.frequency))
       .set("percentage", pattern.percentage)
       .set("examples", string_array(pattern.example_commands))
       .set("lastOccurrence", utils::format_timestamp(pattern.last_occurrence))
       .set("severity", risk_level_to_string(pattern.severity));
    return obj;
}

JsonValue to_json(const RawCandidate& candidate) {
    auto obj = JsonValue::object();
    obj.set("text", candidate.text)
       .set("line", static_cast<uint64_t>(candidate.line_number))
       .set("source", candidate_source_to_string(candidate.source));
    return obj;
}

JsonValue to_json(const ProcessedCommand& command) {
    auto obj = JsonValue::object();
    obj.set("original", command.original)
       .set("sanitized", command.sanitized)
       .set("issues", string_array(command.issues))
       .set("riskLevel", risk_level_to_string(command.risk_level))
       .set("category", category_to_string(command.category))
       .set("encodingIssue", command.encoding_issue);
    return obj;
}

JsonValue to_json(const FilteredCommands& filtered) {
    auto stats = JsonValue::object();
    stats.set("totalExtracted", static_cast<uint64_t>(filtered.statistics.total_extracted))
         .set("safeCount", static_cast<uint64_t>(filtered.statistics.safe_count))
         .set("unsafeCount", static_cast<uint64_t>(filtered.statistics.unsafe_count))
         .set("categoryBreakdown", to_json(filtered.statistics.category_breakdown))
         .set("riskLevelBreakdown", to_json(filtered.statistics.risk_breakdown));

    auto obj = JsonValue::object();
    obj.set("extractedCommands", to_json_array(filtered.extracted))
       .set("safeCommands", to_json_array(filtered.safe_commands))
       .set("unsafeCommands", to_json_array(filtered.unsafe_commands))
       .set("statistics", std::move(stats));
    return obj;
}

JsonValue to_json(const ProcessingStatistics& stats) {
    auto obj = JsonValue::object();
    obj.set("totalResponses", stats.total_responses)
       .set("totalCommands", stats.total_commands)
       .set("safeCommands", stats.safe_commands)
       .set("unsafeCommands", stats.unsafe_commands)
       .set("categoryBreakdown", to_json(stats.category_breakdown))
       .set("riskLevelBreakdown", to_json(stats.risk_breakdown))
       .set("averageCommandsPerResponse", stats.average_commands_per_response);
    return obj;
}

JsonValue to_json(const ProcessingRecord& record) {
    auto obj = JsonValue::object();
    obj.set("id", record.id)
       .set("timestamp", utils::format_timestamp(record.timestamp))
       .set("responseLength", static_cast<uint64_t>(record.response_length))
       .set("result", to_json(record.result));
    return obj;
}

JsonValue to_json(const SystemStatistics& stats) {
    auto obj = JsonValue::object();
    obj.set("ai", to_json(stats.ai))
       .set("execution", to_json(stats.execution))
       .set("monitoring", to_json(stats.monitoring));
    return obj;
}

JsonValue to_json(const ProtectionResult& result) {
    auto obj = JsonValue::object();
    obj.set("filtered", to_json(result.filtered))
       .set("executions", to_json_array(result.executions))
       .set("statistics", to_json(result.statistics));
    return obj;
}

std::string to_csv_row(const ExecutionRecord& record) {
    std::string row;
    row += utils::csv_escape(record.id);
    row += ',';
    row += utils::format_timestamp(record.timestamp);
    row += ',';
    row += utils::booltostr(record.success);
    row += ',';
    row += utils::csv_escape(record.original_command);
    row += ',';
    row += utils::csv_escape(record.sanitized_command);
    row += ',';
    row += std::to_string(record.execution_time_ms);
    row += ',';
    row += utils::booltostr(record.timeout_used);
    row += ',';
    row += utils::csv_escape(record.error.value_or(""));
    row += ',';
    row += category_to_string(record.category);
    row += ',';
    row += risk_level_to_string(record.risk_level);
    return row;
}

std::string executions_to_csv(const std::vector<ExecutionRecord>& records) {
    std::string out(kExecutionCsvHeader);
    for (const auto& r : records) {
        out += '\n';
        out += to_csv_row(r);
    }
    return out;
}

} // namespace cmdguard::serialization
