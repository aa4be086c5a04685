#pragma once

#include "alerting/alert_types.hpp"
#include "core/command_protection.hpp"
#include "core/json.hpp"
#include "core/types.hpp"
#include "executor/command_executor.hpp"
#include "filter/filter_types.hpp"
#include "monitor/monitor_types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace cmdguard::serialization {

/**
 * @brief JSON and CSV encodings of the pipeline's data records
 *
 * JSON keys are camelCase to match the CSV header. Timestamps are ISO-8601
 * UTC strings; optional fields are omitted when unset.
 */

[[nodiscard]] JsonValue to_json(const SanitizationReport& report);
[[nodiscard]] JsonValue to_json(const ValidationResult& result);
[[nodiscard]] JsonValue to_json(const ExecutionRecord& record);
[[nodiscard]] JsonValue to_json(const ExecutionStats& stats);
[[nodiscard]] JsonValue to_json(const CommandPreview& preview);
[[nodiscard]] JsonValue to_json(const Alert& alert);
[[nodiscard]] JsonValue to_json(const CommandStatistics& stats);
[[nodiscard]] JsonValue to_json(const FailurePattern& pattern);
[[nodiscard]] JsonValue to_json(const RawCandidate& candidate);
[[nodiscard]] JsonValue to_json(const ProcessedCommand& command);
[[nodiscard]] JsonValue to_json(const FilteredCommands& filtered);
[[nodiscard]] JsonValue to_json(const ProcessingStatistics& stats);
[[nodiscard]] JsonValue to_json(const ProcessingRecord& record);
[[nodiscard]] JsonValue to_json(const SystemStatistics& stats);
[[nodiscard]] JsonValue to_json(const ProtectionResult& result);

[[nodiscard]] JsonValue to_json(const CategoryBreakdown& breakdown);
[[nodiscard]] JsonValue to_json(const RiskBreakdown& breakdown);

// Serializes each element with the matching to_json overload
template <typename T>
[[nodiscard]] JsonValue to_json_array(const std::vector<T>& items) {
    auto arr = JsonValue::array();
    for (const auto& item : items) {
        arr.push_back(to_json(item));
    }
    return arr;
}

// ============================================================================
// CSV
// ============================================================================

inline constexpr std::string_view kExecutionCsvHeader =
    "id,timestamp,success,original,sanitized,executionTime,timeoutUsed,error,category,riskLevel";

/// One CSV line (no trailing newline) in kExecutionCsvHeader column order
[[nodiscard]] std::string to_csv_row(const ExecutionRecord& record);

/// Header plus one row per record, newline-separated
[[nodiscard]] std::string executions_to_csv(const std::vector<ExecutionRecord>& records);

} // namespace cmdguard::serialization
