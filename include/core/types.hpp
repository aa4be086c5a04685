#pragma once

#include "core/error.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cmdguard {

// ============================================================================
// Basic Enums
// ============================================================================

enum class CommandCategory : uint8_t {
    GIT,
    NPM,
    YARN,
    NODE,
    NAVIGATION,
    LISTING,
    FILE_OPERATION,
    DELETION,
    PROCESS_MANAGEMENT,
    BUILD,
    TEST,
    OTHER
};

inline constexpr size_t kCategoryCount = 12;

inline constexpr std::array<CommandCategory, kCategoryCount> kAllCategories = {
    CommandCategory::GIT, CommandCategory::NPM, CommandCategory::YARN,
    CommandCategory::NODE, CommandCategory::NAVIGATION, CommandCategory::LISTING,
    CommandCategory::FILE_OPERATION, CommandCategory::DELETION,
    CommandCategory::PROCESS_MANAGEMENT, CommandCategory::BUILD,
    CommandCategory::TEST, CommandCategory::OTHER
};

enum class RiskLevel : uint8_t {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

inline constexpr size_t kRiskLevelCount = 4;

inline constexpr std::array<RiskLevel, kRiskLevelCount> kAllRiskLevels = {
    RiskLevel::LOW, RiskLevel::MEDIUM, RiskLevel::HIGH, RiskLevel::CRITICAL
};

enum class ExportFormat {
    JSON,
    CSV
};

[[nodiscard]] constexpr std::string_view category_to_string(CommandCategory c) {
    switch (c) {
        case CommandCategory::GIT:                return "git";
        case CommandCategory::NPM:                return "npm";
        case CommandCategory::YARN:               return "yarn";
        case CommandCategory::NODE:               return "node";
        case CommandCategory::NAVIGATION:         return "navigation";
        case CommandCategory::LISTING:            return "listing";
        case CommandCategory::FILE_OPERATION:     return "file_operation";
        case CommandCategory::DELETION:           return "deletion";
        case CommandCategory::PROCESS_MANAGEMENT: return "process_management";
        case CommandCategory::BUILD:              return "build";
        case CommandCategory::TEST:               return "test";
        case CommandCategory::OTHER:              return "other";
        default: return "other";
    }
}

[[nodiscard]] constexpr std::string_view risk_level_to_string(RiskLevel r) {
    switch (r) {
        case RiskLevel::LOW:      return "low";
        case RiskLevel::MEDIUM:   return "medium";
        case RiskLevel::HIGH:     return "high";
        case RiskLevel::CRITICAL: return "critical";
        default: return "low";
    }
}

[[nodiscard]] constexpr std::string_view export_format_to_string(ExportFormat f) {
    return f == ExportFormat::CSV ? "csv" : "json";
}

[[nodiscard]] inline Result<ExportFormat> parse_export_format(std::string_view s) {
    if (s == "json" || s == "JSON") return Result<ExportFormat>::ok(ExportFormat::JSON);
    if (s == "csv" || s == "CSV") return Result<ExportFormat>::ok(ExportFormat::CSV);
    return Result<ExportFormat>::error(ErrorCategory::INVALID_ARGUMENT,
                                       "unknown export format '" + std::string(s) + "'");
}

// Fixed-key counters: every enum value has a slot, zero by default
using CategoryBreakdown = std::array<uint64_t, kCategoryCount>;
using RiskBreakdown = std::array<uint64_t, kRiskLevelCount>;

// ============================================================================
// Sanitization
// ============================================================================

struct SanitizationReport {
    std::string original;
    std::string sanitized;
    size_t characters_removed = 0;      // code points, including trimmed whitespace
    size_t thai_removed = 0;
    size_t invisible_removed = 0;
    size_t control_removed = 0;
    size_t invalid_removed = 0;         // bytes that were not valid UTF-8
    std::vector<std::string> problematic_characters;

    [[nodiscard]] size_t problematic_count() const {
        return thai_removed + invisible_removed + control_removed + invalid_removed;
    }
};

struct ValidationResult {
    bool is_valid = true;
    std::vector<std::string> issues;
    std::string sanitized;
};

// ============================================================================
// Execution Record
// ============================================================================

/**
 * @brief Outcome of one execution attempt
 *
 * Created once by CommandExecutor at the end of an attempt (including
 * validation failures and timeouts) and never mutated afterwards. The
 * monitor takes its own copy on ingestion.
 */
struct ExecutionRecord {
    std::string id;
    std::chrono::system_clock::time_point timestamp;
    std::string original_command;
    std::string sanitized_command;
    bool success = false;
    std::optional<std::string> error;       // set iff !success
    std::string output;                     // backend result text on success
    int64_t execution_time_ms = 0;
    bool timeout_used = false;
    std::optional<SanitizationReport> sanitization;
    CommandCategory category = CommandCategory::OTHER;
    RiskLevel risk_level = RiskLevel::LOW;
    uint32_t attempts = 1;
};

} // namespace cmdguard
