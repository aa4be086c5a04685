#pragma once

#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace cmdguard {

// ============================================================================
// Filter Configuration
// ============================================================================

struct FilterConfig {
    // Line prefixes that mark a shell prompt; removed from the candidate
    std::vector<std::string> prompt_markers = {"$ ", "PS> "};

    // Additional first words accepted on bare lines (lower case)
    std::vector<std::string> extra_commands;

    // Extract every non-blank, non-comment line inside ``` fences
    bool extract_fenced_blocks = true;

    // Extract bare lines that start with a known command word
    bool extract_bare_commands = true;

    size_t max_history = 10000;
};

// ============================================================================
// Extraction
// ============================================================================

enum class CandidateSource {
    FENCED_BLOCK,
    PROMPT,
    BARE_LINE
};

[[nodiscard]] constexpr std::string_view candidate_source_to_string(CandidateSource s) {
    switch (s) {
        case CandidateSource::FENCED_BLOCK: return "fenced_block";
        case CandidateSource::PROMPT:       return "prompt";
        case CandidateSource::BARE_LINE:    return "bare_line";
        default: return "bare_line";
    }
}

/// A candidate command as found in the text, before any judgement
struct RawCandidate {
    std::string text;
    size_t line_number = 0;         // 1-based
    CandidateSource source = CandidateSource::BARE_LINE;
};

// ============================================================================
// Classification
// ============================================================================

struct ProcessedCommand {
    std::string original;
    std::string sanitized;
    std::vector<std::string> issues;        // validation issues of the original text
    RiskLevel risk_level = RiskLevel::LOW;
    CommandCategory category = CommandCategory::OTHER;
    bool encoding_issue = false;            // Thai mixed with Latin letters or digits
};

/// Counters for a single filtered response
struct FilterStatistics {
    size_t total_extracted = 0;
    size_t safe_count = 0;
    size_t unsafe_count = 0;
    CategoryBreakdown category_breakdown{};
    RiskBreakdown risk_breakdown{};
};

struct FilteredCommands {
    std::vector<RawCandidate> extracted;
    std::vector<ProcessedCommand> safe_commands;
    std::vector<ProcessedCommand> unsafe_commands;
    FilterStatistics statistics;
};

/// Running counters across every response since the last clear
struct ProcessingStatistics {
    uint64_t total_responses = 0;
    uint64_t total_commands = 0;
    uint64_t safe_commands = 0;
    uint64_t unsafe_commands = 0;
    CategoryBreakdown category_breakdown{};
    RiskBreakdown risk_breakdown{};
    double average_commands_per_response = 0.0;
};

struct ProcessingRecord {
    std::string id;
    std::chrono::system_clock::time_point timestamp;
    size_t response_length = 0;     // bytes of input text
    FilteredCommands result;
};

} // namespace cmdguard
