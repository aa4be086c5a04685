#pragma once

#include "core/types.hpp"
#include "filter/command_extractor.hpp"
#include "filter/filter_types.hpp"

#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace cmdguard {

/**
 * @brief Splits an AI reply into safe and unsafe candidate commands
 *
 * Each candidate from CommandExtractor is judged on its raw text:
 *   unsafe  if Thai is mixed with Latin letters or digits (encoding
 *           corruption), or if its sanitized form still fails validation
 *           (dangerous pattern, empty, too long)
 *   safe    otherwise; the sanitized text is what gets executed
 * Running statistics and a bounded processing history are kept under one
 * mutex.
 */
class AiCommandFilter {
public:
    AiCommandFilter() : AiCommandFilter(FilterConfig{}) {}
    explicit AiCommandFilter(const FilterConfig& config);

    AiCommandFilter(const AiCommandFilter&) = delete;
    AiCommandFilter& operator=(const AiCommandFilter&) = delete;

    FilteredCommands filter_ai_output(std::string_view text);

    /// Classify a single candidate without touching statistics or history
    [[nodiscard]] static ProcessedCommand process_command(std::string_view candidate);

    [[nodiscard]] static bool is_safe(const ProcessedCommand& command);

    /// Newest first, at most `limit` (0 = all)
    [[nodiscard]] std::vector<ProcessingRecord> get_processing_history(size_t limit = 10) const;

    [[nodiscard]] ProcessingStatistics get_processing_statistics() const;

    /**
     * @brief Serialize history and statistics
     *
     * JSON: {"statistics": {...}, "history": [...]}. CSV: one row per
     * processed command. Returns an empty string if serialization fails.
     */
    [[nodiscard]] std::string export_processing_data(ExportFormat format = ExportFormat::JSON) const;

    void clear_processing_history();

    [[nodiscard]] size_t history_size() const;

private:
    void record(ProcessingRecord entry);

    FilterConfig config_;
    CommandExtractor extractor_;

    mutable std::mutex mutex_;
    std::deque<ProcessingRecord> history_;
    ProcessingStatistics stats_;
};

} // namespace cmdguard
