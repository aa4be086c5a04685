#include "filter/ai_command_filter.hpp"
#include "classifier/command_classifier.hpp"
#include "core/utils.hpp"
#include "sanitizer/command_sanitizer.hpp"
#include "serialization/record_serializer.hpp"

#include <algorithm>
#include <format>

namespace cmdguard {

namespace {

constexpr std::string_view kProcessingCsvHeader =
    "responseId,timestamp,original,sanitized,safe,category,riskLevel,issues";

void append_csv_row(std::string& out, const ProcessingRecord& entry,
                    const ProcessedCommand& cmd, bool safe) {
    out += '\n';
    out += utils::csv_escape(entry.id);
    out += ',';
    out += utils::format_timestamp(entry.timestamp);
    out += ',';
    out += utils::csv_escape(cmd.original);
    out += ',';
    out += utils::csv_escape(cmd.sanitized);
    out += ',';
    out += utils::booltostr(safe);
    out += ',';
    out += category_to_string(cmd.category);
    out += ',';
    out += risk_level_to_string(cmd.risk_level);
    out += ',';
    out += utils::csv_escape(utils::join(cmd.issues, "; "));
}

} // anonymous namespace

AiCommandFilter::AiCommandFilter(const FilterConfig& config)
    : config_(config),
      extractor_(config) {
    if (config_.max_history == 0) config_.max_history = 1;
}

ProcessedCommand AiCommandFilter::process_command(std::string_view candidate) {
    ProcessedCommand cmd;
    cmd.original = std::string(candidate);

    const auto validation = CommandSanitizer::validate(candidate);
    cmd.issues = validation.issues;
    cmd.sanitized = validation.sanitized;
    cmd.category = CommandClassifier::categorize(cmd.sanitized);
    cmd.risk_level = CommandClassifier::assess_risk(cmd.sanitized);
    cmd.encoding_issue = CommandSanitizer::detect_encoding_issues(candidate);
    return cmd;
}

bool AiCommandFilter::is_safe(const ProcessedCommand& command) {
    if (command.encoding_issue) return false;
    return CommandSanitizer::validate(command.sanitized).is_valid;
}

FilteredCommands AiCommandFilter::filter_ai_output(std::string_view text) {
    FilteredCommands result;
    result.extracted = extractor_.extract(text);

    for (const auto& candidate : result.extracted) {
        ProcessedCommand cmd = process_command(candidate.text);

        ++result.statistics.category_breakdown[static_cast<size_t>(cmd.category)];
        ++result.statistics.risk_breakdown[static_cast<size_t>(cmd.risk_level)];

        if (is_safe(cmd)) {
            result.safe_commands.push_back(std::move(cmd));
        } else {
            utils::log::debug(std::format("Filter: unsafe candidate on line {}: {}",
                candidate.line_number, cmd.sanitized));
            result.unsafe_commands.push_back(std::move(cmd));
        }
    }

    result.statistics.total_extracted = result.extracted.size();
    result.statistics.safe_count = result.safe_commands.size();
    result.statistics.unsafe_count = result.unsafe_commands.size();

    ProcessingRecord entry;
    entry.id = utils::generate_id("ai");
    entry.timestamp = utils::now();
    entry.response_length = text.size();
    entry.result = result;
    record(std::move(entry));

    utils::log::info(std::format("Filtered AI output: {} candidates, {} safe, {} unsafe",
        result.statistics.total_extracted, result.statistics.safe_count,
        result.statistics.unsafe_count));
    return result;
}

void AiCommandFilter::record(ProcessingRecord entry) {
    const auto& s = entry.result.statistics;

    std::lock_guard lock(mutex_);
    ++stats_.total_responses;
    stats_.total_commands += s.total_extracted;
    stats_.safe_commands += s.safe_count;
    stats_.unsafe_commands += s.unsafe_count;
    for (size_t i = 0; i < kCategoryCount; ++i) {
        stats_.category_breakdown[i] += s.category_breakdown[i];
    }
    for (size_t i = 0; i < kRiskLevelCount; ++i) {
        stats_.risk_breakdown[i] += s.risk_breakdown[i];
    }
    stats_.average_commands_per_response = static_cast<double>(stats_.total_commands)
                                         / static_cast<double>(stats_.total_responses);

    history_.push_back(std::move(entry));
    while (history_.size() > config_.max_history) {
        history_.pop_front();
    }
}

std::vector<ProcessingRecord> AiCommandFilter::get_processing_history(size_t limit) const {
    std::lock_guard lock(mutex_);
    const size_t count = (limit == 0) ? history_.size() : std::min(limit, history_.size());
    return {history_.rbegin(), history_.rbegin() + static_cast<std::ptrdiff_t>(count)};
}

ProcessingStatistics AiCommandFilter::get_processing_statistics() const {
    std::lock_guard lock(mutex_);
    return stats_;
}

std::string AiCommandFilter::export_processing_data(ExportFormat format) const {
    std::vector<ProcessingRecord> history;
    ProcessingStatistics stats;
    {
        std::lock_guard lock(mutex_);
        history.assign(history_.begin(), history_.end());
        stats = stats_;
    }

    try {
        if (format == ExportFormat::CSV) {
            std::string out(kProcessingCsvHeader);
            for (const auto& entry : history) {
                for (const auto& cmd : entry.result.safe_commands) {
                    append_csv_row(out, entry, cmd, true);
                }
                for (const auto& cmd : entry.result.unsafe_commands) {
                    append_csv_row(out, entry, cmd, false);
                }
            }
            return out;
        }

        auto doc = JsonValue::object();
        doc.set("statistics", serialization::to_json(stats))
           .set("history", serialization::to_json_array(history));
        return doc.dump();
    } catch (const std::exception& e) {
        utils::log::error(std::format("Filter export ({}) failed: {}",
            export_format_to_string(format), e.what()));
        return {};
    }
}

void AiCommandFilter::clear_processing_history() {
    std::lock_guard lock(mutex_);
    history_.clear();
    stats_ = ProcessingStatistics{};
}

size_t AiCommandFilter::history_size() const {
    std::lock_guard lock(mutex_);
    return history_.size();
}

} // namespace cmdguard
