#pragma once

#include "core/protection_builder.hpp"
#include "core/types.hpp"
#include "executor/command_executor.hpp"
#include "filter/ai_command_filter.hpp"
#include "filter/filter_types.hpp"
#include "monitor/command_monitor.hpp"
#include "monitor/monitor_types.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace cmdguard {

struct SystemStatistics {
    ProcessingStatistics ai;
    ExecutionStats execution;
    CommandStatistics monitoring;
};

struct ProtectionResult {
    FilteredCommands filtered;
    std::vector<ExecutionRecord> executions;    // one per safe command, in order
    SystemStatistics statistics;
};

struct SystemExport {
    std::string executions;     // executor history, one JSON object per line, newest first
    std::string ai;             // filter export in the requested format
    std::string monitor;        // monitor export in the requested format
};

/**
 * @brief Command protection coordinator
 *
 * Owns one executor, monitor and filter for the lifetime of a session.
 * Flow for an AI reply:
 * 1. Filter: extract candidates, split into safe / unsafe
 * 2. Execute: each safe command's sanitized text, sequentially
 * 3. Monitor: every execution record, raising alerts
 * 4. Report: filter, executor and monitor statistics
 * Unsafe commands never reach the executor.
 */
class CommandProtection {
public:
    /**
     * @brief Construct from components struct (use ProtectionBuilder)
     */
    explicit CommandProtection(ProtectionComponents components);

    CommandProtection(const CommandProtection&) = delete;
    CommandProtection& operator=(const CommandProtection&) = delete;

    ProtectionResult process_ai_response(std::string_view text);

    /// Full protection (sanitize + validate forced on), then monitor logging
    ExecutionRecord execute_command(const std::string& command);
    ExecutionRecord execute_command(const std::string& command, const ExecutionOptions& options);

    [[nodiscard]] SystemStatistics get_system_statistics() const;

    [[nodiscard]] SystemExport export_system_data(ExportFormat format = ExportFormat::JSON) const;

    /// Clear executor history, monitor ledger and alerts, filter history
    void reset();

    [[nodiscard]] CommandExecutor& executor() { return *executor_; }
    [[nodiscard]] CommandMonitor& monitor() { return *monitor_; }
    [[nodiscard]] AiCommandFilter& filter() { return *filter_; }
    [[nodiscard]] const CommandExecutor& executor() const { return *executor_; }
    [[nodiscard]] const CommandMonitor& monitor() const { return *monitor_; }
    [[nodiscard]] const AiCommandFilter& filter() const { return *filter_; }

private:
    std::unique_ptr<CommandExecutor> executor_;
    std::unique_ptr<CommandMonitor> monitor_;
    std::unique_ptr<AiCommandFilter> filter_;
};

} // namespace cmdguard
