#include "core/command_protection.hpp"
#include "core/utils.hpp"
#include "serialization/record_serializer.hpp"

#include <format>
#include <stdexcept>

namespace cmdguard {

std::shared_ptr<CommandProtection> ProtectionBuilder::build() {
    if (!c_.backend) throw std::runtime_error("ProtectionBuilder: backend is required");

    return std::make_shared<CommandProtection>(std::move(c_));
}

CommandProtection::CommandProtection(ProtectionComponents components)
    : executor_(std::make_unique<CommandExecutor>(std::move(components.backend), components.executor_config)),
      monitor_(std::make_unique<CommandMonitor>(components.monitor_config)),
      filter_(std::make_unique<AiCommandFilter>(components.filter_config)) {
    if (components.on_execution) {
        executor_->set_on_execution(std::move(components.on_execution));
    }
    if (components.on_alert) {
        monitor_->set_on_alert(std::move(components.on_alert));
    }
    utils::log::info("Command protection initialized");
}

ProtectionResult CommandProtection::process_ai_response(std::string_view text) {
    ProtectionResult result;
    result.filtered = filter_->filter_ai_output(text);

    result.executions.reserve(result.filtered.safe_commands.size());
    for (const auto& safe : result.filtered.safe_commands) {
        auto record = executor_->execute(safe.sanitized);
        (void)monitor_->log_execution(record);
        result.executions.push_back(std::move(record));
    }

    result.statistics = get_system_statistics();
    return result;
}

ExecutionRecord CommandProtection::execute_command(const std::string& command) {
    return execute_command(command, executor_->default_options());
}

ExecutionRecord CommandProtection::execute_command(const std::string& command,
                                                   const ExecutionOptions& options) {
    ExecutionOptions opts = options;
    opts.sanitize = true;
    opts.validate = true;

    auto record = executor_->execute(command, opts);
    (void)monitor_->log_execution(record);
    return record;
}

SystemStatistics CommandProtection::get_system_statistics() const {
    SystemStatistics stats;
    stats.ai = filter_->get_processing_statistics();
    stats.execution = executor_->get_execution_stats();
    stats.monitoring = monitor_->get_statistics();
    return stats;
}

SystemExport CommandProtection::export_system_data(ExportFormat format) const {
    SystemExport out;

    try {
        for (const auto& record : executor_->get_recent_executions(0)) {
            if (!out.executions.empty()) out.executions += '\n';
            out.executions += serialization::to_json(record).dump();
        }
    } catch (const std::exception& e) {
        utils::log::error(std::format("Execution history export failed: {}", e.what()));
        out.executions.clear();
    }

    out.ai = filter_->export_processing_data(format);
    out.monitor = monitor_->export_data(format);
    return out;
}

void CommandProtection::reset() {
    monitor_->clear_all_data();
    filter_->clear_processing_history();
    executor_->clear_history();
    utils::log::info("Command protection reset");
}

} // namespace cmdguard
