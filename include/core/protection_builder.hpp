#pragma once

#include "executor/command_executor.hpp"
#include "executor/icommand_backend.hpp"
#include "filter/filter_types.hpp"
#include "monitor/command_monitor.hpp"
#include "monitor/monitor_types.hpp"

#include <memory>

namespace cmdguard {

class CommandProtection;

/**
 * @brief Everything CommandProtection needs, grouped in a single struct.
 *
 * Adding a setting only requires adding a field here (no signature
 * changes anywhere).
 */
struct ProtectionComponents {
    // Required
    std::shared_ptr<ICommandBackend> backend;

    // Per-stage configuration (defaults when not set)
    CommandExecutor::Config executor_config;
    MonitorConfig monitor_config;
    FilterConfig filter_config;

    // Optional observers (empty = none)
    CommandExecutor::ExecutionCallback on_execution;
    CommandMonitor::AlertCallback on_alert;
};

/**
 * @brief Builder pattern for CommandProtection construction.
 *
 * Usage:
 *   auto protection = ProtectionBuilder()
 *       .with_backend(std::make_shared<SimulatedCommandBackend>())
 *       .with_monitor_config(monitor_cfg)       // optional
 *       .on_alert([](const Alert& a) { ... })   // optional
 *       .build();
 */
class ProtectionBuilder {
public:
    ProtectionBuilder& with_backend(std::shared_ptr<ICommandBackend> p)            { c_.backend = std::move(p); return *this; }
    ProtectionBuilder& with_executor_config(const CommandExecutor::Config& cfg)  { c_.executor_config = cfg; return *this; }
    ProtectionBuilder& with_monitor_config(const MonitorConfig& cfg)             { c_.monitor_config = cfg; return *this; }
    ProtectionBuilder& with_filter_config(const FilterConfig& cfg)               { c_.filter_config = cfg; return *this; }
    ProtectionBuilder& on_execution(CommandExecutor::ExecutionCallback cb)       { c_.on_execution = std::move(cb); return *this; }
    ProtectionBuilder& on_alert(CommandMonitor::AlertCallback cb)                { c_.on_alert = std::move(cb); return *this; }

    /**
     * @brief Build the CommandProtection from accumulated components.
     * @throws std::runtime_error if the backend is missing.
     */
    [[nodiscard]] std::shared_ptr<CommandProtection> build();

private:
    ProtectionComponents c_;
};

} // namespace cmdguard
