#pragma once

#include "config/config_types.hpp"
#include "executor/command_executor.hpp"
#include "filter/filter_types.hpp"
#include "monitor/monitor_types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace cmdguard {

// ============================================================================
// GuardConfig - Complete parsed configuration
// ============================================================================

struct GuardConfig {
    LoggingConfig logging;
    CommandExecutor::Config executor;
    MonitorConfig monitor;
    FilterConfig filter;
    BackendConfig backend;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Reads cmdguard.toml
 *
 * Sections: [logging], [executor], [monitor], [filter], [backend]; all
 * optional, missing keys keep their defaults. ${VAR} in string values is
 * replaced from the environment. Executor timeouts outside the supported
 * range are clamped (with a warning); other bad values fail the load with
 * every problem listed.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        GuardConfig config;

        static LoadResult ok(GuardConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to cmdguard.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Problems that make a config unusable (empty when valid)
    [[nodiscard]] static std::vector<std::string> validate_config(const GuardConfig& config);
};

} // namespace cmdguard
