#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml.hpp>

#include <algorithm>
#include <cstdlib>
#include <format>
#include <limits>
#include <stdexcept>

using namespace std::string_literals;

namespace cmdguard {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

using Errors = std::vector<std::string>;

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

/**
 * @brief Read an integer that must not be negative; a negative value is
 * reported and the default kept.
 */
template <typename T>
T toml_unsigned(const toml::table& tbl, const std::string_view section,
                const std::string_view key, const T fallback, Errors& errors) {
    const int64_t value = tbl[key].value_or(static_cast<int64_t>(fallback));
    if (value < 0) {
        errors.push_back(std::format("{}.{} must not be negative (got {})", section, key, value));
        return fallback;
    }
    if (static_cast<uint64_t>(value) > std::numeric_limits<T>::max()) {
        errors.push_back(std::format("{}.{} is out of range (got {}, max {})",
                                     section, key, value, std::numeric_limits<T>::max()));
        return fallback;
    }
    return static_cast<T>(value);
}

// ---- Sections --------------------------------------------------------------

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* lg = root["logging"].as_table();
    if (!lg) return cfg;

    cfg.level = (*lg)["level"].value_or("info"s);
    return cfg;
}

CommandExecutor::Config extract_executor(const toml::table& root, Errors& errors) {
    CommandExecutor::Config cfg;
    const auto* ex = root["executor"].as_table();
    if (!ex) return cfg;

    auto& opts = cfg.default_options;
    const int64_t timeout = (*ex)["timeout_ms"].value_or(static_cast<int64_t>(opts.timeout_ms));
    const int64_t clamped = std::clamp<int64_t>(timeout,
                                                ExecutionOptions::kMinTimeoutMs,
                                                ExecutionOptions::kMaxTimeoutMs);
    if (clamped != timeout) {
        utils::log::warn(std::format("executor.timeout_ms {} out of range, using {}",
                                     timeout, clamped));
    }
    opts.timeout_ms = static_cast<uint32_t>(clamped);
    opts.sanitize = (*ex)["sanitize"].value_or(opts.sanitize);
    opts.validate = (*ex)["validate"].value_or(opts.validate);
    opts.log_execution = (*ex)["log_execution"].value_or(opts.log_execution);
    opts.retry_on_failure = (*ex)["retry_on_failure"].value_or(opts.retry_on_failure);
    opts.max_retries = toml_unsigned<uint32_t>(*ex, "executor", "max_retries", opts.max_retries, errors);
    cfg.max_history = toml_unsigned<size_t>(*ex, "executor", "max_history", cfg.max_history, errors);
    return cfg;
}

MonitorConfig extract_monitor(const toml::table& root, Errors& errors) {
    MonitorConfig cfg;
    const auto* mn = root["monitor"].as_table();
    if (!mn) return cfg;

    cfg.max_history = toml_unsigned<size_t>(*mn, "monitor", "max_history", cfg.max_history, errors);
    cfg.max_alerts = toml_unsigned<size_t>(*mn, "monitor", "max_alerts", cfg.max_alerts, errors);
    cfg.failure_rate_window = toml_unsigned<size_t>(*mn, "monitor", "failure_rate_window",
                                                    cfg.failure_rate_window, errors);
    cfg.failure_rate_threshold = (*mn)["failure_rate_threshold"].value_or(cfg.failure_rate_threshold);
    cfg.slow_execution_ms = toml_unsigned<int64_t>(*mn, "monitor", "slow_execution_ms",
                                                   cfg.slow_execution_ms, errors);
    cfg.alert_on_encoding_issues = (*mn)["alert_on_encoding_issues"].value_or(cfg.alert_on_encoding_issues);
    cfg.trend_window = toml_unsigned<size_t>(*mn, "monitor", "trend_window", cfg.trend_window, errors);
    cfg.trend_min_samples = toml_unsigned<size_t>(*mn, "monitor", "trend_min_samples",
                                                  cfg.trend_min_samples, errors);
    cfg.success_rate_delta = (*mn)["success_rate_delta"].value_or(cfg.success_rate_delta);
    cfg.execution_time_delta_ms = (*mn)["execution_time_delta_ms"].value_or(cfg.execution_time_delta_ms);
    cfg.min_pattern_frequency = toml_unsigned<size_t>(*mn, "monitor", "min_pattern_frequency",
                                                      cfg.min_pattern_frequency, errors);
    cfg.max_pattern_examples = toml_unsigned<size_t>(*mn, "monitor", "max_pattern_examples",
                                                     cfg.max_pattern_examples, errors);
    return cfg;
}

FilterConfig extract_filter(const toml::table& root, Errors& errors) {
    FilterConfig cfg;
    const auto* fl = root["filter"].as_table();
    if (!fl) return cfg;

    if (fl->contains("prompt_markers")) {
        cfg.prompt_markers = toml_string_array(*fl, "prompt_markers");
    }
    for (auto& word : toml_string_array(*fl, "extra_commands")) {
        cfg.extra_commands.push_back(utils::to_lower(word));
    }
    cfg.extract_fenced_blocks = (*fl)["extract_fenced_blocks"].value_or(cfg.extract_fenced_blocks);
    cfg.extract_bare_commands = (*fl)["extract_bare_commands"].value_or(cfg.extract_bare_commands);
    cfg.max_history = toml_unsigned<size_t>(*fl, "filter", "max_history", cfg.max_history, errors);
    return cfg;
}

BackendConfig extract_backend(const toml::table& root, Errors& errors) {
    BackendConfig cfg;
    const auto* be = root["backend"].as_table();
    if (!be) return cfg;

    cfg.type = (*be)["type"].value_or("simulated"s);
    cfg.min_latency_ms = toml_unsigned<uint32_t>(*be, "backend", "min_latency_ms", cfg.min_latency_ms, errors);
    cfg.max_latency_ms = toml_unsigned<uint32_t>(*be, "backend", "max_latency_ms", cfg.max_latency_ms, errors);
    cfg.failure_rate = (*be)["failure_rate"].value_or(cfg.failure_rate);
    cfg.seed = toml_unsigned<uint64_t>(*be, "backend", "seed", cfg.seed, errors);
    return cfg;
}

GuardConfig extract_all_sections(const toml::table& root, Errors& errors) {
    GuardConfig config;
    config.logging = extract_logging(root);
    config.executor = extract_executor(root, errors);
    config.monitor = extract_monitor(root, errors);
    config.filter = extract_filter(root, errors);
    config.backend = extract_backend(root, errors);
    return config;
}

ConfigLoader::LoadResult validate_and_return(GuardConfig config, Errors errors) {
    auto more = ConfigLoader::validate_config(config);
    errors.insert(errors.end(), more.begin(), more.end());
    if (!errors.empty()) {
        std::string msg = "Config validation failed:";
        for (const auto& e : errors) {
            msg += "\n  - " + e;
        }
        return ConfigLoader::LoadResult::error(std::move(msg));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto root = parse_toml_file(config_path);
        Errors errors;
        auto config = extract_all_sections(root, errors);
        return validate_and_return(std::move(config), std::move(errors));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto root = parse_toml_string(toml_content);
        Errors errors;
        auto config = extract_all_sections(root, errors);
        return validate_and_return(std::move(config), std::move(errors));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

std::vector<std::string> ConfigLoader::validate_config(const GuardConfig& config) {
    std::vector<std::string> errors;

    {
        const std::string lvl = utils::to_lower(config.logging.level);
        if (lvl != "debug" && lvl != "info" && lvl != "warn" && lvl != "warning" && lvl != "error") {
            errors.push_back(std::format("logging.level '{}' is not one of debug, info, warn, error",
                                         config.logging.level));
        }
    }

    if (config.executor.max_history == 0) {
        errors.emplace_back("executor.max_history must be at least 1");
    }
    if (config.executor.default_options.max_retries > ExecutionOptions::kMaxRetries) {
        errors.push_back(std::format("executor.max_retries must be at most {} (got {})",
                                     ExecutionOptions::kMaxRetries,
                                     config.executor.default_options.max_retries));
    }

    const auto& mon = config.monitor;
    if (mon.max_history == 0) errors.emplace_back("monitor.max_history must be at least 1");
    if (mon.max_alerts == 0) errors.emplace_back("monitor.max_alerts must be at least 1");
    if (mon.failure_rate_window == 0) errors.emplace_back("monitor.failure_rate_window must be at least 1");
    if (mon.failure_rate_threshold < 0.0 || mon.failure_rate_threshold > 1.0) {
        errors.push_back(std::format("monitor.failure_rate_threshold must be in [0, 1] (got {})",
                                     mon.failure_rate_threshold));
    }
    if (mon.trend_window == 0) errors.emplace_back("monitor.trend_window must be at least 1");
    if (mon.success_rate_delta < 0.0) errors.emplace_back("monitor.success_rate_delta must not be negative");
    if (mon.execution_time_delta_ms < 0.0) {
        errors.emplace_back("monitor.execution_time_delta_ms must not be negative");
    }

    if (config.filter.max_history == 0) errors.emplace_back("filter.max_history must be at least 1");
    for (const auto& marker : config.filter.prompt_markers) {
        if (marker.empty()) {
            errors.emplace_back("filter.prompt_markers must not contain empty strings");
            break;
        }
    }

    const auto& be = config.backend;
    if (be.type != "simulated") {
        errors.push_back(std::format("backend.type '{}' is not supported (expected 'simulated')", be.type));
    }
    if (be.min_latency_ms > be.max_latency_ms) {
        errors.push_back(std::format("backend.min_latency_ms ({}) exceeds backend.max_latency_ms ({})",
                                     be.min_latency_ms, be.max_latency_ms));
    }
    if (be.failure_rate < 0.0 || be.failure_rate > 1.0) {
        errors.push_back(std::format("backend.failure_rate must be in [0, 1] (got {})", be.failure_rate));
    }

    return errors;
}

} // namespace cmdguard
