#include "config/config_loader.hpp"
#include "core/command_protection.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "executor/simulated_command_backend.hpp"
#include "sanitizer/command_sanitizer.hpp"
#include "serialization/record_serializer.hpp"

#include <cstdio>
#include <format>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

using namespace cmdguard;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitCommandFailed = 2;

constexpr const char* kUsage =
    "usage: cmdguard [--config FILE] <command> [args]\n"
    "\n"
    "commands:\n"
    "  sanitize TEXT     strip problematic characters, print the report\n"
    "  validate TEXT     list validation issues\n"
    "  check TEXT        dry-run preview (sanitized form, issues, estimate)\n"
    "  exec TEXT         execute with full protection\n"
    "  process           filter and execute an AI reply read from stdin\n"
    "  export [json|csv] process stdin, then print the exported ledgers\n";

struct CliArgs {
    std::string config_file;        // empty = built-in defaults
    std::string command;
    std::string text;               // remaining arguments joined by spaces
    ExportFormat format = ExportFormat::JSON;
};

Result<CliArgs> parse_args(int argc, char* argv[]) {
    CliArgs args;
    std::vector<std::string> rest;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                return Result<CliArgs>::error(ErrorCategory::INVALID_ARGUMENT,
                                              "--config requires a file path");
            }
            args.config_file = argv[++i];
        } else if (args.command.empty()) {
            args.command = arg;
        } else {
            rest.push_back(arg);
        }
    }

    if (args.command.empty()) {
        return Result<CliArgs>::error(ErrorCategory::INVALID_ARGUMENT, "missing command");
    }

    const bool needs_text = args.command == "sanitize" || args.command == "validate" ||
                            args.command == "check" || args.command == "exec";
    const bool reads_stdin = args.command == "process" || args.command == "export";
    if (!needs_text && !reads_stdin) {
        return Result<CliArgs>::error(ErrorCategory::INVALID_ARGUMENT,
                                      std::format("unknown command '{}'", args.command));
    }
    if (needs_text && rest.empty()) {
        return Result<CliArgs>::error(ErrorCategory::INVALID_ARGUMENT,
                                      std::format("'{}' requires a command text", args.command));
    }

    args.text = utils::join(rest, " ");
    if (args.command == "export" && !args.text.empty()) {
        auto format = parse_export_format(args.text);
        if (format.is_error()) {
            return Result<CliArgs>::error(format.error_category(), format.error_message());
        }
        args.format = format.value();
    }
    return Result<CliArgs>::ok(std::move(args));
}

std::string read_stdin() {
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
}

JsonValue export_to_json(const SystemExport& data) {
    auto executions = JsonValue::array();
    for (const auto& line : utils::split(data.executions, '\n')) {
        if (!line.empty()) executions.push_back(JsonValue::parse(line));
    }

    auto obj = JsonValue::object();
    obj.set("executions", std::move(executions))
       .set("ai", JsonValue::parse(data.ai))
       .set("monitor", JsonValue::parse(data.monitor));
    return obj;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    auto parsed = parse_args(argc, argv);
    if (parsed.is_error()) {
        std::cerr << "cmdguard: " << parsed.error_message() << "\n\n" << kUsage;
        return kExitUsage;
    }
    const auto& args = parsed.value();

    try {
        // =====================================================================
        // Configuration
        // =====================================================================
        GuardConfig config;
        if (!args.config_file.empty()) {
            auto config_result = ConfigLoader::load_from_file(args.config_file);
            if (!config_result.success) {
                utils::log::error(config_result.error_message);
                return kExitUsage;
            }
            config = std::move(config_result.config);
        }
        utils::log::set_level(utils::log::parse_level(config.logging.level));
        utils::log::debug(std::format("Configuration: {}",
            args.config_file.empty() ? "built-in defaults" : args.config_file));

        // =====================================================================
        // Stateless commands
        // =====================================================================
        if (args.command == "sanitize") {
            const auto report = CommandSanitizer::sanitization_report(args.text);
            std::cout << serialization::to_json(report).dump() << '\n';
            return kExitOk;
        }
        if (args.command == "validate") {
            const auto result = CommandSanitizer::validate(args.text);
            std::cout << serialization::to_json(result).dump() << '\n';
            return result.is_valid ? kExitOk : kExitCommandFailed;
        }

        // =====================================================================
        // Protection pipeline
        // =====================================================================
        SimulatedCommandBackend::Config backend_config;
        backend_config.min_latency_ms = config.backend.min_latency_ms;
        backend_config.max_latency_ms = config.backend.max_latency_ms;
        backend_config.failure_rate = config.backend.failure_rate;
        backend_config.seed = config.backend.seed;

        auto protection = ProtectionBuilder()
            .with_backend(std::make_shared<SimulatedCommandBackend>(backend_config))
            .with_executor_config(config.executor)
            .with_monitor_config(config.monitor)
            .with_filter_config(config.filter)
            .on_alert([](const Alert& alert) {
                utils::log::warn(std::format("[alert] {} ({}): {}",
                    alert_type_to_string(alert.type),
                    alert_severity_to_string(alert.severity),
                    alert.message));
            })
            .build();

        if (args.command == "check") {
            const auto preview = protection->executor().test_command(args.text);
            std::cout << serialization::to_json(preview).dump() << '\n';
            return preview.is_valid ? kExitOk : kExitCommandFailed;
        }
        if (args.command == "exec") {
            const auto record = protection->execute_command(args.text);
            std::cout << serialization::to_json(record).dump() << '\n';
            return record.success ? kExitOk : kExitCommandFailed;
        }

        const auto result = protection->process_ai_response(read_stdin());

        if (args.command == "process") {
            std::cout << serialization::to_json(result).dump() << '\n';
            for (const auto& record : result.executions) {
                if (!record.success) return kExitCommandFailed;
            }
            return kExitOk;
        }

        // export
        const auto data = protection->export_system_data(args.format);
        if (args.format == ExportFormat::CSV) {
            std::cout << data.monitor << "\n\n" << data.ai << '\n';
        } else {
            std::cout << export_to_json(data).dump() << '\n';
        }
        return kExitOk;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return kExitUsage;
    }
}
