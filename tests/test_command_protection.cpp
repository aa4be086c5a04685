#include <catch2/catch_test_macros.hpp>
#include "core/command_protection.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"
#include "mocks/mock_command_backend.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace cmdguard;
using cmdguard::testing::MockCommandBackend;

namespace {

const std::string kThai = "\xE0\xB9\x81";

struct Fixture {
    std::shared_ptr<MockCommandBackend> backend = std::make_shared<MockCommandBackend>();
    std::vector<std::string> executed_ids;
    std::vector<AlertType> alerts;
    std::shared_ptr<CommandProtection> protection;

    Fixture() {
        protection = ProtectionBuilder()
            .with_backend(backend)
            .on_execution([this](const ExecutionRecord& r) { executed_ids.push_back(r.id); })
            .on_alert([this](const Alert& a) { alerts.push_back(a.type); })
            .build();
    }
};

} // anonymous namespace

TEST_CASE("CommandProtection: only safe commands from an AI reply are executed", "[protection]") {
    Fixture f;
    const auto result = f.protection->process_ai_response(
        kThai + "git add .\ngit status\nnpm install");

    REQUIRE(result.filtered.unsafe_commands.size() >= 1);
    REQUIRE(result.filtered.safe_commands.size() >= 1);
    REQUIRE(result.executions.size() == result.filtered.safe_commands.size());

    for (size_t i = 0; i < result.executions.size(); ++i) {
        CHECK(result.executions[i].sanitized_command == result.filtered.safe_commands[i].sanitized);
        CHECK(result.executions[i].success);
    }

    const auto ran = f.backend->commands();
    REQUIRE(ran.size() == 2);
    CHECK(ran[0] == "git status");
    CHECK(ran[1] == "npm install");
    CHECK(std::find(ran.begin(), ran.end(), "git add .") == ran.end());

    CHECK(f.executed_ids.size() == 2);
    CHECK(f.protection->monitor().size() == 2);
    CHECK(result.statistics.ai.total_responses == 1);
    CHECK(result.statistics.execution.total == 2);
    CHECK(result.statistics.monitoring.total_commands == 2);
}

TEST_CASE("CommandProtection: reply without commands executes nothing", "[protection]") {
    Fixture f;
    const auto result = f.protection->process_ai_response("Sure, here is an explanation.");
    CHECK(result.filtered.extracted.empty());
    CHECK(result.executions.empty());
    CHECK(f.backend->run_count() == 0);
}

TEST_CASE("CommandProtection: prose in a reply is never executed", "[protection]") {
    Fixture f;
    const auto result = f.protection->process_ai_response(
        "Make sure the tests pass.\n"
        "Find the config file.\n"
        "Echo this back to me.\n"
        "Cat videos are a good break.");

    CHECK(result.filtered.extracted.empty());
    CHECK(result.executions.empty());
    CHECK(f.backend->run_count() == 0);
    CHECK(f.protection->monitor().size() == 0);
}

TEST_CASE("CommandProtection: builder requires a backend", "[protection]") {
    CHECK_THROWS_AS(ProtectionBuilder().build(), std::runtime_error);
}

TEST_CASE("CommandProtection: direct execution always validates", "[protection]") {
    Fixture f;
    ExecutionOptions opts;
    opts.validate = false;
    opts.sanitize = false;

    const auto record = f.protection->execute_command("rm -rf /", opts);

    CHECK_FALSE(record.success);
    REQUIRE(record.error.has_value());
    CHECK(record.error->find("validation failed") != std::string::npos);
    CHECK(f.backend->run_count() == 0);
    CHECK(f.protection->monitor().size() == 1);
    CHECK(std::find(f.alerts.begin(), f.alerts.end(), AlertType::SUSPICIOUS_COMMAND) != f.alerts.end());
}

TEST_CASE("CommandProtection: encoding alert for a sanitized command", "[protection]") {
    Fixture f;
    const auto record = f.protection->execute_command(kThai + "git add .");

    CHECK(record.success);
    CHECK(record.sanitized_command == "git add .");
    CHECK(std::find(f.alerts.begin(), f.alerts.end(), AlertType::ENCODING_ISSUES) != f.alerts.end());
}

TEST_CASE("CommandProtection: system export", "[protection][export]") {
    Fixture f;
    (void)f.protection->process_ai_response("git status\nls");

    SECTION("JSON") {
        const auto data = f.protection->export_system_data(ExportFormat::JSON);

        const auto lines = utils::split(data.executions, '\n');
        REQUIRE(lines.size() == 2);
        for (const auto& line : lines) {
            CHECK(JsonValue::parse(line).contains("sanitizedCommand"));
        }
        CHECK(JsonValue::parse(data.monitor).size() == 2);
        CHECK(JsonValue::parse(data.ai)["statistics"]["totalCommands"].get<int>() == 2);
    }

    SECTION("CSV") {
        const auto data = f.protection->export_system_data(ExportFormat::CSV);
        CHECK(data.monitor.starts_with("id,timestamp,success,"));
        CHECK(data.ai.starts_with("responseId,"));
    }
}

TEST_CASE("CommandProtection: reset clears every ledger", "[protection]") {
    Fixture f;
    (void)f.protection->process_ai_response("git status\n$ rm -rf /");
    (void)f.protection->execute_command("ls");

    f.protection->reset();

    const auto stats = f.protection->get_system_statistics();
    CHECK(stats.ai.total_responses == 0);
    CHECK(stats.execution.total == 0);
    CHECK(stats.monitoring.total_commands == 0);
    CHECK(f.protection->monitor().get_alerts().empty());
    CHECK(f.protection->filter().history_size() == 0);
}
