#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "monitor/command_monitor.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace cmdguard;

namespace {

ExecutionRecord make_record(const std::string& id, bool success,
                            const std::string& command = "ls",
                            const std::string& error = "") {
    ExecutionRecord r;
    r.id = id;
    r.timestamp = utils::now();
    r.original_command = command;
    r.sanitized_command = command;
    r.success = success;
    if (!success) r.error = error.empty() ? std::string("failed") : error;
    r.execution_time_ms = 100;
    r.category = CommandCategory::LISTING;
    r.risk_level = RiskLevel::LOW;
    return r;
}

bool has_type(const std::vector<Alert>& alerts, AlertType type) {
    return std::any_of(alerts.begin(), alerts.end(),
        [type](const Alert& a) { return a.type == type; });
}

// Quiet config: only the rule under test can fire
MonitorConfig quiet_config() {
    MonitorConfig cfg;
    cfg.failure_rate_threshold = 1.0;
    return cfg;
}

} // anonymous namespace

TEST_CASE("CommandMonitor: identical errors form one critical pattern", "[monitor][patterns]") {
    CommandMonitor monitor;
    for (int i = 0; i < 5; ++i) {
        (void)monitor.log_execution(make_record("f" + std::to_string(i), false,
                                                "cmd " + std::to_string(i), "X"));
    }

    const auto patterns = monitor.detect_failure_patterns();
    REQUIRE(patterns.size() == 1);
    CHECK(patterns[0].pattern == "X");
    CHECK(patterns[0].frequency == 5);
    CHECK(patterns[0].percentage == Catch::Approx(100.0));
    CHECK(patterns[0].severity == RiskLevel::CRITICAL);
    REQUIRE(patterns[0].example_commands.size() == 3);
    CHECK(patterns[0].example_commands[0] == "cmd 0");
}

TEST_CASE("CommandMonitor: patterns sorted by frequency with severity by share", "[monitor][patterns]") {
    CommandMonitor monitor;
    int n = 0;
    const auto log_failures = [&](int count, const std::string& error) {
        for (int i = 0; i < count; ++i) {
            (void)monitor.log_execution(make_record("r" + std::to_string(n++), false, "ls", error));
        }
    };
    log_failures(4, "B");
    log_failures(6, "A");
    log_failures(2, "rare");    // below min_pattern_frequency
    (void)monitor.log_execution(make_record("ok", true));

    const auto patterns = monitor.detect_failure_patterns();
    REQUIRE(patterns.size() == 2);
    CHECK(patterns[0].pattern == "A");
    CHECK(patterns[0].percentage == Catch::Approx(50.0));
    CHECK(patterns[0].severity == RiskLevel::HIGH);
    CHECK(patterns[1].pattern == "B");
    CHECK(patterns[1].percentage == Catch::Approx(100.0 / 3.0));
    CHECK(patterns[1].severity == RiskLevel::HIGH);
}

TEST_CASE("CommandMonitor: ledger is bounded", "[monitor]") {
    MonitorConfig cfg = quiet_config();
    cfg.max_history = 5;
    CommandMonitor monitor(cfg);

    for (int i = 1; i <= 8; ++i) {
        (void)monitor.log_execution(make_record("r" + std::to_string(i), true));
    }

    CHECK(monitor.size() == 5);
    const auto recent = monitor.get_recent_executions(0);
    REQUIRE(recent.size() == 5);
    CHECK(recent.front().id == "r8");
    CHECK(recent.back().id == "r4");
    CHECK(monitor.get_recent_executions(2).size() == 2);

    // An evicted id may be logged again
    (void)monitor.log_execution(make_record("r1", true));
    CHECK(monitor.duplicates_ignored() == 0);
}

TEST_CASE("CommandMonitor: duplicate execution id is ignored", "[monitor]") {
    CommandMonitor monitor;
    const auto record = make_record("dup", false);

    CHECK_FALSE(monitor.log_execution(record).empty());
    CHECK(monitor.log_execution(record).empty());
    CHECK(monitor.size() == 1);
    CHECK(monitor.duplicates_ignored() == 1);
}

TEST_CASE("CommandMonitor alert rules", "[monitor][alerts]") {

    SECTION("Clean success raises nothing") {
        CommandMonitor monitor;
        CHECK(monitor.log_execution(make_record("ok", true)).empty());
        CHECK(monitor.get_active_alerts().empty());
    }

    SECTION("High failure rate over the recent window") {
        MonitorConfig cfg;
        cfg.failure_rate_window = 4;
        cfg.failure_rate_threshold = 0.5;
        CommandMonitor monitor(cfg);

        CHECK(monitor.log_execution(make_record("a", true)).empty());
        CHECK(monitor.log_execution(make_record("b", true)).empty());
        // 1 of 3 failed: below threshold
        CHECK_FALSE(has_type(monitor.log_execution(make_record("c", false)), AlertType::HIGH_FAILURE_RATE));
        // 2 of 4: equal, not above
        CHECK_FALSE(has_type(monitor.log_execution(make_record("d", false)), AlertType::HIGH_FAILURE_RATE));
        // Window now b..e: 3 of 4 failed
        const auto alerts = monitor.log_execution(make_record("e", false));
        REQUIRE(has_type(alerts, AlertType::HIGH_FAILURE_RATE));
        const auto& alert = alerts.front();
        CHECK(alert.severity == AlertSeverity::ERROR);
        CHECK(alert.message == "High failure rate detected: 75.0%");
        CHECK(alert.related_execution_id == "e");
    }

    SECTION("Timeout") {
        CommandMonitor monitor(quiet_config());
        auto record = make_record("t", false, "sleep 60");
        record.timeout_used = true;

        const auto alerts = monitor.log_execution(record);
        REQUIRE(alerts.size() == 1);
        CHECK(alerts[0].type == AlertType::TIMEOUT_INCREASE);
        CHECK(alerts[0].severity == AlertSeverity::WARNING);
        CHECK(alerts[0].message == "Command timed out: sleep 60");
    }

    SECTION("Suspicious command") {
        CommandMonitor monitor(quiet_config());
        auto high = make_record("h", true, "chmod 777 x");
        high.risk_level = RiskLevel::HIGH;
        auto medium = make_record("m", true, "git push");
        medium.risk_level = RiskLevel::MEDIUM;

        CHECK(has_type(monitor.log_execution(high), AlertType::SUSPICIOUS_COMMAND));
        CHECK(monitor.log_execution(medium).empty());
    }

    SECTION("Slow execution") {
        CommandMonitor monitor(quiet_config());
        auto at_limit = make_record("s1", true, "npm ci");
        at_limit.execution_time_ms = 10000;
        auto over = make_record("s2", true, "npm ci");
        over.execution_time_ms = 10001;

        CHECK(monitor.log_execution(at_limit).empty());
        const auto alerts = monitor.log_execution(over);
        REQUIRE(alerts.size() == 1);
        CHECK(alerts[0].type == AlertType::PERFORMANCE_DEGRADATION);
        CHECK(alerts[0].message == "Slow command execution: 10001ms for npm ci");
    }

    SECTION("Encoding issues") {
        auto record = make_record("enc", true, "git add .");
        SanitizationReport report;
        report.sanitized = "git add .";
        report.thai_removed = 2;
        record.sanitization = report;

        CommandMonitor monitor(quiet_config());
        const auto alerts = monitor.log_execution(record);
        REQUIRE(alerts.size() == 1);
        CHECK(alerts[0].type == AlertType::ENCODING_ISSUES);
        CHECK(alerts[0].severity == AlertSeverity::INFO);
        CHECK(alerts[0].message == "Removed 2 problematic character(s) from command: git add .");

        MonitorConfig off = quiet_config();
        off.alert_on_encoding_issues = false;
        CommandMonitor silent(off);
        CHECK(silent.log_execution(record).empty());
    }

    SECTION("Observer receives every alert") {
        CommandMonitor monitor(quiet_config());
        std::vector<AlertType> seen;
        monitor.set_on_alert([&seen](const Alert& a) { seen.push_back(a.type); });

        auto record = make_record("x", false, "shutdown now");
        record.timeout_used = true;
        record.risk_level = RiskLevel::CRITICAL;
        (void)monitor.log_execution(record);

        CHECK(seen.size() == 2);
        CHECK(monitor.get_alerts().size() == 2);
    }
}

TEST_CASE("CommandMonitor: resolved alerts leave the active list", "[monitor][alerts]") {
    CommandMonitor monitor(quiet_config());
    auto record = make_record("t", false);
    record.timeout_used = true;
    const auto raised = monitor.log_execution(record);
    REQUIRE(raised.size() == 1);

    CHECK(monitor.get_active_alerts().size() == 1);
    CHECK(monitor.resolve_alert(raised[0].id));
    CHECK(monitor.get_active_alerts().empty());
    CHECK(monitor.get_alerts().size() == 1);
    CHECK(monitor.get_alerts()[0].resolved);
    CHECK(monitor.resolve_alert(raised[0].id));
    CHECK_FALSE(monitor.resolve_alert("alert_unknown"));
    CHECK(monitor.get_alert_stats().alerts_resolved == 1);
}

TEST_CASE("CommandMonitor: statistics over the ledger", "[monitor][stats]") {
    CommandMonitor monitor(quiet_config());

    auto git = make_record("g", true, "git status");
    git.category = CommandCategory::GIT;
    git.execution_time_ms = 300;
    auto rm = make_record("r", false, "rm -rf /");
    rm.category = CommandCategory::DELETION;
    rm.risk_level = RiskLevel::CRITICAL;
    rm.execution_time_ms = 0;
    auto timeout = make_record("t", false, "sleep 60");
    timeout.timeout_used = true;
    timeout.execution_time_ms = 1000;
    auto again = make_record("g2", true, "git status");
    again.category = CommandCategory::GIT;
    again.execution_time_ms = 100;

    for (const auto& r : {git, rm, timeout, again}) (void)monitor.log_execution(r);

    const auto stats = monitor.get_statistics();
    CHECK(stats.total_commands == 4);
    CHECK(stats.successful_commands == 2);
    CHECK(stats.failed_commands == 2);
    CHECK(stats.timeout_commands == 1);
    CHECK(stats.success_rate == Catch::Approx(50.0));
    CHECK(stats.total_execution_time_ms == 1400);
    CHECK(stats.average_execution_time_ms == Catch::Approx(350.0));

    CHECK(stats.category_breakdown[static_cast<size_t>(CommandCategory::GIT)] == 2);
    CHECK(stats.category_breakdown[static_cast<size_t>(CommandCategory::DELETION)] == 1);
    CHECK(stats.category_breakdown[static_cast<size_t>(CommandCategory::LISTING)] == 1);
    CHECK(stats.category_breakdown[static_cast<size_t>(CommandCategory::NPM)] == 0);
    CHECK(stats.risk_breakdown[static_cast<size_t>(RiskLevel::CRITICAL)] == 1);
    CHECK(stats.risk_breakdown[static_cast<size_t>(RiskLevel::LOW)] == 3);

    uint64_t hourly_total = 0;
    for (const auto& h : stats.hourly_stats) {
        CHECK(h.hour >= 0);
        CHECK(h.hour <= 23);
        hourly_total += h.total_commands;
    }
    CHECK(hourly_total == 4);

    uint64_t daily_total = 0;
    size_t unique = 0;
    for (const auto& d : stats.daily_stats) {
        CHECK(d.date.size() == 10);
        daily_total += d.total_commands;
        unique += d.unique_commands;
    }
    CHECK(daily_total == 4);
    CHECK(unique >= 3);
}

TEST_CASE("CommandMonitor: empty ledger statistics", "[monitor][stats]") {
    CommandMonitor monitor;
    const auto stats = monitor.get_statistics();
    CHECK(stats.total_commands == 0);
    CHECK(stats.success_rate == 0.0);
    CHECK(stats.average_execution_time_ms == 0.0);
    CHECK(stats.hourly_stats.empty());
    CHECK(stats.daily_stats.empty());
    CHECK(stats.trends.success_rate == TrendDirection::STABLE);
    CHECK(monitor.detect_failure_patterns().empty());
}

TEST_CASE("CommandMonitor: trends compare the last two windows", "[monitor][stats]") {
    MonitorConfig cfg = quiet_config();
    cfg.trend_window = 10;
    cfg.trend_min_samples = 10;
    CommandMonitor monitor(cfg);

    SECTION("Too few samples stays stable") {
        for (int i = 0; i < 15; ++i) {
            (void)monitor.log_execution(make_record("r" + std::to_string(i), true));
        }
        const auto trends = monitor.get_statistics().trends;
        CHECK(trends.success_rate == TrendDirection::STABLE);
        CHECK(trends.execution_time == TrendDirection::STABLE);
        CHECK(trends.failure_rate == TrendDirection::STABLE);
        CHECK(trends.command_volume == TrendDirection::STABLE);
    }

    SECTION("Degrading window") {
        for (int i = 0; i < 10; ++i) {
            (void)monitor.log_execution(make_record("ok" + std::to_string(i), true));
        }
        for (int i = 0; i < 10; ++i) {
            auto r = make_record("bad" + std::to_string(i), false);
            r.execution_time_ms = 2000;
            (void)monitor.log_execution(r);
        }
        const auto trends = monitor.get_statistics().trends;
        CHECK(trends.success_rate == TrendDirection::DECLINING);
        CHECK(trends.failure_rate == TrendDirection::INCREASING);
        CHECK(trends.execution_time == TrendDirection::SLOWER);
        CHECK(trends.command_volume == TrendDirection::STABLE);
    }

    SECTION("Improving window") {
        for (int i = 0; i < 10; ++i) {
            auto r = make_record("bad" + std::to_string(i), false);
            r.execution_time_ms = 2000;
            (void)monitor.log_execution(r);
        }
        for (int i = 0; i < 10; ++i) {
            (void)monitor.log_execution(make_record("ok" + std::to_string(i), true));
        }
        const auto trends = monitor.get_statistics().trends;
        CHECK(trends.success_rate == TrendDirection::IMPROVING);
        CHECK(trends.failure_rate == TrendDirection::DECREASING);
        CHECK(trends.execution_time == TrendDirection::FASTER);
    }
}

TEST_CASE("CommandMonitor: CSV export escapes fields", "[monitor][export]") {
    CommandMonitor monitor(quiet_config());
    (void)monitor.log_execution(make_record("q", true, "echo \"a,b\""));

    const auto csv = monitor.export_data(ExportFormat::CSV);
    const auto lines = utils::split(csv, '\n');
    REQUIRE(lines.size() == 2);
    CHECK(lines[0] == "id,timestamp,success,original,sanitized,executionTime,timeoutUsed,error,category,riskLevel");
    CHECK(lines[1].starts_with("q,"));
    CHECK(lines[1].find("\"echo \"\"a,b\"\"\"") != std::string::npos);
    CHECK(lines[1].ends_with(",listing,low"));
}

TEST_CASE("CommandMonitor: JSON export lists records oldest first", "[monitor][export]") {
    CommandMonitor monitor(quiet_config());
    (void)monitor.log_execution(make_record("first", true));
    (void)monitor.log_execution(make_record("second", false, "ls", "boom"));

    const auto doc = JsonValue::parse(monitor.export_data(ExportFormat::JSON));
    REQUIRE(doc.is_array());
    REQUIRE(doc.size() == 2);
    CHECK(doc[size_t{0}]["id"].get<std::string>() == "first");
    CHECK(doc[size_t{1}]["success"].get<bool>() == false);
    CHECK(doc[size_t{1}]["error"].get<std::string>() == "boom");
}

TEST_CASE("CommandMonitor: clear_all_data empties ledger and alerts", "[monitor]") {
    CommandMonitor monitor;
    (void)monitor.log_execution(make_record("a", false));
    REQUIRE(monitor.size() == 1);
    REQUIRE_FALSE(monitor.get_alerts().empty());

    monitor.clear_all_data();
    CHECK(monitor.size() == 0);
    CHECK(monitor.get_alerts().empty());
    CHECK(monitor.get_statistics().total_commands == 0);

    // Ids are forgotten too
    (void)monitor.log_execution(make_record("a", true));
    CHECK(monitor.size() == 1);
}
