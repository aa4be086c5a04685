#pragma once

#include "core/types.hpp"

#include <array>
#include <string_view>

namespace cmdguard {

/**
 * @brief Ordered rule tables for command classification
 *
 * All tables are evaluated first-match-wins against lower-cased, sanitized
 * command text. Adding a rule means adding a row; control flow in
 * CommandClassifier never changes.
 */

enum class MatchKind : uint8_t {
    PREFIX,
    SUBSTRING,
    REGEX
};

struct CategoryRule {
    MatchKind kind;
    std::string_view pattern;
    CommandCategory category;
};

struct RiskRule {
    MatchKind kind;
    std::string_view pattern;
    RiskLevel level;
};

struct DangerousPattern {
    std::string_view name;
    std::string_view regex;     // ECMAScript, matched case-insensitively
};

namespace rules {

inline constexpr std::array kCategoryRules = {
    CategoryRule{MatchKind::PREFIX, "git ",      CommandCategory::GIT},
    CategoryRule{MatchKind::PREFIX, "npm ",      CommandCategory::NPM},
    CategoryRule{MatchKind::PREFIX, "yarn ",     CommandCategory::YARN},
    CategoryRule{MatchKind::PREFIX, "node ",     CommandCategory::NODE},
    CategoryRule{MatchKind::PREFIX, "cd ",       CommandCategory::NAVIGATION},
    CategoryRule{MatchKind::PREFIX, "pushd ",    CommandCategory::NAVIGATION},
    CategoryRule{MatchKind::PREFIX, "popd",      CommandCategory::NAVIGATION},
    CategoryRule{MatchKind::PREFIX, "ls",        CommandCategory::LISTING},
    CategoryRule{MatchKind::PREFIX, "dir",       CommandCategory::LISTING},
    CategoryRule{MatchKind::PREFIX, "pwd",       CommandCategory::LISTING},
    CategoryRule{MatchKind::PREFIX, "mkdir ",    CommandCategory::FILE_OPERATION},
    CategoryRule{MatchKind::PREFIX, "touch ",    CommandCategory::FILE_OPERATION},
    CategoryRule{MatchKind::PREFIX, "cp ",       CommandCategory::FILE_OPERATION},
    CategoryRule{MatchKind::PREFIX, "mv ",       CommandCategory::FILE_OPERATION},
    CategoryRule{MatchKind::PREFIX, "rm ",       CommandCategory::DELETION},
    CategoryRule{MatchKind::PREFIX, "del ",      CommandCategory::DELETION},
    CategoryRule{MatchKind::PREFIX, "taskkill ", CommandCategory::PROCESS_MANAGEMENT},
    CategoryRule{MatchKind::PREFIX, "kill ",     CommandCategory::PROCESS_MANAGEMENT},
    CategoryRule{MatchKind::PREFIX, "ps ",       CommandCategory::PROCESS_MANAGEMENT},
    CategoryRule{MatchKind::SUBSTRING, "build",   CommandCategory::BUILD},
    CategoryRule{MatchKind::SUBSTRING, "compile", CommandCategory::BUILD},
    CategoryRule{MatchKind::SUBSTRING, "test",    CommandCategory::TEST},
    CategoryRule{MatchKind::SUBSTRING, "spec",    CommandCategory::TEST},
};

// Highest severity first; the first matching row decides
inline constexpr std::array kRiskRules = {
    RiskRule{MatchKind::SUBSTRING, "rm -rf",              RiskLevel::CRITICAL},
    RiskRule{MatchKind::SUBSTRING, "rm -fr",              RiskLevel::CRITICAL},
    RiskRule{MatchKind::REGEX,     R"((^|[\s;&|(])format\s)", RiskLevel::CRITICAL},
    RiskRule{MatchKind::SUBSTRING, "shutdown",            RiskLevel::CRITICAL},
    RiskRule{MatchKind::SUBSTRING, "reboot",              RiskLevel::CRITICAL},
    RiskRule{MatchKind::SUBSTRING, "mkfs",                RiskLevel::CRITICAL},
    RiskRule{MatchKind::SUBSTRING, "taskkill /f",         RiskLevel::HIGH},
    RiskRule{MatchKind::SUBSTRING, "del /s",              RiskLevel::HIGH},
    RiskRule{MatchKind::SUBSTRING, "chmod 777",           RiskLevel::HIGH},
    RiskRule{MatchKind::SUBSTRING, "kill -9",             RiskLevel::HIGH},
    RiskRule{MatchKind::SUBSTRING, "git push",            RiskLevel::MEDIUM},
    RiskRule{MatchKind::SUBSTRING, "npm install",         RiskLevel::MEDIUM},
    RiskRule{MatchKind::SUBSTRING, "chmod",               RiskLevel::MEDIUM},
};

inline constexpr std::array kDangerousPatterns = {
    DangerousPattern{"recursive_delete", R"(\brm\s+-[a-z]*(r[a-z]*f|f[a-z]*r))"},
    DangerousPattern{"recursive_delete", R"(\bdel\s+/s)"},
    DangerousPattern{"force_kill",       R"(\btaskkill\s+/f)"},
    DangerousPattern{"force_kill",       R"(\bkill\s+-9\b)"},
    DangerousPattern{"format",           R"((^|[\s;&|(])format\s+)"},
    DangerousPattern{"shutdown",         R"(\bshutdown(\s|$))"},
    DangerousPattern{"reboot",           R"(\breboot(\s|$))"},
};

} // namespace rules

} // namespace cmdguard
