#include "classifier/command_classifier.hpp"
#include "core/utils.hpp"

#include <regex>
#include <string>
#include <unordered_map>

namespace cmdguard {

namespace {

// Precompiled regex rows, keyed by the pattern text in the rule tables.
// Built once (thread-safe static init) and only read afterwards.
const std::unordered_map<std::string_view, std::regex>& compiled_patterns() {
    static const auto patterns = [] {
        std::unordered_map<std::string_view, std::regex> map;
        constexpr auto flags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;
        for (const auto& rule : rules::kRiskRules) {
            if (rule.kind == MatchKind::REGEX) {
                map.emplace(rule.pattern, std::regex(std::string(rule.pattern), flags));
            }
        }
        for (const auto& rule : rules::kCategoryRules) {
            if (rule.kind == MatchKind::REGEX) {
                map.emplace(rule.pattern, std::regex(std::string(rule.pattern), flags));
            }
        }
        for (const auto& pattern : rules::kDangerousPatterns) {
            map.emplace(pattern.regex, std::regex(std::string(pattern.regex), flags));
        }
        return map;
    }();
    return patterns;
}

bool regex_search(std::string_view text, std::string_view pattern) {
    const auto& patterns = compiled_patterns();
    const auto it = patterns.find(pattern);
    if (it == patterns.end()) return false;
    return std::regex_search(text.begin(), text.end(), it->second);
}

bool matches(MatchKind kind, std::string_view text, std::string_view pattern) {
    switch (kind) {
        case MatchKind::PREFIX:    return text.starts_with(pattern);
        case MatchKind::SUBSTRING: return text.find(pattern) != std::string_view::npos;
        case MatchKind::REGEX:     return regex_search(text, pattern);
    }
    return false;
}

} // anonymous namespace

CommandCategory CommandClassifier::categorize(std::string_view sanitized_command) {
    const std::string cmd = utils::to_lower(sanitized_command);
    for (const auto& rule : rules::kCategoryRules) {
        if (matches(rule.kind, cmd, rule.pattern)) {
            return rule.category;
        }
    }
    return CommandCategory::OTHER;
}

RiskLevel CommandClassifier::assess_risk(std::string_view sanitized_command) {
    const std::string cmd = utils::to_lower(sanitized_command);
    for (const auto& rule : rules::kRiskRules) {
        if (matches(rule.kind, cmd, rule.pattern)) {
            return rule.level;
        }
    }
    return RiskLevel::LOW;
}

std::optional<std::string_view> CommandClassifier::match_dangerous_pattern(
    std::string_view command) {
    for (const auto& pattern : rules::kDangerousPatterns) {
        if (regex_search(command, pattern.regex)) {
            return pattern.name;
        }
    }
    return std::nullopt;
}

} // namespace cmdguard
