#pragma once

#include "classifier/command_rules.hpp"
#include "core/types.hpp"

#include <optional>
#include <string_view>

namespace cmdguard {

/**
 * @brief Stateless command classifier driven by the tables in command_rules.hpp
 *
 * Category and risk are pure functions of the sanitized command text.
 * Regex rows are compiled once on first use and shared read-only.
 */
class CommandClassifier {
public:
    [[nodiscard]] static CommandCategory categorize(std::string_view sanitized_command);

    [[nodiscard]] static RiskLevel assess_risk(std::string_view sanitized_command);

    /**
     * @brief Name of the first dangerous-operation pattern the text matches
     * @return Pattern name, or nullopt when no pattern matches
     */
    [[nodiscard]] static std::optional<std::string_view> match_dangerous_pattern(
        std::string_view command);

    [[nodiscard]] static bool is_dangerous(std::string_view command) {
        return match_dangerous_pattern(command).has_value();
    }
};

} // namespace cmdguard
