#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace cmdguard {

/**
 * @brief Strips and reports characters known to hang terminal execution
 *
 * Input is treated as UTF-8. Three character classes are removed:
 *   - Thai block (U+0E00..U+0E7F), the usual sign of keyboard-layout
 *     corruption in a command
 *   - invisible formatting characters (U+200B..U+200D, U+FEFF)
 *   - ASCII and C1 control characters (U+0000..U+001F, U+007F..U+009F)
 * Bytes that do not decode as UTF-8 are dropped as well.
 *
 * Every operation is a pure function of its input: no state, no I/O,
 * never throws on any byte string.
 */
class CommandSanitizer {
public:
    static constexpr size_t kMaxCommandLength = 1000;  // code points

    /**
     * @brief Remove problematic characters, then trim surrounding whitespace
     *
     * Idempotent: sanitize(sanitize(x)) == sanitize(x). The result is never
     * longer than the input.
     */
    [[nodiscard]] static std::string sanitize(std::string_view text);

    /**
     * @brief Report every issue with @p text without modifying it
     *
     * Issues are listed in a fixed order (Thai, invisible, control, invalid
     * UTF-8, empty, dangerous pattern, length). The sanitized form is
     * returned alongside for convenience.
     */
    [[nodiscard]] static ValidationResult validate(std::string_view text);

    /// Thai characters mixed with Latin letters or digits
    [[nodiscard]] static bool detect_encoding_issues(std::string_view text);

    /**
     * @brief Diagnostic listing, one "{Class}: {char} (U+{HEX})" entry per
     * problematic character
     *
     * Classes are grouped in the order Thai, Invisible, Control; encounter
     * order is kept within a class. Undecodable bytes follow as
     * "Invalid: 0x{HH}".
     */
    [[nodiscard]] static std::vector<std::string> get_problematic_characters(std::string_view text);

    [[nodiscard]] static bool has_problematic_characters(std::string_view text);

    [[nodiscard]] static SanitizationReport sanitization_report(std::string_view original);

    [[nodiscard]] static std::vector<std::string> batch_sanitize(
        const std::vector<std::string>& commands);

    [[nodiscard]] static std::vector<ValidationResult> batch_validate(
        const std::vector<std::string>& commands);

    /// Length in code points; each undecodable byte counts as one
    [[nodiscard]] static size_t code_point_count(std::string_view text);
};

} // namespace cmdguard
