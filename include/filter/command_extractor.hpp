#pragma once

#include "filter/filter_types.hpp"

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace cmdguard {

/**
 * @brief Pulls candidate commands out of loosely structured text
 *
 * Lines are examined one by one (LF or CRLF). A line is a candidate when
 *   - it sits inside a ``` fenced block and is neither blank nor a
 *     '#' comment,
 *   - it starts with a prompt marker ("$ ", "PS> " by default), which is
 *     stripped, or
 *   - its first word, after sanitization, is a known command name
 *     (case-sensitive) and the line does not read as a sentence.
 * Prompt markers are recognized inside fences too. Fence lines themselves
 * are never candidates. Candidates keep their raw text (no sanitization)
 * so the caller can judge them.
 */
class CommandExtractor {
public:
    CommandExtractor() : CommandExtractor(FilterConfig{}) {}
    explicit CommandExtractor(const FilterConfig& config);

    [[nodiscard]] std::vector<RawCandidate> extract(std::string_view text) const;

    /// Exact match; configured extra commands are stored lower-cased
    [[nodiscard]] bool is_known_command(std::string_view word) const;

    /// Built-in command vocabulary for bare lines
    [[nodiscard]] static const std::vector<std::string_view>& default_vocabulary();

private:
    [[nodiscard]] bool strip_prompt(std::string_view line, std::string_view& out) const;
    [[nodiscard]] bool starts_with_known_command(std::string_view line) const;

    std::vector<std::string> prompt_markers_;
    std::unordered_set<std::string> vocabulary_;
    bool extract_fenced_blocks_;
    bool extract_bare_commands_;
};

} // namespace cmdguard
