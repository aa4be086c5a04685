#include "filter/command_extractor.hpp"
#include "core/utils.hpp"
#include "sanitizer/command_sanitizer.hpp"

#include <algorithm>
#include <cctype>

namespace cmdguard {

namespace {

// Leading and trailing ASCII blanks only; everything else is left for the
// sanitizer to judge
std::string_view trim_blanks(std::string_view s) {
    const auto start = s.find_first_not_of(" \t");
    if (start == std::string_view::npos) return {};
    const auto end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

bool is_fence(std::string_view line) {
    return trim_blanks(line).starts_with("```");
}

// A sentence: ends in . ? or ! glued to a word, with no shell syntax
// anywhere. "git add ." and "cd .." keep their bare-dot arguments.
bool reads_as_prose(std::string_view line) {
    if (line.find_first_of("|&;<>$`=*/\\\"'") != std::string_view::npos) return false;
    if (!line.ends_with('.') && !line.ends_with('?') && !line.ends_with('!')) return false;

    const auto space = line.find_last_of(' ');
    const std::string_view last_word =
        space == std::string_view::npos ? line : line.substr(space + 1);
    return std::any_of(last_word.begin(), last_word.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0;
    });
}

} // anonymous namespace

const std::vector<std::string_view>& CommandExtractor::default_vocabulary() {
    static const std::vector<std::string_view> words = {
        "git", "npm", "yarn", "node", "npx", "pnpm",
        "cd", "ls", "dir", "pwd", "mkdir", "touch", "cp", "mv", "rm", "del",
        "taskkill", "kill", "ps", "echo", "cat", "grep", "find",
        "chmod", "chown", "make", "cmake", "python", "pip", "cargo",
        "docker", "curl", "wget", "tar", "format", "shutdown", "reboot",
    };
    return words;
}

CommandExtractor::CommandExtractor(const FilterConfig& config)
    : prompt_markers_(config.prompt_markers),
      extract_fenced_blocks_(config.extract_fenced_blocks),
      extract_bare_commands_(config.extract_bare_commands) {
    for (const auto word : default_vocabulary()) {
        vocabulary_.emplace(word);
    }
    for (const auto& word : config.extra_commands) {
        if (!word.empty()) vocabulary_.insert(utils::to_lower(word));
    }
    // An empty marker would turn every line into a candidate
    std::erase_if(prompt_markers_, [](const std::string& m) { return m.empty(); });
}

bool CommandExtractor::is_known_command(std::string_view word) const {
    return vocabulary_.contains(std::string(word));
}

bool CommandExtractor::strip_prompt(std::string_view line, std::string_view& out) const {
    const std::string_view body = trim_blanks(line);
    for (const auto& marker : prompt_markers_) {
        if (body.starts_with(marker)) {
            out = trim_blanks(body.substr(marker.size()));
            return true;
        }
    }
    return false;
}

bool CommandExtractor::starts_with_known_command(std::string_view line) const {
    const std::string sanitized = CommandSanitizer::sanitize(line);
    const auto end = sanitized.find(' ');
    const std::string_view first = std::string_view(sanitized).substr(0, end);
    return !first.empty() && is_known_command(first) && !reads_as_prose(sanitized);
}

std::vector<RawCandidate> CommandExtractor::extract(std::string_view text) const {
    std::vector<RawCandidate> candidates;

    bool in_fence = false;
    size_t line_number = 0;
    size_t pos = 0;
    while (pos <= text.size()) {
        const auto nl = text.find('\n', pos);
        std::string_view line = text.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
        pos = (nl == std::string_view::npos) ? text.size() + 1 : nl + 1;
        ++line_number;

        if (line.ends_with('\r')) line.remove_suffix(1);

        if (is_fence(line)) {
            in_fence = !in_fence;
            continue;
        }

        std::string_view command;
        if (strip_prompt(line, command)) {
            if (!command.empty()) {
                candidates.push_back({std::string(command), line_number, CandidateSource::PROMPT});
            }
            continue;
        }

        const std::string_view body = trim_blanks(line);
        if (body.empty()) continue;

        if (in_fence) {
            if (extract_fenced_blocks_ && !body.starts_with('#')) {
                candidates.push_back({std::string(body), line_number, CandidateSource::FENCED_BLOCK});
            }
            continue;
        }

        if (extract_bare_commands_ && starts_with_known_command(body)) {
            candidates.push_back({std::string(body), line_number, CandidateSource::BARE_LINE});
        }
    }

    return candidates;
}

} // namespace cmdguard
