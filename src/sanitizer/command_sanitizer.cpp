#include "sanitizer/command_sanitizer.hpp"
#include "classifier/command_classifier.hpp"

#include <format>

namespace cmdguard {

namespace {

enum class CharClass : uint8_t {
    NORMAL,
    THAI,
    INVISIBLE,
    CONTROL
};

// One decoded unit of input: a code point, or a single byte that is not
// part of a well-formed UTF-8 sequence.
struct Unit {
    char32_t code_point = 0;
    size_t offset = 0;
    size_t length = 1;
    bool valid = true;
};

size_t sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

Unit decode_at(std::string_view text, size_t pos) {
    Unit unit;
    unit.offset = pos;

    const auto lead = static_cast<unsigned char>(text[pos]);
    const size_t len = sequence_length(lead);
    if (len == 0 || pos + len > text.size()) {
        unit.valid = false;
        unit.code_point = lead;
        return unit;
    }
    if (len == 1) {
        unit.code_point = lead;
        return unit;
    }

    char32_t cp = lead & (0xFF >> (len + 1));
    for (size_t i = 1; i < len; ++i) {
        const auto cont = static_cast<unsigned char>(text[pos + i]);
        if ((cont & 0xC0) != 0x80) {
            unit.valid = false;
            unit.code_point = lead;
            return unit;
        }
        cp = (cp << 6) | (cont & 0x3F);
    }

    // Overlong encodings, surrogates and out-of-range values
    static constexpr char32_t kMinForLength[] = {0, 0, 0x80, 0x800, 0x10000};
    if (cp < kMinForLength[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        unit.valid = false;
        unit.code_point = lead;
        return unit;
    }

    unit.code_point = cp;
    unit.length = len;
    return unit;
}

template <typename Fn>
void for_each_unit(std::string_view text, Fn&& fn) {
    size_t pos = 0;
    while (pos < text.size()) {
        const Unit unit = decode_at(text, pos);
        fn(unit);
        pos += unit.length;
    }
}

CharClass classify(char32_t cp) {
    if (cp >= 0x0E00 && cp <= 0x0E7F) return CharClass::THAI;
    if ((cp >= 0x200B && cp <= 0x200D) || cp == 0xFEFF) return CharClass::INVISIBLE;
    if (cp <= 0x1F || (cp >= 0x7F && cp <= 0x9F)) return CharClass::CONTROL;
    return CharClass::NORMAL;
}

bool is_space(char32_t cp) {
    switch (cp) {
        case 0x20: case 0xA0: case 0x1680: case 0x2028: case 0x2029:
        case 0x202F: case 0x205F: case 0x3000:
            return true;
        default:
            // Control whitespace (TAB, LF, CR...) never survives stripping,
            // but validate() trims raw text too
            return (cp >= 0x09 && cp <= 0x0D) || (cp >= 0x2000 && cp <= 0x200A);
    }
}

bool is_ascii_alnum(char32_t cp) {
    return (cp >= '0' && cp <= '9') || (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z');
}

// Byte range of text with leading and trailing whitespace removed
std::string_view trim_spaces(std::string_view text) {
    size_t begin = text.size();
    size_t end = 0;
    for_each_unit(text, [&](const Unit& unit) {
        if (unit.valid && is_space(unit.code_point)) return;
        if (begin == text.size()) begin = unit.offset;
        end = unit.offset + unit.length;
    });
    if (begin >= end) return {};
    return text.substr(begin, end - begin);
}

struct ScanResult {
    std::string stripped;   // problematic units removed, not yet trimmed
    size_t thai = 0;
    size_t invisible = 0;
    size_t control = 0;
    size_t invalid = 0;
};

ScanResult strip(std::string_view text) {
    ScanResult scan;
    scan.stripped.reserve(text.size());
    for_each_unit(text, [&](const Unit& unit) {
        if (!unit.valid) {
            ++scan.invalid;
            return;
        }
        switch (classify(unit.code_point)) {
            case CharClass::THAI:      ++scan.thai; return;
            case CharClass::INVISIBLE: ++scan.invisible; return;
            case CharClass::CONTROL:   ++scan.control; return;
            case CharClass::NORMAL:
                scan.stripped.append(text.substr(unit.offset, unit.length));
                return;
        }
    });
    return scan;
}

} // anonymous namespace

size_t CommandSanitizer::code_point_count(std::string_view text) {
    size_t count = 0;
    for_each_unit(text, [&count](const Unit&) { ++count; });
    return count;
}

std::string CommandSanitizer::sanitize(std::string_view text) {
    const ScanResult scan = strip(text);
    return std::string(trim_spaces(scan.stripped));
}

ValidationResult CommandSanitizer::validate(std::string_view text) {
    ValidationResult result;
    const ScanResult scan = strip(text);

    if (scan.thai > 0) {
        result.issues.emplace_back("Contains Thai characters");
    }
    if (scan.invisible > 0) {
        result.issues.emplace_back("Contains invisible characters");
    }
    if (scan.control > 0) {
        result.issues.emplace_back("Contains control characters");
    }
    if (scan.invalid > 0) {
        result.issues.emplace_back("Contains invalid UTF-8 bytes");
    }
    if (trim_spaces(text).empty()) {
        result.issues.emplace_back("Empty command");
    }
    if (CommandClassifier::is_dangerous(text)) {
        result.issues.emplace_back("Contains dangerous command pattern");
    }
    if (code_point_count(text) > kMaxCommandLength) {
        result.issues.emplace_back(
            std::format("Command too long (over {} characters)", kMaxCommandLength));
    }

    result.is_valid = result.issues.empty();
    result.sanitized = std::string(trim_spaces(scan.stripped));
    return result;
}

bool CommandSanitizer::detect_encoding_issues(std::string_view text) {
    bool has_thai = false;
    bool has_latin = false;
    for_each_unit(text, [&](const Unit& unit) {
        if (!unit.valid) return;
        if (classify(unit.code_point) == CharClass::THAI) has_thai = true;
        else if (is_ascii_alnum(unit.code_point)) has_latin = true;
    });
    return has_thai && has_latin;
}

std::vector<std::string> CommandSanitizer::get_problematic_characters(std::string_view text) {
    std::vector<std::string> thai;
    std::vector<std::string> invisible;
    std::vector<std::string> control;
    std::vector<std::string> invalid;

    for_each_unit(text, [&](const Unit& unit) {
        if (!unit.valid) {
            invalid.push_back(std::format("Invalid: 0x{:02X}",
                static_cast<unsigned>(unit.code_point)));
            return;
        }
        const auto ch = text.substr(unit.offset, unit.length);
        const auto cp = static_cast<uint32_t>(unit.code_point);
        switch (classify(unit.code_point)) {
            case CharClass::THAI:
                thai.push_back(std::format("Thai: {} (U+{:04X})", ch, cp));
                break;
            case CharClass::INVISIBLE:
                invisible.push_back(std::format("Invisible: {} (U+{:04X})", ch, cp));
                break;
            case CharClass::CONTROL:
                control.push_back(std::format("Control: {} (U+{:04X})", ch, cp));
                break;
            case CharClass::NORMAL:
                break;
        }
    });

    std::vector<std::string> result;
    result.reserve(thai.size() + invisible.size() + control.size() + invalid.size());
    for (auto* group : {&thai, &invisible, &control, &invalid}) {
        for (auto& entry : *group) {
            result.push_back(std::move(entry));
        }
    }
    return result;
}

bool CommandSanitizer::has_problematic_characters(std::string_view text) {
    bool found = false;
    for_each_unit(text, [&found](const Unit& unit) {
        if (!unit.valid || classify(unit.code_point) != CharClass::NORMAL) found = true;
    });
    return found;
}

SanitizationReport CommandSanitizer::sanitization_report(std::string_view original) {
    const ScanResult scan = strip(original);

    SanitizationReport report;
    report.original = std::string(original);
    report.sanitized = std::string(trim_spaces(scan.stripped));
    report.thai_removed = scan.thai;
    report.invisible_removed = scan.invisible;
    report.control_removed = scan.control;
    report.invalid_removed = scan.invalid;
    report.characters_removed = code_point_count(original) - code_point_count(report.sanitized);
    report.problematic_characters = get_problematic_characters(original);
    return report;
}

std::vector<std::string> CommandSanitizer::batch_sanitize(const std::vector<std::string>& commands) {
    std::vector<std::string> result;
    result.reserve(commands.size());
    for (const auto& cmd : commands) {
        result.push_back(sanitize(cmd));
    }
    return result;
}

std::vector<ValidationResult> CommandSanitizer::batch_validate(const std::vector<std::string>& commands) {
    std::vector<ValidationResult> result;
    result.reserve(commands.size());
    for (const auto& cmd : commands) {
        result.push_back(validate(cmd));
    }
    return result;
}

} // namespace cmdguard
