#include "capture.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <memory>
#include <regex>

namespace memvault {

namespace {

CaptureRule regex_rule(const std::string& name, const char* pattern, double weight,
                       MemoryCategory category) {
    auto re = std::make_shared<std::regex>(pattern, std::regex::icase);
    return CaptureRule{name,
                       [re](const std::string& text) { return std::regex_search(text, *re); },
                       weight, category};
}

// Typographic apostrophes would otherwise miss "don't", "we'll", "let's".
std::string normalize_quotes(const std::string& text) {
    std::string out = replace_all(text, "\xE2\x80\x99", "'");
    return replace_all(out, "\xE2\x80\x98", "'");
}

size_t count_code_fences(const std::string& text) {
    size_t count = 0;
    size_t pos = 0;
    while ((pos = text.find("```", pos)) != std::string::npos) {
        ++count;
        pos += 3;
    }
    return count;
}

// Lines starting with 1-6 '#' followed by whitespace
size_t count_markdown_headers(const std::string& text) {
    size_t count = 0;
    size_t line_start = 0;
    while (line_start < text.size()) {
        size_t hashes = 0;
        while (line_start + hashes < text.size() && text[line_start + hashes] == '#') {
            ++hashes;
        }
        size_t next = line_start + hashes;
        if (hashes >= 1 && hashes <= 6 && next < text.size() &&
            std::isspace(static_cast<unsigned char>(text[next]))) {
            ++count;
        }
        size_t nl = text.find('\n', line_start);
        if (nl == std::string::npos) break;
        line_start = nl + 1;
    }
    return count;
}

} // namespace

const std::vector<CaptureRule>& capture_rules() {
    static const std::vector<CaptureRule> rules = {
        regex_rule("explicit_memory",
                   R"(\b(remember|don't forget|note that|keep in mind|save this)\b)",
                   0.5, MemoryCategory::Preference),
        regex_rule("personal_info",
                   R"(\b(my |i prefer|i use |i like |i need |we decided|i always|i never)\b)",
                   0.3, MemoryCategory::Preference),
        regex_rule("structured_data",
                   R"((\b[a-z0-9._%+-]+@[a-z0-9.-]+\.[a-z]{2,}\b)"
                   R"(|\b\d{3}[-.]?\d{3}[-.]?\d{4}\b)"
                   R"(|\b\d{4}[-/]\d{2}[-/]\d{2}\b))",
                   0.3, MemoryCategory::Entity),
        regex_rule("tech_decision",
                   R"(\b(we'll use|switched to|let's go with|migrated to|chose|decided on|going with)\b)",
                   0.3, MemoryCategory::Decision),
        regex_rule("preference",
                   R"(\b(always|never|prefer|instead of|rather than|better than)\b)",
                   0.2, MemoryCategory::Preference),
    };
    return rules;
}

bool contains_recall_marker(const std::string& text) {
    return text.find("<relevant-memories") != std::string::npos ||
           text.find("<vault-memories") != std::string::npos;
}

CaptureResult evaluate_capture(const std::string& text) {
    return evaluate_capture(text, capture_rules());
}

CaptureResult evaluate_capture(const std::string& text, const std::vector<CaptureRule>& rules) {
    CaptureResult result;
    size_t length = utf8_length(text);
    if (length < kCaptureMinChars || length > kCaptureMaxChars) return result;
    if (contains_recall_marker(text)) return result;

    std::string normalized = normalize_quotes(text);
    double best_weight = 0.0;
    for (const auto& rule : rules) {
        if (!rule.matches || !rule.matches(normalized)) continue;
        result.score += rule.weight;
        if (rule.weight > best_weight) {
            best_weight = rule.weight;
            result.category = rule.category;
        }
    }

    // Penalties
    if (count_code_fences(text) >= 2) result.score -= 0.3;
    if (count_markdown_headers(text) >= 3) result.score -= 0.2;

    result.score = std::max(0.0, result.score);
    return result;
}

} // namespace memvault
