#include "sanitizer.hpp"
#include "util.hpp"
#include <regex>
#include <vector>

namespace memvault {

namespace {

const std::vector<std::regex>& injection_patterns() {
    static const std::vector<std::regex> patterns = {
        std::regex(R"(\bsystem\s*:)", std::regex::icase),
        std::regex(R"(\bignore\s+(previous|above|all)\s+instructions)", std::regex::icase),
        std::regex(R"(\byou\s+are\s+now\b)", std::regex::icase),
        std::regex(R"(\bforget\s+(everything|all|your)\b)", std::regex::icase),
        std::regex(R"(\bnew\s+instructions?\b)", std::regex::icase),
        std::regex(R"(</?system>)", std::regex::icase),
        std::regex(R"(\bdo\s+not\s+follow\b)", std::regex::icase),
        std::regex(R"(\boverride\b)", std::regex::icase),
        std::regex(R"(\bjailbreak\b)", std::regex::icase),
    };
    return patterns;
}

} // namespace

SanitizeResult PatternSanitizer::sanitize(const std::string& text) const {
    static const std::regex context_tags(
        R"(</?(?:system|instructions?|prompt|context|role)[^>]*>)", std::regex::icase);

    SanitizeResult result;
    for (const auto& re : injection_patterns()) {
        if (std::regex_search(text, re)) {
            result.flagged = true;
            break;
        }
    }
    result.clean = trim(std::regex_replace(text, context_tags, ""));
    return result;
}

bool is_valid_memory_text(const std::string& text, size_t max_chars) {
    size_t length = utf8_length(text);
    if (length < 5 || length > max_chars) return false;

    // Sum the lengths of ```...``` blocks, fences included
    size_t code_chars = 0;
    size_t pos = 0;
    while ((pos = text.find("```", pos)) != std::string::npos) {
        size_t end = text.find("```", pos + 3);
        if (end == std::string::npos) break;
        code_chars += utf8_length(text.substr(pos, end + 3 - pos));
        pos = end + 3;
    }
    return static_cast<double>(code_chars) / static_cast<double>(length) <= 0.6;
}

} // namespace memvault
