#pragma once
#include <string>

namespace memvault {

struct SanitizeResult {
    std::string clean;
    bool flagged = false;  // looks like a prompt-injection attempt
};

// Content filter applied before anything is stored.
class Sanitizer {
public:
    virtual ~Sanitizer() = default;
    virtual SanitizeResult sanitize(const std::string& text) const = 0;
};

// Flags common injection phrasing ("ignore previous instructions",
// "you are now", <system> tags, ...) and strips
// <system|instruction(s)|prompt|context|role> tags from the text.
class PatternSanitizer : public Sanitizer {
public:
    SanitizeResult sanitize(const std::string& text) const override;
};

// False for text shorter than 5 or longer than max_chars characters, and for
// text that is more than 60% fenced code blocks.
bool is_valid_memory_text(const std::string& text, size_t max_chars);

} // namespace memvault
