#pragma once
#include "memory.hpp"
#include <functional>
#include <string>
#include <vector>

namespace memvault {

constexpr size_t kCaptureMinChars = 20;
constexpr size_t kCaptureMaxChars = 2000;

struct CaptureResult {
    double score = 0.0;
    MemoryCategory category = MemoryCategory::Other;
};

// One weighted signal. Every matching rule adds its weight to the score;
// the category comes from the heaviest match, earliest rule on ties.
struct CaptureRule {
    std::string name;
    std::function<bool(const std::string&)> matches;
    double weight = 0.0;
    MemoryCategory category = MemoryCategory::Other;
};

// Built-in rules in evaluation order:
// explicit_memory, personal_info, structured_data, tech_decision, preference.
const std::vector<CaptureRule>& capture_rules();

// Score how worth remembering a message is. Text outside
// [kCaptureMinChars, kCaptureMaxChars] or carrying recalled memories scores 0.
CaptureResult evaluate_capture(const std::string& text);
CaptureResult evaluate_capture(const std::string& text, const std::vector<CaptureRule>& rules);

// True if text contains a block injected by recall (<relevant-memories, <vault-memories).
bool contains_recall_marker(const std::string& text);

} // namespace memvault
