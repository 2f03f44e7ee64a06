#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace memvault {

enum class MemoryCategory { Preference, Fact, Decision, Entity, Procedure, Context, Other };

constexpr double kDefaultImportance = 0.7;
constexpr const char* kDefaultNamespace = "default";

// A stored memory. Timestamps are epoch milliseconds.
struct MemoryRecord {
    std::string id;
    std::string text;
    MemoryCategory category = MemoryCategory::Other;
    double importance = kDefaultImportance;
    uint64_t access_count = 0;
    uint64_t created_at = 0;
    uint64_t updated_at = 0;
    std::optional<uint64_t> last_accessed_at;
    // Successor id once merged by consolidation. One hop only: the
    // successor may itself be consolidated later.
    std::optional<std::string> consolidated_into;
    std::optional<std::string> agent_id;
    std::string namespace_ = kDefaultNamespace;
    nlohmann::json metadata;  // null when absent

    bool is_active() const { return !consolidated_into.has_value(); }
};

// A record returned from a vector search.
// distance is cosine distance (1 - similarity); score is filled by ranking.
struct SearchResult {
    MemoryRecord record;
    double distance = 0.0;
    double similarity = 0.0;
    double score = 0.0;
};

// Optional partitioning filters for knn search. Unset fields match everything.
struct RecallFilter {
    std::optional<MemoryCategory> category;
    std::optional<std::string> namespace_;
    std::optional<std::string> agent_id;
};

// Category string conversions
std::string category_to_string(MemoryCategory cat);
MemoryCategory category_from_string(const std::string& s);  // unknown -> Other
bool is_known_category(const std::string& s);
const std::vector<MemoryCategory>& all_categories();

} // namespace memvault
