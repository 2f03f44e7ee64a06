#include "memory.hpp"

namespace memvault {

std::string category_to_string(MemoryCategory cat) {
    switch (cat) {
        case MemoryCategory::Preference: return "preference";
        case MemoryCategory::Fact:       return "fact";
        case MemoryCategory::Decision:   return "decision";
        case MemoryCategory::Entity:     return "entity";
        case MemoryCategory::Procedure:  return "procedure";
        case MemoryCategory::Context:    return "context";
        case MemoryCategory::Other:      return "other";
    }
    return "other";
}

MemoryCategory category_from_string(const std::string& s) {
    if (s == "preference") return MemoryCategory::Preference;
    if (s == "fact")       return MemoryCategory::Fact;
    if (s == "decision")   return MemoryCategory::Decision;
    if (s == "entity")     return MemoryCategory::Entity;
    if (s == "procedure")  return MemoryCategory::Procedure;
    if (s == "context")    return MemoryCategory::Context;
    return MemoryCategory::Other;
}

bool is_known_category(const std::string& s) {
    for (auto cat : all_categories()) {
        if (category_to_string(cat) == s) return true;
    }
    return false;
}

const std::vector<MemoryCategory>& all_categories() {
    static const std::vector<MemoryCategory> cats = {
        MemoryCategory::Preference, MemoryCategory::Fact, MemoryCategory::Decision,
        MemoryCategory::Entity, MemoryCategory::Procedure, MemoryCategory::Context,
        MemoryCategory::Other,
    };
    return cats;
}

} // namespace memvault
