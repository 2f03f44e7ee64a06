#pragma once
#include "../memory.hpp"
#include <nlohmann/json.hpp>

namespace memvault {

// JSON <-> MemoryRecord conversion shared by export, import and the CLI.

// Fields that are missing, null or of the wrong type fall back to defaults.
inline std::string json_string_or(const nlohmann::json& item, const char* key,
                                  const std::string& fallback) {
    if (item.contains(key) && item[key].is_string()) return item[key].get<std::string>();
    return fallback;
}

inline uint64_t json_uint_or(const nlohmann::json& item, const char* key, uint64_t fallback) {
    if (item.contains(key) && item[key].is_number_unsigned()) return item[key].get<uint64_t>();
    return fallback;
}

inline MemoryRecord record_from_json(const nlohmann::json& item) {
    MemoryRecord rec;
    rec.id = json_string_or(item, "id", "");
    rec.text = json_string_or(item, "text", "");
    rec.category = category_from_string(json_string_or(item, "category", "other"));
    if (item.contains("importance") && item["importance"].is_number()) {
        rec.importance = item["importance"].get<double>();
    }
    rec.access_count = json_uint_or(item, "access_count", 0);
    rec.created_at = json_uint_or(item, "created_at", 0);
    rec.updated_at = json_uint_or(item, "updated_at", 0);
    if (item.contains("last_accessed_at") && item["last_accessed_at"].is_number_unsigned()) {
        rec.last_accessed_at = item["last_accessed_at"].get<uint64_t>();
    }
    if (item.contains("consolidated_into") && item["consolidated_into"].is_string()) {
        rec.consolidated_into = item["consolidated_into"].get<std::string>();
    }
    if (item.contains("agent_id") && item["agent_id"].is_string()) {
        rec.agent_id = item["agent_id"].get<std::string>();
    }
    rec.namespace_ = json_string_or(item, "namespace", kDefaultNamespace);
    if (item.contains("metadata")) {
        rec.metadata = item["metadata"];
    }
    return rec;
}

inline nlohmann::json record_to_json(const MemoryRecord& rec) {
    nlohmann::json item = {
        {"id", rec.id},
        {"text", rec.text},
        {"category", category_to_string(rec.category)},
        {"importance", rec.importance},
        {"access_count", rec.access_count},
        {"created_at", rec.created_at},
        {"updated_at", rec.updated_at},
        {"last_accessed_at", nullptr},
        {"consolidated_into", nullptr},
        {"agent_id", nullptr},
        {"namespace", rec.namespace_},
        {"metadata", rec.metadata}
    };
    if (rec.last_accessed_at) item["last_accessed_at"] = *rec.last_accessed_at;
    if (rec.consolidated_into) item["consolidated_into"] = *rec.consolidated_into;
    if (rec.agent_id) item["agent_id"] = *rec.agent_id;
    return item;
}

} // namespace memvault
