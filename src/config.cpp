#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

namespace memvault {

nlohmann::json Config::defaults_json() {
    return {
        {"db_path", "~/.memvault/vault.db"},
        {"embedding", {
            {"provider", "auto"},
            {"api_key", ""},
            {"model", ""},
            {"base_url", ""}
        }},
        {"auto_capture", true},
        {"auto_recall", true},
        {"recall_limit", 5},
        {"capture_max_chars", 2000},
        {"consolidation", {
            {"enabled", true},
            {"interval_minutes", 360}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

std::string config_file_path() {
    return expand_home("~/.memvault/config.json");
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) {
        cfg.db_path = expand_home(cfg.db_path);
        return cfg;
    }

    if (j.contains("db_path") && j["db_path"].is_string())
        cfg.db_path = j["db_path"].get<std::string>();

    if (j.contains("embedding") && j["embedding"].is_object()) {
        auto& e = j["embedding"];
        if (e.contains("provider") && e["provider"].is_string())
            cfg.embedding.provider = e["provider"].get<std::string>();
        if (e.contains("api_key") && e["api_key"].is_string())
            cfg.embedding.api_key = e["api_key"].get<std::string>();
        if (e.contains("model") && e["model"].is_string())
            cfg.embedding.model = e["model"].get<std::string>();
        if (e.contains("base_url") && e["base_url"].is_string())
            cfg.embedding.base_url = e["base_url"].get<std::string>();
    }

    if (j.contains("auto_capture") && j["auto_capture"].is_boolean())
        cfg.auto_capture = j["auto_capture"].get<bool>();
    if (j.contains("auto_recall") && j["auto_recall"].is_boolean())
        cfg.auto_recall = j["auto_recall"].get<bool>();
    if (j.contains("recall_limit") && j["recall_limit"].is_number_unsigned())
        cfg.recall_limit = j["recall_limit"].get<uint32_t>();
    if (j.contains("capture_max_chars") && j["capture_max_chars"].is_number_unsigned())
        cfg.capture_max_chars = j["capture_max_chars"].get<uint32_t>();

    if (j.contains("consolidation") && j["consolidation"].is_object()) {
        auto& c = j["consolidation"];
        if (c.contains("enabled") && c["enabled"].is_boolean())
            cfg.consolidation.enabled = c["enabled"].get<bool>();
        if (c.contains("interval_minutes") && c["interval_minutes"].is_number_unsigned())
            cfg.consolidation.interval_minutes = c["interval_minutes"].get<uint32_t>();
    }

    cfg.db_path = expand_home(cfg.db_path);
    return cfg;
}

Config Config::load() {
    std::string config_path = config_file_path();
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed config " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("MEMVAULT_DB_PATH"))
        cfg.db_path = expand_home(v);
    if (const char* v = std::getenv("OPENAI_API_KEY"))
        cfg.embedding.api_key = v;
    if (const char* v = std::getenv("MEMVAULT_EMBEDDING_BASE_URL"))
        cfg.embedding.base_url = v;
    if (const char* v = std::getenv("MEMVAULT_EMBEDDING_MODEL"))
        cfg.embedding.model = v;

    return cfg;
}

} // namespace memvault
