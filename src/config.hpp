#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace memvault {

struct EmbeddingConfig {
    std::string provider = "auto";  // auto, openai, voyage, ollama, none
    std::string api_key;
    std::string model;              // empty = provider default
    std::string base_url;           // empty = provider default
};

struct ConsolidationConfig {
    bool enabled = true;
    uint32_t interval_minutes = 360;
};

struct Config {
    std::string db_path = "~/.memvault/vault.db";  // stored with ~ expanded
    EmbeddingConfig embedding;
    bool auto_capture = true;
    bool auto_recall = true;
    uint32_t recall_limit = 5;
    uint32_t capture_max_chars = 2000;
    ConsolidationConfig consolidation;

    // Load from ~/.memvault/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse a config document. Missing or mistyped keys keep their defaults.
    // Does not consult the environment.
    static Config from_json(const nlohmann::json& j);
};

// Path of the user config file (~ expanded)
std::string config_file_path();

} // namespace memvault
