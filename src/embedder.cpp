#include "embedder.hpp"
#include "embedders/http_embedder.hpp"
#include "config.hpp"
#include "http.hpp"
#include <iostream>

namespace memvault {

std::unique_ptr<Embedder> create_embedder(const Config& config, HttpClient& http) {
    const auto& emb = config.embedding;

    // Resolve provider: explicit config, or auto-detect from the API key
    std::string provider = emb.provider;
    if (provider.empty() || provider == "auto") {
        if (emb.api_key.empty()) {
            std::cerr << "[embedder] No embedding API key found; embedding commands are disabled\n";
            return nullptr;
        }
        provider = "openai";
    }
    if (provider == "none") return nullptr;

    if (provider == "openai" || provider == "voyage") {
        if (emb.api_key.empty()) {
            std::cerr << "[embedder] " << provider
                      << " embeddings configured but no API key found\n";
            return nullptr;
        }
        if (provider == "voyage") {
            return create_voyage_embedder(emb.api_key, http, emb.base_url, emb.model);
        }
        return create_openai_embedder(emb.api_key, http, emb.base_url, emb.model);
    }

    if (provider == "ollama") {
        return create_ollama_embedder(http, emb.base_url, emb.model);
    }

    std::cerr << "[embedder] Unknown embedding provider: " << provider << "\n";
    return nullptr;
}

} // namespace memvault
