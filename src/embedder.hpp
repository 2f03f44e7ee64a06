#pragma once
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace memvault {

using Embedding = std::vector<float>;

class HttpClient; // forward declare
struct Config;    // forward declare

// Abstract embedding provider interface.
// Implementations must return vectors of one consistent dimension and be
// safe to call from several threads. embed() throws EmbeddingError on failure.
class Embedder {
public:
    virtual ~Embedder() = default;

    // Compute embedding vector for the given text
    virtual Embedding embed(const std::string& text) = 0;

    // Dimensionality of the embedding vectors (0 until known)
    virtual uint32_t dimensions() const = 0;

    // Human-readable name (e.g. "openai", "ollama")
    virtual std::string embedder_name() const = 0;
};

// Raised by operations that need an embedding when no Embedder is set.
class EmbedderNotConfiguredError : public std::runtime_error {
public:
    EmbedderNotConfiguredError()
        : std::runtime_error("embedder not configured") {}
};

// Raised when the embedding provider fails or returns an unusable vector.
class EmbeddingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Create an embedder from config. Returns nullptr if embeddings are disabled,
// no API key is available, or the configured provider is not recognized.
std::unique_ptr<Embedder> create_embedder(const Config& config, HttpClient& http);

} // namespace memvault
