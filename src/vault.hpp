#pragma once
#include "memory.hpp"
#include "embedder.hpp"
#include "sanitizer.hpp"
#include "memory/vector_store.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace memvault {

constexpr double kDedupThreshold = 0.95;
constexpr double kCaptureThreshold = 0.3;
constexpr uint32_t kMaxCapturesPerTurn = 5;
constexpr size_t kMinRecallPromptChars = 10;

enum class SaveStatus { Saved, Duplicate, Flagged, Invalid };

struct SaveOptions {
    std::optional<MemoryCategory> category;  // default Other
    std::optional<double> importance;        // default kDefaultImportance
    std::optional<std::string> agent_id;
    std::string namespace_ = kDefaultNamespace;
    nlohmann::json metadata;
};

struct SaveResult {
    SaveStatus status = SaveStatus::Invalid;
    std::optional<MemoryRecord> record;        // set when Saved
    std::optional<SearchResult> duplicate_of;  // set when Duplicate
};

struct VaultOptions {
    size_t capture_max_chars = 2000;
    uint32_t recall_limit = 5;
};

// One conversation turn as seen by auto_capture. Only "user" messages are captured.
struct ChatMessage {
    std::string role;
    std::string content;
};

// Front door for saving, recalling and forgetting memories.
//
// Store and sanitizer are borrowed and must outlive the Vault. The embedder
// may be null; operations that need a vector then throw
// EmbedderNotConfiguredError. Embedding happens before the store is touched,
// never under the store lock.
class Vault {
public:
    Vault(SqliteVectorStore& store, Embedder* embedder, const Sanitizer& sanitizer,
          VaultOptions options = {});

    void set_embedder(Embedder* embedder) { embedder_ = embedder; }
    bool has_embedder() const { return embedder_ != nullptr; }

    // Sanitize, validate, dedup against existing memories, then store.
    SaveResult save(const std::string& text, const SaveOptions& opts = {});

    // Top k active memories for query ranked by final_score, best first.
    // The returned records are counted as accessed.
    std::vector<SearchResult> recall(const std::string& query, uint32_t k,
                                     const RecallFilter& filter = {});

    bool forget(const std::string& id);

    // Delete the single nearest memory to query and return it.
    std::optional<MemoryRecord> forget_by_query(const std::string& query);

    // Capture memorable user messages from one turn. Returns how many were
    // stored (at most kMaxCapturesPerTurn). Failures are logged, not thrown.
    uint32_t auto_capture(const std::vector<ChatMessage>& messages);

    // Block of recalled memories to prepend to a prompt, or "" when the
    // prompt is too short, nothing matches, or recall fails.
    std::string recall_context(const std::string& prompt);

    // Every record, consolidated ones included, oldest first.
    nlohmann::json export_json();

    // Insert each item with a non-empty "text". Returns the number imported.
    uint32_t import_json(const nlohmann::json& items);

    std::vector<MemoryRecord> list(uint32_t limit,
                                   std::optional<MemoryCategory> category = std::nullopt);
    StoreStats stats();

private:
    Embedding embed(const std::string& text);

    SqliteVectorStore& store_;
    Embedder* embedder_;
    const Sanitizer& sanitizer_;
    VaultOptions options_;
};

} // namespace memvault
