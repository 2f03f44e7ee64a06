#include "vault.hpp"
#include "capture.hpp"
#include "scoring.hpp"
#include "util.hpp"
#include "memory/record_json.hpp"
#include <algorithm>
#include <iostream>

namespace memvault {

Vault::Vault(SqliteVectorStore& store, Embedder* embedder, const Sanitizer& sanitizer,
             VaultOptions options)
    : store_(store)
    , embedder_(embedder)
    , sanitizer_(sanitizer)
    , options_(options)
{}

Embedding Vault::embed(const std::string& text) {
    if (!embedder_) throw EmbedderNotConfiguredError();
    Embedding vec = embedder_->embed(text);
    if (vec.empty()) {
        throw EmbeddingError("embedder " + embedder_->embedder_name() + " returned an empty vector");
    }
    return vec;
}

SaveResult Vault::save(const std::string& text, const SaveOptions& opts) {
    SaveResult result;

    auto sanitized = sanitizer_.sanitize(text);
    if (sanitized.flagged) {
        result.status = SaveStatus::Flagged;
        return result;
    }
    if (!is_valid_memory_text(sanitized.clean, options_.capture_max_chars)) {
        result.status = SaveStatus::Invalid;
        return result;
    }

    Embedding vec = embed(sanitized.clean);

    MemoryRecord rec;
    rec.id = generate_id();
    rec.text = sanitized.clean;
    rec.category = opts.category.value_or(MemoryCategory::Other);
    rec.importance = std::clamp(opts.importance.value_or(kDefaultImportance), 0.0, 1.0);
    rec.agent_id = opts.agent_id;
    rec.namespace_ = opts.namespace_;
    rec.metadata = opts.metadata;
    rec.created_at = epoch_millis();
    rec.updated_at = rec.created_at;

    // Dedup check and insert under one transaction so a concurrent save of
    // the same text cannot slip in between.
    store_.transaction([&]() {
        auto similar = store_.find_similar(vec, kDedupThreshold);
        if (!similar.empty()) {
            result.status = SaveStatus::Duplicate;
            result.duplicate_of = similar.front();
            return;
        }
        store_.insert(rec, vec);
        result.status = SaveStatus::Saved;
        result.record = rec;
    });
    return result;
}

std::vector<SearchResult> Vault::recall(const std::string& query, uint32_t k,
                                        const RecallFilter& filter) {
    if (k == 0) return {};

    Embedding vec = embed(query);
    auto results = store_.knn_search(vec, k, filter);

    uint64_t now = epoch_millis();
    for (auto& r : results) {
        r.score = final_score(r.similarity, r.record.created_at, r.record.importance,
                              r.record.access_count, now);
    }
    std::stable_sort(results.begin(), results.end(),
                     [](const SearchResult& a, const SearchResult& b) {
                         return a.score > b.score;
                     });
    if (results.size() > k) results.resize(k);

    std::vector<std::string> ids;
    ids.reserve(results.size());
    for (auto& r : results) {
        ids.push_back(r.record.id);
        r.record.access_count += 1;
        r.record.last_accessed_at = now;
    }
    store_.touch(ids, now);
    return results;
}

bool Vault::forget(const std::string& id) {
    return store_.delete_by_id(id);
}

std::optional<MemoryRecord> Vault::forget_by_query(const std::string& query) {
    Embedding vec = embed(query);
    auto results = store_.knn_search(vec, 1);
    if (results.empty()) return std::nullopt;

    MemoryRecord match = results.front().record;
    if (!store_.delete_by_id(match.id)) return std::nullopt;
    return match;
}

uint32_t Vault::auto_capture(const std::vector<ChatMessage>& messages) {
    uint32_t captured = 0;

    try {
        for (const auto& msg : messages) {
            if (captured >= kMaxCapturesPerTurn) break;
            if (msg.role != "user") continue;
            if (!is_valid_memory_text(msg.content, options_.capture_max_chars)) continue;

            auto capture = evaluate_capture(msg.content);
            if (capture.score < kCaptureThreshold) continue;

            auto sanitized = sanitizer_.sanitize(msg.content);
            if (sanitized.flagged) continue;
            if (!is_valid_memory_text(sanitized.clean, options_.capture_max_chars)) continue;

            Embedding vec = embed(sanitized.clean);

            MemoryRecord rec;
            rec.id = generate_id();
            rec.text = sanitized.clean;
            rec.category = capture.category;
            rec.importance = std::min(0.5 + capture.score * 0.3, 0.9);

            bool stored = false;
            store_.transaction([&]() {
                if (!store_.find_similar(vec, kDedupThreshold).empty()) return;
                store_.insert(rec, vec);
                stored = true;
            });
            if (!stored) continue;

            ++captured;
            std::cerr << "[vault] Auto-captured [" << category_to_string(rec.category)
                      << "]: " << preview(rec.text, 60) << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "[vault] Auto-capture failed: " << e.what() << "\n";
    }
    return captured;
}

std::string Vault::recall_context(const std::string& prompt) {
    if (utf8_length(prompt) < kMinRecallPromptChars) return "";

    std::vector<SearchResult> results;
    try {
        results = recall(prompt, options_.recall_limit);
    } catch (const std::exception& e) {
        std::cerr << "[vault] Auto-recall failed: " << e.what() << "\n";
        return "";
    }
    if (results.empty()) return "";

    std::string block = "<vault-memories trust=\"unverified\">\n";
    for (const auto& r : results) {
        block += "- [" + category_to_string(r.record.category) + "] " + r.record.text + "\n";
    }
    block += "</vault-memories>";
    return block;
}

nlohmann::json Vault::export_json() {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& rec : store_.all_for_export()) {
        arr.push_back(record_to_json(rec));
    }
    return arr;
}

uint32_t Vault::import_json(const nlohmann::json& items) {
    if (!items.is_array()) {
        throw std::runtime_error("import: expected a JSON array of memories");
    }

    uint32_t imported = 0;
    for (const auto& item : items) {
        if (!item.is_object()) continue;
        MemoryRecord rec = record_from_json(item);
        if (rec.text.empty()) continue;

        if (rec.id.empty()) rec.id = generate_id();
        rec.access_count = 0;
        rec.last_accessed_at.reset();

        Embedding vec = embed(rec.text);
        try {
            store_.insert(rec, vec);
            ++imported;
        } catch (const DimensionMismatchError&) {
            throw;
        } catch (const StoreError& e) {
            std::cerr << "[vault] Skipping import of " << rec.id << ": " << e.what() << "\n";
        }
    }
    return imported;
}

std::vector<MemoryRecord> Vault::list(uint32_t limit, std::optional<MemoryCategory> category) {
    return store_.list_active(limit, category);
}

StoreStats Vault::stats() {
    return store_.stats();
}

} // namespace memvault
