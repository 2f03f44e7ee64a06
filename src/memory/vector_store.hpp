#pragma once
#include "../memory.hpp"
#include "../embedder.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

struct sqlite3; // forward declare

namespace memvault {

// Failure inside the store. retryable() is true for lock contention and
// failed commits, where the whole operation may simply be tried again.
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& msg, bool retryable = false)
        : std::runtime_error(msg), retryable_(retryable) {}

    bool retryable() const { return retryable_; }

private:
    bool retryable_;
};

// The store already holds vectors of another dimension.
class DimensionMismatchError : public StoreError {
public:
    DimensionMismatchError(uint32_t stored, uint32_t requested);

    uint32_t stored() const { return stored_; }
    uint32_t requested() const { return requested_; }

private:
    uint32_t stored_;
    uint32_t requested_;
};

struct StoreStats {
    uint32_t total = 0;
    uint32_t active = 0;
    uint32_t consolidated = 0;
    std::map<std::string, uint32_t> categories;  // active records only
};

// SQLite-backed record store with a parallel cosine vector index.
//
// Tables: memories (records), memory_vectors (id -> float32 BLOB, created
// once the dimension is known) and vault_meta (committed dimension).
// All methods are thread-safe. Multi-statement writes run in transaction().
class SqliteVectorStore {
public:
    static constexpr uint32_t kOverFetchFactor = 3;
    static constexpr uint32_t kSimilarCandidates = 5;

    explicit SqliteVectorStore(const std::string& path);
    ~SqliteVectorStore();

    // Non-copyable
    SqliteVectorStore(const SqliteVectorStore&) = delete;
    SqliteVectorStore& operator=(const SqliteVectorStore&) = delete;

    // Commit the vector dimension and create the vector table. Idempotent for
    // the same dimension; throws DimensionMismatchError for a different one,
    // including one committed meanwhile by another connection.
    void initialize(uint32_t dimension);

    // Committed dimension, or 0 if no vector has been stored yet. Re-reads
    // the database until one is found, so another connection's first insert
    // is picked up.
    uint32_t dimension();

    // Insert record and vector atomically. Fills in missing timestamps and
    // clamps importance to [0, 1]. Throws StoreError on failure.
    void insert(const MemoryRecord& record, const Embedding& vector);

    // Active records nearest to query, ascending distance, at most
    // kOverFetchFactor * k of them.
    std::vector<SearchResult> knn_search(const Embedding& query, uint32_t k,
                                         const RecallFilter& filter = {});

    // Up to kSimilarCandidates nearest active records with similarity >= threshold.
    std::vector<SearchResult> find_similar(const Embedding& vector, double threshold,
                                           const RecallFilter& filter = {});

    // Hard delete of record and vector. Returns false if id was not present.
    bool delete_by_id(const std::string& id);

    // Point active records at successor_id. Only valid inside transaction().
    // Returns how many records were marked; ids already consolidated or gone
    // are not counted.
    uint32_t mark_consolidated(const std::vector<std::string>& ids,
                               const std::string& successor_id);

    // Active records created before now_ms - age_ms, oldest first.
    std::vector<MemoryRecord> get_older_than(uint64_t age_ms, uint64_t now_ms);

    StoreStats stats();

    std::optional<MemoryRecord> get(const std::string& id);

    // Stored vector for id, or empty if none.
    Embedding get_vector(const std::string& id);

    // Active records, most recently updated first.
    std::vector<MemoryRecord> list_active(uint32_t limit,
                                          std::optional<MemoryCategory> category);

    // Every record including consolidated ones, oldest first.
    std::vector<MemoryRecord> all_for_export();

    // Bump access_count and set last_accessed_at for each id.
    void touch(const std::vector<std::string>& ids, uint64_t now_ms);

    // Close the database. Later calls throw StoreError. Called by the destructor.
    void close();

    // Run fn inside BEGIN IMMEDIATE / COMMIT. Any exception from fn rolls
    // back and is rethrown. Calls from within fn join the outer transaction.
    void transaction(const std::function<void()>& fn);

private:
    void init_schema();
    void load_dimension();
    void refresh_dimension();
    void exec_or_throw(const char* sql);
    void ensure_open() const;
    std::vector<SearchResult> scan_nearest(const Embedding& query, size_t limit,
                                           const RecallFilter& filter);

    sqlite3* db_ = nullptr;
    std::string path_;
    mutable std::recursive_mutex mutex_;
    uint32_t dimension_ = 0;
    bool vec_ready_ = false;
    int txn_depth_ = 0;
};

} // namespace memvault
