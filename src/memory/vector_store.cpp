#include "vector_store.hpp"
#include "vector.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <algorithm>
#include <filesystem>
#include <stdexcept>

namespace memvault {

namespace {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

bool is_busy(int rc) {
    return rc == SQLITE_BUSY || rc == SQLITE_LOCKED;
}

void prepare_or_throw(sqlite3* db, const std::string& sql, StmtGuard& g) {
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &g.stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw StoreError(std::string("prepare failed: ") + sqlite3_errmsg(db), is_busy(rc));
    }
}

void step_done_or_throw(sqlite3* db, sqlite3_stmt* stmt) {
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        throw StoreError(std::string("write failed: ") + sqlite3_errmsg(db), is_busy(rc));
    }
}

void bind_optional_text(sqlite3_stmt* stmt, int col, const std::optional<std::string>& value) {
    if (value) {
        sqlite3_bind_text(stmt, col, value->c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, col);
    }
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    if (auto* v = sqlite3_column_text(stmt, col)) return reinterpret_cast<const char*>(v);
    return {};
}

std::optional<std::string> column_optional_text(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return column_text(stmt, col);
}

// Columns selected by every record query, in record_from_stmt order.
constexpr const char* kRecordColumns =
    "m.id, m.text, m.category, m.importance, m.access_count, m.created_at,"
    " m.updated_at, m.last_accessed_at, m.consolidated_into, m.agent_id,"
    " m.namespace, m.metadata";
constexpr int kEmbeddingColumn = 12;

MemoryRecord record_from_stmt(sqlite3_stmt* stmt) {
    MemoryRecord rec;
    rec.id           = column_text(stmt, 0);
    rec.text         = column_text(stmt, 1);
    rec.category     = category_from_string(column_text(stmt, 2));
    rec.importance   = sqlite3_column_double(stmt, 3);
    rec.access_count = static_cast<uint64_t>(sqlite3_column_int64(stmt, 4));
    rec.created_at   = static_cast<uint64_t>(sqlite3_column_int64(stmt, 5));
    rec.updated_at   = static_cast<uint64_t>(sqlite3_column_int64(stmt, 6));
    if (sqlite3_column_type(stmt, 7) != SQLITE_NULL) {
        rec.last_accessed_at = static_cast<uint64_t>(sqlite3_column_int64(stmt, 7));
    }
    rec.consolidated_into = column_optional_text(stmt, 8);
    rec.agent_id          = column_optional_text(stmt, 9);
    rec.namespace_        = column_text(stmt, 10);
    if (auto meta = column_optional_text(stmt, 11)) {
        auto parsed = nlohmann::json::parse(*meta, nullptr, false);
        rec.metadata = parsed.is_discarded() ? nlohmann::json(*meta) : parsed;
    }
    return rec;
}

std::vector<MemoryRecord> collect_records(sqlite3_stmt* stmt) {
    std::vector<MemoryRecord> results;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        results.push_back(record_from_stmt(stmt));
    }
    return results;
}

} // namespace

DimensionMismatchError::DimensionMismatchError(uint32_t stored, uint32_t requested)
    : StoreError("dimension mismatch: store has " + std::to_string(stored) +
                 "-dim vectors, got " + std::to_string(requested) +
                 ". Delete the database to re-embed with the new model, or switch back to a " +
                 std::to_string(stored) + "-dim model."),
      stored_(stored), requested_(requested) {}

SqliteVectorStore::SqliteVectorStore(const std::string& path) : path_(path) {
    // Ensure parent directory exists
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw std::runtime_error("SqliteVectorStore: failed to open database: " + err);
    }

    // Performance pragmas
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA temp_store=MEMORY;", nullptr, nullptr, nullptr);
    sqlite3_busy_timeout(db_, 5000);

    try {
        init_schema();
        load_dimension();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteVectorStore::~SqliteVectorStore() {
    close();
}

void SqliteVectorStore::close() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (db_) {
        // An open transaction is rolled back by SQLite on close.
        sqlite3_close(db_);
        db_ = nullptr;
    }
    dimension_ = 0;
    vec_ready_ = false;
}

void SqliteVectorStore::ensure_open() const {
    if (!db_) throw StoreError("SqliteVectorStore: database is closed");
}

void SqliteVectorStore::exec_or_throw(const char* sql) {
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string err = errmsg ? errmsg : sqlite3_errmsg(db_);
        sqlite3_free(errmsg);
        throw StoreError("SqliteVectorStore: " + err, is_busy(rc));
    }
}

void SqliteVectorStore::init_schema() {
    exec_or_throw(
        "CREATE TABLE IF NOT EXISTS memories ("
        "  id                TEXT PRIMARY KEY,"
        "  text              TEXT NOT NULL,"
        "  category          TEXT NOT NULL DEFAULT 'other',"
        "  importance        REAL NOT NULL DEFAULT 0.7,"
        "  access_count      INTEGER NOT NULL DEFAULT 0,"
        "  created_at        INTEGER NOT NULL,"
        "  updated_at        INTEGER NOT NULL,"
        "  last_accessed_at  INTEGER,"
        "  consolidated_into TEXT,"
        "  agent_id          TEXT,"
        "  namespace         TEXT NOT NULL DEFAULT 'default',"
        "  metadata          TEXT"
        ");");

    exec_or_throw(
        "CREATE TABLE IF NOT EXISTS vault_meta ("
        "  key   TEXT PRIMARY KEY,"
        "  value TEXT NOT NULL"
        ");");

    exec_or_throw("CREATE INDEX IF NOT EXISTS idx_memories_category ON memories(category);");
    exec_or_throw("CREATE INDEX IF NOT EXISTS idx_memories_namespace ON memories(namespace);");
    exec_or_throw("CREATE INDEX IF NOT EXISTS idx_memories_consolidated"
                  " ON memories(consolidated_into);");
}

// Re-read the committed dimension. Also used after a rollback, which may
// have undone a vector table created inside the failed transaction.
void SqliteVectorStore::load_dimension() {
    dimension_ = 0;
    vec_ready_ = false;

    {
        StmtGuard g;
        const char* sql = "SELECT value FROM vault_meta WHERE key = 'dimensions';";
        if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) == SQLITE_OK &&
            sqlite3_step(g.stmt) == SQLITE_ROW) {
            try {
                dimension_ = static_cast<uint32_t>(std::stoul(column_text(g.stmt, 0)));
            } catch (const std::exception&) {
                throw StoreError("SqliteVectorStore: corrupt dimensions entry in vault_meta");
            }
        }
    }

    StmtGuard g;
    const char* sql =
        "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = 'memory_vectors';";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) == SQLITE_OK) {
        vec_ready_ = dimension_ > 0 && sqlite3_step(g.stmt) == SQLITE_ROW;
    }
}

void SqliteVectorStore::initialize(uint32_t dimension) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ensure_open();

    if (dimension == 0) {
        throw StoreError("SqliteVectorStore: vector dimension must be positive");
    }
    if (vec_ready_) {
        if (dimension_ != dimension) throw DimensionMismatchError(dimension_, dimension);
        return;
    }

    transaction([&]() {
        // Another connection may have committed a dimension since we last looked
        load_dimension();
        if (dimension_ != 0 && dimension_ != dimension) {
            throw DimensionMismatchError(dimension_, dimension);
        }
        if (vec_ready_) return;

        exec_or_throw(
            "CREATE TABLE IF NOT EXISTS memory_vectors ("
            "  id        TEXT PRIMARY KEY,"
            "  embedding BLOB NOT NULL"
            ");");

        StmtGuard g;
        prepare_or_throw(db_,
            "INSERT OR REPLACE INTO vault_meta (key, value) VALUES ('dimensions', ?);", g);
        std::string value = std::to_string(dimension);
        sqlite3_bind_text(g.stmt, 1, value.c_str(), -1, SQLITE_TRANSIENT);
        step_done_or_throw(db_, g.stmt);

        dimension_ = dimension;
        vec_ready_ = true;
    });
}

uint32_t SqliteVectorStore::dimension() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ensure_open();
    refresh_dimension();
    return vec_ready_ ? dimension_ : 0;
}

// The dimension is committed once and never changes, so only a store that
// has not seen one yet needs to look again.
void SqliteVectorStore::refresh_dimension() {
    if (!vec_ready_) load_dimension();
}

void SqliteVectorStore::transaction(const std::function<void()>& fn) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ensure_open();

    if (txn_depth_ > 0) {
        ++txn_depth_;
        try {
            fn();
        } catch (...) {
            --txn_depth_;
            throw;
        }
        --txn_depth_;
        return;
    }

    exec_or_throw("BEGIN IMMEDIATE;");
    txn_depth_ = 1;
    try {
        fn();
    } catch (...) {
        txn_depth_ = 0;
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        load_dimension();
        throw;
    }
    txn_depth_ = 0;

    char* errmsg = nullptr;
    if (sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, &errmsg) != SQLITE_OK) {
        std::string err = errmsg ? errmsg : sqlite3_errmsg(db_);
        sqlite3_free(errmsg);
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        load_dimension();
        throw StoreError("SqliteVectorStore: commit failed: " + err, true);
    }
}

void SqliteVectorStore::insert(const MemoryRecord& record, const Embedding& vector) {
    if (record.id.empty()) {
        throw StoreError("SqliteVectorStore: record id must not be empty");
    }
    if (vector.empty()) {
        throw StoreError("SqliteVectorStore: record " + record.id + " has no vector");
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);

    auto now = epoch_millis();
    auto created = static_cast<int64_t>(record.created_at ? record.created_at : now);
    auto updated = static_cast<int64_t>(record.updated_at ? record.updated_at : now);
    double importance = std::clamp(record.importance, 0.0, 1.0);
    std::string cat = category_to_string(record.category);
    std::optional<std::string> metadata;
    if (!record.metadata.is_null()) metadata = record.metadata.dump();

    transaction([&]() {
        initialize(static_cast<uint32_t>(vector.size()));
        {
            StmtGuard g;
            prepare_or_throw(db_,
                "INSERT INTO memories (id, text, category, importance, access_count,"
                " created_at, updated_at, last_accessed_at, consolidated_into, agent_id,"
                " namespace, metadata)"
                " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);", g);
            sqlite3_bind_text(g.stmt, 1, record.id.c_str(),   -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(g.stmt, 2, record.text.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(g.stmt, 3, cat.c_str(),         -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(g.stmt, 4, importance);
            sqlite3_bind_int64(g.stmt, 5, static_cast<int64_t>(record.access_count));
            sqlite3_bind_int64(g.stmt, 6, created);
            sqlite3_bind_int64(g.stmt, 7, updated);
            if (record.last_accessed_at) {
                sqlite3_bind_int64(g.stmt, 8, static_cast<int64_t>(*record.last_accessed_at));
            } else {
                sqlite3_bind_null(g.stmt, 8);
            }
            bind_optional_text(g.stmt, 9, record.consolidated_into);
            bind_optional_text(g.stmt, 10, record.agent_id);
            sqlite3_bind_text(g.stmt, 11, record.namespace_.c_str(), -1, SQLITE_TRANSIENT);
            bind_optional_text(g.stmt, 12, metadata);
            step_done_or_throw(db_, g.stmt);
        }

        StmtGuard vg;
        prepare_or_throw(db_, "INSERT INTO memory_vectors (id, embedding) VALUES (?, ?);", vg);
        std::string blob = serialize_vector(vector);
        sqlite3_bind_text(vg.stmt, 1, record.id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_blob(vg.stmt, 2, blob.data(), static_cast<int>(blob.size()),
                          SQLITE_TRANSIENT);
        step_done_or_throw(db_, vg.stmt);
    });
}

// Exact nearest-neighbor scan over every active vector that passes filter.
std::vector<SearchResult> SqliteVectorStore::scan_nearest(const Embedding& query, size_t limit,
                                                          const RecallFilter& filter) {
    ensure_open();
    refresh_dimension();
    if (!vec_ready_ || limit == 0) return {};
    if (query.size() != dimension_) {
        throw DimensionMismatchError(dimension_, static_cast<uint32_t>(query.size()));
    }

    std::string sql = std::string("SELECT ") + kRecordColumns + ", v.embedding"
                      " FROM memory_vectors v"
                      " JOIN memories m ON m.id = v.id"
                      " WHERE m.consolidated_into IS NULL";
    std::vector<std::string> params;
    if (filter.category) {
        sql += " AND m.category = ?";
        params.push_back(category_to_string(*filter.category));
    }
    if (filter.namespace_) {
        sql += " AND m.namespace = ?";
        params.push_back(*filter.namespace_);
    }
    if (filter.agent_id) {
        sql += " AND m.agent_id = ?";
        params.push_back(*filter.agent_id);
    }
    sql += " ORDER BY m.created_at ASC, m.id ASC;";

    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        return {};
    }
    int col = 1;
    for (const auto& p : params) {
        sqlite3_bind_text(g.stmt, col++, p.c_str(), -1, SQLITE_TRANSIENT);
    }

    std::vector<SearchResult> candidates;
    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        Embedding emb = deserialize_vector(
            sqlite3_column_blob(g.stmt, kEmbeddingColumn),
            static_cast<size_t>(sqlite3_column_bytes(g.stmt, kEmbeddingColumn)));
        if (emb.size() != query.size()) continue;

        SearchResult r;
        r.record = record_from_stmt(g.stmt);
        r.similarity = cosine_similarity(query, emb);
        r.distance = 1.0 - r.similarity;
        candidates.push_back(std::move(r));
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const SearchResult& a, const SearchResult& b) {
                         return a.distance < b.distance;
                     });
    if (candidates.size() > limit) {
        candidates.resize(limit);
    }
    return candidates;
}

std::vector<SearchResult> SqliteVectorStore::knn_search(const Embedding& query, uint32_t k,
                                                        const RecallFilter& filter) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return scan_nearest(query, static_cast<size_t>(k) * kOverFetchFactor, filter);
}

std::vector<SearchResult> SqliteVectorStore::find_similar(const Embedding& vector,
                                                          double threshold,
                                                          const RecallFilter& filter) {
    // Float round-off keeps an identical vector a hair below 1.0
    constexpr double kEpsilon = 1e-6;

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto results = scan_nearest(vector, kSimilarCandidates, filter);
    results.erase(std::remove_if(results.begin(), results.end(),
                                 [threshold](const SearchResult& r) {
                                     return r.similarity + kEpsilon < threshold;
                                 }),
                  results.end());
    return results;
}

bool SqliteVectorStore::delete_by_id(const std::string& id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    bool removed = false;
    transaction([&]() {
        {
            StmtGuard g;
            prepare_or_throw(db_, "DELETE FROM memories WHERE id = ?;", g);
            sqlite3_bind_text(g.stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
            step_done_or_throw(db_, g.stmt);
            removed = sqlite3_changes(db_) > 0;
        }
        refresh_dimension();
        if (vec_ready_) {
            StmtGuard g;
            prepare_or_throw(db_, "DELETE FROM memory_vectors WHERE id = ?;", g);
            sqlite3_bind_text(g.stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
            step_done_or_throw(db_, g.stmt);
        }
    });
    return removed;
}

uint32_t SqliteVectorStore::mark_consolidated(const std::vector<std::string>& ids,
                                              const std::string& successor_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (txn_depth_ == 0) {
        throw StoreError("SqliteVectorStore: mark_consolidated must run inside a transaction");
    }

    StmtGuard g;
    prepare_or_throw(db_,
        "UPDATE memories SET consolidated_into = ?"
        " WHERE id = ? AND id != ? AND consolidated_into IS NULL;", g);

    uint32_t marked = 0;
    for (const auto& id : ids) {
        sqlite3_reset(g.stmt);
        sqlite3_bind_text(g.stmt, 1, successor_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(g.stmt, 2, id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(g.stmt, 3, successor_id.c_str(), -1, SQLITE_TRANSIENT);
        step_done_or_throw(db_, g.stmt);
        marked += static_cast<uint32_t>(sqlite3_changes(db_));
    }
    return marked;
}

std::vector<MemoryRecord> SqliteVectorStore::get_older_than(uint64_t age_ms, uint64_t now_ms) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ensure_open();

    auto cutoff = now_ms > age_ms ? static_cast<int64_t>(now_ms - age_ms) : 0;
    std::string sql = std::string("SELECT ") + kRecordColumns +
                      " FROM memories m"
                      " WHERE m.consolidated_into IS NULL AND m.created_at < ?"
                      " ORDER BY m.created_at ASC, m.id ASC;";

    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        return {};
    }
    sqlite3_bind_int64(g.stmt, 1, cutoff);
    return collect_records(g.stmt);
}

StoreStats SqliteVectorStore::stats() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ensure_open();

    StoreStats s;
    {
        StmtGuard g;
        const char* sql =
            "SELECT COUNT(*), COALESCE(SUM(consolidated_into IS NULL), 0) FROM memories;";
        if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) == SQLITE_OK &&
            sqlite3_step(g.stmt) == SQLITE_ROW) {
            s.total = static_cast<uint32_t>(sqlite3_column_int64(g.stmt, 0));
            s.active = static_cast<uint32_t>(sqlite3_column_int64(g.stmt, 1));
            s.consolidated = s.total - s.active;
        }
    }

    StmtGuard g;
    const char* sql =
        "SELECT category, COUNT(*) FROM memories"
        " WHERE consolidated_into IS NULL GROUP BY category;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) == SQLITE_OK) {
        while (sqlite3_step(g.stmt) == SQLITE_ROW) {
            s.categories[column_text(g.stmt, 0)] =
                static_cast<uint32_t>(sqlite3_column_int64(g.stmt, 1));
        }
    }
    return s;
}

std::optional<MemoryRecord> SqliteVectorStore::get(const std::string& id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ensure_open();

    std::string sql = std::string("SELECT ") + kRecordColumns + " FROM memories m WHERE m.id = ?;";
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sqlite3_bind_text(g.stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(g.stmt) == SQLITE_ROW) {
        return record_from_stmt(g.stmt);
    }
    return std::nullopt;
}

Embedding SqliteVectorStore::get_vector(const std::string& id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ensure_open();
    refresh_dimension();
    if (!vec_ready_) return {};

    StmtGuard g;
    const char* sql = "SELECT embedding FROM memory_vectors WHERE id = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return {};
    sqlite3_bind_text(g.stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return {};
    return deserialize_vector(sqlite3_column_blob(g.stmt, 0),
                              static_cast<size_t>(sqlite3_column_bytes(g.stmt, 0)));
}

std::vector<MemoryRecord> SqliteVectorStore::list_active(uint32_t limit,
                                                         std::optional<MemoryCategory> category) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ensure_open();

    std::string sql = std::string("SELECT ") + kRecordColumns +
                      " FROM memories m WHERE m.consolidated_into IS NULL";
    if (category) sql += " AND m.category = ?";
    sql += " ORDER BY m.updated_at DESC LIMIT ?;";

    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        return {};
    }
    int col = 1;
    if (category) {
        std::string cat = category_to_string(*category);
        sqlite3_bind_text(g.stmt, col++, cat.c_str(), -1, SQLITE_TRANSIENT);
    }
    sqlite3_bind_int64(g.stmt, col, static_cast<int64_t>(limit));
    return collect_records(g.stmt);
}

std::vector<MemoryRecord> SqliteVectorStore::all_for_export() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ensure_open();

    std::string sql = std::string("SELECT ") + kRecordColumns +
                      " FROM memories m ORDER BY m.created_at ASC, m.id ASC;";
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        return {};
    }
    return collect_records(g.stmt);
}

void SqliteVectorStore::touch(const std::vector<std::string>& ids, uint64_t now_ms) {
    if (ids.empty()) return;
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    transaction([&]() {
        StmtGuard g;
        prepare_or_throw(db_,
            "UPDATE memories SET access_count = access_count + 1, last_accessed_at = ?"
            " WHERE id = ?;", g);
        for (const auto& id : ids) {
            sqlite3_reset(g.stmt);
            sqlite3_bind_int64(g.stmt, 1, static_cast<int64_t>(now_ms));
            sqlite3_bind_text(g.stmt, 2, id.c_str(), -1, SQLITE_TRANSIENT);
            step_done_or_throw(db_, g.stmt);
        }
    });
}

} // namespace memvault
