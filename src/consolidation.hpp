#pragma once
#include "embedder.hpp"
#include "memory/vector_store.hpp"
#include "util.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace memvault {

constexpr uint64_t kConsolidationMinAgeMs = 7ULL * 24 * 60 * 60 * 1000;  // 7 days
constexpr double kConsolidationThreshold = 0.85;

struct ConsolidationOptions {
    uint64_t min_age_ms = kConsolidationMinAgeMs;
    double similarity_threshold = kConsolidationThreshold;
    std::string separator = " | ";
};

// Merge clusters of aged near-duplicate memories.
//
// Each active record older than min_age_ms seeds a cluster with its aged,
// unclaimed neighbors at or above similarity_threshold that share the
// seed's namespace and agent_id. A cluster is replaced
// by one new record holding the members' texts joined by separator (seed
// first), the seed's category and partition keys, and the highest member
// importance. Members are kept as tombstones pointing at the new record.
// Returns the number of clusters merged.
uint32_t run_consolidation(SqliteVectorStore& store, Embedder& embedder,
                           const ConsolidationOptions& options = {},
                           uint64_t now_ms = epoch_millis());

// Runs a consolidation job on a fixed interval on one background thread.
// Runs never overlap; a failing run is logged and the schedule continues.
class ConsolidationScheduler {
public:
    using Job = std::function<uint32_t()>;

    ConsolidationScheduler(Job job, std::chrono::milliseconds interval);
    ~ConsolidationScheduler();

    ConsolidationScheduler(const ConsolidationScheduler&) = delete;
    ConsolidationScheduler& operator=(const ConsolidationScheduler&) = delete;

    void start();

    // Wake the worker and wait for it, including any run in progress.
    void stop();

    bool running() const { return running_.load(); }

    // Run the job on the calling thread. Returns nullopt without running if
    // another run is in progress. Exceptions from the job propagate.
    std::optional<uint32_t> run_now();

    uint64_t completed_runs() const { return completed_runs_.load(); }

private:
    void loop();

    Job job_;
    std::chrono::milliseconds interval_;
    std::atomic<bool> running_{false};
    std::atomic<bool> in_flight_{false};
    std::atomic<uint64_t> completed_runs_{0};
    std::thread worker_;
    std::mutex wait_mu_;
    std::condition_variable cv_;
};

} // namespace memvault
