#include "consolidation.hpp"
#include <algorithm>
#include <iostream>
#include <unordered_set>
#include <vector>

namespace memvault {

namespace {

// A member was merged or deleted by someone else after the cluster was built.
class StaleClusterError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace

uint32_t run_consolidation(SqliteVectorStore& store, Embedder& embedder,
                           const ConsolidationOptions& options, uint64_t now_ms) {
    auto aged = store.get_older_than(options.min_age_ms, now_ms);
    if (aged.size() < 2) return 0;

    std::unordered_set<std::string> eligible;
    for (const auto& rec : aged) eligible.insert(rec.id);

    std::unordered_set<std::string> claimed;
    uint32_t merged = 0;

    for (const auto& seed : aged) {
        if (claimed.count(seed.id)) continue;

        Embedding seed_vec = store.get_vector(seed.id);
        if (seed_vec.empty()) continue;

        RecallFilter partition;
        partition.namespace_ = seed.namespace_;
        partition.agent_id = seed.agent_id;

        std::vector<MemoryRecord> cluster{seed};
        for (const auto& n : store.find_similar(seed_vec, options.similarity_threshold,
                                                partition)) {
            const auto& id = n.record.id;
            if (id == seed.id || claimed.count(id) || !eligible.count(id)) continue;
            // A seed without agent_id leaves the filter open to every agent
            if (n.record.namespace_ != seed.namespace_ || n.record.agent_id != seed.agent_id) {
                continue;
            }
            cluster.push_back(n.record);
        }
        if (cluster.size() < 2) continue;

        std::string merged_text;
        std::vector<std::string> member_ids;
        double importance = 0.0;
        for (const auto& m : cluster) {
            if (!merged_text.empty()) merged_text += options.separator;
            merged_text += m.text;
            member_ids.push_back(m.id);
            importance = std::max(importance, m.importance);
        }

        // Embed outside the transaction so the store stays available
        Embedding merged_vec = embedder.embed(merged_text);
        if (merged_vec.empty()) {
            throw EmbeddingError("consolidation: embedder returned an empty vector");
        }

        MemoryRecord successor;
        successor.id = generate_id();
        successor.text = merged_text;
        successor.category = seed.category;
        successor.importance = importance;
        successor.namespace_ = seed.namespace_;
        successor.agent_id = seed.agent_id;
        successor.created_at = std::max(now_ms, epoch_millis());
        successor.updated_at = successor.created_at;
        successor.metadata = {{"consolidated_from", member_ids}};

        try {
            store.transaction([&]() {
                store.insert(successor, merged_vec);
                uint32_t marked = store.mark_consolidated(member_ids, successor.id);
                if (marked != member_ids.size()) {
                    throw StaleClusterError("cluster changed during merge");
                }
            });
        } catch (const StaleClusterError&) {
            std::cerr << "[consolidation] Skipping cluster seeded by " << seed.id
                      << ": members changed concurrently\n";
            continue;
        }

        for (const auto& id : member_ids) claimed.insert(id);
        ++merged;
    }

    return merged;
}

// ── ConsolidationScheduler ──────────────────────────────────────

ConsolidationScheduler::ConsolidationScheduler(Job job, std::chrono::milliseconds interval)
    : job_(std::move(job)), interval_(interval) {}

ConsolidationScheduler::~ConsolidationScheduler() {
    stop();
}

void ConsolidationScheduler::start() {
    if (!job_ || running_.exchange(true)) return;
    worker_ = std::thread([this]() { loop(); });
}

void ConsolidationScheduler::stop() {
    if (!running_.exchange(false)) return;
    {
        std::lock_guard<std::mutex> lock(wait_mu_);
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

std::optional<uint32_t> ConsolidationScheduler::run_now() {
    bool expected = false;
    if (!job_ || !in_flight_.compare_exchange_strong(expected, true)) {
        return std::nullopt;
    }

    struct InFlightGuard {
        std::atomic<bool>& flag;
        ~InFlightGuard() { flag.store(false); }
    } guard{in_flight_};

    uint32_t merged = job_();
    completed_runs_.fetch_add(1);
    return merged;
}

void ConsolidationScheduler::loop() {
    while (running_.load()) {
        std::unique_lock<std::mutex> lock(wait_mu_);
        const bool stopped = cv_.wait_for(
            lock, interval_, [this]() { return !running_.load(); });
        lock.unlock();

        if (stopped || !running_.load()) {
            break;
        }

        try {
            auto merged = run_now();
            if (!merged) {
                std::cerr << "[consolidation] Previous run still in progress, skipping\n";
            } else if (*merged > 0) {
                std::cerr << "[consolidation] Merged " << *merged << " cluster(s)\n";
            }
        } catch (const std::exception& e) {
            std::cerr << "[consolidation] Run failed: " << e.what() << "\n";
        }
    }
}

} // namespace memvault
