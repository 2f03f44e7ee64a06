#pragma once
#include <cstdint>

namespace memvault {

// Ranking functions. Timestamps are epoch milliseconds.

constexpr uint64_t kRecencyHalfLifeMs = 30ULL * 24 * 60 * 60 * 1000;  // 30 days
constexpr double kMaxAccessBoost = 1.3;

// exp(-ln2 / half_life * age). 1.0 at age 0, 0.5 after one half-life.
// A created_at in the future counts as age 0.
double recency_decay(uint64_t created_at_ms, uint64_t now_ms);

// min(1.3, 1 + log2(1 + access_count) * 0.1)
double access_boost(uint64_t access_count);

// similarity * (0.5 + 0.3 * decay + 0.2 * importance) * boost
double final_score(double similarity, uint64_t created_at_ms, double importance,
                   uint64_t access_count, uint64_t now_ms);

} // namespace memvault
