#include "scoring.hpp"
#include <algorithm>
#include <cmath>

namespace memvault {

double recency_decay(uint64_t created_at_ms, uint64_t now_ms) {
    if (created_at_ms >= now_ms) return 1.0;
    double age = static_cast<double>(now_ms - created_at_ms);
    double lambda = std::log(2.0) / static_cast<double>(kRecencyHalfLifeMs);
    return std::exp(-lambda * age);
}

double access_boost(uint64_t access_count) {
    double boost = 1.0 + std::log2(1.0 + static_cast<double>(access_count)) * 0.1;
    return std::min(kMaxAccessBoost, boost);
}

double final_score(double similarity, uint64_t created_at_ms, double importance,
                   uint64_t access_count, uint64_t now_ms) {
    double decay = recency_decay(created_at_ms, now_ms);
    return similarity * (0.5 + 0.3 * decay + 0.2 * importance) * access_boost(access_count);
}

} // namespace memvault
