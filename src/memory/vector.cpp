#include "vector.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>

namespace memvault {

double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.empty() || b.empty() || a.size() != b.size()) return 0.0;

    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;

    for (size_t i = 0; i < a.size(); i++) {
        dot    += static_cast<double>(a[i]) * static_cast<double>(b[i]);
        norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
        norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
    }

    double denom = std::sqrt(norm_a) * std::sqrt(norm_b);
    if (denom < 1e-12) return 0.0;

    return std::clamp(dot / denom, -1.0, 1.0);
}

double cosine_distance(const std::vector<float>& a, const std::vector<float>& b) {
    return 1.0 - cosine_similarity(a, b);
}

std::string serialize_vector(const std::vector<float>& vec) {
    if (vec.empty()) return {};

    std::string data(sizeof(float) * vec.size(), '\0');
    std::memcpy(data.data(), vec.data(), sizeof(float) * vec.size());
    return data;
}

std::vector<float> deserialize_vector(const std::string& data) {
    return deserialize_vector(data.data(), data.size());
}

std::vector<float> deserialize_vector(const void* data, size_t bytes) {
    if (!data || bytes == 0 || bytes % sizeof(float) != 0) return {};

    std::vector<float> vec(bytes / sizeof(float));
    std::memcpy(vec.data(), data, bytes);
    return vec;
}

} // namespace memvault
