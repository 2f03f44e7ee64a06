#pragma once
#include <string>
#include <vector>

namespace memvault {

// Cosine similarity between two float vectors, clamped to [-1, 1].
// Returns 0.0 if either is empty, zero-magnitude, or the lengths differ.
double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

// 1 - cosine_similarity; 0 for identical directions, 2 for opposite.
double cosine_distance(const std::vector<float>& a, const std::vector<float>& b);

// Serialize a float vector to a binary string (for DB storage).
std::string serialize_vector(const std::vector<float>& vec);

// Deserialize a binary string back to a float vector.
std::vector<float> deserialize_vector(const std::string& data);

// Same as above, straight from a BLOB column.
std::vector<float> deserialize_vector(const void* data, size_t bytes);

} // namespace memvault
