#pragma once
#include "../types.hpp"
#include <map>
#include <string>
#include <vector>

namespace culturerank {

// Cosine similarity in [-1, 1]. Returns 0.0 if either vector is empty,
// the lengths differ, or either vector has (near) zero magnitude.
double cosine_similarity(const std::vector<double>& a, const std::vector<double>& b);

// Euclidean distance. Returns +inf if the lengths differ or either is empty.
double euclidean_distance(const std::vector<double>& a, const std::vector<double>& b);

// 1 / (1 + distance), 0.0 for incomparable vectors.
double euclidean_similarity(const std::vector<double>& a, const std::vector<double>& b);

// Jaccard index of the keys whose value is >= threshold. 0.0 when neither
// map has such a key.
double jaccard_similarity(const std::map<std::string, double>& a,
                          const std::map<std::string, double>& b, double threshold = 0.5);

// 1.0 for the same cluster, 0.0 otherwise.
double cluster_similarity(const std::string& cluster_a, const std::string& cluster_b);

// Candidate similarity in [0, 1]: (cosine + 1) / 2 when both carry an
// embedding, cluster similarity otherwise.
double candidate_similarity(const Candidate& a, const Candidate& b);

} // namespace culturerank
