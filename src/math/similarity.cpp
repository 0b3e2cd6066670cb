#include "similarity.hpp"
#include "../util.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace culturerank {

double cosine_similarity(const std::vector<double>& a, const std::vector<double>& b) {
    if (a.empty() || b.empty() || a.size() != b.size()) return 0.0;

    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;

    for (size_t i = 0; i < a.size(); i++) {
        dot    += a[i] * b[i];
        norm_a += a[i] * a[i];
        norm_b += b[i] * b[i];
    }

    double denom = std::sqrt(norm_a) * std::sqrt(norm_b);
    if (!std::isfinite(denom) || denom < 1e-10) return 0.0;

    return clamp(dot / denom, -1.0, 1.0);
}

double euclidean_distance(const std::vector<double>& a, const std::vector<double>& b) {
    if (a.empty() || b.empty() || a.size() != b.size()) {
        return std::numeric_limits<double>::infinity();
    }

    double sum = 0.0;
    for (size_t i = 0; i < a.size(); i++) {
        double diff = a[i] - b[i];
        sum += diff * diff;
    }
    return std::sqrt(sum);
}

double euclidean_similarity(const std::vector<double>& a, const std::vector<double>& b) {
    double distance = euclidean_distance(a, b);
    if (!std::isfinite(distance)) return 0.0;
    return 1.0 / (1.0 + std::max(0.0, distance));
}

double jaccard_similarity(const std::map<std::string, double>& a,
                          const std::map<std::string, double>& b, double threshold) {
    size_t in_a = 0;
    size_t shared = 0;
    for (const auto& [key, value] : a) {
        if (!(value >= threshold)) continue;
        in_a++;
        auto it = b.find(key);
        if (it != b.end() && it->second >= threshold) shared++;
    }
    size_t in_b = 0;
    for (const auto& [key, value] : b) {
        if (value >= threshold) in_b++;
    }

    size_t united = in_a + in_b - shared;
    if (united == 0) return 0.0;
    return static_cast<double>(shared) / static_cast<double>(united);
}

double cluster_similarity(const std::string& cluster_a, const std::string& cluster_b) {
    return cluster_a == cluster_b ? 1.0 : 0.0;
}

double candidate_similarity(const Candidate& a, const Candidate& b) {
    const auto& ea = a.features.embedding;
    const auto& eb = b.features.embedding;
    if (ea && eb && !ea->empty() && !eb->empty()) {
        return clamp01((cosine_similarity(*ea, *eb) + 1.0) / 2.0);
    }
    return cluster_similarity(a.cluster_id, b.cluster_id);
}

} // namespace culturerank
