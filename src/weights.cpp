#include "weights.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>

namespace culturerank {

ScoreWeights renormalize_weights(const ScoreWeights& weights, double min_weight,
                                 double max_weight, uint32_t iterations) {
    ScoreWeights w = weights;
    const uint32_t passes = std::max<uint32_t>(1, iterations);

    for (uint32_t pass = 0; pass < passes; pass++) {
        w.prs = clamp(w.prs, min_weight, max_weight);
        w.cvs = clamp(w.cvs, min_weight, max_weight);
        w.dns = clamp(w.dns, min_weight, max_weight);

        double sum = w.prs + w.cvs + w.dns;
        if (!(sum > 0.0) || !std::isfinite(sum)) {
            return {1.0 / 3.0, 1.0 / 3.0, 1.0 / 3.0};
        }
        w.prs /= sum;
        w.cvs /= sum;
        w.dns /= sum;

        bool bounded = w.prs >= min_weight && w.prs <= max_weight &&
                       w.cvs >= min_weight && w.cvs <= max_weight &&
                       w.dns >= min_weight && w.dns <= max_weight;
        if (bounded) break;
    }
    return w;
}

SliderAdjustment adjust_for_diversity_slider(const ScoreWeights& base, double slider,
                                             int64_t base_k, double base_budget,
                                             const SliderConfig& config) {
    double t = std::isfinite(slider) ? clamp01(slider) : 0.5;

    double delta = (2.0 * t - 1.0) * config.delta_max;
    ScoreWeights shifted;
    shifted.prs = base.prs - delta;
    shifted.dns = base.dns + config.dns_ratio * delta;
    shifted.cvs = base.cvs + config.cvs_ratio * delta;

    SliderAdjustment out;
    out.weights = renormalize_weights(shifted, config.min_weight, config.max_weight,
                                      config.max_iterations);

    // Bounded so that k + 3 and the uint32_t result cannot overflow.
    int64_t k = std::clamp<int64_t>(base_k, 0, static_cast<int64_t>(UINT32_MAX) - 3);
    double scaled_k = static_cast<double>(k) *
                      lerp(config.k_max_multiplier, config.k_min_multiplier, t);
    double rounded_k = std::floor(finite_or(scaled_k, 0.0) + 0.5);
    double upper_k = static_cast<double>(k + 3);
    out.effective_k = static_cast<uint32_t>(saturate_int(rounded_k, 1, static_cast<int64_t>(upper_k)));

    double budget = clamp01(base_budget) *
                    lerp(config.exploration_min_multiplier, config.exploration_max_multiplier, t);
    out.effective_budget = clamp(budget, config.budget_min, config.budget_max);

    return out;
}

} // namespace culturerank
