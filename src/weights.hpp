#pragma once
#include "params.hpp"
#include "types.hpp"
#include <cstdint>

namespace culturerank {

struct SliderAdjustment {
    ScoreWeights weights;
    uint32_t effective_k = 1;
    double effective_budget = 0.0;
};

// Clamp each weight into [min_weight, max_weight] and divide by the sum,
// repeated up to `iterations` passes. A zero sum falls back to 1/3 each.
ScoreWeights renormalize_weights(const ScoreWeights& weights, double min_weight,
                                 double max_weight, uint32_t iterations);

// Map the user's diversity slider t in [0, 1] onto score weights, the
// per-cluster cap and the exploration budget. t = 0.5 leaves the weights
// unchanged; higher t shifts weight from PRS to DNS/CVS, tightens the cap
// and widens exploration.
SliderAdjustment adjust_for_diversity_slider(const ScoreWeights& base, double slider,
                                             int64_t base_k, double base_budget,
                                             const SliderConfig& config = {});

} // namespace culturerank
