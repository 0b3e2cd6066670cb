#pragma once
#include "params.hpp"
#include "types.hpp"

namespace culturerank {

constexpr double kMsPerHour = 1000.0 * 60.0 * 60.0;

// Cultural Value Score: clamp01 of the weighted sum of the CVS components.
double calculate_cvs(const CvsComponents& components, const CvsWeights& weights = {});

// Diversity/Novelty Score: blend of cluster novelty (fewer recent exposures
// of the cluster score higher) and time novelty (exponential decay with a
// half-life). Future timestamps count as age 0.
double calculate_dns(const Candidate& candidate, const ClusterExposures& exposures,
                     int64_t now_ts, const ScoringConfig& config = {});

// Quality penalty in [0, 1]. Hard-blocked items are filtered, not penalized.
double calculate_penalty(const Candidate& candidate, const ScoringConfig& config = {});

// w_prs*PRS + w_cvs*CVS + w_dns*DNS - penalty, rounded to 9 digits.
ScoreBreakdown calculate_mixed_score(const Candidate& candidate,
                                     const ClusterExposures& exposures,
                                     int64_t now_ts,
                                     const ScoreWeights& weights,
                                     const ScoringConfig& config = {});

} // namespace culturerank
