#pragma once
#include "params.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace culturerank {

// Support density for the explain pass: the explicit hint when present,
// otherwise (like + prior_likes) / (qualified_views + prior_views) when
// view counts were supplied. nullopt when neither is available.
std::optional<double> support_density(const Candidate& candidate,
                                      const ExplainThresholds& thresholds = {});

// Reason codes for a candidate, in fixed rule order, de-duplicated.
// Every rule is evaluated; TRENDING_IN_CLUSTER is appended only when no
// other rule fired, so the result is never empty.
std::vector<ReasonCode> determine_reason_codes(const Candidate& candidate,
                                               const ClusterExposures& exposures,
                                               const ExplainThresholds& thresholds = {});

// Append `extra` to `codes`, skipping codes already present.
void merge_reason_codes(std::vector<ReasonCode>& codes, const std::vector<ReasonCode>& extra);

struct ContributionRates {
    int prs = 0;
    int cvs = 0;
    int dns = 0;
};

// Percent share of PRS/CVS/DNS in their sum, rounded to integers.
ContributionRates contribution_rates(const ScoreBreakdown& breakdown);

// "PRS", "CVS", "DNS" or "PENALTY": the factor with the largest magnitude.
std::string dominant_factor(const ScoreBreakdown& breakdown);

} // namespace culturerank
