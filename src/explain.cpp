#include "explain.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace culturerank {

std::optional<double> support_density(const Candidate& candidate,
                                      const ExplainThresholds& thresholds) {
    const auto& f = candidate.features;
    if (f.support_density && std::isfinite(*f.support_density)) {
        return *f.support_density;
    }
    if (f.qualified_unique_views && std::isfinite(*f.qualified_unique_views)) {
        double views = std::max(0.0, *f.qualified_unique_views);
        double denom = views + thresholds.support_prior_views;
        if (denom <= 0.0) return std::nullopt;
        double likes = std::max(0.0, finite_or(f.cvs.like, 0.0));
        return (likes + thresholds.support_prior_likes) / denom;
    }
    return std::nullopt;
}

std::vector<ReasonCode> determine_reason_codes(const Candidate& candidate,
                                               const ClusterExposures& exposures,
                                               const ExplainThresholds& thresholds) {
    std::vector<ReasonCode> codes;
    const auto& f = candidate.features;

    if (f.cvs.context >= thresholds.context_high) {
        codes.push_back(ReasonCode::GrowingContext);
    }

    if (f.cvs.bridge >= thresholds.bridge_high) {
        codes.push_back(ReasonCode::BridgeSuccess);
    }

    auto density = support_density(candidate, thresholds);
    if (density && *density >= thresholds.support_density_high) {
        codes.push_back(ReasonCode::HighSupportDensity);
    }

    if (exposure_count(exposures, candidate.cluster_id) < thresholds.new_cluster_exposure_limit) {
        codes.push_back(ReasonCode::NewInCluster);
    }

    if (f.prs && *f.prs >= thresholds.prs_similarity_min && f.prs_source) {
        switch (*f.prs_source) {
            case PrsSource::Liked:     codes.push_back(ReasonCode::SimilarToLiked); break;
            case PrsSource::Following: codes.push_back(ReasonCode::Following); break;
            case PrsSource::Saved:     codes.push_back(ReasonCode::SimilarToSaved); break;
        }
    }

    if (codes.empty()) {
        codes.push_back(ReasonCode::TrendingInCluster);
    }
    return codes;
}

void merge_reason_codes(std::vector<ReasonCode>& codes, const std::vector<ReasonCode>& extra) {
    for (ReasonCode code : extra) {
        if (std::find(codes.begin(), codes.end(), code) == codes.end()) {
            codes.push_back(code);
        }
    }
}

ContributionRates contribution_rates(const ScoreBreakdown& breakdown) {
    double prs = finite_or(breakdown.prs, 0.0);
    double cvs = finite_or(breakdown.cvs, 0.0);
    double dns = finite_or(breakdown.dns, 0.0);

    double total = prs + cvs + dns;
    if (total == 0.0) return {};

    auto pct = [total](double v) {
        return static_cast<int>(std::floor(v / total * 100.0 + 0.5));
    };
    return {pct(prs), pct(cvs), pct(dns)};
}

std::string dominant_factor(const ScoreBreakdown& breakdown) {
    const std::pair<const char*, double> factors[] = {
        {"PRS", breakdown.prs},
        {"CVS", breakdown.cvs},
        {"DNS", breakdown.dns},
        {"PENALTY", breakdown.penalty > 0.0 ? -breakdown.penalty : 0.0},
    };

    const char* best = factors[0].first;
    double best_abs = std::fabs(finite_or(factors[0].second, 0.0));
    for (const auto& [name, value] : factors) {
        double a = std::fabs(finite_or(value, 0.0));
        if (a > best_abs) {
            best_abs = a;
            best = name;
        }
    }
    return best;
}

} // namespace culturerank
