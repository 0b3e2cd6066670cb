#include "mmr.hpp"
#include "similarity_cache.hpp"
#include "../explain.hpp"
#include "../rng.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <optional>
#include <string>

namespace culturerank {

namespace {

constexpr double kNoScore = -std::numeric_limits<double>::infinity();

// Running state of one rerank call.
struct MmrState {
    const std::vector<ScoredCandidate>& candidates;
    const RerankOptions& options;
    SimilarityCache similarities;
    std::vector<bool> used;
    std::vector<size_t> selected;
    std::map<std::string, uint32_t> cluster_counts;
    uint32_t cap_applied = 0;

    MmrState(const std::vector<ScoredCandidate>& c, const RerankOptions& o)
        : candidates(c), options(o), similarities(c), used(c.size(), false) {}

    const std::string& cluster_of(size_t i) const {
        return candidates[i].candidate->cluster_id;
    }

    bool under_cap(size_t i) const {
        auto it = cluster_counts.find(cluster_of(i));
        uint32_t count = it == cluster_counts.end() ? 0 : it->second;
        return count < options.cluster_cap;
    }

    double final_score(size_t i) const { return candidates[i].score.final_score; }

    double exploration_score(size_t i) const {
        return options.exploration_dns_weight * candidates[i].score.dns +
               options.exploration_score_weight * candidates[i].score.final_score;
    }

    double mmr_score(size_t i) {
        double max_sim = 0.0;
        for (size_t s : selected) {
            max_sim = std::max(max_sim, similarities.get(i, s));
        }
        double score = final_score(i) - options.mmr_lambda * max_sim;
        return std::isfinite(score) ? score : kNoScore;
    }

    void take(size_t i) {
        used[i] = true;
        selected.push_back(i);
        cluster_counts[cluster_of(i)]++;
    }
};

// Argmax over unused candidates accepted by `filter`; ties keep the
// earliest index, i.e. primary order.
template<typename Filter, typename Score>
std::optional<size_t> best_unused(MmrState& st, Filter filter, Score score) {
    std::optional<size_t> best;
    double best_score = kNoScore;
    for (size_t i = 0; i < st.candidates.size(); i++) {
        if (st.used[i] || !filter(i)) continue;
        double s = score(i);
        if (!best || s > best_score) {
            best = i;
            best_score = s;
        }
    }
    return best;
}

std::optional<size_t> pick_exploration(MmrState& st, const std::vector<bool>& eligible) {
    auto score = [&st](size_t i) { return st.exploration_score(i); };

    auto pick = best_unused(st, [&](size_t i) { return eligible[i] && st.under_cap(i); }, score);
    if (pick) return pick;

    pick = best_unused(st, [&st](size_t i) { return st.under_cap(i); }, score);
    if (pick) return pick;

    return best_unused(st, [](size_t) { return true; }, score);
}

// Scores capped-aware candidates, counting every cap skip. Falls back to
// the full remaining pool when the cap excludes everything.
template<typename Score>
std::optional<size_t> pick_capped(MmrState& st, Score score) {
    auto pick = best_unused(st, [&st](size_t i) {
        if (st.under_cap(i)) return true;
        st.cap_applied++;
        return false;
    }, score);
    if (pick) return pick;

    return best_unused(st, [](size_t) { return true; }, score);
}

} // namespace

RerankResult MmrReranker::rerank(const std::vector<ScoredCandidate>& candidates,
                                 const ClusterExposures& exposures,
                                 const RerankOptions& options) const {
    RerankResult result;
    ConstraintsReport& report = result.report;
    report.effective_diversity_cap_k = options.cluster_cap;
    report.effective_exploration_budget = options.exploration_budget;

    const size_t n = std::min<size_t>(options.target_size, candidates.size());
    if (n == 0) {
        report.used_strategy = Strategy::None;
        return result;
    }
    report.used_strategy = Strategy::Mmr;

    auto requested = static_cast<int64_t>(
        std::floor(static_cast<double>(n) * options.exploration_budget));
    report.exploration_slots_requested = static_cast<uint32_t>(std::max<int64_t>(0, requested));

    Xorshift64 rng(options.seed);
    std::vector<bool> is_slot(n, false);
    for (int64_t pos : unique_random_indices(rng, requested, 1, static_cast<int64_t>(n) - 1)) {
        is_slot[static_cast<size_t>(pos)] = true;
    }

    std::vector<bool> eligible(candidates.size(), false);
    for (size_t i = 0; i < candidates.size(); i++) {
        eligible[i] = exposure_count(exposures, candidates[i].candidate->cluster_id) <=
                      options.exploration_exposure_ceiling;
    }

    MmrState st(candidates, options);

    for (size_t pos = 0; pos < n; pos++) {
        std::optional<size_t> pick;
        bool exploration = false;

        if (is_slot[pos]) {
            pick = pick_exploration(st, eligible);
            exploration = pick.has_value();
        } else if (pos == 0) {
            pick = pick_capped(st, [&st](size_t i) { return st.final_score(i); });
        } else {
            pick = pick_capped(st, [&st](size_t i) { return st.mmr_score(i); });
        }

        if (!pick) break; // exhausted

        st.take(*pick);

        RerankedItem item;
        item.index = *pick;
        item.reason_codes = determine_reason_codes(*candidates[*pick].candidate, exposures,
                                                   options.explain);
        if (exploration) {
            merge_reason_codes(item.reason_codes,
                               {ReasonCode::Exploration, ReasonCode::DiversitySlot});
            report.exploration_slots_filled++;
        }
        result.items.push_back(std::move(item));
    }

    report.cap_applied_count = st.cap_applied;
    return result;
}

} // namespace culturerank
