#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace culturerank {

constexpr const char* kAlgorithmId = "culture-rank";
constexpr const char* kAlgorithmVersion = "1.0.0";
constexpr const char* kContractVersion = "1.0";

enum class ContentType { Post, Work, Collection, Note, Bridge };

enum class PrsSource { Saved, Liked, Following };

enum class Strategy { None, Mmr, Dpp };

enum class ReasonCode {
    SimilarToSaved,
    SimilarToLiked,
    Following,
    GrowingContext,
    BridgeSuccess,
    DiversitySlot,
    Exploration,
    HighSupportDensity,
    TrendingInCluster,
    NewInCluster,
    Editorial, // reserved for curated placements, never emitted by the ranker
};

// Cultural-value sub-signals, each nominally in [0, 1].
struct CvsComponents {
    double like = 0.0;
    double context = 0.0;
    double collection = 0.0;
    double bridge = 0.0;
    double sustain = 0.0;
};

struct QualityFlags {
    bool moderated = false;
    bool nsfw = false;
    bool spam_suspect = false;
    bool hard_block = false;
};

// Precomputed upstream; the ranker never derives these itself.
struct CandidateFeatures {
    CvsComponents cvs;
    std::optional<double> prs;
    std::optional<PrsSource> prs_source;
    std::optional<std::vector<double>> embedding;
    std::optional<double> support_density;
    std::optional<double> qualified_unique_views;
};

struct Candidate {
    std::string item_key;
    ContentType type = ContentType::Post;
    std::string cluster_id;
    int64_t created_at = 0; // epoch ms
    QualityFlags quality;
    CandidateFeatures features;
};

// Recent per-cluster exposure counts for the requesting user.
using ClusterExposures = std::map<std::string, int64_t>;

// Exposure count for a cluster; absent or negative counts read as 0.
int64_t exposure_count(const ClusterExposures& exposures, const std::string& cluster_id);

struct ScoreWeights {
    double prs = 0.55;
    double cvs = 0.25;
    double dns = 0.20;
};

struct ScoreBreakdown {
    double prs = 0.0;
    double cvs = 0.0;
    double dns = 0.0;
    double penalty = 0.0;
    double final_score = 0.0;
};

struct ConstraintsReport {
    Strategy used_strategy = Strategy::None;
    uint32_t cap_applied_count = 0;
    uint32_t exploration_slots_requested = 0;
    uint32_t exploration_slots_filled = 0;
    uint32_t effective_diversity_cap_k = 0;
    double effective_exploration_budget = 0.0;
    ScoreWeights effective_weights;
};

struct RankedItem {
    std::string item_key;
    ContentType type = ContentType::Post;
    std::string cluster_id;
    double final_score = 0.0;
    std::vector<ReasonCode> reason_codes;
    ScoreBreakdown score_breakdown;
};

struct UserState {
    std::string user_key;
    double diversity_slider = 0.5;
    ClusterExposures recent_cluster_exposures;
    // Owned by external collaborators; carried through untouched.
    int64_t like_window_count = 0;
    double curator_reputation = 1.0;
    double cp_earned_90d = 0.0;
};

struct RankContext {
    std::string surface = "home_mix";
    int64_t now_ts = 0; // epoch ms
};

struct RankRequest {
    std::string contract_version = kContractVersion;
    std::string request_id;
    std::optional<std::string> request_seed;
    UserState user_state;
    std::vector<Candidate> candidates;
    RankContext context;
    nlohmann::json params = nullptr; // partial overrides, object or null
    std::optional<std::string> variant_id;
};

struct RankResponse {
    std::string request_id;
    std::string algorithm_id = kAlgorithmId;
    std::string algorithm_version = kAlgorithmVersion;
    std::string contract_version = kContractVersion;
    std::string param_set_id;
    std::optional<std::string> variant_id;
    std::vector<RankedItem> ranked;
    ConstraintsReport constraints_report;
};

// ── Name mapping ─────────────────────────────────────────────────

std::string content_type_name(ContentType type);
std::optional<ContentType> parse_content_type(const std::string& name);

std::string prs_source_name(PrsSource source);
std::optional<PrsSource> parse_prs_source(const std::string& name);

std::string strategy_name(Strategy strategy);
std::optional<Strategy> parse_strategy(const std::string& name);

std::string reason_code_name(ReasonCode code);
std::optional<ReasonCode> parse_reason_code(const std::string& name);

} // namespace culturerank
