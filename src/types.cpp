#include "types.hpp"
#include "util.hpp"

#include <algorithm>
#include <utility>

namespace culturerank {

namespace {

const std::pair<ReasonCode, const char*> kReasonCodeNames[] = {
    {ReasonCode::SimilarToSaved, "SIMILAR_TO_SAVED"},
    {ReasonCode::SimilarToLiked, "SIMILAR_TO_LIKED"},
    {ReasonCode::Following, "FOLLOWING"},
    {ReasonCode::GrowingContext, "GROWING_CONTEXT"},
    {ReasonCode::BridgeSuccess, "BRIDGE_SUCCESS"},
    {ReasonCode::DiversitySlot, "DIVERSITY_SLOT"},
    {ReasonCode::Exploration, "EXPLORATION"},
    {ReasonCode::HighSupportDensity, "HIGH_SUPPORT_DENSITY"},
    {ReasonCode::TrendingInCluster, "TRENDING_IN_CLUSTER"},
    {ReasonCode::NewInCluster, "NEW_IN_CLUSTER"},
    {ReasonCode::Editorial, "EDITORIAL"},
};

} // namespace

int64_t exposure_count(const ClusterExposures& exposures, const std::string& cluster_id) {
    auto it = exposures.find(cluster_id);
    if (it == exposures.end()) return 0;
    return std::max<int64_t>(0, it->second);
}

std::string content_type_name(ContentType type) {
    switch (type) {
        case ContentType::Post:       return "post";
        case ContentType::Work:       return "work";
        case ContentType::Collection: return "collection";
        case ContentType::Note:       return "note";
        case ContentType::Bridge:     return "bridge";
    }
    return "post";
}

std::optional<ContentType> parse_content_type(const std::string& name) {
    std::string n = to_lower(trim(name));
    if (n == "post") return ContentType::Post;
    if (n == "work") return ContentType::Work;
    if (n == "collection") return ContentType::Collection;
    if (n == "note") return ContentType::Note;
    if (n == "bridge") return ContentType::Bridge;
    return std::nullopt;
}

std::string prs_source_name(PrsSource source) {
    switch (source) {
        case PrsSource::Saved:     return "saved";
        case PrsSource::Liked:     return "liked";
        case PrsSource::Following: return "following";
    }
    return "liked";
}

std::optional<PrsSource> parse_prs_source(const std::string& name) {
    std::string n = to_lower(trim(name));
    if (n == "saved") return PrsSource::Saved;
    if (n == "liked") return PrsSource::Liked;
    if (n == "following") return PrsSource::Following;
    return std::nullopt;
}

std::string strategy_name(Strategy strategy) {
    switch (strategy) {
        case Strategy::None: return "NONE";
        case Strategy::Mmr:  return "MMR";
        case Strategy::Dpp:  return "DPP";
    }
    return "NONE";
}

std::optional<Strategy> parse_strategy(const std::string& name) {
    std::string n = to_lower(trim(name));
    if (n == "mmr") return Strategy::Mmr;
    if (n == "dpp") return Strategy::Dpp;
    if (n == "none") return Strategy::None;
    return std::nullopt;
}

std::string reason_code_name(ReasonCode code) {
    for (const auto& [c, name] : kReasonCodeNames) {
        if (c == code) return name;
    }
    return "TRENDING_IN_CLUSTER";
}

std::optional<ReasonCode> parse_reason_code(const std::string& name) {
    for (const auto& [c, n] : kReasonCodeNames) {
        if (name == n) return c;
    }
    return std::nullopt;
}

} // namespace culturerank
