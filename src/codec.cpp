#include "codec.hpp"
#include "util.hpp"

#include <cmath>

namespace culturerank {

using json = nlohmann::json;

namespace {

const json* find_key(const json& j, const char* key) {
    if (!j.is_object()) return nullptr;
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return nullptr;
    return &*it;
}

const json* find_either(const json& j, const char* key, const char* alt) {
    if (const json* v = find_key(j, key)) return v;
    return find_key(j, alt);
}

std::string require_string(const json& j, const char* key, const std::string& where) {
    const json* v = find_key(j, key);
    if (!v) throw RequestError(where + ": missing '" + key + "'");
    if (!v->is_string()) throw RequestError(where + ": '" + key + "' must be a string");
    return v->get<std::string>();
}

double number_or(const json* v, double fallback, const std::string& where, const char* key) {
    if (!v) return fallback;
    if (!v->is_number()) throw RequestError(where + ": '" + key + "' must be a number");
    return v->get<double>();
}

bool bool_or(const json& j, const char* key, bool fallback) {
    const json* v = find_key(j, key);
    if (!v) return fallback;
    if (!v->is_boolean()) throw RequestError(std::string("'") + key + "' must be a boolean");
    return v->get<bool>();
}

QualityFlags quality_from_json(const json& j) {
    QualityFlags q;
    q.moderated = bool_or(j, "moderated", false);
    q.nsfw = bool_or(j, "nsfw", false);
    q.spam_suspect = bool_or(j, "spamSuspect", false);
    q.hard_block = bool_or(j, "hardBlock", false);
    return q;
}

CvsComponents cvs_from_json(const json& j, const std::string& where) {
    CvsComponents c;
    c.like = number_or(find_either(j, "like", "likeSignal"), 0.0, where, "like");
    c.context = number_or(find_either(j, "context", "contextSignal"), 0.0, where, "context");
    c.collection = number_or(find_either(j, "collection", "collectionSignal"), 0.0, where,
                             "collection");
    c.bridge = number_or(find_either(j, "bridge", "bridgeSignal"), 0.0, where, "bridge");
    c.sustain = number_or(find_either(j, "sustain", "sustainSignal"), 0.0, where, "sustain");
    return c;
}

CandidateFeatures features_from_json(const json& j, const std::string& where) {
    CandidateFeatures f;

    if (const json* cvs = find_either(j, "cvsComponents", "cvs")) {
        if (!cvs->is_object()) throw RequestError(where + ": 'cvsComponents' must be an object");
        f.cvs = cvs_from_json(*cvs, where);
    }

    if (const json* prs = find_key(j, "prs")) {
        f.prs = number_or(prs, 0.0, where, "prs");
    }
    if (const json* src = find_key(j, "prsSource")) {
        if (!src->is_string()) throw RequestError(where + ": 'prsSource' must be a string");
        f.prs_source = parse_prs_source(src->get<std::string>());
    }

    if (const json* emb = find_key(j, "embedding")) {
        if (!emb->is_array()) throw RequestError(where + ": 'embedding' must be an array");
        std::vector<double> values;
        values.reserve(emb->size());
        for (const auto& x : *emb) {
            if (!x.is_number()) throw RequestError(where + ": 'embedding' must hold numbers");
            values.push_back(x.get<double>());
        }
        f.embedding = std::move(values);
    }

    if (const json* sd = find_key(j, "supportDensity")) {
        f.support_density = number_or(sd, 0.0, where, "supportDensity");
    } else if (const json* hint = find_either(j, "publicMetricsHint", "publicMetrics")) {
        if (const json* hsd = find_key(*hint, "supportDensity")) {
            f.support_density = number_or(hsd, 0.0, where, "supportDensity");
        }
    }

    if (const json* views = find_either(j, "qualifiedUniqueViews", "uniqueViews")) {
        f.qualified_unique_views = number_or(views, 0.0, where, "qualifiedUniqueViews");
    }
    return f;
}

UserState user_state_from_json(const json& j) {
    UserState u;
    if (!j.is_object()) return u;

    if (const json* key = find_key(j, "userKey"); key && key->is_string())
        u.user_key = key->get<std::string>();
    u.diversity_slider = number_or(find_key(j, "diversitySlider"), 0.5, "userState",
                                   "diversitySlider");

    if (const json* exp = find_key(j, "recentClusterExposures")) {
        if (!exp->is_object())
            throw RequestError("userState: 'recentClusterExposures' must be an object");
        for (auto& [cluster, count] : exp->items()) {
            if (!count.is_number()) continue;
            double v = count.get<double>();
            u.recent_cluster_exposures[cluster] =
                std::isfinite(v) ? saturate_int(v, INT64_MIN, INT64_MAX) : 0;
        }
    }

    u.like_window_count = saturate_int(finite_or(
        number_or(find_either(j, "likeWindowCount", "likeWindowCount24h"), 0.0, "userState",
                  "likeWindowCount"), 0.0), INT64_MIN, INT64_MAX);
    u.curator_reputation = number_or(find_key(j, "curatorReputation"), 1.0, "userState",
                                     "curatorReputation");
    u.cp_earned_90d = number_or(find_key(j, "cpEarned90d"), 0.0, "userState", "cpEarned90d");
    return u;
}

} // namespace

Candidate candidate_from_json(const json& j) {
    if (!j.is_object()) throw RequestError("candidate must be an object");

    Candidate c;
    c.item_key = require_string(j, "itemKey", "candidate");
    const std::string where = "candidate '" + c.item_key + "'";

    if (const json* type = find_key(j, "type")) {
        if (!type->is_string()) throw RequestError(where + ": 'type' must be a string");
        auto parsed = parse_content_type(type->get<std::string>());
        if (!parsed) throw RequestError(where + ": unknown type '" + type->get<std::string>() + "'");
        c.type = *parsed;
    }

    c.cluster_id = require_string(j, "clusterId", where);

    const json* created = find_key(j, "createdAt");
    if (!created) throw RequestError(where + ": missing 'createdAt'");
    c.created_at = saturate_int(finite_or(number_or(created, 0.0, where, "createdAt"), 0.0),
                                INT64_MIN, INT64_MAX);

    const json* features = find_key(j, "features");
    if (!features) throw RequestError(where + ": missing 'features'");
    if (!features->is_object()) throw RequestError(where + ": 'features' must be an object");
    c.features = features_from_json(*features, where);

    if (const json* q = find_key(j, "qualityFlags")) {
        c.quality = quality_from_json(*q);
    } else if (const json* fq = find_key(*features, "qualityFlags")) {
        c.quality = quality_from_json(*fq);
    }
    return c;
}

RankRequest request_from_json(const json& j) {
    if (!j.is_object()) throw RequestError("request must be a JSON object");

    RankRequest r;
    r.request_id = require_string(j, "requestId", "request");

    if (const json* v = find_key(j, "contractVersion"); v && v->is_string())
        r.contract_version = v->get<std::string>();
    if (const json* v = find_key(j, "requestSeed"); v && v->is_string())
        r.request_seed = v->get<std::string>();
    if (const json* v = find_key(j, "variantId"); v && v->is_string())
        r.variant_id = v->get<std::string>();

    if (const json* u = find_key(j, "userState")) r.user_state = user_state_from_json(*u);

    const json* candidates = find_key(j, "candidates");
    if (!candidates || !candidates->is_array())
        throw RequestError("request: 'candidates' must be an array");
    r.candidates.reserve(candidates->size());
    for (const auto& c : *candidates) {
        r.candidates.push_back(candidate_from_json(c));
    }

    if (const json* ctx = find_key(j, "context"); ctx && ctx->is_object()) {
        if (const json* s = find_key(*ctx, "surface"); s && s->is_string())
            r.context.surface = s->get<std::string>();
        r.context.now_ts = saturate_int(
            finite_or(number_or(find_key(*ctx, "nowTs"), 0.0, "context", "nowTs"), 0.0),
            INT64_MIN, INT64_MAX);
    }

    if (const json* p = find_key(j, "params"); p && p->is_object()) r.params = *p;
    return r;
}

json breakdown_to_json(const ScoreBreakdown& b) {
    return {
        {"prs", b.prs},
        {"cvs", b.cvs},
        {"dns", b.dns},
        {"penalty", b.penalty},
        {"finalScore", b.final_score}
    };
}

json report_to_json(const ConstraintsReport& r) {
    return {
        {"usedStrategy", strategy_name(r.used_strategy)},
        {"capAppliedCount", r.cap_applied_count},
        {"explorationSlotsRequested", r.exploration_slots_requested},
        {"explorationSlotsFilled", r.exploration_slots_filled},
        {"effectiveDiversityCapK", r.effective_diversity_cap_k},
        {"effectiveExplorationBudget", r.effective_exploration_budget},
        {"effectiveWeights", {
            {"prs", r.effective_weights.prs},
            {"cvs", r.effective_weights.cvs},
            {"dns", r.effective_weights.dns}
        }}
    };
}

json response_to_json(const RankResponse& r) {
    json ranked = json::array();
    for (const auto& item : r.ranked) {
        json codes = json::array();
        for (ReasonCode code : item.reason_codes) codes.push_back(reason_code_name(code));
        ranked.push_back({
            {"itemKey", item.item_key},
            {"type", content_type_name(item.type)},
            {"clusterId", item.cluster_id},
            {"finalScore", item.final_score},
            {"reasonCodes", codes},
            {"scoreBreakdown", breakdown_to_json(item.score_breakdown)}
        });
    }

    json out = {
        {"requestId", r.request_id},
        {"algorithmId", r.algorithm_id},
        {"algorithmVersion", r.algorithm_version},
        {"contractVersion", r.contract_version},
        {"paramSetId", r.param_set_id},
        {"ranked", ranked},
        {"constraintsReport", report_to_json(r.constraints_report)}
    };
    if (r.variant_id) out["variantId"] = *r.variant_id;
    return out;
}

} // namespace culturerank
