#include <catch2/catch.hpp>
#include "candidate_builder.hpp"
#include "rerank/dpp.hpp"
#include <cmath>

using namespace culturerank;

static bool near(double a, double b, double eps = 1e-12) {
    return std::fabs(a - b) < eps;
}

// ── Kernel ───────────────────────────────────────────────────────

TEST_CASE("build_dpp_kernel: quality on the diagonal, damped off it", "[dpp]") {
    std::vector<Candidate> cs = {make_candidate("a", "c1"), make_candidate("b", "c1")};
    auto scored = make_scored(cs, {0.5, 0.4});
    SimilarityCache sims(scored);

    Matrix k = build_dpp_kernel(scored, 2, 0.5, sims);
    REQUIRE(near(k[0][0], 0.25));
    REQUIRE(near(k[1][1], 0.16));
    // 0.5 * (1 - 0.5 * 1) * 0.4
    REQUIRE(near(k[0][1], 0.1));
    REQUIRE(k[0][1] == k[1][0]);
}

TEST_CASE("build_dpp_kernel: non-positive scores floor to a tiny quality", "[dpp]") {
    std::vector<Candidate> cs = {make_candidate("a", "c1"), make_candidate("b", "c2")};
    auto scored = make_scored(cs, {-0.3, 0.0});
    SimilarityCache sims(scored);

    Matrix k = build_dpp_kernel(scored, 2, 0.5, sims);
    REQUIRE(k[0][0] == 1e-10 * 1e-10);
    REQUIRE(k[1][1] == 1e-10 * 1e-10);
}

TEST_CASE("build_dpp_kernel: count limits the pool", "[dpp]") {
    std::vector<Candidate> cs = {
        make_candidate("a", "c1"), make_candidate("b", "c2"), make_candidate("c", "c3")};
    auto scored = make_scored(cs, {0.9, 0.8, 0.7});
    SimilarityCache sims(scored);
    REQUIRE(build_dpp_kernel(scored, 2, 0.5, sims).size() == 2);
    REQUIRE(build_dpp_kernel(scored, 10, 0.5, sims).size() == 3);
}

// ── Greedy selection ─────────────────────────────────────────────

TEST_CASE("dpp_greedy_select: diagonal kernel picks by quality", "[dpp]") {
    Matrix k = {{0.1, 0.0, 0.0}, {0.0, 0.5, 0.0}, {0.0, 0.0, 0.3}};
    auto picks = dpp_greedy_select(k, 3, DppConfig{});
    REQUIRE(picks == std::vector<size_t>{1, 2, 0});
}

TEST_CASE("dpp_greedy_select: stops at k", "[dpp]") {
    Matrix k = {{0.1, 0.0, 0.0}, {0.0, 0.5, 0.0}, {0.0, 0.0, 0.3}};
    REQUIRE(dpp_greedy_select(k, 1, DppConfig{}) == std::vector<size_t>{1});
    REQUIRE(dpp_greedy_select(k, 0, DppConfig{}).empty());
}

TEST_CASE("dpp_greedy_select: stops when no gain is positive", "[dpp]") {
    Matrix k = {{0.0, 0.0}, {0.0, 0.0}};
    DppConfig cfg;
    cfg.regularization = 0.0;
    REQUIRE(dpp_greedy_select(k, 2, cfg).empty());
}

// ── DppReranker ──────────────────────────────────────────────────

static RerankOptions dpp_options(uint32_t n, uint32_t k) {
    RerankOptions o;
    o.target_size = n;
    o.cluster_cap = k;
    o.exploration_budget = 0.15;
    return o;
}

TEST_CASE("DPP: empty input reports NONE", "[dpp]") {
    std::vector<ScoredCandidate> none;
    DppReranker dpp;
    auto r = dpp.rerank(none, {}, dpp_options(20, 5));
    REQUIRE(r.items.empty());
    REQUIRE(r.report.used_strategy == Strategy::None);
}

TEST_CASE("DPP: counts cap violations without enforcing them", "[dpp]") {
    std::vector<Candidate> cs = {
        make_candidate("a", "c1"), make_candidate("b", "c1"), make_candidate("c", "c1")};
    auto scored = make_scored(cs, {0.9, 0.8, 0.7});

    DppReranker dpp;
    auto r = dpp.rerank(scored, {}, dpp_options(3, 1));
    REQUIRE(r.report.used_strategy == Strategy::Dpp);
    REQUIRE(keys_of(scored, r.items) == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(r.report.cap_applied_count == 2);
    REQUIRE(r.report.exploration_slots_requested == 0);
    REQUIRE(r.report.exploration_slots_filled == 0);
}

TEST_CASE("DPP: output bounded by N and carries reason codes", "[dpp]") {
    std::vector<Candidate> cs = {
        make_candidate("a", "c1"), make_candidate("b", "c2"), make_candidate("c", "c3"),
        make_candidate("d", "c1")};
    auto scored = make_scored(cs, {0.9, 0.8, 0.7, 0.6});

    DppReranker dpp;
    auto r = dpp.rerank(scored, {}, dpp_options(2, 5));
    REQUIRE(r.items.size() == 2);
    REQUIRE(r.items[0].index == 0);
    for (const auto& item : r.items) REQUIRE_FALSE(item.reason_codes.empty());
}

TEST_CASE("DPP: determinant gain reorders against primary order", "[dpp]") {
    // cos(a, b) = -1 gives sim 0, cos(a, c) = 1 gives sim 1.
    std::vector<Candidate> cs = {
        make_candidate("a", "c1"), make_candidate("b", "c2"), make_candidate("c", "c3")};
    cs[0].features.embedding = std::vector<double>{1.0, 0.0};
    cs[1].features.embedding = std::vector<double>{-1.0, 0.0};
    cs[2].features.embedding = std::vector<double>{1.0, 0.0};
    auto scored = make_scored(cs, {0.9, 0.8, 0.7});

    SimilarityCache sims(scored);
    Matrix k = build_dpp_kernel(scored, 3, 0.5, sims);
    REQUIRE(near(k[0][1], 0.72));  // 0.9 * 1.0 * 0.8
    REQUIRE(near(k[0][2], 0.315)); // 0.9 * 0.5 * 0.7
    REQUIRE(near(k[1][2], 0.56));  // 0.8 * 1.0 * 0.7

    // det{a,b} = 0.81 * 0.64 - 0.72^2 = 0 (plus regularization),
    // det{a,c} = 0.81 * 0.49 - 0.315^2 = 0.297675, so c outranks b.
    // det{a,b,c} = -0.063504, so b never yields a positive gain.
    REQUIRE(dpp_greedy_select(k, 3, DppConfig{}) == std::vector<size_t>{0, 2});

    DppReranker dpp;
    auto r = dpp.rerank(scored, {}, dpp_options(3, 5));
    REQUIRE(keys_of(scored, r.items) == std::vector<std::string>{"a", "c"});
    REQUIRE(r.report.cap_applied_count == 0);
}

TEST_CASE("DPP: reproducible", "[dpp]") {
    std::vector<Candidate> cs;
    for (int i = 0; i < 12; i++) {
        cs.push_back(make_candidate("k" + std::to_string(i), "c" + std::to_string(i % 3)));
    }
    std::vector<double> finals;
    for (int i = 0; i < 12; i++) finals.push_back(0.9 - i * 0.05);
    auto scored = make_scored(cs, finals);

    DppReranker dpp;
    auto first = dpp.rerank(scored, {}, dpp_options(6, 2));
    auto second = dpp.rerank(scored, {}, dpp_options(6, 2));
    REQUIRE(keys_of(scored, first.items) == keys_of(scored, second.items));
    REQUIRE(first.report.cap_applied_count == second.report.cap_applied_count);
}

TEST_CASE("create_reranker: strategy dispatch", "[dpp]") {
    REQUIRE(create_reranker(Strategy::Dpp)->strategy() == Strategy::Dpp);
    REQUIRE(create_reranker(Strategy::Mmr)->strategy() == Strategy::Mmr);
    REQUIRE(create_reranker(Strategy::None)->strategy() == Strategy::Mmr);
}
