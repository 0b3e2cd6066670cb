#include <catch2/catch.hpp>
#include "weights.hpp"
#include <cmath>

using namespace culturerank;

static bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) < eps;
}

// ── renormalize_weights ──────────────────────────────────────────

TEST_CASE("renormalize_weights: already valid weights unchanged", "[weights]") {
    auto w = renormalize_weights({0.55, 0.25, 0.20}, 0.05, 0.9, 3);
    REQUIRE(near(w.prs, 0.55));
    REQUIRE(near(w.cvs, 0.25));
    REQUIRE(near(w.dns, 0.20));
}

TEST_CASE("renormalize_weights: clamps into bounds", "[weights]") {
    auto w = renormalize_weights({5.0, 0.0, 0.0}, 0.05, 0.9, 3);
    REQUIRE(near(w.prs, 0.9));
    REQUIRE(near(w.cvs, 0.05));
    REQUIRE(near(w.dns, 0.05));
}

TEST_CASE("renormalize_weights: zero sum falls back to equal thirds", "[weights]") {
    auto w = renormalize_weights({0.0, 0.0, 0.0}, 0.0, 1.0, 3);
    REQUIRE(w.prs == 1.0 / 3.0);
    REQUIRE(w.cvs == 1.0 / 3.0);
    REQUIRE(w.dns == 1.0 / 3.0);
}

TEST_CASE("renormalize_weights: non-finite input stays finite", "[weights]") {
    auto w = renormalize_weights({std::nan(""), 0.5, 0.5}, 0.05, 0.9, 3);
    REQUIRE(std::isfinite(w.prs));
    REQUIRE(near(w.prs + w.cvs + w.dns, 1.0));
}

// ── adjust_for_diversity_slider ──────────────────────────────────

TEST_CASE("slider: neutral position keeps base values", "[weights]") {
    auto adj = adjust_for_diversity_slider({0.55, 0.25, 0.20}, 0.5, 5, 0.15);
    REQUIRE(near(adj.weights.prs, 0.55));
    REQUIRE(near(adj.weights.cvs, 0.25));
    REQUIRE(near(adj.weights.dns, 0.20));
    REQUIRE(adj.effective_k == 5);
    REQUIRE(near(adj.effective_budget, 0.15));
}

TEST_CASE("slider: full diversity shifts weight off PRS", "[weights]") {
    auto adj = adjust_for_diversity_slider({0.55, 0.25, 0.20}, 1.0, 5, 0.15);
    REQUIRE(near(adj.weights.prs, 0.45));
    REQUIRE(near(adj.weights.dns, 0.26));
    REQUIRE(near(adj.weights.cvs, 0.29));
    REQUIRE(adj.effective_k == 3); // round(2.5) rounds half up
    REQUIRE(near(adj.effective_budget, 0.225));
}

TEST_CASE("slider: zero diversity favours relevance", "[weights]") {
    auto adj = adjust_for_diversity_slider({0.55, 0.25, 0.20}, 0.0, 5, 0.15);
    REQUIRE(near(adj.weights.prs, 0.65));
    REQUIRE(near(adj.weights.dns, 0.14));
    REQUIRE(near(adj.weights.cvs, 0.21));
    REQUIRE(adj.effective_k == 8); // capped at K + 3
    REQUIRE(near(adj.effective_budget, 0.075));
}

TEST_CASE("slider: out-of-range and non-finite values", "[weights]") {
    ScoreWeights base{0.55, 0.25, 0.20};
    auto high = adjust_for_diversity_slider(base, 7.0, 5, 0.15);
    auto one = adjust_for_diversity_slider(base, 1.0, 5, 0.15);
    REQUIRE(high.weights.prs == one.weights.prs);
    REQUIRE(high.effective_k == one.effective_k);

    auto nan = adjust_for_diversity_slider(base, std::nan(""), 5, 0.15);
    REQUIRE(near(nan.weights.prs, 0.55));
    REQUIRE(nan.effective_k == 5);
}

TEST_CASE("slider: effective K never drops below 1", "[weights]") {
    REQUIRE(adjust_for_diversity_slider({}, 1.0, 1, 0.15).effective_k == 1);
    REQUIRE(adjust_for_diversity_slider({}, 0.5, 0, 0.15).effective_k == 1);
    REQUIRE(adjust_for_diversity_slider({}, 0.5, -3, 0.15).effective_k == 1);
}

TEST_CASE("slider: budget bounded by config", "[weights]") {
    auto adj = adjust_for_diversity_slider({}, 1.0, 5, 0.9);
    REQUIRE(adj.effective_budget == 0.5);
}

TEST_CASE("slider: weights sum to 1 across the whole range", "[weights]") {
    for (int i = 0; i <= 20; i++) {
        double t = i / 20.0;
        auto adj = adjust_for_diversity_slider({0.55, 0.25, 0.20}, t, 5, 0.15);
        double sum = adj.weights.prs + adj.weights.cvs + adj.weights.dns;
        REQUIRE(std::fabs(sum - 1.0) < 1e-5);
        REQUIRE(adj.weights.prs >= 0.05 - 1e-12);
        REQUIRE(adj.weights.dns <= 0.9 + 1e-12);
    }
}
