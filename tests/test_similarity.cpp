#include <catch2/catch.hpp>
#include "candidate_builder.hpp"
#include "math/similarity.hpp"
#include "rerank/similarity_cache.hpp"
#include <cmath>

using namespace culturerank;

TEST_CASE("cosine_similarity: identical vectors", "[similarity]") {
    std::vector<double> a = {1.0, 2.0, 3.0};
    REQUIRE(cosine_similarity(a, a) > 0.999999);
}

TEST_CASE("cosine_similarity: orthogonal and opposite", "[similarity]") {
    REQUIRE(std::fabs(cosine_similarity({1.0, 0.0}, {0.0, 1.0})) < 1e-12);
    REQUIRE(cosine_similarity({1.0, 0.0}, {-1.0, 0.0}) < -0.999999);
}

TEST_CASE("cosine_similarity: degenerate inputs return 0", "[similarity]") {
    REQUIRE(cosine_similarity({}, {}) == 0.0);
    REQUIRE(cosine_similarity({1.0, 2.0}, {1.0}) == 0.0);
    REQUIRE(cosine_similarity({0.0, 0.0}, {1.0, 1.0}) == 0.0);
}

TEST_CASE("euclidean_distance and similarity", "[similarity]") {
    REQUIRE(euclidean_distance({0.0, 0.0}, {3.0, 4.0}) == 5.0);
    REQUIRE(std::isinf(euclidean_distance({1.0}, {1.0, 2.0})));

    double sim = euclidean_similarity({0.0, 0.0}, {3.0, 4.0});
    REQUIRE(std::fabs(sim - 1.0 / 6.0) < 1e-12);
    REQUIRE(euclidean_similarity({1.0}, {}) == 0.0);
}

TEST_CASE("jaccard_similarity: keys at or above the threshold", "[similarity]") {
    std::map<std::string, double> a = {{"x", 1.0}, {"y", 0.5}, {"z", 0.2}};
    std::map<std::string, double> b = {{"y", 0.9}, {"z", 0.8}, {"w", 0.1}};
    // {x, y} vs {y, z}
    REQUIRE(std::fabs(jaccard_similarity(a, b) - 1.0 / 3.0) < 1e-12);
    REQUIRE(jaccard_similarity(a, a) == 1.0);
    REQUIRE(jaccard_similarity({{"x", 1.0}}, {{"y", 1.0}}) == 0.0);
    // {x, y, z} vs {y, z, w}
    REQUIRE(jaccard_similarity(a, b, 0.1) == 0.5);
}

TEST_CASE("jaccard_similarity: nothing above the threshold returns 0", "[similarity]") {
    REQUIRE(jaccard_similarity({}, {}) == 0.0);
    REQUIRE(jaccard_similarity({{"x", 0.1}}, {{"x", 0.2}}) == 0.0);
}

TEST_CASE("cluster_similarity: same cluster only", "[similarity]") {
    REQUIRE(cluster_similarity("jazz", "jazz") == 1.0);
    REQUIRE(cluster_similarity("jazz", "folk") == 0.0);
}

TEST_CASE("candidate_similarity: embeddings map cosine into [0, 1]", "[similarity]") {
    Candidate a, b;
    a.cluster_id = "x";
    b.cluster_id = "y";
    a.features.embedding = std::vector<double>{1.0, 0.0};
    b.features.embedding = std::vector<double>{-1.0, 0.0};
    REQUIRE(candidate_similarity(a, b) < 1e-9);

    b.features.embedding = std::vector<double>{0.0, 1.0};
    REQUIRE(std::fabs(candidate_similarity(a, b) - 0.5) < 1e-12);

    b.features.embedding = std::vector<double>{2.0, 0.0};
    REQUIRE(candidate_similarity(a, b) > 0.999999);
}

TEST_CASE("candidate_similarity: falls back to clusters without embeddings", "[similarity]") {
    Candidate a, b;
    a.cluster_id = "x";
    b.cluster_id = "x";
    a.features.embedding = std::vector<double>{1.0, 0.0};
    REQUIRE(candidate_similarity(a, b) == 1.0);

    b.cluster_id = "y";
    REQUIRE(candidate_similarity(a, b) == 0.0);
}

// ── SimilarityCache ──────────────────────────────────────────────

TEST_CASE("SimilarityCache: one entry per unordered pair", "[similarity]") {
    std::vector<Candidate> cs = {make_candidate("a", "c1"), make_candidate("b", "c1")};
    auto scored = make_scored(cs, {0.9, 0.8});
    SimilarityCache sims(scored);

    REQUIRE(sims.get(0, 0) == 1.0);
    REQUIRE(sims.size() == 0);

    REQUIRE(sims.get(0, 1) == 1.0);
    REQUIRE(sims.size() == 1);

    // Later changes to the candidate are not seen: (1, 0) hits the (0, 1) entry.
    cs[1].cluster_id = "c2";
    REQUIRE(sims.get(1, 0) == 1.0);
    REQUIRE(sims.size() == 1);
}
