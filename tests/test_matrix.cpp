#include <catch2/catch.hpp>
#include "math/matrix.hpp"
#include <cmath>
#include <limits>

using namespace culturerank;

TEST_CASE("determinant: empty matrix is 1", "[matrix]") {
    REQUIRE(determinant({}, 0.0) == 1.0);
    REQUIRE(determinant({}) == 1.0);
}

TEST_CASE("determinant: small closed forms", "[matrix]") {
    REQUIRE(determinant({{2.0}}, 0.0) == 2.0);
    REQUIRE(determinant({{1.0, 2.0}, {3.0, 4.0}}, 0.0) == -2.0);
    REQUIRE(determinant({{1.0, 2.0}, {2.0, 4.0}}, 0.0) == 0.0);
}

TEST_CASE("determinant: regularization shifts the diagonal", "[matrix]") {
    REQUIRE(determinant({{0.0}}, 0.5) == 0.5);
    // (1 + 1)(1 + 1) - 1*1 = 3
    REQUIRE(determinant({{1.0, 1.0}, {1.0, 1.0}}, 1.0) == 3.0);
}

TEST_CASE("determinant: LU path with pivoting", "[matrix]") {
    Matrix diag = {{2.0, 0.0, 0.0}, {0.0, 3.0, 0.0}, {0.0, 0.0, 4.0}};
    REQUIRE(std::fabs(determinant(diag, 0.0) - 24.0) < 1e-9);

    // One row swap flips the sign.
    Matrix swapped = {{0.0, 1.0, 0.0}, {1.0, 0.0, 0.0}, {0.0, 0.0, 1.0}};
    REQUIRE(std::fabs(determinant(swapped, 0.0) + 1.0) < 1e-12);

    Matrix general = {{4.0, 3.0, 2.0}, {2.0, 1.0, 3.0}, {3.0, 2.0, 1.0}};
    // 4(1-6) - 3(2-9) + 2(4-3) = -20 + 21 + 2 = 3
    REQUIRE(std::fabs(determinant(general, 0.0) - 3.0) < 1e-9);
}

TEST_CASE("determinant: singular LU input returns exactly 0", "[matrix]") {
    Matrix singular = {{1.0, 2.0, 3.0}, {2.0, 4.0, 6.0}, {1.0, 1.0, 1.0}};
    REQUIRE(determinant(singular, 0.0) == 0.0);
}

TEST_CASE("principal_submatrix: picks rows and columns in order", "[matrix]") {
    Matrix m = {{1.0, 2.0, 3.0}, {4.0, 5.0, 6.0}, {7.0, 8.0, 9.0}};
    Matrix sub = principal_submatrix(m, {2, 0});
    REQUIRE(sub.size() == 2);
    REQUIRE(sub[0][0] == 9.0);
    REQUIRE(sub[0][1] == 7.0);
    REQUIRE(sub[1][0] == 3.0);
    REQUIRE(sub[1][1] == 1.0);
}

TEST_CASE("principal_submatrix: out-of-range and non-finite read as 0", "[matrix]") {
    Matrix m = {{std::numeric_limits<double>::quiet_NaN(), 1.0}, {1.0, 2.0}};
    Matrix sub = principal_submatrix(m, {0, 5});
    REQUIRE(sub[0][0] == 0.0);
    REQUIRE(sub[0][1] == 0.0);
    REQUIRE(sub[1][0] == 0.0);
    REQUIRE(sub[1][1] == 0.0);
}
