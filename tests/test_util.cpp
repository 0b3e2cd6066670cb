#include <catch2/catch.hpp>
#include "util.hpp"
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <stdexcept>
#include <unistd.h>

using namespace culturerank;

// ── String helpers ───────────────────────────────────────────────

TEST_CASE("trim: strips surrounding whitespace", "[util]") {
    REQUIRE(trim("  hello \t\n") == "hello");
    REQUIRE(trim("") == "");
    REQUIRE(trim("   ") == "");
}

TEST_CASE("to_lower: ASCII only", "[util]") {
    REQUIRE(to_lower("MMR") == "mmr");
    REQUIRE(to_lower("Home_Mix") == "home_mix");
}

TEST_CASE("expand_home: replaces leading tilde", "[util]") {
    const char* home = std::getenv("HOME");
    if (home) {
        REQUIRE(expand_home("~/x") == std::string(home) + "/x");
    }
    REQUIRE(expand_home("/abs/path") == "/abs/path");
}

TEST_CASE("hex_encode: lowercase pairs", "[util]") {
    const unsigned char bytes[] = {0x00, 0xab, 0x7f};
    REQUIRE(hex_encode(bytes, 3) == "00ab7f");
}

// ── Files ────────────────────────────────────────────────────────

static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "culturerank_util_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

TEST_CASE("atomic_write_file: creates parents and round-trips", "[util]") {
    std::string dir = make_temp_dir();
    REQUIRE_FALSE(dir.empty());

    std::string path = dir + "/nested/out.json";
    REQUIRE(atomic_write_file(path, "{\"a\":1}\n"));
    REQUIRE(read_file(path) == "{\"a\":1}\n");
    REQUIRE_FALSE(std::filesystem::exists(path + ".tmp"));

    REQUIRE(atomic_write_file(path, "second"));
    REQUIRE(read_file(path) == "second");

    std::filesystem::remove_all(dir);
}

TEST_CASE("read_file: missing file throws", "[util]") {
    REQUIRE_THROWS_AS(read_file("/nonexistent/culturerank/file.json"), std::runtime_error);
}

// ── Numeric guards ───────────────────────────────────────────────

TEST_CASE("clamp: non-finite maps to lower bound", "[util]") {
    REQUIRE(clamp(std::nan(""), 0.0, 1.0) == 0.0);
    REQUIRE(clamp(std::numeric_limits<double>::infinity(), 0.2, 0.8) == 0.2);
    REQUIRE(clamp(0.5, 0.2, 0.8) == 0.5);
    REQUIRE(clamp(-3.0, 0.2, 0.8) == 0.2);
    REQUIRE(clamp(3.0, 0.2, 0.8) == 0.8);
}

TEST_CASE("clamp01: bounds to unit interval", "[util]") {
    REQUIRE(clamp01(-0.1) == 0.0);
    REQUIRE(clamp01(1.5) == 1.0);
    REQUIRE(clamp01(0.25) == 0.25);
}

TEST_CASE("round9: rounds to nine decimals", "[util]") {
    REQUIRE(round9(1.0000000004) == 1.0);
    REQUIRE(round9(1.0000000006) == 1.000000001);
    REQUIRE(round9(0.25) == 0.25);
}

TEST_CASE("round9: non-finite and negative zero become plain zero", "[util]") {
    REQUIRE(round9(std::nan("")) == 0.0);
    REQUIRE(round9(std::numeric_limits<double>::infinity()) == 0.0);
    REQUIRE_FALSE(std::signbit(round9(-0.0)));
    REQUIRE_FALSE(std::signbit(round9(-1e-12)));
}

TEST_CASE("round9: idempotent", "[util]") {
    for (double x : {0.123456789123, -0.987654321987, 3.14159265358979, 1e-10}) {
        double once = round9(x);
        REQUIRE(round9(once) == once);
    }
}

TEST_CASE("lerp and finite_or", "[util]") {
    REQUIRE(lerp(0.0, 10.0, 0.5) == 5.0);
    REQUIRE(lerp(1.5, 0.5, 0.0) == 1.5);
    REQUIRE(finite_or(std::nan(""), 7.0) == 7.0);
    REQUIRE(finite_or(2.0, 7.0) == 2.0);
}

TEST_CASE("saturate_int: floors and saturates", "[util]") {
    REQUIRE(saturate_int(2.9, INT64_MIN, INT64_MAX) == 2);
    REQUIRE(saturate_int(-2.1, INT64_MIN, INT64_MAX) == -3);
    REQUIRE(saturate_int(1e30, INT64_MIN, INT64_MAX) == INT64_MAX);
    REQUIRE(saturate_int(-1e30, INT64_MIN, INT64_MAX) == INT64_MIN);
    REQUIRE(saturate_int(9223372036854775807.0, INT64_MIN, INT64_MAX) == INT64_MAX);
    REQUIRE(saturate_int(1e10, 1, 8) == 8);
    REQUIRE(saturate_int(0.5, 1, 8) == 1);
    REQUIRE(saturate_int(std::numeric_limits<double>::infinity(), 0, 5) == 5);
    REQUIRE(saturate_int(std::nan(""), 3, 5) == 3);
}
